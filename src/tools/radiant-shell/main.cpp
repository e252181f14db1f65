//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `radiant-shell` driver.  The executable boots a
// kernel with the file system and shell Managers, then runs command lines from
// its arguments or from standard input.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `radiant-shell` tool.

#include "cli.hpp"

#include <iostream>
#include <string>
#include <unistd.h>

namespace
{

void printVersion()
{
    std::cout << "radiant-shell v" << RADIANT_VERSION_STR << "\n";
}

} // namespace

/// @brief Program entry for the `radiant-shell` command-line tool.
///
/// @details Step-by-step summary:
///          1. Parse options; usage errors exit with status 2.
///          2. Handle `--help` and `--version`.
///          3. Load the boot file, if any, and boot the kernel.
///          4. Run argument commands, or read commands from standard input.
int main(int argc, char **argv)
{
    using namespace radiant;

    tools::shell::ShellOptions opts;
    std::string error;
    if (tools::shell::parseOptions(argc, argv, opts, error) != tools::shell::OptionParseResult::Parsed)
    {
        std::cerr << "error: " << error << "\n";
        tools::shell::usage(std::cerr);
        return tools::shell::kExitUsage;
    }
    if (opts.showHelp)
    {
        tools::shell::usage(std::cout);
        return tools::shell::kExitOk;
    }
    if (opts.showVersion)
    {
        printVersion();
        return tools::shell::kExitOk;
    }

    config::BootConfig cfg;
    if (!opts.configPath.empty() && !config::loadFromFile(opts.configPath, cfg))
    {
        std::cerr << "error: cannot open config file '" << opts.configPath << "'\n";
        return tools::shell::kExitUsage;
    }

    auto booted = tools::shell::bootKernel(cfg);
    if (!booted)
    {
        support::printDiag(booted.error(), std::cerr);
        return tools::shell::kExitUsage;
    }

    auto shell = booted.value()->manager<services::ShellManager>(services::ShellManager::kName);
    if (!shell)
    {
        support::printDiag(shell.error(), std::cerr);
        return tools::shell::kExitUsage;
    }

    if (!opts.commands.empty())
        return tools::shell::runCommands(*shell.value(), opts.commands, std::cout, std::cerr);
    return tools::shell::runInteractive(
        *shell.value(), std::cin, std::cout, std::cerr, isatty(STDIN_FILENO) != 0);
}
