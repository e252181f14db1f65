//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the radiant-shell plumbing: option parsing, kernel bootstrap and
// the two command loops.  Failures of individual commands are collected in a
// DiagnosticEngine so the loops keep going and the driver can pick the exit
// status at the end.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "services/FileSystemManager.hpp"
#include "support/diagnostics.hpp"
#include "support/log.hpp"

#include <istream>
#include <ostream>
#include <string_view>
#include <utility>

namespace radiant::tools::shell
{

namespace
{
/// @brief Execute one line, print its output, and record any failure.
void runLine(const services::ShellManager &shell,
             std::string_view line,
             std::ostream &out,
             std::ostream &err,
             support::DiagnosticEngine &diags)
{
    auto result = shell.execute(line);
    if (!result)
    {
        support::printDiag(result.error(), err);
        diags.report(result.error());
        return;
    }
    const std::string &text = result.value();
    out << text;
    if (!text.empty() && text.back() != '\n')
        out << '\n';
}
} // namespace

OptionParseResult parseOptions(int argc, char **argv, ShellOptions &opts, std::string &error)
{
    bool optionsDone = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (optionsDone || arg.empty() || arg.front() != '-')
        {
            opts.commands.emplace_back(arg);
            optionsDone = true;
            continue;
        }
        if (arg == "--")
        {
            optionsDone = true;
            continue;
        }
        if (arg == "--help" || arg == "-h")
        {
            opts.showHelp = true;
            continue;
        }
        if (arg == "--version")
        {
            opts.showVersion = true;
            continue;
        }
        if (arg == "--config")
        {
            if (i + 1 >= argc)
            {
                error = "--config requires a file argument";
                return OptionParseResult::Error;
            }
            opts.configPath = argv[++i];
            continue;
        }
        error = "unknown option: " + std::string(arg);
        return OptionParseResult::Error;
    }
    return OptionParseResult::Parsed;
}

void usage(std::ostream &os)
{
    os << "Usage: radiant-shell [--config <file>] [command...]\n"
       << "       radiant-shell --help | --version\n"
       << "\nEach argument is run as one command line.  Without commands, lines are\n"
       << "read from standard input until end of input or `exit`.\n"
       << "\nCommands:\n"
       << services::ShellManager::helpText()
       << "\nSet RADIANT_DEBUG=1 or `[kernel] debug = true` for debug logging.\n";
}

support::Expected<std::unique_ptr<kernel::Kernel>> bootKernel(const config::BootConfig &cfg)
{
    if (cfg.kernel.debug)
        support::setDebugLogging(true);

    auto fs = services::FileSystemManager::create(cfg);
    if (!fs)
        return fs.error();

    std::vector<std::unique_ptr<kernel::Manager>> managers;
    managers.push_back(std::move(fs.value()));
    managers.push_back(std::make_unique<services::ShellManager>());

    auto created = kernel::Kernel::create(std::move(managers));
    if (!created)
        return created.error();
    auto started = created.value()->start();
    if (!started)
        return started.error();
    return std::move(created.value());
}

int runCommands(const services::ShellManager &shell,
                const std::vector<std::string> &commands,
                std::ostream &out,
                std::ostream &err)
{
    support::DiagnosticEngine diags;
    for (const auto &command : commands)
        runLine(shell, command, out, err, diags);
    return diags.errorCount() == 0 ? kExitOk : kExitCommandFailed;
}

int runInteractive(const services::ShellManager &shell,
                   std::istream &in,
                   std::ostream &out,
                   std::ostream &err,
                   bool prompt)
{
    support::DiagnosticEngine diags;
    std::string line;
    while (true)
    {
        if (prompt)
            out << "radiant> " << std::flush;
        if (!std::getline(in, line))
            break;
        if (line == "exit" || line == "quit")
            break;
        runLine(shell, line, out, err, diags);
    }
    if (prompt)
        out << '\n';
    return diags.errorCount() == 0 ? kExitOk : kExitCommandFailed;
}

} // namespace radiant::tools::shell
