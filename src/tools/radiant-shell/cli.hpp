// File: src/tools/radiant-shell/cli.hpp
// Purpose: Declarations for radiant-shell option parsing, kernel bootstrap and
//          command loops.
// Key invariants: Exit codes are 0 on success, 1 when a command failed and 2
//                 on usage or configuration errors.
// Ownership/Lifetime: The booted Kernel owns every Manager it hands back.
// Links: docs/architecture.md
#pragma once

#include "config/BootConfig.hpp"
#include "kernel/Kernel.hpp"
#include "services/ShellManager.hpp"
#include "support/diag_expected.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace radiant::tools::shell
{

constexpr int kExitOk = 0;
constexpr int kExitCommandFailed = 1;
constexpr int kExitUsage = 2;

/// @brief Options accepted on the radiant-shell command line.
struct ShellOptions
{
    /// @brief Boot file path; empty selects the built-in defaults.
    std::string configPath{};
    bool showHelp = false;
    bool showVersion = false;
    /// @brief Command lines given as arguments, one per argument.
    std::vector<std::string> commands{};
};

/// @brief Result of scanning the command line.
enum class OptionParseResult
{
    Parsed, ///< Options were understood.
    Error   ///< An option was unknown or missing its value.
};

/// @brief Parse radiant-shell options from argv.
///
/// @param argc Argument count including the program name.
/// @param argv Argument vector.
/// @param opts Receives parsed values.
/// @param error Receives a description when parsing fails.
OptionParseResult parseOptions(int argc, char **argv, ShellOptions &opts, std::string &error);

/// @brief Print synopsis and command summary to @p os.
void usage(std::ostream &os);

/// @brief Build and start a Kernel hosting the fs and shell Managers for @p cfg.
support::Expected<std::unique_ptr<kernel::Kernel>> bootKernel(const config::BootConfig &cfg);

/// @brief Run each of @p commands in order, continuing past failures.
/// @return kExitOk, or kExitCommandFailed when any command failed.
int runCommands(const services::ShellManager &shell,
                const std::vector<std::string> &commands,
                std::ostream &out,
                std::ostream &err);

/// @brief Read command lines from @p in until end of input or `exit`.
/// @param prompt Print a prompt before each line when true.
/// @return kExitOk, or kExitCommandFailed when any command failed.
int runInteractive(const services::ShellManager &shell,
                   std::istream &in,
                   std::ostream &out,
                   std::ostream &err,
                   bool prompt);

} // namespace radiant::tools::shell
