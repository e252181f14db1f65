//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: services/ShellManager.hpp
// Purpose: Declare the "shell" Manager, a command interpreter that consumes
//          the "fs" Manager's ModuleApi.
// Key invariants: Commands are only accepted after start(); the fs capability
//                 is looked up during start(), never during setup().
// Ownership/Lifetime: Holds a copy of the fs capability whose callables refer
//                     to the fs Manager; both live as long as the kernel.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kernel/Manager.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace radiant::services
{

/// @brief Split @p line into words; double quotes group words together.
/// @return InvalidArgument for an unterminated quote.
support::Expected<std::vector<std::string>> tokenize(std::string_view line);

class ShellManager final : public kernel::Manager
{
  public:
    static constexpr const char *kName = "shell";

    ShellManager();

    /// @brief Binds the "fs" capability.  When no "fs" Manager is registered
    ///        the shell stays unbound and every command reports NotFound.
    void start() override;

    /// @brief Operations: exec and help.
    kernel::ModuleApi getModuleApi() override;

    /// @brief Run one command line.
    /// @return The command's output; InvalidLifecycleState before start(),
    ///         NotFound for an unknown command.
    support::Expected<std::string> execute(std::string_view line) const;

    /// @brief Run a command already split into words; the first word names
    ///        the command.  Words are passed on unchanged.
    support::Expected<std::string> executeWords(std::vector<std::string> words) const;

    /// @brief Usage text for every shell command.
    [[nodiscard]] static std::string helpText();

  private:
    std::optional<kernel::ModuleApi> fs_;
};

} // namespace radiant::services
