//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the failure record shared by the file system, kernel and
//          shell layers, plus the engine the shell driver collects them in.
// Key invariants: errorCount() equals the number of Error records reported.
// Ownership/Lifetime: The engine owns its records by value.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace radiant::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Failure categories surfaced by the file system and kernel.
enum class ErrorCode
{
    None,                  ///< Informational diagnostic, no failure
    NotFound,              ///< Unknown node, entry, manager, name or operation
    DuplicateName,         ///< Colliding directory entry or manager name
    InvalidLifecycleState, ///< Kernel/manager used outside its lifecycle window
    NotADirectory,         ///< Directory operation reached a non-directory node
    InvalidArgument        ///< Malformed command, path or request
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    ErrorCode code;      ///< Failure category
    std::string message; ///< Human-readable text
};

/// @brief Failures gathered over one radiant-shell run.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Print every record to @p os in report order.
    void printAll(std::ostream &os) const;

    /// @brief Non-zero means the run ends with a command-failure status.
    size_t errorCount() const;

    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace radiant::support
