//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.hpp
// Purpose: Environment-gated debug logging shared by the file system, kernel
//          and services.
// Key invariants: Output is line-oriented on stderr, tagged "[DEBUG][<TAG>]".
// Ownership/Lifetime: Process-wide switch; no buffered state.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace radiant::support
{

/// @brief Whether debug lines should be emitted.
/// @details Reads RADIANT_DEBUG once; a non-empty value enables logging.  A
///          later call to setDebugLogging() overrides the environment.
bool isDebugLoggingEnabled() noexcept;

/// @brief Force debug logging on or off for the rest of the process.
void setDebugLogging(bool enabled) noexcept;

/// @brief Emit "[DEBUG][<tag>] <message>" to stderr when logging is enabled.
/// @param tag Short upper-case component name, e.g. "FS" or "KERNEL".
/// @param message Text of the line, without trailing newline.
void logDebug(std::string_view tag, std::string_view message);

} // namespace radiant::support
