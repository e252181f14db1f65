//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.cpp
// Purpose: Implement the RADIANT_DEBUG switch and the stderr line writer.
// Key invariants: The environment is consulted at most once per process.
// Ownership/Lifetime: State lives in function-local statics.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace radiant::support
{
namespace
{
/// @brief Tri-state override: -1 follows the environment, 0 off, 1 on.
std::atomic<int> &overrideFlag() noexcept
{
    static std::atomic<int> flag{-1};
    return flag;
}

bool environmentEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("RADIANT_DEBUG"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}
} // namespace

bool isDebugLoggingEnabled() noexcept
{
    const int forced = overrideFlag().load(std::memory_order_relaxed);
    if (forced >= 0)
        return forced != 0;
    return environmentEnabled();
}

void setDebugLogging(bool enabled) noexcept
{
    overrideFlag().store(enabled ? 1 : 0, std::memory_order_relaxed);
}

void logDebug(std::string_view tag, std::string_view message)
{
    if (!isDebugLoggingEnabled())
        return;
    std::fprintf(stderr,
                 "[DEBUG][%.*s] %.*s\n",
                 static_cast<int>(tag.size()),
                 tag.data(),
                 static_cast<int>(message.size()),
                 message.data());
}

} // namespace radiant::support
