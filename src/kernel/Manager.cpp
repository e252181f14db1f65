//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: kernel/Manager.cpp
// Purpose: Default lifecycle hooks shared by every Manager.
// Key invariants: setup records the kernel exactly once.
// Ownership/Lifetime: See header.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "kernel/Manager.hpp"

#include <utility>

namespace radiant::kernel
{

const char *managerStateName(ManagerState state) noexcept
{
    switch (state)
    {
        case ManagerState::Unregistered:
            return "unregistered";
        case ManagerState::Registered:
            return "registered";
        case ManagerState::SetUp:
            return "set-up";
        case ManagerState::Started:
            return "started";
    }
    return "unknown";
}

Manager::Manager(std::string name) : name_(std::move(name)) {}

void Manager::setup(Kernel &kernel)
{
    kernel_ = &kernel;
}

} // namespace radiant::kernel
