//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the kernel's manager registry and startup sequence.  Registration
// mirrors a pass registry keyed by name, with the added rule that the registry
// is sealed the moment start() is entered.  Startup runs in two full passes over
// the registration-ordered list so that no start() hook can observe a Manager
// whose setup() has not completed.
//
//===----------------------------------------------------------------------===//

#include "kernel/Kernel.hpp"

#include "support/log.hpp"

#include <utility>

namespace radiant::kernel
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

Kernel::~Kernel() = default;

Expected<std::unique_ptr<Kernel>> Kernel::create(std::vector<std::unique_ptr<Manager>> managers)
{
    auto kernel = std::make_unique<Kernel>();
    for (auto &manager : managers)
    {
        auto registered = kernel->registerManager(std::move(manager));
        if (!registered)
            return registered.error();
    }
    return std::move(kernel);
}

Expected<Manager *> Kernel::registerManager(std::unique_ptr<Manager> manager)
{
    // Only available pre-init.
    if (running_)
    {
        return makeError(ErrorCode::InvalidLifecycleState,
                         "Kernel.registerManager can only be called prior to Kernel initialization");
    }
    if (!manager)
        return makeError(ErrorCode::InvalidArgument, "cannot register a null Manager");
    if (manager->state_ != ManagerState::Unregistered)
    {
        return makeError(ErrorCode::InvalidLifecycleState,
                         "Manager with name " + manager->name() + " is already " +
                             managerStateName(manager->state_));
    }
    if (byName_.find(manager->name()) != byName_.end())
    {
        return makeError(ErrorCode::DuplicateName,
                         "Manager with name " + manager->name() + " has already been registered");
    }

    Manager *raw = manager.get();
    raw->state_ = ManagerState::Registered;
    byName_.emplace(raw->name(), raw);
    order_.push_back(std::move(manager));
    support::logDebug("KERNEL", "registered manager '" + raw->name() + "'");
    return raw;
}

Expected<Manager *> Kernel::getManager(std::string_view name) const
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Attempt to access unregistered manager with name " + std::string(name));
    }
    return it->second;
}

Expected<void> Kernel::start()
{
    if (running_)
        return makeError(ErrorCode::InvalidLifecycleState, "Kernel has already been started");

    // We are officially running: lock down APIs that are only available
    // before initialization.
    running_ = true;

    support::logDebug("KERNEL", "setup phase, " + std::to_string(order_.size()) + " managers");
    for (auto &manager : order_)
    {
        manager->setup(*this);
        manager->state_ = ManagerState::SetUp;
    }

    support::logDebug("KERNEL", "start phase");
    for (auto &manager : order_)
    {
        manager->start();
        manager->state_ = ManagerState::Started;
    }
    return {};
}

std::vector<std::string> Kernel::managerNames() const
{
    std::vector<std::string> names;
    names.reserve(order_.size());
    for (const auto &manager : order_)
        names.push_back(manager->name());
    return names;
}

} // namespace radiant::kernel
