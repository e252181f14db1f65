//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: kernel/Kernel.hpp
// Purpose: Declare Kernel, the composition root that owns the Managers, locks
//          registration once started and drives their two-phase startup.
// Key invariants: Manager names are unique.  No Manager is registered after
//                 start().  Every setup() call happens before any start()
//                 call, and both phases follow registration order.
// Ownership/Lifetime: Owns its Managers.  Managers keep a raw back-pointer,
//                     so a Kernel is neither copyable nor movable; create()
//                     hands it out on the heap.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kernel/Manager.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace radiant::kernel
{

/// @brief A running Radiant kernel and its services.
class Kernel
{
  public:
    /// @brief Subscript-style view over getManager, e.g. `k.managers()["fs"]`.
    class ManagerView
    {
      public:
        explicit ManagerView(const Kernel &kernel) : kernel_(&kernel) {}

        support::Expected<Manager *> operator[](std::string_view name) const
        {
            return kernel_->getManager(name);
        }

      private:
        const Kernel *kernel_;
    };

    Kernel() = default;
    ~Kernel();

    Kernel(const Kernel &) = delete;
    Kernel &operator=(const Kernel &) = delete;

    /// @brief Build a kernel and register @p managers in order.
    /// @return The kernel, or the first registration failure.
    static support::Expected<std::unique_ptr<Kernel>> create(
        std::vector<std::unique_ptr<Manager>> managers);

    /// @brief Register a Manager to execute within this kernel.
    /// @details Only available prior to start().  On failure the Manager is
    ///          discarded and the registry is left unchanged.
    /// @return The registered Manager; InvalidLifecycleState once running or
    ///         when the Manager was registered before, DuplicateName when the
    ///         name is taken.
    support::Expected<Manager *> registerManager(std::unique_ptr<Manager> manager);

    /// @brief Retrieve a registered Manager by name, or NotFound.
    support::Expected<Manager *> getManager(std::string_view name) const;

    /// @brief Typed lookup: the Manager called @p name viewed as a @p T.
    /// @return NotFound when absent or when it is not a @p T.
    template <class T> support::Expected<T *> manager(std::string_view name) const
    {
        auto found = getManager(name);
        if (!found)
            return found.error();
        if (auto *typed = dynamic_cast<T *>(found.value()))
            return typed;
        return support::makeError(support::ErrorCode::NotFound,
                                  "Manager with name " + std::string(name) +
                                      " does not provide the requested interface");
    }

    [[nodiscard]] ManagerView managers() const
    {
        return ManagerView(*this);
    }

    /// @brief Finalize registration and begin kernel execution.
    /// @details Locks registration, runs every setup() in registration order,
    ///          then every start() in the same order.
    /// @return InvalidLifecycleState when called a second time.
    support::Expected<void> start();

    [[nodiscard]] bool isRunning() const noexcept
    {
        return running_;
    }

    /// @brief Registered names in registration order.
    [[nodiscard]] std::vector<std::string> managerNames() const;

    [[nodiscard]] size_t managerCount() const noexcept
    {
        return order_.size();
    }

  private:
    bool running_ = false;
    std::vector<std::unique_ptr<Manager>> order_;
    std::unordered_map<std::string, Manager *> byName_;
};

} // namespace radiant::kernel
