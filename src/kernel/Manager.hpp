//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: kernel/Manager.hpp
// Purpose: Declare Manager, the named capability provider driven through a
//          two-phase lifecycle by a Kernel.
// Key invariants: State only moves forward, Unregistered -> Registered ->
//                 SetUp -> Started, and only the Kernel moves it.
// Ownership/Lifetime: Owned by the Kernel it is registered with; the Kernel
//                     back-pointer is non-owning and set once during setup.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "kernel/ModuleApi.hpp"

#include <string>

namespace radiant::kernel
{

class Kernel;

/// @brief Lifecycle position of a Manager.
enum class ManagerState
{
    Unregistered,
    Registered,
    SetUp,
    Started
};

/// @brief Lowercase name of @p state for logs and diagnostics.
const char *managerStateName(ManagerState state) noexcept;

/// @brief Data provider within the kernel with unrestricted access to both
///        kernel and file system APIs.
class Manager
{
  public:
    explicit Manager(std::string name);
    virtual ~Manager() = default;

    Manager(const Manager &) = delete;
    Manager &operator=(const Manager &) = delete;

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

    [[nodiscard]] ManagerState state() const noexcept
    {
        return state_;
    }

    /// @brief Executed while the kernel is instantiating its Managers.
    /// @details Stores the kernel back-reference.  Consuming other Managers
    ///          is UNSAFE here: their own setup may not have run yet.
    ///          Overrides must call Manager::setup.
    virtual void setup(Kernel &kernel);

    /// @brief Executed after every Manager has been set up.
    /// @details Other Managers are safe to consume from this point on.
    virtual void start() {}

    /// @brief API exposed by this Manager to kernel modules.
    /// @details May expose kernel-sensitive operations, but never anything
    ///          that could compromise the host if misused.
    virtual ModuleApi getModuleApi() = 0;

  protected:
    /// @brief Owning kernel; nullptr before setup.
    [[nodiscard]] Kernel *kernel() const noexcept
    {
        return kernel_;
    }

  private:
    friend class Kernel;

    std::string name_;
    Kernel *kernel_ = nullptr;
    ManagerState state_ = ManagerState::Unregistered;
};

} // namespace radiant::kernel
