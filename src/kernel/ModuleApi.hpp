//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: kernel/ModuleApi.hpp
// Purpose: Declare the capability object a Manager publishes: an open mapping
//          from operation name to callable.
// Key invariants: Operation names are unique; defining an existing name
//                 replaces its callable.
// Ownership/Lifetime: Stores callables by value.  Callables that capture a
//                     Manager must not outlive it.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace radiant::kernel
{

/// @brief Named operations exposed by a Manager to in-process consumers.
/// @details The schema is defined per Manager.  Arguments and results are
///          text so that terminal front ends can forward user input directly.
class ModuleApi
{
  public:
    using Args = std::vector<std::string>;
    using Result = support::Expected<std::string>;
    using Operation = std::function<Result(const Args &args)>;

    /// @brief Register or replace the operation called @p name.
    void define(std::string name, Operation op);

    [[nodiscard]] bool has(std::string_view name) const;

    /// @brief Operation names in lexical order.
    [[nodiscard]] std::vector<std::string> names() const;

    /// @brief Run the operation called @p name with @p args.
    /// @return The operation's result, or NotFound for an unknown name.
    Result invoke(std::string_view name, const Args &args = {}) const;

  private:
    std::map<std::string, Operation, std::less<>> ops_;
};

} // namespace radiant::kernel
