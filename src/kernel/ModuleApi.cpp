//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: kernel/ModuleApi.cpp
// Purpose: Implement registration and dispatch of capability operations.
// Key invariants: invoke never calls an empty callable.
// Ownership/Lifetime: See header.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "kernel/ModuleApi.hpp"

#include <utility>

namespace radiant::kernel
{

using support::ErrorCode;
using support::makeError;

void ModuleApi::define(std::string name, Operation op)
{
    ops_[std::move(name)] = std::move(op);
}

bool ModuleApi::has(std::string_view name) const
{
    return ops_.find(name) != ops_.end();
}

std::vector<std::string> ModuleApi::names() const
{
    std::vector<std::string> out;
    out.reserve(ops_.size());
    for (const auto &[name, op] : ops_)
        out.push_back(name);
    return out;
}

ModuleApi::Result ModuleApi::invoke(std::string_view name, const Args &args) const
{
    auto it = ops_.find(name);
    if (it == ops_.end() || !it->second)
        return makeError(ErrorCode::NotFound, "unknown operation '" + std::string(name) + "'");
    return it->second(args);
}

} // namespace radiant::kernel
