//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Ids.hpp
// Purpose: Defines the NodeId and EntryId handle types and their generators.
// Key invariants: Value 0 denotes an invalid handle; generated handles are
//                 unique for the lifetime of the process.
// Ownership/Lifetime: Handles are value types.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace radiant::fs
{

/// @brief Opaque identifier of a Node.
/// @invariant 0 denotes an invalid id.
struct NodeId
{
    uint64_t id = 0;

    [[nodiscard]] explicit operator bool() const noexcept;

    /// @brief Allocate a fresh process-unique node id.
    static NodeId next() noexcept;
};

/// @brief Opaque identifier of an Entry.
/// @invariant 0 denotes an invalid id.
struct EntryId
{
    uint64_t id = 0;

    [[nodiscard]] explicit operator bool() const noexcept;

    /// @brief Allocate a fresh process-unique entry id.
    static EntryId next() noexcept;
};

bool operator==(NodeId a, NodeId b) noexcept;
bool operator!=(NodeId a, NodeId b) noexcept;
bool operator<(NodeId a, NodeId b) noexcept;
bool operator==(EntryId a, EntryId b) noexcept;
bool operator!=(EntryId a, EntryId b) noexcept;
bool operator<(EntryId a, EntryId b) noexcept;

/// @brief Render as "n<id>" for diagnostics.
std::string toString(NodeId id);

/// @brief Render as "e<id>" for diagnostics.
std::string toString(EntryId id);

} // namespace radiant::fs

namespace std
{
template <> struct hash<radiant::fs::NodeId>
{
    size_t operator()(radiant::fs::NodeId n) const noexcept;
};

template <> struct hash<radiant::fs::EntryId>
{
    size_t operator()(radiant::fs::EntryId e) const noexcept;
};
} // namespace std
