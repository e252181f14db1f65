//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Entry.hpp
// Purpose: Declares Entry, the named reference from a directory listing to a
//          Node.
// Key invariants: The id is generated once and never changes; name and target
//                 are immutable; only the parent link may be rebound.
// Ownership/Lifetime: Value type.  Node and parent links are identifiers that
//                     must be resolved through a FileSystem.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Ids.hpp"

#include <string>

namespace radiant::fs
{

class Node;
class Directory;

/// @brief Named pointer to a Node.
/// @details Each Entry is tied to one Node, but a Node may be tied to several
///          Entries.  An Entry takes effect once registered with a FileSystem
///          through FileSystem::addEntry, which bumps the target's reference
///          count.  Copies share the id and therefore denote the same Entry.
class Entry
{
  public:
    /// @brief Create an entry named @p name targeting node @p node.
    /// @param parent Optional containing directory; usually set later by
    ///               Directory::addEntry.
    Entry(std::string name, NodeId node, NodeId parent = {});

    /// @brief Convenience overload taking the node and parent objects.
    Entry(std::string name, const Node &node, const Directory *parent = nullptr);

    [[nodiscard]] EntryId id() const noexcept
    {
        return id_;
    }

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

    /// @brief Id of the Node this entry represents.
    [[nodiscard]] NodeId node() const noexcept
    {
        return node_;
    }

    /// @brief Id of the containing Directory; invalid when the entry has none.
    [[nodiscard]] NodeId parent() const noexcept
    {
        return parent_;
    }

    [[nodiscard]] bool hasParent() const noexcept
    {
        return static_cast<bool>(parent_);
    }

    void setParent(NodeId parent) noexcept
    {
        parent_ = parent;
    }

  private:
    EntryId id_;
    std::string name_;
    NodeId node_;
    NodeId parent_;
};

} // namespace radiant::fs
