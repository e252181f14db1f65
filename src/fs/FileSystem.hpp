//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/FileSystem.hpp
// Purpose: Declares FileSystem, the registry that owns every Node and Entry of
//          one namespace and maintains reference counts as Entries come and go.
// Key invariants: A registered Entry's target is registered in the same
//                 FileSystem when the Entry is added.  Removing an Entry
//                 detaches it from its parent listing before its target is
//                 notified.
// Ownership/Lifetime: Owns Nodes through unique_ptr and Entries by value, both
//                     keyed by identifier.  Non-copyable and non-movable since
//                     nodes keep a back-pointer to it.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Directory.hpp"
#include "fs/Entry.hpp"
#include "fs/Ids.hpp"
#include "fs/Node.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace radiant::fs
{

/// @brief Tracks and holds a single file structure composed of Nodes and Entries.
class FileSystem
{
  public:
    /// @param name Used for diagnostics only.
    explicit FileSystem(std::string name);
    ~FileSystem();

    FileSystem(const FileSystem &) = delete;
    FileSystem &operator=(const FileSystem &) = delete;

    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

    // Nodes --------------------------------------------------------------

    /// @brief Take ownership of @p node and register it under its id.
    /// @return Reference to the registered node, valid until it is removed.
    template <class T> T &addNode(std::unique_ptr<T> node)
    {
        static_assert(std::is_base_of_v<Node, T>, "addNode requires a Node subclass");
        T &ref = *node;
        adopt(std::unique_ptr<Node>(std::move(node)));
        return ref;
    }

    /// @brief Construct a @p T from @p args and register it.
    template <class T, class... Args> T &emplaceNode(Args &&...args)
    {
        return addNode(std::make_unique<T>(std::forward<Args>(args)...));
    }

    /// @brief Remove the node @p id from the registry.
    /// @details Entries that still target the node are not inspected.
    /// @return Ownership of the removed node, or NotFound.
    support::Expected<std::unique_ptr<Node>> removeNode(NodeId id);

    /// @brief Retrieve the node with the given id, or NotFound.
    support::Expected<Node *> getNode(NodeId id) const;

    /// @brief Retrieve the node @p id as a Directory.
    /// @return NotFound when absent, NotADirectory for other node kinds.
    support::Expected<Directory *> getDirectory(NodeId id) const;

    /// @brief All nodes in creation order.
    [[nodiscard]] std::vector<Node *> getNodes() const;

    [[nodiscard]] size_t nodeCount() const noexcept
    {
        return nodes_.size();
    }

    // Entries ------------------------------------------------------------

    /// @brief Register @p entry and notify its target node.
    /// @return NotFound when the target is not registered here;
    ///         DuplicateName when this entry id is already registered.
    support::Expected<void> addEntry(const Entry &entry);

    /// @brief Deregister the entry @p id.
    /// @details Detaches it from its parent listing first, then notifies the
    ///          target node, which removes itself when no entries remain.
    /// @return The removed entry, or NotFound.
    support::Expected<Entry> removeEntry(EntryId id);

    /// @brief Retrieve the entry with the given id, or NotFound.
    support::Expected<Entry> getEntry(EntryId id) const;

    /// @brief All entries in creation order.
    [[nodiscard]] std::vector<Entry> getEntries() const;

    [[nodiscard]] size_t entryCount() const noexcept
    {
        return entries_.size();
    }

    /// @brief Directory containing @p entry, or NotFound if it has none.
    support::Expected<Directory *> getParent(const Entry &entry) const;

    // Root ---------------------------------------------------------------

    void setRoot(const Entry &entry) noexcept
    {
        root_ = entry.id();
    }

    void setRoot(EntryId id) noexcept
    {
        root_ = id;
    }

    void clearRoot() noexcept
    {
        root_.reset();
    }

    [[nodiscard]] std::optional<EntryId> rootId() const noexcept
    {
        return root_;
    }

    /// @brief The entry representing the root directory.
    /// @return NotFound when no root is set or the root entry is gone.
    support::Expected<Entry> getRoot() const;

    /// @brief The root directory node itself.
    /// @return NotFound as for getRoot(), NotADirectory if the root entry
    ///         targets something else.
    support::Expected<Directory *> getRootDirectory() const;

  private:
    friend class Directory;

    void adopt(std::unique_ptr<Node> node);

    /// @brief Rebind the registered copy of entry @p id to @p parent, if any.
    void updateEntryParent(EntryId id, NodeId parent);

    std::string name_;
    std::map<NodeId, std::unique_ptr<Node>> nodes_;
    std::map<EntryId, Entry> entries_;
    std::optional<EntryId> root_;
};

} // namespace radiant::fs
