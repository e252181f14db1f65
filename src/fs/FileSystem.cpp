//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the FileSystem registry.  Nodes and Entries live in id-keyed maps;
// every other link between them is an identifier resolved here.  Reference
// counts are maintained incrementally: addEntry and removeEntry are the only
// places that notify nodes, and a removal that drops a node to zero references
// releases the node before removeEntry returns.
//
//===----------------------------------------------------------------------===//

#include "fs/FileSystem.hpp"

#include "support/log.hpp"

namespace radiant::fs
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

FileSystem::FileSystem(std::string name) : name_(std::move(name)) {}

FileSystem::~FileSystem() = default;

void FileSystem::adopt(std::unique_ptr<Node> node)
{
    node->filesystem_ = this;
    const NodeId id = node->id();
    if (support::isDebugLoggingEnabled())
    {
        support::logDebug("FS",
                          name_ + ": add " + nodeKindName(node->kind()) + " node " + toString(id));
    }
    nodes_.emplace(id, std::move(node));
}

Expected<std::unique_ptr<Node>> FileSystem::removeNode(NodeId id)
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to remove Node " + toString(id) + " from FileSystem " +
                             name_);
    }

    std::unique_ptr<Node> node = std::move(it->second);
    nodes_.erase(it);
    node->filesystem_ = nullptr;
    if (support::isDebugLoggingEnabled())
        support::logDebug("FS", name_ + ": removed node " + toString(id));
    return std::move(node);
}

Expected<Node *> FileSystem::getNode(NodeId id) const
{
    auto it = nodes_.find(id);
    if (it == nodes_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to retrieve Node " + toString(id) + " from FileSystem " +
                             name_);
    }
    return it->second.get();
}

Expected<Directory *> FileSystem::getDirectory(NodeId id) const
{
    auto node = getNode(id);
    if (!node)
        return node.error();
    if (!node.value()->isDirectory())
    {
        return makeError(ErrorCode::NotADirectory,
                         "Node " + toString(id) + " in FileSystem " + name_ +
                             " is not a directory");
    }
    return static_cast<Directory *>(node.value());
}

std::vector<Node *> FileSystem::getNodes() const
{
    std::vector<Node *> out;
    out.reserve(nodes_.size());
    for (const auto &[id, node] : nodes_)
        out.push_back(node.get());
    return out;
}

Expected<void> FileSystem::addEntry(const Entry &entry)
{
    auto node = nodes_.find(entry.node());
    if (node == nodes_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Entry " + entry.name() + " targets Node " + toString(entry.node()) +
                             " which is not registered in FileSystem " + name_);
    }
    if (entries_.find(entry.id()) != entries_.end())
    {
        return makeError(ErrorCode::DuplicateName,
                         "Entry " + toString(entry.id()) + " is already registered in FileSystem " +
                             name_);
    }

    entries_.emplace(entry.id(), entry);
    node->second->entryAdded(entry);
    return {};
}

/// @brief Deregister an entry, cascading to its parent listing and its node.
///
/// @details The parent listing is edited directly rather than through the
///          virtual Directory::removeEntry so that a parent which happens to be
///          a mount point is never asked to forward the detach.  The listing is
///          only touched when it still maps the entry's name to this very
///          entry; a listing that was already edited by hand keeps whatever it
///          holds now.  A target node that was removed manually, leaving the
///          entry dangling, is skipped.
Expected<Entry> FileSystem::removeEntry(EntryId id)
{
    auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to remove Entry " + toString(id) + " from FileSystem " +
                             name_);
    }

    Entry entry = it->second;

    if (entry.hasParent())
    {
        auto parent = nodes_.find(entry.parent());
        if (parent != nodes_.end() && parent->second->isDirectory())
        {
            auto &listing = static_cast<Directory &>(*parent->second).data();
            auto listed = listing.find(entry.name());
            if (listed != listing.end() && listed->second.id() == entry.id())
                listing.erase(listed);
        }
        else if (support::isDebugLoggingEnabled())
        {
            support::logDebug("FS",
                              name_ + ": parent " + toString(entry.parent()) + " of entry '" +
                                  entry.name() + "' is not a registered directory");
        }
    }

    entries_.erase(it);

    auto node = nodes_.find(entry.node());
    if (node == nodes_.end())
    {
        if (support::isDebugLoggingEnabled())
        {
            support::logDebug("FS",
                              name_ + ": entry '" + entry.name() + "' was dangling, node " +
                                  toString(entry.node()) + " already removed");
        }
        return entry;
    }

    auto released = node->second->entryRemoved(entry);
    if (!released)
        return released.error();
    return entry;
}

Expected<Entry> FileSystem::getEntry(EntryId id) const
{
    auto it = entries_.find(id);
    if (it == entries_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to retrieve Entry " + toString(id) + " from FileSystem " +
                             name_);
    }
    return it->second;
}

std::vector<Entry> FileSystem::getEntries() const
{
    std::vector<Entry> out;
    out.reserve(entries_.size());
    for (const auto &[id, entry] : entries_)
        out.push_back(entry);
    return out;
}

Expected<Directory *> FileSystem::getParent(const Entry &entry) const
{
    if (!entry.hasParent())
    {
        return makeError(ErrorCode::NotFound,
                         "Entry " + entry.name() + " has no parent directory");
    }
    return getDirectory(entry.parent());
}

Expected<Entry> FileSystem::getRoot() const
{
    if (!root_)
        return makeError(ErrorCode::NotFound, "FileSystem " + name_ + " has no root");
    return getEntry(*root_);
}

Expected<Directory *> FileSystem::getRootDirectory() const
{
    auto root = getRoot();
    if (!root)
        return root.error();
    return getDirectory(root.value().node());
}

void FileSystem::updateEntryParent(EntryId id, NodeId parent)
{
    auto it = entries_.find(id);
    if (it != entries_.end())
        it->second.setParent(parent);
}

} // namespace radiant::fs
