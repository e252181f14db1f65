//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements reference counting for file system nodes.  A node's count moves
// only in response to Entry registration changes reported by its FileSystem;
// reaching zero through a removal is the single automatic destruction trigger.
// A node that never gained an Entry keeps a count of zero and stays registered
// until somebody removes it explicitly.
//
//===----------------------------------------------------------------------===//

#include "fs/Node.hpp"

#include "fs/Entry.hpp"
#include "fs/FileSystem.hpp"
#include "support/log.hpp"

namespace radiant::fs
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

const char *nodeKindName(NodeKind kind) noexcept
{
    switch (kind)
    {
        case NodeKind::File:
            return "file";
        case NodeKind::Directory:
            return "directory";
        case NodeKind::ExternDirectory:
            return "mount";
    }
    return "unknown";
}

Node::Node() : id_(NodeId::next()) {}

bool Node::isDirectory() const noexcept
{
    const NodeKind k = kind();
    return k == NodeKind::Directory || k == NodeKind::ExternDirectory;
}

void Node::entryAdded(const Entry &entry)
{
    ++references_;
    if (support::isDebugLoggingEnabled())
    {
        support::logDebug("FS",
                          "node " + toString(id_) + " +ref via '" + entry.name() +
                              "' -> " + std::to_string(references_));
    }
}

/// @brief Drop one reference and collect the node when none remain.
///
/// @details The comparison is `<= 0` rather than `== 0` so a count that was
///          driven negative by a caller bypassing FileSystem still results in
///          removal instead of a leak.  Ownership of the removed node is handed
///          back up to FileSystem::removeEntry, which lets it expire after this
///          member function has returned.
Expected<std::unique_ptr<Node>> Node::entryRemoved(const Entry &entry)
{
    --references_;
    if (support::isDebugLoggingEnabled())
    {
        support::logDebug("FS",
                          "node " + toString(id_) + " -ref via '" + entry.name() +
                              "' -> " + std::to_string(references_));
    }

    if (references_ > 0)
        return std::unique_ptr<Node>{};

    return remove();
}

Expected<std::unique_ptr<Node>> Node::remove()
{
    if (!filesystem_)
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to remove unregistered Node " + toString(id_));
    }
    return filesystem_->removeNode(id_);
}

File::File(Bytes data) : BasicNode(std::move(data)) {}

NodeKind File::kind() const noexcept
{
    return NodeKind::File;
}

size_t File::size() const noexcept
{
    return data_.size();
}

} // namespace radiant::fs
