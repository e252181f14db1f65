/**
 * @file Ids.cpp
 * @brief Provides comparison helpers and generators for node and entry handles.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Handles wrap 64-bit identifiers drawn from one process-wide counter per
 *     kind.  Identifier `0` is reserved to mean "no node" / "no entry".  Since
 *     the counters are shared by every FileSystem, an entry that crosses a
 *     mount never collides with an identifier of the target namespace.
 */

#include "fs/Ids.hpp"

#include <atomic>

namespace radiant::fs
{
namespace
{
std::atomic<uint64_t> nextNodeId{1};
std::atomic<uint64_t> nextEntryId{1};
} // namespace

NodeId::operator bool() const noexcept
{
    return id != 0;
}

NodeId NodeId::next() noexcept
{
    return NodeId{nextNodeId.fetch_add(1, std::memory_order_relaxed)};
}

EntryId::operator bool() const noexcept
{
    return id != 0;
}

EntryId EntryId::next() noexcept
{
    return EntryId{nextEntryId.fetch_add(1, std::memory_order_relaxed)};
}

bool operator==(NodeId a, NodeId b) noexcept
{
    return a.id == b.id;
}

bool operator!=(NodeId a, NodeId b) noexcept
{
    return a.id != b.id;
}

/**
 * @brief Orders node handles by allocation time.
 *
 * Handles are allocated from a monotonically increasing counter, so ordered
 * containers keyed by NodeId list nodes in creation order.
 */
bool operator<(NodeId a, NodeId b) noexcept
{
    return a.id < b.id;
}

bool operator==(EntryId a, EntryId b) noexcept
{
    return a.id == b.id;
}

bool operator!=(EntryId a, EntryId b) noexcept
{
    return a.id != b.id;
}

bool operator<(EntryId a, EntryId b) noexcept
{
    return a.id < b.id;
}

std::string toString(NodeId id)
{
    return "n" + std::to_string(id.id);
}

std::string toString(EntryId id)
{
    return "e" + std::to_string(id.id);
}
} // namespace radiant::fs

namespace std
{
size_t hash<radiant::fs::NodeId>::operator()(radiant::fs::NodeId n) const noexcept
{
    return static_cast<size_t>(n.id);
}

size_t hash<radiant::fs::EntryId>::operator()(radiant::fs::EntryId e) const noexcept
{
    return static_cast<size_t>(e.id);
}
} // namespace std
