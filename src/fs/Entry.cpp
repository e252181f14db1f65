//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Entry.cpp
// Purpose: Construct entries and allocate their identifiers.
// Key invariants: Every constructed Entry receives a fresh EntryId.
// Ownership/Lifetime: Entries are values; no resources are held.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "fs/Entry.hpp"

#include "fs/Directory.hpp"
#include "fs/Node.hpp"

#include <utility>

namespace radiant::fs
{

Entry::Entry(std::string name, NodeId node, NodeId parent)
    : id_(EntryId::next()), name_(std::move(name)), node_(node), parent_(parent)
{
}

Entry::Entry(std::string name, const Node &node, const Directory *parent)
    : Entry(std::move(name), node.id(), parent ? parent->id() : NodeId{})
{
}

} // namespace radiant::fs
