//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Directory.hpp
// Purpose: Declares Directory, a node whose payload maps names to Entries, and
//          ExternDirectory, the mount point that forwards every listing
//          operation to the root directory of another FileSystem.
// Key invariants: A Directory never lists two Entries with the same name.
//                 An ExternDirectory never stores anything in its own map.
// Ownership/Lifetime: Owned by a FileSystem like every Node.  The listing
//                     holds Entry copies; the FileSystem's entry registry is a
//                     separate index.  ExternDirectory keeps a non-owning
//                     pointer to its target FileSystem, which must outlive it.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Entry.hpp"
#include "fs/Node.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace radiant::fs
{

/// @brief Name-ordered listing type stored by a Directory.
using EntryMap = std::map<std::string, Entry, std::less<>>;

/// @brief A Node that contains Entries.
class Directory : public BasicNode<EntryMap>
{
  public:
    Directory() = default;

    /// @brief Build a directory pre-populated with @p entries, in order.
    /// @details Each entry's parent is set to the new directory.
    /// @return The directory, or DuplicateName when two entries share a name.
    static support::Expected<std::unique_ptr<Directory>> create(std::vector<Entry> &entries);

    [[nodiscard]] NodeKind kind() const noexcept override;

    /// @brief List @p entry under its name and make this directory its parent.
    /// @details When the entry is already registered with this directory's
    ///          FileSystem, the registered copy is reparented as well so that
    ///          removing it later cascades back to this listing.
    /// @return DuplicateName if the name is already listed; InvalidArgument
    ///         if another directory of the same FileSystem still lists it.
    virtual support::Expected<void> addEntry(Entry &entry);

    /// @brief Unlist the entry called @p name.
    /// @return The removed entry, or NotFound.
    virtual support::Expected<Entry> removeEntry(std::string_view name);

    /// @brief Look up the entry called @p name.
    /// @return The entry, or NotFound.
    virtual support::Expected<Entry> getEntry(std::string_view name) const;

    /// @brief All listed entries ordered by name.
    virtual support::Expected<std::vector<Entry>> getEntries() const;
};

/// @brief A joint between two FileSystems.
/// @details All four listing operations are rerouted to the root directory of
///          the target file system, so entries added through the mount land in
///          and are visible from the target's own root listing.  Entries
///          created through a mount belong to the target FileSystem and must be
///          registered there.
class ExternDirectory final : public Directory
{
  public:
    explicit ExternDirectory(FileSystem &target);

    [[nodiscard]] NodeKind kind() const noexcept override;

    [[nodiscard]] FileSystem &target() const noexcept
    {
        return *target_;
    }

    support::Expected<void> addEntry(Entry &entry) override;
    support::Expected<Entry> removeEntry(std::string_view name) override;
    support::Expected<Entry> getEntry(std::string_view name) const override;
    support::Expected<std::vector<Entry>> getEntries() const override;

  private:
    /// @brief Resolve the target's root directory at call time.
    support::Expected<Directory *> targetRoot() const;

    FileSystem *target_;
};

} // namespace radiant::fs
