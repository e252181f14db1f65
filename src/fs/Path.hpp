//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: fs/Path.hpp
// Purpose: Absolute path normalization and resolution across mount points.
// Key invariants: A resolved Location never names an ExternDirectory; walking
//                 through a mount switches to the target FileSystem so that
//                 entry and node ids are always resolved in the namespace that
//                 owns them.
// Ownership/Lifetime: Results hold non-owning pointers into the file systems
//                     passed in; they are invalidated by removals.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fs/Directory.hpp"
#include "fs/Entry.hpp"
#include "fs/FileSystem.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace radiant::fs
{

/// @brief A directory together with the file system that owns its entries.
struct Location
{
    FileSystem *fs = nullptr;
    Directory *dir = nullptr;
};

/// @brief Outcome of resolving a path to a node.
struct Resolved
{
    FileSystem *fs = nullptr;   ///< Namespace owning @c entry and @c node.
    std::optional<Entry> entry; ///< Entry naming the node (root entry for "/").
    Node *node = nullptr;       ///< Resolved node; may be an ExternDirectory.
};

/// @brief Collapse "." and ".." segments and duplicate slashes.
/// @return Normalized absolute path, or InvalidArgument for relative or
///         empty input.
support::Expected<std::string> normalizePath(std::string_view path);

/// @brief Split a path into its normalized components ("/" yields none).
support::Expected<std::vector<std::string>> splitPath(std::string_view path);

/// @brief Last component of @p path, empty for "/".
[[nodiscard]] std::string basename(std::string_view path);

/// @brief Follow mount points starting at @p dir until a plain Directory.
/// @return InvalidArgument when mounts form a cycle.
support::Expected<Location> enterDirectory(FileSystem &fs, Directory &dir);

/// @brief Resolve an absolute @p path starting at @p root's root directory.
support::Expected<Resolved> resolvePath(FileSystem &root, std::string_view path);

/// @brief Resolve the directory that would contain @p path.
/// @param leaf Receives the final component; must not be empty.
support::Expected<Location> resolveParent(FileSystem &root,
                                          std::string_view path,
                                          std::string &leaf);

} // namespace radiant::fs
