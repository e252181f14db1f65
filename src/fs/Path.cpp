//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements path handling for the in-memory namespace.  Normalization is
// purely lexical, like the host path cache: ".." never climbs back out through
// a mount, it simply drops the previous component before any lookup happens.
//
//===----------------------------------------------------------------------===//

#include "fs/Path.hpp"

#include <filesystem>

namespace radiant::fs
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

namespace
{
/// Upper bound on consecutive mount hops before assuming a cycle.
constexpr int kMaxMountHops = 64;
} // namespace

Expected<std::string> normalizePath(std::string_view path)
{
    if (path.empty() || path.front() != '/')
    {
        return makeError(ErrorCode::InvalidArgument,
                         "path '" + std::string(path) + "' is not absolute");
    }

    std::string generic = std::filesystem::path(std::string(path)).lexically_normal().generic_string();
    // lexically_normal keeps a trailing separator ("/a/b/" -> "/a/b/").
    while (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();
    if (generic.empty())
        generic = "/";
    return generic;
}

Expected<std::vector<std::string>> splitPath(std::string_view path)
{
    auto normalized = normalizePath(path);
    if (!normalized)
        return normalized.error();

    std::vector<std::string> parts;
    const std::string &text = normalized.value();
    size_t pos = 1;
    while (pos < text.size())
    {
        size_t next = text.find('/', pos);
        if (next == std::string::npos)
            next = text.size();
        if (next > pos)
            parts.emplace_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

std::string basename(std::string_view path)
{
    auto parts = splitPath(path);
    if (!parts || parts.value().empty())
        return {};
    return parts.value().back();
}

Expected<Location> enterDirectory(FileSystem &fs, Directory &dir)
{
    Location loc{&fs, &dir};
    for (int hops = 0; loc.dir->kind() == NodeKind::ExternDirectory; ++hops)
    {
        if (hops == kMaxMountHops)
        {
            return makeError(ErrorCode::InvalidArgument,
                             "mount points starting in FileSystem " + fs.name() +
                                 " form a cycle");
        }
        FileSystem &target = static_cast<ExternDirectory *>(loc.dir)->target();
        auto root = target.getRootDirectory();
        if (!root)
            return root.error();
        loc = Location{&target, root.value()};
    }
    return loc;
}

Expected<Resolved> resolvePath(FileSystem &root, std::string_view path)
{
    auto parts = splitPath(path);
    if (!parts)
        return parts.error();

    auto rootEntry = root.getRoot();
    if (!rootEntry)
        return rootEntry.error();
    auto rootNode = root.getNode(rootEntry.value().node());
    if (!rootNode)
        return rootNode.error();

    Resolved current{&root, rootEntry.value(), rootNode.value()};
    for (const auto &name : parts.value())
    {
        if (!current.node->isDirectory())
        {
            return makeError(ErrorCode::NotADirectory,
                             "'" + current.entry->name() + "' is not a directory");
        }
        auto loc = enterDirectory(*current.fs, static_cast<Directory &>(*current.node));
        if (!loc)
            return loc.error();

        auto entry = loc.value().dir->getEntry(name);
        if (!entry)
            return makeError(ErrorCode::NotFound, "no such file or directory: " + std::string(path));
        auto node = loc.value().fs->getNode(entry.value().node());
        if (!node)
            return node.error();
        current = Resolved{loc.value().fs, entry.value(), node.value()};
    }
    return current;
}

Expected<Location> resolveParent(FileSystem &root, std::string_view path, std::string &leaf)
{
    auto parts = splitPath(path);
    if (!parts)
        return parts.error();
    if (parts.value().empty())
        return makeError(ErrorCode::InvalidArgument, "path '/' has no parent");

    leaf = parts.value().back();
    std::string parentPath = "/";
    for (size_t i = 0; i + 1 < parts.value().size(); ++i)
    {
        if (i > 0)
            parentPath += '/';
        parentPath += parts.value()[i];
    }

    auto parent = resolvePath(root, parentPath);
    if (!parent)
        return parent.error();
    if (!parent.value().node->isDirectory())
        return makeError(ErrorCode::NotADirectory, "'" + parentPath + "' is not a directory");
    return enterDirectory(*parent.value().fs, static_cast<Directory &>(*parent.value().node));
}

} // namespace radiant::fs
