//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the "fs" Manager.  Every mutation goes through the same two steps
// the core requires: the node is registered with the FileSystem that owns the
// target directory, then an Entry is listed in the directory and registered
// with that same FileSystem.  Paths that cross a mount are resolved to the
// mounted FileSystem before either step, so entries always land in the
// namespace that owns their node.
//
//===----------------------------------------------------------------------===//

#include "services/FileSystemManager.hpp"

#include "kernel/Kernel.hpp"
#include "support/log.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace radiant::services
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

namespace
{
/// @brief List a new entry for @p node under @p leaf and register it.
/// @details Undoes the listing when registration fails so the directory and
///          the entry registry never disagree.
Expected<void> linkEntry(const fs::Location &loc, fs::Node &node, const std::string &leaf)
{
    fs::Entry entry(leaf, node);
    auto listed = loc.dir->addEntry(entry);
    if (!listed)
        return listed;

    auto registered = loc.fs->addEntry(entry);
    if (!registered)
    {
        auto undone = loc.dir->removeEntry(leaf);
        if (!undone)
            return undone.error();
    }
    return registered;
}

/// @brief Register a fresh @p T in @p loc's file system and link it as @p leaf.
/// @details The node is dropped again if it cannot be linked, since a node
///          without entries is never collected automatically.
template <class T, class... Args>
Expected<T *> createAt(const fs::Location &loc, const std::string &leaf, Args &&...args)
{
    T &node = loc.fs->emplaceNode<T>(std::forward<Args>(args)...);
    auto linked = linkEntry(loc, node, leaf);
    if (!linked)
    {
        auto dropped = node.remove();
        if (!dropped)
            return dropped.error();
        return linked.error();
    }
    return &node;
}

Expected<void> expectArgs(const kernel::ModuleApi::Args &args, size_t count, const char *usage)
{
    if (args.size() < count)
        return makeError(ErrorCode::InvalidArgument, std::string("usage: ") + usage);
    return {};
}

/// @brief Adapt a void operation to the text-returning capability signature.
kernel::ModuleApi::Result toText(Expected<void> result)
{
    if (!result)
        return result.error();
    return std::string{};
}
} // namespace

FileSystemManager::FileSystemManager(ConstructionTag) : Manager(kName) {}

Expected<std::unique_ptr<FileSystemManager>> FileSystemManager::create(const config::BootConfig &cfg)
{
    auto manager = std::make_unique<FileSystemManager>(ConstructionTag{});

    auto rootFs = manager->createFileSystem(cfg.filesystem.name);
    if (!rootFs)
        return rootFs.error();

    for (const auto &mountPoint : cfg.mounts)
    {
        auto mounted = manager->mount("/" + mountPoint.name, mountPoint.filesystem);
        if (!mounted)
            return mounted.error();
    }

    for (const auto &file : cfg.files)
    {
        auto parentPath = fs::normalizePath(file.path);
        if (!parentPath)
            return parentPath.error();
        const std::string &normalized = parentPath.value();
        const size_t slash = normalized.find_last_of('/');
        auto parents = manager->makeDirectories(slash == 0 ? "/" : normalized.substr(0, slash));
        if (!parents)
            return parents.error();
        auto written = manager->writeFile(normalized, file.content);
        if (!written)
            return written.error();
    }
    return std::move(manager);
}

void FileSystemManager::setup(kernel::Kernel &kernel)
{
    Manager::setup(kernel);
    support::logDebug("FS", "manager set up with root file system '" + root().name() + "'");
}

void FileSystemManager::start()
{
    support::logDebug("FS", "serving " + std::to_string(filesystems_.size()) + " file systems");
}

Expected<fs::FileSystem *> FileSystemManager::createFileSystem(std::string name)
{
    if (findFileSystem(name))
        return makeError(ErrorCode::DuplicateName, "file system '" + name + "' already exists");

    auto created = std::make_unique<fs::FileSystem>(std::move(name));
    auto &dir = created->emplaceNode<fs::Directory>();
    fs::Entry rootEntry("/", dir);
    auto added = created->addEntry(rootEntry);
    if (!added)
        return added.error();
    created->setRoot(rootEntry);

    fs::FileSystem *raw = created.get();
    filesystems_.push_back(std::move(created));
    support::logDebug("FS", "created file system '" + raw->name() + "'");
    return raw;
}

void FileSystemManager::dropFileSystem(const fs::FileSystem *doomed)
{
    auto it = std::find_if(filesystems_.begin(), filesystems_.end(),
                           [doomed](const std::unique_ptr<fs::FileSystem> &candidate)
                           { return candidate.get() == doomed; });
    if (it == filesystems_.end())
        return;
    support::logDebug("FS", "dropped file system '" + (*it)->name() + "'");
    filesystems_.erase(it);
}

Expected<fs::FileSystem *> FileSystemManager::findFileSystem(std::string_view name) const
{
    for (const auto &candidate : filesystems_)
    {
        if (candidate->name() == name)
            return candidate.get();
    }
    return makeError(ErrorCode::NotFound, "no file system named '" + std::string(name) + "'");
}

std::vector<std::string> FileSystemManager::fileSystemNames() const
{
    std::vector<std::string> names;
    names.reserve(filesystems_.size());
    for (const auto &candidate : filesystems_)
        names.push_back(candidate->name());
    return names;
}

Expected<fs::Resolved> FileSystemManager::resolve(std::string_view path) const
{
    return fs::resolvePath(root(), path);
}

Expected<std::vector<fs::Entry>> FileSystemManager::list(std::string_view path) const
{
    auto target = resolve(path);
    if (!target)
        return target.error();
    fs::Node *node = target.value().node;
    if (!node->isDirectory())
        return makeError(ErrorCode::NotADirectory, "'" + std::string(path) + "' is not a directory");
    return static_cast<fs::Directory &>(*node).getEntries();
}

Expected<void> FileSystemManager::makeDirectory(std::string_view path)
{
    std::string leaf;
    auto loc = fs::resolveParent(root(), path, leaf);
    if (!loc)
        return loc.error();
    auto created = createAt<fs::Directory>(loc.value(), leaf);
    if (!created)
        return created.error();
    return {};
}

Expected<void> FileSystemManager::makeDirectories(std::string_view path)
{
    auto parts = fs::splitPath(path);
    if (!parts)
        return parts.error();

    std::string current;
    for (const auto &part : parts.value())
    {
        current += '/';
        current += part;
        auto existing = resolve(current);
        if (existing)
        {
            if (!existing.value().node->isDirectory())
                return makeError(ErrorCode::NotADirectory, "'" + current + "' is not a directory");
            continue;
        }
        if (existing.code() != ErrorCode::NotFound)
            return existing.error();
        auto made = makeDirectory(current);
        if (!made)
            return made;
    }
    return {};
}

Expected<void> FileSystemManager::writeFile(std::string_view path, std::string_view text)
{
    auto existing = resolve(path);
    if (existing)
    {
        fs::Node *node = existing.value().node;
        if (node->kind() != fs::NodeKind::File)
            return makeError(ErrorCode::InvalidArgument, "'" + std::string(path) + "' is a directory");
        static_cast<fs::File &>(*node).data().assign(text.begin(), text.end());
        return {};
    }
    if (existing.code() != ErrorCode::NotFound)
        return existing.error();

    std::string leaf;
    auto loc = fs::resolveParent(root(), path, leaf);
    if (!loc)
        return loc.error();
    auto created = createAt<fs::File>(loc.value(), leaf, fs::File::Bytes(text.begin(), text.end()));
    if (!created)
        return created.error();
    return {};
}

Expected<std::string> FileSystemManager::readFile(std::string_view path) const
{
    auto target = resolve(path);
    if (!target)
        return target.error();
    const fs::Node *node = target.value().node;
    if (node->kind() != fs::NodeKind::File)
        return makeError(ErrorCode::InvalidArgument, "'" + std::string(path) + "' is a directory");
    const auto &bytes = static_cast<const fs::File &>(*node).data();
    return std::string(bytes.begin(), bytes.end());
}

Expected<void> FileSystemManager::remove(std::string_view path)
{
    auto normalized = fs::normalizePath(path);
    if (!normalized)
        return normalized.error();
    if (normalized.value() == "/")
        return makeError(ErrorCode::InvalidArgument, "cannot remove '/'");

    auto target = resolve(normalized.value());
    if (!target)
        return target.error();
    return removeRecursive(*target.value().fs, *target.value().entry);
}

/// @brief Remove @p entry from @p owner, emptying a plain directory first when
///        this entry is its last link.
/// @details Mount points are plain entries here: dropping the ExternDirectory
///          never reaches into the mounted file system.
Expected<void> FileSystemManager::removeRecursive(fs::FileSystem &owner, const fs::Entry &entry)
{
    auto node = owner.getNode(entry.node());
    if (node && node.value()->kind() == fs::NodeKind::Directory && node.value()->references() <= 1)
    {
        auto children = static_cast<fs::Directory &>(*node.value()).getEntries();
        if (!children)
            return children.error();
        for (const auto &child : children.value())
        {
            auto removed = removeRecursive(owner, child);
            if (!removed)
                return removed;
        }
    }

    auto removed = owner.removeEntry(entry.id());
    if (!removed)
        return removed.error();
    return {};
}

Expected<void> FileSystemManager::link(std::string_view target, std::string_view path)
{
    auto source = resolve(target);
    if (!source)
        return source.error();
    if (source.value().node->isDirectory())
    {
        return makeError(ErrorCode::InvalidArgument,
                         "hard links to directories are not supported: " + std::string(target));
    }

    std::string leaf;
    auto loc = fs::resolveParent(root(), path, leaf);
    if (!loc)
        return loc.error();
    if (loc.value().fs != source.value().fs)
    {
        return makeError(ErrorCode::InvalidArgument,
                         "cannot link across file systems: " + std::string(target) + " -> " +
                             std::string(path));
    }
    return linkEntry(loc.value(), *source.value().node, leaf);
}

Expected<void> FileSystemManager::mount(std::string_view path, std::string_view fsName)
{
    std::string leaf;
    auto loc = fs::resolveParent(root(), path, leaf);
    if (!loc)
        return loc.error();

    fs::FileSystem *target = nullptr;
    fs::FileSystem *fresh = nullptr;
    if (auto found = findFileSystem(fsName))
    {
        target = found.value();
    }
    else
    {
        auto created = createFileSystem(std::string(fsName));
        if (!created)
            return created.error();
        target = fresh = created.value();
    }

    if (target == loc.value().fs)
    {
        return makeError(ErrorCode::InvalidArgument,
                         "cannot mount file system '" + target->name() + "' inside itself");
    }

    auto mounted = createAt<fs::ExternDirectory>(loc.value(), leaf, *target);
    if (!mounted)
    {
        // A file system created for a failed mount is unreachable.
        if (fresh)
            dropFileSystem(fresh);
        return mounted.error();
    }
    support::logDebug("FS",
                      "mounted '" + target->name() + "' at " + std::string(path) + " in '" +
                          loc.value().fs->name() + "'");
    return {};
}

Expected<std::string> FileSystemManager::stat(std::string_view path) const
{
    auto target = resolve(path);
    if (!target)
        return target.error();

    const fs::Node &node = *target.value().node;
    std::ostringstream os;
    os << path << ": " << fs::nodeKindName(node.kind()) << " id=" << fs::toString(node.id())
       << " refs=" << node.references() << " fs=" << target.value().fs->name();
    switch (node.kind())
    {
        case fs::NodeKind::File:
            os << " size=" << static_cast<const fs::File &>(node).size();
            break;
        case fs::NodeKind::Directory:
            os << " entries=" << static_cast<const fs::Directory &>(node).data().size();
            break;
        case fs::NodeKind::ExternDirectory:
            os << " target=" << static_cast<const fs::ExternDirectory &>(node).target().name();
            break;
    }
    return os.str();
}

kernel::ModuleApi FileSystemManager::getModuleApi()
{
    kernel::ModuleApi api;

    api.define("list",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   const std::string path = args.empty() ? std::string("/") : args[0];
                   auto entries = list(path);
                   if (!entries)
                       return entries.error();

                   std::string base = path;
                   if (base.empty() || base.back() != '/')
                       base += '/';
                   std::string out;
                   for (const auto &entry : entries.value())
                   {
                       out += entry.name();
                       auto child = resolve(base + entry.name());
                       if (child && child.value().node->isDirectory())
                           out += '/';
                       out += '\n';
                   }
                   return out;
               });

    api.define("stat",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 1, "stat <path>"); !ok)
                       return ok.error();
                   return stat(args[0]);
               });

    api.define("mkdir",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 1, "mkdir <path>"); !ok)
                       return ok.error();
                   return toText(makeDirectory(args[0]));
               });

    api.define("write",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 1, "write <path> [text...]"); !ok)
                       return ok.error();
                   std::string text;
                   for (size_t i = 1; i < args.size(); ++i)
                   {
                       if (i > 1)
                           text += ' ';
                       text += args[i];
                   }
                   return toText(writeFile(args[0], text));
               });

    api.define("read",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 1, "read <path>"); !ok)
                       return ok.error();
                   return readFile(args[0]);
               });

    api.define("remove",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 1, "remove <path>"); !ok)
                       return ok.error();
                   return toText(remove(args[0]));
               });

    api.define("link",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 2, "link <target> <path>"); !ok)
                       return ok.error();
                   return toText(link(args[0], args[1]));
               });

    api.define("mount",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               {
                   if (auto ok = expectArgs(args, 2, "mount <path> <filesystem>"); !ok)
                       return ok.error();
                   return toText(mount(args[0], args[1]));
               });

    api.define("filesystems",
               [this](const kernel::ModuleApi::Args &) -> kernel::ModuleApi::Result
               {
                   std::string out;
                   for (const auto &name : fileSystemNames())
                   {
                       out += name;
                       out += '\n';
                   }
                   return out;
               });

    return api;
}

} // namespace radiant::services
