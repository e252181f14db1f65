//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements directory listings and mount forwarding.  Directory keeps a
// name-ordered map of Entry copies; ExternDirectory resolves the target file
// system's root on every call, so replacing the target's root redirects the
// mount without rebuilding it.
//
//===----------------------------------------------------------------------===//

#include "fs/Directory.hpp"

#include "fs/FileSystem.hpp"
#include "support/log.hpp"

namespace radiant::fs
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

Expected<std::unique_ptr<Directory>> Directory::create(std::vector<Entry> &entries)
{
    auto dir = std::make_unique<Directory>();
    for (auto &entry : entries)
    {
        auto added = dir->addEntry(entry);
        if (!added)
            return added.error();
    }
    return std::move(dir);
}

NodeKind Directory::kind() const noexcept
{
    return NodeKind::Directory;
}

Expected<void> Directory::addEntry(Entry &entry)
{
    if (data_.find(entry.name()) != data_.end())
    {
        return makeError(ErrorCode::DuplicateName,
                         "Directory " + toString(id()) + " already contains Entry with name " +
                             entry.name());
    }

    FileSystem *fs = filesystem();
    if (fs && entry.hasParent() && entry.parent() != id())
    {
        // An entry has a single parent slot; a second listing would escape
        // the removal cascade.
        auto other = fs->getDirectory(entry.parent());
        if (other)
        {
            auto listed = other.value()->getEntry(entry.name());
            if (listed && listed.value().id() == entry.id())
            {
                return makeError(ErrorCode::InvalidArgument,
                                 "Entry " + entry.name() + " is already listed in Directory " +
                                     toString(entry.parent()));
            }
        }
    }

    entry.setParent(id());
    data_.emplace(entry.name(), entry);
    if (fs)
        fs->updateEntryParent(entry.id(), id());
    return {};
}

Expected<Entry> Directory::removeEntry(std::string_view name)
{
    auto it = data_.find(name);
    if (it == data_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to remove Entry " + std::string(name) + " from Directory " +
                             toString(id()));
    }
    Entry removed = it->second;
    data_.erase(it);
    return removed;
}

Expected<Entry> Directory::getEntry(std::string_view name) const
{
    auto it = data_.find(name);
    if (it == data_.end())
    {
        return makeError(ErrorCode::NotFound,
                         "Invalid attempt to retrieve Entry " + std::string(name) +
                             " from Directory " + toString(id()));
    }
    return it->second;
}

Expected<std::vector<Entry>> Directory::getEntries() const
{
    std::vector<Entry> out;
    out.reserve(data_.size());
    for (const auto &[name, entry] : data_)
        out.push_back(entry);
    return out;
}

ExternDirectory::ExternDirectory(FileSystem &target) : target_(&target) {}

NodeKind ExternDirectory::kind() const noexcept
{
    return NodeKind::ExternDirectory;
}

Expected<Directory *> ExternDirectory::targetRoot() const
{
    return target_->getRootDirectory();
}

// Reroute to the target file system's root directory.

Expected<void> ExternDirectory::addEntry(Entry &entry)
{
    auto root = targetRoot();
    if (!root)
        return root.error();
    if (support::isDebugLoggingEnabled())
    {
        support::logDebug("FS",
                          "mount " + toString(id()) + " forwards '" + entry.name() + "' to " +
                              target_->name());
    }
    return root.value()->addEntry(entry);
}

Expected<Entry> ExternDirectory::removeEntry(std::string_view name)
{
    auto root = targetRoot();
    if (!root)
        return root.error();
    return root.value()->removeEntry(name);
}

Expected<Entry> ExternDirectory::getEntry(std::string_view name) const
{
    auto root = targetRoot();
    if (!root)
        return root.error();
    return root.value()->getEntry(name);
}

Expected<std::vector<Entry>> ExternDirectory::getEntries() const
{
    auto root = targetRoot();
    if (!root)
        return root.error();
    return root.value()->getEntries();
}

} // namespace radiant::fs
