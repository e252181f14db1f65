//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: services/FileSystemManager.hpp
// Purpose: Declare the "fs" Manager, which owns the root FileSystem plus every
//          mounted one and publishes path-based operations over them.
// Key invariants: filesystems_[0] is the root namespace; every FileSystem it
//                 owns has a root Directory; file system names are unique.
// Ownership/Lifetime: Owns its FileSystems.  Pointers handed out stay valid
//                     for the Manager's lifetime.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/BootConfig.hpp"
#include "fs/FileSystem.hpp"
#include "fs/Path.hpp"
#include "kernel/Manager.hpp"
#include "support/diag_expected.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace radiant::services
{

/// @brief Manager owning the in-memory namespace.
class FileSystemManager final : public kernel::Manager
{
  public:
  private:
    struct ConstructionTag
    {
        explicit ConstructionTag() = default;
    };

  public:
    static constexpr const char *kName = "fs";

    /// @brief Only create() can name the tag.
    explicit FileSystemManager(ConstructionTag);

    /// @brief Build the namespace described by @p cfg: root file system,
    ///        mounts and seed files.
    static support::Expected<std::unique_ptr<FileSystemManager>> create(
        const config::BootConfig &cfg);

    void setup(kernel::Kernel &kernel) override;
    void start() override;

    /// @brief Operations: list, stat, mkdir, write, read, remove, link,
    ///        mount and filesystems.
    kernel::ModuleApi getModuleApi() override;

    [[nodiscard]] fs::FileSystem &root() const noexcept
    {
        return *filesystems_.front();
    }

    /// @brief File system called @p name, or NotFound.
    support::Expected<fs::FileSystem *> findFileSystem(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> fileSystemNames() const;

    support::Expected<fs::Resolved> resolve(std::string_view path) const;

    /// @brief Entries of the directory at @p path, crossing a mount if needed.
    support::Expected<std::vector<fs::Entry>> list(std::string_view path) const;

    support::Expected<void> makeDirectory(std::string_view path);

    /// @brief Create the file at @p path or replace its contents.
    support::Expected<void> writeFile(std::string_view path, std::string_view text);

    support::Expected<std::string> readFile(std::string_view path) const;

    /// @brief Remove the entry at @p path; directories are emptied first
    ///        unless other entries still link to them.  Removing a mount
    ///        point leaves the mounted file system untouched.
    support::Expected<void> remove(std::string_view path);

    /// @brief Add a second entry at @p path for the file at @p target.
    support::Expected<void> link(std::string_view target, std::string_view path);

    /// @brief Graft file system @p fsName at @p path, creating it if needed.
    /// @details A file system created for a mount that then fails is
    ///          discarded again.
    support::Expected<void> mount(std::string_view path, std::string_view fsName);

    /// @brief One-line description of the node at @p path.
    support::Expected<std::string> stat(std::string_view path) const;

  private:
    support::Expected<fs::FileSystem *> createFileSystem(std::string name);
    void dropFileSystem(const fs::FileSystem *doomed);
    support::Expected<void> makeDirectories(std::string_view path);
    support::Expected<void> removeRecursive(fs::FileSystem &owner, const fs::Entry &entry);

    std::vector<std::unique_ptr<fs::FileSystem>> filesystems_;
};

} // namespace radiant::services
