// src/config/BootConfig.hpp
// @brief INI-like boot configuration describing the initial namespace.
// @invariant Unknown sections and keys are ignored; defaults stay in place when
//            a value cannot be parsed.
// @ownership Plain data; the loader holds no resources after returning.
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace radiant::config
{

/// @brief A file system grafted into the root namespace.
struct MountSpec
{
    std::string name;       ///< Entry name in the root directory.
    std::string filesystem; ///< Name of the file system created for it.
};

/// @brief A file created at boot.
struct SeedFile
{
    std::string path;    ///< Absolute path; parents are created as needed.
    std::string content; ///< Text stored as the file payload.
};

/// @brief Settings for the [kernel] section.
struct KernelSettings
{
    bool debug = false;
};

/// @brief Settings for the [filesystem] section.
struct FileSystemSettings
{
    std::string name = "root";
};

/// @brief Whole boot configuration.
struct BootConfig
{
    KernelSettings kernel{};
    FileSystemSettings filesystem{};
    std::vector<MountSpec> mounts;
    std::vector<SeedFile> files;
};

/// @brief Load configuration from @p path into @p out.
/// @return False when the file cannot be opened; parse problems are skipped.
bool loadFromFile(const std::string &path, BootConfig &out);

/// @brief Parse configuration text held in memory into @p out.
void loadFromString(std::string_view text, BootConfig &out);

} // namespace radiant::config
