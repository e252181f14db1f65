// src/config/BootConfig.cpp
// @brief INI-like boot configuration loader implementation.
// @invariant Reads sections [kernel], [filesystem], [mounts] and [files].
// @ownership Loader does not own external resources beyond file path.

#include "config/BootConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <sstream>

namespace radiant::config
{

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string to_lower(std::string s)
{
    std::transform(
        s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_bool(const std::string &s, bool &out)
{
    const std::string lower = to_lower(s);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
    {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
    {
        out = false;
        return true;
    }
    return false;
}

void parse_stream(std::istream &in, BootConfig &out)
{
    std::string line;
    std::string section;
    while (std::getline(in, line))
    {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = to_lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string value = trim(trimmed.substr(eq + 1));
        if (key.empty())
        {
            continue;
        }

        if (section == "kernel")
        {
            if (to_lower(key) == "debug")
            {
                bool flag = false;
                if (parse_bool(value, flag))
                    out.kernel.debug = flag;
            }
        }
        else if (section == "filesystem")
        {
            if (to_lower(key) == "name" && !value.empty())
            {
                out.filesystem.name = value;
            }
        }
        else if (section == "mounts")
        {
            // Mount names become root directory entries; no slashes allowed.
            if (value.empty() || key.find('/') != std::string::npos)
            {
                continue;
            }
            out.mounts.push_back(MountSpec{key, value});
        }
        else if (section == "files")
        {
            if (key.front() != '/')
            {
                continue;
            }
            out.files.push_back(SeedFile{key, value});
        }
    }
}

} // namespace

bool loadFromFile(const std::string &path, BootConfig &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    parse_stream(in, out);
    return true;
}

void loadFromString(std::string_view text, BootConfig &out)
{
    std::istringstream in{std::string(text)};
    parse_stream(in, out);
}

} // namespace radiant::config
