//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the "shell" Manager.  Each command word maps onto one operation of
// the "fs" capability; the shell itself keeps no namespace state.
//
//===----------------------------------------------------------------------===//

#include "services/ShellManager.hpp"

#include "kernel/Kernel.hpp"
#include "support/log.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace radiant::services
{

using support::ErrorCode;
using support::Expected;
using support::makeError;

namespace
{
struct Command
{
    const char *word;
    const char *operation;
    const char *usage;
};

constexpr std::array<Command, 10> kCommands{{
    {"ls", "list", "ls [path]            list a directory"},
    {"stat", "stat", "stat <path>          describe a node"},
    {"mkdir", "mkdir", "mkdir <path>         create a directory"},
    {"write", "write", "write <path> [text]  create or replace a file"},
    {"cat", "read", "cat <path>           print a file"},
    {"rm", "remove", "rm <path>            remove an entry"},
    {"ln", "link", "ln <target> <path>   add another entry for a file"},
    {"mount", "mount", "mount <path> <fs>    graft a file system"},
    {"df", "filesystems", "df                   list file systems"},
    {"help", nullptr, "help                 show this text"},
}};

const Command *findCommand(std::string_view word)
{
    for (const auto &command : kCommands)
    {
        if (word == command.word)
            return &command;
    }
    return nullptr;
}
} // namespace

Expected<std::vector<std::string>> tokenize(std::string_view line)
{
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    bool quoted = false;

    for (char c : line)
    {
        if (c == '"')
        {
            quoted = !quoted;
            inWord = true;
            continue;
        }
        if (!quoted && std::isspace(static_cast<unsigned char>(c)))
        {
            if (inWord)
            {
                words.push_back(std::move(current));
                current.clear();
                inWord = false;
            }
            continue;
        }
        current += c;
        inWord = true;
    }

    if (quoted)
        return makeError(ErrorCode::InvalidArgument, "unterminated quote in: " + std::string(line));
    if (inWord)
        words.push_back(std::move(current));
    return words;
}

ShellManager::ShellManager() : Manager(kName) {}

void ShellManager::start()
{
    auto fs = kernel()->getManager("fs");
    if (!fs)
    {
        support::logDebug("SHELL", fs.error().message);
        return;
    }
    fs_ = fs.value()->getModuleApi();
    support::logDebug("SHELL", "bound to file system service");
}

std::string ShellManager::helpText()
{
    std::string text;
    for (const auto &command : kCommands)
    {
        text += command.usage;
        text += '\n';
    }
    return text;
}

Expected<std::string> ShellManager::execute(std::string_view line) const
{
    auto words = tokenize(line);
    if (!words)
        return words.error();
    return executeWords(std::move(words.value()));
}

Expected<std::string> ShellManager::executeWords(std::vector<std::string> args) const
{
    if (state() != kernel::ManagerState::Started)
    {
        return makeError(ErrorCode::InvalidLifecycleState,
                         "shell cannot run commands before the kernel has started");
    }
    if (args.empty())
        return std::string{};

    const std::string word = args.front();
    args.erase(args.begin());

    const Command *command = findCommand(word);
    if (!command)
        return makeError(ErrorCode::NotFound, "unknown command: " + word);
    if (!command->operation)
        return helpText();
    if (!fs_)
        return makeError(ErrorCode::NotFound, "no file system service is available");

    if (support::isDebugLoggingEnabled())
        support::logDebug("SHELL", word + " -> " + command->operation);
    return fs_->invoke(command->operation, args);
}

kernel::ModuleApi ShellManager::getModuleApi()
{
    kernel::ModuleApi api;
    api.define("exec",
               [this](const kernel::ModuleApi::Args &args) -> kernel::ModuleApi::Result
               { return executeWords(args); });
    api.define("help",
               [](const kernel::ModuleApi::Args &) -> kernel::ModuleApi::Result
               { return helpText(); });
    return api;
}

} // namespace radiant::services
