//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/Shell_CommandTests.cpp
// Purpose: Drive the "shell" Manager through a started kernel.
// Key invariants: The shell only talks to the file system through the "fs"
//                 capability obtained during start().
// Ownership/Lifetime: Each test owns a Kernel that owns both Managers.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "kernel/Kernel.hpp"
#include "services/FileSystemManager.hpp"
#include "services/ShellManager.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace radiant;
using support::ErrorCode;

namespace
{
struct ShellFixture : public ::testing::Test
{
    std::unique_ptr<kernel::Kernel> booted;
    services::ShellManager *shell = nullptr;

    void SetUp() override
    {
        config::BootConfig cfg;
        cfg.mounts.push_back({"home", "users"});
        cfg.files.push_back({"/etc/motd", "welcome"});

        auto fs = services::FileSystemManager::create(cfg);
        ASSERT_TRUE(fs);
        std::vector<std::unique_ptr<kernel::Manager>> managers;
        managers.push_back(std::move(fs.value()));
        managers.push_back(std::make_unique<services::ShellManager>());

        auto created = kernel::Kernel::create(std::move(managers));
        ASSERT_TRUE(created);
        booted = std::move(created.value());
        ASSERT_TRUE(booted->start());

        auto found = booted->manager<services::ShellManager>(services::ShellManager::kName);
        ASSERT_TRUE(found);
        shell = found.value();
    }

    std::string run(const std::string &line)
    {
        auto result = shell->execute(line);
        EXPECT_TRUE(result) << line << ": " << (result ? "" : result.error().message);
        return result ? result.value() : std::string{};
    }
};
} // namespace

TEST(ShellTokenize, SplitsOnWhitespace)
{
    auto words = services::tokenize("  ls   /etc  ");
    ASSERT_TRUE(words);
    EXPECT_EQ(words.value(), (std::vector<std::string>{"ls", "/etc"}));
}

TEST(ShellTokenize, QuotesGroupWords)
{
    auto words = services::tokenize("write /f \"two  words\" \"\"");
    ASSERT_TRUE(words);
    EXPECT_EQ(words.value(), (std::vector<std::string>{"write", "/f", "two  words", ""}));
}

TEST(ShellTokenize, UnterminatedQuoteFails)
{
    auto words = services::tokenize("write /f \"oops");
    ASSERT_FALSE(words);
    EXPECT_EQ(words.code(), ErrorCode::InvalidArgument);
}

TEST(ShellManager, RejectsCommandsBeforeStart)
{
    services::ShellManager idle;
    auto result = idle.execute("ls");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ErrorCode::InvalidLifecycleState);
}

TEST(ShellManager, UnboundShellReportsMissingService)
{
    std::vector<std::unique_ptr<kernel::Manager>> managers;
    managers.push_back(std::make_unique<services::ShellManager>());
    auto k = kernel::Kernel::create(std::move(managers));
    ASSERT_TRUE(k);
    ASSERT_TRUE(k.value()->start());

    auto shell = k.value()->manager<services::ShellManager>("shell");
    ASSERT_TRUE(shell);
    auto result = shell.value()->execute("ls");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
    EXPECT_TRUE(shell.value()->execute("help"));
}

TEST_F(ShellFixture, ListsAndReadsSeededFiles)
{
    EXPECT_EQ(run("ls"), "etc/\nhome/\n");
    EXPECT_EQ(run("ls /etc"), "motd\n");
    EXPECT_EQ(run("cat /etc/motd"), "welcome");
}

TEST_F(ShellFixture, WritesThroughMounts)
{
    run("mkdir /home/alice");
    run("write /home/alice/todo \"water the plants\"");
    EXPECT_EQ(run("cat /home/alice/todo"), "water the plants");
    EXPECT_NE(run("stat /home/alice/todo").find("fs=users"), std::string::npos);
    EXPECT_EQ(run("df"), "root\nusers\n");
}

TEST_F(ShellFixture, LinkAndRemove)
{
    run("write /a one");
    run("ln /a /b");
    EXPECT_NE(run("stat /b").find("refs=2"), std::string::npos);
    run("rm /a");
    EXPECT_EQ(run("cat /b"), "one");

    auto gone = shell->execute("cat /a");
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.code(), ErrorCode::NotFound);
}

TEST_F(ShellFixture, UnknownCommandIsNotFound)
{
    auto result = shell->execute("frobnicate /x");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

TEST_F(ShellFixture, BlankLineDoesNothing)
{
    EXPECT_EQ(run("   "), "");
}

TEST_F(ShellFixture, HelpListsCommands)
{
    const std::string help = run("help");
    for (const char *word : {"ls", "stat", "mkdir", "write", "cat", "rm", "ln", "mount", "df"})
        EXPECT_NE(help.find(word), std::string::npos) << word;
}

TEST_F(ShellFixture, ModuleApiExec)
{
    auto api = shell->getModuleApi();
    EXPECT_TRUE(api.has("exec"));
    EXPECT_TRUE(api.has("help"));
    auto listed = api.invoke("exec", {"ls", "/etc"});
    ASSERT_TRUE(listed);
    EXPECT_EQ(listed.value(), "motd\n");
}

TEST_F(ShellFixture, ModuleApiExecKeepsWordsIntact)
{
    auto api = shell->getModuleApi();
    ASSERT_TRUE(api.invoke("exec", {"mkdir", "/my dir"}));
    ASSERT_TRUE(api.invoke("exec", {"write", "/my dir/note", "a  b", "\"c\""}));
    EXPECT_NE(run("ls /").find("my dir/\n"), std::string::npos);
    EXPECT_EQ(run("cat \"/my dir/note\""), "a  b \"c\"");

    auto blank = api.invoke("exec", {});
    ASSERT_TRUE(blank);
    EXPECT_EQ(blank.value(), "");
}

TEST_F(ShellFixture, FileSystemManagerIsReachableThroughKernel)
{
    auto fs = booted->managers()["fs"];
    ASSERT_TRUE(fs);
    auto api = fs.value()->getModuleApi();
    auto read = api.invoke("read", {"/etc/motd"});
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), "welcome");
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
