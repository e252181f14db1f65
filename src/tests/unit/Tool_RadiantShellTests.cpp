//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/Tool_RadiantShellTests.cpp
// Purpose: Check the radiant-shell driver loops: option scanning, failure
//          collection and the resulting exit status.
// Key invariants: A failing command never stops the loop; any failure turns
//                 the exit status into kExitCommandFailed.
// Ownership/Lifetime: Each test boots its own kernel.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tools/radiant-shell/cli.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace radiant;
namespace cli = radiant::tools::shell;

namespace
{
std::unique_ptr<kernel::Kernel> boot()
{
    config::BootConfig cfg;
    cfg.files.push_back({"/etc/motd", "welcome"});
    auto booted = cli::bootKernel(cfg);
    EXPECT_TRUE(booted);
    if (!booted)
        return nullptr;
    return std::move(booted.value());
}

const services::ShellManager &shellOf(kernel::Kernel &k)
{
    auto shell = k.manager<services::ShellManager>(services::ShellManager::kName);
    EXPECT_TRUE(shell);
    return *shell.value();
}
} // namespace

TEST(RadiantShell, AllCommandsSucceed)
{
    auto k = boot();
    ASSERT_TRUE(k);
    std::ostringstream out;
    std::ostringstream err;
    const int status = cli::runCommands(shellOf(*k), {"mkdir /d", "cat /etc/motd"}, out, err);
    EXPECT_EQ(status, cli::kExitOk);
    EXPECT_EQ(out.str(), "welcome\n");
    EXPECT_TRUE(err.str().empty());
}

TEST(RadiantShell, FailureIsReportedAndLoopContinues)
{
    auto k = boot();
    ASSERT_TRUE(k);
    std::ostringstream out;
    std::ostringstream err;
    const int status =
        cli::runCommands(shellOf(*k), {"cat /missing", "bogus", "cat /etc/motd"}, out, err);
    EXPECT_EQ(status, cli::kExitCommandFailed);
    EXPECT_EQ(out.str(), "welcome\n");
    EXPECT_NE(err.str().find("[not-found]"), std::string::npos);
    EXPECT_NE(err.str().find("unknown command: bogus"), std::string::npos);
}

TEST(RadiantShell, InteractiveLoopStopsAtExit)
{
    auto k = boot();
    ASSERT_TRUE(k);
    std::istringstream in("write /f hi\nexit\ncat /missing\n");
    std::ostringstream out;
    std::ostringstream err;
    const int status = cli::runInteractive(shellOf(*k), in, out, err, false);
    EXPECT_EQ(status, cli::kExitOk);
    EXPECT_TRUE(err.str().empty());
}

TEST(RadiantShell, ParsesOptionsAndCommands)
{
    std::vector<std::string> args = {"radiant-shell", "--config", "boot.ini", "ls /", "df"};
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.data());

    cli::ShellOptions opts;
    std::string error;
    ASSERT_EQ(cli::parseOptions(static_cast<int>(argv.size()), argv.data(), opts, error),
              cli::OptionParseResult::Parsed);
    EXPECT_EQ(opts.configPath, "boot.ini");
    EXPECT_EQ(opts.commands, (std::vector<std::string>{"ls /", "df"}));
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
