//===----------------------------------------------------------------------===//
//
// Part of the Radiant project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/FS_PathTests.cpp
// Purpose: Validate path normalization and resolution across mount points.
// Key invariants: Resolution reports the FileSystem owning each entry; mount
//                 points are crossed transparently.
// Ownership/Lifetime: Tests build small namespaces on the stack.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "fs/Path.hpp"

#include <string>
#include <vector>

using namespace radiant;
using support::ErrorCode;

namespace
{
fs::Directory &makeRoot(fs::FileSystem &fs)
{
    auto &root = fs.emplaceNode<fs::Directory>();
    fs::Entry rootEntry("/", root);
    EXPECT_TRUE(fs.addEntry(rootEntry));
    fs.setRoot(rootEntry);
    return root;
}

void attach(fs::FileSystem &fs, fs::Directory &dir, const std::string &name, fs::Node &node)
{
    fs::Entry e(name, node);
    ASSERT_TRUE(dir.addEntry(e));
    ASSERT_TRUE(fs.addEntry(e));
}

/// @brief Host "/" with "/etc/motd" and a mount "/home" onto a second file
///        system containing "/alice".
struct TwoFs
{
    fs::FileSystem host{"host"};
    fs::FileSystem users{"users"};
    fs::File *motd = nullptr;
    fs::Directory *alice = nullptr;

    TwoFs()
    {
        auto &hostRoot = makeRoot(host);
        auto &usersRoot = makeRoot(users);

        auto &etc = host.emplaceNode<fs::Directory>();
        attach(host, hostRoot, "etc", etc);
        motd = &host.emplaceNode<fs::File>(fs::File::Bytes{'o', 'k'});
        attach(host, etc, "motd", *motd);

        auto &home = host.emplaceNode<fs::ExternDirectory>(users);
        attach(host, hostRoot, "home", home);
        alice = &users.emplaceNode<fs::Directory>();
        attach(users, usersRoot, "alice", *alice);
    }
};
} // namespace

TEST(FSPath, NormalizeCollapsesDotsAndSlashes)
{
    EXPECT_EQ(fs::normalizePath("/").value(), "/");
    EXPECT_EQ(fs::normalizePath("//a///b/").value(), "/a/b");
    EXPECT_EQ(fs::normalizePath("/a/./b/../c").value(), "/a/c");
    EXPECT_EQ(fs::normalizePath("/..").value(), "/");
}

TEST(FSPath, RelativeAndEmptyPathsAreRejected)
{
    auto relative = fs::normalizePath("a/b");
    ASSERT_FALSE(relative);
    EXPECT_EQ(relative.code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(fs::normalizePath(""));
    EXPECT_FALSE(fs::splitPath("x"));
}

TEST(FSPath, SplitAndBasename)
{
    auto parts = fs::splitPath("/usr/local/bin/");
    ASSERT_TRUE(parts);
    EXPECT_EQ(parts.value(), (std::vector<std::string>{"usr", "local", "bin"}));
    EXPECT_TRUE(fs::splitPath("/").value().empty());
    EXPECT_EQ(fs::basename("/usr/local"), "local");
    EXPECT_EQ(fs::basename("/"), "");
}

TEST(FSPath, ResolvesWithinHost)
{
    TwoFs t;
    auto resolved = fs::resolvePath(t.host, "/etc/motd");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved.value().fs, &t.host);
    EXPECT_EQ(resolved.value().node, t.motd);
    ASSERT_TRUE(resolved.value().entry.has_value());
    EXPECT_EQ(resolved.value().entry->name(), "motd");
}

TEST(FSPath, RootResolvesToRootEntry)
{
    TwoFs t;
    auto resolved = fs::resolvePath(t.host, "/");
    ASSERT_TRUE(resolved);
    EXPECT_EQ(resolved.value().entry->name(), "/");
    EXPECT_EQ(resolved.value().node->kind(), fs::NodeKind::Directory);
}

TEST(FSPath, CrossesMountPoints)
{
    TwoFs t;
    auto mountPoint = fs::resolvePath(t.host, "/home");
    ASSERT_TRUE(mountPoint);
    EXPECT_EQ(mountPoint.value().fs, &t.host);
    EXPECT_EQ(mountPoint.value().node->kind(), fs::NodeKind::ExternDirectory);

    auto inside = fs::resolvePath(t.host, "/home/alice");
    ASSERT_TRUE(inside);
    EXPECT_EQ(inside.value().fs, &t.users);
    EXPECT_EQ(inside.value().node, t.alice);
}

TEST(FSPath, MissingComponentIsNotFound)
{
    TwoFs t;
    auto missing = fs::resolvePath(t.host, "/home/bob");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.code(), ErrorCode::NotFound);
    EXPECT_NE(missing.error().message.find("/home/bob"), std::string::npos);
}

TEST(FSPath, TraversingAFileIsNotADirectory)
{
    TwoFs t;
    auto through = fs::resolvePath(t.host, "/etc/motd/extra");
    ASSERT_FALSE(through);
    EXPECT_EQ(through.code(), ErrorCode::NotADirectory);
}

TEST(FSPath, ResolveParentEntersMounts)
{
    TwoFs t;
    std::string leaf;
    auto loc = fs::resolveParent(t.host, "/home/carol", leaf);
    ASSERT_TRUE(loc);
    EXPECT_EQ(leaf, "carol");
    EXPECT_EQ(loc.value().fs, &t.users);
    EXPECT_EQ(loc.value().dir, t.users.getRootDirectory().value());

    auto root = fs::resolveParent(t.host, "/", leaf);
    ASSERT_FALSE(root);
    EXPECT_EQ(root.code(), ErrorCode::InvalidArgument);
}

TEST(FSPath, EnterDirectoryFollowsMount)
{
    TwoFs t;
    auto home = fs::resolvePath(t.host, "/home");
    ASSERT_TRUE(home);
    auto loc = fs::enterDirectory(t.host, static_cast<fs::Directory &>(*home.value().node));
    ASSERT_TRUE(loc);
    EXPECT_EQ(loc.value().fs, &t.users);
    EXPECT_EQ(loc.value().dir->kind(), fs::NodeKind::Directory);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
