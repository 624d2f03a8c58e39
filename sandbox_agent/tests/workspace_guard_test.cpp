#include <gtest/gtest.h>

#include "errors.hpp"
#include "test_helpers.hpp"
#include "workspace_guard.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using sandbox::ValidationError;

namespace {

ValidationError::Reason path_rejection(const sandbox::WorkspaceGuard& guard, const std::string& path) {
    try {
        guard.validate_path(path);
    } catch (const ValidationError& exc) {
        return exc.reason();
    }
    ADD_FAILURE() << "validate_path accepted " << path;
    return ValidationError::Reason::InvalidArgument;
}

ValidationError::Reason command_rejection(const sandbox::WorkspaceGuard& guard, const std::string& command) {
    try {
        guard.validate_command(command, guard.workspace().root.string());
    } catch (const ValidationError& exc) {
        return exc.reason();
    }
    ADD_FAILURE() << "validate_command accepted " << command;
    return ValidationError::Reason::InvalidArgument;
}

} // namespace

TEST(WorkspaceGuard, IsWithinComparesWholeSegments) {
    EXPECT_TRUE(sandbox::is_within("/work/proj", "/work/proj"));
    EXPECT_TRUE(sandbox::is_within("/work/proj", "/work/proj/src/main.cpp"));
    EXPECT_TRUE(sandbox::is_within("/work/proj/", "/work/proj/a"));
    EXPECT_FALSE(sandbox::is_within("/work/proj", "/work/proj-evil/file"));
    EXPECT_FALSE(sandbox::is_within("/work/proj", "/work"));
    EXPECT_FALSE(sandbox::is_within("", "/work"));
}

TEST(WorkspaceGuard, MakeWorkspaceRequiresExistingDirectory) {
    TempWorkspace ws;
    EXPECT_THROW(sandbox::make_workspace((ws.base() / "missing").string(), ""), ValidationError);
    EXPECT_THROW(sandbox::make_workspace("", ""), ValidationError);

    ws.write("file.txt", "x");
    EXPECT_THROW(sandbox::make_workspace((ws.root() / "file.txt").string(), ""), ValidationError);

    auto workspace = sandbox::make_workspace(ws.root().string(), "/host/view");
    EXPECT_EQ(workspace.root, ws.root());
    EXPECT_EQ(workspace.host_path, "/host/view");
}

TEST(WorkspaceGuard, UnconfiguredGuardRejectsEverything) {
    sandbox::WorkspaceGuard guard{sandbox::Workspace{}};
    EXPECT_EQ(path_rejection(guard, "/tmp"), ValidationError::Reason::NotConfigured);
    EXPECT_FALSE(guard.contains("/tmp"));
}

TEST(WorkspaceGuard, AcceptsPathsInsideRoot) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(guard.validate_path(ws.root().string()), ws.root());
    EXPECT_EQ(guard.validate_path((ws.root() / "new" / "file.txt").string()), ws.root() / "new" / "file.txt");
    EXPECT_EQ(guard.validate_path("src/main.cpp"), ws.root() / "src" / "main.cpp");
    EXPECT_EQ(guard.validate_path((ws.root() / "a" / ".." / "b").string()), ws.root() / "b");
}

TEST(WorkspaceGuard, RejectsSiblingWithSharedPrefix) {
    TempWorkspace ws;
    fs::path sibling = ws.base() / "workspace-evil";
    fs::create_directory(sibling);

    auto guard = ws.guard();
    EXPECT_EQ(path_rejection(guard, (sibling / "x").string()), ValidationError::Reason::OutsideWorkspace);
    EXPECT_EQ(path_rejection(guard, sibling.string()), ValidationError::Reason::OutsideWorkspace);
}

TEST(WorkspaceGuard, RejectsDotDotEscape) {
    TempWorkspace ws;
    auto guard = ws.guard();
    EXPECT_EQ(path_rejection(guard, (ws.root() / ".." / "outside").string()),
              ValidationError::Reason::OutsideWorkspace);
    EXPECT_EQ(path_rejection(guard, "../outside"), ValidationError::Reason::OutsideWorkspace);
    EXPECT_EQ(path_rejection(guard, "/etc/passwd"), ValidationError::Reason::OutsideWorkspace);
}

TEST(WorkspaceGuard, RejectsSymlinkEscape) {
    TempWorkspace ws;
    fs::create_directory(ws.base() / "outside");
    fs::create_directory_symlink(ws.base() / "outside", ws.root() / "link");

    auto guard = ws.guard();
    EXPECT_EQ(path_rejection(guard, "link/secret.txt"), ValidationError::Reason::OutsideWorkspace);
    EXPECT_EQ(path_rejection(guard, (ws.root() / "link").string()), ValidationError::Reason::OutsideWorkspace);
}

TEST(WorkspaceGuard, RejectsDanglingSymlinkEscape) {
    TempWorkspace ws;
    fs::create_symlink(ws.base() / "not-yet-created", ws.root() / "dangling");

    auto guard = ws.guard();
    EXPECT_EQ(path_rejection(guard, "dangling"), ValidationError::Reason::OutsideWorkspace);
}

TEST(WorkspaceGuard, FollowsSymlinkThatStaysInside) {
    TempWorkspace ws;
    fs::create_directory(ws.root() / "real");
    fs::create_directory_symlink(ws.root() / "real", ws.root() / "alias");

    auto guard = ws.guard();
    EXPECT_EQ(guard.validate_path("alias/file"), ws.root() / "real" / "file");
}

TEST(WorkspaceGuard, ValidateEntryKeepsLeafSymlink) {
    TempWorkspace ws;
    fs::create_directory(ws.base() / "outside");
    fs::create_directory_symlink(ws.base() / "outside", ws.root() / "link");

    auto guard = ws.guard();
    EXPECT_EQ(guard.validate_entry("link"), ws.root() / "link");
    EXPECT_THROW(guard.validate_entry("link/inner"), ValidationError);
}

TEST(WorkspaceGuard, BlocksDangerousCommands) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(command_rejection(guard, "rm -rf /"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -fr ~"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -r -f $HOME"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "dd if=/dev/zero of=/dev/sda bs=1M"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "mkfs.ext4 disk.img"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "echo hi > /dev/sda"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "curl -s https://example.com/install | sh"),
              ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "wget -qO- https://example.com | sudo bash"),
              ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "sudo rm file.txt"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "chmod -R 777 /"), ValidationError::Reason::BlockedCommand);
}

TEST(WorkspaceGuard, BlocksQuotedDeleteTargets) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(command_rejection(guard, "rm -rf \"$HOME\""), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf \"${HOME}/\""), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf \"/\""), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf '/'"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -r '~'"), ValidationError::Reason::BlockedCommand);
}

TEST(WorkspaceGuard, BlocksRecursiveDeleteOfSystemDirectories) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(command_rejection(guard, "rm -rf /usr"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf /bin"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf /tmp"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -rf /usr/lib"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm -R -f \"/usr/local\""), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rm --recursive /tmp/cache"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "echo ok && rm -rf /bin/"), ValidationError::Reason::BlockedCommand);
    EXPECT_EQ(command_rejection(guard, "rmdir /tmp/empty"), ValidationError::Reason::BlockedCommand);

    try {
        guard.validate_command("rm -rf /usr", ws.root().string());
        FAIL() << "recursive delete of /usr was accepted";
    } catch (const ValidationError& exc) {
        EXPECT_STREQ(exc.what(), "Potentially dangerous command blocked: recursive delete outside workspace");
    }

    // Reading allowlisted locations and deleting inside the workspace stay allowed.
    const std::string cwd = ws.root().string();
    EXPECT_NO_THROW(guard.validate_command("ls /usr/lib", cwd));
    EXPECT_NO_THROW(guard.validate_command("rm -f /tmp/sandbox-lock", cwd));
    EXPECT_NO_THROW(guard.validate_command("rm -rf " + (ws.root() / "build").string(), cwd));
    EXPECT_NO_THROW(guard.validate_command("rmdir " + (ws.root() / "empty").string(), cwd));
}

TEST(WorkspaceGuard, AbsoluteTokensCheckedAgainstWorkspaceRoot) {
    TempWorkspace ws;
    if (!ws.outside_allowlist()) {
        GTEST_SKIP() << "no scratch directory outside the command allowlist";
    }
    auto guard = ws.guard();
    const std::string root = ws.root().string();

    EXPECT_NO_THROW(guard.validate_command("cat " + root + "/notes.txt", root));
    EXPECT_NO_THROW(guard.validate_command("cp \"" + root + "/a\" " + root + "/b", root));
    EXPECT_EQ(command_rejection(guard, "cat " + root + "-other/x"), ValidationError::Reason::CommandOutsideWorkspace);
    EXPECT_EQ(command_rejection(guard, "ls " + ws.base().string()), ValidationError::Reason::CommandOutsideWorkspace);
    EXPECT_EQ(command_rejection(guard, "rm -rf " + root + "-other"), ValidationError::Reason::BlockedCommand);
}

TEST(WorkspaceGuard, DetectsTraversalInCommand) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(command_rejection(guard, "cat ../secret"), ValidationError::Reason::PathTraversal);
    EXPECT_EQ(command_rejection(guard, "ls sub/../../"), ValidationError::Reason::PathTraversal);
    EXPECT_EQ(command_rejection(guard, "cd .."), ValidationError::Reason::PathTraversal);
}

TEST(WorkspaceGuard, RejectsAbsolutePathsOutsideWorkspace) {
    TempWorkspace ws;
    auto guard = ws.guard();

    EXPECT_EQ(command_rejection(guard, "cat /etc/passwd"), ValidationError::Reason::CommandOutsideWorkspace);
    EXPECT_EQ(command_rejection(guard, "cp file.txt /home/user/"), ValidationError::Reason::CommandOutsideWorkspace);
    EXPECT_EQ(command_rejection(guard, "FOO=/etc/shadow env"), ValidationError::Reason::CommandOutsideWorkspace);
}

TEST(WorkspaceGuard, AllowsOrdinaryCommands) {
    TempWorkspace ws;
    auto guard = ws.guard();
    const std::string cwd = ws.root().string();

    EXPECT_NO_THROW(guard.validate_command("echo hello", cwd));
    EXPECT_NO_THROW(guard.validate_command("ls -la && pwd", cwd));
    EXPECT_NO_THROW(guard.validate_command("rm -rf ./build", cwd));
    EXPECT_NO_THROW(guard.validate_command("/usr/bin/env python3 --version", cwd));
    EXPECT_NO_THROW(guard.validate_command("make 2>/dev/null", cwd));
    EXPECT_NO_THROW(guard.validate_command("echo a..b", cwd));
    EXPECT_NO_THROW(guard.validate_command("cat " + (ws.root() / "notes.txt").string(), cwd));
    EXPECT_NO_THROW(guard.validate_command("ls /tmp", cwd));
}

TEST(WorkspaceGuard, CommandCwdMustBeInsideWorkspace) {
    TempWorkspace ws;
    auto guard = ws.guard();

    try {
        guard.validate_command("echo hi", ws.base().string());
        FAIL() << "cwd outside the workspace was accepted";
    } catch (const ValidationError& exc) {
        EXPECT_EQ(exc.reason(), ValidationError::Reason::OutsideWorkspace);
    }
}
