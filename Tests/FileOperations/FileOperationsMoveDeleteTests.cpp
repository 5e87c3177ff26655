#include <gtest/gtest.h>

#include <filesystem>

#include "FileOpsTestHelpers.h"
#include "FileOperations/FileOperationsManager.h"

using namespace TwinPane::Core::IO;
using twinpane::test_helpers::itemFor;
using twinpane::test_helpers::readAllBytes;
using twinpane::test_helpers::RecordingSink;
using twinpane::test_helpers::ScopedTempDir;
using twinpane::test_helpers::ScopedWorkEnv;
using twinpane::test_helpers::writeFile;

namespace fs = std::filesystem;

TEST(FileOperationsMove, SameVolumeMoveRenamesEntries) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("left/docs/old"));
    writeFile(tmp.join("left/docs/a.txt"), "alpha");
    writeFile(tmp.join("left/docs/old/b.txt"), "beta");
    writeFile(tmp.join("left/note.txt"), "note");

    auto result = env.manager().moveItems({itemFor(tmp.join("left/docs")), itemFor(tmp.join("left/note.txt"))},
                                          tmp.join("right"), ConflictResolver::skip());

    EXPECT_EQ(result.items.size(), 5u);
    EXPECT_TRUE(result.allCompleted());
    EXPECT_EQ(readAllBytes(tmp.join("right/docs/a.txt")), "alpha");
    EXPECT_EQ(readAllBytes(tmp.join("right/docs/old/b.txt")), "beta");
    EXPECT_EQ(readAllBytes(tmp.join("right/note.txt")), "note");
    EXPECT_FALSE(fs::exists(tmp.join("left/docs")));
    EXPECT_FALSE(fs::exists(tmp.join("left/note.txt")));
}

TEST(FileOperationsMove, SkippedContentKeepsSourceDirectory) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("left/docs"));
    fs::create_directories(tmp.join("right/docs"));
    writeFile(tmp.join("left/docs/keep.txt"), "mine");
    writeFile(tmp.join("left/docs/go.txt"), "go");
    writeFile(tmp.join("right/docs/keep.txt"), "theirs");

    // Directory pairs merge, files collide and are skipped
    auto result = env.manager().moveItems({itemFor(tmp.join("left/docs"))}, tmp.join("right"),
                                          ConflictResolver::merge(ConflictAction::Skip));

    ASSERT_EQ(result.items.size(), 3u);
    EXPECT_EQ(result.count(OperationState::Skipped), 1u);
    EXPECT_EQ(readAllBytes(tmp.join("right/docs/go.txt")), "go");
    EXPECT_EQ(readAllBytes(tmp.join("right/docs/keep.txt")), "theirs");
    EXPECT_EQ(readAllBytes(tmp.join("left/docs/keep.txt")), "mine");
    EXPECT_FALSE(fs::exists(tmp.join("left/docs/go.txt")));
}

TEST(FileOperationsMove, MovingOntoItselfIsRefused) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "a");

    auto result = env.manager().moveItems({itemFor(tmp.join("a.txt"))}, tmp.path(), ConflictResolver::overwrite());

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].state(), OperationState::Failed);
    EXPECT_EQ(result.items[0].error()->code, FileOpError::InvalidTarget);
    EXPECT_EQ(readAllBytes(tmp.join("a.txt")), "a");
}

TEST(FileOperationsMove, DirectoryIntoItsOwnSubtreeIsRefused) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("a/b"));
    writeFile(tmp.join("a/file.txt"), "f");

    auto result = env.manager().moveItems({itemFor(tmp.join("a"))}, tmp.join("a/b"), ConflictResolver::skip());

    ASSERT_FALSE(result.items.empty());
    EXPECT_EQ(result.items[0].error()->code, FileOpError::InvalidTarget);
    EXPECT_EQ(result.count(OperationState::Completed), 0u);
    EXPECT_TRUE(fs::exists(tmp.join("a/file.txt")));
    EXPECT_FALSE(fs::exists(tmp.join("a/b/a")));
}

TEST(FileOperationsMove, OverwriteReplacesDestinationFile) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("dst"));
    writeFile(tmp.join("a.txt"), "replacement");
    writeFile(tmp.join("dst/a.txt"), "old");

    auto result = env.manager().moveItems({itemFor(tmp.join("a.txt"))}, tmp.join("dst"), ConflictResolver::overwrite());

    ASSERT_TRUE(result.allCompleted());
    EXPECT_EQ(readAllBytes(tmp.join("dst/a.txt")), "replacement");
    EXPECT_FALSE(fs::exists(tmp.join("a.txt")));
}

TEST(FileOperationsDelete, ChildrenFinishBeforeTheirDirectory) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("tree/sub"));
    writeFile(tmp.join("tree/1.txt"), "1");
    writeFile(tmp.join("tree/2.txt"), "2");
    writeFile(tmp.join("tree/sub/3.txt"), "3");
    RecordingSink recorder;

    auto result = env.manager().deleteItems({itemFor(tmp.join("tree"))}, recorder.sink());

    ASSERT_EQ(result.items.size(), 5u);
    EXPECT_TRUE(result.allCompleted());
    EXPECT_FALSE(fs::exists(tmp.join("tree")));

    const auto& root = result.items.back();
    ASSERT_EQ(root.sourcePath(), normalizePath(tmp.join("tree")));
    for (const auto& item : result.items) {
        ASSERT_TRUE(item.finishedAt().has_value());
        EXPECT_LE(*item.finishedAt(), *root.finishedAt());
    }

    EXPECT_EQ(recorder.terminalItems().size(), 5u);
}

TEST(FileOperationsDelete, LinkIsRemovedWithoutTouchingTarget) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("real"));
    writeFile(tmp.join("real/data.txt"), "data");
    fs::create_directory_symlink(tmp.join("real"), tmp.join("alias"));

    auto result = env.manager().deleteItems({itemFor(tmp.join("alias"))});

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_TRUE(result.allCompleted());
    EXPECT_FALSE(fs::exists(fs::symlink_status(tmp.join("alias"))));
    EXPECT_EQ(readAllBytes(tmp.join("real/data.txt")), "data");
}

TEST(FileOperationsDelete, VanishedEntryFailsWithNotFound) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "a");
    writeFile(tmp.join("b.txt"), "b");
    auto gone = itemFor(tmp.join("a.txt"));
    fs::remove(tmp.join("a.txt"));

    auto result = env.manager().deleteItems({gone, itemFor(tmp.join("b.txt"))});

    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.count(OperationState::Failed), 1u);
    EXPECT_EQ(result.count(OperationState::Completed), 1u);
    for (const auto& item : result.items) {
        if (item.state() == OperationState::Failed) {
            EXPECT_EQ(item.error()->code, FileOpError::NotFound);
        }
    }
    EXPECT_FALSE(fs::exists(tmp.join("b.txt")));
}
