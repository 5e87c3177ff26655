#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>

#include "FileOpsTestHelpers.h"
#include "FileOperations/FileOperationsManager.h"

using namespace TwinPane::Core::IO;
using TwinPane::Core::Concurrency::WorkContractGroup;
using twinpane::test_helpers::itemFor;
using twinpane::test_helpers::listNames;
using twinpane::test_helpers::readAllBytes;
using twinpane::test_helpers::RecordingSink;
using twinpane::test_helpers::ScopedTempDir;
using twinpane::test_helpers::ScopedWorkEnv;
using twinpane::test_helpers::writeFile;

namespace fs = std::filesystem;

TEST(FileOperationsCopy, OverwriteReplacesSmallerFile) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("src"));
    fs::create_directories(tmp.join("dst"));
    writeFile(tmp.join("src/a.txt"), "0123456789");
    writeFile(tmp.join("dst/a.txt"), "old!!");

    auto result = env.manager().copyItems({itemFor(tmp.join("src/a.txt"))}, tmp.join("dst"),
                                          ConflictResolver::overwrite());

    ASSERT_EQ(result.items.size(), 1u);
    const auto& item = result.items[0];
    EXPECT_EQ(item.state(), OperationState::Completed) << (item.error() ? item.error()->message : "");
    EXPECT_EQ(item.bytesTransferred(), 10u);
    EXPECT_EQ(fs::file_size(tmp.join("dst/a.txt")), 10u);
    EXPECT_EQ(readAllBytes(tmp.join("dst/a.txt")), "0123456789");
    EXPECT_EQ(listNames(tmp.join("dst")), (std::vector<fs::path>{"a.txt"}));
}

TEST(FileOperationsCopy, DirectoryIsCreatedBeforeItsContentStarts) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("src"));
    writeFile(tmp.join("src/x.txt"), "x");
    fs::create_directories(tmp.join("out"));

    auto result = env.manager().copyItems({itemFor(tmp.join("src"))}, tmp.join("out"), ConflictResolver::skip());

    ASSERT_EQ(result.items.size(), 2u);
    const auto& dir = result.items[0];
    const auto& file = result.items[1];
    EXPECT_EQ(dir.kind(), OperationKind::CreateDirectory);
    EXPECT_EQ(dir.state(), OperationState::Completed);
    EXPECT_EQ(file.kind(), OperationKind::Copy);
    EXPECT_EQ(file.state(), OperationState::Completed);
    EXPECT_EQ(file.destinationPath(), normalizePath(tmp.join("out/src/x.txt")));
    ASSERT_TRUE(dir.finishedAt() && file.startedAt());
    EXPECT_LE(*dir.finishedAt(), *file.startedAt());
    EXPECT_EQ(readAllBytes(tmp.join("out/src/x.txt")), "x");
}

TEST(FileOperationsCopy, OneTerminalItemPerEntry) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("tree/a/b"));
    writeFile(tmp.join("tree/1.txt"), "1");
    writeFile(tmp.join("tree/a/2.txt"), "22");
    writeFile(tmp.join("tree/a/b/3.txt"), "333");
    writeFile(tmp.join("single.txt"), "s");
    RecordingSink recorder;

    auto result = env.manager().copyItems({itemFor(tmp.join("tree")), itemFor(tmp.join("single.txt"))},
                                          tmp.join("copy"), ConflictResolver::skip(), recorder.sink());

    ASSERT_FALSE(result.planError.has_value());
    EXPECT_EQ(result.items.size(), 7u);
    EXPECT_TRUE(result.allCompleted());
    EXPECT_EQ(recorder.terminalItems().size(), result.items.size());
    EXPECT_EQ(readAllBytes(tmp.join("copy/tree/a/b/3.txt")), "333");
    EXPECT_TRUE(fs::exists(tmp.join("tree/a/b/3.txt")));

    auto progress = env.manager().lastBatchProgress();
    EXPECT_EQ(progress.totalItems, 7u);
    EXPECT_EQ(progress.completedItems, 7u);
    EXPECT_EQ(progress.totalBytes, 7u);
    EXPECT_EQ(progress.bytesTransferred, 7u);
    EXPECT_DOUBLE_EQ(progress.itemPercent(), 100.0);
}

TEST(FileOperationsCopy, ProgressStartsAtZeroAndEndsAtSize) {
    FileOperationsManager::Config config;
    config.chunkSize = 1024;
    config.progressIntervalBytes = 1;
    ScopedWorkEnv env(config);
    ScopedTempDir tmp;
    writeFile(tmp.join("big.bin"), std::string(10 * 1024, 'b'));
    RecordingSink recorder;

    auto result = env.manager().copyItems({itemFor(tmp.join("big.bin"))}, tmp.join("dst"),
                                          ConflictResolver::skip(), recorder.sink());
    ASSERT_TRUE(result.allCompleted());

    auto bytes = recorder.progressBytesFor(tmp.join("big.bin"));
    ASSERT_GE(bytes.size(), 3u);
    EXPECT_EQ(bytes.front(), 0u);
    EXPECT_EQ(bytes.back(), 10u * 1024);
    EXPECT_TRUE(std::is_sorted(bytes.begin(), bytes.end()));
}

TEST(FileOperationsCopy, SkipLeavesExistingFileAlone) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("dst"));
    writeFile(tmp.join("a.txt"), "new");
    writeFile(tmp.join("dst/a.txt"), "old");

    auto result = env.manager().copyItems({itemFor(tmp.join("a.txt"))}, tmp.join("dst"), ConflictResolver::skip());

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].state(), OperationState::Skipped);
    EXPECT_EQ(readAllBytes(tmp.join("dst/a.txt")), "old");
}

TEST(FileOperationsCopy, RenameKeepsBothFiles) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("dst"));
    writeFile(tmp.join("a.txt"), "new");
    writeFile(tmp.join("dst/a.txt"), "old");

    auto result = env.manager().copyItems({itemFor(tmp.join("a.txt"))}, tmp.join("dst"), ConflictResolver::rename());

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].state(), OperationState::Completed);
    EXPECT_EQ(result.items[0].destinationPath().filename(), "a (1).txt");
    EXPECT_EQ(readAllBytes(tmp.join("dst/a.txt")), "old");
    EXPECT_EQ(readAllBytes(tmp.join("dst/a (1).txt")), "new");
}

TEST(FileOperationsCopy, FileOverDirectoryIsATypeMismatch) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("dst/a.txt"));
    writeFile(tmp.join("a.txt"), "file");

    auto result = env.manager().copyItems({itemFor(tmp.join("a.txt"))}, tmp.join("dst"), ConflictResolver::overwrite());

    ASSERT_EQ(result.items.size(), 1u);
    EXPECT_EQ(result.items[0].state(), OperationState::Failed);
    EXPECT_EQ(result.items[0].error()->code, FileOpError::TypeMismatch);
    EXPECT_TRUE(fs::is_directory(tmp.join("dst/a.txt")));
}

TEST(FileOperationsCopy, SymlinksAreCopiedAsLinks) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("src"));
    writeFile(tmp.join("target.txt"), "target");
    fs::create_symlink(tmp.join("target.txt"), tmp.join("src/link.txt"));

    auto result = env.manager().copyItems({itemFor(tmp.join("src"))}, tmp.join("dst"), ConflictResolver::skip());

    ASSERT_TRUE(result.allCompleted());
    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(tmp.join("dst/src/link.txt"))));
    EXPECT_EQ(fs::read_symlink(tmp.join("dst/src/link.txt")), tmp.join("target.txt"));
}

TEST(FileOperationsCopy, FollowingSymlinksCopiesTargets) {
    FileOperationsManager::Config config;
    config.followSymlinks = true;
    ScopedWorkEnv env(config);
    ScopedTempDir tmp;
    fs::create_directories(tmp.join("src"));
    writeFile(tmp.join("target.txt"), "target");
    fs::create_symlink(tmp.join("target.txt"), tmp.join("src/link.txt"));

    auto result = env.manager().copyItems({itemFor(tmp.join("src"))}, tmp.join("dst"), ConflictResolver::skip());

    ASSERT_TRUE(result.allCompleted());
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(tmp.join("dst/src/link.txt"))));
    EXPECT_EQ(readAllBytes(tmp.join("dst/src/link.txt")), "target");
}

TEST(FileOperationsCopy, EmptyRequestAndBadDestination) {
    ScopedWorkEnv env;
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "a");
    writeFile(tmp.join("blocker"), "b");

    auto empty = env.manager().copyItems({}, tmp.join("dst"), ConflictResolver::skip());
    EXPECT_TRUE(empty.items.empty());
    EXPECT_FALSE(empty.planError.has_value());

    auto blocked = env.manager().copyItems({itemFor(tmp.join("a.txt"))}, tmp.join("blocker"), ConflictResolver::skip());
    EXPECT_TRUE(blocked.items.empty());
    ASSERT_TRUE(blocked.planError.has_value());
    EXPECT_EQ(blocked.planError->code, FileOpError::TypeMismatch);
}

TEST(FileOperationsCopy, WorksWhenTheCallerPumpsTheGroup) {
    ScopedTempDir tmp;
    writeFile(tmp.join("a.txt"), "pumped");
    writeFile(tmp.join("b.txt"), "inline");

    WorkContractGroup group(16, "PumpedGroup");
    FileOperationsManager pumped(&group);
    auto first = pumped.copyItems({itemFor(tmp.join("a.txt"))}, tmp.join("dst"), ConflictResolver::skip());
    ASSERT_TRUE(first.allCompleted());
    EXPECT_EQ(readAllBytes(tmp.join("dst/a.txt")), "pumped");
    EXPECT_EQ(group.activeCount(), 0u);

    FileOperationsManager inlineManager(nullptr);
    auto second = inlineManager.copyItems({itemFor(tmp.join("b.txt"))}, tmp.join("dst"), ConflictResolver::skip());
    ASSERT_TRUE(second.allCompleted());
    EXPECT_EQ(readAllBytes(tmp.join("dst/b.txt")), "inline");
}

TEST(FileOperationsConfig, EnvironmentOverridesDefaults) {
    ::setenv("TWINPANE_FILEOPS_CONCURRENCY", "3", 1);
    ::setenv("TWINPANE_FILEOPS_CHUNK_SIZE", "4096", 1);
    auto config = FileOperationsManager::Config::fromEnvironment();
    ::unsetenv("TWINPANE_FILEOPS_CONCURRENCY");
    ::unsetenv("TWINPANE_FILEOPS_CHUNK_SIZE");

    EXPECT_EQ(config.maxConcurrentItems, 3u);
    EXPECT_EQ(config.chunkSize, 4096u);

    FileOperationsManager::Config defaults;
    EXPECT_GE(defaults.maxConcurrentItems, 2u);
    EXPECT_LE(defaults.maxConcurrentItems, 4u);
    EXPECT_EQ(defaults.chunkSize, 1024u * 1024u);
    EXPECT_TRUE(defaults.abortOnDiskFull);
}
