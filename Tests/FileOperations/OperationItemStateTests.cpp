#include <gtest/gtest.h>

#include "FileOperations/OperationItem.h"

using namespace TwinPane::Core::IO;

namespace {
    OperationItem makeCopy(uint64_t size = 100) {
        return OperationItem(OperationKind::Copy, "/src/a.txt", "/dst/a.txt", size);
    }
}

TEST(OperationItemState, PendingCannotCompleteWithoutStarting) {
    auto item = makeCopy();
    EXPECT_FALSE(item.complete());
    EXPECT_EQ(item.state(), OperationState::Pending);

    ASSERT_TRUE(item.start());
    EXPECT_TRUE(item.startedAt().has_value());
    ASSERT_TRUE(item.complete());
    EXPECT_EQ(item.state(), OperationState::Completed);
    EXPECT_TRUE(item.finishedAt().has_value());
}

TEST(OperationItemState, TerminalStatesAreFinal) {
    auto item = makeCopy();
    item.start();
    item.fail(makeError(FileOpError::IOError, "boom"));
    ASSERT_EQ(item.state(), OperationState::Failed);

    EXPECT_FALSE(item.start());
    EXPECT_FALSE(item.complete());
    EXPECT_FALSE(item.skip());
    EXPECT_FALSE(item.cancel());
    EXPECT_EQ(item.state(), OperationState::Failed);
    EXPECT_TRUE(item.isTerminal());
}

TEST(OperationItemState, FailRequiresARealError) {
    auto item = makeCopy();
    item.start();
    EXPECT_FALSE(item.fail(FileOpErrorInfo{}));
    EXPECT_EQ(item.state(), OperationState::InProgress);
}

TEST(OperationItemState, AwaitingNeedsANonSkipDecisionToStart) {
    auto item = makeCopy();
    ASSERT_TRUE(item.awaitDecision());
    EXPECT_FALSE(item.start());

    ASSERT_TRUE(item.setConflictDecision(ConflictDecision::overwrite()));
    EXPECT_TRUE(item.start());
}

TEST(OperationItemState, AwaitingSkipsDirectly) {
    auto item = makeCopy();
    item.awaitDecision();
    item.setConflictDecision(ConflictDecision::skip());
    EXPECT_TRUE(item.skip());
    EXPECT_EQ(item.state(), OperationState::Skipped);
    EXPECT_FALSE(item.startedAt().has_value());
}

TEST(OperationItemState, CancelFromAnyNonTerminalState) {
    auto pending = makeCopy();
    EXPECT_TRUE(pending.cancel());

    auto awaiting = makeCopy();
    awaiting.awaitDecision();
    EXPECT_TRUE(awaiting.cancel());

    auto running = makeCopy();
    running.start();
    EXPECT_TRUE(running.cancel());
    EXPECT_EQ(running.state(), OperationState::Cancelled);
}

TEST(OperationItemState, BytesTransferredIsMonotonicAndClamped) {
    auto item = makeCopy(100);
    EXPECT_FALSE(item.updateBytesTransferred(10));  // not started

    item.start();
    EXPECT_TRUE(item.updateBytesTransferred(40));
    EXPECT_FALSE(item.updateBytesTransferred(30));
    EXPECT_EQ(item.bytesTransferred(), 40u);
    EXPECT_TRUE(item.updateBytesTransferred(1000));
    EXPECT_EQ(item.bytesTransferred(), 100u);
}

TEST(OperationItemState, RenameDecisionRetargetsDestination) {
    auto item = makeCopy();
    item.awaitDecision();
    ASSERT_TRUE(item.setConflictDecision(ConflictDecision::rename("a (1).txt")));
    EXPECT_EQ(item.destinationPath(), std::filesystem::path("/dst/a (1).txt"));

    // Only the first decision counts
    EXPECT_FALSE(item.setConflictDecision(ConflictDecision::overwrite()));
    ASSERT_TRUE(item.conflictDecision().has_value());
    EXPECT_EQ(item.conflictDecision()->action, ConflictAction::Rename);
}

TEST(OperationItemState, AskAndNamelessRenameAreNotDecisions) {
    auto item = makeCopy();
    EXPECT_FALSE(item.setConflictDecision(ConflictDecision::ask()));
    EXPECT_FALSE(item.setConflictDecision(ConflictDecision::rename({})));
    EXPECT_FALSE(item.conflictDecision().has_value());
}

TEST(OperationItemState, TerminalPredicateMatchesStates) {
    EXPECT_FALSE(isTerminal(OperationState::Pending));
    EXPECT_FALSE(isTerminal(OperationState::AwaitingConflictDecision));
    EXPECT_FALSE(isTerminal(OperationState::InProgress));
    EXPECT_TRUE(isTerminal(OperationState::Completed));
    EXPECT_TRUE(isTerminal(OperationState::Failed));
    EXPECT_TRUE(isTerminal(OperationState::Skipped));
    EXPECT_TRUE(isTerminal(OperationState::Cancelled));
}
