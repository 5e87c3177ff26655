/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file OperationItem.h
 * @brief Unit-of-work record for one source entry of a batch
 *
 * Every entry of a copy, move or delete request is tracked by exactly one
 * OperationItem. The item owns its lifecycle state machine:
 *
 * @code
 * Pending ──► AwaitingConflictDecision ──► InProgress ──► Completed
 *    │                 │                        ├──────► Failed
 *    │                 └──► Skipped             ├──────► Skipped
 *    └─────────────────────────────────────────►└──────► Cancelled (from any non-terminal state)
 * @endcode
 *
 * A rejected transition returns false and leaves the item unchanged. Items are plain
 * records: the FileOperationsManager serializes all mutation of a batch's items.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

#include "ConflictDecision.h"
#include "FileOpError.h"

namespace TwinPane::Core::IO {

enum class OperationKind {
    Copy,
    Move,
    Delete,
    CreateDirectory
};

enum class OperationState {
    Pending,
    AwaitingConflictDecision,
    InProgress,
    Completed,
    Failed,
    Skipped,
    Cancelled
};

constexpr bool isTerminal(OperationState state) noexcept {
    return state == OperationState::Completed || state == OperationState::Failed ||
           state == OperationState::Skipped || state == OperationState::Cancelled;
}

constexpr std::string_view toString(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Copy: return "Copy";
        case OperationKind::Move: return "Move";
        case OperationKind::Delete: return "Delete";
        case OperationKind::CreateDirectory: return "CreateDirectory";
    }
    return "Unknown";
}

constexpr std::string_view toString(OperationState state) noexcept {
    switch (state) {
        case OperationState::Pending: return "Pending";
        case OperationState::AwaitingConflictDecision: return "AwaitingConflictDecision";
        case OperationState::InProgress: return "InProgress";
        case OperationState::Completed: return "Completed";
        case OperationState::Failed: return "Failed";
        case OperationState::Skipped: return "Skipped";
        case OperationState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

class OperationItem {
public:
    using Clock = std::chrono::steady_clock;

    OperationItem(OperationKind kind,
                  std::filesystem::path sourcePath,
                  std::filesystem::path destinationPath,
                  uint64_t sizeBytes = 0,
                  bool isDirectory = false);

    OperationKind kind() const noexcept { return _kind; }
    const std::filesystem::path& sourcePath() const noexcept { return _sourcePath; }
    const std::filesystem::path& destinationPath() const noexcept { return _destinationPath; }
    uint64_t sizeBytes() const noexcept { return _sizeBytes; }
    uint64_t bytesTransferred() const noexcept { return _bytesTransferred; }
    bool isDirectory() const noexcept { return _isDirectory; }
    OperationState state() const noexcept { return _state; }
    bool isTerminal() const noexcept { return IO::isTerminal(_state); }

    // Present only in Failed state
    const std::optional<FileOpErrorInfo>& error() const noexcept { return _error; }
    const std::optional<ConflictDecision>& conflictDecision() const noexcept { return _conflictDecision; }

    // Entered InProgress / reached a terminal state
    const std::optional<Clock::time_point>& startedAt() const noexcept { return _startedAt; }
    const std::optional<Clock::time_point>& finishedAt() const noexcept { return _finishedAt; }

    size_t planIndex() const noexcept { return _planIndex; }
    void setPlanIndex(size_t index) noexcept { _planIndex = index; }

    // Pending -> AwaitingConflictDecision
    bool awaitDecision();
    /**
     * @brief Pending -> InProgress, or AwaitingConflictDecision -> InProgress
     *
     * Leaving AwaitingConflictDecision requires a recorded Overwrite, Rename or
     * MergeDirectories decision.
     */
    bool start();
    // InProgress -> Completed
    bool complete();
    // InProgress -> Failed; a None code is rejected
    bool fail(FileOpErrorInfo error);
    // AwaitingConflictDecision -> Skipped, or InProgress -> Skipped
    bool skip();
    // Any non-terminal state -> Cancelled
    bool cancel();

    /**
     * @brief Records transfer progress while InProgress
     *
     * Values are clamped to sizeBytes and never move backwards.
     * @return true when the stored value changed
     */
    bool updateBytesTransferred(uint64_t bytes) noexcept;

    /**
     * @brief Records the conflict resolution; only the first call per item sticks
     *
     * Rename decisions also retarget destinationPath to the new name. Ask is not a
     * resolution and is rejected.
     */
    bool setConflictDecision(const ConflictDecision& decision);

private:
    void finish(OperationState state);

    OperationKind _kind;
    std::filesystem::path _sourcePath;
    std::filesystem::path _destinationPath;
    uint64_t _sizeBytes = 0;
    uint64_t _bytesTransferred = 0;
    bool _isDirectory = false;
    OperationState _state = OperationState::Pending;
    std::optional<FileOpErrorInfo> _error;
    std::optional<ConflictDecision> _conflictDecision;
    std::optional<Clock::time_point> _startedAt;
    std::optional<Clock::time_point> _finishedAt;
    size_t _planIndex = 0;
};

} // namespace TwinPane::Core::IO
