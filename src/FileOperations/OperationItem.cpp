/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "OperationItem.h"
#include <algorithm>

namespace TwinPane::Core::IO {

OperationItem::OperationItem(OperationKind kind,
                             std::filesystem::path sourcePath,
                             std::filesystem::path destinationPath,
                             uint64_t sizeBytes,
                             bool isDirectory)
    : _kind(kind)
    , _sourcePath(std::move(sourcePath))
    , _destinationPath(std::move(destinationPath))
    , _sizeBytes(sizeBytes)
    , _isDirectory(isDirectory) {
}

bool OperationItem::awaitDecision() {
    if (_state != OperationState::Pending) return false;
    _state = OperationState::AwaitingConflictDecision;
    return true;
}

bool OperationItem::start() {
    if (_state == OperationState::AwaitingConflictDecision) {
        if (!_conflictDecision || _conflictDecision->action == ConflictAction::Skip) {
            return false;
        }
    } else if (_state != OperationState::Pending) {
        return false;
    }
    _state = OperationState::InProgress;
    _startedAt = Clock::now();
    return true;
}

bool OperationItem::complete() {
    if (_state != OperationState::InProgress) return false;
    finish(OperationState::Completed);
    return true;
}

bool OperationItem::fail(FileOpErrorInfo error) {
    if (_state != OperationState::InProgress || error.code == FileOpError::None) return false;
    _error = std::move(error);
    finish(OperationState::Failed);
    return true;
}

bool OperationItem::skip() {
    if (_state != OperationState::InProgress && _state != OperationState::AwaitingConflictDecision) {
        return false;
    }
    finish(OperationState::Skipped);
    return true;
}

bool OperationItem::cancel() {
    if (isTerminal()) return false;
    finish(OperationState::Cancelled);
    return true;
}

bool OperationItem::updateBytesTransferred(uint64_t bytes) noexcept {
    if (_state != OperationState::InProgress) return false;
    const uint64_t clamped = std::min(bytes, _sizeBytes);
    if (clamped <= _bytesTransferred) return false;
    _bytesTransferred = clamped;
    return true;
}

bool OperationItem::setConflictDecision(const ConflictDecision& decision) {
    if (_conflictDecision || isTerminal() || decision.action == ConflictAction::Ask) {
        return false;
    }
    if (decision.action == ConflictAction::Rename) {
        if (decision.newName.empty() || _state == OperationState::InProgress) return false;
        _destinationPath = _destinationPath.parent_path() / decision.newName;
    }
    _conflictDecision = decision;
    return true;
}

void OperationItem::finish(OperationState state) {
    _state = state;
    _finishedAt = Clock::now();
}

} // namespace TwinPane::Core::IO
