/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file ProgressSink.h
 * @brief Progress reporting contract between the operations engine and its caller
 *
 * Every callback is optional and is invoked synchronously by whichever thread produced
 * the event: worker threads for transfer progress, the calling thread for planning
 * and decisions. Callbacks receive snapshots and must not call back into the manager
 * that is running the batch.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "OperationItem.h"

namespace TwinPane::Core::IO {

struct BatchProgress {
    OperationKind kind = OperationKind::Copy;
    size_t totalItems = 0;
    size_t finishedItems = 0;    ///< Items in any terminal state
    size_t completedItems = 0;
    size_t failedItems = 0;
    size_t skippedItems = 0;
    size_t cancelledItems = 0;
    uint64_t totalBytes = 0;
    uint64_t bytesTransferred = 0;
    std::string currentPath;

    // 100 when there is nothing to do
    double itemPercent() const noexcept {
        return totalItems == 0 ? 100.0 : 100.0 * static_cast<double>(finishedItems) / static_cast<double>(totalItems);
    }
    double bytePercent() const noexcept {
        return totalBytes == 0 ? 100.0 : 100.0 * static_cast<double>(bytesTransferred) / static_cast<double>(totalBytes);
    }
};

struct ProgressSink {
    // At the start of each item (0 bytes), at bounded intervals, and at completion
    std::function<void(const OperationItem& item, uint64_t bytesTransferred, uint64_t totalBytes)> onProgress;
    // Exactly once per item, after it reached a terminal state
    std::function<void(const OperationItem& item)> onItemTerminal;
    // While the plan is built: entries visited and bytes found so far
    std::function<void(size_t entries, uint64_t bytes)> onScanProgress;
    // Aggregate counters, throttled like onProgress and emitted once at the end
    std::function<void(const BatchProgress& progress)> onBatchProgress;
};

} // namespace TwinPane::Core::IO
