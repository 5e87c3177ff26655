/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file OperationPlanner.h
 * @brief Expands a copy, move or delete request into an ordered plan
 *
 * The planner runs on the thread that issued the request. It walks every requested
 * entry depth-first and appends one OperationItem per entry:
 *
 * - Copy/Move: a directory entry becomes a CreateDirectory item that precedes its
 *   content. Directory items are settled immediately: the directory is created, or
 *   the destination collision is resolved (asking the decision provider if needed).
 *   Items inside a skipped or failed directory are settled to the same outcome.
 * - Delete: the walk is reversed at the end so that children precede their parent.
 *
 * Sources that have vanished become Failed(NotFound) items. Cancellation observed
 * while planning settles the current entry to Cancelled without walking its content.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "ConflictResolver.h"
#include "FileItem.h"
#include "FileOpError.h"
#include "OperationItem.h"
#include "ProgressSink.h"
#include "../Concurrency/CancellationToken.h"

namespace TwinPane::Core::IO {

struct PlannedEntry {
    OperationItem item;
    std::optional<FileItem> source;     ///< Snapshot taken while planning; empty when the source vanished
    std::optional<size_t> parent;       ///< Plan index of the enclosing directory entry
    size_t childCount = 0;
};

struct OperationPlan {
    OperationKind kind = OperationKind::Copy;
    std::filesystem::path destinationDirectory;
    std::vector<PlannedEntry> entries;
    uint64_t totalBytes = 0;
    std::optional<FileOpErrorInfo> planError;   ///< Set when no plan could be built at all
    bool cancelled = false;                      ///< Cancellation was observed while planning
};

class OperationPlanner {
public:
    struct Options {
        bool followSymlinks;
        bool createDestinationIfMissing;
        size_t scanReportInterval;   ///< Entries between onScanProgress reports

        Options()
            : followSymlinks(false)
            , createDestinationIfMissing(true)
            , scanReportInterval(64) {}
    };

    OperationPlanner(Options options,
                     const ConflictResolver& resolver,
                     const ProgressSink& sink,
                     Concurrency::CancellationToken cancel);

    OperationPlan planTransfer(OperationKind kind,
                               const std::vector<FileItem>& items,
                               const std::filesystem::path& destinationDirectory);

    OperationPlan planDelete(const std::vector<FileItem>& items);

private:
    struct Outcome {
        OperationState state;
        std::optional<FileOpErrorInfo> error;
    };

    void appendTransfer(OperationPlan& plan, const std::filesystem::path& src, const std::filesystem::path& dst,
                        std::optional<size_t> parent, std::optional<Outcome> preset);
    void appendDelete(OperationPlan& plan, const std::filesystem::path& src,
                      std::optional<size_t> parent, std::optional<Outcome> preset);

    // Creates or reconciles the destination of a directory entry; returns the outcome its content inherits
    std::optional<Outcome> settleDirectory(OperationPlan& plan, size_t index);

    size_t push(OperationPlan& plan, PlannedEntry entry);
    void reportScan(const OperationPlan& plan, bool force);
    bool checkCancelled(OperationPlan& plan);

    static void settle(OperationItem& item, const Outcome& outcome);
    static std::optional<Outcome> inherited(const OperationItem& directory);
    static bool listChildren(const std::filesystem::path& dir, std::vector<std::filesystem::path>& out,
                             std::error_code& ec);

    Options _options;
    const ConflictResolver& _resolver;
    const ProgressSink& _sink;
    Concurrency::CancellationToken _cancel;
    size_t _lastReported = 0;
};

} // namespace TwinPane::Core::IO
