/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file FileOperationsManager.h
 * @brief Batch copy, move, delete and directory creation with per-item results
 *
 * A request is first expanded into a plan (see OperationPlanner.h), then its items run as
 * contracts of the manager's WorkContractGroup with at most Config::maxConcurrentItems in
 * flight. The calling thread coordinates: it dispatches items, asks the decision provider
 * about conflicts, and returns once every item reached a terminal state.
 *
 * @code
 * WorkService service(WorkService::Config{});
 * WorkContractGroup group(256, "FileOps");
 * service.start();
 * service.addWorkContractGroup(&group);
 *
 * FileOperationsManager manager(&group);
 * auto result = manager.copyItems(selection, "/backup", ConflictResolver::rename(), sink);
 * for (const auto& item : result.items) {
 *     if (item.state() == OperationState::Failed) report(item);
 * }
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ConflictResolver.h"
#include "FileItem.h"
#include "FileOpError.h"
#include "FileTransfer.h"
#include "OperationItem.h"
#include "OperationPlanner.h"
#include "ProgressSink.h"
#include "../Concurrency/CancellationToken.h"
#include "../Concurrency/WorkContractGroup.h"

namespace TwinPane::Core::IO {

class FileOperationsManager {
public:
    struct Config {
        size_t maxConcurrentItems;                  // Items in flight at once
        size_t chunkSize;                           // Read/write buffer per copy step
        uint64_t progressIntervalBytes;             // Report progress at least every N bytes
        std::chrono::milliseconds progressInterval; // or at least this often
        bool preserveAttributes;                    // Carry mtime and permission bits over
        bool followSymlinks;                        // Copy link targets instead of links
        bool createDestinationIfMissing;
        bool abortOnDiskFull;                       // Stop starting items after DiskFull

        Config();

        /// Defaults overlaid with TWINPANE_FILEOPS_CONCURRENCY and TWINPANE_FILEOPS_CHUNK_SIZE
        static Config fromEnvironment();
    };

    struct BatchResult {
        std::vector<OperationItem> items;           // Plan order, every item terminal
        std::optional<FileOpErrorInfo> planError;   // Set when nothing could be planned

        size_t count(OperationState state) const noexcept;
        bool allCompleted() const noexcept;
    };

    /**
     * @param group Executes item contracts. When it has no running concurrency provider the
     *              calling thread pumps it; nullptr runs every item inline. If the group
     *              stops mid-batch, items it has not started fail with IOError.
     * @param backend Filesystem access for the workers; nullptr selects LocalTransferBackend
     */
    explicit FileOperationsManager(Concurrency::WorkContractGroup* group, Config config = Config(),
                                   std::shared_ptr<ITransferBackend> backend = nullptr);

    FileOperationsManager(const FileOperationsManager&) = delete;
    FileOperationsManager& operator=(const FileOperationsManager&) = delete;

    BatchResult copyItems(const std::vector<FileItem>& items,
                          const std::filesystem::path& destinationDirectory,
                          const ConflictResolver& resolver,
                          const ProgressSink& sink = {},
                          Concurrency::CancellationToken cancel = {});

    /**
     * @brief Moves entries into destinationDirectory
     *
     * On the same volume each entry is renamed. Across volumes it is copied, verified and
     * only then removed from the source. Source directories are removed once everything
     * inside them moved.
     */
    BatchResult moveItems(const std::vector<FileItem>& items,
                          const std::filesystem::path& destinationDirectory,
                          const ConflictResolver& resolver,
                          const ProgressSink& sink = {},
                          Concurrency::CancellationToken cancel = {});

    /**
     * @brief Deletes entries, directory content first
     *
     * A directory item starts only after all its children are terminal. If any of them was
     * not deleted the directory fails with DirectoryNotEmpty without touching the disk.
     */
    BatchResult deleteItems(const std::vector<FileItem>& items,
                            const ProgressSink& sink = {},
                            Concurrency::CancellationToken cancel = {});

    /**
     * @brief Creates parentPath/name synchronously
     *
     * An invalid name fails with InvalidName, a missing parent with NotFound and a file in
     * the way with TypeMismatch. An existing directory is handled by the resolver: Skip
     * skips, Overwrite and MergeDirectories reuse it, Rename creates the next free name.
     */
    OperationItem createDirectory(const std::filesystem::path& parentPath,
                                  const std::string& name,
                                  const ConflictResolver& resolver = ConflictResolver::skip());

    /// Aggregate counters of the most recent (or running) batch
    BatchProgress lastBatchProgress() const;

    const Config& config() const noexcept { return _config; }

private:
    struct Batch;

    OperationPlanner::Options plannerOptions() const;
    BatchResult runBatch(OperationPlan plan, const ConflictResolver& resolver, const ProgressSink& sink,
                         const Concurrency::CancellationToken& cancel);

    void dispatch(Batch& batch, size_t index, std::unique_lock<std::mutex>& lock);
    void executeTransfer(Batch& batch, size_t index, uint64_t ticket);
    void executeDelete(Batch& batch, size_t index, uint64_t ticket);
    void removeMovedDirectories(const std::vector<PlannedEntry>& entries) const;

    void publishProgress(const BatchProgress& progress);

    Concurrency::WorkContractGroup* _group;
    Config _config;
    std::shared_ptr<ITransferBackend> _backend;

    mutable std::mutex _progressMutex;
    BatchProgress _lastProgress;
};

} // namespace TwinPane::Core::IO
