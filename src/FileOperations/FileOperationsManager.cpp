/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "FileOperationsManager.h"
#include "FileTransfer.h"
#include "PathUtils.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <format>
#include <new>
#include <thread>
#include <utility>

namespace TwinPane::Core::IO {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {
    constexpr auto kCoordinatorWait = std::chrono::milliseconds(50);
    constexpr auto kPumpIdleWait = std::chrono::milliseconds(1);

    const char* kindVerb(OperationKind kind) {
        switch (kind) {
            case OperationKind::Copy: return "copy";
            case OperationKind::Move: return "move";
            case OperationKind::Delete: return "delete";
            case OperationKind::CreateDirectory: return "create directory";
        }
        return "operation";
    }

    // Fails an item that has not started yet; Awaiting items must already hold a decision
    void failBeforeStart(OperationItem& item, FileOpErrorInfo error) {
        if (item.state() != OperationState::InProgress) {
            item.start();
        }
        item.fail(std::move(error));
    }
}

FileOperationsManager::Config::Config()
    : maxConcurrentItems(std::clamp<size_t>(std::thread::hardware_concurrency() / 2, 2, 4))
    , chunkSize(1024 * 1024)
    , progressIntervalBytes(256 * 1024)
    , progressInterval(std::chrono::milliseconds(100))
    , preserveAttributes(true)
    , followSymlinks(false)
    , createDestinationIfMissing(true)
    , abortOnDiskFull(true) {
}

FileOperationsManager::Config FileOperationsManager::Config::fromEnvironment() {
    Config config;
    if (auto concurrency = safeGetEnvUnsigned("TWINPANE_FILEOPS_CONCURRENCY"); concurrency && *concurrency > 0) {
        config.maxConcurrentItems = static_cast<size_t>(*concurrency);
    }
    if (auto chunk = safeGetEnvUnsigned("TWINPANE_FILEOPS_CHUNK_SIZE"); chunk && *chunk > 0) {
        config.chunkSize = static_cast<size_t>(*chunk);
    }
    return config;
}

size_t FileOperationsManager::BatchResult::count(OperationState state) const noexcept {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
        [state](const OperationItem& item) { return item.state() == state; }));
}

bool FileOperationsManager::BatchResult::allCompleted() const noexcept {
    return !planError && count(OperationState::Completed) == items.size();
}

/**
 * Shared state of one running batch. Everything below the mutex is guarded by it; the
 * planned entries themselves are guarded too because workers transition their items.
 */
struct FileOperationsManager::Batch {
    struct PendingDecision {
        size_t index;
        FileItem existing;
    };

    Batch(OperationPlan&& plan, const ConflictResolver& resolver, const ProgressSink& sink,
          const Concurrency::CancellationToken& cancel)
        : kind(plan.kind)
        , entries(std::move(plan.entries))
        , resolver(resolver)
        , sink(sink)
        , cancel(cancel)
        , dispatched(entries.size(), 0)
        , handles(entries.size())
        , pendingChildren(entries.size(), 0)
        , childFailed(entries.size(), 0) {
        progress.kind = kind;
        progress.totalItems = entries.size();
        progress.totalBytes = plan.totalBytes;
    }

    const OperationKind kind;
    std::vector<PlannedEntry> entries;
    const ConflictResolver& resolver;
    const ProgressSink& sink;
    const Concurrency::CancellationToken cancel;

    std::mutex mutex;
    std::condition_variable changed;
    std::deque<size_t> ready;
    std::deque<PendingDecision> decisions;
    std::vector<uint64_t> dispatched;      // Ticket of the contract holding the item, 0 when none
    std::vector<Concurrency::WorkContractHandle> handles;
    uint64_t nextTicket = 0;
    std::vector<size_t> pendingChildren;    // Delete: children not yet terminal
    std::vector<char> childFailed;          // Delete: a child was not removed
    size_t inFlight = 0;
    size_t remaining = 0;
    bool diskFull = false;
    BatchProgress progress;
    Clock::time_point lastBatchReport{};

    // Records that entries[index] became terminal
    void finishLocked(size_t index) {
        const auto& item = entries[index].item;
        ++progress.finishedItems;
        switch (item.state()) {
            case OperationState::Completed: ++progress.completedItems; break;
            case OperationState::Failed:
                ++progress.failedItems;
                if (item.error() && item.error()->code == FileOpError::DiskFull) diskFull = true;
                break;
            case OperationState::Skipped: ++progress.skippedItems; break;
            case OperationState::Cancelled: ++progress.cancelledItems; break;
            default: break;
        }
        if (remaining > 0) --remaining;

        if (kind != OperationKind::Delete || !entries[index].parent) return;
        const size_t parent = *entries[index].parent;
        const bool vanished = item.state() == OperationState::Failed &&
                              item.error() && item.error()->code == FileOpError::NotFound;
        if (item.state() != OperationState::Completed && !vanished) {
            childFailed[parent] = 1;
        }
        if (pendingChildren[parent] > 0 && --pendingChildren[parent] == 0 &&
            !entries[parent].item.isTerminal()) {
            ready.push_back(parent);
        }
    }

    // Next batch snapshot if one is due
    std::optional<BatchProgress> batchReportLocked(std::chrono::milliseconds interval, bool force) {
        const auto now = Clock::now();
        if (!force && now - lastBatchReport < interval) return std::nullopt;
        lastBatchReport = now;
        return progress;
    }
};

FileOperationsManager::FileOperationsManager(Concurrency::WorkContractGroup* group, Config config,
                                             std::shared_ptr<ITransferBackend> backend)
    : _group(group)
    , _config(std::move(config))
    , _backend(backend ? std::move(backend) : std::make_shared<LocalTransferBackend>()) {
    if (_config.maxConcurrentItems == 0) _config.maxConcurrentItems = 1;
    if (_config.chunkSize == 0) _config.chunkSize = 1024 * 1024;
}

OperationPlanner::Options FileOperationsManager::plannerOptions() const {
    OperationPlanner::Options options;
    options.followSymlinks = _config.followSymlinks;
    options.createDestinationIfMissing = _config.createDestinationIfMissing;
    return options;
}

FileOperationsManager::BatchResult FileOperationsManager::copyItems(const std::vector<FileItem>& items,
                                                                    const fs::path& destinationDirectory,
                                                                    const ConflictResolver& resolver,
                                                                    const ProgressSink& sink,
                                                                    Concurrency::CancellationToken cancel) {
    if (items.empty()) {
        TWINPANE_LOG_WARNING_CAT("FileOperations", "copyItems called without items");
        return {};
    }
    TWINPANE_LOG_INFO_CAT("FileOperations",
        std::format("Copying {} item(s) to {}", items.size(), destinationDirectory.string()));

    OperationPlanner planner(plannerOptions(), resolver, sink, cancel);
    return runBatch(planner.planTransfer(OperationKind::Copy, items, destinationDirectory), resolver, sink, cancel);
}

FileOperationsManager::BatchResult FileOperationsManager::moveItems(const std::vector<FileItem>& items,
                                                                    const fs::path& destinationDirectory,
                                                                    const ConflictResolver& resolver,
                                                                    const ProgressSink& sink,
                                                                    Concurrency::CancellationToken cancel) {
    if (items.empty()) {
        TWINPANE_LOG_WARNING_CAT("FileOperations", "moveItems called without items");
        return {};
    }
    TWINPANE_LOG_INFO_CAT("FileOperations",
        std::format("Moving {} item(s) to {}", items.size(), destinationDirectory.string()));

    OperationPlanner planner(plannerOptions(), resolver, sink, cancel);
    return runBatch(planner.planTransfer(OperationKind::Move, items, destinationDirectory), resolver, sink, cancel);
}

FileOperationsManager::BatchResult FileOperationsManager::deleteItems(const std::vector<FileItem>& items,
                                                                      const ProgressSink& sink,
                                                                      Concurrency::CancellationToken cancel) {
    if (items.empty()) {
        TWINPANE_LOG_WARNING_CAT("FileOperations", "deleteItems called without items");
        return {};
    }
    TWINPANE_LOG_INFO_CAT("FileOperations", std::format("Deleting {} item(s)", items.size()));

    // Deletes never collide; the resolver is only there to satisfy the planner
    const auto resolver = ConflictResolver::skip();
    OperationPlanner planner(plannerOptions(), resolver, sink, cancel);
    return runBatch(planner.planDelete(items), resolver, sink, cancel);
}

FileOperationsManager::BatchResult FileOperationsManager::runBatch(OperationPlan plan,
                                                                   const ConflictResolver& resolver,
                                                                   const ProgressSink& sink,
                                                                   const Concurrency::CancellationToken& cancel) {
    if (plan.planError) {
        TWINPANE_LOG_ERROR_CAT("FileOperations",
            std::format("Cannot {}: {} ({})", kindVerb(plan.kind), plan.planError->message, plan.planError->path));
        BatchResult result;
        result.planError = std::move(plan.planError);
        return result;
    }

    const bool isMove = plan.kind == OperationKind::Move;
    Batch batch(std::move(plan), resolver, sink, cancel);
    std::vector<OperationItem> settled;

    {
        std::lock_guard<std::mutex> lock(batch.mutex);
        for (const auto& entry : batch.entries) {
            if (entry.parent) ++batch.pendingChildren[*entry.parent];
        }
        batch.remaining = batch.entries.size();
        for (size_t i = 0; i < batch.entries.size(); ++i) {
            if (batch.entries[i].item.isTerminal()) {
                batch.finishLocked(i);
                settled.push_back(batch.entries[i].item);
            }
        }
        for (size_t i = 0; i < batch.entries.size(); ++i) {
            const auto& entry = batch.entries[i];
            if (entry.item.isTerminal()) continue;
            if (batch.kind == OperationKind::Delete && batch.pendingChildren[i] > 0) continue;
            batch.ready.push_back(i);
        }
    }

    if (sink.onItemTerminal) {
        for (const auto& item : settled) sink.onItemTerminal(item);
    }

    std::vector<OperationItem> notifications;
    std::unique_lock<std::mutex> lock(batch.mutex);
    while (batch.remaining > 0) {
        notifications.clear();

        if (cancel.isCancellationRequested()) {
            // Everything not held by a worker ends here; workers cancel their own items
            batch.decisions.clear();
            for (size_t i = 0; i < batch.entries.size(); ++i) {
                auto& item = batch.entries[i].item;
                if (batch.dispatched[i] || item.isTerminal()) continue;
                item.cancel();
                batch.finishLocked(i);
                notifications.push_back(item);
            }
            batch.ready.clear();
        }

        const bool groupStopping = _group && _group->isStopping();
        if (groupStopping) {
            // A stopping group never selects its scheduled contracts; take them back
            for (size_t i = 0; i < batch.entries.size(); ++i) {
                if (!batch.dispatched[i] || !_group->releaseContract(batch.handles[i])) continue;
                batch.dispatched[i] = 0;
                batch.handles[i] = Concurrency::WorkContractHandle();
                --batch.inFlight;
                auto& item = batch.entries[i].item;
                if (item.isTerminal()) continue;
                if (cancel.isCancellationRequested()) {
                    item.cancel();
                } else {
                    failBeforeStart(item, makeError(FileOpError::IOError, "Not started: work group is stopping",
                                                    item.sourcePath().string()));
                }
                batch.finishLocked(i);
                notifications.push_back(item);
            }
        }

        if ((batch.diskFull && _config.abortOnDiskFull) || groupStopping) {
            while (!batch.ready.empty()) {
                const size_t index = batch.ready.front();
                batch.ready.pop_front();
                auto& item = batch.entries[index].item;
                if (item.isTerminal()) continue;
                failBeforeStart(item, groupStopping
                    ? makeError(FileOpError::IOError, "Not started: work group is stopping", item.sourcePath().string())
                    : makeError(FileOpError::DiskFull, "Not started: destination disk is full", item.sourcePath().string()));
                batch.finishLocked(index);
                notifications.push_back(item);
            }
        }

        while (batch.inFlight < _config.maxConcurrentItems && !batch.ready.empty()) {
            const size_t index = batch.ready.front();
            batch.ready.pop_front();
            if (batch.entries[index].item.isTerminal()) continue;
            dispatch(batch, index, lock);
            if (!batch.dispatched[index] && _group) {
                // Group is full; retry once a slot frees up
                batch.ready.push_front(index);
                break;
            }
        }

        if (!notifications.empty()) {
            auto report = batch.batchReportLocked(_config.progressInterval, false);
            lock.unlock();
            if (sink.onItemTerminal) {
                for (const auto& item : notifications) sink.onItemTerminal(item);
            }
            if (report) publishProgress(*report);
            if (report && sink.onBatchProgress) sink.onBatchProgress(*report);
            lock.lock();
            continue;
        }

        if (!batch.decisions.empty() && !cancel.isCancellationRequested()) {
            auto pending = std::move(batch.decisions.front());
            batch.decisions.pop_front();
            const OperationItem snapshot = batch.entries[pending.index].item;
            lock.unlock();

            const ConflictDecision decision = batch.resolver.requestDecision(snapshot, pending.existing);
            TWINPANE_LOG_DEBUG_CAT("FileOperations",
                std::format("Conflict at {} answered with {}", snapshot.destinationPath().string(), toString(decision.action)));

            lock.lock();
            auto& item = batch.entries[pending.index].item;
            if (item.isTerminal()) continue;
            item.setConflictDecision(decision);
            if (decision.action == ConflictAction::Skip) {
                item.skip();
                batch.finishLocked(pending.index);
                const OperationItem skipped = item;
                lock.unlock();
                if (sink.onItemTerminal) sink.onItemTerminal(skipped);
                lock.lock();
            } else {
                batch.ready.push_front(pending.index);
            }
            continue;
        }

        if (batch.remaining == 0) break;

        if (_group && !_group->hasActiveConcurrencyProvider() && batch.inFlight > 0) {
            lock.unlock();
            const size_t executed = _group->executeAllBackgroundWork();
            lock.lock();
            if (executed == 0) {
                batch.changed.wait_for(lock, kPumpIdleWait);
            }
        } else {
            batch.changed.wait_for(lock, kCoordinatorWait);
        }
    }

    // Worker epilogues still reference the batch
    batch.changed.wait(lock, [&batch] { return batch.inFlight == 0; });

    auto finalReport = batch.batchReportLocked(_config.progressInterval, true);
    lock.unlock();
    publishProgress(*finalReport);
    if (sink.onBatchProgress) sink.onBatchProgress(*finalReport);

    if (isMove) {
        removeMovedDirectories(batch.entries);
    }

    const auto& p = *finalReport;
    TWINPANE_LOG_INFO_CAT("FileOperations",
        std::format("Finished {} batch: {} completed, {} failed, {} skipped, {} cancelled of {}",
                    kindVerb(batch.kind), p.completedItems, p.failedItems, p.skippedItems, p.cancelledItems,
                    p.totalItems));

    BatchResult result;
    result.items.reserve(batch.entries.size());
    for (auto& entry : batch.entries) {
        result.items.push_back(std::move(entry.item));
    }
    return result;
}

void FileOperationsManager::dispatch(Batch& batch, size_t index, std::unique_lock<std::mutex>& lock) {
    const uint64_t ticket = ++batch.nextTicket;
    auto work = [this, &batch, index, ticket]() {
        if (batch.kind == OperationKind::Delete) {
            executeDelete(batch, index, ticket);
        } else {
            executeTransfer(batch, index, ticket);
        }
    };

    batch.dispatched[index] = ticket;
    ++batch.inFlight;

    if (!_group) {
        lock.unlock();
        work();
        lock.lock();
        return;
    }

    auto handle = _group->createContract(std::move(work));
    if (!handle.valid()) {
        batch.dispatched[index] = 0;
        --batch.inFlight;
        return;
    }
    TWINPANE_LOG_DEBUG_CAT("FileOperations",
        std::format("Dispatching {} as {}", batch.entries[index].item.sourcePath().string(), handle.toString()));
    if (handle.schedule() != Concurrency::ScheduleResult::Scheduled) {
        handle.release();
        batch.dispatched[index] = 0;
        --batch.inFlight;
        return;
    }
    batch.handles[index] = handle;
}

namespace {
    // Returns the worker slot when a contract body exits. The coordinator may destroy the
    // batch as soon as it sees inFlight reach zero, so the notification happens under the lock.
    struct SlotRelease {
        std::mutex& mutex;
        std::condition_variable& changed;
        size_t& inFlight;
        uint64_t& dispatched;
        uint64_t ticket;

        ~SlotRelease() {
            std::lock_guard<std::mutex> lock(mutex);
            --inFlight;
            if (dispatched == ticket) dispatched = 0;
            changed.notify_all();
        }
    };

    // Throttles onProgress for one item
    class ItemProgressReporter {
    public:
        ItemProgressReporter(uint64_t byteInterval, std::chrono::milliseconds timeInterval)
            : _byteInterval(byteInterval), _timeInterval(timeInterval), _lastTime(Clock::now()) {}

        bool due(uint64_t bytes) {
            const auto now = Clock::now();
            if (bytes - _lastBytes < _byteInterval && now - _lastTime < _timeInterval) return false;
            _lastBytes = bytes;
            _lastTime = now;
            return true;
        }

    private:
        uint64_t _byteInterval;
        std::chrono::milliseconds _timeInterval;
        uint64_t _lastBytes = 0;
        Clock::time_point _lastTime;
    };
}

void FileOperationsManager::executeTransfer(Batch& batch, size_t index, uint64_t ticket) {
    SlotRelease release{batch.mutex, batch.changed, batch.inFlight, batch.dispatched[index], ticket};
    const auto& source = batch.entries[index].source;
    const ProgressSink& sink = batch.sink;

    auto finish = [&](auto&& transition) {
        std::optional<OperationItem> terminal;
        std::optional<BatchProgress> report;
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            auto& item = batch.entries[index].item;
            if (item.isTerminal()) return;
            transition(item);
            if (!item.isTerminal()) return;
            batch.finishLocked(index);
            terminal = item;
            report = batch.batchReportLocked(_config.progressInterval, false);
        }
        if (terminal->state() == OperationState::Completed && sink.onProgress) {
            sink.onProgress(*terminal, terminal->sizeBytes(), terminal->sizeBytes());
        }
        if (terminal->state() == OperationState::Failed) {
            TWINPANE_LOG_ERROR_CAT("FileOperations",
                std::format("Failed to {} {}: {}", kindVerb(batch.kind), terminal->sourcePath().string(),
                            terminal->error()->message));
        }
        if (sink.onItemTerminal) sink.onItemTerminal(*terminal);
        if (report) {
            publishProgress(*report);
            if (sink.onBatchProgress) sink.onBatchProgress(*report);
        }
    };

    try {
        std::optional<ConflictDecision> decision;
        fs::path src;
        fs::path dst;
        uint64_t size = 0;
        bool isDirectory = false;
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            const auto& item = batch.entries[index].item;
            if (item.isTerminal()) return;
            decision = item.conflictDecision();
            src = item.sourcePath();
            dst = item.destinationPath();
            size = item.sizeBytes();
            isDirectory = item.isDirectory();
        }

        if (batch.cancel.isCancellationRequested()) {
            finish([](OperationItem& item) { item.cancel(); });
            return;
        }
        if (!source) {
            finish([&](OperationItem& item) {
                failBeforeStart(item, makeError(FileOpError::NotFound, "Source no longer exists", src.string()));
            });
            return;
        }

        // The destination entry itself is examined, links included
        auto existing = FileItem::fromPath(dst, false);
        bool replaceExisting = false;

        if (existing && !decision) {
            OperationItem snapshot = [&] {
                std::lock_guard<std::mutex> lock(batch.mutex);
                return batch.entries[index].item;
            }();
            const bool typeMismatch = existing->isDirectory() != source->isDirectory();
            auto resolved = batch.resolver.resolve(ConflictContext{snapshot, *source, *existing, typeMismatch});

            if (resolved.action == ConflictAction::Ask) {
                {
                    std::lock_guard<std::mutex> lock(batch.mutex);
                    auto& item = batch.entries[index].item;
                    if (item.isTerminal() || !item.awaitDecision()) return;
                    batch.decisions.push_back({index, *existing});
                    batch.dispatched[index] = 0;
                }
                TWINPANE_LOG_DEBUG_CAT("FileOperations",
                    std::format("Waiting for a conflict decision on {}", dst.string()));
                return;
            }

            std::lock_guard<std::mutex> lock(batch.mutex);
            auto& item = batch.entries[index].item;
            item.setConflictDecision(resolved);
            decision = resolved;
            dst = item.destinationPath();
        }

        if (decision) {
            switch (decision->action) {
                case ConflictAction::Skip:
                    finish([](OperationItem& item) {
                        if (item.state() == OperationState::Pending) item.start();
                        item.skip();
                    });
                    return;

                case ConflictAction::Overwrite:
                    if (existing && existing->isDirectory() != source->isDirectory()) {
                        finish([&](OperationItem& item) {
                            failBeforeStart(item, makeError(FileOpError::TypeMismatch,
                                std::format("Cannot overwrite a {} with a {}", existing->isDirectory() ? "directory" : "file",
                                            source->isDirectory() ? "directory" : "file"), dst.string()));
                        });
                        return;
                    }
                    if (normalizePath(src) == normalizePath(dst)) {
                        finish([&](OperationItem& item) {
                            failBeforeStart(item, makeError(FileOpError::InvalidTarget,
                                "Source and destination are the same", dst.string()));
                        });
                        return;
                    }
                    replaceExisting = true;
                    break;

                case ConflictAction::Rename:
                    if (!validateFileName(decision->newName)) {
                        finish([&](OperationItem& item) {
                            failBeforeStart(item, makeError(FileOpError::InvalidName,
                                std::format("Invalid name '{}'", decision->newName), dst.string()));
                        });
                        return;
                    }
                    break;

                case ConflictAction::MergeDirectories:
                    if (!isDirectory) {
                        finish([&](OperationItem& item) {
                            failBeforeStart(item, makeError(FileOpError::TypeMismatch,
                                "Only directories can be merged", dst.string()));
                        });
                        return;
                    }
                    break;

                case ConflictAction::Ask:
                    break;
            }
        }

        OperationItem started = [&] {
            std::lock_guard<std::mutex> lock(batch.mutex);
            auto& item = batch.entries[index].item;
            item.start();
            return item;
        }();
        if (started.state() != OperationState::InProgress) return;
        if (sink.onProgress) sink.onProgress(started, 0, size);

        ItemProgressReporter reporter(_config.progressIntervalBytes, _config.progressInterval);
        TransferProgress onBytes = [&](uint64_t bytes) {
            std::optional<OperationItem> snapshot;
            std::optional<BatchProgress> report;
            {
                std::lock_guard<std::mutex> lock(batch.mutex);
                auto& item = batch.entries[index].item;
                const uint64_t before = item.bytesTransferred();
                if (!item.updateBytesTransferred(bytes)) return;
                batch.progress.bytesTransferred += item.bytesTransferred() - before;
                batch.progress.currentPath = item.sourcePath().string();
                if (bytes < size && !reporter.due(bytes)) return;
                snapshot = item;
                report = batch.batchReportLocked(_config.progressInterval, false);
            }
            if (sink.onProgress && bytes < size) sink.onProgress(*snapshot, bytes, size);
            if (report) {
                publishProgress(*report);
                if (sink.onBatchProgress) sink.onBatchProgress(*report);
            }
        };

        TransferOptions options;
        options.chunkSize = _config.chunkSize;
        options.preserveAttributes = _config.preserveAttributes;
        options.replaceExisting = replaceExisting;

        const bool linkEntry = source->isSymlink() && !_config.followSymlinks;
        auto copyEntry = [&]() -> TransferResult {
            if (isDirectory) return _backend->createDirectory(dst);
            if (linkEntry) return _backend->copyLink(src, dst, replaceExisting);
            return _backend->copyFile(src, dst, size, options, onBytes, batch.cancel);
        };

        TransferResult result;
        if (batch.kind == OperationKind::Copy) {
            result = copyEntry();
        } else {
            bool crossVolume = !_backend->sameVolume(src, dst.parent_path());
            if (!crossVolume) {
                result = _backend->rename(src, dst, replaceExisting);
                if (result.crossDevice()) {
                    crossVolume = true;
                } else if (result.ok() && !linkEntry && !isDirectory) {
                    std::error_code ec;
                    const auto moved = fs::file_size(dst, ec);
                    if (ec || moved != size) {
                        result = TransferResult::failure(makeError(FileOpError::IntegrityMismatch,
                            std::format("Moved file has {} bytes, expected {}", ec ? 0 : moved, size), dst.string()));
                    } else {
                        onBytes(size);
                    }
                }
            }
            if (crossVolume) {
                result = copyEntry();
                if (result.ok()) {
                    // Only a verified copy releases the source
                    auto removed = _backend->remove(src, isDirectory);
                    if (!removed.ok()) {
                        result = TransferResult::failure(makeError(removed.error.code,
                            std::format("Copied, but the source could not be removed: {}", removed.error.message),
                            src.string(), removed.error.systemError));
                    }
                }
            }
        }

        if (result.ok()) {
            finish([&](OperationItem& item) {
                const uint64_t before = item.bytesTransferred();
                item.updateBytesTransferred(size);
                batch.progress.bytesTransferred += item.bytesTransferred() - before;
                item.complete();
            });
        } else if (result.cancelled()) {
            finish([](OperationItem& item) { item.cancel(); });
        } else {
            finish([&](OperationItem& item) { item.fail(result.error); });
        }
    } catch (const fs::filesystem_error& e) {
        finish([&](OperationItem& item) {
            failBeforeStart(item, errorFromCode(e.code(), e.what(), e.path1().string()));
        });
    } catch (const std::bad_alloc&) {
        finish([&](OperationItem& item) {
            failBeforeStart(item, makeError(FileOpError::IOError, "Out of memory", item.sourcePath().string()));
        });
    }
}

void FileOperationsManager::executeDelete(Batch& batch, size_t index, uint64_t ticket) {
    SlotRelease release{batch.mutex, batch.changed, batch.inFlight, batch.dispatched[index], ticket};
    const ProgressSink& sink = batch.sink;

    auto finish = [&](auto&& transition) {
        std::optional<OperationItem> terminal;
        std::optional<BatchProgress> report;
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            auto& item = batch.entries[index].item;
            if (item.isTerminal()) return;
            transition(item);
            if (!item.isTerminal()) return;
            batch.finishLocked(index);
            terminal = item;
            report = batch.batchReportLocked(_config.progressInterval, false);
        }
        if (terminal->state() == OperationState::Failed) {
            TWINPANE_LOG_ERROR_CAT("FileOperations",
                std::format("Failed to delete {}: {}", terminal->sourcePath().string(), terminal->error()->message));
        }
        if (sink.onItemTerminal) sink.onItemTerminal(*terminal);
        if (report) {
            publishProgress(*report);
            if (sink.onBatchProgress) sink.onBatchProgress(*report);
        }
    };

    try {
        std::optional<OperationItem> started;
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            auto& item = batch.entries[index].item;
            if (item.isTerminal()) return;
            if (!batch.cancel.isCancellationRequested() && !(item.isDirectory() && batch.childFailed[index])) {
                item.start();
                started = item;
            }
        }

        if (!started) {
            if (batch.cancel.isCancellationRequested()) {
                finish([](OperationItem& item) { item.cancel(); });
            } else {
                finish([](OperationItem& item) {
                    failBeforeStart(item, makeError(FileOpError::DirectoryNotEmpty,
                        "Directory still holds entries that were not deleted", item.sourcePath().string()));
                });
            }
            return;
        }

        if (sink.onProgress) sink.onProgress(*started, 0, started->sizeBytes());

        // Last point at which a started delete can still be called off
        if (batch.cancel.isCancellationRequested()) {
            finish([](OperationItem& item) { item.cancel(); });
            return;
        }

        auto result = _backend->remove(started->sourcePath(), started->isDirectory());
        if (result.ok()) {
            finish([&](OperationItem& item) {
                const uint64_t before = item.bytesTransferred();
                item.updateBytesTransferred(item.sizeBytes());
                batch.progress.bytesTransferred += item.bytesTransferred() - before;
                item.complete();
            });
        } else {
            finish([&](OperationItem& item) { item.fail(result.error); });
        }
    } catch (const fs::filesystem_error& e) {
        finish([&](OperationItem& item) {
            failBeforeStart(item, errorFromCode(e.code(), e.what(), e.path1().string()));
        });
    } catch (const std::bad_alloc&) {
        finish([&](OperationItem& item) {
            failBeforeStart(item, makeError(FileOpError::IOError, "Out of memory", item.sourcePath().string()));
        });
    }
}

void FileOperationsManager::removeMovedDirectories(const std::vector<PlannedEntry>& entries) const {
    // A source directory goes away only when it and everything inside it moved
    std::vector<char> fullyMoved(entries.size(), 0);
    for (size_t i = 0; i < entries.size(); ++i) {
        fullyMoved[i] = entries[i].item.state() == OperationState::Completed;
    }
    for (size_t i = entries.size(); i-- > 0;) {
        if (!fullyMoved[i] && entries[i].parent) {
            fullyMoved[*entries[i].parent] = 0;
        }
    }

    for (size_t i = entries.size(); i-- > 0;) {
        const auto& item = entries[i].item;
        if (!item.isDirectory() || !fullyMoved[i]) continue;
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(item.sourcePath(), ec))) continue;
        auto removed = _backend->remove(item.sourcePath(), true);
        if (!removed.ok()) {
            TWINPANE_LOG_WARNING_CAT("FileOperations",
                std::format("Moved directory source {} was not removed: {}", item.sourcePath().string(),
                            removed.error.message));
        }
    }
}

OperationItem FileOperationsManager::createDirectory(const fs::path& parentPath,
                                                     const std::string& name,
                                                     const ConflictResolver& resolver) {
    const fs::path parent = normalizePath(parentPath);
    OperationItem item(OperationKind::CreateDirectory, {}, parent / name, 0, true);

    auto failWith = [&](FileOpErrorInfo error) {
        TWINPANE_LOG_ERROR_CAT("FileOperations",
            std::format("Cannot create directory '{}' in {}: {}", name, parent.string(), error.message));
        failBeforeStart(item, std::move(error));
        return item;
    };

    if (!validateFileName(name)) {
        return failWith(makeError(FileOpError::InvalidName, std::format("Invalid name '{}'", name), parent.string()));
    }

    std::error_code ec;
    const auto parentStatus = fs::status(parent, ec);
    if (!fs::exists(parentStatus)) {
        return failWith(makeError(FileOpError::NotFound, "Parent directory does not exist", parent.string()));
    }
    if (!fs::is_directory(parentStatus)) {
        return failWith(makeError(FileOpError::TypeMismatch, "Parent is not a directory", parent.string()));
    }

    const fs::path target = parent / name;
    auto existing = FileItem::fromPath(target, true);
    if (!existing) {
        item.start();
        auto created = _backend->createDirectory(target);
        if (!created.ok()) {
            TWINPANE_LOG_ERROR_CAT("FileOperations",
                std::format("Cannot create directory {}: {}", target.string(), created.error.message));
            item.fail(std::move(created.error));
            return item;
        }
        TWINPANE_LOG_DEBUG_CAT("FileOperations", std::format("Created directory {}", target.string()));
        item.complete();
        return item;
    }

    if (!existing->isDirectory()) {
        return failWith(makeError(FileOpError::TypeMismatch, "A file with this name already exists", target.string()));
    }

    const FileItem requested(name, target, true, std::nullopt, fs::file_time_type::clock::now(),
                             !name.empty() && name.front() == '.');
    auto decision = resolver.resolve(ConflictContext{item, requested, *existing, false});
    if (decision.action == ConflictAction::Ask) {
        item.awaitDecision();
        decision = resolver.requestDecision(item, *existing);
    }
    item.setConflictDecision(decision);

    switch (decision.action) {
        case ConflictAction::Skip:
        case ConflictAction::Ask:
            if (item.state() == OperationState::Pending) item.start();
            item.skip();
            break;

        case ConflictAction::Overwrite:
        case ConflictAction::MergeDirectories:
            // The existing directory already is what was asked for
            item.start();
            item.complete();
            break;

        case ConflictAction::Rename: {
            if (!validateFileName(decision.newName)) {
                return failWith(makeError(FileOpError::InvalidName,
                    std::format("Invalid name '{}'", decision.newName), target.string()));
            }
            item.start();
            auto created = _backend->createDirectory(item.destinationPath());
            if (created.ok()) {
                item.complete();
            } else {
                item.fail(std::move(created.error));
            }
            break;
        }
    }
    return item;
}

BatchProgress FileOperationsManager::lastBatchProgress() const {
    std::lock_guard<std::mutex> lock(_progressMutex);
    return _lastProgress;
}

void FileOperationsManager::publishProgress(const BatchProgress& progress) {
    std::lock_guard<std::mutex> lock(_progressMutex);
    _lastProgress = progress;
}

} // namespace TwinPane::Core::IO
