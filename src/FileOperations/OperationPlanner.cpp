/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "OperationPlanner.h"
#include "FileTransfer.h"
#include "PathUtils.h"
#include "../Logging/Logger.h"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace TwinPane::Core::IO {

namespace fs = std::filesystem;

OperationPlanner::OperationPlanner(Options options,
                                   const ConflictResolver& resolver,
                                   const ProgressSink& sink,
                                   Concurrency::CancellationToken cancel)
    : _options(options)
    , _resolver(resolver)
    , _sink(sink)
    , _cancel(std::move(cancel)) {
}

OperationPlan OperationPlanner::planTransfer(OperationKind kind,
                                             const std::vector<FileItem>& items,
                                             const fs::path& destinationDirectory) {
    OperationPlan plan;
    plan.kind = kind;
    plan.destinationDirectory = normalizePath(destinationDirectory);

    std::error_code ec;
    const auto destStatus = fs::status(plan.destinationDirectory, ec);
    if (!fs::exists(destStatus)) {
        if (!_options.createDestinationIfMissing) {
            plan.planError = makeError(FileOpError::NotFound, "Destination directory does not exist",
                                       plan.destinationDirectory.string());
            return plan;
        }
        ec.clear();
        fs::create_directories(plan.destinationDirectory, ec);
        if (ec) {
            plan.planError = errorFromCode(ec, "Cannot create destination directory", plan.destinationDirectory.string());
            return plan;
        }
        TWINPANE_LOG_DEBUG_CAT("FileOperations",
            std::format("Created destination directory {}", plan.destinationDirectory.string()));
    } else if (!fs::is_directory(destStatus)) {
        plan.planError = makeError(FileOpError::TypeMismatch, "Destination is not a directory",
                                   plan.destinationDirectory.string());
        return plan;
    }

    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (!seen.insert(item.path().string()).second) {
            TWINPANE_LOG_WARNING_CAT("FileOperations",
                std::format("Ignoring duplicate request entry {}", item.path().string()));
            continue;
        }
        appendTransfer(plan, item.path(), plan.destinationDirectory / item.path().filename(), std::nullopt, std::nullopt);
    }

    reportScan(plan, true);
    return plan;
}

OperationPlan OperationPlanner::planDelete(const std::vector<FileItem>& items) {
    OperationPlan plan;
    plan.kind = OperationKind::Delete;

    std::unordered_set<std::string> seen;
    for (const auto& item : items) {
        if (!seen.insert(item.path().string()).second) {
            TWINPANE_LOG_WARNING_CAT("FileOperations",
                std::format("Ignoring duplicate request entry {}", item.path().string()));
            continue;
        }
        appendDelete(plan, item.path(), std::nullopt, std::nullopt);
    }

    // Pre-order walk reversed: every child precedes its directory
    const size_t count = plan.entries.size();
    std::reverse(plan.entries.begin(), plan.entries.end());
    for (size_t i = 0; i < count; ++i) {
        auto& entry = plan.entries[i];
        entry.item.setPlanIndex(i);
        if (entry.parent) {
            entry.parent = count - 1 - *entry.parent;
        }
    }

    reportScan(plan, true);
    return plan;
}

void OperationPlanner::appendTransfer(OperationPlan& plan, const fs::path& src, const fs::path& dst,
                                      std::optional<size_t> parent, std::optional<Outcome> preset) {
    std::error_code ec;
    auto snapshot = FileItem::fromPath(src, _options.followSymlinks, &ec);
    const bool isDir = snapshot && snapshot->isDirectory();
    const uint64_t size = (snapshot && !isDir) ? snapshot->size().value_or(0) : 0;
    const auto itemKind = isDir ? OperationKind::CreateDirectory : plan.kind;

    const size_t index = push(plan, PlannedEntry{OperationItem(itemKind, src, dst, size, isDir), snapshot, parent});

    if (!preset && !snapshot) {
        preset = Outcome{OperationState::Failed, errorFromCode(ec, "Source no longer exists", src.string())};
    }
    if (!preset && checkCancelled(plan)) {
        preset = Outcome{OperationState::Cancelled, std::nullopt};
    }
    if (!preset && !parent) {
        if (isDir && isSameOrSubPath(src, dst.parent_path())) {
            preset = Outcome{OperationState::Failed,
                             makeError(FileOpError::InvalidTarget, "Cannot copy or move a directory into itself", dst.string())};
        } else if (plan.kind == OperationKind::Move && normalizePath(src) == normalizePath(dst)) {
            preset = Outcome{OperationState::Failed,
                             makeError(FileOpError::InvalidTarget, "Source and destination are the same", dst.string())};
        }
    }

    std::optional<Outcome> childPreset;
    if (preset) {
        settle(plan.entries[index].item, *preset);
        if (!isDir || preset->state == OperationState::Cancelled) {
            return;
        }
        childPreset = preset;
    } else if (!isDir) {
        // Files and links run on the workers
        return;
    }

    std::vector<fs::path> children;
    if (!listChildren(src, children, ec)) {
        auto& item = plan.entries[index].item;
        if (!item.isTerminal()) {
            item.start();
            item.fail(errorFromCode(ec, "Cannot list directory", src.string()));
        }
        return;
    }

    if (!childPreset) {
        childPreset = settleDirectory(plan, index);
        if (plan.entries[index].item.state() == OperationState::Cancelled) {
            return;
        }
    }

    const fs::path childBase = plan.entries[index].item.destinationPath();
    for (const auto& child : children) {
        appendTransfer(plan, child, childBase / child.filename(), index, childPreset);
    }
}

void OperationPlanner::appendDelete(OperationPlan& plan, const fs::path& src,
                                    std::optional<size_t> parent, std::optional<Outcome> preset) {
    std::error_code ec;
    // Links are removed, never followed
    auto snapshot = FileItem::fromPath(src, false, &ec);
    const bool isDir = snapshot && snapshot->isDirectory();
    const uint64_t size = (snapshot && !isDir) ? snapshot->size().value_or(0) : 0;

    const size_t index = push(plan, PlannedEntry{OperationItem(OperationKind::Delete, src, {}, size, isDir), snapshot, parent});

    if (!preset && !snapshot) {
        preset = Outcome{OperationState::Failed, errorFromCode(ec, "Source no longer exists", src.string())};
    }
    if (!preset && checkCancelled(plan)) {
        preset = Outcome{OperationState::Cancelled, std::nullopt};
    }
    if (preset) {
        settle(plan.entries[index].item, *preset);
        return;
    }
    if (!isDir) {
        return;
    }

    std::vector<fs::path> children;
    if (!listChildren(src, children, ec)) {
        auto& item = plan.entries[index].item;
        item.start();
        item.fail(errorFromCode(ec, "Cannot list directory", src.string()));
        return;
    }
    for (const auto& child : children) {
        appendDelete(plan, child, index, std::nullopt);
    }
}

std::optional<OperationPlanner::Outcome> OperationPlanner::settleDirectory(OperationPlan& plan, size_t index) {
    const fs::path dst = plan.entries[index].item.destinationPath();

    // Follow links at the destination: merging into a linked directory is legitimate
    auto existing = FileItem::fromPath(dst, true);
    if (!existing) {
        auto& item = plan.entries[index].item;
        item.start();
        auto created = createDirectoryEntry(dst);
        if (created.ok()) {
            item.complete();
        } else {
            item.fail(std::move(created.error));
        }
        return inherited(item);
    }

    const auto& source = *plan.entries[index].source;
    const bool typeMismatch = !existing->isDirectory();
    auto decision = _resolver.resolve(ConflictContext{plan.entries[index].item, source, *existing, typeMismatch});

    if (decision.action == ConflictAction::Ask) {
        plan.entries[index].item.awaitDecision();
        decision = _resolver.requestDecision(plan.entries[index].item, *existing);
        if (checkCancelled(plan)) {
            plan.entries[index].item.cancel();
            return inherited(plan.entries[index].item);
        }
    }

    auto& item = plan.entries[index].item;
    item.setConflictDecision(decision);
    if (decision.action == ConflictAction::Rename && !validateFileName(decision.newName)) {
        item.start();
        item.fail(makeError(FileOpError::InvalidName, std::format("Invalid name '{}'", decision.newName), dst.string()));
        return inherited(item);
    }

    switch (decision.action) {
        case ConflictAction::Skip:
            if (item.state() == OperationState::Pending) item.start();
            item.skip();
            break;

        case ConflictAction::Overwrite:
        case ConflictAction::MergeDirectories:
            item.start();
            if (typeMismatch) {
                item.fail(makeError(FileOpError::TypeMismatch, "A file occupies the destination directory name", dst.string()));
            } else {
                // The existing directory receives the content
                item.complete();
            }
            break;

        case ConflictAction::Rename: {
            item.start();
            auto created = createDirectoryEntry(item.destinationPath());
            if (created.ok()) {
                item.complete();
            } else {
                item.fail(std::move(created.error));
            }
            break;
        }

        case ConflictAction::Ask:
            // requestDecision never returns Ask
            item.start();
            item.skip();
            break;
    }

    TWINPANE_LOG_DEBUG_CAT("FileOperations",
        std::format("Directory conflict at {} resolved as {}", dst.string(), toString(decision.action)));
    return inherited(item);
}

size_t OperationPlanner::push(OperationPlan& plan, PlannedEntry entry) {
    const size_t index = plan.entries.size();
    entry.item.setPlanIndex(index);
    if (entry.parent) {
        ++plan.entries[*entry.parent].childCount;
    }
    plan.totalBytes += entry.item.sizeBytes();
    plan.entries.push_back(std::move(entry));
    reportScan(plan, false);
    return index;
}

void OperationPlanner::reportScan(const OperationPlan& plan, bool force) {
    if (!_sink.onScanProgress) return;
    const size_t count = plan.entries.size();
    if (!force && count - _lastReported < std::max<size_t>(_options.scanReportInterval, 1)) return;
    _lastReported = count;
    _sink.onScanProgress(count, plan.totalBytes);
}

bool OperationPlanner::checkCancelled(OperationPlan& plan) {
    if (_cancel.isCancellationRequested()) {
        plan.cancelled = true;
        return true;
    }
    return false;
}

void OperationPlanner::settle(OperationItem& item, const Outcome& outcome) {
    switch (outcome.state) {
        case OperationState::Cancelled:
            item.cancel();
            break;
        case OperationState::Skipped:
            item.start();
            item.skip();
            break;
        case OperationState::Failed:
            item.start();
            item.fail(outcome.error.value_or(makeError(FileOpError::IOError, "Not executed", item.sourcePath().string())));
            break;
        default:
            break;
    }
}

std::optional<OperationPlanner::Outcome> OperationPlanner::inherited(const OperationItem& directory) {
    switch (directory.state()) {
        case OperationState::Skipped:
            return Outcome{OperationState::Skipped, std::nullopt};
        case OperationState::Cancelled:
            return Outcome{OperationState::Cancelled, std::nullopt};
        case OperationState::Failed: {
            const auto& cause = *directory.error();
            return Outcome{OperationState::Failed,
                           makeError(cause.code, std::format("Parent directory failed: {}", cause.message), cause.path,
                                     cause.systemError)};
        }
        default:
            return std::nullopt;
    }
}

bool OperationPlanner::listChildren(const fs::path& dir, std::vector<fs::path>& out, std::error_code& ec) {
    ec.clear();
    fs::directory_iterator it(dir, ec);
    if (ec) return false;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return false;
        out.push_back(it->path());
    }
    if (ec) return false;
    std::sort(out.begin(), out.end());
    return true;
}

} // namespace TwinPane::Core::IO
