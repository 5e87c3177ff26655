/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "ConflictResolver.h"
#include "PathUtils.h"
#include "../Logging/Logger.h"

#include <format>

namespace TwinPane::Core::IO {

namespace {

    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    ConflictDecision renameFor(const FileItem& existing) {
        const auto& dest = existing.path();
        return ConflictDecision::rename(makeUniqueName(dest.parent_path(), dest.filename().string()));
    }

    ConflictDecision fromFilePolicy(ConflictAction policy, const FileItem& existing) {
        switch (policy) {
            case ConflictAction::Overwrite:
                return ConflictDecision::overwrite();
            case ConflictAction::Rename:
                return renameFor(existing);
            default:
                return ConflictDecision::skip();
        }
    }

} // namespace

ConflictResolver::ConflictResolver(ResolverStrategy strategy)
    : _strategy(std::move(strategy))
    , _shared(std::make_shared<SharedState>()) {
}

ConflictDecision ConflictResolver::resolve(const ConflictContext& context) const {
    const bool bothDirectories = context.source.isDirectory() && context.existing.isDirectory();

    return std::visit(Overloaded{
        [](const SkipStrategy&) {
            return ConflictDecision::skip();
        },
        [&](const OverwriteStrategy&) {
            // Directories are merged, never removed to make room
            return bothDirectories ? ConflictDecision::merge() : ConflictDecision::overwrite();
        },
        [&](const RenameStrategy&) {
            return renameFor(context.existing);
        },
        [&](const MergeStrategy& merge) {
            if (bothDirectories) return ConflictDecision::merge();
            return fromFilePolicy(merge.filePolicy, context.existing);
        },
        [&](const AskStrategy&) {
            std::lock_guard<std::mutex> lock(_shared->mutex);
            if (_shared->applyToAll) {
                auto remembered = *_shared->applyToAll;
                if (remembered.action == ConflictAction::Rename) {
                    return renameFor(context.existing);
                }
                if (remembered.action == ConflictAction::MergeDirectories && !bothDirectories) {
                    return ConflictDecision::ask();
                }
                if (remembered.action == ConflictAction::Overwrite && bothDirectories) {
                    return ConflictDecision::merge();
                }
                return remembered;
            }
            return ConflictDecision::ask();
        }
    }, _strategy);
}

ConflictDecision ConflictResolver::requestDecision(const OperationItem& item, const FileItem& existing) const {
    const bool bothDirectories = item.isDirectory() && existing.isDirectory();

    {
        std::lock_guard<std::mutex> lock(_shared->mutex);
        if (_shared->applyToAll &&
            !(_shared->applyToAll->action == ConflictAction::MergeDirectories && !bothDirectories)) {
            auto remembered = *_shared->applyToAll;
            if (remembered.action == ConflictAction::Rename) return renameFor(existing);
            if (remembered.action == ConflictAction::Overwrite && bothDirectories) return ConflictDecision::merge();
            return remembered;
        }
    }

    const auto* ask = std::get_if<AskStrategy>(&_strategy);
    if (!ask || !ask->provider) {
        TWINPANE_LOG_WARNING_CAT("FileOperations",
            std::format("No conflict decision provider, skipping {}", item.destinationPath().string()));
        return ConflictDecision::skip();
    }

    auto decision = ask->provider(item, existing);
    if (decision.action == ConflictAction::Ask) {
        TWINPANE_LOG_WARNING_CAT("FileOperations",
            std::format("Decision provider answered Ask for {}, skipping", item.destinationPath().string()));
        decision = ConflictDecision::skip(decision.applyToAll);
    }
    if (decision.action == ConflictAction::Rename && decision.newName.empty()) {
        decision.newName = renameFor(existing).newName;
    }

    if (decision.applyToAll) {
        std::lock_guard<std::mutex> lock(_shared->mutex);
        _shared->applyToAll = decision;
    }
    return decision;
}

std::optional<ConflictDecision> ConflictResolver::rememberedDecision() const {
    std::lock_guard<std::mutex> lock(_shared->mutex);
    return _shared->applyToAll;
}

void ConflictResolver::forgetRememberedDecision() {
    std::lock_guard<std::mutex> lock(_shared->mutex);
    _shared->applyToAll.reset();
}

} // namespace TwinPane::Core::IO
