/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file ConflictResolver.h
 * @brief Destination collision policy for copy, move and createDirectory
 *
 * A ConflictResolver wraps one of a closed set of strategies. resolve() is
 * deterministic for every strategy except Ask, which returns ConflictAction::Ask;
 * the engine then calls requestDecision() on the calling thread, which forwards to
 * the caller-supplied ConflictDecisionProvider.
 *
 * Strategy summary:
 * - Skip: always Skip
 * - Overwrite: Overwrite files; a directory/directory collision merges instead
 * - Rename: Rename to "stem (N).ext", the first free N
 * - Merge: MergeDirectories for directory pairs, filePolicy for everything else
 * - Ask: Ask; a decision returned with applyToAll is replayed for the rest of the batch
 *
 * The engine refuses Overwrite and MergeDirectories on a file/directory type mismatch
 * and reports TypeMismatch; Rename and Skip are always honoured.
 *
 * Copies of a resolver share the remembered applyToAll decision. The same instance is
 * used for nested conflicts inside merged directories.
 *
 * @code
 * auto resolver = ConflictResolver::ask([](const OperationItem& item, const FileItem& existing) {
 *     return dialog.ask(item.destinationPath(), existing);   // e.g. ConflictDecision::overwrite(true)
 * });
 * manager.copyItems(items, dest, resolver, sink);
 * @endcode
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include "ConflictDecision.h"
#include "FileItem.h"
#include "OperationItem.h"

namespace TwinPane::Core::IO {

using ConflictDecisionProvider =
    std::function<ConflictDecision(const OperationItem& item, const FileItem& existing)>;

struct ConflictContext {
    const OperationItem& item;
    const FileItem& source;
    const FileItem& existing;
    bool typeMismatch;   ///< One side is a directory, the other is not
};

struct SkipStrategy {};
struct OverwriteStrategy {};
struct RenameStrategy {};
struct MergeStrategy {
    ConflictAction filePolicy = ConflictAction::Skip;   ///< Skip, Overwrite or Rename
};
struct AskStrategy {
    ConflictDecisionProvider provider;
};

using ResolverStrategy = std::variant<SkipStrategy, OverwriteStrategy, RenameStrategy, MergeStrategy, AskStrategy>;

class ConflictResolver {
public:
    explicit ConflictResolver(ResolverStrategy strategy = SkipStrategy{});

    static ConflictResolver skip() { return ConflictResolver(SkipStrategy{}); }
    static ConflictResolver overwrite() { return ConflictResolver(OverwriteStrategy{}); }
    static ConflictResolver rename() { return ConflictResolver(RenameStrategy{}); }
    static ConflictResolver merge(ConflictAction filePolicy = ConflictAction::Skip) {
        return ConflictResolver(MergeStrategy{filePolicy});
    }
    static ConflictResolver ask(ConflictDecisionProvider provider) {
        return ConflictResolver(AskStrategy{std::move(provider)});
    }

    /**
     * @brief Decides what to do about an occupied destination
     * @return A concrete decision, or Ask for the interactive strategy without a
     *         remembered applyToAll answer
     */
    ConflictDecision resolve(const ConflictContext& context) const;

    /**
     * @brief Obtains an interactive decision from the provider
     *
     * Called by the engine on the thread that started the batch. A decision flagged
     * applyToAll is remembered; later calls replay it without asking. A Rename answer
     * without a name is completed with the next free "stem (N).ext". Without a provider,
     * or when the provider answers Ask, the conflict is skipped.
     */
    ConflictDecision requestDecision(const OperationItem& item, const FileItem& existing) const;

    bool isInteractive() const noexcept { return std::holds_alternative<AskStrategy>(_strategy); }
    const ResolverStrategy& strategy() const noexcept { return _strategy; }

    std::optional<ConflictDecision> rememberedDecision() const;
    void forgetRememberedDecision();

private:
    struct SharedState {
        std::mutex mutex;
        std::optional<ConflictDecision> applyToAll;
    };

    ResolverStrategy _strategy;
    std::shared_ptr<SharedState> _shared;
};

} // namespace TwinPane::Core::IO
