/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include <string>
#include <string_view>

namespace TwinPane::Core::IO {

enum class ConflictAction {
    Overwrite,
    Skip,
    Rename,            ///< Use ConflictDecision::newName in the same directory
    MergeDirectories,  ///< Only legal when both sides are directories
    Ask                ///< Defer to the decision provider
};

constexpr std::string_view toString(ConflictAction action) noexcept {
    switch (action) {
        case ConflictAction::Overwrite: return "Overwrite";
        case ConflictAction::Skip: return "Skip";
        case ConflictAction::Rename: return "Rename";
        case ConflictAction::MergeDirectories: return "MergeDirectories";
        case ConflictAction::Ask: return "Ask";
    }
    return "Unknown";
}

struct ConflictDecision {
    ConflictAction action = ConflictAction::Skip;
    std::string newName;       // Rename only
    bool applyToAll = false;   // Reuse for every later conflict of the batch

    static ConflictDecision overwrite(bool applyToAll = false) { return {ConflictAction::Overwrite, {}, applyToAll}; }
    static ConflictDecision skip(bool applyToAll = false) { return {ConflictAction::Skip, {}, applyToAll}; }
    static ConflictDecision rename(std::string newName) { return {ConflictAction::Rename, std::move(newName), false}; }
    static ConflictDecision merge(bool applyToAll = false) { return {ConflictAction::MergeDirectories, {}, applyToAll}; }
    static ConflictDecision ask() { return {ConflictAction::Ask, {}, false}; }

    bool operator==(const ConflictDecision&) const = default;
};

} // namespace TwinPane::Core::IO
