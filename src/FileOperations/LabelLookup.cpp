/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "LabelLookup.h"
#include <format>

namespace TwinPane::Core::IO {

std::string ILabelLookup::describe(const OperationItem& item) const {
    if (item.error()) {
        return std::format("{}: {} ({})", label(item.kind()), label(item.state()), label(item.error()->code));
    }
    return std::format("{}: {}", label(item.kind()), label(item.state()));
}

std::string DefaultLabelLookup::label(OperationState state) const {
    switch (state) {
        case OperationState::Pending: return "Waiting";
        case OperationState::AwaitingConflictDecision: return "Waiting for decision";
        case OperationState::InProgress: return "In progress";
        case OperationState::Completed: return "Done";
        case OperationState::Failed: return "Failed";
        case OperationState::Skipped: return "Skipped";
        case OperationState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string DefaultLabelLookup::label(OperationKind kind) const {
    switch (kind) {
        case OperationKind::Copy: return "Copy";
        case OperationKind::Move: return "Move";
        case OperationKind::Delete: return "Delete";
        case OperationKind::CreateDirectory: return "Create folder";
    }
    return "Unknown";
}

std::string DefaultLabelLookup::label(FileOpError error) const {
    switch (error) {
        case FileOpError::None: return "No error";
        case FileOpError::NotFound: return "File not found";
        case FileOpError::PermissionDenied: return "Permission denied";
        case FileOpError::DiskFull: return "Disk is full";
        case FileOpError::TypeMismatch: return "A file and a folder have the same name";
        case FileOpError::IntegrityMismatch: return "Copied size does not match";
        case FileOpError::Cancelled: return "Cancelled";
        case FileOpError::AlreadyExists: return "Already exists";
        case FileOpError::InvalidName: return "Invalid name";
        case FileOpError::InvalidTarget: return "Cannot copy a folder into itself";
        case FileOpError::PathTooLong: return "Path is too long";
        case FileOpError::DirectoryNotEmpty: return "Folder is not empty";
        case FileOpError::IOError: return "Input/output error";
    }
    return "Unknown error";
}

std::string DefaultLabelLookup::label(ConflictAction action) const {
    switch (action) {
        case ConflictAction::Overwrite: return "Replace";
        case ConflictAction::Skip: return "Skip";
        case ConflictAction::Rename: return "Keep both";
        case ConflictAction::MergeDirectories: return "Merge";
        case ConflictAction::Ask: return "Ask";
    }
    return "Unknown";
}

} // namespace TwinPane::Core::IO
