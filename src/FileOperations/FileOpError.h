/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace TwinPane::Core::IO {

/**
 * Error taxonomy recorded on failed OperationItems.
 * Mapping guidelines:
 * - NotFound: source vanished before or during execution
 * - PermissionDenied: EACCES/EPERM on any step
 * - DiskFull: ENOSPC/EDQUOT while writing the destination
 * - TypeMismatch: file/directory collision the engine refuses to overwrite
 * - IntegrityMismatch: destination size differs from the planned size
 * - Cancelled: informational; cancelled items carry it, they never fail
 * - AlreadyExists: a renamed or newly created target is already taken
 * - InvalidName: a file name that cannot be created portably
 * - InvalidTarget: copy/move into the source itself or its own subtree
 * - PathTooLong: ENAMETOOLONG
 * - DirectoryNotEmpty: a directory still holds entries when it is removed
 * - IOError: anything else
 */
enum class FileOpError {
    None = 0,
    NotFound,
    PermissionDenied,
    DiskFull,
    TypeMismatch,
    IntegrityMismatch,
    Cancelled,
    AlreadyExists,
    InvalidName,
    InvalidTarget,
    PathTooLong,
    DirectoryNotEmpty,
    IOError
};

struct FileOpErrorInfo {
    FileOpError code = FileOpError::None;
    std::string message;
    std::string path;
    std::optional<std::error_code> systemError;

    explicit operator bool() const noexcept { return code != FileOpError::None; }
};

constexpr std::string_view toString(FileOpError code) noexcept {
    switch (code) {
        case FileOpError::None: return "None";
        case FileOpError::NotFound: return "NotFound";
        case FileOpError::PermissionDenied: return "PermissionDenied";
        case FileOpError::DiskFull: return "DiskFull";
        case FileOpError::TypeMismatch: return "TypeMismatch";
        case FileOpError::IntegrityMismatch: return "IntegrityMismatch";
        case FileOpError::Cancelled: return "Cancelled";
        case FileOpError::AlreadyExists: return "AlreadyExists";
        case FileOpError::InvalidName: return "InvalidName";
        case FileOpError::InvalidTarget: return "InvalidTarget";
        case FileOpError::PathTooLong: return "PathTooLong";
        case FileOpError::DirectoryNotEmpty: return "DirectoryNotEmpty";
        case FileOpError::IOError: return "IOError";
    }
    return "Unknown";
}

// Map errno to FileOpError
FileOpError mapErrnoToFileOpError(int err) noexcept;

// Generic and system category codes go through the errno table; others become IOError
FileOpError mapErrorCode(const std::error_code& ec) noexcept;

FileOpErrorInfo makeError(FileOpError code, std::string message, std::string path = {},
                          std::optional<std::error_code> ec = std::nullopt);

// Builds an error from a failed system call, classifying ec
FileOpErrorInfo errorFromCode(const std::error_code& ec, std::string message, std::string path);

} // namespace TwinPane::Core::IO
