/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "FileOpError.h"
#include <cerrno>

namespace TwinPane::Core::IO {

FileOpError mapErrnoToFileOpError(int err) noexcept {
    switch (err) {
        case 0:
            return FileOpError::None;
        case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
        case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
            return FileOpError::DiskFull;
        case EACCES:
        case EPERM:
        case EROFS:
            return FileOpError::PermissionDenied;
        case ENOENT:
            return FileOpError::NotFound;
        case ENAMETOOLONG:
            return FileOpError::PathTooLong;
        case EEXIST:
            return FileOpError::AlreadyExists;
        case ENOTEMPTY:
            return FileOpError::DirectoryNotEmpty;
        case EISDIR:
        case ENOTDIR:
            return FileOpError::TypeMismatch;
        case EINVAL:  // rename() of a directory into its own subtree
            return FileOpError::InvalidTarget;
        case EILSEQ:
            return FileOpError::InvalidName;
        default:
            return FileOpError::IOError;
    }
}

FileOpError mapErrorCode(const std::error_code& ec) noexcept {
    if (!ec) return FileOpError::None;
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return mapErrnoToFileOpError(ec.value());
    }
    return FileOpError::IOError;
}

FileOpErrorInfo makeError(FileOpError code, std::string message, std::string path,
                          std::optional<std::error_code> ec) {
    FileOpErrorInfo info;
    info.code = code;
    info.message = std::move(message);
    info.path = std::move(path);
    info.systemError = ec;
    return info;
}

FileOpErrorInfo errorFromCode(const std::error_code& ec, std::string message, std::string path) {
    auto code = mapErrorCode(ec);
    if (code == FileOpError::None) code = FileOpError::IOError;
    if (ec) {
        message += ": ";
        message += ec.message();
    }
    return makeError(code, std::move(message), std::move(path), ec);
}

} // namespace TwinPane::Core::IO
