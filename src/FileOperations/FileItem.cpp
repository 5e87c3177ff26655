/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "FileItem.h"
#include "PathUtils.h"

#include <chrono>
#include <format>

namespace TwinPane::Core::IO {

FileItem::FileItem(std::string name,
                   std::filesystem::path path,
                   bool isDirectory,
                   std::optional<uint64_t> size,
                   std::filesystem::file_time_type modifiedTime,
                   bool isHidden,
                   std::string extension,
                   uint32_t permissions,
                   bool isSymlink)
    : _name(std::move(name))
    , _path(normalizePath(path))
    , _isDirectory(isDirectory)
    , _size(isDirectory ? size : size.value_or(0))
    , _modifiedTime(modifiedTime)
    , _isHidden(isHidden)
    , _extension(isDirectory ? std::string() : std::move(extension))
    , _permissions(permissions & 0777)
    , _isSymlink(isSymlink) {
}

std::optional<FileItem> FileItem::fromPath(const std::filesystem::path& path, bool followSymlinks,
                                           std::error_code* ecOut) {
    namespace fs = std::filesystem;
    std::error_code ec;

    const auto linkStatus = fs::symlink_status(path, ec);
    if (ec || !fs::exists(linkStatus)) {
        if (ecOut) *ecOut = ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory);
        return std::nullopt;
    }

    const bool isLink = fs::is_symlink(linkStatus);
    auto status = linkStatus;
    if (isLink && followSymlinks) {
        status = fs::status(path, ec);
        if (ec) {
            // Dangling link
            if (ecOut) *ecOut = ec;
            return std::nullopt;
        }
    }

    const bool describesLink = isLink && !followSymlinks;
    const bool isDir = !describesLink && fs::is_directory(status);

    std::optional<uint64_t> size;
    if (!isDir) {
        size = 0;
        if (!describesLink && fs::is_regular_file(status)) {
            auto bytes = fs::file_size(path, ec);
            if (ec) {
                if (ecOut) *ecOut = ec;
                return std::nullopt;
            }
            size = static_cast<uint64_t>(bytes);
        }
    }

    fs::file_time_type mtime{};
    if (!describesLink) {
        mtime = fs::last_write_time(path, ec);
        if (ec) {
            mtime = {};
            ec.clear();
        }
    }

    const auto normalized = normalizePath(path);
    std::string name = normalized.filename().string();
    std::string extension = normalized.extension().string();
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }

    return FileItem(name,
                    normalized,
                    isDir,
                    size,
                    mtime,
                    !name.empty() && name.front() == '.',
                    extension,
                    static_cast<uint32_t>(status.permissions()) & 0777,
                    isLink);
}

std::string FileItem::formatSize() const {
    if (_isDirectory || !_size) {
        return {};
    }
    return formatFileSize(*_size);
}

std::string FileItem::formatModifiedTime() const {
    const auto sys = std::chrono::file_clock::to_sys(_modifiedTime);
    return std::format("{:%Y-%m-%d %H:%M}", std::chrono::floor<std::chrono::minutes>(sys));
}

FileItem FileItem::withSize(uint64_t size) const {
    FileItem copy(*this);
    copy._size = size;
    return copy;
}

} // namespace TwinPane::Core::IO
