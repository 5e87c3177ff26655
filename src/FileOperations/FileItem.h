/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file FileItem.h
 * @brief Immutable snapshot of a single filesystem entry
 *
 * FileItem is what a directory listing hands to the operations engine. It is never
 * mutated: re-observing an entry, or attaching a computed directory size, produces a
 * new instance. Two items are equal when their normalized absolute paths are equal.
 *
 * @code
 * if (auto item = FileItem::fromPath("/home/me/notes.txt")) {
 *     label.setText(item->formatSize());   // "1.5 KB"
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace TwinPane::Core::IO {

class FileItem {
public:
    FileItem(std::string name,
             std::filesystem::path path,
             bool isDirectory,
             std::optional<uint64_t> size,
             std::filesystem::file_time_type modifiedTime,
             bool isHidden,
             std::string extension = {},
             uint32_t permissions = 0,
             bool isSymlink = false);

    /**
     * @brief Observes an entry on disk
     * @param path Entry to stat; normalized to an absolute path
     * @param followSymlinks When false a symbolic link is described as the link itself
     * @param ec Receives the failure reason when the entry cannot be observed
     * @return The snapshot, or std::nullopt if the entry does not exist or cannot be stat'ed
     */
    static std::optional<FileItem> fromPath(const std::filesystem::path& path,
                                            bool followSymlinks = false,
                                            std::error_code* ec = nullptr);

    const std::string& name() const noexcept { return _name; }
    const std::filesystem::path& path() const noexcept { return _path; }
    bool isDirectory() const noexcept { return _isDirectory; }
    // Absent for directories until their size has been computed
    const std::optional<uint64_t>& size() const noexcept { return _size; }
    std::filesystem::file_time_type modifiedTime() const noexcept { return _modifiedTime; }
    bool isHidden() const noexcept { return _isHidden; }
    const std::string& extension() const noexcept { return _extension; }
    uint32_t permissions() const noexcept { return _permissions; }
    bool isSymlink() const noexcept { return _isSymlink; }

    bool canRead() const noexcept { return (_permissions & 0400) != 0; }
    bool canWrite() const noexcept { return (_permissions & 0200) != 0; }
    bool canExecute() const noexcept { return (_permissions & 0100) != 0; }

    // "1.5 KB"; empty for directories and unknown sizes
    std::string formatSize() const;
    // Modification time as "YYYY-MM-DD HH:MM" (UTC)
    std::string formatModifiedTime() const;

    // Same entry with a computed size attached
    FileItem withSize(uint64_t size) const;

    bool operator==(const FileItem& other) const noexcept { return _path == other._path; }
    bool operator!=(const FileItem& other) const noexcept { return !(*this == other); }

private:
    std::string _name;
    std::filesystem::path _path;
    bool _isDirectory = false;
    std::optional<uint64_t> _size;
    std::filesystem::file_time_type _modifiedTime{};
    bool _isHidden = false;
    std::string _extension;
    uint32_t _permissions = 0;
    bool _isSymlink = false;
};

} // namespace TwinPane::Core::IO

template <>
struct std::hash<TwinPane::Core::IO::FileItem> {
    size_t operator()(const TwinPane::Core::IO::FileItem& item) const noexcept {
        return std::filesystem::hash_value(item.path());
    }
};
