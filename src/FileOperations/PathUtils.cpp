/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "PathUtils.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <optional>
#include <system_error>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/stat.h>  // stat()
#endif

namespace TwinPane::Core::IO {

namespace {

    std::string toUpper(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    bool isReservedDeviceName(std::string_view name) {
        static constexpr std::array<std::string_view, 4> plain{"CON", "PRN", "AUX", "NUL"};
        const auto upper = toUpper(name);
        if (std::find(plain.begin(), plain.end(), upper) != plain.end()) {
            return true;
        }
        if (upper.size() == 4 && (upper.starts_with("COM") || upper.starts_with("LPT"))) {
            return upper[3] >= '1' && upper[3] <= '9';
        }
        return false;
    }

#if defined(__unix__) || defined(__APPLE__)
    std::optional<dev_t> deviceOf(const std::filesystem::path& p) {
        auto current = normalizePath(p);
        while (true) {
            struct stat st{};
            if (::stat(current.c_str(), &st) == 0) {
                return st.st_dev;
            }
            if (!current.has_parent_path() || current.parent_path() == current) {
                return std::nullopt;
            }
            current = current.parent_path();
        }
    }
#endif

} // namespace

bool validateFileName(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    // Forbidden on Windows and at least one other platform
    constexpr std::string_view forbidden = "<>:\"/\\|?*";
    for (char c : name) {
        if (c == '\0' || forbidden.find(c) != std::string_view::npos) {
            return false;
        }
    }

    try {
        return !isReservedDeviceName(name);
    } catch (const std::bad_alloc&) {
        return false;
    }
}

std::string makeUniqueName(const std::filesystem::path& directory, const std::string& name) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(directory / name, ec))) {
        return name;
    }

    const std::filesystem::path original(name);
    std::string stem = original.stem().string();
    std::string suffix = original.extension().string();
    if (std::filesystem::is_directory(std::filesystem::symlink_status(directory / name, ec))) {
        stem = name;
        suffix.clear();
    }

    for (uint64_t counter = 1;; ++counter) {
        auto candidate = std::format("{} ({}){}", stem, counter, suffix);
        if (!std::filesystem::exists(std::filesystem::symlink_status(directory / candidate, ec))) {
            return candidate;
        }
    }
}

std::filesystem::path normalizePath(const std::filesystem::path& p) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(p, ec);
    if (ec) absolute = p;
    absolute = absolute.lexically_normal();

    // "/a/b/" and "/a/b" name the same entry
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }
    if (!absolute.has_relative_path()) {
        return absolute;
    }

    // Resolve links in the parent only; the entry itself may be a link we must not follow
    auto parent = std::filesystem::weakly_canonical(absolute.parent_path(), ec);
    if (ec) {
        return absolute;
    }
    return (parent / absolute.filename()).lexically_normal();
}

bool isSameOrSubPath(const std::filesystem::path& ancestor, const std::filesystem::path& candidate) {
    const auto a = normalizePath(ancestor);
    const auto c = normalizePath(candidate);

    auto ai = a.begin();
    auto ci = c.begin();
    for (; ai != a.end(); ++ai, ++ci) {
        if (ci == c.end() || *ai != *ci) {
            return false;
        }
    }
    return true;
}

bool isSameVolume(const std::filesystem::path& a, const std::filesystem::path& b) {
#if defined(__unix__) || defined(__APPLE__)
    auto da = deviceOf(a);
    auto db = deviceOf(b);
    return da && db && *da == *db;
#else
    return normalizePath(a).root_name() == normalizePath(b).root_name();
#endif
}

std::string formatFileSize(uint64_t bytes) {
    static constexpr std::array<const char*, 5> units{"B", "KB", "MB", "GB", "TB"};

    double size = static_cast<double>(bytes);
    for (const char* unit : units) {
        if (size < 1024.0) {
            if (size == std::floor(size)) {
                return std::format("{} {}", static_cast<uint64_t>(size), unit);
            }
            return std::format("{:.1f} {}", size, unit);
        }
        size /= 1024.0;
    }
    return std::format("{:.1f} PB", size);
}

} // namespace TwinPane::Core::IO
