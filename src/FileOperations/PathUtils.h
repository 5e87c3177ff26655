/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file PathUtils.h
 * @brief Path and name helpers shared by the planner and the transfer primitives
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace TwinPane::Core::IO {

/**
 * @brief Checks that a single path component can be created on any supported platform
 *
 * Rejects empty names, "." and "..", names containing any of <>:"/\|?* or NUL, and the
 * reserved device names CON, PRN, AUX, NUL, COM1-COM9 and LPT1-LPT9 (case-insensitive).
 */
bool validateFileName(std::string_view name) noexcept;

/**
 * @brief Picks a name that does not exist yet in the given directory
 *
 * Returns `name` itself when it is free, otherwise "stem (N).ext" with the smallest
 * N >= 1 that is free. Directory names and dot-files use the whole name as stem.
 */
std::string makeUniqueName(const std::filesystem::path& directory, const std::string& name);

/// Absolute, lexically normal form of p with links resolved in its parent directories only
std::filesystem::path normalizePath(const std::filesystem::path& p);

/// True when candidate equals ancestor or lies inside it, after normalization
bool isSameOrSubPath(const std::filesystem::path& ancestor, const std::filesystem::path& candidate);

/**
 * @brief Reports whether two paths live on the same device
 *
 * Each path is walked up to its nearest existing ancestor, so a destination that has
 * not been created yet is attributed to the volume it would be created on.
 */
bool isSameVolume(const std::filesystem::path& a, const std::filesystem::path& b);

/// "0 B", "512 B", "1.5 KB", "2 MB" ... up to PB, one decimal unless integral
std::string formatFileSize(uint64_t bytes);

} // namespace TwinPane::Core::IO
