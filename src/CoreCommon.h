/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file CoreCommon.h
 * @brief Environment helpers shared by the configuration code
 *
 * Logging levels and FileOperationsManager::Config::fromEnvironment() read their
 * overrides through these helpers, so malformed values are ignored in one place.
 */

#pragma once

#include <cstdint>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

namespace TwinPane {
namespace Core {
    /// Copy of an environment variable, or std::nullopt if it is not set
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
        const char* value = std::getenv(name);
        if (!value) return std::nullopt;
        return std::string(value);
    }

    /// Decimal unsigned value of an environment variable; nullopt when unset or malformed
    inline std::optional<uint64_t> safeGetEnvUnsigned(const char* name) {
        auto value = safeGetEnv(name);
        if (!value || value->empty() || value->front() == '-') return std::nullopt;
        char* end = nullptr;
        errno = 0;
        const unsigned long long parsed = std::strtoull(value->c_str(), &end, 10);
        if (end == value->c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
        return static_cast<uint64_t>(parsed);
    }
} // namespace Core
} // namespace TwinPane
