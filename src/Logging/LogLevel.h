/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace TwinPane {
namespace Core {
namespace Logging {

    /**
     * @brief Severity of a log entry, ordered from most to least verbose
     */
    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warning = 3,
        Error = 4,
        Fatal = 5,
        Off = 6
    };

    constexpr std::string_view logLevelToString(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return "TRACE";
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Fatal: return "FATAL";
            case LogLevel::Off: return "OFF";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Parses a level name (case-insensitive, "warn" and "warning" both accepted)
     * @return The level, or std::nullopt for unrecognized input
     */
    std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

} // namespace Logging
} // namespace Core
} // namespace TwinPane
