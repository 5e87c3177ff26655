/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger fans each accepted entry out to every registered ILogSink. Call sites
 * format their message up front (std::format or string concatenation) and pass
 * it through the TWINPANE_LOG_* macros below.
 *
 * @code
 * TWINPANE_LOG_INFO_CAT("FileOperations", std::format("Copied {} items", n));
 * @endcode
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogEntry.h"
#include "LogLevel.h"

namespace TwinPane {
namespace Core {
namespace Logging {

    class Logger {
    public:
        explicit Logger(std::string name);
        ~Logger();

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief Shared logger used by the TWINPANE_LOG_* macros
         *
         * Created on first use with a ConsoleSink attached. The minimum level is taken
         * from the TWINPANE_LOG_LEVEL environment variable when set (Info otherwise).
         */
        static Logger& global();

        void log(LogLevel level, std::string_view category, std::string_view message);

        void addSink(std::shared_ptr<ILogSink> sink);
        bool removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void flush();

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= minLevel();
        }

        const std::string& name() const noexcept { return _name; }

    private:
        std::string _name;
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
        mutable std::mutex _sinkMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };

} // namespace Logging
} // namespace Core
} // namespace TwinPane

// Message-only macros use the enclosing function name as category
#define TWINPANE_LOG_IMPL(level, category, msg)                                                       \
    do {                                                                                              \
        auto& twinpaneLogger_ = ::TwinPane::Core::Logging::Logger::global();                         \
        if (twinpaneLogger_.isEnabled(level)) {                                                       \
            twinpaneLogger_.log((level), (category), (msg));                                          \
        }                                                                                             \
    } while (0)

#define TWINPANE_LOG_TRACE(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Trace, __func__, msg)
#define TWINPANE_LOG_DEBUG(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Debug, __func__, msg)
#define TWINPANE_LOG_INFO(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Info, __func__, msg)
#define TWINPANE_LOG_WARNING(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Warning, __func__, msg)
#define TWINPANE_LOG_ERROR(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Error, __func__, msg)
#define TWINPANE_LOG_FATAL(msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Fatal, __func__, msg)

#define TWINPANE_LOG_TRACE_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Trace, cat, msg)
#define TWINPANE_LOG_DEBUG_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Debug, cat, msg)
#define TWINPANE_LOG_INFO_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Info, cat, msg)
#define TWINPANE_LOG_WARNING_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Warning, cat, msg)
#define TWINPANE_LOG_ERROR_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Error, cat, msg)
#define TWINPANE_LOG_FATAL_CAT(cat, msg) TWINPANE_LOG_IMPL(::TwinPane::Core::Logging::LogLevel::Fatal, cat, msg)
