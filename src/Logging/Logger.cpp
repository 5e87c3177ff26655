/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "Logger.h"
#include "ConsoleSink.h"
#include "../CoreCommon.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace TwinPane {
namespace Core {
namespace Logging {

    std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept {
        std::string lower;
        lower.reserve(text.size());
        for (char c : text) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        if (lower == "trace") return LogLevel::Trace;
        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info") return LogLevel::Info;
        if (lower == "warn" || lower == "warning") return LogLevel::Warning;
        if (lower == "error") return LogLevel::Error;
        if (lower == "fatal") return LogLevel::Fatal;
        if (lower == "off" || lower == "none") return LogLevel::Off;
        return std::nullopt;
    }

    Logger::Logger(std::string name)
        : _name(std::move(name)) {
    }

    Logger::~Logger() {
        flush();
    }

    Logger& Logger::global() {
        static Logger instance("TwinPane");
        static std::once_flag configured;
        std::call_once(configured, [] {
            instance.addSink(std::make_shared<ConsoleSink>());
            if (auto level = safeGetEnv("TWINPANE_LOG_LEVEL")) {
                if (auto parsed = parseLogLevel(*level)) {
                    instance.setMinLevel(*parsed);
                }
            }
        });
        return instance;
    }

    void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
        if (!isEnabled(level)) return;

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = level;
        entry.category = std::string(category);
        entry.message = std::string(message);
        entry.threadId = std::this_thread::get_id();

        std::lock_guard<std::mutex> lock(_sinkMutex);
        for (const auto& sink : _sinks) {
            if (sink && sink->accepts(level)) {
                sink->write(entry);
            }
        }
        if (level >= LogLevel::Error) {
            for (const auto& sink : _sinks) {
                if (sink) sink->flush();
            }
        }
    }

    void Logger::addSink(std::shared_ptr<ILogSink> sink) {
        if (!sink) return;
        std::lock_guard<std::mutex> lock(_sinkMutex);
        _sinks.push_back(std::move(sink));
    }

    bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        auto it = std::find(_sinks.begin(), _sinks.end(), sink);
        if (it == _sinks.end()) return false;
        _sinks.erase(it);
        return true;
    }

    void Logger::clearSinks() {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        _sinks.clear();
    }

    size_t Logger::sinkCount() const {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        return _sinks.size();
    }

    void Logger::flush() {
        std::lock_guard<std::mutex> lock(_sinkMutex);
        for (const auto& sink : _sinks) {
            if (sink) sink->flush();
        }
    }

} // namespace Logging
} // namespace Core
} // namespace TwinPane
