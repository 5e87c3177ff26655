/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include "LogEntry.h"

namespace TwinPane {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks are invoked by Logger while it holds its sink lock, so write() is never
     * called concurrently on the same sink instance. Implementations must not log
     * through the Logger from inside write().
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() {}

        // Per-sink threshold applied after the logger's global threshold
        void setMinLevel(LogLevel level) noexcept { _minLevel = level; }
        LogLevel minLevel() const noexcept { return _minLevel; }
        bool accepts(LogLevel level) const noexcept { return level >= _minLevel; }

    private:
        LogLevel _minLevel = LogLevel::Trace;
    };

} // namespace Logging
} // namespace Core
} // namespace TwinPane
