/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#include "ConsoleSink.h"

#include <chrono>
#include <format>
#include <iostream>
#include <sstream>

namespace TwinPane {
namespace Core {
namespace Logging {

    ConsoleSink::ConsoleSink()
        : _out(&std::cout)
        , _err(&std::cerr) {
    }

    ConsoleSink::ConsoleSink(std::ostream& out)
        : _out(&out)
        , _err(&out) {
    }

    void ConsoleSink::write(const LogEntry& entry) {
        auto millis = std::chrono::time_point_cast<std::chrono::milliseconds>(entry.timestamp);
        std::string line = std::format("{:%Y-%m-%d %H:%M:%S} [{}]", millis, logLevelToString(entry.level));
        if (!entry.category.empty()) {
            line += std::format(" [{}]", entry.category);
        }
        if (_showThreadId) {
            std::ostringstream tid;
            tid << entry.threadId;
            line += std::format(" (thread {})", tid.str());
        }
        line += ' ';
        line += entry.message;
        line += '\n';

        std::ostream& stream = entry.level >= LogLevel::Warning ? *_err : *_out;
        stream << line;
    }

    void ConsoleSink::flush() {
        _out->flush();
        if (_err != _out) _err->flush();
    }

} // namespace Logging
} // namespace Core
} // namespace TwinPane
