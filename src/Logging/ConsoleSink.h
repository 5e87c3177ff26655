/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 The TwinPane Authors
 * This file is part of the TwinPane Core project.
 */

#pragma once

#include <iosfwd>

#include "ILogSink.h"

namespace TwinPane {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries to stdout (Trace..Info) and stderr (Warning and above)
     *
     * Output format: `2025-01-01 12:00:00.123 [INFO] [Category] message`
     */
    class ConsoleSink : public ILogSink {
    public:
        ConsoleSink();
        // Redirects all output to a single stream (used by tests)
        explicit ConsoleSink(std::ostream& out);

        void write(const LogEntry& entry) override;
        void flush() override;

        void setShowThreadId(bool show) noexcept { _showThreadId = show; }

    private:
        std::ostream* _out = nullptr;
        std::ostream* _err = nullptr;
        bool _showThreadId = false;
    };

} // namespace Logging
} // namespace Core
} // namespace TwinPane
