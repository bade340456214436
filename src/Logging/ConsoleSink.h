/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

#include <mutex>
#include <ostream>
#include "ILogSink.h"

namespace Palisade {
namespace Core {
namespace Logging {

    /**
     * @brief Writes entries to a stream (stderr by default)
     *
     * Output format: `[2025-01-01 12:00:00.000] [INFO] [Category] message`.
     * ANSI colours are applied only when the target is stderr attached to a
     * terminal, or when explicitly forced.
     */
    class ConsoleSink : public ILogSink {
    public:
        ConsoleSink();
        explicit ConsoleSink(std::ostream& out, bool useColor = false);

        void write(const LogEntry& entry) override;
        void flush() override;

        void setShowThreadId(bool show) noexcept { _showThreadId = show; }
        void setShowLocation(bool show) noexcept { _showLocation = show; }

    private:
        std::ostream& _out;
        std::mutex _mutex;
        bool _useColor = false;
        bool _showThreadId = false;
        bool _showLocation = false;
    };

} // namespace Logging
} // namespace Core
} // namespace Palisade
