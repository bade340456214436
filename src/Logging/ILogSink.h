/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

#include <atomic>
#include "LogEntry.h"

namespace Palisade {
namespace Core {
namespace Logging {

    /**
     * @brief Destination for log entries
     *
     * Sinks may be called concurrently from any thread; implementations are
     * responsible for their own synchronization. Each sink carries its own
     * minimum level on top of the Logger's global one.
     */
    class ILogSink {
    public:
        virtual ~ILogSink() = default;

        virtual void write(const LogEntry& entry) = 0;
        virtual void flush() = 0;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool shouldLog(LogLevel level) const noexcept { return level >= minLevel() && level != LogLevel::Off; }

    private:
        std::atomic<LogLevel> _minLevel{LogLevel::Trace};
    };

} // namespace Logging
} // namespace Core
} // namespace Palisade
