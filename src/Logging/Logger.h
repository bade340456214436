/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * The Logger fans each entry out to every registered sink. A global instance
 * is created lazily with a ConsoleSink attached; its minimum level honours
 * the PALISADE_LOG_LEVEL environment variable. Components log through the
 * PALISADE_LOG_* macros, which skip message construction entirely when the
 * level is filtered out.
 *
 * @code
 * PALISADE_LOG_INFO("Gateway started");
 * PALISADE_LOG_WARNING_CAT("FileService", "Skipping inaccessible item: " + name);
 * @endcode
 */

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>
#include "ILogSink.h"

namespace Palisade {
namespace Core {
namespace Logging {

    class Logger {
    public:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        /**
         * @brief The shared logger used by the PALISADE_LOG_* macros
         */
        static Logger& global();

        void addSink(std::shared_ptr<ILogSink> sink);
        bool removeSink(const std::shared_ptr<ILogSink>& sink);
        void clearSinks();
        size_t sinkCount() const;

        void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
        LogLevel minLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }
        bool isEnabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= minLevel();
        }

        void log(LogLevel level, std::string_view category, std::string_view message,
                 LogLocation location = {});

        // Convenience wrappers
        void trace(std::string_view category, std::string_view message) { log(LogLevel::Trace, category, message); }
        void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
        void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
        void warning(std::string_view category, std::string_view message) { log(LogLevel::Warning, category, message); }
        void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }
        void fatal(std::string_view category, std::string_view message) { log(LogLevel::Fatal, category, message); }

        void flush();

    private:
        mutable std::shared_mutex _sinksMutex;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
        std::atomic<LogLevel> _minLevel{LogLevel::Info};
    };

} // namespace Logging
} // namespace Core
} // namespace Palisade

#define PALISADE_LOG_AT(level, category, message)                                                   \
    do {                                                                                            \
        auto& palisadeLogger_ = ::Palisade::Core::Logging::Logger::global();                        \
        if (palisadeLogger_.isEnabled(level)) {                                                     \
            palisadeLogger_.log((level), (category), (message),                                     \
                                ::Palisade::Core::Logging::LogLocation{__FILE__, __LINE__, __func__}); \
        }                                                                                           \
    } while (0)

#define PALISADE_LOG_TRACE(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Trace, __func__, message)
#define PALISADE_LOG_DEBUG(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Debug, __func__, message)
#define PALISADE_LOG_INFO(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Info, __func__, message)
#define PALISADE_LOG_WARNING(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Warning, __func__, message)
#define PALISADE_LOG_ERROR(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Error, __func__, message)
#define PALISADE_LOG_FATAL(message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Fatal, __func__, message)

#define PALISADE_LOG_TRACE_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Trace, cat, message)
#define PALISADE_LOG_DEBUG_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Debug, cat, message)
#define PALISADE_LOG_INFO_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Info, cat, message)
#define PALISADE_LOG_WARNING_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Warning, cat, message)
#define PALISADE_LOG_ERROR_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Error, cat, message)
#define PALISADE_LOG_FATAL_CAT(cat, message) PALISADE_LOG_AT(::Palisade::Core::Logging::LogLevel::Fatal, cat, message)
