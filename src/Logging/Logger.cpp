/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>
#include "ConsoleSink.h"
#include "CoreCommon.h"

namespace Palisade {
namespace Core {
namespace Logging {

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off" || lowered == "none") return LogLevel::Off;
    return std::nullopt;
}

Logger& Logger::global() {
    static Logger* instance = [] {
        auto* logger = new Logger();
        logger->addSink(std::make_shared<ConsoleSink>());
        if (auto env = safeGetEnv("PALISADE_LOG_LEVEL")) {
            if (auto level = parseLogLevel(*env)) {
                logger->setMinLevel(*level);
            }
        }
        return logger;
    }();
    // Intentionally leaked so logging stays valid during static destruction
    return *instance;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::unique_lock lock(_sinksMutex);
    _sinks.push_back(std::move(sink));
}

bool Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::unique_lock lock(_sinksMutex);
    auto it = std::find(_sinks.begin(), _sinks.end(), sink);
    if (it == _sinks.end()) return false;
    _sinks.erase(it);
    return true;
}

void Logger::clearSinks() {
    std::unique_lock lock(_sinksMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::shared_lock lock(_sinksMutex);
    return _sinks.size();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message, LogLocation location) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);
    entry.threadId = std::this_thread::get_id();
    entry.location = location;

    std::shared_lock lock(_sinksMutex);
    for (const auto& sink : _sinks) {
        if (sink->shouldLog(level)) {
            sink->write(entry);
        }
    }
}

void Logger::flush() {
    std::shared_lock lock(_sinksMutex);
    for (const auto& sink : _sinks) {
        sink->flush();
    }
}

} // namespace Logging
} // namespace Core
} // namespace Palisade
