/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace Palisade {
namespace Core {
namespace Logging {

namespace {
    bool stderrIsTerminal() {
#if defined(__unix__) || defined(__APPLE__)
        return ::isatty(STDERR_FILENO) != 0;
#else
        return false;
#endif
    }

    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Info:    return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:   return "\033[31m";
            case LogLevel::Fatal:   return "\033[1;31m";
            case LogLevel::Off:     return "";
        }
        return "";
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
        return oss.str();
    }
}

ConsoleSink::ConsoleSink()
    : _out(std::cerr)
    , _useColor(stderrIsTerminal()) {
}

ConsoleSink::ConsoleSink(std::ostream& out, bool useColor)
    : _out(out)
    , _useColor(useColor) {
}

void ConsoleSink::write(const LogEntry& entry) {
    if (!shouldLog(entry.level)) return;

    // Format outside the lock; only the stream write is serialized
    std::ostringstream line;
    line << '[' << formatTimestamp(entry.timestamp) << "] ";
    if (_useColor) line << colorFor(entry.level);
    line << '[' << toString(entry.level) << ']';
    if (_useColor) line << "\033[0m";
    if (!entry.category.empty()) line << " [" << entry.category << ']';
    if (_showThreadId) line << " [tid " << entry.threadId << ']';
    line << ' ' << entry.message;
    if (_showLocation && entry.location.file && *entry.location.file) {
        line << " (" << entry.location.file << ':' << entry.location.line << ')';
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(_mutex);
    _out << line.str();
    if (entry.level >= LogLevel::Error) {
        _out.flush();
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(_mutex);
    _out.flush();
}

} // namespace Logging
} // namespace Core
} // namespace Palisade
