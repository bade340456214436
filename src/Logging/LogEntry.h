/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>
#include "LogLevel.h"

namespace Palisade {
namespace Core {
namespace Logging {

    /**
     * @brief Source location captured by the logging macros
     */
    struct LogLocation {
        const char* file = "";
        int line = 0;
        const char* function = "";
    };

    /**
     * @brief A single formatted record handed to every sink
     *
     * Entries are built once by the Logger and passed by const reference, so
     * sinks must copy anything they want to keep past write().
     */
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::Info;
        std::string category;
        std::string message;
        std::thread::id threadId;
        LogLocation location;
    };

} // namespace Logging
} // namespace Core
} // namespace Palisade
