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
 * @file ResourceLimiter.h
 * @brief Fixed-window operation quotas
 *
 * Each operation kind has a counter that grows as operations are tracked and
 * drops to zero when the window timer fires. This is a fixed window, not a
 * sliding one: a burst straddling a reset can reach twice the limit within
 * one interval, which is accepted behaviour.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include "Config/Limits.h"
#include "Core/Timer.h"

namespace Palisade::Core {
class TimerService;
}

namespace Palisade::Core::Security {

namespace ResourceKind {
    inline constexpr std::string_view FileReads = "fileReads";
    inline constexpr std::string_view FileWrites = "fileWrites";
    inline constexpr std::string_view ConcurrentOps = "concurrentOps";
}

class ResourceLimiter {
public:
    struct Stats {
        std::map<std::string, uint32_t> counters;   ///< Only kinds used in the current window
        std::map<std::string, uint32_t> limits;
        std::chrono::milliseconds resetInterval{0};
    };

    explicit ResourceLimiter(const Core::Config::ResourceLimits& limits);
    ~ResourceLimiter();

    ResourceLimiter(const ResourceLimiter&) = delete;
    ResourceLimiter& operator=(const ResourceLimiter&) = delete;

    /**
     * @brief Starts the repeating window reset on timers
     *
     * Calling it again replaces the previous window timer.
     */
    void startWindow(TimerService& timers);

    /**
     * @brief True while the counter for kind is below its limit
     *
     * Kinds without a configured limit are always permitted.
     */
    bool canPerform(std::string_view kind) const;

    /**
     * @brief Increments the counter for kind unconditionally
     *
     * Pair with canPerform(), or use tryAcquire() to do both atomically.
     */
    void track(std::string_view kind);

    /**
     * @brief canPerform() and track() under one lock
     */
    bool tryAcquire(std::string_view kind);

    /**
     * @brief Clears every counter, starting a new window
     */
    void reset();

    uint32_t count(std::string_view kind) const;
    Stats getStats() const;

    /**
     * @brief Stops the window timer and clears all counters; idempotent
     */
    void cleanup();

    bool isWindowActive() const;

private:
    // Counters live behind a shared_ptr so a reset already running on the
    // timer thread never touches a destroyed limiter
    struct Counters {
        std::mutex mutex;
        std::unordered_map<std::string, uint32_t> operations;
    };

    std::optional<uint32_t> limitFor(std::string_view kind) const;

    std::unordered_map<std::string, uint32_t> _limits;
    std::chrono::milliseconds _resetInterval;
    std::shared_ptr<Counters> _counters;

    mutable std::mutex _timerMutex;
    Timer _windowTimer;
};

} // namespace Palisade::Core::Security
