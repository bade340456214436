/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file Timer.h
 * @brief RAII handle for work scheduled on the TimerService
 *
 * Timers back two things in the gateway: the per-operation timeout that
 * races every file operation, and the repeating window reset of the
 * ResourceLimiter.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace Palisade {
namespace Core {

// Forward declaration
class TimerService;

/**
 * @brief A scheduled task that executes after a delay, optionally repeating
 *
 * Timers are one-shot (fire once) or repeating (fire at intervals). The
 * handle owns the schedule: destroying or invalidating it cancels any
 * future firing. A firing already in progress is not interrupted.
 *
 * @code
 * // Operation timeout
 * auto timeout = timerService.scheduleTimer(
 *     std::chrono::milliseconds(30000),
 *     [state] { state->settleTimedOut(); }
 * );
 *
 * // Fixed-window counter reset
 * auto window = timerService.scheduleTimer(
 *     std::chrono::hours(1),
 *     [this] { reset(); },
 *     true  // Repeating
 * );
 *
 * window.invalidate();  // No further resets
 * @endcode
 */
class Timer {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;
    using WorkFunction = std::function<void()>;

    /**
     * @brief Creates an invalid timer (no-op)
     *
     * Use TimerService::scheduleTimer() to create active timers.
     */
    Timer() = default;

    /**
     * @brief Move constructor - the moved-from timer becomes invalid
     */
    Timer(Timer&& other) noexcept;

    /**
     * @brief Move assignment - invalidates the current timer first
     */
    Timer& operator=(Timer&& other) noexcept;

    /**
     * @brief Cancels the timer if still valid
     */
    ~Timer();

    // No copying - timers have unique ownership
    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    /**
     * @brief Cancels the timer and prevents future executions
     *
     * Thread-safe and idempotent. Safe to call from inside the timer's own
     * work function.
     */
    void invalidate();

    /**
     * @brief True until invalidate() is called or the handle is moved from
     */
    bool isValid() const;

    Duration getInterval() const { return _interval; }
    bool isRepeating() const { return _repeating; }

private:
    // Only TimerService can create active timers
    friend class TimerService;

    Timer(TimerService* service, uint64_t timerId, Duration interval, bool repeating);

    void adopt(Timer& other) noexcept;

    TimerService* _service = nullptr;
    uint64_t _timerId = 0;
    Duration _interval{};
    bool _repeating = false;
    std::atomic<bool> _valid{false};
};

} // namespace Core
} // namespace Palisade
