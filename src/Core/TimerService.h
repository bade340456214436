/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file TimerService.h
 * @brief Service that fires delayed and repeating work on a scheduler thread
 */

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include "PalisadeService.h"
#include "Timer.h"

namespace Palisade {
namespace Core {

/**
 * @brief Runs Timer work on a single dedicated scheduler thread
 *
 * The thread sleeps until the earliest deadline (or until a new timer is
 * scheduled) with no busy waiting. Work runs on the scheduler thread with no
 * lock held, so it may schedule or cancel timers itself. Keep timer work
 * short: a slow callback delays every other timer.
 *
 * Repeating timers track absolute deadlines and skip missed intervals rather
 * than firing in rapid catch-up.
 *
 * @code
 * TimerService timers;
 * timers.load();
 * timers.start();
 * auto t = timers.scheduleTimer(std::chrono::milliseconds(100), [] { onTick(); }, true);
 * ...
 * timers.stop();
 * @endcode
 */
class TimerService : public PalisadeService {
public:
    struct Config {
        bool logSlowTimers = true;                                 ///< Warn when timer work overruns
        std::chrono::milliseconds slowTimerThreshold{250};
    };

    TimerService();
    explicit TimerService(const Config& config);
    ~TimerService() override;

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    // PalisadeService interface
    const char* id() const override { return "com.palisade.core.timers"; }
    const char* name() const override { return "TimerService"; }

    void start() override;
    void stop() override;
    void unload() override;

    /**
     * @brief Schedules work to run after interval, optionally repeating
     *
     * @throws std::runtime_error if the service is not started
     */
    Timer scheduleTimer(std::chrono::steady_clock::duration interval,
                        Timer::WorkFunction work,
                        bool repeating = false);

    /**
     * @brief Prevents a scheduled timer from firing again
     *
     * Called by Timer::invalidate(); unknown ids are ignored.
     */
    void cancelTimer(uint64_t timerId);

    /**
     * @brief Number of timers still waiting to fire
     */
    size_t getActiveTimerCount() const;

private:
    struct TimerData {
        uint64_t id = 0;
        Timer::TimePoint fireTime;
        Timer::Duration interval{};
        Timer::WorkFunction work;
        bool repeating = false;
    };

    void run();

    Config _config;
    mutable std::mutex _timersMutex;
    std::condition_variable _timersCV;
    std::unordered_map<uint64_t, std::shared_ptr<TimerData>> _timers;
    uint64_t _nextTimerId = 1;
    bool _stopRequested = false;
    std::thread _thread;
};

} // namespace Core
} // namespace Palisade
