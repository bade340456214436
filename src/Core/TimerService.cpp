/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "TimerService.h"
#include "Logging/Logger.h"
#include <chrono>
#include <stdexcept>

namespace Palisade {
namespace Core {

TimerService::TimerService()
    : TimerService(Config{}) {
}

TimerService::TimerService(const Config& config)
    : _config(config) {
}

TimerService::~TimerService() {
    if (state() == ServiceState::Started) {
        stop();
    }
    if (_thread.joinable()) {
        _thread.join();
    }
}

void TimerService::start() {
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        if (_thread.joinable()) {
            return;
        }
        _stopRequested = false;
    }
    _thread = std::thread([this] { run(); });
    setState(ServiceState::Started);
}

void TimerService::stop() {
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        _stopRequested = true;
        // Pending timers never fire after stop
        _timers.clear();
    }
    _timersCV.notify_all();
    if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id()) {
        _thread.join();
    }
    setState(ServiceState::Stopped);
}

void TimerService::unload() {
    std::lock_guard<std::mutex> lock(_timersMutex);
    _timers.clear();
    setState(ServiceState::Unloaded);
}

Timer TimerService::scheduleTimer(std::chrono::steady_clock::duration interval,
                                  Timer::WorkFunction work,
                                  bool repeating) {
    if (state() != ServiceState::Started) {
        throw std::runtime_error("TimerService not started");
    }
    if (repeating && interval <= Timer::Duration::zero()) {
        throw std::invalid_argument("Repeating timers need a positive interval");
    }

    auto timerData = std::make_shared<TimerData>();
    timerData->fireTime = std::chrono::steady_clock::now() + interval;
    timerData->interval = interval;
    timerData->work = std::move(work);
    timerData->repeating = repeating;

    uint64_t timerId = 0;
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        timerId = _nextTimerId++;
        timerData->id = timerId;
        _timers[timerId] = timerData;
    }
    _timersCV.notify_all();

    return Timer(this, timerId, interval, repeating);
}

void TimerService::cancelTimer(uint64_t timerId) {
    std::shared_ptr<TimerData> removed;
    {
        std::lock_guard<std::mutex> lock(_timersMutex);
        auto it = _timers.find(timerId);
        if (it == _timers.end()) {
            return;
        }
        removed = std::move(it->second);
        _timers.erase(it);
    }
    _timersCV.notify_all();
    // removed (and any state captured by its work) is released here, outside the lock
}

size_t TimerService::getActiveTimerCount() const {
    std::lock_guard<std::mutex> lock(_timersMutex);
    return _timers.size();
}

void TimerService::run() {
    std::unique_lock<std::mutex> lock(_timersMutex);
    while (!_stopRequested) {
        // Find the earliest deadline
        std::shared_ptr<TimerData> next;
        for (const auto& [timerId, timerData] : _timers) {
            if (!next || timerData->fireTime < next->fireTime) {
                next = timerData;
            }
        }

        if (!next) {
            _timersCV.wait(lock, [this] { return _stopRequested || !_timers.empty(); });
            continue;
        }

        auto now = std::chrono::steady_clock::now();
        if (now < next->fireTime) {
            // Woken early by schedule/cancel/stop; loop re-evaluates the earliest deadline
            _timersCV.wait_until(lock, next->fireTime);
            continue;
        }

        Timer::WorkFunction work = next->work;
        if (next->repeating) {
            do {
                next->fireTime += next->interval;
            } while (next->fireTime <= now);
        } else {
            _timers.erase(next->id);
        }

        lock.unlock();
        auto started = std::chrono::steady_clock::now();
        try {
            if (work) {
                work();
            }
        } catch (const std::exception& e) {
            PALISADE_LOG_ERROR_CAT("TimerService", std::string("Timer work threw: ") + e.what());
        }
        if (_config.logSlowTimers) {
            auto elapsed = std::chrono::steady_clock::now() - started;
            if (elapsed > _config.slowTimerThreshold) {
                PALISADE_LOG_WARNING_CAT("TimerService", "Timer work took " +
                    std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()) + "ms");
            }
        }
        // Drop our copy of the work before retaking the lock
        work = nullptr;
        lock.lock();
    }
}

} // namespace Core
} // namespace Palisade
