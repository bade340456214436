/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "Timer.h"

#include <utility>

#include "TimerService.h"

namespace Palisade::Core {

Timer::Timer(TimerService* service, uint64_t timerId, Duration interval, bool repeating)
    : _service(service), _timerId(timerId), _interval(interval), _repeating(repeating), _valid(true) {}

Timer::Timer(Timer&& other) noexcept {
    adopt(other);
}

Timer& Timer::operator=(Timer&& other) noexcept {
    if (this != &other) {
        invalidate();
        adopt(other);
    }
    return *this;
}

Timer::~Timer() {
    invalidate();
}

// Leaves other inert; its schedule now belongs to this handle
void Timer::adopt(Timer& other) noexcept {
    _service = std::exchange(other._service, nullptr);
    _timerId = std::exchange(other._timerId, 0);
    _interval = other._interval;
    _repeating = other._repeating;
    _valid.store(other._valid.exchange(false, std::memory_order_acq_rel), std::memory_order_release);
}

void Timer::invalidate() {
    // Only the caller that flips _valid talks to the service
    if (!_valid.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    if (auto* service = std::exchange(_service, nullptr)) {
        service->cancelTimer(_timerId);
    }
}

bool Timer::isValid() const {
    return _valid.load(std::memory_order_acquire);
}

} // namespace Palisade::Core
