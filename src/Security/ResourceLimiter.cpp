/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "ResourceLimiter.h"

#include "Core/TimerService.h"
#include "Logging/Logger.h"

namespace Palisade::Core::Security {

namespace {
    void clearCounters(std::mutex& mutex, std::unordered_map<std::string, uint32_t>& operations) {
        std::lock_guard<std::mutex> lock(mutex);
        operations.clear();
    }
}

ResourceLimiter::ResourceLimiter(const Core::Config::ResourceLimits& limits)
    : _resetInterval(limits.resetInterval)
    , _counters(std::make_shared<Counters>()) {
    _limits.emplace(std::string(ResourceKind::FileReads), limits.maxFileReads);
    _limits.emplace(std::string(ResourceKind::FileWrites), limits.maxFileWrites);
    _limits.emplace(std::string(ResourceKind::ConcurrentOps), limits.maxConcurrentOps);
}

ResourceLimiter::~ResourceLimiter() {
    cleanup();
}

void ResourceLimiter::startWindow(TimerService& timers) {
    std::weak_ptr<Counters> weakCounters = _counters;
    auto timer = timers.scheduleTimer(_resetInterval, [weakCounters] {
        if (auto counters = weakCounters.lock()) {
            clearCounters(counters->mutex, counters->operations);
            PALISADE_LOG_DEBUG_CAT("ResourceLimiter", "Operation window reset");
        }
    }, true);

    std::lock_guard<std::mutex> lock(_timerMutex);
    _windowTimer = std::move(timer);
}

std::optional<uint32_t> ResourceLimiter::limitFor(std::string_view kind) const {
    auto it = _limits.find(std::string(kind));
    if (it == _limits.end()) return std::nullopt;
    return it->second;
}

bool ResourceLimiter::canPerform(std::string_view kind) const {
    auto limit = limitFor(kind);
    if (!limit) return true;
    std::lock_guard<std::mutex> lock(_counters->mutex);
    auto it = _counters->operations.find(std::string(kind));
    const uint32_t current = it == _counters->operations.end() ? 0 : it->second;
    return current < *limit;
}

void ResourceLimiter::track(std::string_view kind) {
    std::lock_guard<std::mutex> lock(_counters->mutex);
    ++_counters->operations[std::string(kind)];
}

bool ResourceLimiter::tryAcquire(std::string_view kind) {
    auto limit = limitFor(kind);
    std::lock_guard<std::mutex> lock(_counters->mutex);
    auto& current = _counters->operations[std::string(kind)];
    if (limit && current >= *limit) {
        return false;
    }
    ++current;
    return true;
}

void ResourceLimiter::reset() {
    clearCounters(_counters->mutex, _counters->operations);
}

uint32_t ResourceLimiter::count(std::string_view kind) const {
    std::lock_guard<std::mutex> lock(_counters->mutex);
    auto it = _counters->operations.find(std::string(kind));
    return it == _counters->operations.end() ? 0 : it->second;
}

ResourceLimiter::Stats ResourceLimiter::getStats() const {
    Stats stats;
    stats.resetInterval = _resetInterval;
    for (const auto& [kind, limit] : _limits) {
        stats.limits.emplace(kind, limit);
    }
    std::lock_guard<std::mutex> lock(_counters->mutex);
    for (const auto& [kind, value] : _counters->operations) {
        if (value > 0) stats.counters.emplace(kind, value);
    }
    return stats;
}

void ResourceLimiter::cleanup() {
    Timer timer;
    {
        std::lock_guard<std::mutex> lock(_timerMutex);
        timer = std::move(_windowTimer);
    }
    timer.invalidate();
    reset();
}

bool ResourceLimiter::isWindowActive() const {
    std::lock_guard<std::mutex> lock(_timerMutex);
    return _windowTimer.isValid();
}

} // namespace Palisade::Core::Security
