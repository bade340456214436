/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "WorkService.h"
#include "Logging/Logger.h"
#include <algorithm>
#include <exception>

namespace Palisade {
namespace Core {
namespace Concurrency {

WorkService::WorkService(const Config& config)
    : _config(config) {
    _threadCount = config.threadCount;
    if (_threadCount == 0) {
        _threadCount = std::max(1u, std::thread::hardware_concurrency());
    }
}

WorkService::~WorkService() {
    stop();
}

void WorkService::start() {
    std::lock_guard<std::mutex> lock(_queueMutex);
    if (!_threads.empty()) {
        return;
    }
    _stopRequested = false;
    _accepting = true;
    _threads.reserve(_threadCount);
    for (size_t i = 0; i < _threadCount; ++i) {
        _threads.emplace_back([this] { workerLoop(); });
    }
    setState(ServiceState::Started);
    PALISADE_LOG_DEBUG_CAT("WorkService", "Started with " + std::to_string(_threadCount) + " threads");
}

void WorkService::stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        if (_threads.empty()) {
            return;
        }
        _accepting = false;
        _stopRequested = true;
        threads.swap(_threads);
    }
    _queueCV.notify_all();
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
    setState(ServiceState::Stopped);
}

bool WorkService::submit(std::function<void()> work) {
    if (!work) return false;
    {
        std::lock_guard<std::mutex> lock(_queueMutex);
        if (!_accepting) {
            return false;
        }
        if (_config.maxQueueDepth != 0 && _queue.size() >= _config.maxQueueDepth) {
            return false;
        }
        _queue.push_back(std::move(work));
    }
    _queueCV.notify_one();
    return true;
}

size_t WorkService::pendingCount() const {
    std::lock_guard<std::mutex> lock(_queueMutex);
    return _queue.size();
}

void WorkService::workerLoop() {
    for (;;) {
        std::function<void()> work;
        {
            std::unique_lock<std::mutex> lock(_queueMutex);
            _queueCV.wait(lock, [this] { return _stopRequested || !_queue.empty(); });
            if (_queue.empty()) {
                // Stop requested and the queue has drained
                return;
            }
            work = std::move(_queue.front());
            _queue.pop_front();
        }
        try {
            work();
        } catch (const std::exception& e) {
            PALISADE_LOG_ERROR_CAT("WorkService", std::string("Work item threw: ") + e.what());
        }
    }
}

} // namespace Concurrency
} // namespace Core
} // namespace Palisade
