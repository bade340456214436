/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file WorkService.h
 * @brief Fixed-size worker pool that executes gateway operations
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "../Core/PalisadeService.h"

namespace Palisade {
namespace Core {
namespace Concurrency {

    /**
     * @brief Executes submitted work on a pool of background threads
     *
     * The pool size bounds how many file operations run at once; work beyond
     * that queues in FIFO order. stop() stops accepting work, lets queued
     * work drain, then joins every thread.
     *
     * @code
     * WorkService::Config config;
     * config.threadCount = 4;
     * WorkService work(config);
     * work.start();
     * work.submit([] { doSomething(); });
     * work.stop();
     * @endcode
     */
    class WorkService : public PalisadeService {
    public:
        struct Config {
            size_t threadCount = 0;     ///< 0 selects std::thread::hardware_concurrency()
            size_t maxQueueDepth = 0;   ///< 0 means unbounded
        };

        explicit WorkService(const Config& config);
        ~WorkService() override;

        WorkService(const WorkService&) = delete;
        WorkService& operator=(const WorkService&) = delete;

        const char* id() const override { return "com.palisade.core.work"; }
        const char* name() const override { return "WorkService"; }

        void start() override;
        void stop() override;

        /**
         * @brief Queues work for execution
         *
         * @return false if the service is not running or the queue is full
         */
        bool submit(std::function<void()> work);

        size_t threadCount() const noexcept { return _threadCount; }
        size_t pendingCount() const;

    private:
        void workerLoop();

        Config _config;
        size_t _threadCount = 0;
        mutable std::mutex _queueMutex;
        std::condition_variable _queueCV;
        std::deque<std::function<void()>> _queue;
        std::vector<std::thread> _threads;
        bool _accepting = false;
        bool _stopRequested = false;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Palisade
