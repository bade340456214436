/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "Gateway.h"
#include "FileSystem/LocalFileSystemBackend.h"
#include "Logging/Logger.h"

namespace Palisade {
namespace Core {

    namespace {
        std::shared_ptr<IO::IFileSystemBackend> backendOrLocal(std::shared_ptr<IO::IFileSystemBackend> backend) {
            return backend ? std::move(backend) : std::make_shared<IO::LocalFileSystemBackend>();
        }
    }

    Gateway::Gateway(const Config::Limits& limits)
        : Gateway(limits, Options{}) {
    }

    Gateway::Gateway(const Config::Limits& limits, Options options)
        : _limits(limits)
        , _backend(backendOrLocal(std::move(options.backend)))
        , _work(Concurrency::WorkService::Config{limits.resource.maxConcurrentOps, 0})
        , _timers()
        , _security(limits, _timers, options.validator.value_or(Security::PathValidator::Config{}))
        , _files(_security, _work, _timers, _limits, _backend)
        , _recent(_backend, _security.sanitizer(), limits.ui.maxRecentFiles, options.recentFilesDirectory) {
    }

    Gateway::~Gateway() {
        stop();
    }

    void Gateway::start() {
        if (_running) return;
        _work.start();
        _timers.load();
        _timers.start();
        _security.start();
        _files.start();
        _running = true;
        PALISADE_LOG_INFO_CAT("Gateway", "Gateway started with " + std::to_string(_work.threadCount()) +
                                         " worker thread(s) on " + _backend->getBackendType());
    }

    void Gateway::stop() {
        if (!_running) return;
        _files.stop();
        _security.stop();
        _timers.stop();
        _work.stop();
        _running = false;
        PALISADE_LOG_INFO_CAT("Gateway", "Gateway stopped");
    }

} // namespace Core
} // namespace Palisade
