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
 * @file Gateway.h
 * @brief Owns and wires every gateway service
 *
 * Services are plain members constructed in dependency order and handed to
 * each other by reference. start() brings them up in that order and stop()
 * tears them down in reverse, cancelling in-flight file operations first.
 *
 * @code
 * Palisade::Core::Gateway gateway(Palisade::Core::Config::Limits::fromEnvironment());
 * gateway.start();
 * auto handle = gateway.files().parseThemeFile("nord.txt");
 * handle.wait();
 * @endcode
 */

#include <filesystem>
#include <memory>
#include <optional>
#include "Concurrency/WorkService.h"
#include "Config/Limits.h"
#include "Core/TimerService.h"
#include "FileSystem/FileService.h"
#include "FileSystem/IFileSystemBackend.h"
#include "FileSystem/RecentFiles.h"
#include "Security/SecurityService.h"

namespace Palisade {
namespace Core {

    class Gateway {
    public:
        struct Options {
            std::shared_ptr<IO::IFileSystemBackend> backend;          ///< LocalFileSystemBackend when null
            std::optional<Security::PathValidator::Config> validator; ///< Overrides the safe roots
            std::optional<std::filesystem::path> recentFilesDirectory; ///< Defaults to the home directory
        };

        explicit Gateway(const Config::Limits& limits = Config::Limits::fromEnvironment());
        Gateway(const Config::Limits& limits, Options options);
        ~Gateway();

        Gateway(const Gateway&) = delete;
        Gateway& operator=(const Gateway&) = delete;

        void start();
        void stop();
        bool isRunning() const noexcept { return _running; }

        const Config::Limits& limits() const noexcept { return _limits; }
        Concurrency::WorkService& work() noexcept { return _work; }
        TimerService& timers() noexcept { return _timers; }
        Security::SecurityService& security() noexcept { return _security; }
        IO::FileService& files() noexcept { return _files; }
        IO::RecentFiles& recentFiles() noexcept { return _recent; }

    private:
        Config::Limits _limits;
        std::shared_ptr<IO::IFileSystemBackend> _backend;
        Concurrency::WorkService _work;
        TimerService _timers;
        Security::SecurityService _security;
        IO::FileService _files;
        IO::RecentFiles _recent;
        bool _running = false;
    };

} // namespace Core
} // namespace Palisade
