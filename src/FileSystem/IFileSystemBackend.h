/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file IFileSystemBackend.h
 * @brief Backend interface for FileService
 *
 * Implementations provide the synchronous filesystem primitives FileService
 * runs on its worker threads. Every method reports failure by throwing
 * std::filesystem::filesystem_error carrying the OS error code; FileService
 * maps and scrubs those before they reach a handle. Backends never see a
 * path that has not passed SecurityService.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "FileOperationHandle.h"

namespace Palisade::Core::IO {

class FileStream;

/**
 * @brief Options for opening streams
 * @param mode Access mode; Write creates or truncates
 * @param permissions Mode bits for files created by Write (umask applies)
 */
struct StreamOptions {
    enum Mode { Read, Write };
    Mode mode = Read;
    uint32_t permissions = 0644;
};

class IFileSystemBackend {
public:
    virtual ~IFileSystemBackend() = default;

    // Metadata operations
    virtual FileMetadata getMetadata(const std::filesystem::path& path) = 0;
    /// False when missing; throws when the answer cannot be determined (e.g. EACCES)
    virtual bool exists(const std::filesystem::path& path) = 0;

    // Whole-file operations
    virtual std::string readFile(const std::filesystem::path& path) = 0;
    virtual uint64_t writeFile(const std::filesystem::path& path, std::string_view data, uint32_t permissions) = 0;

    // Stream support
    virtual std::unique_ptr<FileStream> openStream(const std::filesystem::path& path, StreamOptions options) = 0;

    // Directory operations
    virtual void createDirectories(const std::filesystem::path& path, uint32_t permissions) = 0;
    /// Names of the immediate children, unsorted
    virtual std::vector<std::string> listDirectory(const std::filesystem::path& path) = 0;

    virtual void removeFile(const std::filesystem::path& path) = 0;
    virtual uintmax_t removeAll(const std::filesystem::path& path) = 0;

    virtual void copyFile(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          bool overwrite) = 0;

    virtual void setTimes(const std::filesystem::path& path,
                          std::optional<std::chrono::system_clock::time_point> accessed,
                          std::optional<std::chrono::system_clock::time_point> modified) = 0;

    // Backend info
    virtual std::string getBackendType() const = 0;
};

} // namespace Palisade::Core::IO
