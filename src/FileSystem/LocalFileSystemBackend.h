/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once
#include <system_error>
#include "IFileSystemBackend.h"

namespace Palisade::Core::IO {

class LocalFileSystemBackend : public IFileSystemBackend {
public:
    LocalFileSystemBackend() = default;
    ~LocalFileSystemBackend() override = default;

    FileMetadata getMetadata(const std::filesystem::path& path) override;
    bool exists(const std::filesystem::path& path) override;

    std::string readFile(const std::filesystem::path& path) override;
    uint64_t writeFile(const std::filesystem::path& path, std::string_view data, uint32_t permissions) override;

    std::unique_ptr<FileStream> openStream(const std::filesystem::path& path, StreamOptions options) override;

    void createDirectories(const std::filesystem::path& path, uint32_t permissions) override;
    std::vector<std::string> listDirectory(const std::filesystem::path& path) override;

    void removeFile(const std::filesystem::path& path) override;
    uintmax_t removeAll(const std::filesystem::path& path) override;

    void copyFile(const std::filesystem::path& source,
                  const std::filesystem::path& destination,
                  bool overwrite) override;

    void setTimes(const std::filesystem::path& path,
                  std::optional<std::chrono::system_clock::time_point> accessed,
                  std::optional<std::chrono::system_clock::time_point> modified) override;

    std::string getBackendType() const override { return "LocalFileSystem"; }
};

// Map errno to FileError with platform-specific handling
FileError mapErrnoToFileError(int err) noexcept;

// Same mapping for a std::error_code from any filesystem call
FileError mapErrorCode(const std::error_code& ec) noexcept;

} // namespace Palisade::Core::IO
