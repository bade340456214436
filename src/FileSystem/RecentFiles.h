/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file RecentFiles.h
 * @brief Small persisted list of recently used theme files
 *
 * Stored as a JSON array of {path, name, lastUsed} objects in
 * ".vscode-theme-generator-recent.json" under the user's home directory
 * (falling back to the working directory), readable by the owner only.
 * Persistence problems are logged and never thrown: losing the list is
 * not worth failing the caller over.
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Palisade::Core::Security {
class InputSanitizer;
}

namespace Palisade::Core::IO {

class IFileSystemBackend;

struct RecentFile {
    std::string path;       ///< Absolute path
    std::string name;       ///< Sanitized theme name
    std::string lastUsed;   ///< ISO-8601 UTC timestamp
};

class RecentFiles {
public:
    static constexpr std::string_view FileName = ".vscode-theme-generator-recent.json";

    RecentFiles(std::shared_ptr<IFileSystemBackend> backend,
                const Security::InputSanitizer& sanitizer,
                uint32_t maxEntries,
                std::optional<std::filesystem::path> directory = std::nullopt);

    std::filesystem::path storagePath() const { return _directory / std::string(FileName); }

    /// Entries whose file still exists; malformed entries are dropped
    std::vector<RecentFile> list() const;

    /**
     * @brief Moves path to the front of the list
     *
     * The path is resolved against the working directory and must exist.
     * Duplicates collapse onto the new entry and the list is cut to the
     * configured maximum.
     * @return false when nothing was recorded (the reason is logged)
     */
    bool add(std::string_view path, std::string_view themeName);

    /// Replaces the list with an empty one if the file exists
    bool clear();

private:
    bool persist(const std::string& contents) const;

    std::shared_ptr<IFileSystemBackend> _backend;
    const Security::InputSanitizer& _sanitizer;
    uint32_t _maxEntries;
    std::filesystem::path _directory;
};

} // namespace Palisade::Core::IO
