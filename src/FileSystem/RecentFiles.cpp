/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "RecentFiles.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <json/json.h>
#include "CoreCommon.h"
#include "Core/Errors.h"
#include "IFileSystemBackend.h"
#include "Logging/Logger.h"
#include "Security/InputSanitizer.h"

namespace fs = std::filesystem;

namespace Palisade::Core::IO {

namespace {
    constexpr uint32_t PrivateFileMode = 0600;

    fs::path defaultDirectory() {
        if (auto home = homeDirectory()) {
            return fs::path(*home);
        }
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        return ec ? fs::path(".") : cwd;
    }

    std::string isoTimestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
        gmtime_r(&secs, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis));
        return out;
    }

    std::string serialize(const std::vector<RecentFile>& files) {
        Json::Value array(Json::arrayValue);
        for (const auto& file : files) {
            Json::Value entry(Json::objectValue);
            entry["path"] = file.path;
            entry["name"] = file.name;
            entry["lastUsed"] = file.lastUsed;
            array.append(entry);
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        return Json::writeString(builder, array);
    }
}

RecentFiles::RecentFiles(std::shared_ptr<IFileSystemBackend> backend,
                         const Security::InputSanitizer& sanitizer,
                         uint32_t maxEntries,
                         std::optional<fs::path> directory)
    : _backend(std::move(backend))
    , _sanitizer(sanitizer)
    , _maxEntries(maxEntries)
    , _directory(directory ? *directory : defaultDirectory()) {
}

std::vector<RecentFile> RecentFiles::list() const {
    std::vector<RecentFile> files;
    const auto storage = storagePath();

    std::string content;
    try {
        if (!_backend->exists(storage)) {
            return files;
        }
        content = _backend->readFile(storage);
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT("RecentFiles", std::string("Failed to read recent files: ") + e.code().message());
        return files;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(content.data(), content.data() + content.size(), &root, &errors) || !root.isArray()) {
        PALISADE_LOG_DEBUG_CAT("RecentFiles", "Ignoring malformed recent files list");
        return files;
    }

    for (const auto& entry : root) {
        if (!entry.isObject() || !entry["path"].isString() || !entry["name"].isString() ||
            !entry["lastUsed"].isString()) {
            continue;
        }
        std::error_code ec;
        const auto resolved = fs::absolute(fs::path(entry["path"].asString()), ec).lexically_normal();
        if (ec) {
            continue;
        }
        try {
            if (!_backend->exists(resolved)) {
                continue;
            }
        } catch (const fs::filesystem_error&) {
            continue;
        }
        files.push_back({resolved.string(), entry["name"].asString(), entry["lastUsed"].asString()});
    }
    return files;
}

bool RecentFiles::add(std::string_view path, std::string_view themeName) {
    try {
        if (path.empty()) {
            throw ValidationError("Invalid input parameters for recent file");
        }
        const auto resolved = fs::absolute(fs::path(std::string(path))).lexically_normal();
        if (!_backend->exists(resolved)) {
            throw FileProcessingError("File not found when adding to recent files");
        }

        RecentFile entry{resolved.string(), _sanitizer.sanitizeName(themeName), isoTimestamp()};

        auto files = list();
        std::vector<RecentFile> updated;
        updated.reserve(files.size() + 1);
        updated.push_back(std::move(entry));
        for (auto& file : files) {
            if (file.path != updated.front().path) {
                updated.push_back(std::move(file));
            }
        }
        if (updated.size() > _maxEntries) {
            updated.resize(_maxEntries);
        }
        return persist(serialize(updated));
    } catch (const PalisadeError& e) {
        PALISADE_LOG_WARNING_CAT("RecentFiles", std::string("Failed to add recent file: ") + e.what());
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT("RecentFiles", std::string("Failed to add recent file: ") + e.code().message());
    }
    return false;
}

bool RecentFiles::clear() {
    try {
        if (!_backend->exists(storagePath())) {
            return true;
        }
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT("RecentFiles", std::string("Failed to clear recent files: ") + e.code().message());
        return false;
    }
    return persist("[]");
}

bool RecentFiles::persist(const std::string& contents) const {
    const auto storage = storagePath();
    try {
        _backend->writeFile(storage, contents, PrivateFileMode);
        // Creation mode is ignored for a file that already existed
        fs::permissions(storage, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
        return true;
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT("RecentFiles", std::string("Failed to save recent files: ") + e.code().message());
        return false;
    }
}

} // namespace Palisade::Core::IO
