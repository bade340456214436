/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "Limits.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "CoreCommon.h"

namespace Palisade {
namespace Core {
namespace Config {

namespace {
    template <typename T>
    T clampValue(T value, T lo, T hi) {
        return std::max(lo, std::min(hi, value));
    }

    std::optional<std::string_view> envView(const char* name, std::optional<std::string>& storage) {
        storage = safeGetEnv(name);
        if (!storage) return std::nullopt;
        return std::string_view(*storage);
    }

    std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    uint64_t envBytes(const char* name, uint64_t fallback, uint64_t lo, uint64_t hi) {
        std::optional<std::string> storage;
        return clampValue(parseEnvBytes(envView(name, storage), fallback), lo, hi);
    }

    int64_t envNumber(const char* name, int64_t fallback, int64_t lo, int64_t hi) {
        std::optional<std::string> storage;
        return clampValue(parseEnvNumber(envView(name, storage), fallback), lo, hi);
    }
}

int64_t parseEnvNumber(std::optional<std::string_view> text, int64_t fallback) noexcept {
    if (!text) return fallback;
    auto s = trim(*text);
    if (s.empty()) return fallback;
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr == s.data()) return fallback;
    return value;
}

uint64_t parseEnvBytes(std::optional<std::string_view> text, uint64_t fallback) noexcept {
    if (!text) return fallback;
    auto s = trim(*text);
    if (s.empty()) return fallback;

    // Number part: digits with an optional fractional part
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0) return fallback;
    size_t numberEnd = i;
    if (i < s.size() && s[i] == '.') {
        size_t fracStart = ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == fracStart) return fallback;
        numberEnd = i;
    }

    double value = 0.0;
    {
        std::string number(s.substr(0, numberEnd));
        std::istringstream iss(number);
        iss.imbue(std::locale::classic());
        if (!(iss >> value)) return fallback;
    }

    auto unit = trim(s.substr(numberEnd));
    std::string upper;
    for (char c : unit) upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

    double scale = 1.0;
    if (upper.empty()) scale = 1.0;
    else if (upper == "K" || upper == "KB") scale = static_cast<double>(KiB);
    else if (upper == "M" || upper == "MB") scale = static_cast<double>(MiB);
    else if (upper == "G" || upper == "GB") scale = static_cast<double>(GiB);
    else return fallback;

    return static_cast<uint64_t>(std::floor(value * scale));
}

std::vector<std::string> parseEnvList(std::string_view text) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string_view::npos) comma = text.size();
        auto item = trim(text.substr(start, comma - start));
        if (!item.empty()) items.emplace_back(item);
        start = comma + 1;
    }
    return items;
}

std::string formatBytes(uint64_t bytes) {
    if (bytes == 0) return "0 Bytes";
    static const char* units[] = {"Bytes", "KB", "MB", "GB"};
    size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }
    double rounded = std::round(value * 10.0) / 10.0;
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    if (rounded == std::floor(rounded)) {
        oss << static_cast<uint64_t>(rounded);
    } else {
        oss << std::fixed << std::setprecision(1) << rounded;
    }
    oss << ' ' << units[unit];
    return oss.str();
}

Limits Limits::fromEnvironment() {
    Limits l;

    l.file.maxSize = envBytes("THEME_MAX_FILE_SIZE", l.file.maxSize, 1 * KiB, 100 * MiB);
    l.file.streamingMaxSize = envBytes("THEME_STREAMING_SIZE", l.file.streamingMaxSize, 1 * MiB, 1 * GiB);
    l.file.streamingThreshold = envBytes("THEME_STREAMING_THRESHOLD", l.file.streamingThreshold, 1 * MiB, 100 * MiB);
    l.file.maxLines = static_cast<uint64_t>(envNumber("THEME_MAX_LINES", 10000, 100, 1000000));
    l.file.maxConfigLines = static_cast<uint64_t>(envNumber("THEME_MAX_CONFIG_LINES", 1000, 10, 10000));
    l.file.streamChunkSize = envBytes("THEME_STREAM_CHUNK_SIZE", l.file.streamChunkSize, 1 * KiB, 1 * MiB);
    l.file.progressInterval = envBytes("THEME_PROGRESS_INTERVAL", l.file.progressInterval, 64 * KiB, 10 * MiB);

    l.security.maxInputLength = static_cast<size_t>(envNumber("THEME_MAX_INPUT_LENGTH", 1000, 10, 10000));
    l.security.maxKeyLength = static_cast<size_t>(envNumber("THEME_MAX_KEY_LENGTH", 100, 5, 500));
    l.security.maxValueLength = static_cast<size_t>(envNumber("THEME_MAX_VALUE_LENGTH", 500, 5, 2000));
    l.security.maxThemeNameLength = static_cast<size_t>(envNumber("THEME_MAX_NAME_LENGTH", 100, 5, 200));
    l.security.maxDescriptionLength = static_cast<size_t>(envNumber("THEME_MAX_DESCRIPTION_LENGTH", 500, 10, 2000));
    l.security.maxPublisherLength = static_cast<size_t>(envNumber("THEME_MAX_PUBLISHER_LENGTH", 100, 3, 200));
    l.security.maxPathLength = static_cast<size_t>(envNumber("THEME_MAX_PATH_LENGTH", 500, 50, 4096));
    if (auto exts = safeGetEnv("THEME_ALLOWED_EXTENSIONS")) {
        auto parsed = parseEnvList(*exts);
        if (!parsed.empty()) l.security.allowedExtensions = std::move(parsed);
    }

    l.resource.maxConcurrentOps = static_cast<uint32_t>(envNumber("THEME_MAX_CONCURRENT_OPS", 10, 1, 100));
    l.resource.maxFileReads = static_cast<uint32_t>(envNumber("THEME_MAX_FILE_READS", 100, 10, 1000));
    l.resource.maxFileWrites = static_cast<uint32_t>(envNumber("THEME_MAX_FILE_WRITES", 50, 5, 500));
    l.resource.resetInterval = std::chrono::milliseconds(
        envNumber("THEME_RESOURCE_RESET_INTERVAL", 3600000, 300000, 86400000));

    l.performance.operationTimeout = std::chrono::milliseconds(
        envNumber("THEME_OPERATION_TIMEOUT", 30000, 5000, 300000));
    l.performance.extendedTimeout = std::chrono::milliseconds(
        envNumber("THEME_EXTENDED_TIMEOUT", 60000, 10000, 600000));

    l.ui.maxRecentFiles = static_cast<uint32_t>(envNumber("THEME_MAX_RECENT_FILES", 10, 3, 50));

    if (auto v = safeGetEnv("THEME_DEFAULT_VERSION"); v && !v->empty()) l.defaults.themeVersion = *v;
    if (auto v = safeGetEnv("THEME_DEFAULT_LICENSE"); v && !v->empty()) l.defaults.license = *v;

    return l;
}

} // namespace Config
} // namespace Core
} // namespace Palisade
