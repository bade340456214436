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
 * @file Limits.h
 * @brief Tunable limits for the filesystem gateway
 *
 * Every limit has a default, a permitted range, and an optional THEME_*
 * environment override. Limits::fromEnvironment() reads the overrides and
 * clamps each value into its range; values set directly in code (tests,
 * embedding applications) are taken as-is.
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Palisade {
namespace Core {
namespace Config {

    constexpr uint64_t KiB = 1024ULL;
    constexpr uint64_t MiB = 1024ULL * KiB;
    constexpr uint64_t GiB = 1024ULL * MiB;

    struct FileLimits {
        uint64_t maxSize = 1 * MiB;                 ///< Largest theme file accepted for validation
        uint64_t streamingMaxSize = 10 * MiB;       ///< Hard cap for any read, streamed or not
        uint64_t streamingThreshold = 10 * MiB;     ///< Above this, I/O switches to chunks
        uint64_t maxLines = 10000;
        uint64_t maxConfigLines = 1000;
        uint64_t streamChunkSize = 64 * KiB;
        uint64_t progressInterval = 1 * MiB;
    };

    struct SecurityLimits {
        size_t maxInputLength = 1000;
        size_t maxKeyLength = 100;
        size_t maxValueLength = 500;
        size_t maxThemeNameLength = 100;
        size_t maxDescriptionLength = 500;
        size_t maxPublisherLength = 100;
        size_t maxPathLength = 500;
        size_t maxVersionLength = 20;
        size_t maxLicenseLength = 20;
        std::vector<std::string> allowedExtensions{".txt", ".theme", ".conf", ".json", ".config"};
    };

    struct ResourceLimits {
        uint32_t maxConcurrentOps = 10;
        uint32_t maxFileReads = 100;
        uint32_t maxFileWrites = 50;
        std::chrono::milliseconds resetInterval{3600000};
    };

    struct PerformanceLimits {
        std::chrono::milliseconds operationTimeout{30000};
        std::chrono::milliseconds extendedTimeout{60000};
    };

    struct UiLimits {
        uint32_t maxRecentFiles = 10;
    };

    struct Defaults {
        std::string themeVersion = "0.0.1";
        std::string license = "MIT";
    };

    struct Limits {
        FileLimits file;
        SecurityLimits security;
        ResourceLimits resource;
        PerformanceLimits performance;
        UiLimits ui;
        Defaults defaults;

        /**
         * @brief Builds limits from THEME_* environment variables
         *
         * Unset or malformed variables keep their default. Parsed values are
         * clamped into the documented range for each field.
         */
        static Limits fromEnvironment();
    };

    /**
     * @brief Parses a plain integer, returning fallback when text is not a number
     *
     * Leading digits are accepted ("42abc" -> 42) to match common
     * environment-variable parsers; empty or non-numeric text yields fallback.
     */
    int64_t parseEnvNumber(std::optional<std::string_view> text, int64_t fallback) noexcept;

    /**
     * @brief Parses a byte size such as "512", "64K", "1.5MB" or "2 gb"
     *
     * Recognised suffixes are K, KB, M, MB, G, GB (case-insensitive, binary
     * multiples). Fractional values are floored after scaling. Anything that
     * does not match returns fallback.
     */
    uint64_t parseEnvBytes(std::optional<std::string_view> text, uint64_t fallback) noexcept;

    // Splits a comma-separated list, trimming whitespace and dropping empty items
    std::vector<std::string> parseEnvList(std::string_view text);

    // Human readable size: "0 Bytes", "512 Bytes", "1.5 KB", "10 MB"
    std::string formatBytes(uint64_t bytes);

} // namespace Config
} // namespace Core
} // namespace Palisade
