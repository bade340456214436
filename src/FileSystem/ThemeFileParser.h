/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file ThemeFileParser.h
 * @brief Content rules for terminal theme files
 *
 * A theme file is line oriented. Blank lines and lines starting with '#' or
 * '//' are ignored. Recognized assignments name a color slot (color0..colorN,
 * background, foreground, cursor, selection_background, selection_foreground)
 * followed by '=', ':' or whitespace and a value, or use the palette form
 * "palette = N = value". Keys are matched case-insensitively.
 *
 * The parser works on text only; FileService supplies the file contents.
 */
#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "Config/Limits.h"
#include "FileOperationHandle.h"

namespace Palisade::Core::IO {

class ThemeFileParser {
public:
    struct Config {
        uint64_t maxLines = 10000;          ///< Content lines allowed before the file is rejected
        uint64_t maxConfigLines = 1000;     ///< Lines parsed before the rest is ignored
        size_t maxKeyLength = 100;
        size_t maxLineLength = 600;         ///< Longer lines are skipped without pattern matching
    };

    ThemeFileParser() = default;
    explicit ThemeFileParser(Config config) : _config(config) {}
    ThemeFileParser(const Core::Config::FileLimits& file, const Core::Config::SecurityLimits& security);

    /**
     * @brief Checks content for usable color definitions
     *
     * Valid when at least one recognized assignment exists and no more than
     * half of them carry a malformed hex value. Partial breakage is reported
     * as a warning on a valid result. Lines over maxLineLength are skipped
     * with a warning.
     */
    ThemeValidationResult validateContent(std::string_view content) const;

    /**
     * @brief Extracts key -> color for every well-formed assignment
     *
     * Later definitions of a key replace earlier ones and leave a warning.
     * Does not validate; callers run validateContent() first.
     */
    ThemeParseResult parse(std::string_view content) const;

    static bool isHexColor(std::string_view value);

    /// True for .txt and .theme, case-insensitively
    static bool hasThemeExtension(const std::filesystem::path& path);

    const Config& config() const noexcept { return _config; }

private:
    Config _config;
};

} // namespace Palisade::Core::IO
