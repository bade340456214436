/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "Config/Limits.h"
#include "PathValidator.h"

namespace Palisade::Core::Security {

/**
 * @brief Cleansing and length enforcement for untrusted text fields
 *
 * All operations are pure over strings and fail fast with ValidationError;
 * partially sanitized data is never returned. Lengths are measured in bytes.
 */
class InputSanitizer {
public:
    // Shell and path metacharacters removed by strip()
    static constexpr std::string_view DangerousCharacters = ";&|`$(){}[]<>";

    InputSanitizer(const Core::Config::SecurityLimits& limits, const PathValidator& validator);

    /**
     * @brief Removes every dangerous character
     */
    static std::string strip(std::string_view input);

    /**
     * @brief Trims, strips, and enforces 1..maxLength bytes
     *
     * maxLength defaults to SecurityLimits::maxInputLength.
     *
     * @throws ValidationError on empty input, an over-long result, or a
     *         result that is empty after stripping
     */
    std::string process(std::string_view input, std::optional<size_t> maxLength = std::nullopt) const;

    /**
     * @brief Theme-name cleansing: process(), then keep [A-Za-z0-9 _-] and collapse whitespace
     *
     * Idempotent: sanitizeName(sanitizeName(x)) == sanitizeName(x).
     *
     * @throws ValidationError if nothing printable remains
     */
    std::string sanitizeName(std::string_view input) const;

    /**
     * @brief process() with the path length limit, then PathValidator::validate()
     */
    ValidatedPath sanitizePath(std::string_view input,
                               const std::optional<std::filesystem::path>& baseDir = std::nullopt) const;

private:
    Core::Config::SecurityLimits _limits;
    const PathValidator& _validator;
};

} // namespace Palisade::Core::Security
