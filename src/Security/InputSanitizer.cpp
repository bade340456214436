/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "InputSanitizer.h"

#include <cctype>
#include "Core/Errors.h"

namespace Palisade::Core::Security {

namespace {
    bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    std::string_view trim(std::string_view s) {
        while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
        while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
        return s;
    }
}

InputSanitizer::InputSanitizer(const Core::Config::SecurityLimits& limits, const PathValidator& validator)
    : _limits(limits)
    , _validator(validator) {
}

std::string InputSanitizer::strip(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (DangerousCharacters.find(c) == std::string_view::npos) {
            out.push_back(c);
        }
    }
    return out;
}

std::string InputSanitizer::process(std::string_view input, std::optional<size_t> maxLength) const {
    if (input.empty()) {
        throw ValidationError("Invalid input provided");
    }
    const size_t limit = maxLength.value_or(_limits.maxInputLength);

    auto sanitized = strip(trim(input));

    if (sanitized.size() > limit) {
        throw ValidationError("Input too long (max " + std::to_string(limit) + " characters)");
    }
    if (sanitized.empty()) {
        throw ValidationError("Input cannot be empty after sanitization");
    }
    return sanitized;
}

std::string InputSanitizer::sanitizeName(std::string_view input) const {
    auto processed = process(input, _limits.maxThemeNameLength);

    std::string out;
    out.reserve(processed.size());
    bool pendingSpace = false;
    for (char c : processed) {
        const auto uc = static_cast<unsigned char>(c);
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (std::isalnum(uc) || c == '-' || c == '_') {
            if (pendingSpace) out.push_back(' ');
            pendingSpace = false;
            out.push_back(c);
        }
    }

    if (out.empty()) {
        throw ValidationError("Theme name must contain letters or numbers");
    }
    return out;
}

ValidatedPath InputSanitizer::sanitizePath(std::string_view input,
                                           const std::optional<std::filesystem::path>& baseDir) const {
    auto processed = process(input, _limits.maxPathLength);
    return _validator.validate(processed, baseDir);
}

} // namespace Palisade::Core::Security
