/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "ThemeFileParser.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace Palisade::Core::IO {

namespace {
    const std::regex& colorLineRegex() {
        static const std::regex re(
            R"(^(color\d+|background|foreground|cursor|selection_background|selection_foreground)[\s=:])",
            std::regex::ECMAScript | std::regex::icase);
        return re;
    }

    const std::regex& colorValueRegex() {
        static const std::regex re(R"([\s=:]+(#[A-Fa-f0-9]{3,8}|\w+)\s*$)");
        return re;
    }

    const std::regex& hexColorRegex() {
        static const std::regex re(R"(^#([A-Fa-f0-9]{6}|[A-Fa-f0-9]{3}|[A-Fa-f0-9]{8})$)");
        return re;
    }

    const std::regex& paletteRegex() {
        static const std::regex re(R"(^palette[\s=:]+(\d+)[\s=:]+(.+)$)",
                                   std::regex::ECMAScript | std::regex::icase);
        return re;
    }

    std::string_view trim(std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    std::string toLower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool isComment(std::string_view line) {
        return line.front() == '#' || line.substr(0, 2) == "//";
    }

    // Each element is a trimmed line; numbering follows the raw content
    struct ContentLine {
        size_t number;
        std::string text;
    };

    std::vector<ContentLine> meaningfulLines(std::string_view content) {
        std::vector<ContentLine> lines;
        size_t number = 0;
        size_t start = 0;
        while (start <= content.size()) {
            size_t end = content.find('\n', start);
            if (end == std::string_view::npos) end = content.size();
            ++number;
            auto line = trim(content.substr(start, end - start));
            if (!line.empty() && !isComment(line)) {
                lines.push_back({number, std::string(line)});
            }
            start = end + 1;
        }
        return lines;
    }

    bool isMalformedHex(std::string_view value) {
        return !value.empty() && value.front() == '#' && !ThemeFileParser::isHexColor(value);
    }
}

ThemeFileParser::ThemeFileParser(const Core::Config::FileLimits& file, const Core::Config::SecurityLimits& security)
    : _config{file.maxLines, file.maxConfigLines, security.maxKeyLength,
              security.maxKeyLength + security.maxValueLength} {
}

bool ThemeFileParser::isHexColor(std::string_view value) {
    return std::regex_match(value.begin(), value.end(), hexColorRegex());
}

bool ThemeFileParser::hasThemeExtension(const std::filesystem::path& path) {
    auto ext = toLower(path.extension().string());
    return ext == ".txt" || ext == ".theme";
}

ThemeValidationResult ThemeFileParser::validateContent(std::string_view content) const {
    ThemeValidationResult result;
    auto lines = meaningfulLines(content);

    if (lines.size() > _config.maxLines) {
        result.error = "Too many lines in file (maximum " + std::to_string(_config.maxLines) + ")";
        result.suggestions = {"Remove unnecessary content", "Split the theme into smaller files"};
        return result;
    }

    size_t colorLines = 0;
    size_t invalidColors = 0;
    std::smatch match;
    for (const auto& line : lines) {
        if (line.text.size() > _config.maxLineLength) {
            result.warnings.push_back("Line " + std::to_string(line.number) + " is too long and was ignored");
            continue;
        }
        if (std::regex_search(line.text, colorLineRegex())) {
            ++colorLines;
            if (std::regex_search(line.text, match, colorValueRegex()) && isMalformedHex(match.str(1))) {
                ++invalidColors;
            }
        } else if (std::regex_match(line.text, match, paletteRegex())) {
            ++colorLines;
            if (isMalformedHex(trim(match.str(2)))) {
                ++invalidColors;
            }
        }
    }

    if (colorLines == 0) {
        result.error = "No valid color definitions found";
        result.suggestions = {
            "Add color definitions (e.g., background=#000000)",
            "Check the Ghostty theme format",
            "Ensure color lines are not commented out"
        };
        return result;
    }

    if (invalidColors * 2 > colorLines) {
        result.error = "Too many invalid color values found";
        result.suggestions = {
            "Use valid hex color format (#RRGGBB)",
            "Check color values for typos",
            "Ensure colors are properly formatted"
        };
        return result;
    }

    if (invalidColors > 0) {
        result.warnings.push_back(std::to_string(invalidColors) + " invalid color value(s) found");
    }
    result.isValid = true;
    return result;
}

ThemeParseResult ThemeFileParser::parse(std::string_view content) const {
    ThemeParseResult result;
    auto lines = meaningfulLines(content);

    auto assign = [&result](const std::string& key, const std::string& value, size_t lineNumber) {
        if (result.colors.count(key) != 0) {
            result.warnings.push_back("Duplicate definition of " + key + " on line " + std::to_string(lineNumber));
        }
        result.colors[key] = toLower(value);
        ++result.colorCount;
    };

    uint64_t processed = 0;
    std::smatch match;
    for (const auto& line : lines) {
        if (++processed > _config.maxConfigLines) {
            result.warnings.push_back("Too many configuration lines, some may be ignored");
            break;
        }
        const auto number = std::to_string(line.number);

        // std::regex recurses per character; never hand it unbounded input
        if (line.text.size() > _config.maxLineLength) {
            result.invalidLines.push_back("Line " + number + ": Line too long (maximum " +
                                          std::to_string(_config.maxLineLength) + " characters)");
            continue;
        }

        if (std::regex_search(line.text, match, colorLineRegex())) {
            const auto key = toLower(match.str(1));
            std::smatch valueMatch;
            if (!std::regex_search(line.text, valueMatch, colorValueRegex())) {
                result.invalidLines.push_back("Line " + number + ": Missing color value");
                continue;
            }
            const auto value = valueMatch.str(1);
            if (isMalformedHex(value)) {
                result.invalidLines.push_back("Line " + number + ": Invalid color format \"" + value + "\"");
                result.warnings.push_back("Invalid color on line " + number + ": " + value);
                continue;
            }
            assign(key, value, line.number);
            continue;
        }

        if (std::regex_match(line.text, match, paletteRegex())) {
            const auto key = "color" + match.str(1);
            const std::string color(trim(match.str(2)));
            if (isMalformedHex(color)) {
                result.invalidLines.push_back("Line " + number + ": Invalid palette color format \"" + color + "\"");
                result.warnings.push_back("Invalid palette color on line " + number + ": " + color);
                continue;
            }
            assign(key, color, line.number);
            continue;
        }

        const auto delimiter = line.text.find_first_of("=:");
        if (delimiter == std::string::npos) {
            continue;
        }
        const auto key = trim(std::string_view(line.text).substr(0, delimiter));
        if (key.size() > _config.maxKeyLength) {
            result.warnings.push_back("Skipping line with overly long key: " + std::string(key.substr(0, 20)) + "...");
            continue;
        }
        result.invalidLines.push_back("Line " + number + ": Unrecognized configuration \"" + line.text + "\"");
    }

    result.success = true;
    return result;
}

} // namespace Palisade::Core::IO
