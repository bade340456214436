/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "FileSystem/ThemeFileParser.h"
#include "PalisadeTestHelpers.h"

using namespace Palisade::Core;
using namespace Palisade::Core::IO;
using palisade::test_helpers::ScopedGatewayEnv;
using palisade::test_helpers::writeText;

namespace {

std::string fullTheme() {
    std::string s = "# Nord-ish\nbackground = #2e3440\n";
    const char* palette[] = {"#3b4252", "#bf616a", "#a3be8c", "#ebcb8b", "#81a1c1", "#b48ead", "#88c0d0",
                             "#e5e9f0", "#4c566a", "#bf616a", "#a3be8c", "#ebcb8b", "#81a1c1", "#b48ead",
                             "#8fbcbb"};
    for (int i = 0; i < 15; ++i) {
        s += "color" + std::to_string(i) + " = " + palette[i] + "\n";
    }
    return s;
}

bool contains(const std::vector<std::string>& list, const std::string& needle) {
    return std::find(list.begin(), list.end(), needle) != list.end();
}

} // namespace

TEST(ThemeFileParser, CompleteThemeIsValidWithoutWarnings) {
    ThemeFileParser parser;
    auto result = parser.validateContent(fullTheme());
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(result.warnings.empty());
}

TEST(ThemeFileParser, CommentsOnlyIsInvalid) {
    ThemeFileParser parser;
    auto result = parser.validateContent("# just a comment\n// another\n\n");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.error.value_or(""), "No valid color definitions found");
    EXPECT_FALSE(result.suggestions.empty());
}

TEST(ThemeFileParser, MostlyMalformedColorsAreInvalid) {
    ThemeFileParser parser;
    auto result = parser.validateContent("background = #abcd\nforeground = #12345\ncursor = #ffffff\n");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.error.value_or(""), "Too many invalid color values found");
}

TEST(ThemeFileParser, PartiallyMalformedColorsWarn) {
    ThemeFileParser parser;
    auto result = parser.validateContent("background = #000000\nforeground = #ffffff\ncursor = #abcd\n");
    EXPECT_TRUE(result.isValid);
    EXPECT_TRUE(contains(result.warnings, "1 invalid color value(s) found"));
}

TEST(ThemeFileParser, ExactlyHalfMalformedIsStillValid) {
    ThemeFileParser parser;
    auto result = parser.validateContent("background = #000000\nforeground = #abcd\n");
    EXPECT_TRUE(result.isValid);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_TRUE(contains(result.warnings, "1 invalid color value(s) found"));
}

TEST(ThemeFileParser, OverlongLinesAreSkippedBeforeMatching) {
    ThemeFileParser parser;
    const std::string content = fullTheme() + "background=" + std::string(200000, 'a') + "\n";

    auto verdict = parser.validateContent(content);
    EXPECT_TRUE(verdict.isValid);
    EXPECT_TRUE(contains(verdict.warnings, "Line 18 is too long and was ignored"));

    auto parsed = parser.parse(content);
    ASSERT_TRUE(parsed.success);
    EXPECT_EQ(parsed.colors.at("background"), "#2e3440");
    EXPECT_TRUE(contains(parsed.invalidLines, "Line 18: Line too long (maximum 600 characters)"));
}

TEST(ThemeFileParser, TooManyLinesIsInvalid) {
    ThemeFileParser::Config config;
    config.maxLines = 2;
    ThemeFileParser parser(config);
    auto result = parser.validateContent("background=#000000\nforeground=#ffffff\ncursor=#ffffff\n");
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.error.value_or(""), "Too many lines in file (maximum 2)");
}

TEST(ThemeFileParser, ParsesEverySeparatorStyle) {
    ThemeFileParser parser;
    auto result = parser.parse("background=#AABBCC\nforeground: #ddeeff\ncursor #123\nColor1 = #FF0000\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.colors.at("background"), "#aabbcc");
    EXPECT_EQ(result.colors.at("foreground"), "#ddeeff");
    EXPECT_EQ(result.colors.at("cursor"), "#123");
    EXPECT_EQ(result.colors.at("color1"), "#ff0000");
    EXPECT_EQ(result.colorCount, 4u);
    EXPECT_TRUE(result.invalidLines.empty());
}

TEST(ThemeFileParser, PaletteLinesMapToNumberedColors) {
    ThemeFileParser parser;
    auto result = parser.parse("palette = 3 = #FF00FF\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.colors.at("color3"), "#ff00ff");
}

TEST(ThemeFileParser, RecordsInvalidAndUnrecognizedLines) {
    ThemeFileParser parser;
    auto result = parser.parse("background = #000000\nforeground = #abcd\nfont-size = 12\n");
    EXPECT_TRUE(contains(result.invalidLines, "Line 2: Invalid color format \"#abcd\""));
    EXPECT_TRUE(contains(result.invalidLines, "Line 3: Unrecognized configuration \"font-size = 12\""));
}

TEST(ThemeFileParser, DuplicateKeysWarnAndLastWins) {
    ThemeFileParser parser;
    auto result = parser.parse("background = #000000\n\nbackground = #111111\n");
    EXPECT_EQ(result.colors.at("background"), "#111111");
    EXPECT_TRUE(contains(result.warnings, "Duplicate definition of background on line 3"));
}

TEST(ThemeFileParser, OverlongKeysAreSkipped) {
    ThemeFileParser::Config config;
    config.maxKeyLength = 10;
    ThemeFileParser parser(config);
    auto result = parser.parse("averyveryverylongconfigurationkey = 1\n");
    EXPECT_TRUE(contains(result.warnings, "Skipping line with overly long key: averyveryverylongcon..."));
    EXPECT_TRUE(result.invalidLines.empty());
}

TEST(ThemeFileParser, ConfigLineLimitTruncatesWithWarning) {
    ThemeFileParser::Config config;
    config.maxConfigLines = 2;
    ThemeFileParser parser(config);
    auto result = parser.parse("color0=#000000\ncolor1=#111111\ncolor2=#222222\n");
    EXPECT_EQ(result.colors.size(), 2u);
    EXPECT_TRUE(contains(result.warnings, "Too many configuration lines, some may be ignored"));
}

TEST(ThemeFileParser, HexAndExtensionHelpers) {
    EXPECT_TRUE(ThemeFileParser::isHexColor("#abc"));
    EXPECT_TRUE(ThemeFileParser::isHexColor("#AABBCC"));
    EXPECT_TRUE(ThemeFileParser::isHexColor("#aabbccdd"));
    EXPECT_FALSE(ThemeFileParser::isHexColor("#abcd"));
    EXPECT_FALSE(ThemeFileParser::isHexColor("abcdef"));
    EXPECT_TRUE(ThemeFileParser::hasThemeExtension("x.THEME"));
    EXPECT_TRUE(ThemeFileParser::hasThemeExtension("x.txt"));
    EXPECT_FALSE(ThemeFileParser::hasThemeExtension("x.json"));
}

TEST(ThemeFiles, ValidateThemeFileThroughTheService) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("nord.txt"), fullTheme());

    auto h = env.files().validateThemeFile("nord.txt", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
    ASSERT_TRUE(h.themeValidation().has_value());
    EXPECT_TRUE(h.themeValidation()->isValid);
    ASSERT_TRUE(h.themeValidation()->metadata.has_value());
    EXPECT_EQ(h.themeValidation()->metadata->size, fullTheme().size());
}

TEST(ThemeFiles, MissingThemeFileIsInvalidNotFailed) {
    ScopedGatewayEnv env;
    auto h = env.files().validateThemeFile("absent.theme", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_FALSE(h.themeValidation()->isValid);
    EXPECT_EQ(h.themeValidation()->error.value_or(""), "File does not exist");
    EXPECT_FALSE(h.themeValidation()->suggestions.empty());
}

TEST(ThemeFiles, WrongExtensionIsInvalid) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("colors.json"), "{}");
    auto h = env.files().validateThemeFile("colors.json", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(h.themeValidation()->error.value_or(""), "Invalid file extension. Expected .txt or .theme file");
}

TEST(ThemeFiles, OversizedThemeFileIsInvalid) {
    ScopedGatewayEnv env([](Config::Limits& limits) { limits.file.maxSize = 64; });
    writeText(env.dir().join("large.txt"), fullTheme());
    auto h = env.files().validateThemeFile("large.txt", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_FALSE(h.themeValidation()->isValid);
    EXPECT_EQ(h.themeValidation()->error.value_or("").rfind("File too large (", 0), 0u);
}

TEST(ThemeFiles, ParseThemeFileExtractsColors) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("mixed.theme"), fullTheme() + "palette = 3 = #FF00FF\n");

    auto h = env.files().parseThemeFile("mixed.theme", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
    ASSERT_TRUE(h.themeParse().has_value());
    const auto& parsed = *h.themeParse();
    EXPECT_TRUE(parsed.success);
    EXPECT_EQ(parsed.colors.at("background"), "#2e3440");
    EXPECT_EQ(parsed.colors.at("color3"), "#ff00ff");
    EXPECT_TRUE(contains(parsed.warnings, "Duplicate definition of color3 on line 18"));
}

TEST(ThemeFiles, ParseOfAnInvalidFileCarriesTheValidationError) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("blank.txt"), "# nothing\n");

    auto h = env.files().parseThemeFile("blank.txt", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_FALSE(h.themeParse()->success);
    EXPECT_EQ(h.themeParse()->error.value_or(""), "No valid color definitions found");
}

TEST(ThemeFiles, HugeSingleLineThemeCompletes) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("huge.txt"), "background=" + std::string(200000, 'a') + "\nforeground=#ffffff\n");

    auto checked = env.files().validateThemeFile("huge.txt", env.options());
    checked.wait();
    ASSERT_EQ(checked.status(), FileOpStatus::Complete) << checked.errorInfo().message;
    EXPECT_TRUE(checked.themeValidation()->isValid);

    auto parsed = env.files().parseThemeFile("huge.txt", env.options());
    parsed.wait();
    ASSERT_EQ(parsed.status(), FileOpStatus::Complete) << parsed.errorInfo().message;
    ASSERT_TRUE(parsed.themeParse()->success);
    EXPECT_EQ(parsed.themeParse()->colors.at("foreground"), "#ffffff");
    EXPECT_EQ(parsed.themeParse()->colors.count("background"), 0u);
    EXPECT_EQ(parsed.themeParse()->invalidLines.size(), 1u);
}
