/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include <json/json.h>

#include "FileSystem/ExtensionBundleWriter.h"
#include "PalisadeTestHelpers.h"

namespace fs = std::filesystem;
using namespace Palisade::Core;
using namespace Palisade::Core::IO;
using palisade::test_helpers::readText;
using palisade::test_helpers::ScopedGatewayEnv;

namespace {

Json::Value parseJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
    return root;
}

ThemeColors sampleColors() {
    return {{"background", "#2e3440"}, {"foreground", "#d8dee9"}, {"color1", "#bf616a"}, {"color2", "#a3be8c"}};
}

} // namespace

TEST(ExtensionBundle, PackageNamesAreSlugified) {
    EXPECT_EQ(ExtensionBundleWriter::toPackageName("My Cool Theme"), "my-cool-theme");
    EXPECT_EQ(ExtensionBundleWriter::toPackageName("  --Nord__Dark!!  "), "nord-dark");
    EXPECT_EQ(ExtensionBundleWriter::toPackageName("!!!"), "");
    EXPECT_EQ(ExtensionBundleWriter::themeFileName("Nord Dark"), "nord-dark-color-theme.json");
    EXPECT_EQ(ExtensionBundleWriter::themeFileName("***"), "theme-color-theme.json");
}

TEST(ExtensionBundle, ThemeMappingCoversEditorAndTerminal) {
    auto theme = ExtensionBundleWriter::defaultThemeMapping("Nord", sampleColors());
    EXPECT_EQ(theme["name"].asString(), "Nord");
    EXPECT_EQ(theme["type"].asString(), "dark");
    EXPECT_EQ(theme["colors"]["editor.background"].asString(), "#2e3440");
    EXPECT_EQ(theme["colors"]["terminal.foreground"].asString(), "#d8dee9");
    EXPECT_EQ(theme["colors"]["terminal.ansiRed"].asString(), "#bf616a");
    EXPECT_FALSE(theme["colors"].isMember("terminal.ansiBlue"));
    EXPECT_EQ(theme["tokenColors"].size(), 5u);
}

TEST(ExtensionBundle, PackageJsonUsesDefaultsAndPublisher) {
    ExtensionBundleWriter writer;
    Security::SanitizedThemeFields fields;
    fields.name = "Nord Dark";
    fields.publisher = "acme";

    auto pkg = parseJson(writer.packageJson(fields));
    EXPECT_EQ(pkg["name"].asString(), "nord-dark");
    EXPECT_EQ(pkg["displayName"].asString(), "Nord Dark");
    EXPECT_EQ(pkg["version"].asString(), "0.0.1");
    EXPECT_EQ(pkg["license"].asString(), "MIT");
    EXPECT_EQ(pkg["publisher"].asString(), "acme");
    EXPECT_EQ(pkg["repository"]["url"].asString(), "https://github.com/acme/nord-dark");
    EXPECT_EQ(pkg["contributes"]["themes"][0]["path"].asString(), "./themes/nord-dark-color-theme.json");
    EXPECT_EQ(pkg["categories"][0].asString(), "Themes");
}

TEST(ExtensionBundle, LicenseTextFollowsTheLicenseField) {
    ExtensionBundleWriter writer;
    Security::SanitizedThemeFields fields;
    fields.name = "T";
    EXPECT_EQ(writer.license(fields).rfind("MIT License", 0), 0u);
    fields.license = "isc";
    EXPECT_EQ(writer.license(fields).rfind("ISC License", 0), 0u);
    fields.license = "Proprietary";
    EXPECT_NE(writer.license(fields).find("All rights reserved."), std::string::npos);
}

TEST(ExtensionBundle, RenderRequiresAName) {
    ExtensionBundleWriter writer;
    EXPECT_THROW((void)writer.render({}, sampleColors()), ValidationError);
}

TEST(ExtensionBundle, GenerateWritesEveryArtifactWithOrderedProgress) {
    ScopedGatewayEnv env;
    std::vector<ProgressEvent> events;
    auto options = env.options();
    options.onProgress = [&](const ProgressEvent& e) { events.push_back(e); };

    Security::ThemeInputFields config;
    config.name = "Nord Dark";
    config.description = "Arctic palette";
    config.version = "1.2.3";

    auto h = env.files().generateExtensionBundle("ext", sampleColors(), config, options);
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete) << h.errorInfo().message;
    ASSERT_TRUE(h.bundle().has_value());
    const auto& bundle = *h.bundle();
    EXPECT_EQ(bundle.packageName, "nord-dark");
    EXPECT_EQ(bundle.files.size(), 5u);
    EXPECT_EQ(bundle.directories.size(), 2u);

    const auto root = env.dir().join("ext");
    for (const char* name : {"package.json", "README.md", "CHANGELOG.md", "LICENSE",
                             "themes/nord-dark-color-theme.json"}) {
        EXPECT_TRUE(fs::is_regular_file(root / name)) << name;
    }

    auto pkg = parseJson(readText(root / "package.json"));
    EXPECT_EQ(pkg["version"].asString(), "1.2.3");
    EXPECT_EQ(pkg["description"].asString(), "Arctic palette");
    auto theme = parseJson(readText(root / "themes/nord-dark-color-theme.json"));
    EXPECT_EQ(theme["colors"]["editor.background"].asString(), "#2e3440");

    ASSERT_EQ(events.size(), 6u);
    const double expected[] = {0, 20, 40, 60, 80, 100};
    for (size_t i = 0; i < events.size(); ++i) {
        EXPECT_EQ(events[i].percentage.value_or(-1), expected[i]) << i;
    }
    EXPECT_EQ(events.back().operation, "Extension generation completed");
    EXPECT_EQ(events.back().bytesProcessed, 5u);
    EXPECT_EQ(events.back().totalBytes.value_or(0), 5u);
}

TEST(ExtensionBundle, InvalidThemeInputFailsValidation) {
    ScopedGatewayEnv env;
    Security::ThemeInputFields config;
    config.name = "$$$";
    auto h = env.files().generateExtensionBundle("ext", sampleColors(), config, env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().kind, ErrorKind::Validation);
    EXPECT_FALSE(fs::exists(env.dir().join("ext")));
}

TEST(ExtensionBundle, MissingNameFailsValidation) {
    ScopedGatewayEnv env;
    auto h = env.files().generateExtensionBundle("ext", sampleColors(), {}, env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().kind, ErrorKind::Validation);
    EXPECT_EQ(h.errorInfo().message, "Theme name is required");
}
