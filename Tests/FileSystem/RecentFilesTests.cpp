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

#include "FileSystem/RecentFiles.h"
#include "PalisadeTestHelpers.h"

namespace fs = std::filesystem;
using namespace Palisade::Core;
using namespace Palisade::Core::IO;
using palisade::test_helpers::readText;
using palisade::test_helpers::ScopedGatewayEnv;
using palisade::test_helpers::writeText;

TEST(RecentFiles, AddPutsNewestFirstAndCollapsesDuplicates) {
    ScopedGatewayEnv env;
    auto& recent = env.gateway().recentFiles();
    writeText(env.dir().join("a.txt"), "a");
    writeText(env.dir().join("b.txt"), "b");

    ASSERT_TRUE(recent.add(env.dir().join("a.txt").string(), "Alpha"));
    ASSERT_TRUE(recent.add(env.dir().join("b.txt").string(), "Beta"));
    ASSERT_TRUE(recent.add(env.dir().join("a.txt").string(), "Alpha Again!"));

    auto files = recent.list();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, env.dir().join("a.txt").string());
    EXPECT_EQ(files[0].name, "Alpha Again");
    EXPECT_EQ(files[1].name, "Beta");
    EXPECT_EQ(files[0].lastUsed.size(), 24u);  // 2025-01-01T00:00:00.000Z
}

TEST(RecentFiles, ListIsCappedAtTheConfiguredMaximum) {
    ScopedGatewayEnv env([](Config::Limits& limits) { limits.ui.maxRecentFiles = 3; });
    auto& recent = env.gateway().recentFiles();
    for (int i = 0; i < 5; ++i) {
        auto p = env.dir().join("t" + std::to_string(i) + ".txt");
        writeText(p, "x");
        ASSERT_TRUE(recent.add(p.string(), "Theme " + std::to_string(i)));
    }
    auto files = recent.list();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "Theme 4");
    EXPECT_EQ(files[2].name, "Theme 2");
}

TEST(RecentFiles, StorageFileIsPrivate) {
    ScopedGatewayEnv env;
    auto& recent = env.gateway().recentFiles();
    writeText(env.dir().join("a.txt"), "a");
    ASSERT_TRUE(recent.add(env.dir().join("a.txt").string(), "Alpha"));

    EXPECT_EQ(recent.storagePath(), env.dir().join(".vscode-theme-generator-recent.json"));
    auto perms = fs::status(recent.storagePath()).permissions() & fs::perms::all;
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);
}

TEST(RecentFiles, MissingFilesAreNotAddedAndDropOutOfTheList) {
    ScopedGatewayEnv env;
    auto& recent = env.gateway().recentFiles();
    EXPECT_FALSE(recent.add(env.dir().join("nope.txt").string(), "Nope"));
    EXPECT_FALSE(recent.add("", "Empty"));

    auto p = env.dir().join("temp.txt");
    writeText(p, "x");
    ASSERT_TRUE(recent.add(p.string(), "Temp"));
    fs::remove(p);
    EXPECT_TRUE(recent.list().empty());
}

TEST(RecentFiles, MalformedStorageIsIgnored) {
    ScopedGatewayEnv env;
    auto& recent = env.gateway().recentFiles();
    writeText(recent.storagePath(), "{not json");
    EXPECT_TRUE(recent.list().empty());

    writeText(recent.storagePath(), R"([{"path": 42}, "junk"])");
    EXPECT_TRUE(recent.list().empty());
}

TEST(RecentFiles, ClearEmptiesAnExistingList) {
    ScopedGatewayEnv env;
    auto& recent = env.gateway().recentFiles();
    EXPECT_TRUE(recent.clear());
    EXPECT_FALSE(fs::exists(recent.storagePath()));

    writeText(env.dir().join("a.txt"), "a");
    ASSERT_TRUE(recent.add(env.dir().join("a.txt").string(), "Alpha"));
    EXPECT_TRUE(recent.clear());
    EXPECT_EQ(readText(recent.storagePath()), "[]");
    EXPECT_TRUE(recent.list().empty());
}
