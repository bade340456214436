/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "PalisadeTestHelpers.h"

using namespace Palisade::Core;
using namespace Palisade::Core::IO;
using palisade::test_helpers::ScopedGatewayEnv;
using palisade::test_helpers::writeText;
using namespace std::chrono_literals;

TEST(FileServiceLifecycle, CancelSettlesAndDeregisters) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("slow.txt"), "data");
    env.backend().setDelay(300ms);

    auto h = env.files().readFile("slow.txt", env.options());
    ASSERT_FALSE(h.id().empty());
    EXPECT_EQ(env.files().activeOperationCount(), 1u);

    EXPECT_TRUE(env.files().cancel(h.id()));
    h.wait();
    EXPECT_EQ(h.status(), FileOpStatus::Cancelled);
    EXPECT_EQ(h.errorInfo().kind, ErrorKind::FileProcessing);
    EXPECT_EQ(h.errorInfo().code, FileError::Cancelled);
    EXPECT_EQ(env.files().activeOperationCount(), 0u);

    EXPECT_FALSE(env.files().cancel(h.id()));
    EXPECT_FALSE(env.files().cancel("op-unknown"));
    EXPECT_THROW(h.throwIfFailed(), FileProcessingError);
}

TEST(FileServiceLifecycle, CancelAllAbortsEveryOperation) {
    ScopedGatewayEnv env;
    env.backend().setDelay(300ms);

    std::vector<FileOperationHandle> handles;
    for (int i = 0; i < 3; ++i) {
        handles.push_back(env.files().writeFile("f" + std::to_string(i) + ".txt", "x", env.options()));
    }
    EXPECT_EQ(env.files().activeOperationCount(), 3u);

    EXPECT_EQ(env.files().cancelAll(), 3u);
    for (auto& h : handles) {
        h.wait();
        EXPECT_EQ(h.status(), FileOpStatus::Cancelled);
    }
    EXPECT_EQ(env.files().activeOperationCount(), 0u);
    EXPECT_EQ(env.files().cancelAll(), 0u);
}

TEST(FileServiceLifecycle, TimeoutWinsAgainstSlowIo) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("stuck.txt"), "data");
    env.backend().setDelay(500ms);

    auto options = env.options();
    options.timeout = 50ms;
    auto h = env.files().readFile("stuck.txt", options);
    h.wait();
    EXPECT_EQ(h.status(), FileOpStatus::TimedOut);
    EXPECT_EQ(h.errorInfo().kind, ErrorKind::FileProcessing);
    EXPECT_EQ(h.errorInfo().code, FileError::Timeout);
    EXPECT_EQ(h.errorInfo().message, "File operation timed out after 50ms");
    EXPECT_EQ(env.files().activeOperationCount(), 0u);
}

TEST(FileServiceLifecycle, CompletedOperationsAreDeregistered) {
    ScopedGatewayEnv env;
    writeText(env.dir().join("quick.txt"), "q");
    auto h = env.files().readFile("quick.txt", env.options());
    h.wait();
    ASSERT_EQ(h.status(), FileOpStatus::Complete);
    EXPECT_EQ(env.files().activeOperationCount(), 0u);
    EXPECT_FALSE(env.files().cancel(h.id()));
    EXPECT_NO_THROW(h.throwIfFailed());
}

TEST(FileServiceLifecycle, ValidationFailureIsSettledOnTheCallingThread) {
    ScopedGatewayEnv env;
    auto h = env.files().readFile("../escape.txt", env.options());
    EXPECT_TRUE(h.isSettled());
    EXPECT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().kind, ErrorKind::Security);
    EXPECT_EQ(env.files().activeOperationCount(), 0u);
}

TEST(FileServiceLifecycle, RejectedOperationsDoNotHoldUpStop) {
    ScopedGatewayEnv env;
    std::vector<FileOperationHandle> rejected;
    rejected.push_back(env.files().readFile("../escape.txt", env.options()));
    rejected.push_back(env.files().remove(".", env.options()));
    rejected.push_back(env.files().writeFile("tool.exe", "x", env.options()));
    for (const auto& h : rejected) {
        EXPECT_TRUE(h.isSettled());
        EXPECT_EQ(h.status(), FileOpStatus::Failed);
    }

    const auto start = std::chrono::steady_clock::now();
    env.files().stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(env.files().activeOperationCount(), 0u);
}

TEST(FileServiceLifecycle, StoppedServiceRefusesWork) {
    ScopedGatewayEnv env;
    env.files().stop();
    auto h = env.files().readFile("any.txt", env.options());
    EXPECT_TRUE(h.isSettled());
    EXPECT_EQ(h.status(), FileOpStatus::Failed);
    EXPECT_EQ(h.errorInfo().message, "File service is not running");
    EXPECT_EQ(env.backend().callCount(), 0u);
}

TEST(FileServiceLifecycle, StopCancelsInFlightOperations) {
    ScopedGatewayEnv env;
    env.backend().setDelay(200ms);
    auto h = env.files().writeFile("pending.txt", "x", env.options());
    env.files().stop();
    EXPECT_TRUE(h.isSettled());
    EXPECT_EQ(h.status(), FileOpStatus::Cancelled);
}

// Every public operation must reject traversal before touching the filesystem
TEST(FileServiceLifecycle, TraversalNeverReachesTheBackend) {
    ScopedGatewayEnv env;
    auto& files = env.files();
    const std::string evil = "../../etc/passwd";
    auto options = env.options();
    ListDirectoryOptions listOptions;
    listOptions.baseDir = env.dir().path();
    CopyOptions copyOptions;
    copyOptions.baseDir = env.dir().path();
    Security::ThemeInputFields config;
    config.name = "Evil";

    std::vector<FileOperationHandle> handles{
        files.exists(evil, options),
        files.getMetadata(evil, options),
        files.readFile(evil, options),
        files.writeFile(evil, "owned", options),
        files.ensureDirectoryExists(evil, options),
        files.listDirectory(evil, listOptions),
        files.copy(evil, "copy.txt", copyOptions),
        files.copy("safe.txt", evil, copyOptions),
        files.remove(evil, options),
        files.validateThemeFile(evil, options),
        files.parseThemeFile(evil, options),
        files.generateExtensionBundle(evil, {}, config, options),
    };

    for (auto& h : handles) {
        h.wait();
        EXPECT_EQ(h.status(), FileOpStatus::Failed);
        EXPECT_EQ(h.errorInfo().kind, ErrorKind::Security);
        EXPECT_EQ(h.errorInfo().message, "Path traversal detected");
    }
    EXPECT_EQ(env.backend().callCount(), 0u);
}

TEST(FileServiceLifecycle, OperationsRunConcurrentlyUpToThePoolSize) {
    ScopedGatewayEnv env([](Config::Limits& limits) { limits.resource.maxConcurrentOps = 4; });
    for (int i = 0; i < 4; ++i) {
        writeText(env.dir().join("p" + std::to_string(i) + ".txt"), "p");
    }
    env.backend().setDelay(150ms);

    auto start = std::chrono::steady_clock::now();
    std::vector<FileOperationHandle> handles;
    for (int i = 0; i < 4; ++i) {
        handles.push_back(env.files().exists("p" + std::to_string(i) + ".txt", env.options()));
    }
    for (auto& h : handles) {
        h.wait();
        EXPECT_TRUE(h.exists());
    }
    // Four serial calls would take 600ms
    EXPECT_LT(std::chrono::steady_clock::now() - start, 450ms);
    EXPECT_EQ(env.gateway().work().threadCount(), 4u);
}
