/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

#include "PalisadeTestHelpers.h"

namespace fs = std::filesystem;
using namespace Palisade::Core;
using namespace Palisade::Core::IO;
using palisade::test_helpers::readText;
using palisade::test_helpers::ScopedGatewayEnv;
using palisade::test_helpers::writeText;

namespace {

// Small thresholds so a few hundred KiB exercise the chunked paths
void streamingLimits(Config::Limits& limits) {
    limits.file.streamingThreshold = 64 * Config::KiB;
    limits.file.streamChunkSize = 4 * Config::KiB;
    limits.file.progressInterval = 16 * Config::KiB;
    limits.file.streamingMaxSize = 1 * Config::MiB;
}

std::string patterned(size_t size) {
    std::string s(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        s[i] = static_cast<char>('a' + (i * 7) % 26);
    }
    return s;
}

struct Recorder {
    std::vector<ProgressEvent> events;
    ProgressCallback callback() {
        return [this](const ProgressEvent& e) { events.push_back(e); };
    }
    size_t count(const std::string& label) const {
        size_t n = 0;
        for (const auto& e : events) n += e.operation == label ? 1 : 0;
        return n;
    }
    bool percentagesNonDecreasing() const {
        double last = -1.0;
        for (const auto& e : events) {
            if (!e.percentage) continue;
            if (*e.percentage < last) return false;
            last = *e.percentage;
        }
        return true;
    }
};

} // namespace

TEST_CASE("Streaming: large write and read move in chunks with ordered progress", "[files][streaming]") {
    ScopedGatewayEnv env(streamingLimits);
    const std::string payload = patterned(200 * 1024);

    Recorder writeProgress;
    auto options = env.options();
    options.onProgress = writeProgress.callback();
    auto w = env.files().writeFile("big.txt", payload, options);
    w.wait();
    INFO(w.errorInfo().message);
    REQUIRE(w.status() == FileOpStatus::Complete);
    CHECK(w.bytesWritten() == payload.size());

    REQUIRE_FALSE(writeProgress.events.empty());
    CHECK(writeProgress.events.front().operation == "Streaming file write");
    CHECK(writeProgress.events.front().percentage.value_or(-1) == 0.0);
    CHECK(writeProgress.events.back().operation == "Streaming write completed");
    CHECK(writeProgress.events.back().percentage.value_or(0) == 100.0);
    // 200 KiB at a 16 KiB interval
    CHECK(writeProgress.count("Streaming file write") >= 12u);
    CHECK(writeProgress.percentagesNonDecreasing());
    CHECK(readText(env.dir().join("big.txt")) == payload);

    Recorder readProgress;
    options.onProgress = readProgress.callback();
    auto r = env.files().readFile("big.txt", options);
    r.wait();
    INFO(r.errorInfo().message);
    REQUIRE(r.status() == FileOpStatus::Complete);
    CHECK(r.contentsText() == payload);
    CHECK(readProgress.events.front().operation == "Streaming file read");
    CHECK(readProgress.events.back().operation == "Streaming read completed");
    CHECK(readProgress.events.back().bytesProcessed == payload.size());
    CHECK(readProgress.percentagesNonDecreasing());
}

TEST_CASE("Streaming: useStreaming forces chunked I/O for small files", "[files][streaming]") {
    ScopedGatewayEnv env(streamingLimits);
    Recorder progress;
    auto options = env.options();
    options.useStreaming = true;
    options.chunkSize = 3;
    options.onProgress = progress.callback();

    auto w = env.files().writeFile("tiny.txt", "0123456789", options);
    w.wait();
    INFO(w.errorInfo().message);
    REQUIRE(w.status() == FileOpStatus::Complete);
    CHECK(progress.events.back().operation == "Streaming write completed");

    auto r = env.files().readFile("tiny.txt", options);
    r.wait();
    INFO(r.errorInfo().message);
    REQUIRE(r.status() == FileOpStatus::Complete);
    CHECK(r.contentsText() == "0123456789");
    CHECK(progress.events.back().operation == "Streaming read completed");
}

TEST_CASE("Streaming: empty file streams to completion", "[files][streaming]") {
    ScopedGatewayEnv env(streamingLimits);
    writeText(env.dir().join("empty.txt"), "");
    Recorder progress;
    auto options = env.options();
    options.useStreaming = true;
    options.onProgress = progress.callback();

    auto r = env.files().readFile("empty.txt", options);
    r.wait();
    INFO(r.errorInfo().message);
    REQUIRE(r.status() == FileOpStatus::Complete);
    CHECK(r.contentsText().empty());
    CHECK(progress.events.back().percentage.value_or(0) == 100.0);
}

TEST_CASE("Streaming: reads above the hard cap are rejected", "[files][streaming][limits]") {
    ScopedGatewayEnv env([](Config::Limits& limits) {
        streamingLimits(limits);
        limits.file.streamingMaxSize = 100 * Config::KiB;
    });
    writeText(env.dir().join("huge.txt"), patterned(200 * 1024));

    auto r = env.files().readFile("huge.txt", env.options());
    r.wait();
    REQUIRE(r.status() == FileOpStatus::Failed);
    CHECK(r.errorInfo().kind == ErrorKind::FileProcessing);
    INFO(r.errorInfo().message);
    CHECK(r.errorInfo().message.rfind("File too large (", 0) == 0u);
}

TEST_CASE("Streaming: large copy streams", "[files][streaming][copy]") {
    ScopedGatewayEnv env(streamingLimits);
    const std::string payload = patterned(150 * 1024);
    writeText(env.dir().join("source.txt"), payload);

    Recorder progress;
    CopyOptions options;
    options.baseDir = env.dir().path();
    options.onProgress = progress.callback();
    auto h = env.files().copy("source.txt", "target.txt", options);
    h.wait();
    INFO(h.errorInfo().message);
    REQUIRE(h.status() == FileOpStatus::Complete);
    CHECK(h.bytesWritten() == payload.size());
    CHECK(readText(env.dir().join("target.txt")) == payload);
    CHECK(progress.events.front().operation == "Streaming file copy");
    CHECK(progress.events.back().operation == "Streaming copy completed");
}

TEST_CASE("Streaming: cancellation stops between chunks", "[files][streaming][cancel]") {
    ScopedGatewayEnv env(streamingLimits);
    const std::string payload = patterned(256 * 1024);

    auto options = env.options();
    options.chunkSize = 1024;
    FileOperationHandle handle;
    std::atomic<bool> cancelled{false};
    auto* files = &env.files();
    options.onProgress = [&](const ProgressEvent& e) {
        if (e.bytesProcessed > 0 && !cancelled.exchange(true)) {
            files->cancelAll();
        }
    };
    handle = env.files().writeFile("partial.txt", payload, options);
    handle.wait();
    CHECK(handle.status() == FileOpStatus::Cancelled);
    CHECK(handle.errorInfo().code == FileError::Cancelled);
    CHECK(fs::file_size(env.dir().join("partial.txt")) < payload.size());
    CHECK(env.files().activeOperationCount() == 0u);
}
