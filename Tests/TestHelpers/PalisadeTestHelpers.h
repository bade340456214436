/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "Palisade.h"

namespace palisade::test_helpers
{

// RAII temporary directory that gets cleaned up on destruction
class ScopedTempDir
{
public:
    ScopedTempDir() {
        namespace fs = std::filesystem;
        auto base = fs::temp_directory_path();
        auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::ostringstream oss;
        oss << "Palisade_Test_" << std::hex << now << "_" << gen();
        _path = fs::weakly_canonical(base) / oss.str();
        std::error_code ec;
        fs::create_directories(_path, ec);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(_path, ec);  // best-effort cleanup
    }

    const std::filesystem::path& path() const noexcept {
        return _path;
    }
    std::filesystem::path join(const std::string& name) const {
        return _path / name;
    }

private:
    std::filesystem::path _path;
};

// Writes text to path directly, bypassing the gateway
void writeText(const std::filesystem::path& path, const std::string& text);
std::string readText(const std::filesystem::path& path);

// Decorator over the local backend that counts every call and can delay each one
class ForwardingBackend : public Palisade::Core::IO::IFileSystemBackend
{
public:
    ForwardingBackend();

    Palisade::Core::IO::FileMetadata getMetadata(const std::filesystem::path& path) override;
    bool exists(const std::filesystem::path& path) override;
    std::string readFile(const std::filesystem::path& path) override;
    uint64_t writeFile(const std::filesystem::path& path, std::string_view data, uint32_t permissions) override;
    std::unique_ptr<Palisade::Core::IO::FileStream> openStream(const std::filesystem::path& path,
                                                               Palisade::Core::IO::StreamOptions options) override;
    void createDirectories(const std::filesystem::path& path, uint32_t permissions) override;
    std::vector<std::string> listDirectory(const std::filesystem::path& path) override;
    void removeFile(const std::filesystem::path& path) override;
    uintmax_t removeAll(const std::filesystem::path& path) override;
    void copyFile(const std::filesystem::path& source, const std::filesystem::path& destination,
                  bool overwrite) override;
    void setTimes(const std::filesystem::path& path,
                  std::optional<std::chrono::system_clock::time_point> accessed,
                  std::optional<std::chrono::system_clock::time_point> modified) override;
    std::string getBackendType() const override { return "Forwarding"; }

    size_t callCount() const noexcept { return _calls.load(); }
    std::vector<std::string> calls() const;
    void setDelay(std::chrono::milliseconds delay) noexcept { _delayMs.store(delay.count()); }

private:
    void hook(const char* op);

    Palisade::Core::IO::LocalFileSystemBackend _inner;
    std::atomic<size_t> _calls{0};
    std::atomic<long long> _delayMs{0};
    mutable std::mutex _mutex;
    std::vector<std::string> _log;
};

// RAII gateway rooted in its own temporary directory
class ScopedGatewayEnv
{
public:
    using Tweak = std::function<void(Palisade::Core::Config::Limits&)>;

    explicit ScopedGatewayEnv(Tweak tweak = {});
    ~ScopedGatewayEnv();

    Palisade::Core::Gateway& gateway() noexcept { return *_gateway; }
    Palisade::Core::IO::FileService& files() noexcept { return _gateway->files(); }
    Palisade::Core::Security::SecurityService& security() noexcept { return _gateway->security(); }
    ForwardingBackend& backend() noexcept { return *_backend; }
    const ScopedTempDir& dir() const noexcept { return _dir; }

    // Options with baseDir pointing at the temporary directory
    Palisade::Core::IO::FileOperationOptions options() const;

    static Palisade::Core::Config::Limits testLimits();

private:
    ScopedTempDir _dir;
    std::shared_ptr<ForwardingBackend> _backend;
    std::unique_ptr<Palisade::Core::Gateway> _gateway;
};

// Log sink that keeps every entry for inspection
class CapturingSink : public Palisade::Core::Logging::ILogSink
{
public:
    void write(const Palisade::Core::Logging::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(_mutex);
        _entries.push_back(entry);
    }
    void flush() override {}

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto& e : _entries) {
            if (e.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }
    std::vector<Palisade::Core::Logging::LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _entries;
    }

private:
    mutable std::mutex _mutex;
    std::vector<Palisade::Core::Logging::LogEntry> _entries;
};

// Attaches a CapturingSink to the global logger for the scope's lifetime
class ScopedLogCapture
{
public:
    ScopedLogCapture()
        : _sink(std::make_shared<CapturingSink>()) {
        Palisade::Core::Logging::Logger::global().addSink(_sink);
    }
    ~ScopedLogCapture() {
        Palisade::Core::Logging::Logger::global().removeSink(_sink);
    }

    const CapturingSink& sink() const noexcept { return *_sink; }

private:
    std::shared_ptr<CapturingSink> _sink;
};

} // namespace palisade::test_helpers
