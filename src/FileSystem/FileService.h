/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file FileService.h
 * @brief Every filesystem operation, routed through SecurityService first
 *
 * Each operation follows the same lifecycle:
 *  - Pending: an id is minted and the operation is registered
 *  - Validating: the path goes through SecurityService on the calling thread,
 *    before any filesystem call; a rejection settles the handle as Failed
 *    with the validator's error kind
 *  - Running: the I/O runs on a WorkService worker while a TimerService
 *    timer races it
 *  - Complete, Cancelled, Failed or TimedOut, after which the operation is
 *    deregistered
 *
 * Files above FileLimits::streamingThreshold (or any file when useStreaming
 * is set) are moved in chunks, with cancellation observed between chunks and
 * progress reported at least every FileLimits::progressInterval bytes.
 *
 * @code
 * auto handle = files.readFile("themes/nord.txt");
 * handle.wait();
 * if (handle.status() == IO::FileOpStatus::Complete) {
 *     use(handle.contentsText());
 * }
 * @endcode
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include "Concurrency/WorkService.h"
#include "Config/Limits.h"
#include "Core/PalisadeService.h"
#include "Core/TimerService.h"
#include "ExtensionBundleWriter.h"
#include "FileOperationHandle.h"
#include "IFileSystemBackend.h"
#include "OperationRegistry.h"
#include "Security/SecurityService.h"
#include "ThemeFileParser.h"

namespace Palisade::Core::IO {

struct FileOperationOptions {
    ProgressCallback onProgress;                            ///< Runs synchronously on the worker thread
    std::optional<std::chrono::milliseconds> timeout;       ///< Defaults to PerformanceLimits::operationTimeout
    std::optional<std::filesystem::path> baseDir;           ///< Relative paths resolve here; defaults to cwd
    bool createParents = false;                             ///< writeFile: create missing parent directories
    std::optional<uint32_t> mode;                           ///< Defaults to 0644 for files, 0755 for directories
    bool useStreaming = false;                              ///< Force chunked I/O below the threshold
    std::optional<size_t> chunkSize;                        ///< Defaults to FileLimits::streamChunkSize
};

struct ListDirectoryOptions : FileOperationOptions {
    bool recursive = false;
    bool includeHidden = false;
    std::function<bool(const DirectoryEntry&)> filter;      ///< Entries failing the filter are left out
};

struct CopyOptions : FileOperationOptions {
    bool overwrite = false;
    bool preserveTimestamps = false;
    /// Directory copies: return false to skip a (source, destination) pair
    std::function<bool(const std::filesystem::path&, const std::filesystem::path&)> filter;
};

class FileService : public PalisadeService {
public:
    /**
     * @param backend Filesystem primitives; a LocalFileSystemBackend when null
     */
    FileService(Security::SecurityService& security,
                Concurrency::WorkService& work,
                TimerService& timers,
                const Core::Config::Limits& limits,
                std::shared_ptr<IFileSystemBackend> backend = nullptr);
    ~FileService() override;

    FileService(const FileService&) = delete;
    FileService& operator=(const FileService&) = delete;

    const char* id() const override { return "com.palisade.core.files"; }
    const char* name() const override { return "FileService"; }

    void start() override;

    /// Cancels everything in flight and waits for the workers to let go
    void stop() override;

    /// Completes with exists() false when the target is missing or inaccessible
    FileOperationHandle exists(std::string_view path, const FileOperationOptions& options = {});

    /// Stat plus a SHA-256 content hash for regular files up to streamingMaxSize
    FileOperationHandle getMetadata(std::string_view path, const FileOperationOptions& options = {});

    FileOperationHandle readFile(std::string_view path, const FileOperationOptions& options = {});
    FileOperationHandle writeFile(std::string_view path, std::string content, const FileOperationOptions& options = {});

    /// Recursive mkdir; succeeds when the directory already exists
    FileOperationHandle ensureDirectoryExists(std::string_view path, const FileOperationOptions& options = {});

    /// Dot-entries are skipped unless includeHidden; symlinked directories are not followed
    FileOperationHandle listDirectory(std::string_view path, const ListDirectoryOptions& options = {});

    /**
     * @brief Copies a file or a directory tree
     *
     * An existing destination file fails with a ValidationError unless
     * overwrite is set. bytesWritten() reports the total bytes copied.
     */
    FileOperationHandle copy(std::string_view source, std::string_view destination, const CopyOptions& options = {});

    /// Unlinks a file or removes a directory recursively
    FileOperationHandle remove(std::string_view path, const FileOperationOptions& options = {});

    /**
     * @brief Checks a theme file's existence, type, size and content
     *
     * The verdict is in themeValidation(); problems with the file show up
     * there as isValid == false rather than as a failed handle.
     */
    FileOperationHandle validateThemeFile(std::string_view path, const FileOperationOptions& options = {});

    /// validateThemeFile() followed by extraction of the color table into themeParse()
    FileOperationHandle parseThemeFile(std::string_view path, const FileOperationOptions& options = {});

    /**
     * @brief Writes a VS Code extension for a parsed theme into outputDir
     *
     * Uses PerformanceLimits::extendedTimeout unless options.timeout is set.
     * config.outputPath is ignored; outputDir names the target.
     */
    FileOperationHandle generateExtensionBundle(std::string_view outputDir,
                                                const ThemeColors& colors,
                                                const Security::ThemeInputFields& config,
                                                const FileOperationOptions& options = {});

    /// @return false for unknown or already settled ids
    bool cancel(const std::string& operationId);
    size_t cancelAll();
    size_t activeOperationCount() const;

    /// cancelAll() followed by SecurityService::cleanup()
    void cleanup();

    IFileSystemBackend& backend() noexcept { return *_backend; }
    const ThemeFileParser& themeParser() const noexcept { return _parser; }

private:
    struct OperationContext;
    struct ThemeCheck;
    using Work = std::function<void(OperationContext&, FileOperationHandle::Results&)>;

    FileOperationHandle launch(std::string_view failure,
                               const FileOperationOptions& options,
                               std::chrono::milliseconds timeout,
                               const std::function<Work()>& prepare);
    void execute(FileOperationHandle::OpState& state, OperationContext& ctx,
                 const Work& work, const std::string& failure);

    std::chrono::milliseconds timeoutFor(const FileOperationOptions& options) const;
    size_t chunkSizeFor(const FileOperationOptions& options) const;
    bool shouldStream(const FileOperationOptions& options, uint64_t size) const;

    FileMetadata statWithHash(const std::filesystem::path& path, OperationContext& ctx);
    std::string readContents(const std::filesystem::path& path, uint64_t size,
                             const FileOperationOptions& options, OperationContext& ctx);
    uint64_t writeContents(const std::filesystem::path& path, std::string_view content,
                           const FileOperationOptions& options, OperationContext& ctx);
    void listInto(const Security::ValidatedPath& dir, const ListDirectoryOptions& options,
                  std::vector<DirectoryEntry>& out, OperationContext& ctx);
    uint64_t copyFile(const Security::ValidatedPath& source, const Security::ValidatedPath& destination,
                      const FileMetadata& sourceInfo, const CopyOptions& options, OperationContext& ctx);
    uint64_t copyDirectory(const Security::ValidatedPath& source, const Security::ValidatedPath& destination,
                           const FileMetadata& sourceInfo, const CopyOptions& options, OperationContext& ctx);
    ThemeCheck checkThemeFile(const Security::ValidatedPath& path, const FileOperationOptions& options,
                              OperationContext& ctx);
    void requireAllowedExtension(const std::filesystem::path& path, std::string_view failure) const;

    void finishInFlight();

    Security::SecurityService& _security;
    Concurrency::WorkService& _work;
    TimerService& _timers;
    Core::Config::Limits _limits;
    std::shared_ptr<IFileSystemBackend> _backend;
    ThemeFileParser _parser;
    ExtensionBundleWriter _bundleWriter;
    OperationRegistry _registry;

    mutable std::mutex _inFlightMutex;
    std::condition_variable _inFlightCV;
    size_t _inFlight = 0;
};

} // namespace Palisade::Core::IO
