/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file FileOperationHandle.h
 * @brief Shared-state handle for asynchronous file operations
 *
 * Every FileService operation returns a FileOperationHandle immediately. The
 * operation settles exactly once into Complete, Cancelled, Failed or TimedOut;
 * whichever of I/O completion, timeout or cancellation gets there first wins
 * and the others become no-ops. Result accessors block until settlement.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Core/CancellationToken.h"
#include "Core/Errors.h"
#include "Core/Timer.h"

namespace Palisade::Core::IO {

enum class FileOpStatus { Pending, Validating, Running, Complete, Cancelled, Failed, TimedOut };

std::string_view toString(FileOpStatus status) noexcept;

/**
 * Error codes surfaced on failed handles.
 * Mapping guidelines:
 * - FileNotFound: path does not exist when required (read/stat/copy source)
 * - AccessDenied: denied by OS permissions or by the security layer
 * - DiskFull: ENOSPC/EDQUOT or equivalent on write
 * - InvalidPath: malformed path, name too long, wrong file type, failed validation
 * - IOError: other local I/O failures
 * - Timeout: the operation outlived its deadline
 * - Cancelled: cancel() or cancelAll() settled the operation
 * - Conflict: destination exists and overwriting was not requested
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    IOError,
    Timeout,
    Cancelled,
    Conflict,
    Unknown
};

std::string_view toString(FileError error) noexcept;

// Short user-facing description with no OS detail, e.g. "File not found"
std::string_view describe(FileError error) noexcept;

// message is already scrubbed of OS error codes and absolute paths
struct FileErrorInfo {
    ErrorKind kind = ErrorKind::FileProcessing;
    FileError code = FileError::None;
    std::string message;
};

struct FileMetadata {
    std::string path;
    bool exists = false;
    bool isDirectory = false;
    bool isRegularFile = false;
    bool isSymlink = false;
    uintmax_t size = 0;
    uint32_t permissions = 0;   ///< POSIX permission bits (0777 mask)
    std::optional<std::chrono::system_clock::time_point> created;  ///< Birth time where the platform records it
    std::optional<std::chrono::system_clock::time_point> lastModified;
    std::optional<std::chrono::system_clock::time_point> lastAccessed;
    std::optional<std::string> contentHash;   ///< Lower-case hex SHA-256
};

struct DirectoryEntry {
    std::string name;           // Just the filename, not full path
    std::string fullPath;       // Complete absolute path
    std::string extension;      // Lower-case, with the dot; empty for directories
    FileMetadata metadata;
};

struct ProgressEvent {
    uint64_t bytesProcessed = 0;
    std::optional<uint64_t> totalBytes;
    std::optional<double> percentage;
    std::string operation;      ///< Human readable label, e.g. "Streaming file read"
    std::string currentFile;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct ThemeValidationResult {
    bool isValid = false;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
    std::optional<FileMetadata> metadata;
};

using ThemeColors = std::map<std::string, std::string>;

struct ThemeParseResult {
    bool success = false;
    ThemeColors colors;                 ///< key -> lower-cased color value
    size_t colorCount = 0;
    std::vector<std::string> invalidLines;
    std::vector<std::string> warnings;
    std::optional<std::string> error;
};

struct ExtensionBundleResult {
    std::filesystem::path outputDir;
    std::string packageName;
    std::vector<std::filesystem::path> files;         ///< In write order
    std::vector<std::filesystem::path> directories;
};

class FileOperationHandle {
public:
    FileOperationHandle() = default;

    /// Blocks until the operation settles
    void wait() const;

    /// Waits at most timeout; returns true when the operation has settled
    bool waitFor(std::chrono::milliseconds timeout) const;

    FileOpStatus status() const noexcept;
    bool isSettled() const noexcept;

    /// Operation id usable with FileService::cancel(); empty for default handles
    const std::string& id() const noexcept;

    // Result accessors - block until settled
    std::string contentsText() const;
    uint64_t bytesWritten() const;
    bool exists() const;
    const std::optional<FileMetadata>& metadata() const;
    const std::vector<DirectoryEntry>& directoryEntries() const;
    const std::optional<ThemeValidationResult>& themeValidation() const;
    const std::optional<ThemeParseResult>& themeParse() const;
    const std::optional<ExtensionBundleResult>& bundle() const;

    // Error information - only meaningful once status is Failed, Cancelled or TimedOut
    const FileErrorInfo& errorInfo() const;

    /// Waits, then throws the typed PalisadeError for any non-Complete outcome
    void throwIfFailed() const;

    // Factory for an already settled handle (no async work needed)
    static FileOperationHandle immediate(FileOpStatus status, FileErrorInfo error = {});

private:
    struct Results {
        std::string text;
        uint64_t wrote = 0;
        bool exists = false;
        std::optional<FileMetadata> metadata;
        std::vector<DirectoryEntry> directoryEntries;
        std::optional<ThemeValidationResult> themeValidation;
        std::optional<ThemeParseResult> themeParse;
        std::optional<ExtensionBundleResult> bundle;
    };

    struct OpState {
        std::string id;
        std::atomic<FileOpStatus> st{FileOpStatus::Pending};
        mutable std::mutex completionMutex;
        mutable std::condition_variable completionCV;
        std::atomic<bool> isComplete{false};
        bool claimed = false;   // Guarded by completionMutex; set by the one settle() that wins

        CancellationSource cancellation;

        // Guarded by completionMutex until settlement hands them out
        Timer timeout;
        std::function<void()> onSettled;

        // Result data - only valid after completion
        Results results;
        FileErrorInfo error;

        void advance(FileOpStatus next) noexcept;

        /**
         * @brief Settles the operation once
         *
         * Stores the final status, error and results under the completion lock,
         * then releases the timeout timer and runs onSettled outside of it.
         * Waiters are released only after onSettled has returned.
         * @return false when another path already settled the operation
         */
        bool settle(FileOpStatus final, FileErrorInfo err, Results* results = nullptr);
    };

    std::shared_ptr<OpState> _s;
    explicit FileOperationHandle(std::shared_ptr<OpState> s) : _s(std::move(s)) {}

    friend class FileService;
    friend class OperationRegistry;
};

} // namespace Palisade::Core::IO
