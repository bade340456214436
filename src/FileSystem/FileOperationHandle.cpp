/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "FileOperationHandle.h"

namespace Palisade::Core::IO {

std::string_view toString(FileOpStatus status) noexcept {
    switch (status) {
        case FileOpStatus::Pending:    return "Pending";
        case FileOpStatus::Validating: return "Validating";
        case FileOpStatus::Running:    return "Running";
        case FileOpStatus::Complete:   return "Complete";
        case FileOpStatus::Cancelled:  return "Cancelled";
        case FileOpStatus::Failed:     return "Failed";
        case FileOpStatus::TimedOut:   return "TimedOut";
    }
    return "Unknown";
}

std::string_view toString(FileError error) noexcept {
    switch (error) {
        case FileError::None:         return "None";
        case FileError::FileNotFound: return "FileNotFound";
        case FileError::AccessDenied: return "AccessDenied";
        case FileError::DiskFull:     return "DiskFull";
        case FileError::InvalidPath:  return "InvalidPath";
        case FileError::IOError:      return "IOError";
        case FileError::Timeout:      return "Timeout";
        case FileError::Cancelled:    return "Cancelled";
        case FileError::Conflict:     return "Conflict";
        case FileError::Unknown:      return "Unknown";
    }
    return "Unknown";
}

std::string_view describe(FileError error) noexcept {
    switch (error) {
        case FileError::None:         return "No error";
        case FileError::FileNotFound: return "File not found";
        case FileError::AccessDenied: return "Permission denied";
        case FileError::DiskFull:     return "Disk full or quota exceeded";
        case FileError::InvalidPath:  return "Invalid path";
        case FileError::IOError:      return "I/O error";
        case FileError::Timeout:      return "Operation timed out";
        case FileError::Cancelled:    return "Operation cancelled";
        case FileError::Conflict:     return "Destination already exists";
        case FileError::Unknown:      return "Unknown error";
    }
    return "Unknown error";
}

void FileOperationHandle::OpState::advance(FileOpStatus next) noexcept {
    std::lock_guard<std::mutex> lock(completionMutex);
    if (!claimed) {
        st.store(next, std::memory_order_release);
    }
}

bool FileOperationHandle::OpState::settle(FileOpStatus final, FileErrorInfo err, Results* produced) {
    Timer expiredTimer;
    std::function<void()> settledHook;
    {
        std::lock_guard<std::mutex> lock(completionMutex);
        if (claimed) {
            return false;
        }
        claimed = true;
        if (produced) {
            results = std::move(*produced);
        }
        error = std::move(err);
        st.store(final, std::memory_order_release);
        expiredTimer = std::move(timeout);
        settledHook = std::move(onSettled);
    }

    // Both run outside the completion lock; the timer callback itself takes it
    expiredTimer.invalidate();
    if (settledHook) {
        settledHook();
    }

    {
        std::lock_guard<std::mutex> lock(completionMutex);
        isComplete.store(true, std::memory_order_release);
    }
    completionCV.notify_all();
    return true;
}

void FileOperationHandle::wait() const {
    if (!_s) return;

    // Fast path - already complete
    if (_s->isComplete.load(std::memory_order_acquire)) {
        return;
    }

    std::unique_lock<std::mutex> lock(_s->completionMutex);
    _s->completionCV.wait(lock, [this] {
        return _s->isComplete.load(std::memory_order_acquire);
    });
}

bool FileOperationHandle::waitFor(std::chrono::milliseconds timeout) const {
    if (!_s) return true;
    if (_s->isComplete.load(std::memory_order_acquire)) {
        return true;
    }
    std::unique_lock<std::mutex> lock(_s->completionMutex);
    return _s->completionCV.wait_for(lock, timeout, [this] {
        return _s->isComplete.load(std::memory_order_acquire);
    });
}

FileOpStatus FileOperationHandle::status() const noexcept {
    return _s ? _s->st.load(std::memory_order_acquire) : FileOpStatus::Pending;
}

bool FileOperationHandle::isSettled() const noexcept {
    return _s && _s->isComplete.load(std::memory_order_acquire);
}

const std::string& FileOperationHandle::id() const noexcept {
    static const std::string empty;
    return _s ? _s->id : empty;
}

std::string FileOperationHandle::contentsText() const {
    if (!_s) return {};
    wait();
    return _s->results.text;
}

uint64_t FileOperationHandle::bytesWritten() const {
    if (!_s) return 0ULL;
    wait();
    return _s->results.wrote;
}

bool FileOperationHandle::exists() const {
    if (!_s) return false;
    wait();
    return _s->results.exists;
}

const std::optional<FileMetadata>& FileOperationHandle::metadata() const {
    static const std::optional<FileMetadata> empty;
    if (!_s) return empty;
    wait();
    return _s->results.metadata;
}

const std::vector<DirectoryEntry>& FileOperationHandle::directoryEntries() const {
    static const std::vector<DirectoryEntry> empty;
    if (!_s) return empty;
    wait();
    return _s->results.directoryEntries;
}

const std::optional<ThemeValidationResult>& FileOperationHandle::themeValidation() const {
    static const std::optional<ThemeValidationResult> empty;
    if (!_s) return empty;
    wait();
    return _s->results.themeValidation;
}

const std::optional<ThemeParseResult>& FileOperationHandle::themeParse() const {
    static const std::optional<ThemeParseResult> empty;
    if (!_s) return empty;
    wait();
    return _s->results.themeParse;
}

const std::optional<ExtensionBundleResult>& FileOperationHandle::bundle() const {
    static const std::optional<ExtensionBundleResult> empty;
    if (!_s) return empty;
    wait();
    return _s->results.bundle;
}

const FileErrorInfo& FileOperationHandle::errorInfo() const {
    static const FileErrorInfo emptyError;
    if (!_s) return emptyError;
    wait();
    return _s->error;
}

void FileOperationHandle::throwIfFailed() const {
    if (!_s) {
        throw FileProcessingError("Operation handle is empty");
    }
    wait();
    switch (status()) {
        case FileOpStatus::Complete:
            return;
        case FileOpStatus::Cancelled:
        case FileOpStatus::Failed:
        case FileOpStatus::TimedOut:
            throwError(_s->error.kind, _s->error.message);
        case FileOpStatus::Pending:
        case FileOpStatus::Validating:
        case FileOpStatus::Running:
            break;
    }
    throw FileProcessingError("Operation did not settle");
}

FileOperationHandle FileOperationHandle::immediate(FileOpStatus status, FileErrorInfo error) {
    auto state = std::make_shared<OpState>();
    state->st.store(status, std::memory_order_release);
    state->error = std::move(error);
    state->claimed = true;
    state->isComplete.store(true, std::memory_order_release);
    return FileOperationHandle(state);
}

} // namespace Palisade::Core::IO
