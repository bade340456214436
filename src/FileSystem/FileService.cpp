/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "FileService.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>
#include <vector>
#include "ContentHash.h"
#include "FileStream.h"
#include "LocalFileSystemBackend.h"
#include "Logging/Logger.h"

namespace fs = std::filesystem;

namespace Palisade::Core::IO {

namespace {

constexpr uint32_t kDefaultFileMode = 0644;
constexpr uint32_t kDefaultDirectoryMode = 0755;
constexpr const char* kCategory = "FileService";

// A typed failure that carries its own FileError code
class OperationError : public PalisadeError {
public:
    OperationError(ErrorKind kind, FileError code, const std::string& message)
        : PalisadeError(kind, message), _code(code) {}

    FileError code() const noexcept { return _code; }

private:
    FileError _code;
};

FileError codeFor(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:     return FileError::InvalidPath;
        case ErrorKind::Security:       return FileError::AccessDenied;
        case ErrorKind::FileProcessing: return FileError::IOError;
    }
    return FileError::Unknown;
}

[[noreturn]] void throwStreamError(const IoResult& result, const fs::path& path, const char* what) {
    int err = result.systemError != 0 ? result.systemError : EIO;
    throw fs::filesystem_error(what, path, std::error_code(err, std::generic_category()));
}

std::string lowerExtension(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string tooLarge(uint64_t size, uint64_t limit) {
    return "File too large (" + Core::Config::formatBytes(size) + "). Maximum size is " +
           Core::Config::formatBytes(limit);
}

} // namespace

struct FileService::OperationContext {
    CancellationToken token;
    ProgressCallback onProgress;

    void checkpoint() const { token.throwIfCancelled(); }

    void report(uint64_t processed, std::optional<uint64_t> total,
                const std::string& label, const std::string& file) const {
        if (!onProgress) return;
        ProgressEvent event;
        event.bytesProcessed = processed;
        event.totalBytes = total;
        if (total) {
            event.percentage = *total == 0
                ? 100.0
                : std::min(100.0, static_cast<double>(processed) * 100.0 / static_cast<double>(*total));
        }
        event.operation = label;
        event.currentFile = file;
        try {
            onProgress(event);
        } catch (const std::exception& e) {
            // A faulty observer must not fail the operation it observes
            PALISADE_LOG_WARNING_CAT(kCategory, std::string("Progress callback threw: ") + e.what());
        }
    }

    // For collaborators that build their own events
    ProgressCallback forward() const {
        if (!onProgress) return {};
        return [this](const ProgressEvent& event) {
            try {
                onProgress(event);
            } catch (const std::exception& e) {
                PALISADE_LOG_WARNING_CAT(kCategory, std::string("Progress callback threw: ") + e.what());
            }
        };
    }
};

struct FileService::ThemeCheck {
    ThemeValidationResult result;
    std::string content;
};

FileService::FileService(Security::SecurityService& security,
                         Concurrency::WorkService& work,
                         TimerService& timers,
                         const Core::Config::Limits& limits,
                         std::shared_ptr<IFileSystemBackend> backend)
    : _security(security)
    , _work(work)
    , _timers(timers)
    , _limits(limits)
    , _backend(backend ? std::move(backend) : std::make_shared<LocalFileSystemBackend>())
    , _parser(limits.file, limits.security)
    , _bundleWriter(limits.defaults) {
}

FileService::~FileService() {
    stop();
}

void FileService::start() {
    std::lock_guard<std::mutex> lock(_inFlightMutex);
    setState(ServiceState::Started);
}

void FileService::stop() {
    {
        std::lock_guard<std::mutex> lock(_inFlightMutex);
        if (state() != ServiceState::Started) return;
        setState(ServiceState::Stopped);
    }
    size_t cancelled = _registry.cancelAll();
    if (cancelled > 0) {
        PALISADE_LOG_INFO_CAT(kCategory, "Cancelled " + std::to_string(cancelled) + " operation(s) on shutdown");
    }
    std::unique_lock<std::mutex> lock(_inFlightMutex);
    _inFlightCV.wait(lock, [this] { return _inFlight == 0; });
}

void FileService::finishInFlight() {
    {
        std::lock_guard<std::mutex> lock(_inFlightMutex);
        --_inFlight;
    }
    _inFlightCV.notify_all();
}

std::chrono::milliseconds FileService::timeoutFor(const FileOperationOptions& options) const {
    return options.timeout.value_or(_limits.performance.operationTimeout);
}

size_t FileService::chunkSizeFor(const FileOperationOptions& options) const {
    uint64_t chunk = options.chunkSize ? *options.chunkSize : _limits.file.streamChunkSize;
    return static_cast<size_t>(std::max<uint64_t>(chunk, 1));
}

bool FileService::shouldStream(const FileOperationOptions& options, uint64_t size) const {
    return options.useStreaming || size > _limits.file.streamingThreshold;
}

FileOperationHandle FileService::launch(std::string_view failure,
                                        const FileOperationOptions& options,
                                        std::chrono::milliseconds timeout,
                                        const std::function<Work()>& prepare) {
    {
        std::lock_guard<std::mutex> lock(_inFlightMutex);
        if (!isRunning()) {
            return FileOperationHandle::immediate(
                FileOpStatus::Failed,
                {ErrorKind::FileProcessing, FileError::Unknown, "File service is not running"});
        }
        ++_inFlight;
    }

    auto state = std::make_shared<FileOperationHandle::OpState>();
    auto scope = std::make_shared<OperationRegistry::ActiveOperation>(_registry.begin(state));
    FileOperationHandle handle(state);
    bool submitted = false;

    state->advance(FileOpStatus::Validating);
    Work work;
    try {
        work = prepare();
    } catch (const PalisadeError& e) {
        PALISADE_LOG_WARNING_CAT(kCategory, std::string(failure) + ": " + e.what());
        state->settle(FileOpStatus::Failed, {e.kind(), codeFor(e.kind()), e.what()});
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT(kCategory, std::string(failure) + ": " + e.what());
        state->settle(FileOpStatus::Failed,
                      {ErrorKind::Validation, FileError::InvalidPath, "Invalid path provided"});
    } catch (const std::exception& e) {
        PALISADE_LOG_ERROR_CAT(kCategory, std::string(failure) + ": " + e.what());
        state->settle(FileOpStatus::Failed,
                      {ErrorKind::FileProcessing, FileError::Unknown,
                       std::string(failure) + ": " + std::string(describe(FileError::Unknown))});
    }

    if (work) {
        std::weak_ptr<FileOperationHandle::OpState> weak = state;
        try {
            Timer timer = _timers.scheduleTimer(timeout, [weak, timeout] {
                auto s = weak.lock();
                if (!s) return;
                FileErrorInfo info{ErrorKind::FileProcessing, FileError::Timeout,
                                   "File operation timed out after " + std::to_string(timeout.count()) + "ms"};
                if (s->settle(FileOpStatus::TimedOut, std::move(info))) {
                    s->cancellation.cancel();
                }
            });
            std::unique_lock<std::mutex> lock(state->completionMutex);
            if (!state->claimed) {
                state->timeout = std::move(timer);
            } else {
                lock.unlock();
                timer.invalidate();
            }
        } catch (const std::exception& e) {
            PALISADE_LOG_ERROR_CAT(kCategory, std::string("Could not arm operation timeout: ") + e.what());
            state->settle(FileOpStatus::Failed,
                          {ErrorKind::FileProcessing, FileError::Unknown, std::string(failure) + ": timer unavailable"});
            work = nullptr;
        }
    }

    if (work) {
        state->advance(FileOpStatus::Running);
        OperationContext ctx{state->cancellation.token(), options.onProgress};
        submitted = _work.submit([this, state, scope, work = std::move(work), ctx,
                                  failure = std::string(failure)]() mutable {
            execute(*state, ctx, work, failure);
            scope->release();
            finishInFlight();
        });
        if (!submitted) {
            state->settle(FileOpStatus::Failed,
                          {ErrorKind::FileProcessing, FileError::Unknown, std::string(failure) + ": worker pool unavailable"});
        }
    }

    if (!submitted) {
        scope->release();
        finishInFlight();
    }
    return handle;
}

void FileService::execute(FileOperationHandle::OpState& state, OperationContext& ctx,
                          const Work& work, const std::string& failure) {
    if (state.isComplete.load(std::memory_order_acquire)) {
        return;
    }

    FileOperationHandle::Results results;
    try {
        ctx.checkpoint();
        work(ctx, results);
        state.settle(FileOpStatus::Complete, {}, &results);
    } catch (const OperationError& e) {
        state.settle(FileOpStatus::Failed, {e.kind(), e.code(), e.what()});
    } catch (const PalisadeError& e) {
        if (ctx.token.isCancellationRequested()) {
            state.settle(FileOpStatus::Cancelled,
                         {ErrorKind::FileProcessing, FileError::Cancelled, "Operation cancelled"});
        } else {
            state.settle(FileOpStatus::Failed, {e.kind(), codeFor(e.kind()), e.what()});
        }
    } catch (const fs::filesystem_error& e) {
        FileError code = mapErrorCode(e.code());
        PALISADE_LOG_WARNING_CAT(kCategory, failure + ": " + e.what());
        if (ctx.token.isCancellationRequested()) {
            state.settle(FileOpStatus::Cancelled,
                         {ErrorKind::FileProcessing, FileError::Cancelled, "Operation cancelled"});
        } else {
            state.settle(FileOpStatus::Failed,
                         {ErrorKind::FileProcessing, code, failure + ": " + std::string(describe(code))});
        }
    } catch (const std::exception& e) {
        PALISADE_LOG_ERROR_CAT(kCategory, failure + ": " + e.what());
        state.settle(FileOpStatus::Failed,
                     {ErrorKind::FileProcessing, FileError::Unknown,
                      failure + ": " + std::string(describe(FileError::Unknown))});
    }
}

void FileService::requireAllowedExtension(const fs::path& path, std::string_view failure) const {
    if (!_security.pathValidator().validateExtension(path)) {
        PALISADE_LOG_WARNING_CAT(kCategory, std::string(failure) + ": extension rejected");
        throw SecurityError("File type not allowed");
    }
}

FileMetadata FileService::statWithHash(const fs::path& path, OperationContext& ctx) {
    FileMetadata info = _backend->getMetadata(path);
    if (!info.isRegularFile || info.size > _limits.file.streamingMaxSize) {
        return info;
    }
    try {
        info.contentHash = ContentHash::sha256File(*_backend, path, chunkSizeFor({}), ctx.token);
    } catch (const fs::filesystem_error& e) {
        PALISADE_LOG_WARNING_CAT(kCategory, std::string("Could not hash file: ") + e.what());
    } catch (const PalisadeError& e) {
        if (ctx.token.isCancellationRequested()) throw;
        PALISADE_LOG_WARNING_CAT(kCategory, std::string("Could not hash file: ") + e.what());
    }
    return info;
}

std::string FileService::readContents(const fs::path& path, uint64_t size,
                                      const FileOperationOptions& options, OperationContext& ctx) {
    const std::string file = path.string();
    if (size > _limits.file.streamingMaxSize) {
        throw OperationError(ErrorKind::FileProcessing, FileError::IOError,
                             tooLarge(size, _limits.file.streamingMaxSize));
    }

    if (!shouldStream(options, size)) {
        ctx.report(0, size, "Reading file", file);
        std::string contents = _backend->readFile(path);
        ctx.report(contents.size(), contents.size(), "Reading file completed", file);
        return contents;
    }

    auto stream = _backend->openStream(path, StreamOptions{StreamOptions::Read});
    std::vector<std::byte> chunk(chunkSizeFor(options));
    std::string contents;
    contents.reserve(static_cast<size_t>(size));

    uint64_t done = 0;
    uint64_t lastReport = 0;
    ctx.report(0, size, "Streaming file read", file);
    for (;;) {
        ctx.checkpoint();
        IoResult r = stream->read(chunk);
        if (!r.success()) {
            throwStreamError(r, path, "stream read");
        }
        if (r.bytesTransferred == 0) {
            break;
        }
        contents.append(reinterpret_cast<const char*>(chunk.data()), r.bytesTransferred);
        done += r.bytesTransferred;
        // The file may have grown since it was stat'ed
        if (done > _limits.file.streamingMaxSize) {
            throw OperationError(ErrorKind::FileProcessing, FileError::IOError,
                                 tooLarge(done, _limits.file.streamingMaxSize));
        }
        if (done - lastReport >= _limits.file.progressInterval) {
            ctx.report(done, std::max(size, done), "Streaming file read", file);
            lastReport = done;
        }
    }
    stream->close();
    ctx.report(done, done, "Streaming read completed", file);
    return contents;
}

uint64_t FileService::writeContents(const fs::path& path, std::string_view content,
                                    const FileOperationOptions& options, OperationContext& ctx) {
    const std::string file = path.string();
    const uint64_t total = content.size();
    const uint32_t mode = options.mode.value_or(kDefaultFileMode);

    if (!shouldStream(options, total)) {
        ctx.report(0, total, "Writing file", file);
        uint64_t wrote = _backend->writeFile(path, content, mode);
        ctx.report(wrote, total, "Writing file completed", file);
        return wrote;
    }

    StreamOptions streamOptions{StreamOptions::Write};
    streamOptions.permissions = mode;
    auto stream = _backend->openStream(path, streamOptions);
    const size_t chunkSize = chunkSizeFor(options);

    uint64_t done = 0;
    uint64_t lastReport = 0;
    ctx.report(0, total, "Streaming file write", file);
    while (done < total) {
        ctx.checkpoint();
        auto slice = content.substr(static_cast<size_t>(done), chunkSize);
        auto bytes = std::as_bytes(std::span<const char>(slice.data(), slice.size()));
        IoResult r = stream->write(bytes);
        if (!r.success() || r.bytesTransferred == 0) {
            throwStreamError(r, path, "stream write");
        }
        done += r.bytesTransferred;
        if (done - lastReport >= _limits.file.progressInterval) {
            ctx.report(done, total, "Streaming file write", file);
            lastReport = done;
        }
    }
    IoResult flushed = stream->flush();
    if (!flushed.success()) {
        throwStreamError(flushed, path, "stream flush");
    }
    stream->close();
    ctx.report(done, total, "Streaming write completed", file);
    return done;
}

FileOperationHandle FileService::exists(std::string_view path, const FileOperationOptions& options) {
    return launch("Existence check failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateFilePath(path, options.baseDir);
        return [this, target](OperationContext& ctx, FileOperationHandle::Results& out) {
            ctx.checkpoint();
            try {
                out.exists = _backend->exists(target);
            } catch (const fs::filesystem_error& e) {
                PALISADE_LOG_DEBUG_CAT(kCategory, std::string("Treating inaccessible path as missing: ") + e.what());
                out.exists = false;
            }
        };
    });
}

FileOperationHandle FileService::getMetadata(std::string_view path, const FileOperationOptions& options) {
    return launch("Failed to get file metadata", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateFilePath(path, options.baseDir);
        return [this, target](OperationContext& ctx, FileOperationHandle::Results& out) {
            out.metadata = statWithHash(target, ctx);
            out.exists = out.metadata->exists;
        };
    });
}

FileOperationHandle FileService::readFile(std::string_view path, const FileOperationOptions& options) {
    return launch("File read failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateFilePath(path, options.baseDir);
        return [this, target, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            FileMetadata info = _backend->getMetadata(target);
            if (info.isDirectory) {
                throw OperationError(ErrorKind::Validation, FileError::InvalidPath, "Path is a directory");
            }
            out.text = readContents(target, info.size, options, ctx);
        };
    });
}

FileOperationHandle FileService::writeFile(std::string_view path, std::string content,
                                           const FileOperationOptions& options) {
    auto payload = std::make_shared<const std::string>(std::move(content));
    return launch("File write failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateWritePath(path, options.baseDir);
        return [this, target, payload, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            ctx.checkpoint();
            if (options.createParents && target.path().has_parent_path()) {
                _backend->createDirectories(target.path().parent_path(), kDefaultDirectoryMode);
            }
            out.wrote = writeContents(target, *payload, options, ctx);
        };
    });
}

FileOperationHandle FileService::ensureDirectoryExists(std::string_view path, const FileOperationOptions& options) {
    return launch("Failed to create directory", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateDirectoryPath(path, options.baseDir);
        return [this, target, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            ctx.checkpoint();
            _backend->createDirectories(target, options.mode.value_or(kDefaultDirectoryMode));
            out.exists = true;
            ctx.report(1, 1, "Directory created", target.string());
        };
    });
}

void FileService::listInto(const Security::ValidatedPath& dir, const ListDirectoryOptions& options,
                           std::vector<DirectoryEntry>& out, OperationContext& ctx) {
    ctx.checkpoint();
    std::vector<std::string> names = _backend->listDirectory(dir);
    std::sort(names.begin(), names.end());
    ctx.report(0, std::nullopt, "Listing directory", dir.string());

    for (const auto& name : names) {
        ctx.checkpoint();
        if (!options.includeHidden && !name.empty() && name.front() == '.') {
            continue;
        }
        auto child = dir.child(name);
        DirectoryEntry entry;
        try {
            entry.metadata = _backend->getMetadata(child);
        } catch (const fs::filesystem_error& e) {
            PALISADE_LOG_WARNING_CAT(kCategory, std::string("Skipping inaccessible item: ") + e.what());
            continue;
        }
        entry.name = name;
        entry.fullPath = child.string();
        if (!entry.metadata.isDirectory) {
            entry.extension = lowerExtension(child.path());
        }

        const bool descend = options.recursive && entry.metadata.isDirectory && !entry.metadata.isSymlink;
        if (!options.filter || options.filter(entry)) {
            out.push_back(std::move(entry));
        }
        if (descend) {
            listInto(child, options, out, ctx);
        }
    }
}

FileOperationHandle FileService::listDirectory(std::string_view path, const ListDirectoryOptions& options) {
    return launch("Failed to list directory", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateDirectoryPath(path, options.baseDir);
        return [this, target, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            listInto(target, options, out.directoryEntries, ctx);
        };
    });
}

uint64_t FileService::copyFile(const Security::ValidatedPath& source, const Security::ValidatedPath& destination,
                               const FileMetadata& sourceInfo, const CopyOptions& options, OperationContext& ctx) {
    ctx.checkpoint();
    if (_backend->exists(destination) && !options.overwrite) {
        throw OperationError(ErrorKind::Validation, FileError::Conflict,
                             "Destination file exists and overwrite is not enabled");
    }

    const std::string file = source.string();
    const uint64_t total = sourceInfo.size;
    uint64_t done = 0;

    if (!shouldStream(options, total)) {
        ctx.report(0, total, "Copying file", file);
        _backend->copyFile(source, destination, options.overwrite);
        done = total;
        ctx.report(done, total, "File copy completed", file);
    } else {
        auto in = _backend->openStream(source, StreamOptions{StreamOptions::Read});
        StreamOptions writeOptions{StreamOptions::Write};
        writeOptions.permissions = options.mode.value_or(sourceInfo.permissions ? sourceInfo.permissions : kDefaultFileMode);
        auto out = _backend->openStream(destination, writeOptions);
        std::vector<std::byte> chunk(chunkSizeFor(options));

        uint64_t lastReport = 0;
        ctx.report(0, total, "Streaming file copy", file);
        for (;;) {
            ctx.checkpoint();
            IoResult r = in->read(chunk);
            if (!r.success()) {
                throwStreamError(r, source, "stream read");
            }
            if (r.bytesTransferred == 0) {
                break;
            }
            std::span<const std::byte> pending(chunk.data(), r.bytesTransferred);
            while (!pending.empty()) {
                IoResult w = out->write(pending);
                if (!w.success() || w.bytesTransferred == 0) {
                    throwStreamError(w, destination, "stream write");
                }
                pending = pending.subspan(w.bytesTransferred);
            }
            done += r.bytesTransferred;
            if (done - lastReport >= _limits.file.progressInterval) {
                ctx.report(done, std::max(total, done), "Streaming file copy", file);
                lastReport = done;
            }
        }
        IoResult flushed = out->flush();
        if (!flushed.success()) {
            throwStreamError(flushed, destination, "stream flush");
        }
        out->close();
        ctx.report(done, done, "Streaming copy completed", file);
    }

    if (options.preserveTimestamps) {
        _backend->setTimes(destination, sourceInfo.lastAccessed, sourceInfo.lastModified);
    }
    return done;
}

uint64_t FileService::copyDirectory(const Security::ValidatedPath& source, const Security::ValidatedPath& destination,
                                    const FileMetadata& sourceInfo, const CopyOptions& options, OperationContext& ctx) {
    ctx.checkpoint();
    ctx.report(0, std::nullopt, "Copying directory", source.string());
    _backend->createDirectories(destination, options.mode.value_or(kDefaultDirectoryMode));

    std::vector<std::string> names = _backend->listDirectory(source);
    std::sort(names.begin(), names.end());

    uint64_t copied = 0;
    for (const auto& name : names) {
        ctx.checkpoint();
        auto from = source.child(name);
        auto to = destination.child(name);
        if (options.filter && !options.filter(from.path(), to.path())) {
            continue;
        }
        FileMetadata info = _backend->getMetadata(from);
        if (info.isSymlink) {
            // Links are not followed; the target may lie outside the validated tree
            PALISADE_LOG_DEBUG_CAT(kCategory, "Not copying symbolic link " + from.string());
            continue;
        }
        if (info.isDirectory) {
            copied += copyDirectory(from, to, info, options, ctx);
        } else if (!_security.pathValidator().validateExtension(from.path())) {
            PALISADE_LOG_WARNING_CAT(kCategory, "Not copying file of disallowed type " + from.string());
        } else {
            copied += copyFile(from, to, info, options, ctx);
        }
    }

    if (options.preserveTimestamps) {
        _backend->setTimes(destination, sourceInfo.lastAccessed, sourceInfo.lastModified);
    }
    return copied;
}

FileOperationHandle FileService::copy(std::string_view source, std::string_view destination,
                                      const CopyOptions& options) {
    return launch("File copy failed", options, timeoutFor(options), [&]() -> Work {
        auto from = _security.validateDirectoryPath(source, options.baseDir);
        auto to = _security.validateWritePath(destination, options.baseDir, false);
        if (Security::PathValidator::isWithin(to.path(), from.path())) {
            throw ValidationError("Destination is inside the source");
        }
        return [this, from, to, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            ctx.checkpoint();
            FileMetadata info = _backend->getMetadata(from);
            if (info.isDirectory) {
                out.wrote = copyDirectory(from, to, info, options, ctx);
            } else {
                requireAllowedExtension(from, "File copy failed");
                requireAllowedExtension(to, "File copy failed");
                out.wrote = copyFile(from, to, info, options, ctx);
            }
        };
    });
}

FileOperationHandle FileService::remove(std::string_view path, const FileOperationOptions& options) {
    return launch("File deletion failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateRemovalPath(path, options.baseDir);
        return [this, target](OperationContext& ctx, FileOperationHandle::Results& out) {
            ctx.checkpoint();
            FileMetadata info = _backend->getMetadata(target);
            const std::string file = target.string();
            if (info.isDirectory && !info.isSymlink) {
                ctx.report(0, std::nullopt, "Deleting directory", file);
                _backend->removeAll(target);
                ctx.report(1, 1, "Directory deleted", file);
            } else {
                requireAllowedExtension(target, "File deletion failed");
                ctx.report(0, info.size, "Deleting file", file);
                _backend->removeFile(target);
                ctx.report(info.size, info.size, "File deleted", file);
            }
            out.exists = false;
        };
    });
}

FileService::ThemeCheck FileService::checkThemeFile(const Security::ValidatedPath& path,
                                                    const FileOperationOptions& options,
                                                    OperationContext& ctx) {
    ThemeCheck check;
    ThemeValidationResult& result = check.result;
    const std::string file = path.string();

    ctx.checkpoint();
    if (!_backend->exists(path)) {
        result.error = "File does not exist";
        result.suggestions = {"Check the file path for typos", "Make sure the file has not been moved or deleted"};
        return check;
    }

    FileMetadata info = _backend->getMetadata(path);
    result.metadata = info;
    if (!info.isRegularFile) {
        result.error = "Path is not a regular file";
        result.suggestions = {"Select a theme file rather than a directory"};
        return check;
    }
    if (!ThemeFileParser::hasThemeExtension(path)) {
        result.error = "Invalid file extension. Expected .txt or .theme file";
        result.suggestions = {"Rename the file with a .txt or .theme extension"};
        return check;
    }
    if (info.size > _limits.file.maxSize) {
        result.error = tooLarge(info.size, _limits.file.maxSize);
        result.suggestions = {"Remove unused lines from the theme file", "Split the theme into smaller files"};
        return check;
    }

    FileOperationOptions quiet = options;
    quiet.onProgress = nullptr;
    OperationContext reader{ctx.token, nullptr};
    ctx.report(0, info.size, "Validating theme file", file);
    check.content = readContents(path, info.size, quiet, reader);

    ThemeValidationResult verdict = _parser.validateContent(check.content);
    verdict.metadata = std::move(result.metadata);
    result = std::move(verdict);
    ctx.report(info.size, info.size, "Validating theme file", file);
    return check;
}

FileOperationHandle FileService::validateThemeFile(std::string_view path, const FileOperationOptions& options) {
    return launch("Theme validation failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateFilePath(path, options.baseDir);
        return [this, target, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            try {
                out.themeValidation = checkThemeFile(target, options, ctx).result;
            } catch (const fs::filesystem_error& e) {
                PALISADE_LOG_WARNING_CAT(kCategory, std::string("Theme validation failed: ") + e.what());
                ThemeValidationResult failed;
                failed.error = "Validation failed: " + std::string(describe(mapErrorCode(e.code())));
                failed.suggestions = {"Check file permissions", "Ensure file exists", "Verify file format"};
                out.themeValidation = std::move(failed);
            }
        };
    });
}

FileOperationHandle FileService::parseThemeFile(std::string_view path, const FileOperationOptions& options) {
    return launch("Theme parsing failed", options, timeoutFor(options), [&]() -> Work {
        auto target = _security.validateFilePath(path, options.baseDir);
        return [this, target, options](OperationContext& ctx, FileOperationHandle::Results& out) {
            ThemeParseResult parsed;
            try {
                ThemeCheck check = checkThemeFile(target, options, ctx);
                out.themeValidation = check.result;
                if (!check.result.isValid) {
                    parsed.error = check.result.error.value_or("Invalid theme file");
                    parsed.warnings = check.result.warnings;
                } else {
                    const uint64_t size = check.content.size();
                    ctx.report(0, size, "Parsing theme file", target.string());
                    parsed = _parser.parse(check.content);
                    ctx.report(size, size, "Parsing theme file", target.string());
                }
            } catch (const fs::filesystem_error& e) {
                PALISADE_LOG_WARNING_CAT(kCategory, std::string("Theme parsing failed: ") + e.what());
                parsed = ThemeParseResult{};
                parsed.error = "Parsing failed: " + std::string(describe(mapErrorCode(e.code())));
            }
            out.themeParse = std::move(parsed);
        };
    });
}

FileOperationHandle FileService::generateExtensionBundle(std::string_view outputDir,
                                                         const ThemeColors& colors,
                                                         const Security::ThemeInputFields& config,
                                                         const FileOperationOptions& options) {
    auto timeout = options.timeout.value_or(_limits.performance.extendedTimeout);
    return launch("Extension generation failed", options, timeout, [&]() -> Work {
        Security::ThemeInputFields input = config;
        input.outputPath.reset();
        auto fields = _security.validateThemeInput(input);
        if (fields.name.empty()) {
            throw ValidationError("Theme name is required");
        }
        auto target = _security.validateWritePath(outputDir, options.baseDir, false);
        return [this, target, fields, colors](OperationContext& ctx, FileOperationHandle::Results& out) {
            out.bundle = _bundleWriter.write(*_backend, target, fields, colors, ctx.forward(), ctx.token);
            out.wrote = out.bundle->files.size();
        };
    });
}

bool FileService::cancel(const std::string& operationId) {
    return _registry.cancel(operationId);
}

size_t FileService::cancelAll() {
    return _registry.cancelAll();
}

size_t FileService::activeOperationCount() const {
    return _registry.size();
}

void FileService::cleanup() {
    cancelAll();
    _security.cleanup();
}

} // namespace Palisade::Core::IO
