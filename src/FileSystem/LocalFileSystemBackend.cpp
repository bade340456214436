/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "LocalFileSystemBackend.h"
#include "FileStream.h"
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>     // open(), utimensat()
#include <unistd.h>    // read(), write(), close()
#include <sys/stat.h>  // stat(), mkdir(), statx()
#else
#error "LocalFileSystemBackend requires a POSIX platform"
#endif

namespace fs = std::filesystem;

namespace Palisade::Core::IO {

FileError mapErrnoToFileError(int err) noexcept {
    switch (err) {
        case 0:
            return FileError::None;
        case ENOSPC:
        case EDQUOT:  // Disk quota exceeded (POSIX)
            return FileError::DiskFull;
        case EACCES:
        case EPERM:
        case EROFS:
            return FileError::AccessDenied;
        case ENOENT:
            return FileError::FileNotFound;
        case EINVAL:
        case ENAMETOOLONG:
        case EISDIR:
        case ENOTDIR:
        case ELOOP:
            return FileError::InvalidPath;
        case EEXIST:
        case ENOTEMPTY:
            return FileError::Conflict;
        case ETIMEDOUT:
            return FileError::Timeout;
        default:
            return FileError::IOError;
    }
}

FileError mapErrorCode(const std::error_code& ec) noexcept {
    if (!ec) return FileError::None;
    auto condition = ec.default_error_condition();
    if (condition.category() == std::generic_category()) {
        return mapErrnoToFileError(condition.value());
    }
    return FileError::IOError;
}

namespace {
    [[noreturn]] void throwErrno(const char* what, const fs::path& p, int err) {
        throw fs::filesystem_error(what, p, std::error_code(err, std::generic_category()));
    }

    std::chrono::system_clock::time_point toTimePoint(int64_t seconds, int64_t nanoseconds) {
        auto since = std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanoseconds);
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since));
    }

    timespec toTimespec(std::optional<std::chrono::system_clock::time_point> tp) {
        timespec ts{};
        if (!tp) {
            ts.tv_nsec = UTIME_OMIT;
            return ts;
        }
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp->time_since_epoch()).count();
        ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
        ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
        if (ts.tv_nsec < 0) {
            ts.tv_nsec += 1000000000L;
            ts.tv_sec -= 1;
        }
        return ts;
    }

    int openRetrying(const fs::path& p, int flags, mode_t mode) {
        int fd;
        do {
            fd = ::open(p.c_str(), flags, mode);
        } while (fd < 0 && errno == EINTR);
        return fd;
    }

    // Writes all of data or returns the errno that stopped it
    int writeAll(int fd, const char* data, size_t size, size_t& written) {
        written = 0;
        while (written < size) {
            ssize_t n = ::write(fd, data + written, size - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return errno;
            }
            written += static_cast<size_t>(n);
        }
        return 0;
    }
}

// Concrete FileStream over a POSIX descriptor
class LocalFileStream : public FileStream {
public:
    LocalFileStream(int fd, std::string path)
        : _fd(fd), _path(std::move(path)) {}

    ~LocalFileStream() override {
        close();
    }

    IoResult read(std::span<std::byte> buffer) override {
        IoResult result;
        if (_fd < 0) {
            result.error = FileError::IOError;
            return result;
        }
        if (buffer.empty()) {
            result.complete = true;
            return result;
        }

        ssize_t n;
        do {
            n = ::read(_fd, buffer.data(), buffer.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            result.systemError = errno;
            result.error = mapErrnoToFileError(result.systemError);
            _failed = true;
            return result;
        }
        result.bytesTransferred = static_cast<size_t>(n);
        if (n == 0) {
            _eof = true;
        }
        result.complete = _eof || result.bytesTransferred == buffer.size();
        return result;
    }

    IoResult write(std::span<const std::byte> data) override {
        IoResult result;
        if (_fd < 0) {
            result.error = FileError::IOError;
            return result;
        }
        size_t written = 0;
        int err = writeAll(_fd, reinterpret_cast<const char*>(data.data()), data.size(), written);
        result.bytesTransferred = written;
        if (err != 0) {
            result.systemError = err;
            result.error = mapErrnoToFileError(err);
            _failed = true;
        } else {
            result.complete = true;
        }
        return result;
    }

    bool good() const override { return _fd >= 0 && !_failed; }
    bool eof() const override { return _eof; }

    IoResult flush() override {
        // Descriptor writes are unbuffered; nothing to push
        IoResult result;
        result.complete = true;
        return result;
    }

    void close() override {
        if (_fd >= 0) {
            ::close(_fd);
            _fd = -1;
        }
    }

    std::string path() const override { return _path; }

private:
    int _fd = -1;
    std::string _path;
    bool _eof = false;
    bool _failed = false;
};

FileMetadata LocalFileSystemBackend::getMetadata(const fs::path& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        throwErrno("lstat", path, errno);
    }

    FileMetadata md;
    md.path = path.string();
    md.isSymlink = S_ISLNK(st.st_mode);
    if (md.isSymlink && ::stat(path.c_str(), &st) != 0) {
        throwErrno("stat", path, errno);
    }

    md.exists = true;
    md.isDirectory = S_ISDIR(st.st_mode);
    md.isRegularFile = S_ISREG(st.st_mode);
    md.size = static_cast<uintmax_t>(st.st_size);
    md.permissions = static_cast<uint32_t>(st.st_mode & 07777);

#if defined(__APPLE__)
    md.lastModified = toTimePoint(st.st_mtimespec.tv_sec, st.st_mtimespec.tv_nsec);
    md.lastAccessed = toTimePoint(st.st_atimespec.tv_sec, st.st_atimespec.tv_nsec);
    md.created = toTimePoint(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
#else
    md.lastModified = toTimePoint(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    md.lastAccessed = toTimePoint(st.st_atim.tv_sec, st.st_atim.tv_nsec);
#if defined(__linux__) && defined(STATX_BTIME)
    struct statx stx{};
    if (::statx(AT_FDCWD, path.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME)) {
        md.created = toTimePoint(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
    }
#endif
#endif
    return md;
}

bool LocalFileSystemBackend::exists(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) == 0) {
        return true;
    }
    int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
        return false;
    }
    throwErrno("stat", path, err);
}

std::string LocalFileSystemBackend::readFile(const fs::path& path) {
    int fd = openRetrying(path, O_RDONLY | O_CLOEXEC, 0);
    if (fd < 0) {
        throwErrno("open", path, errno);
    }
    LocalFileStream stream(fd, path.string());

    std::string contents;
    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        contents.reserve(static_cast<size_t>(st.st_size));
    }

    std::vector<std::byte> buffer(64 * 1024);
    for (;;) {
        auto result = stream.read(buffer);
        if (!result.success()) {
            throwErrno("read", path, result.systemError != 0 ? result.systemError : EIO);
        }
        if (result.bytesTransferred == 0) {
            break;
        }
        contents.append(reinterpret_cast<const char*>(buffer.data()), result.bytesTransferred);
    }
    return contents;
}

uint64_t LocalFileSystemBackend::writeFile(const fs::path& path, std::string_view data, uint32_t permissions) {
    int fd = openRetrying(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, static_cast<mode_t>(permissions));
    if (fd < 0) {
        throwErrno("open", path, errno);
    }
    size_t written = 0;
    int err = writeAll(fd, data.data(), data.size(), written);
    if (::close(fd) != 0 && err == 0) {
        err = errno;
    }
    if (err != 0) {
        throwErrno("write", path, err);
    }
    return written;
}

std::unique_ptr<FileStream> LocalFileSystemBackend::openStream(const fs::path& path, StreamOptions options) {
    int flags = O_CLOEXEC;
    switch (options.mode) {
        case StreamOptions::Read:
            flags |= O_RDONLY;
            break;
        case StreamOptions::Write:
            flags |= O_WRONLY | O_CREAT | O_TRUNC;
            break;
    }
    int fd = openRetrying(path, flags, static_cast<mode_t>(options.permissions));
    if (fd < 0) {
        throwErrno("open", path, errno);
    }
    return std::make_unique<LocalFileStream>(fd, path.string());
}

void LocalFileSystemBackend::createDirectories(const fs::path& path, uint32_t permissions) {
    fs::path current;
    for (const auto& part : path.lexically_normal()) {
        if (part.empty()) continue;
        current /= part;
        if (::mkdir(current.c_str(), static_cast<mode_t>(permissions)) == 0) {
            continue;
        }
        int err = errno;
        if (err == EEXIST) {
            struct stat st{};
            if (::stat(current.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
                continue;
            }
            throwErrno("mkdir", current, ENOTDIR);
        }
        throwErrno("mkdir", current, err);
    }
}

std::vector<std::string> LocalFileSystemBackend::listDirectory(const fs::path& path) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(path)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

void LocalFileSystemBackend::removeFile(const fs::path& path) {
    if (::unlink(path.c_str()) != 0) {
        throwErrno("unlink", path, errno);
    }
}

uintmax_t LocalFileSystemBackend::removeAll(const fs::path& path) {
    return fs::remove_all(path);
}

void LocalFileSystemBackend::copyFile(const fs::path& source, const fs::path& destination, bool overwrite) {
    auto options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    fs::copy_file(source, destination, options);
}

void LocalFileSystemBackend::setTimes(const fs::path& path,
                                      std::optional<std::chrono::system_clock::time_point> accessed,
                                      std::optional<std::chrono::system_clock::time_point> modified) {
    timespec times[2] = {toTimespec(accessed), toTimespec(modified)};
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        throwErrno("utimensat", path, errno);
    }
}

} // namespace Palisade::Core::IO
