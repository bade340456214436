/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include "FileOperationHandle.h"

namespace Palisade::Core::IO {

// Result structure for I/O operations
struct IoResult {
    size_t bytesTransferred = 0;
    bool complete = false;
    std::optional<FileError> error;
    int systemError = 0;    ///< errno behind error, for logging only

    bool success() const { return !error.has_value(); }
};

// Pure interface for chunked file access
class FileStream {
public:
    virtual ~FileStream() = default;

    // Read into buffer, returns actual bytes read; zero bytes with complete=true at EOF
    virtual IoResult read(std::span<std::byte> buffer) = 0;

    // Write data, returns actual bytes written
    virtual IoResult write(std::span<const std::byte> data) = 0;

    virtual bool good() const = 0;
    virtual bool eof() const = 0;

    virtual IoResult flush() = 0;

    // Close the stream (called automatically by destructor)
    virtual void close() = 0;

    virtual std::string path() const { return ""; }
};

} // namespace Palisade::Core::IO
