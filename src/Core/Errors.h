/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once

/**
 * @file Errors.h
 * @brief Closed error taxonomy shared by every gateway component
 *
 * Three kinds exist and no others:
 * - Validation: malformed, oversized or empty input. The caller can fix it
 *   and try again.
 * - Security: traversal, disallowed extension, unsafe location or an
 *   exhausted quota. Always rejected, never retried automatically.
 * - FileProcessing: I/O failure, timeout, cancellation or a wrapped
 *   lower-level error. May be transient.
 *
 * Synchronous APIs throw the matching exception type; asynchronous
 * operations carry the kind on FileErrorInfo. Both can be turned into a
 * user-facing message with presentError(), which switches over ErrorKind
 * exhaustively.
 */

#include <stdexcept>
#include <string>
#include <string_view>

namespace Palisade {
namespace Core {

    enum class ErrorKind {
        Validation,
        Security,
        FileProcessing
    };

    constexpr std::string_view toString(ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::Validation:     return "ValidationError";
            case ErrorKind::Security:       return "SecurityError";
            case ErrorKind::FileProcessing: return "FileProcessingError";
        }
        return "UnknownError";
    }

    /**
     * @brief Base of all gateway exceptions; carries a machine-readable kind
     */
    class PalisadeError : public std::runtime_error {
    public:
        PalisadeError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), _kind(kind) {}

        ErrorKind kind() const noexcept { return _kind; }

    private:
        ErrorKind _kind;
    };

    class ValidationError : public PalisadeError {
    public:
        explicit ValidationError(const std::string& message)
            : PalisadeError(ErrorKind::Validation, message) {}
    };

    class SecurityError : public PalisadeError {
    public:
        explicit SecurityError(const std::string& message)
            : PalisadeError(ErrorKind::Security, message) {}
    };

    class FileProcessingError : public PalisadeError {
    public:
        explicit FileProcessingError(const std::string& message)
            : PalisadeError(ErrorKind::FileProcessing, message) {}
    };

    /**
     * @brief Throws the exception type matching kind
     */
    [[noreturn]] void throwError(ErrorKind kind, const std::string& message);

    /**
     * @brief Text suitable for showing to an end user
     *
     * Validation and Security messages are already actionable and are
     * returned unchanged. FileProcessing messages get a retry suggestion.
     */
    std::string presentError(ErrorKind kind, std::string_view message);
    inline std::string presentError(const PalisadeError& error) {
        return presentError(error.kind(), error.what());
    }

} // namespace Core
} // namespace Palisade
