/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "Errors.h"

namespace Palisade {
namespace Core {

void throwError(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::Validation:
            throw ValidationError(message);
        case ErrorKind::Security:
            throw SecurityError(message);
        case ErrorKind::FileProcessing:
            throw FileProcessingError(message);
    }
    throw FileProcessingError(message);
}

std::string presentError(ErrorKind kind, std::string_view message) {
    switch (kind) {
        case ErrorKind::Validation:
        case ErrorKind::Security:
            return std::string(message);
        case ErrorKind::FileProcessing:
            return std::string(message) + ". Please check the file and try again.";
    }
    return std::string(message);
}

} // namespace Core
} // namespace Palisade
