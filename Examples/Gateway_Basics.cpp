/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <filesystem>
#include <string>

#include "Palisade.h"

using namespace Palisade::Core;
using namespace Palisade::Core::IO;

int main() {
    Gateway gateway(Config::Limits::fromEnvironment());
    gateway.start();
    auto& files = gateway.files();

    FileOperationOptions options;
    options.baseDir = std::filesystem::temp_directory_path();

    // Write text to a file
    const std::string text = "Hello, Palisade!";
    auto w = files.writeFile("palisade_basics.txt", text, options);
    w.wait();
    if (w.status() != FileOpStatus::Complete) {
        PALISADE_LOG_ERROR(std::string("writeFile failed: ") + presentError(w.errorInfo().kind, w.errorInfo().message));
        return 1;
    }
    PALISADE_LOG_INFO("Wrote " + std::to_string(w.bytesWritten()) + " bytes");

    // Read it back
    auto r = files.readFile("palisade_basics.txt", options);
    r.wait();
    if (r.status() != FileOpStatus::Complete) {
        PALISADE_LOG_ERROR(std::string("readFile failed: ") + r.errorInfo().message);
        return 1;
    }
    PALISADE_LOG_INFO(std::string("Read: ") + r.contentsText());

    // Stat with content hash
    auto m = files.getMetadata("palisade_basics.txt", options);
    m.wait();
    if (m.status() == FileOpStatus::Complete && m.metadata() && m.metadata()->contentHash) {
        PALISADE_LOG_INFO("SHA-256: " + *m.metadata()->contentHash);
    }

    // Traversal never reaches the filesystem
    auto escape = files.readFile("../../etc/passwd", options);
    escape.wait();
    PALISADE_LOG_INFO(std::string("Traversal attempt: ") + std::string(toString(escape.status())) + " (" +
                      escape.errorInfo().message + ")");

    auto rm = files.remove("palisade_basics.txt", options);
    rm.wait();
    if (rm.status() != FileOpStatus::Complete) {
        PALISADE_LOG_ERROR(std::string("remove failed: ") + rm.errorInfo().message);
        return 1;
    }

    gateway.stop();
    return 0;
}
