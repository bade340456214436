/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include <filesystem>
#include <iostream>
#include <string>

#include "Palisade.h"

using namespace Palisade::Core;
using namespace Palisade::Core::IO;

// Parses a terminal theme and writes a VS Code extension next to it.
// Usage: ThemeBundleExample <theme.txt> <output-dir> [theme name]
int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <theme.txt> <output-dir> [theme name]" << std::endl;
        return 2;
    }

    Gateway gateway;
    gateway.start();
    auto& files = gateway.files();

    auto parsed = files.parseThemeFile(argv[1]);
    parsed.wait();
    if (parsed.status() != FileOpStatus::Complete || !parsed.themeParse()) {
        std::cerr << presentError(parsed.errorInfo().kind, parsed.errorInfo().message) << std::endl;
        return 1;
    }
    const auto& theme = *parsed.themeParse();
    if (!theme.success) {
        std::cerr << "Invalid theme: " << theme.error.value_or("unknown error") << std::endl;
        return 1;
    }
    for (const auto& warning : theme.warnings) {
        PALISADE_LOG_WARNING(warning);
    }

    Security::ThemeInputFields config;
    config.name = argc > 3 ? argv[3] : std::filesystem::path(argv[1]).stem().string();
    config.description = "Generated from " + std::filesystem::path(argv[1]).filename().string();

    FileOperationOptions options;
    options.onProgress = [](const ProgressEvent& e) {
        std::cout << "[" << static_cast<int>(e.percentage.value_or(0)) << "%] " << e.operation << std::endl;
    };
    auto bundle = files.generateExtensionBundle(argv[2], theme.colors, config, options);
    bundle.wait();
    if (bundle.status() != FileOpStatus::Complete) {
        std::cerr << presentError(bundle.errorInfo().kind, bundle.errorInfo().message) << std::endl;
        return 1;
    }

    if (!gateway.recentFiles().add(argv[1], *config.name)) {
        PALISADE_LOG_WARNING("Theme was not added to the recent files list");
    }
    std::cout << "Wrote " << bundle.bundle()->files.size() << " files for " << bundle.bundle()->packageName
              << std::endl;

    gateway.stop();
    return 0;
}
