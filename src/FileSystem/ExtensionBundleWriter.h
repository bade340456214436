/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

/**
 * @file ExtensionBundleWriter.h
 * @brief Produces a VS Code color-theme extension from parsed theme colors
 *
 * The bundle has a fixed layout under the output directory:
 *   package.json
 *   themes/<package-name>-color-theme.json
 *   README.md
 *   CHANGELOG.md
 *   LICENSE
 * Artifacts are written in that order. A failure part-way leaves earlier
 * artifacts on disk.
 */
#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include <json/json.h>
#include "Config/Limits.h"
#include "Core/CancellationToken.h"
#include "FileOperationHandle.h"
#include "Security/PathValidator.h"
#include "Security/SecurityService.h"

namespace Palisade::Core::IO {

class IFileSystemBackend;

/// Builds the theme JSON document (name, type, colors, tokenColors) from parsed colors
using ThemeMapper = std::function<Json::Value(const std::string& themeName, const ThemeColors& colors)>;

class ExtensionBundleWriter {
public:
    struct Artifact {
        std::string relativePath;   ///< Relative to the output directory, '/' separated
        std::string label;          ///< Progress label, e.g. "Generating README.md"
        std::string contents;
    };

    explicit ExtensionBundleWriter(Core::Config::Defaults defaults = {}, ThemeMapper mapper = {});

    /**
     * @brief Renders every artifact in write order
     *
     * Empty version and license fall back to the configured defaults. The
     * fields are expected to have been through SecurityService::validateThemeInput().
     */
    std::vector<Artifact> render(const Security::SanitizedThemeFields& fields, const ThemeColors& colors) const;

    /**
     * @brief Creates the directory tree and writes every artifact
     *
     * Emits one progress event per artifact before it is written and a final
     * "Extension generation completed" event. Checks token before each write.
     */
    ExtensionBundleResult write(IFileSystemBackend& backend,
                                const Security::ValidatedPath& outputDir,
                                const Security::SanitizedThemeFields& fields,
                                const ThemeColors& colors,
                                const ProgressCallback& onProgress = {},
                                const CancellationToken& token = {}) const;

    // Lower-case, non [a-z0-9-] runs become one '-', no leading or trailing '-'
    static std::string toPackageName(std::string_view name);
    static std::string themeFileName(std::string_view name);

    static Json::Value defaultThemeMapping(const std::string& themeName, const ThemeColors& colors);

    std::string packageJson(const Security::SanitizedThemeFields& fields) const;
    std::string themeJson(const Security::SanitizedThemeFields& fields, const ThemeColors& colors) const;
    std::string readme(const Security::SanitizedThemeFields& fields) const;
    std::string changelog(const Security::SanitizedThemeFields& fields) const;
    std::string license(const Security::SanitizedThemeFields& fields) const;

private:
    std::string versionOf(const Security::SanitizedThemeFields& fields) const;
    std::string licenseOf(const Security::SanitizedThemeFields& fields) const;

    Core::Config::Defaults _defaults;
    ThemeMapper _mapper;
};

} // namespace Palisade::Core::IO
