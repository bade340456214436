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
 * @file PathValidator.h
 * @brief Resolution and containment checks for user-supplied paths
 *
 * PathValidator is pure: it never touches the filesystem except to read the
 * current working directory and to canonicalize existing path prefixes in
 * isPathSafe(). Paths are compared as opaque byte strings; no Unicode
 * normalization is applied, so visually confusable separators or dots are
 * not folded before the traversal check.
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "Config/Limits.h"

namespace Palisade::Core::Security {

/**
 * @brief An absolute, normalized path that passed the gateway's checks
 *
 * Only PathValidator can mint one, so holding a ValidatedPath proves the
 * traversal, NUL-byte and (where applicable) extension and safe-root checks
 * ran. Recomputed per call; never cache one across configuration changes.
 */
class ValidatedPath {
public:
    const std::filesystem::path& path() const noexcept { return _path; }
    std::string string() const { return _path.string(); }
    operator const std::filesystem::path&() const noexcept { return _path; }

    /**
     * @brief Derives a path for a fixed child name inside this directory
     *
     * name must be a relative path of plain components (no "..", no root,
     * no NUL). Used for artifacts whose names the gateway chooses itself.
     *
     * @throws SecurityError if the result would leave this directory
     */
    ValidatedPath child(std::string_view name) const;

    bool operator==(const ValidatedPath& other) const { return _path == other._path; }

private:
    friend class PathValidator;
    explicit ValidatedPath(std::filesystem::path p) : _path(std::move(p)) {}

    std::filesystem::path _path;
};

class PathValidator {
public:
    struct Config {
        size_t maxPathLength = 500;
        std::vector<std::string> allowedExtensions{".txt", ".theme", ".conf", ".json", ".config"};
        std::vector<std::filesystem::path> safeRoots;   ///< Empty selects home, cwd and temp
    };

    PathValidator();
    explicit PathValidator(Config config);
    explicit PathValidator(const Core::Config::SecurityLimits& limits);

    /**
     * @brief Resolves userPath against baseDir (default: cwd) and checks it
     *
     * @throws SecurityError "Invalid path provided" for empty input,
     *         "Path too long" above maxPathLength, "Null byte in path", or
     *         "Path traversal detected" when the resolved path is not
     *         baseDir or a descendant of it.
     */
    ValidatedPath validate(std::string_view userPath,
                           const std::optional<std::filesystem::path>& baseDir = std::nullopt) const;

    /**
     * @brief Case-insensitive match of the final extension against the allow-list
     */
    bool validateExtension(const std::filesystem::path& path) const noexcept;

    /**
     * @brief Second, independent gate: path must sit under one of the safe roots
     *
     * The check passes only if the lexically resolved path and, where it
     * exists, its symlink-resolved form are both inside a safe root.
     */
    bool isPathSafe(const std::filesystem::path& path) const noexcept;

    /**
     * @brief True when target is the base directory, a safe root, or an ancestor of either
     *
     * Such a target may be read or listed but never deleted.
     */
    bool isProtected(const std::filesystem::path& target,
                     const std::optional<std::filesystem::path>& baseDir = std::nullopt) const;

    /**
     * @brief Lexical containment: candidate equals root or descends from it
     */
    static bool isWithin(const std::filesystem::path& candidate, const std::filesystem::path& root) noexcept;

    const Config& config() const noexcept { return _config; }
    const std::vector<std::filesystem::path>& safeRoots() const noexcept { return _roots; }

private:
    static std::filesystem::path resolveBase(const std::optional<std::filesystem::path>& baseDir);
    static std::filesystem::path resolve(const std::filesystem::path& p, const std::filesystem::path& base);

    Config _config;
    std::vector<std::filesystem::path> _roots;
};

} // namespace Palisade::Core::Security
