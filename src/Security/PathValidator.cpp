/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "PathValidator.h"

#include <algorithm>
#include <cctype>
#include "Core/Errors.h"
#include "CoreCommon.h"

namespace fs = std::filesystem;

namespace Palisade::Core::Security {

namespace {
    std::string toLower(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        return out;
    }

    // lexically_normal() keeps a trailing separator as an empty filename
    fs::path stripTrailingSeparator(fs::path p) {
        if (!p.has_filename() && p.has_relative_path()) {
            p = p.parent_path();
        }
        return p;
    }

    std::vector<fs::path> defaultSafeRoots() {
        std::vector<fs::path> roots;
        std::error_code ec;
        auto cwd = fs::current_path(ec);
        if (!ec) roots.push_back(cwd);
        if (auto home = homeDirectory()) roots.emplace_back(*home);
        auto tmp = fs::temp_directory_path(ec);
        if (!ec) roots.push_back(tmp);
        return roots;
    }
}

ValidatedPath ValidatedPath::child(std::string_view name) const {
    if (name.empty() || name.find('\0') != std::string_view::npos) {
        throw SecurityError("Invalid path provided");
    }
    fs::path rel(name);
    if (rel.has_root_path()) {
        throw SecurityError("Path traversal detected");
    }
    for (const auto& part : rel) {
        if (part == ".." || part == ".") {
            throw SecurityError("Path traversal detected");
        }
    }
    auto joined = (_path / rel).lexically_normal();
    if (!PathValidator::isWithin(joined, _path)) {
        throw SecurityError("Path traversal detected");
    }
    return ValidatedPath(std::move(joined));
}

PathValidator::PathValidator()
    : PathValidator(Config{}) {
}

PathValidator::PathValidator(Config config)
    : _config(std::move(config)) {
    auto roots = _config.safeRoots.empty() ? defaultSafeRoots() : _config.safeRoots;
    for (auto& root : roots) {
        if (root.empty()) continue;
        _roots.push_back(stripTrailingSeparator(fs::absolute(root).lexically_normal()));
    }
}

PathValidator::PathValidator(const Core::Config::SecurityLimits& limits)
    : PathValidator(Config{limits.maxPathLength, limits.allowedExtensions, {}}) {
}

fs::path PathValidator::resolveBase(const std::optional<fs::path>& baseDir) {
    fs::path base;
    try {
        base = baseDir && !baseDir->empty() ? fs::absolute(*baseDir) : fs::current_path();
    } catch (const fs::filesystem_error&) {
        throw SecurityError("Unable to resolve base directory");
    }
    return stripTrailingSeparator(base.lexically_normal());
}

fs::path PathValidator::resolve(const fs::path& p, const fs::path& base) {
    fs::path joined = p.is_absolute() ? p : base / p;
    return stripTrailingSeparator(joined.lexically_normal());
}

ValidatedPath PathValidator::validate(std::string_view userPath, const std::optional<fs::path>& baseDir) const {
    if (userPath.empty()) {
        throw SecurityError("Invalid path provided");
    }
    if (userPath.size() > _config.maxPathLength) {
        throw SecurityError("Path too long");
    }
    if (userPath.find('\0') != std::string_view::npos) {
        throw SecurityError("Null byte in path");
    }

    const fs::path base = resolveBase(baseDir);
    const fs::path resolved = resolve(fs::path(std::string(userPath)), base);

    if (!isWithin(resolved, base)) {
        throw SecurityError("Path traversal detected");
    }

    if (resolved.native().find('\0') != fs::path::string_type::npos) {
        throw SecurityError("Null byte in path");
    }

    return ValidatedPath(resolved);
}

bool PathValidator::validateExtension(const fs::path& path) const noexcept {
    try {
        auto ext = toLower(path.extension().string());
        if (ext.empty()) return false;
        return std::any_of(_config.allowedExtensions.begin(), _config.allowedExtensions.end(),
                           [&](const std::string& allowed) { return toLower(allowed) == ext; });
    } catch (const std::exception&) {
        return false;
    }
}

bool PathValidator::isWithin(const fs::path& candidate, const fs::path& root) noexcept {
    try {
        auto rel = candidate.lexically_relative(root);
        if (rel.empty()) return false;
        auto first = *rel.begin();
        return first != "..";
    } catch (const std::exception&) {
        return false;
    }
}

bool PathValidator::isProtected(const fs::path& target, const std::optional<fs::path>& baseDir) const {
    const auto lexical = stripTrailingSeparator(fs::absolute(target).lexically_normal());
    if (isWithin(resolveBase(baseDir), lexical)) {
        return true;
    }
    return std::any_of(_roots.begin(), _roots.end(), [&](const fs::path& root) {
        if (isWithin(root, lexical)) return true;
        std::error_code ec;
        auto canonicalRoot = fs::weakly_canonical(root, ec);
        return !ec && isWithin(canonicalRoot, lexical);
    });
}

bool PathValidator::isPathSafe(const fs::path& path) const noexcept {
    try {
        const auto lexical = stripTrailingSeparator(fs::absolute(path).lexically_normal());
        auto insideAnyRoot = [this](const fs::path& p) {
            return std::any_of(_roots.begin(), _roots.end(), [&](const fs::path& root) {
                if (isWithin(p, root)) return true;
                std::error_code ec;
                auto canonicalRoot = fs::weakly_canonical(root, ec);
                return !ec && isWithin(p, canonicalRoot);
            });
        };

        if (!insideAnyRoot(lexical)) return false;

        // Follow symlinks in whatever prefix exists so a link cannot smuggle the path out
        std::error_code ec;
        auto canonical = fs::weakly_canonical(lexical, ec);
        if (ec) return true;
        return insideAnyRoot(stripTrailingSeparator(canonical));
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace Palisade::Core::Security
