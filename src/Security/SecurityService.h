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
 * @file SecurityService.h
 * @brief Single gateway that turns raw user input into vetted paths and fields
 *
 * SecurityService composes PathValidator, InputSanitizer and ResourceLimiter.
 * Every path that reaches the filesystem layer has passed through one of the
 * validate*Path() methods, which either return a ValidatedPath or throw a
 * typed error. Rejected input is never counted against a quota.
 *
 * @code
 * Security::SecurityService security(limits, timers);
 * security.start();
 * auto path = security.validateFilePath("themes/nord.txt");
 * @endcode
 */

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "Config/Limits.h"
#include "Core/PalisadeService.h"
#include "InputSanitizer.h"
#include "PathValidator.h"
#include "ResourceLimiter.h"

namespace Palisade::Core {
class TimerService;
}

namespace Palisade::Core::Security {

/// Raw theme configuration as collected from the user
struct ThemeInputFields {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> version;
    std::optional<std::string> publisher;
    std::optional<std::string> license;
    std::optional<std::string> outputPath;
};

/// Sanitized theme configuration; omitted fields come back as empty strings
struct SanitizedThemeFields {
    std::string name;
    std::string description;
    std::string version;
    std::string publisher;
    std::string license;
    std::string outputPath;
};

class SecurityService : public PalisadeService {
public:
    struct Stats {
        ResourceLimiter::Stats resources;
        Core::Config::SecurityLimits limits;
    };

    SecurityService(const Core::Config::Limits& limits, TimerService& timers);

    /// Overrides the validator's safe roots, mainly for tests and embedding
    SecurityService(const Core::Config::Limits& limits, TimerService& timers,
                    PathValidator::Config validatorConfig);

    ~SecurityService() override;

    SecurityService(const SecurityService&) = delete;
    SecurityService& operator=(const SecurityService&) = delete;

    const char* id() const override { return "com.palisade.core.security"; }
    const char* name() const override { return "SecurityService"; }

    /// Starts the quota window timer; the TimerService must already be running
    void start() override;
    void stop() override;

    /**
     * @brief Validates a path naming a file to be read
     *
     * Checks run in order: read quota, sanitization and traversal, extension
     * allow-list, safe-root containment. The read quota is consumed only when
     * every check passes.
     *
     * @throws SecurityError "File read limit exceeded", "File type not allowed",
     *         "File location not allowed" or any PathValidator failure
     * @throws ValidationError when the raw input is empty or too long
     */
    ValidatedPath validateFilePath(std::string_view path,
                                   const std::optional<std::filesystem::path>& baseDir = std::nullopt);

    /// As validateFilePath() without the extension gate, for directory targets
    ValidatedPath validateDirectoryPath(std::string_view path,
                                        const std::optional<std::filesystem::path>& baseDir = std::nullopt);

    /**
     * @brief As validateFilePath() plus the write quota ("File write limit exceeded")
     *
     * Pass requireAllowedExtension = false for targets that may be directories
     * (copy destinations, deletions, bundle output); the caller then applies
     * the extension gate itself once the target's type is known.
     */
    ValidatedPath validateWritePath(std::string_view path,
                                    const std::optional<std::filesystem::path>& baseDir = std::nullopt,
                                    bool requireAllowedExtension = true);

    /**
     * @brief As validateWritePath() without the extension gate, for deletions
     *
     * Refuses the base directory, every safe root and their ancestors with
     * SecurityError "Cannot delete a protected directory", before any quota
     * is consumed.
     */
    ValidatedPath validateRemovalPath(std::string_view path,
                                      const std::optional<std::filesystem::path>& baseDir = std::nullopt);

    /**
     * @brief Sanitizes every theme field independently
     *
     * The output path, when present, is vetted as a directory target.
     */
    SanitizedThemeFields validateThemeInput(const ThemeInputFields& fields);

    /// Current counters and the active security limits
    Stats getStats() const;

    /// Stops the window timer and clears the counters; safe to call repeatedly
    void cleanup();

    const PathValidator& pathValidator() const noexcept { return _validator; }
    const InputSanitizer& sanitizer() const noexcept { return _sanitizer; }
    ResourceLimiter& resourceLimiter() noexcept { return _limiter; }

private:
    ValidatedPath vet(std::string_view path,
                      const std::optional<std::filesystem::path>& baseDir,
                      bool checkExtension,
                      bool forRemoval = false);

    Core::Config::SecurityLimits _limits;
    TimerService& _timers;
    PathValidator _validator;
    InputSanitizer _sanitizer;
    ResourceLimiter _limiter;
};

} // namespace Palisade::Core::Security
