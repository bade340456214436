/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "SecurityService.h"

#include "Core/Errors.h"
#include "Core/TimerService.h"
#include "Logging/Logger.h"

namespace Palisade::Core::Security {

namespace {
    PathValidator::Config validatorConfigFrom(const Core::Config::SecurityLimits& limits,
                                              std::vector<std::filesystem::path> safeRoots) {
        PathValidator::Config config;
        config.maxPathLength = limits.maxPathLength;
        config.allowedExtensions = limits.allowedExtensions;
        config.safeRoots = std::move(safeRoots);
        return config;
    }
}

SecurityService::SecurityService(const Core::Config::Limits& limits, TimerService& timers)
    : SecurityService(limits, timers, PathValidator::Config{}) {
}

SecurityService::SecurityService(const Core::Config::Limits& limits, TimerService& timers,
                                 PathValidator::Config validatorConfig)
    : _limits(limits.security)
    , _timers(timers)
    , _validator(validatorConfigFrom(limits.security, std::move(validatorConfig.safeRoots)))
    , _sanitizer(limits.security, _validator)
    , _limiter(limits.resource) {
}

SecurityService::~SecurityService() {
    cleanup();
}

void SecurityService::start() {
    _limiter.startWindow(_timers);
    setState(ServiceState::Started);
}

void SecurityService::stop() {
    cleanup();
    setState(ServiceState::Stopped);
}

ValidatedPath SecurityService::vet(std::string_view path,
                                   const std::optional<std::filesystem::path>& baseDir,
                                   bool checkExtension,
                                   bool forRemoval) {
    if (!_limiter.canPerform(ResourceKind::FileReads)) {
        PALISADE_LOG_WARNING_CAT("Security", "File read limit exceeded");
        throw SecurityError("File read limit exceeded");
    }

    auto validated = _sanitizer.sanitizePath(path, baseDir);

    if (checkExtension && !_validator.validateExtension(validated.path())) {
        PALISADE_LOG_WARNING_CAT("Security", "Rejected file type: " + validated.path().extension().string());
        throw SecurityError("File type not allowed");
    }
    if (!_validator.isPathSafe(validated.path())) {
        PALISADE_LOG_WARNING_CAT("Security", "Rejected path outside safe roots");
        throw SecurityError("File location not allowed");
    }

    if (forRemoval && _validator.isProtected(validated.path(), baseDir)) {
        PALISADE_LOG_WARNING_CAT("Security", "Refused deletion of a protected directory");
        throw SecurityError("Cannot delete a protected directory");
    }

    // Another thread may have used the last slot since canPerform()
    if (!_limiter.tryAcquire(ResourceKind::FileReads)) {
        throw SecurityError("File read limit exceeded");
    }
    return validated;
}

ValidatedPath SecurityService::validateFilePath(std::string_view path,
                                                const std::optional<std::filesystem::path>& baseDir) {
    return vet(path, baseDir, true);
}

ValidatedPath SecurityService::validateDirectoryPath(std::string_view path,
                                                     const std::optional<std::filesystem::path>& baseDir) {
    return vet(path, baseDir, false);
}

ValidatedPath SecurityService::validateWritePath(std::string_view path,
                                                 const std::optional<std::filesystem::path>& baseDir,
                                                 bool requireAllowedExtension) {
    if (!_limiter.canPerform(ResourceKind::FileWrites)) {
        PALISADE_LOG_WARNING_CAT("Security", "File write limit exceeded");
        throw SecurityError("File write limit exceeded");
    }
    auto validated = vet(path, baseDir, requireAllowedExtension);
    if (!_limiter.tryAcquire(ResourceKind::FileWrites)) {
        throw SecurityError("File write limit exceeded");
    }
    return validated;
}

ValidatedPath SecurityService::validateRemovalPath(std::string_view path,
                                                   const std::optional<std::filesystem::path>& baseDir) {
    if (!_limiter.canPerform(ResourceKind::FileWrites)) {
        PALISADE_LOG_WARNING_CAT("Security", "File write limit exceeded");
        throw SecurityError("File write limit exceeded");
    }
    auto validated = vet(path, baseDir, false, true);
    if (!_limiter.tryAcquire(ResourceKind::FileWrites)) {
        throw SecurityError("File write limit exceeded");
    }
    return validated;
}

SanitizedThemeFields SecurityService::validateThemeInput(const ThemeInputFields& fields) {
    SanitizedThemeFields out;
    if (fields.name) {
        out.name = _sanitizer.sanitizeName(*fields.name);
    }
    if (fields.description) {
        out.description = _sanitizer.process(*fields.description, _limits.maxDescriptionLength);
    }
    if (fields.version) {
        out.version = _sanitizer.process(*fields.version, _limits.maxVersionLength);
    }
    if (fields.publisher) {
        out.publisher = _sanitizer.process(*fields.publisher, _limits.maxPublisherLength);
    }
    if (fields.license) {
        out.license = _sanitizer.process(*fields.license, _limits.maxLicenseLength);
    }
    if (fields.outputPath) {
        out.outputPath = validateDirectoryPath(*fields.outputPath).string();
    }
    return out;
}

SecurityService::Stats SecurityService::getStats() const {
    return Stats{_limiter.getStats(), _limits};
}

void SecurityService::cleanup() {
    _limiter.cleanup();
}

} // namespace Palisade::Core::Security
