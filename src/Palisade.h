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
 * @file Palisade.h
 * @brief Single header that includes all Palisade components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Configuration
#include "Config/Limits.h"

// Core services
#include "Core/CancellationToken.h"
#include "Core/Errors.h"
#include "Core/PalisadeService.h"
#include "Core/Timer.h"
#include "Core/TimerService.h"

// Concurrency
#include "Concurrency/WorkService.h"

// Security
#include "Security/InputSanitizer.h"
#include "Security/PathValidator.h"
#include "Security/ResourceLimiter.h"
#include "Security/SecurityService.h"

// File system
#include "FileSystem/ContentHash.h"
#include "FileSystem/ExtensionBundleWriter.h"
#include "FileSystem/FileOperationHandle.h"
#include "FileSystem/FileService.h"
#include "FileSystem/FileStream.h"
#include "FileSystem/IFileSystemBackend.h"
#include "FileSystem/LocalFileSystemBackend.h"
#include "FileSystem/OperationRegistry.h"
#include "FileSystem/RecentFiles.h"
#include "FileSystem/ThemeFileParser.h"

// Composition root
#include "Core/Gateway.h"
