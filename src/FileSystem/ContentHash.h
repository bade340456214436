/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include "Core/CancellationToken.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace Palisade::Core::IO {

class IFileSystemBackend;

/**
 * @brief Incremental SHA-256 over OpenSSL EVP
 *
 * Feed data with update() and read the lower-case hex digest with finalHex().
 * A finalized hash cannot be updated again.
 */
class ContentHash {
public:
    ContentHash();
    ~ContentHash();

    ContentHash(ContentHash&&) noexcept;
    ContentHash& operator=(ContentHash&&) noexcept;
    ContentHash(const ContentHash&) = delete;
    ContentHash& operator=(const ContentHash&) = delete;

    void update(std::span<const std::byte> data);
    void update(std::string_view data);
    std::string finalHex();

    static std::string sha256Hex(std::string_view data);

    /**
     * @brief Hashes a file in chunks through backend
     *
     * Checks token between chunks. Throws std::filesystem::filesystem_error on
     * I/O failure and FileProcessingError when the digest cannot be computed.
     */
    static std::string sha256File(IFileSystemBackend& backend,
                                  const std::filesystem::path& path,
                                  size_t chunkSize,
                                  const CancellationToken& token = {});

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept;
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> _ctx;
    bool _finalized = false;
};

} // namespace Palisade::Core::IO
