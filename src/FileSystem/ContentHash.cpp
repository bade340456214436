/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Palisade project.
 */

#include "ContentHash.h"

#include <openssl/evp.h>
#include <cerrno>
#include <system_error>
#include <vector>
#include "Core/Errors.h"
#include "FileStream.h"
#include "IFileSystemBackend.h"

namespace Palisade::Core::IO {

void ContentHash::CtxDeleter::operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

ContentHash::ContentHash()
    : _ctx(EVP_MD_CTX_new()) {
    if (!_ctx || EVP_DigestInit_ex(_ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw FileProcessingError("Unable to initialise SHA-256 digest");
    }
}

ContentHash::~ContentHash() = default;
ContentHash::ContentHash(ContentHash&&) noexcept = default;
ContentHash& ContentHash::operator=(ContentHash&&) noexcept = default;

void ContentHash::update(std::span<const std::byte> data) {
    if (_finalized) {
        throw FileProcessingError("Digest already finalized");
    }
    if (data.empty()) return;
    if (EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
        throw FileProcessingError("SHA-256 update failed");
    }
}

void ContentHash::update(std::string_view data) {
    update(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

std::string ContentHash::finalHex() {
    if (_finalized) {
        throw FileProcessingError("Digest already finalized");
    }
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(_ctx.get(), digest, &length) != 1) {
        throw FileProcessingError("SHA-256 finalization failed");
    }
    _finalized = true;

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(hex[digest[i] >> 4]);
        out.push_back(hex[digest[i] & 0x0F]);
    }
    return out;
}

std::string ContentHash::sha256Hex(std::string_view data) {
    ContentHash hash;
    hash.update(data);
    return hash.finalHex();
}

std::string ContentHash::sha256File(IFileSystemBackend& backend,
                                    const std::filesystem::path& path,
                                    size_t chunkSize,
                                    const CancellationToken& token) {
    auto stream = backend.openStream(path, StreamOptions{StreamOptions::Read});
    ContentHash hash;
    std::vector<std::byte> buffer(chunkSize > 0 ? chunkSize : 64 * 1024);
    for (;;) {
        token.throwIfCancelled();
        auto result = stream->read(buffer);
        if (!result.success()) {
            throw std::filesystem::filesystem_error(
                "read", path, std::error_code(result.systemError != 0 ? result.systemError : EIO, std::generic_category()));
        }
        if (result.bytesTransferred == 0) {
            break;
        }
        hash.update(std::span<const std::byte>(buffer.data(), result.bytesTransferred));
    }
    return hash.finalHex();
}

} // namespace Palisade::Core::IO
