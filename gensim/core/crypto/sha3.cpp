// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha3.hpp"

#include <memory>

#include <openssl/evp.h>

namespace gensim::crypto {

std::optional<Bytes> sha3_256(ByteView input) noexcept {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha3_256(), nullptr) != 1) {
        return std::nullopt;
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return std::nullopt;
    }
    Bytes out(32, '\0');
    unsigned int out_len{0};
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
        return std::nullopt;
    }
    return out;
}

}  // namespace gensim::crypto
