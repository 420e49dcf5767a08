// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "curve25519.hpp"

#include <algorithm>

#include <gmp.h>
#include <sodium.h>

namespace gensim::crypto::curve25519 {

// Must be called prior to invoking any libsodium primitive.
// May be called many times from multiple threads.
static bool init_sodium() noexcept {
    // magic static
    static const bool initialized{sodium_init() >= 0};
    return initialized;
}

static bool is_identity(const uint8_t (&point)[kPointLength]) noexcept {
    return std::ranges::all_of(point, [](uint8_t b) { return b == 0; });
}

// The key decodes when x^2 = (y^2 - 1) / (d y^2 + 1) has a root modulo p = 2^255 - 19.
// Small-order and non-canonical encodings still decode.
static bool decodes_to_point(ByteView public_key) noexcept {
    uint8_t y_bytes[kPublicKeyLength];
    std::ranges::copy(public_key, y_bytes);
    y_bytes[kPublicKeyLength - 1] &= 0x7f;  // sign of x

    mpz_t p, d, y2, u, v;
    mpz_inits(p, d, y2, u, v, nullptr);
    mpz_ui_pow_ui(p, 2, 255);
    mpz_sub_ui(p, p, 19);
    // d = -121665 / 121666
    mpz_set_ui(d, 121666);
    mpz_invert(d, d, p);
    mpz_mul_si(d, d, -121665);
    mpz_mod(d, d, p);

    mpz_import(y2, sizeof(y_bytes), /*order=*/-1, /*size=*/1, /*endian=*/0, /*nails=*/0, y_bytes);
    mpz_mul(y2, y2, y2);
    mpz_mod(y2, y2, p);
    mpz_sub_ui(u, y2, 1);
    mpz_mul(v, d, y2);
    mpz_add_ui(v, v, 1);
    // v is never zero, so u * v is a square exactly when u / v is
    mpz_mul(u, u, v);
    mpz_mod(u, u, p);
    const bool square{mpz_jacobi(u, p) >= 0};

    mpz_clears(p, d, y2, u, v, nullptr);
    return square;
}

std::optional<Bytes> ristretto_add(ByteView points) noexcept {
    if (points.size() % kPointLength != 0 || !init_sodium()) {
        return std::nullopt;
    }

    uint8_t sum[kPointLength]{};  // identity
    for (size_t offset{0}; offset < points.size(); offset += kPointLength) {
        const uint8_t* point{&points[offset]};
        if (!crypto_core_ristretto255_is_valid_point(point)) {
            continue;
        }
        if (is_identity(sum)) {
            std::copy_n(point, kPointLength, sum);
            continue;
        }
        uint8_t next[kPointLength];
        if (crypto_core_ristretto255_add(next, sum, point) != 0) {
            return std::nullopt;
        }
        std::ranges::copy(next, sum);
    }
    return Bytes{sum, kPointLength};
}

Bytes ristretto_scalar_mul(ByteView scalar, ByteView point) noexcept {
    Bytes out(kPointLength, '\0');
    if (scalar.size() != kScalarLength || point.size() != kPointLength || !init_sodium()) {
        return out;
    }
    if (!crypto_core_ristretto255_is_valid_point(point.data())) {
        return out;  // identity times anything
    }

    uint8_t wide[crypto_core_ristretto255_NONREDUCEDSCALARBYTES]{};
    std::ranges::copy(scalar, wide);
    uint8_t reduced[crypto_core_ristretto255_SCALARBYTES];
    crypto_core_ristretto255_scalar_reduce(reduced, wide);

    // A non-zero return means the product is the identity, already encoded as zeros
    if (crypto_scalarmult_ristretto255(out.data(), reduced, point.data()) != 0) {
        std::ranges::fill(out, 0);
    }
    return out;
}

VerifyResult ed25519_verify(ByteView message, ByteView public_key, ByteView signature) noexcept {
    if (!init_sodium()) {
        return VerifyResult::kInvalid;
    }
    if (public_key.size() != kPublicKeyLength || !decodes_to_point(public_key)) {
        return VerifyResult::kMalformedKey;
    }
    // The three high bits of s must be clear
    if (signature.size() != kSignatureLength || (signature[kSignatureLength - 1] & 0xe0) != 0) {
        return VerifyResult::kMalformedSignature;
    }
    if (crypto_sign_verify_detached(signature.data(), message.data(), message.size(), public_key.data()) != 0) {
        return VerifyResult::kInvalid;
    }
    return VerifyResult::kValid;
}

}  // namespace gensim::crypto::curve25519
