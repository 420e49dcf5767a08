// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Ristretto255 group operations and Ed25519 signature verification over Curve25519

#include <optional>

#include <gensim/core/common/bytes.hpp>

namespace gensim::crypto::curve25519 {

inline constexpr size_t kPointLength{32};
inline constexpr size_t kScalarLength{32};
inline constexpr size_t kPublicKeyLength{32};
inline constexpr size_t kSignatureLength{64};

//! \brief Sums compressed Ristretto points
//! \param [in] points : concatenated 32-byte compressed points; invalid encodings count as the identity
//! \return The 32-byte compressed sum (all zeros for the identity) or std::nullopt if the length
//! is not a multiple of 32 bytes
std::optional<Bytes> ristretto_add(ByteView points) noexcept;

//! \brief Multiplies a compressed Ristretto point by a scalar
//! \param [in] scalar : 32-byte little-endian scalar, reduced modulo the group order
//! \param [in] point : 32-byte compressed point; an invalid encoding counts as the identity
//! \return The 32-byte compressed product (all zeros for the identity)
Bytes ristretto_scalar_mul(ByteView scalar, ByteView point) noexcept;

//! Outcome of an Ed25519 verification
enum class VerifyResult {
    kValid,
    kInvalid,           // well-formed inputs, signature does not match
    kMalformedKey,      // public key does not decompress to a curve point
    kMalformedSignature
};

//! \brief Verifies an Ed25519 signature
//! \details Any key that decompresses is accepted as well-formed. Keys libsodium refuses to verify
//! against, such as small-order points, yield kInvalid.
VerifyResult ed25519_verify(ByteView message, ByteView public_key, ByteView signature) noexcept;

}  // namespace gensim::crypto::curve25519
