// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// See Yellow Paper, Appendix F "Signing Transactions"

#include <optional>

#include <secp256k1_recovery.h>

#include <gensim/core/common/bytes.hpp>

namespace gensim::ecdsa {

inline constexpr unsigned kContextFlags{SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY};

inline constexpr size_t kUncompressedPublicKeyLength{65};

//! \brief Tries to recover the public key used for message signing
//! \param [in] message : the signed 32-byte message hash
//! \param [in] signature : the 64-byte compact signature r || s
//! \param [in] recovery_id : the recovery id (0 to 3)
//! \param [in] context : a pointer to an existing context. Should it be nullptr a default context is used
//! \return The 65-byte uncompressed key, 0x04 prefix included, or std::nullopt if recovery failed
std::optional<Bytes> recover(ByteView message, ByteView signature, int recovery_id,
                             const secp256k1_context* context = nullptr) noexcept;

//! \brief Tries to recover the address used for message signing
//! \param [out] out : the 20-byte address
//! \return Whether the recovery has succeeded
[[nodiscard]] bool recover_address(uint8_t out[20], ByteView message, ByteView signature, int recovery_id,
                                   const secp256k1_context* context = nullptr) noexcept;

}  // namespace gensim::ecdsa
