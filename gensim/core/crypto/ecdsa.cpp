// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "ecdsa.hpp"

#include <cstring>

#include <ethash/keccak.hpp>

namespace gensim::ecdsa {

static const secp256k1_context* default_context() noexcept {
    // magic static, the context is never mutated after creation
    static const secp256k1_context* context{secp256k1_context_create(kContextFlags)};
    return context;
}

std::optional<Bytes> recover(ByteView message, ByteView signature, int recovery_id,
                             const secp256k1_context* context) noexcept {
    if (!context) {
        context = default_context();
    }
    if (message.size() != 32 || signature.size() != 64 || recovery_id < 0 || recovery_id > 3) {
        return std::nullopt;
    }

    secp256k1_ecdsa_recoverable_signature sig;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context, &sig, signature.data(), recovery_id)) {
        return std::nullopt;
    }

    secp256k1_pubkey pub_key;
    if (!secp256k1_ecdsa_recover(context, &pub_key, &sig, message.data())) {
        return std::nullopt;
    }

    size_t out_len{kUncompressedPublicKeyLength};
    Bytes out(out_len, '\0');
    secp256k1_ec_pubkey_serialize(context, out.data(), &out_len, &pub_key, SECP256K1_EC_UNCOMPRESSED);
    return out;
}

bool recover_address(uint8_t out[20], ByteView message, ByteView signature, int recovery_id,
                     const secp256k1_context* context) noexcept {
    const std::optional<Bytes> public_key{recover(message, signature, recovery_id, context)};
    if (!public_key || public_key->size() != kUncompressedPublicKeyLength || (*public_key)[0] != 4u) {
        return false;
    }
    // Ignore the 0x04 prefix
    const auto key_hash{ethash::keccak256(public_key->data() + 1, kUncompressedPublicKeyLength - 1)};
    std::memcpy(out, &key_hash.bytes[12], 20);
    return true;
}

}  // namespace gensim::ecdsa
