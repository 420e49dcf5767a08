// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1n.hpp"

namespace gensim {

bool is_valid_signature(const intx::uint256& r, const intx::uint256& s, bool homestead) noexcept {
    if (r == 0 || s == 0) {
        return false;
    }
    if (r >= kSecp256k1n || s >= kSecp256k1n) {
        return false;
    }
    return !homestead || s <= kSecp256k1Halfn;
}

}  // namespace gensim
