// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <intx/intx.hpp>

#include <gensim/core/common/bytes.hpp>
#include <gensim/core/common/empty_hashes.hpp>

namespace gensim {

// Contracts start at incarnation 1; re-creating an account at the same address bumps it
// so that storage of the previous incarnation is no longer visible.
// The incarnation of non-contracts (externally owned accounts) is always 0.
inline constexpr uint64_t kDefaultIncarnation{1};

struct Account {
    uint64_t nonce{0};
    intx::uint256 balance;
    evmc::bytes32 code_hash{kEmptyHash};
    uint64_t incarnation{0};

    //! An account with no code, zero nonce and zero balance is indistinguishable from a missing one
    bool empty() const noexcept { return nonce == 0 && balance == 0 && code_hash == kEmptyHash; }

    friend bool operator==(const Account&, const Account&) = default;
};

}  // namespace gensim
