// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gensim/core/common/base.hpp>
#include <gensim/core/common/hash_maps.hpp>
#include <gensim/core/types/account.hpp>

namespace gensim::state {

//! An account as seen by the overlay
struct Object {
    std::optional<Account> initial;  // as read from the backing store, absent for new accounts
    std::optional<Account> current;  // absent once destructed
};

//! Storage slots of one account as seen by the overlay
struct Storage {
    // slots read from the backing store or settled by a finished transaction; see EIP-2200
    FlatHashMap<evmc::bytes32, evmc::bytes32> committed;
    // writes of the running transaction
    FlatHashMap<evmc::bytes32, evmc::bytes32> pending;
};

}  // namespace gensim::state
