// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <variant>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <gensim/core/state/object.hpp>

namespace gensim::state {

// Each journal entry holds what is needed to undo one mutation of IntraBlockState

struct ObjectCreated {
    evmc::address address;
};

struct ObjectReplaced {
    evmc::address address;
    Object previous;
};

struct BalanceChanged {
    evmc::address address;
    intx::uint256 previous;
};

struct SelfDestructRecorded {
    evmc::address address;
};

struct AccountTouched {
    evmc::address address;
};

struct StorageSlotChanged {
    evmc::address address;
    evmc::bytes32 key;
    evmc::bytes32 previous;
};

//! The storage of an account was wiped by a contract creation
struct StorageReset {
    evmc::address address;
    std::optional<Storage> previous;  // absent if nothing was cached for the account
};

using JournalEntry = std::variant<ObjectCreated, ObjectReplaced, BalanceChanged, SelfDestructRecorded, AccountTouched,
                                  StorageSlotChanged, StorageReset>;

}  // namespace gensim::state
