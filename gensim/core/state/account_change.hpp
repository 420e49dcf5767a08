// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <variant>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <gensim/core/common/bytes.hpp>

namespace gensim {

//! Full overwrite of an account as left behind by one execution
struct AccountModify {
    evmc::address address;
    intx::uint256 balance;
    uint64_t nonce{0};
    std::optional<Bytes> code;  // present only when new code was deployed
    std::map<evmc::bytes32, evmc::bytes32> storage;  // upserts, zero meaning cleared
    bool reset_storage{false};  // drop every slot not listed in storage first

    friend bool operator==(const AccountModify&, const AccountModify&) = default;
};

struct AccountDelete {
    evmc::address address;

    friend bool operator==(const AccountDelete&, const AccountDelete&) = default;
};

using AccountChange = std::variant<AccountModify, AccountDelete>;

inline const evmc::address& changed_address(const AccountChange& change) noexcept {
    return std::visit([](const auto& c) -> const evmc::address& { return c.address; }, change);
}

}  // namespace gensim
