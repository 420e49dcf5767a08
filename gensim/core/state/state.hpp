// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gensim/core/common/bytes.hpp>
#include <gensim/core/types/account.hpp>

namespace gensim {

//! Read-only view of the world state that an IntraBlockState overlay is built upon
class State {
  public:
    State() = default;

    State(const State&) = default;
    State& operator=(const State&) = default;
    State(State&&) = default;
    State& operator=(State&&) = default;

    virtual ~State() = default;

    virtual std::optional<Account> read_account(const evmc::address& address) const noexcept = 0;

    virtual ByteView read_code(const evmc::bytes32& code_hash) const noexcept = 0;

    virtual evmc::bytes32 read_storage(const evmc::address& address, const evmc::bytes32& location) const noexcept = 0;
};

}  // namespace gensim
