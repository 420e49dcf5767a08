// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include <gensim/core/common/hash_maps.hpp>
#include <gensim/core/state/account_change.hpp>
#include <gensim/core/state/state.hpp>

namespace gensim {

enum class [[nodiscard]] ApplyError {
    kDuplicateAddress,  // more than one change for the same account
    kMissingAccount,    // deletion of an account that does not exist
};

std::string_view to_string(ApplyError error) noexcept;

//! InMemoryState holds the entire world state of one simulated deployment in memory.
class InMemoryState : public State {
  public:
    // location -> value
    using AccountStorage = FlatHashMap<evmc::bytes32, evmc::bytes32>;

    std::optional<Account> read_account(const evmc::address& address) const noexcept override;

    ByteView read_code(const evmc::bytes32& code_hash) const noexcept override;

    evmc::bytes32 read_storage(const evmc::address& address, const evmc::bytes32& location) const noexcept override;

    //! \brief Returns the account at address, or the empty account if there is none
    Account get_account(const evmc::address& address) const noexcept;

    //! \brief Applies all the changes or, should any of them be invalid, none of them
    tl::expected<void, ApplyError> apply(const std::vector<AccountChange>& changes);

    //! \brief Independent copy to run speculative work against
    InMemoryState snapshot() const { return *this; }

    const FlatHashMap<evmc::address, Account>& accounts() const { return accounts_; }

    size_t storage_size(const evmc::address& address) const;

  private:
    void apply_modify(const AccountModify& change);

    FlatHashMap<evmc::address, Account> accounts_;

    // hash -> code
    FlatHashMap<evmc::bytes32, Bytes> code_;

    // address -> location -> value
    FlatHashMap<evmc::address, AccountStorage> storage_;
};

}  // namespace gensim
