// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_state.hpp"

#include <bit>

#include <gensim/core/common/overloaded.hpp>
#include <gensim/core/common/util.hpp>
#include <gensim/core/types/evmc_bytes32.hpp>

namespace gensim {

std::string_view to_string(ApplyError error) noexcept {
    switch (error) {
        case ApplyError::kDuplicateAddress:
            return "duplicate address in change list";
        case ApplyError::kMissingAccount:
            return "deleted account does not exist";
    }
    return "unknown apply error";
}

std::optional<Account> InMemoryState::read_account(const evmc::address& address) const noexcept {
    auto it{accounts_.find(address)};
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ByteView InMemoryState::read_code(const evmc::bytes32& code_hash) const noexcept {
    auto it{code_.find(code_hash)};
    if (it == code_.end()) {
        return {};
    }
    return it->second;
}

evmc::bytes32 InMemoryState::read_storage(const evmc::address& address,
                                          const evmc::bytes32& location) const noexcept {
    const auto it1{storage_.find(address)};
    if (it1 != storage_.end()) {
        const auto it2{it1->second.find(location)};
        if (it2 != it1->second.end()) {
            return it2->second;
        }
    }
    return {};
}

Account InMemoryState::get_account(const evmc::address& address) const noexcept {
    return read_account(address).value_or(Account{});
}

size_t InMemoryState::storage_size(const evmc::address& address) const {
    const auto it{storage_.find(address)};
    return it == storage_.end() ? 0 : it->second.size();
}

tl::expected<void, ApplyError> InMemoryState::apply(const std::vector<AccountChange>& changes) {
    // Validate everything first so that a rejected list leaves no trace
    FlatHashSet<evmc::address> seen;
    for (const AccountChange& change : changes) {
        const evmc::address& address{changed_address(change)};
        if (!seen.insert(address).second) {
            return tl::unexpected{ApplyError::kDuplicateAddress};
        }
        if (std::holds_alternative<AccountDelete>(change) && !accounts_.contains(address)) {
            return tl::unexpected{ApplyError::kMissingAccount};
        }
    }

    for (const AccountChange& change : changes) {
        std::visit(Overloaded{
                       [this](const AccountModify& modify) { apply_modify(modify); },
                       [this](const AccountDelete& del) {
                           accounts_.erase(del.address);
                           storage_.erase(del.address);
                       },
                   },
                   change);
    }
    return {};
}

void InMemoryState::apply_modify(const AccountModify& change) {
    Account& account{accounts_[change.address]};
    account.balance = change.balance;
    account.nonce = change.nonce;
    if (change.code) {
        account.code_hash = std::bit_cast<evmc_bytes32>(keccak256(*change.code));
        code_.try_emplace(account.code_hash, *change.code);
        account.incarnation = kDefaultIncarnation;
    }

    if (change.reset_storage) {
        storage_.erase(change.address);
    }
    for (const auto& [location, value] : change.storage) {
        if (is_zero(value)) {
            if (auto it{storage_.find(change.address)}; it != storage_.end()) {
                it->second.erase(location);
            }
        } else {
            storage_[change.address][location] = value;
        }
    }
}

}  // namespace gensim
