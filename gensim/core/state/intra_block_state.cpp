// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "intra_block_state.hpp"

#include <algorithm>
#include <bit>
#include <utility>

#include <gensim/core/common/empty_hashes.hpp>
#include <gensim/core/common/overloaded.hpp>
#include <gensim/core/common/util.hpp>
#include <gensim/core/types/evmc_bytes32.hpp>

namespace gensim {

const state::Object* IntraBlockState::get_object(const evmc::address& address) const noexcept {
    if (const auto it{objects_.find(address)}; it != objects_.end()) {
        return &it->second;
    }
    const std::optional<Account> account{db_.read_account(address)};
    if (!account) {
        return nullptr;
    }
    // cached read, not journaled
    return &objects_.emplace(address, state::Object{.initial = account, .current = account}).first->second;
}

state::Object* IntraBlockState::get_object(const evmc::address& address) noexcept {
    const auto& self{*this};
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    return const_cast<state::Object*>(self.get_object(address));
}

state::Object& IntraBlockState::live_object(const evmc::address& address) noexcept {
    state::Object* obj{get_object(address)};
    if (!obj) {
        journal_.emplace_back(state::ObjectCreated{address});
        obj = &objects_[address];
    } else if (obj->current) {
        return *obj;
    } else {
        journal_.emplace_back(state::ObjectReplaced{address, *obj});
    }
    obj->current = Account{};
    return *obj;
}

bool IntraBlockState::exists(const evmc::address& address) const noexcept {
    const state::Object* obj{get_object(address)};
    return obj && obj->current;
}

bool IntraBlockState::is_dead(const evmc::address& address) const noexcept {
    const state::Object* obj{get_object(address)};
    return !obj || !obj->current || obj->current->empty();
}

void IntraBlockState::create_contract(const evmc::address& address) noexcept {
    state::Object created{.current = Account{}};

    if (const state::Object* prev{get_object(address)}) {
        journal_.emplace_back(state::ObjectReplaced{address, *prev});
        created.initial = prev->initial;
        uint64_t prev_incarnation{prev->initial ? prev->initial->incarnation : 0};
        if (prev->current) {
            created.current->balance = prev->current->balance;
            prev_incarnation = std::max(prev_incarnation, prev->current->incarnation);
        }
        // A fresh incarnation hides whatever storage the backing state holds for the address
        created.current->incarnation = prev_incarnation + 1;
    } else {
        journal_.emplace_back(state::ObjectCreated{address});
        created.current->incarnation = kDefaultIncarnation;
    }
    objects_[address] = std::move(created);

    state::StorageReset reset{address, std::nullopt};
    if (auto node{storage_.extract(address)}) {
        reset.previous = std::move(node.mapped());
    }
    journal_.emplace_back(std::move(reset));
}

bool IntraBlockState::record_suicide(const evmc::address& address) noexcept {
    if (!self_destructs_.insert(address).second) {
        return false;
    }
    journal_.emplace_back(state::SelfDestructRecorded{address});
    return true;
}

void IntraBlockState::touch(const evmc::address& address) noexcept {
    if (touched_.insert(address).second) {
        journal_.emplace_back(state::AccountTouched{address});
    }
}

intx::uint256 IntraBlockState::get_balance(const evmc::address& address) const noexcept {
    const state::Object* obj{get_object(address)};
    return obj && obj->current ? obj->current->balance : 0;
}

intx::uint256& IntraBlockState::balance_for_update(const evmc::address& address) noexcept {
    intx::uint256& balance{live_object(address).current->balance};
    journal_.emplace_back(state::BalanceChanged{address, balance});
    touch(address);
    return balance;
}

void IntraBlockState::set_balance(const evmc::address& address, const intx::uint256& value) noexcept {
    balance_for_update(address) = value;
}

void IntraBlockState::add_to_balance(const evmc::address& address, const intx::uint256& addend) noexcept {
    balance_for_update(address) += addend;
}

void IntraBlockState::subtract_from_balance(const evmc::address& address, const intx::uint256& subtrahend) noexcept {
    balance_for_update(address) -= subtrahend;
}

uint64_t IntraBlockState::get_nonce(const evmc::address& address) const noexcept {
    const state::Object* obj{get_object(address)};
    return obj && obj->current ? obj->current->nonce : 0;
}

void IntraBlockState::set_nonce(const evmc::address& address, uint64_t nonce) noexcept {
    state::Object& obj{live_object(address)};
    journal_.emplace_back(state::ObjectReplaced{address, obj});
    obj.current->nonce = nonce;
    touch(address);
}

ByteView IntraBlockState::get_code(const evmc::address& address) const noexcept {
    const evmc::bytes32 code_hash{get_code_hash(address)};
    if (code_hash == kEmptyHash) {
        return {};
    }
    if (const auto it{new_code_.find(code_hash)}; it != new_code_.end()) {
        return {it->second.data(), it->second.size()};
    }
    auto [it, inserted]{existing_code_.try_emplace(code_hash)};
    if (inserted) {
        it->second = db_.read_code(code_hash);
    }
    return it->second;
}

evmc::bytes32 IntraBlockState::get_code_hash(const evmc::address& address) const noexcept {
    const state::Object* obj{get_object(address)};
    return obj && obj->current ? obj->current->code_hash : kEmptyHash;
}

void IntraBlockState::set_code(const evmc::address& address, ByteView code) noexcept {
    state::Object& obj{live_object(address)};
    journal_.emplace_back(state::ObjectReplaced{address, obj});
    obj.current->code_hash = std::bit_cast<evmc_bytes32>(keccak256(code));
    // The first copy stays, as views handed out by get_code() may point into it
    new_code_.try_emplace(obj.current->code_hash, code.begin(), code.end());
    touch(address);
}

evmc::bytes32 IntraBlockState::committed_storage(const evmc::address& address, const state::Object& obj,
                                                 const evmc::bytes32& key) const noexcept {
    state::Storage& storage{storage_[address]};
    if (const auto it{storage.committed.find(key)}; it != storage.committed.end()) {
        return it->second;
    }
    // Slots of a previous incarnation are gone
    const bool same_incarnation{obj.initial && obj.initial->incarnation == obj.current->incarnation};
    const evmc::bytes32 value{same_incarnation ? db_.read_storage(address, key) : evmc::bytes32{}};
    storage.committed.emplace(key, value);
    return value;
}

evmc::bytes32 IntraBlockState::get_current_storage(const evmc::address& address,
                                                   const evmc::bytes32& key) const noexcept {
    const state::Object* obj{get_object(address)};
    if (!obj || !obj->current) {
        return {};
    }
    if (const auto it{storage_.find(address)}; it != storage_.end()) {
        if (const auto slot{it->second.pending.find(key)}; slot != it->second.pending.end()) {
            return slot->second;
        }
    }
    return committed_storage(address, *obj, key);
}

evmc::bytes32 IntraBlockState::get_original_storage(const evmc::address& address,
                                                    const evmc::bytes32& key) const noexcept {
    const state::Object* obj{get_object(address)};
    if (!obj || !obj->current) {
        return {};
    }
    return committed_storage(address, *obj, key);
}

void IntraBlockState::set_storage(const evmc::address& address, const evmc::bytes32& key,
                                  const evmc::bytes32& value) noexcept {
    const evmc::bytes32 previous{get_current_storage(address, key)};
    if (previous == value) {
        return;
    }
    journal_.emplace_back(state::StorageSlotChanged{address, key, previous});
    storage_[address].pending[key] = value;
}

void IntraBlockState::undo(const state::JournalEntry& entry) noexcept {
    std::visit(Overloaded{
                   [this](const state::ObjectCreated& e) { objects_.erase(e.address); },
                   [this](const state::ObjectReplaced& e) { objects_[e.address] = e.previous; },
                   [this](const state::BalanceChanged& e) { objects_[e.address].current->balance = e.previous; },
                   [this](const state::SelfDestructRecorded& e) { self_destructs_.erase(e.address); },
                   [this](const state::AccountTouched& e) { touched_.erase(e.address); },
                   [this](const state::StorageSlotChanged& e) { storage_[e.address].pending[e.key] = e.previous; },
                   [this](const state::StorageReset& e) {
                       if (e.previous) {
                           storage_[e.address] = *e.previous;
                       } else {
                           storage_.erase(e.address);
                       }
                   },
               },
               entry);
}

void IntraBlockState::revert_to_snapshot(Snapshot snapshot) noexcept {
    const auto size{static_cast<size_t>(snapshot)};
    while (journal_.size() > size) {
        undo(journal_.back());
        journal_.pop_back();
    }
}

// Not journaled: only runs once the transaction is over
void IntraBlockState::destruct(const evmc::address& address) {
    storage_.erase(address);
    if (state::Object* obj{get_object(address)}) {
        obj->current.reset();
    }
}

void IntraBlockState::finalize_transaction() {
    for (const auto& address : self_destructs_) {
        destruct(address);
    }
    for (const auto& address : touched_) {
        if (is_dead(address)) {
            destruct(address);
        }
    }
    for (auto& [address, storage] : storage_) {
        for (auto& [key, value] : storage.pending) {
            storage.committed.insert_or_assign(key, value);
        }
        storage.pending.clear();
    }
    journal_.clear();
    self_destructs_.clear();
    touched_.clear();
}

std::optional<AccountChange> IntraBlockState::account_change(const evmc::address& address,
                                                             const state::Object& obj) const {
    if (!obj.current) {
        if (obj.initial) {
            return AccountDelete{address};
        }
        return std::nullopt;  // created and destructed within the transaction
    }

    const Account& current{*obj.current};
    AccountModify modify{
        .address = address,
        .balance = current.balance,
        .nonce = current.nonce,
        .reset_storage = !obj.initial || obj.initial->incarnation != current.incarnation,
    };

    const bool code_changed{modify.reset_storage || obj.initial->code_hash != current.code_hash};
    if (code_changed && current.code_hash != kEmptyHash) {
        if (const auto it{new_code_.find(current.code_hash)}; it != new_code_.end()) {
            modify.code = Bytes{it->second.data(), it->second.size()};
        }
    }

    if (const auto it{storage_.find(address)}; it != storage_.end()) {
        for (const auto& [key, value] : it->second.committed) {
            const evmc::bytes32 stored{modify.reset_storage ? evmc::bytes32{} : db_.read_storage(address, key)};
            if (value != stored) {
                modify.storage.emplace(key, value);
            }
        }
    }

    const bool account_changed{!obj.initial || *obj.initial != current};
    if (!account_changed && !modify.code && modify.storage.empty()) {
        return std::nullopt;
    }
    return modify;
}

std::vector<AccountChange> IntraBlockState::account_changes() const {
    std::vector<AccountChange> changes;
    for (const auto& [address, obj] : objects_) {
        if (auto change{account_change(address, obj)}) {
            changes.push_back(std::move(*change));
        }
    }
    std::ranges::sort(changes, [](const AccountChange& a, const AccountChange& b) {
        return changed_address(a) < changed_address(b);
    });
    return changes;
}

}  // namespace gensim
