// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <intx/intx.hpp>

#include <gensim/core/common/base.hpp>
#include <gensim/core/common/bytes.hpp>
#include <gensim/core/common/hash_maps.hpp>
#include <gensim/core/state/account_change.hpp>
#include <gensim/core/state/journal.hpp>
#include <gensim/core/state/object.hpp>
#include <gensim/core/state/state.hpp>

namespace gensim {

//! \brief Journaled overlay over a State, serving one transaction
//! \details Mutations are journaled so that the EVM can roll back failed call frames. Nothing is
//! written to the backing State: the net effect is handed out by account_changes().
class IntraBlockState {
  public:
    //! Journal position to roll back to
    enum class Snapshot : size_t {};

    // Not copyable nor movable
    IntraBlockState(const IntraBlockState&) = delete;
    IntraBlockState& operator=(const IntraBlockState&) = delete;

    explicit IntraBlockState(const State& db) noexcept : db_{db} {}

    bool exists(const evmc::address& address) const noexcept;

    // See EIP-161: State trie clearing (invariant-preserving alternative)
    bool is_dead(const evmc::address& address) const noexcept;

    //! \brief Starts a new incarnation at address, keeping only its balance
    void create_contract(const evmc::address& address) noexcept;

    //! \return false if address was already scheduled for self-destruction
    bool record_suicide(const evmc::address& address) noexcept;

    intx::uint256 get_balance(const evmc::address& address) const noexcept;
    void set_balance(const evmc::address& address, const intx::uint256& value) noexcept;
    void add_to_balance(const evmc::address& address, const intx::uint256& addend) noexcept;
    void subtract_from_balance(const evmc::address& address, const intx::uint256& subtrahend) noexcept;

    void touch(const evmc::address& address) noexcept;

    uint64_t get_nonce(const evmc::address& address) const noexcept;
    void set_nonce(const evmc::address& address, uint64_t nonce) noexcept;

    ByteView get_code(const evmc::address& address) const noexcept;
    evmc::bytes32 get_code_hash(const evmc::address& address) const noexcept;
    void set_code(const evmc::address& address, ByteView code) noexcept;

    evmc::bytes32 get_current_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept;

    // https://eips.ethereum.org/EIPS/eip-2200
    evmc::bytes32 get_original_storage(const evmc::address& address, const evmc::bytes32& key) const noexcept;

    void set_storage(const evmc::address& address, const evmc::bytes32& key, const evmc::bytes32& value) noexcept;

    Snapshot take_snapshot() const noexcept { return Snapshot{journal_.size()}; }
    void revert_to_snapshot(Snapshot snapshot) noexcept;

    //! \brief Destructs self-destructed and touched empty accounts, then settles pending storage
    //! \remarks No snapshot taken before can be reverted to afterwards
    void finalize_transaction();

    //! \brief Net effect on the backing State, one entry per changed account, ordered by address
    //! \remarks Call after finalize_transaction
    std::vector<AccountChange> account_changes() const;

  private:
    const state::Object* get_object(const evmc::address& address) const noexcept;
    state::Object* get_object(const evmc::address& address) noexcept;

    //! The object at address with a live current account, created if needed
    state::Object& live_object(const evmc::address& address) noexcept;

    //! Journals the balance at address and returns it for update
    intx::uint256& balance_for_update(const evmc::address& address) noexcept;

    //! Value of key before the running transaction, read through to the backing store on a miss
    evmc::bytes32 committed_storage(const evmc::address& address, const state::Object& obj,
                                    const evmc::bytes32& key) const noexcept;

    void undo(const state::JournalEntry& entry) noexcept;

    void destruct(const evmc::address& address);

    std::optional<AccountChange> account_change(const evmc::address& address, const state::Object& obj) const;

    const State& db_;

    mutable FlatHashMap<evmc::address, state::Object> objects_;
    mutable FlatHashMap<evmc::address, state::Storage> storage_;

    // Code read from db_ is viewed in place. Deployed code is owned here, in vectors rather than
    // Bytes so that a rehash never moves a small buffer out from under a view.
    mutable FlatHashMap<evmc::bytes32, ByteView> existing_code_;
    FlatHashMap<evmc::bytes32, std::vector<uint8_t>> new_code_;

    std::vector<state::JournalEntry> journal_;

    // substate
    FlatHashSet<evmc::address> self_destructs_;
    FlatHashSet<evmc::address> touched_;
};

}  // namespace gensim
