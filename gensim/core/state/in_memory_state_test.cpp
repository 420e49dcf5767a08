// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_state.hpp"

#include <bit>

#include <catch2/catch_test_macros.hpp>

#include <gensim/core/common/util.hpp>

namespace gensim {

using namespace evmc::literals;

static constexpr evmc::address kAlice{0x00000000000000000000000000000000000a11ce_address};
static constexpr evmc::address kBob{0x0000000000000000000000000000000000000b0b_address};
static constexpr evmc::bytes32 kSlot1{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
static constexpr evmc::bytes32 kSlot2{0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
static constexpr evmc::bytes32 kValue{0x00000000000000000000000000000000000000000000000000000000000000ff_bytes32};

static AccountModify contract_at(const evmc::address& address) {
    return AccountModify{
        .address = address,
        .balance = 7,
        .nonce = 1,
        .code = *from_hex("600035600055"),
        .storage = {{kSlot1, kValue}, {kSlot2, kValue}},
    };
}

TEST_CASE("Apply account modification", "[core][state]") {
    InMemoryState state;
    REQUIRE(state.apply({contract_at(kAlice)}));

    const auto account{state.read_account(kAlice)};
    REQUIRE(account);
    CHECK(account->balance == 7);
    CHECK(account->nonce == 1);
    CHECK(account->incarnation == kDefaultIncarnation);
    CHECK(account->code_hash == std::bit_cast<evmc_bytes32>(keccak256(*from_hex("600035600055"))));
    CHECK(to_hex(state.read_code(account->code_hash)) == "600035600055");
    CHECK(state.read_storage(kAlice, kSlot1) == kValue);
    CHECK(state.storage_size(kAlice) == 2);

    SECTION("zero value clears the slot") {
        AccountModify clear{.address = kAlice, .balance = 7, .nonce = 1, .storage = {{kSlot1, evmc::bytes32{}}}};
        REQUIRE(state.apply({clear}));
        CHECK(state.read_storage(kAlice, kSlot1) == evmc::bytes32{});
        CHECK(state.storage_size(kAlice) == 1);
        // code survives a modification without code
        CHECK(to_hex(state.read_code(state.get_account(kAlice).code_hash)) == "600035600055");
    }

    SECTION("storage reset") {
        AccountModify reset{.address = kAlice, .nonce = 1, .storage = {{kSlot2, kValue}}, .reset_storage = true};
        REQUIRE(state.apply({reset}));
        CHECK(state.read_storage(kAlice, kSlot1) == evmc::bytes32{});
        CHECK(state.read_storage(kAlice, kSlot2) == kValue);
        CHECK(state.get_account(kAlice).balance == 0);
    }

    SECTION("delete") {
        REQUIRE(state.apply({AccountDelete{kAlice}}));
        CHECK(!state.read_account(kAlice));
        CHECK(state.storage_size(kAlice) == 0);
        CHECK(state.get_account(kAlice).empty());
    }
}

TEST_CASE("Apply is all or nothing", "[core][state]") {
    InMemoryState state;
    REQUIRE(state.apply({contract_at(kAlice)}));
    const auto before{state.accounts()};

    SECTION("duplicate address") {
        const auto result{state.apply({contract_at(kBob), AccountModify{.address = kBob, .balance = 1}})};
        REQUIRE(!result);
        CHECK(result.error() == ApplyError::kDuplicateAddress);
    }

    SECTION("missing account") {
        const auto result{state.apply({contract_at(kBob), AccountDelete{0x0000000000000000000000000000000000000dead_address}})};
        REQUIRE(!result);
        CHECK(result.error() == ApplyError::kMissingAccount);
    }

    CHECK(state.accounts() == before);
    CHECK(!state.read_account(kBob));
    CHECK(state.storage_size(kAlice) == 2);
}

TEST_CASE("Snapshot is independent", "[core][state]") {
    InMemoryState state;
    REQUIRE(state.apply({contract_at(kAlice)}));

    InMemoryState copy{state.snapshot()};
    REQUIRE(copy.apply({AccountDelete{kAlice}, contract_at(kBob)}));

    CHECK(state.read_account(kAlice));
    CHECK(!state.read_account(kBob));
    CHECK(!copy.read_account(kAlice));
    CHECK(copy.read_storage(kBob, kSlot2) == kValue);
}

}  // namespace gensim
