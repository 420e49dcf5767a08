// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evm.hpp"

#include <cstdint>

#include <catch2/catch_test_macros.hpp>

#include <gensim/core/common/util.hpp>
#include <gensim/core/state/in_memory_state.hpp>

namespace gensim {

using namespace evmc::literals;

static constexpr evmc::address kCreator{0x0a6bb546b9208cfab9e8fa2b9b2c042b18df7030_address};
static constexpr evmc::address kTarget{0x0000000000000000000000000000000000001000_address};
static constexpr uint64_t kGas{10'000'000};

static evmc::bytes32 word(uint64_t n) { return intx::be::store<evmc::bytes32>(intx::uint256{n}); }

TEST_CASE("Creation at a chosen address", "[core][execution]") {
    InMemoryState db;
    IntraBlockState state{db};
    const ChainConfig config{.chain_id = 14000};
    const precompile::Registry precompiles;
    const BlockContext block{};
    EVM evm{block, state, config, precompiles};

    // sstore(0, 0x2a) sstore(1, 0x1c9) codecopy(0, 0x16, 6) return(0, 6)
    // runtime: sstore(0, calldataload(0))
    const Bytes init_code{*from_hex("602a6000556101c960015560068060166000396000f3600035600055")};

    const CallResult res{evm.execute_creation({
        .sender = kCreator,
        .target = kTarget,
        .value = 0,
        .init_code = init_code,
        .gas = kGas,
    })};
    REQUIRE(res.status == EVMC_SUCCESS);
    CHECK(res.gas_left > 0);
    CHECK(res.gas_left < kGas);

    CHECK(to_hex(state.get_code(kTarget)) == "600035600055");
    CHECK(state.get_nonce(kTarget) == 1);
    CHECK(state.get_nonce(kCreator) == 1);
    CHECK(state.get_current_storage(kTarget, word(0)) == word(0x2a));
    CHECK(state.get_current_storage(kTarget, word(1)) == word(0x1c9));
}

TEST_CASE("Constructor sees the chain id", "[core][execution]") {
    InMemoryState db;
    IntraBlockState state{db};
    const ChainConfig config{.chain_id = 14000};
    const precompile::Registry precompiles;
    const BlockContext block{};
    EVM evm{block, state, config, precompiles};

    // sstore(0, chainid())
    const Bytes init_code{*from_hex("4660005500")};
    const CallResult res{evm.execute_creation({.sender = kCreator, .target = kTarget, .init_code = init_code, .gas = kGas})};
    REQUIRE(res.status == EVMC_SUCCESS);
    CHECK(state.get_current_storage(kTarget, word(0)) == word(14000));
    CHECK(state.get_code(kTarget).empty());
}

TEST_CASE("Failed creation", "[core][execution]") {
    InMemoryState db;
    IntraBlockState state{db};
    const ChainConfig config{.chain_id = 1};
    const precompile::Registry precompiles;
    const BlockContext block{};
    EVM evm{block, state, config, precompiles};

    CreationMessage message{.sender = kCreator, .target = kTarget, .gas = kGas};

    SECTION("revert with data") {
        // sstore(0, 1) mstore(0, 0xdead) revert(0, 32)
        const Bytes init_code{*from_hex("600160005561dead60005260206000fd")};
        message.init_code = init_code;
        const CallResult res{evm.execute_creation(message)};
        CHECK(res.status == EVMC_REVERT);
        CHECK(to_hex(res.data) == "000000000000000000000000000000000000000000000000000000000000dead");
        CHECK(res.gas_left > 0);
    }

    SECTION("invalid instruction") {
        const Bytes init_code{*from_hex("6001600055fe")};
        message.init_code = init_code;
        const CallResult res{evm.execute_creation(message)};
        CHECK(res.status == EVMC_INVALID_INSTRUCTION);
        CHECK(res.gas_left == 0);
    }

    SECTION("out of gas") {
        const Bytes init_code{*from_hex("6001600055")};
        message.init_code = init_code;
        message.gas = 100;
        const CallResult res{evm.execute_creation(message)};
        CHECK(res.status == EVMC_OUT_OF_GAS);
    }

    SECTION("insufficient balance") {
        const Bytes init_code{*from_hex("00")};
        message.init_code = init_code;
        message.value = 1;
        const CallResult res{evm.execute_creation(message)};
        CHECK(res.status == EVMC_INSUFFICIENT_BALANCE);
    }

    SECTION("address collision") {
        state.set_nonce(kTarget, 1);
        const Bytes init_code{*from_hex("00")};
        message.init_code = init_code;
        const CallResult res{evm.execute_creation(message)};
        CHECK(res.status == EVMC_INVALID_INSTRUCTION);
        CHECK(state.get_nonce(kTarget) == 1);
    }

    // Nothing of the failed frame is left behind
    CHECK(state.get_current_storage(kTarget, word(0)) == evmc::bytes32{});
    CHECK(state.get_code(kTarget).empty());
}

TEST_CASE("Constructor calling precompiles", "[core][execution]") {
    InMemoryState db;
    IntraBlockState state{db};
    const ChainConfig config{.chain_id = 1};
    const precompile::Registry precompiles;
    const BlockContext block{};
    EVM evm{block, state, config, precompiles};

    SECTION("identity and sha256") {
        // mstore(0, 0x2a)
        // sstore(1, call(gas, 0x04, 0, 0, 32, 32, 32)) sstore(0, mload(32))
        // pop(call(gas, 0x02, 0, 0, 0, 0, 32)) sstore(2, mload(0))
        const Bytes init_code{*from_hex(
            "602a600052"
            "6020602060206000600060045af1600155602051600055"
            "6020600060006000600060025af150600051600255"
            "00")};
        const CallResult res{evm.execute_creation({.sender = kCreator, .target = kTarget, .init_code = init_code, .gas = kGas})};
        REQUIRE(res.status == EVMC_SUCCESS);
        CHECK(state.get_current_storage(kTarget, word(0)) == word(0x2a));
        CHECK(state.get_current_storage(kTarget, word(1)) == word(1));
        CHECK(to_hex(state.get_current_storage(kTarget, word(2))) ==
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SECTION("failing precompile does not abort the constructor") {
        // mstore(0, 1) mstore(32, 3): (1, 3) is not on alt_bn128
        // sstore(0, iszero(call(gas, 0x0402, 0, 0, 64, 0, 0)))
        const Bytes init_code{*from_hex("6001600052600360205260006000604060006000610402" "5af115600055" "00")};
        const CallResult res{evm.execute_creation({.sender = kCreator, .target = kTarget, .init_code = init_code, .gas = kGas})};
        REQUIRE(res.status == EVMC_SUCCESS);
        CHECK(state.get_current_storage(kTarget, word(0)) == word(1));
    }

    SECTION("modexp with an oversized exponent length fails the inner call") {
        // mstore(0, 1) mstore(32, 0x1000000000000000) mstore(64, 1)
        // sstore(0, iszero(staticcall(gas, 0x05, 0, 96, 0, 0)))
        const Bytes init_code{*from_hex(
            "6001600052"
            "6710000000000000006020526001604052"
            "60006000606060006005"
            "5afa15600055"
            "00")};
        const uint64_t genesis_gas{static_cast<uint64_t>(INT64_MAX)};
        const CallResult res{evm.execute_creation({.sender = kCreator, .target = kTarget, .init_code = init_code, .gas = genesis_gas})};
        REQUIRE(res.status == EVMC_SUCCESS);
        CHECK(state.get_current_storage(kTarget, word(0)) == word(1));
    }
}

TEST_CASE("Constructor calling other contracts", "[core][execution]") {
    static constexpr evmc::address kGood{0x000000000000000000000000000000000000c0de_address};
    static constexpr evmc::address kBad{0x0000000000000000000000000000000000000bad_address};

    InMemoryState db;
    IntraBlockState state{db};
    state.set_code(kGood, *from_hex("602a60005500"));  // sstore(0, 0x2a)
    state.set_code(kBad, *from_hex("6001600055" "60006000fd"));  // sstore(0, 1) revert(0, 0)

    const ChainConfig config{.chain_id = 1};
    const precompile::Registry precompiles;
    const BlockContext block{};
    EVM evm{block, state, config, precompiles};

    // sstore(0, call(gas, kGood, 0, 0, 0, 0, 0))
    // sstore(1, iszero(call(gas, kBad, 0, 0, 0, 0, 0)))
    const Bytes init_code{*from_hex(
        "6000600060006000600061c0de5af1600055"
        "60006000600060006000610bad5af115600155"
        "00")};
    const CallResult res{evm.execute_creation({.sender = kCreator, .target = kTarget, .init_code = init_code, .gas = kGas})};
    REQUIRE(res.status == EVMC_SUCCESS);

    CHECK(state.get_current_storage(kTarget, word(0)) == word(1));
    CHECK(state.get_current_storage(kTarget, word(1)) == word(1));
    CHECK(state.get_current_storage(kGood, word(0)) == word(0x2a));
    // reverted inner frame
    CHECK(state.get_current_storage(kBad, word(0)) == evmc::bytes32{});
}

TEST_CASE("Storage write classification", "[core][execution]") {
    const evmc::bytes32 zero{};
    const evmc::bytes32 one{word(1)};
    const evmc::bytes32 two{word(2)};

    // clean slots
    CHECK(storage_status(zero, zero, zero) == EVMC_STORAGE_ASSIGNED);
    CHECK(storage_status(zero, zero, one) == EVMC_STORAGE_ADDED);
    CHECK(storage_status(one, one, zero) == EVMC_STORAGE_DELETED);
    CHECK(storage_status(one, one, two) == EVMC_STORAGE_MODIFIED);

    // dirty slots
    CHECK(storage_status(zero, one, zero) == EVMC_STORAGE_ADDED_DELETED);
    CHECK(storage_status(zero, one, two) == EVMC_STORAGE_ASSIGNED);
    CHECK(storage_status(one, zero, one) == EVMC_STORAGE_DELETED_RESTORED);
    CHECK(storage_status(one, zero, two) == EVMC_STORAGE_DELETED_ADDED);
    CHECK(storage_status(one, two, zero) == EVMC_STORAGE_MODIFIED_DELETED);
    CHECK(storage_status(one, two, one) == EVMC_STORAGE_MODIFIED_RESTORED);
    CHECK(storage_status(one, two, word(3)) == EVMC_STORAGE_ASSIGNED);
}

}  // namespace gensim
