// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "orchestrator.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

#include <catch2/catch_test_macros.hpp>

#include <gensim/core/common/util.hpp>
#include <gensim/core/types/address.hpp>
#include <gensim/genesis/system_contracts.hpp>
#include <gensim/infra/common/directories.hpp>

namespace gensim::genesis {

using namespace evmc::literals;
using namespace intx;

static constexpr evmc::address kValidator1{0x08fae3885e299c24ff9841478eb946f41023ac69_address};
static constexpr evmc::address kValidator2{0x751aaca849b09a3e347bbfe125cf18423cc24b40_address};
static constexpr evmc::address kFaucet{0x00a601f45688dba8a070722073b015277cf36725_address};

// Decodes ctor(address[],uint256[],uint256) wrapped in constructor(bytes) and stores
// slot 0: validator count, slots 1..2: validators, slots 0x10..0x11: stakes, slot 0x20: commission rate.
// The runtime code returns slot 0.
static constexpr std::string_view kStakingBytecode{
    "0x61006638036100666000396044516044015160005560445160440160200151600155604451604401604001516002556064516044016020"
    "015160105560645160440160400151601155608451602055600b8061005b6000396000f360005460005260206000f3"};
static constexpr std::string_view kStakingRuntime{"60005460005260206000f3"};

static constexpr std::string_view kStakingAbi{R"([
    {"type": "constructor", "inputs": [{"name": "constructorParams", "type": "bytes"}]},
    {"type": "function", "name": "ctor", "inputs": [
        {"name": "validators", "type": "address[]"},
        {"name": "initialStakes", "type": "uint256[]"},
        {"name": "commissionRate", "type": "uint256"}]},
    {"type": "event", "name": "ValidatorAdded", "inputs": [{"name": "validator", "type": "address", "indexed": true}]}
])"};

static evmc::bytes32 word(const intx::uint256& n) { return intx::be::store<evmc::bytes32>(n); }

static evmc::bytes32 word(const evmc::address& a) {
    evmc::bytes32 w{};
    std::copy(std::begin(a.bytes), std::end(a.bytes), w.bytes + 12);
    return w;
}

static void write_file(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out{path};
    out << content;
}

static void write_contract(const std::filesystem::path& root, std::string_view name, std::string_view bytecode,
                           std::string_view deployed_bytecode, std::string_view abi) {
    const std::string file_name{std::string{name} + ".json"};
    nlohmann::json artifact;
    artifact["contractName"] = std::string{name};
    artifact["bytecode"] = std::string{bytecode};
    artifact["deployedBytecode"] = std::string{deployed_bytecode};
    write_file(root / "contracts" / file_name, artifact.dump());
    write_file(root / "abi" / file_name, abi);
}

static GenesisConfig sample_config() {
    GenesisConfig config;
    config.chain_id = 14000;
    config.validators = {kValidator1, kValidator2};
    config.consensus_params.epoch_block_interval = 1200;
    config.commission_rate = 5;
    config.initial_stakes = {{kValidator1, 0x3635c9adc5dea00000_u256}, {kValidator2, 0x1bc16d674ec80000_u256}};
    config.faucet = {{kFaucet, 0x21e19e0c9bab2400000_u256}};
    return config;
}

TEST_CASE("Deployment plan", "[genesis][orchestrator]") {
    const auto plan{make_deployment_plan(sample_config())};
    REQUIRE(plan.size() == 1);
    CHECK(plan[0].name == "Staking");
    CHECK(plan[0].address == kStakingAddress);
    CHECK(plan[0].init_function == "ctor");
    REQUIRE(plan[0].inputs.size() == 3);

    const auto& validators{std::get<AbiValue::Array>(plan[0].inputs[0].value())};
    REQUIRE(validators.size() == 2);
    CHECK(std::get<evmc::address>(validators[0].value()) == kValidator1);
    const auto& stakes{std::get<AbiValue::Array>(plan[0].inputs[1].value())};
    REQUIRE(stakes.size() == 2);
    CHECK(std::get<intx::uint256>(stakes[1].value()) == 0x1bc16d674ec80000_u256);
    CHECK(std::get<intx::uint256>(plan[0].inputs[2].value()) == 5);
}

TEST_CASE("Chain config from genesis config", "[genesis][orchestrator]") {
    const ChainConfig chain_config{make_chain_config(sample_config())};
    CHECK(chain_config.chain_id == 14000);
    REQUIRE(chain_config.parlia);
    CHECK(chain_config.parlia->period == 3);
    CHECK(chain_config.parlia->epoch == 1200);
}

TEST_CASE("Build genesis", "[genesis][orchestrator]") {
    TemporaryDirectory tmp_dir;
    const auto& root{tmp_dir.path()};
    write_contract(root, "Staking", kStakingBytecode, kStakingRuntime, kStakingAbi);

    const AssetBundle assets{root};
    const precompile::Registry precompiles;
    const GenesisBuilder builder{assets, precompiles};
    auto config{sample_config()};

    SECTION("staking contract and faucet") {
        const GenesisDocument genesis{builder.build(config)};
        CHECK(genesis.config.chain_id == 14000);
        REQUIRE(genesis.alloc.size() == 2);

        const GenesisAccount& staking{genesis.alloc.at(kStakingAddress)};
        CHECK(to_hex(staking.code) == kStakingRuntime);
        CHECK(staking.nonce == 1);
        CHECK(staking.balance == 0);
        CHECK(staking.storage == std::map<evmc::bytes32, evmc::bytes32>{
                                     {word(0), word(2)},
                                     {word(1), word(kValidator1)},
                                     {word(2), word(kValidator2)},
                                     {word(0x10), word(0x3635c9adc5dea00000_u256)},
                                     {word(0x11), word(0x1bc16d674ec80000_u256)},
                                     {word(0x20), word(5)},
                                 });

        const GenesisAccount& faucet{genesis.alloc.at(kFaucet)};
        CHECK(faucet.balance == 0x21e19e0c9bab2400000_u256);
        CHECK(faucet.code.empty());
        CHECK(faucet.storage.empty());
    }

    SECTION("repeated runs are identical") {
        CHECK(builder.build(config).to_json() == builder.build(config).to_json());
    }

    SECTION("zero commission leaves its slot out") {
        config.commission_rate = 0;
        const GenesisDocument genesis{builder.build(config)};
        CHECK(!genesis.alloc.at(kStakingAddress).storage.contains(word(0x20)));
    }

    SECTION("faucet colliding with a system contract") {
        config.faucet.emplace(kStakingAddress, 1);
        const GenesisDocument genesis{builder.build(config)};
        CHECK(genesis.alloc.size() == 2);
        CHECK(genesis.alloc.at(kStakingAddress).balance == 0);
    }

    SECTION("same address deployed twice") {
        write_contract(root, "Empty", "0x00", "0x", "[]");
        const Deployment empty{.name = "Empty", .address = kStakingAddress, .inputs = {}, .init_function = {}};
        const GenesisDocument genesis{builder.build(config, {empty})};
        CHECK(genesis.alloc.at(kStakingAddress) == GenesisAccount{.nonce = 1});
        CHECK_THROWS_AS(builder.build(config, {empty, empty}), std::invalid_argument);
    }

    SECTION("artifact runtime bytecode differing from the deployed code") {
        write_contract(root, "Staking", kStakingBytecode, "0x600160005260206000f3", kStakingAbi);
        const GenesisDocument genesis{builder.build(config)};
        CHECK(to_hex(genesis.alloc.at(kStakingAddress).code) == kStakingRuntime);
    }
}

TEST_CASE("Runtime code comparison", "[genesis][orchestrator]") {
    const Bytes runtime{*from_hex(kStakingRuntime)};
    CHECK(runtime_code_matches(runtime, runtime));
    CHECK(runtime_code_matches(runtime, {}));
    CHECK(runtime_code_matches({}, {}));
    CHECK(!runtime_code_matches(runtime, *from_hex("600160005260206000f3")));
    CHECK(!runtime_code_matches({}, runtime));
}

TEST_CASE("Build genesis failures", "[genesis][orchestrator]") {
    TemporaryDirectory tmp_dir;
    const auto& root{tmp_dir.path()};
    const AssetBundle assets{root};
    const precompile::Registry precompiles;
    const GenesisBuilder builder{assets, precompiles};
    const auto config{sample_config()};

    SECTION("missing assets") {
        CHECK_THROWS_AS(builder.build(config), AssetError);
    }

    SECTION("ABI without the init function") {
        write_contract(root, "Staking", kStakingBytecode, kStakingRuntime,
                       R"([{"type": "constructor", "inputs": [{"name": "data", "type": "bytes"}]}])");
        CHECK_THROWS_AS(builder.build(config), AbiError);
    }

    SECTION("reverting constructor") {
        // mstore(0, 0xdead) revert(30, 2)
        write_contract(root, "Staking", "0x61dead6000526002601efd", "0x", kStakingAbi);
        try {
            static_cast<void>(builder.build(config));
            FAIL("deployment should have failed");
        } catch (const DeploymentError& e) {
            CHECK(e.contract() == "Staking");
            CHECK(e.failure().status == EVMC_REVERT);
            CHECK(to_hex(e.failure().output) == "dead");
            CHECK(std::string{e.what()}.find("Staking") != std::string::npos);
        }
    }

    SECTION("invalid instruction") {
        write_contract(root, "Staking", "0xfe", "0x", kStakingAbi);
        CHECK_THROWS_AS(builder.build(config), DeploymentError);
    }
}

TEST_CASE("Write genesis", "[genesis][orchestrator]") {
    TemporaryDirectory tmp_dir;
    const auto path{tmp_dir.path() / "genesis.json"};

    GenesisDocument genesis;
    genesis.config.chain_id = 14000;
    genesis.alloc.emplace(kFaucet, GenesisAccount{.balance = 0x21e19e0c9bab2400000_u256});
    genesis.alloc.emplace(kStakingAddress, GenesisAccount{.code = *from_hex("00"), .storage = {{word(0), word(2)}}});

    write_genesis(genesis, path);
    CHECK(!std::filesystem::exists(tmp_dir.path() / "genesis.json.tmp"));

    std::ifstream in{path};
    const auto json{nlohmann::json::parse(in)};
    CHECK(json == genesis.to_json());
    CHECK(json["alloc"][address_to_hex(kFaucet)]["balance"] == "0x21e19e0c9bab2400000");
    CHECK(json["alloc"][address_to_hex(kStakingAddress)]["storage"].size() == 1);

    SECTION("overwrite") {
        genesis.alloc.erase(kFaucet);
        write_genesis(genesis, path);
        std::ifstream again{path};
        CHECK(nlohmann::json::parse(again)["alloc"].size() == 1);
    }

    SECTION("missing directory") {
        CHECK_THROWS_AS(write_genesis(genesis, tmp_dir.path() / "nowhere" / "genesis.json"), std::runtime_error);
    }
}

}  // namespace gensim::genesis
