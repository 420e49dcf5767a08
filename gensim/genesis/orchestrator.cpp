// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "orchestrator.hpp"

#include <fstream>
#include <limits>
#include <utility>

#include <gensim/core/common/util.hpp>
#include <gensim/core/state/in_memory_state.hpp>
#include <gensim/core/types/address.hpp>
#include <gensim/genesis/collector.hpp>
#include <gensim/genesis/system_contracts.hpp>
#include <gensim/infra/common/ensure.hpp>
#include <gensim/infra/common/log.hpp>

namespace gensim::genesis {

static std::string describe(const std::string& contract, const ExecutionFailure& failure) {
    std::string what{"deployment of " + contract + " failed: " + to_string(failure.status)};
    if (!failure.message.empty()) {
        what += " (" + failure.message + ")";
    }
    if (!failure.output.empty()) {
        what += " output=" + to_hex(failure.output, /*with_prefix=*/true);
    }
    return what;
}

DeploymentError::DeploymentError(std::string contract, ExecutionFailure failure)
    : std::runtime_error{describe(contract, failure)}, contract_{std::move(contract)}, failure_{std::move(failure)} {}

std::vector<Deployment> make_deployment_plan(const GenesisConfig& config) {
    AbiValue::Array validators;
    for (const auto& validator : config.validators) {
        validators.emplace_back(validator);
    }

    AbiValue::Array stakes;
    intx::uint256 stake_total{0};
    for (const auto& stake : config.ordered_stakes()) {
        stakes.emplace_back(stake);
        stake_total += stake;
        GENSIM_LOG_INFO("Initial stake", {"amount", to_hex_quantity(stake)});
    }
    GENSIM_LOG_INFO("Initial stakes", {"count", std::to_string(stakes.size()), "total", to_hex_quantity(stake_total)});
    if (stakes.size() != validators.size()) {
        GENSIM_LOG_WARN("Some validators have no initial stake",
                        {"validators", std::to_string(validators.size()), "stakes", std::to_string(stakes.size())});
    }

    std::vector<Deployment> plan;
    plan.push_back(Deployment{
        .name = "Staking",
        .address = kStakingAddress,
        .inputs = {std::move(validators), std::move(stakes), intx::uint256{config.commission_rate}},
        .init_function = "ctor",
    });
    return plan;
}

Bytes build_init_code(const ContractArtifact& artifact, const ContractAbi& abi, const Deployment& deployment) {
    Bytes init_code{artifact.bytecode};
    if (deployment.init_function) {
        Bytes call{encode_function_call(abi, *deployment.init_function, deployment.inputs)};
        init_code += encode_constructor(abi, {AbiValue{std::move(call)}});
    } else {
        init_code += encode_constructor(abi, deployment.inputs);
    }
    return init_code;
}

ChainConfig make_chain_config(const GenesisConfig& config) {
    ChainConfig chain_config;
    chain_config.chain_id = config.chain_id;
    chain_config.parlia = ParliaConfig{.period = 3, .epoch = config.consensus_params.epoch_block_interval};
    return chain_config;
}

bool runtime_code_matches(ByteView deployed, ByteView expected) noexcept {
    return expected.empty() || deployed == expected;
}

GenesisAccount GenesisBuilder::deploy(const Deployment& deployment, ByteView init_code,
                                      const ChainConfig& chain_config) const {
    GENSIM_LOG_INFO("Deploying system contract", {"name", deployment.name, "address", address_to_hex(deployment.address),
                                                  "init_code_size", std::to_string(init_code.size())});

    InMemoryState state;
    const auto outcome{execute_creation(state, chain_config, precompiles_, evmc::address{}, deployment.address,
                                        /*value=*/0, init_code, std::numeric_limits<uint64_t>::max())};
    if (!outcome) {
        GENSIM_LOG_ERROR("System contract deployment failed",
                         {"name", deployment.name, "status", to_string(outcome.error().status)});
        throw DeploymentError{deployment.name, outcome.error()};
    }

    GenesisAccount account{collect_account(*outcome, deployment.address)};
    GENSIM_LOG_INFO("Deployed system contract", {"name", deployment.name, "code_size", std::to_string(account.code.size()),
                                                 "storage_slots", std::to_string(account.storage.size())});
    return account;
}

GenesisDocument GenesisBuilder::build(const GenesisConfig& config, const std::vector<Deployment>& plan) const {
    GenesisDocument genesis;
    genesis.config = make_chain_config(config);

    // Load and encode everything up front so that bad assets fail before any simulation
    std::vector<Bytes> init_codes;
    std::vector<Bytes> runtime_codes;
    init_codes.reserve(plan.size());
    runtime_codes.reserve(plan.size());
    for (const auto& deployment : plan) {
        ContractArtifact artifact{assets_.artifact(deployment.name)};
        const ContractAbi abi{assets_.abi(deployment.name)};
        init_codes.push_back(build_init_code(artifact, abi, deployment));
        runtime_codes.push_back(std::move(artifact.deployed_bytecode));
    }

    for (size_t i{0}; i < plan.size(); ++i) {
        const auto& deployment{plan[i]};
        ensure_pre_condition(!genesis.alloc.contains(deployment.address),
                             [&]() { return "address deployed twice: " + address_to_hex(deployment.address); });
        GenesisAccount account{deploy(deployment, init_codes[i], genesis.config)};
        if (!runtime_code_matches(account.code, runtime_codes[i])) {
            GENSIM_LOG_DEBUG("Deployed code differs from the artifact runtime bytecode",
                             {"name", deployment.name, "code_size", std::to_string(account.code.size()),
                              "artifact_size", std::to_string(runtime_codes[i].size())});
        }
        genesis.alloc.emplace(deployment.address, std::move(account));
    }

    for (const auto& [address, balance] : config.faucet) {
        if (genesis.alloc.contains(address)) {
            GENSIM_LOG_WARN("Faucet address collides with a system contract, skipped",
                            {"address", address_to_hex(address)});
            continue;
        }
        GenesisAccount account;
        account.balance = balance;
        genesis.alloc.emplace(address, std::move(account));
        GENSIM_LOG_DEBUG("Faucet account", {"address", address_to_hex(address), "balance", to_hex_quantity(balance)});
    }
    return genesis;
}

void write_genesis(const GenesisDocument& genesis, const std::filesystem::path& path) {
    auto tmp_path{path};
    tmp_path += ".tmp";
    {
        std::ofstream out{tmp_path, std::ios::out | std::ios::trunc};
        if (!out.is_open()) {
            throw std::runtime_error{"cannot open " + tmp_path.string() + " for writing"};
        }
        out << genesis.to_json().dump(2) << '\n';
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp_path);
            throw std::runtime_error{"failed writing " + tmp_path.string()};
        }
    }
    std::filesystem::rename(tmp_path, path);
    GENSIM_LOG_INFO("Genesis written", {"path", path.string(), "accounts", std::to_string(genesis.alloc.size())});
}

}  // namespace gensim::genesis
