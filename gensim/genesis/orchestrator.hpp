// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <gensim/core/chain/genesis.hpp>
#include <gensim/core/execution/execution.hpp>
#include <gensim/core/execution/precompile.hpp>
#include <gensim/genesis/abi.hpp>
#include <gensim/genesis/assets.hpp>
#include <gensim/genesis/genesis_config.hpp>

namespace gensim::genesis {

//! A system contract constructor that did not succeed
class DeploymentError : public std::runtime_error {
  public:
    DeploymentError(std::string contract, ExecutionFailure failure);

    const std::string& contract() const noexcept { return contract_; }
    const ExecutionFailure& failure() const noexcept { return failure_; }

  private:
    std::string contract_;
    ExecutionFailure failure_;
};

//! \brief One system contract to deploy at genesis
struct Deployment {
    std::string name;  // asset name under contracts/ and abi/
    evmc::address address;
    std::vector<AbiValue> inputs;
    //! When set, inputs are encoded as a call to this function and passed as the single bytes
    //! argument of the constructor, otherwise they are the constructor arguments themselves
    std::optional<std::string> init_function;
};

//! \brief Deployments to run for config, in order
//! \details Staking at kStakingAddress initialized through ctor(address[],uint256[],uint256)
std::vector<Deployment> make_deployment_plan(const GenesisConfig& config);

//! \brief Creation bytecode followed by the encoded constructor arguments
//! \throws AbiError
Bytes build_init_code(const ContractArtifact& artifact, const ContractAbi& abi, const Deployment& deployment);

//! \brief Whether the code left by a simulation equals the artifact's runtime bytecode
//! \details An empty expected code matches anything. Immutables filled in by the constructor are
//! a legitimate source of differences.
bool runtime_code_matches(ByteView deployed, ByteView expected) noexcept;

class GenesisBuilder {
  public:
    GenesisBuilder(const AssetBundle& assets, const precompile::Registry& precompiles)
        : assets_{assets}, precompiles_{precompiles} {}

    /**
     * @brief Runs every deployment of the plan and assembles the genesis document
     * @details Assets for the whole plan are loaded before the first simulation. Each deployment
     * runs on its own empty state. Faucet accounts are added as plain balances.
     * @throws AssetError, AbiError or DeploymentError; nothing is returned on partial success
     */
    GenesisDocument build(const GenesisConfig& config, const std::vector<Deployment>& plan) const;

    GenesisDocument build(const GenesisConfig& config) const { return build(config, make_deployment_plan(config)); }

    //! \throws DeploymentError
    GenesisAccount deploy(const Deployment& deployment, ByteView init_code, const ChainConfig& chain_config) const;

  private:
    const AssetBundle& assets_;
    const precompile::Registry& precompiles_;
};

//! \brief Chain configuration block derived from the network inputs
ChainConfig make_chain_config(const GenesisConfig& config);

//! \brief Writes the document as pretty-printed JSON
//! \details The content goes to a sibling temporary file first, renamed over path once complete
//! \throws std::runtime_error or std::filesystem::filesystem_error
void write_genesis(const GenesisDocument& genesis, const std::filesystem::path& path);

}  // namespace gensim::genesis
