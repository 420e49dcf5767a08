// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <gensim/core/chain/config.hpp>

namespace gensim::genesis {

//! Parameters handed to the staking contract at genesis
struct ConsensusParams {
    uint32_t active_validators_length{0};
    uint64_t epoch_block_interval{0};
    uint32_t misdemeanor_threshold{0};
    uint32_t felony_threshold{0};
    uint32_t validator_jail_epoch_length{0};
    uint32_t undelegate_period{0};
    intx::uint256 min_validator_stake_amount;
    intx::uint256 min_staking_amount;

    friend bool operator==(const ConsensusParams&, const ConsensusParams&) = default;
};

//! \brief Network inputs of a genesis generation run
struct GenesisConfig {
    ChainId chain_id{0};
    std::vector<evmc::address> deployers;
    std::vector<evmc::address> validators;  // order is significant
    std::optional<evmc::address> system_treasury;
    ConsensusParams consensus_params;
    int64_t voting_period{0};
    std::map<evmc::address, intx::uint256> faucet;
    uint64_t commission_rate{0};
    std::map<evmc::address, intx::uint256> initial_stakes;

    //! Stakes of validators that have one, in validator order
    std::vector<intx::uint256> ordered_stakes() const;

    /*Sample JSON input:
    {
        "chainId": 14000,
        "validators": ["0x08fae3885e299c24ff9841478eb946f41023ac69"],
        "consensusParams": {"activeValidatorsLength": 25, "epochBlockInterval": 12000, ...},
        "faucet": {"0x00a601f45688dba8a070722073b015277cf36725": "0x21e19e0c9bab2400000"},
        "initialStakes": {"0x08fae3885e299c24ff9841478eb946f41023ac69": "0x3635c9adc5dea00000"}
    }
    */
    //! \brief Try parse a JSON object into strongly typed GenesisConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<GenesisConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const GenesisConfig&, const GenesisConfig&) = default;
};

//! Five-validator development network with chain id 14000
GenesisConfig dev_network_config();

//! \return The built-in configuration named name, matched case-insensitively
std::optional<GenesisConfig> lookup_known_network(std::string_view name);

std::vector<std::string> known_network_names();

}  // namespace gensim::genesis
