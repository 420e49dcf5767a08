// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "genesis_config.hpp"

#include <iterator>
#include <limits>
#include <string>
#include <utility>

#include <gensim/core/common/util.hpp>
#include <gensim/core/types/address.hpp>

namespace gensim::genesis {

using namespace evmc::literals;
using namespace intx;

namespace {

    // Quantities may be JSON numbers, "0x" hex strings or decimal strings
    std::optional<intx::uint256> read_quantity(const nlohmann::json& json) {
        if (json.is_number_unsigned()) {
            return intx::uint256{json.get<uint64_t>()};
        }
        if (json.is_string()) {
            return parse_uint256(json.get_ref<const std::string&>());
        }
        return std::nullopt;
    }

    // Fields are accepted under their camelCase or their snake_case name
    const char* field_name(const nlohmann::json& json, const char* camel_case, const char* snake_case) {
        return json.contains(camel_case) || !json.contains(snake_case) ? camel_case : snake_case;
    }

    template <typename T>
    bool read_unsigned(const nlohmann::json& json, const char* key, T& out) {
        if (!json.contains(key) || !json[key].is_number_unsigned()) {
            return false;
        }
        const auto value{json[key].get<uint64_t>()};
        if (value > std::numeric_limits<T>::max()) {
            return false;
        }
        out = static_cast<T>(value);
        return true;
    }

    bool read_address_list(const nlohmann::json& json, const char* key, std::vector<evmc::address>& out) {
        if (!json.contains(key)) {
            return true;
        }
        if (!json[key].is_array()) {
            return false;
        }
        for (const auto& item : json[key]) {
            if (!item.is_string()) return false;
            const auto address{hex_to_address(item.get_ref<const std::string&>())};
            if (!address) return false;
            out.push_back(*address);
        }
        return true;
    }

    bool read_balance_map(const nlohmann::json& json, const char* key, std::map<evmc::address, intx::uint256>& out) {
        if (!json.contains(key)) {
            return true;
        }
        if (!json[key].is_object()) {
            return false;
        }
        for (const auto& [hex, amount_json] : json[key].items()) {
            const auto address{hex_to_address(hex)};
            const auto amount{read_quantity(amount_json)};
            if (!address || !amount) return false;
            out.insert_or_assign(*address, *amount);
        }
        return true;
    }

    std::optional<ConsensusParams> consensus_params_from_json(const nlohmann::json& json) {
        if (!json.is_object()) {
            return std::nullopt;
        }
        ConsensusParams params;
        const auto field{[&json](const char* camel_case, const char* snake_case) {
            return field_name(json, camel_case, snake_case);
        }};
        if (!read_unsigned(json, field("activeValidatorsLength", "active_validators_length"),
                           params.active_validators_length) ||
            !read_unsigned(json, field("epochBlockInterval", "epoch_block_interval"), params.epoch_block_interval) ||
            !read_unsigned(json, field("misdemeanorThreshold", "misdemeanor_threshold"),
                           params.misdemeanor_threshold) ||
            !read_unsigned(json, field("felonyThreshold", "felony_threshold"), params.felony_threshold) ||
            !read_unsigned(json, field("validatorJailEpochLength", "validator_jail_epoch_length"),
                           params.validator_jail_epoch_length) ||
            !read_unsigned(json, field("undelegatePeriod", "undelegate_period"), params.undelegate_period)) {
            return std::nullopt;
        }
        for (auto [key, member] :
             {std::pair{field("minValidatorStakeAmount", "min_validator_stake_amount"),
                        &ConsensusParams::min_validator_stake_amount},
              std::pair{field("minStakingAmount", "min_staking_amount"), &ConsensusParams::min_staking_amount}}) {
            if (!json.contains(key)) return std::nullopt;
            const auto amount{read_quantity(json[key])};
            if (!amount) return std::nullopt;
            params.*member = *amount;
        }
        return params;
    }

}  // namespace

std::vector<intx::uint256> GenesisConfig::ordered_stakes() const {
    std::vector<intx::uint256> stakes;
    for (const auto& validator : validators) {
        if (const auto it{initial_stakes.find(validator)}; it != initial_stakes.end()) {
            stakes.push_back(it->second);
        }
    }
    return stakes;
}

std::optional<GenesisConfig> GenesisConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }
    const auto field{[&json](const char* camel_case, const char* snake_case) {
        return field_name(json, camel_case, snake_case);
    }};
    const char* chain_id_key{field("chainId", "chain_id")};
    if (!json.contains(chain_id_key)) {
        return std::nullopt;
    }
    try {
        GenesisConfig config;

        const auto chain_id{read_quantity(json[chain_id_key])};
        if (!chain_id || *chain_id > std::numeric_limits<ChainId>::max()) {
            return std::nullopt;
        }
        config.chain_id = static_cast<ChainId>(*chain_id);

        if (!read_address_list(json, "deployers", config.deployers) ||
            !read_address_list(json, "validators", config.validators)) {
            return std::nullopt;
        }

        if (const char* key{field("systemTreasury", "system_treasury")}; json.contains(key) && !json[key].is_null()) {
            if (!json[key].is_string()) return std::nullopt;
            config.system_treasury = hex_to_address(json[key].get_ref<const std::string&>());
            if (!config.system_treasury) return std::nullopt;
        }

        const char* params_key{field("consensusParams", "consensus_params")};
        if (!json.contains(params_key)) {
            return std::nullopt;
        }
        auto params{consensus_params_from_json(json[params_key])};
        if (!params) {
            return std::nullopt;
        }
        config.consensus_params = std::move(*params);

        if (const char* key{field("votingPeriod", "voting_period")}; json.contains(key)) {
            if (!json[key].is_number_integer()) return std::nullopt;
            config.voting_period = json[key].get<int64_t>();
        }
        if (const char* key{field("commissionRate", "commission_rate")};
            json.contains(key) && !read_unsigned(json, key, config.commission_rate)) {
            return std::nullopt;
        }

        if (!read_balance_map(json, "faucet", config.faucet) ||
            !read_balance_map(json, field("initialStakes", "initial_stakes"), config.initial_stakes)) {
            return std::nullopt;
        }
        return config;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

GenesisConfig dev_network_config() {
    constexpr evmc::address kValidators[]{
        0x08fae3885e299c24ff9841478eb946f41023ac69_address,
        0x751aaca849b09a3e347bbfe125cf18423cc24b40_address,
        0xa6ff33e3250cc765052ac9d7f7dfebda183c4b9b_address,
        0x49c0f7c8c11a4c80dc6449efe1010bb166818da8_address,
        0x8e1ea6eaa09c3b40f4a51fcd056a031870a0549a_address,
    };
    constexpr auto kInitialStake{0x3635c9adc5dea00000_u256};  // 1000 ether
    constexpr auto kMinStake{0xde0b6b3a7640000_u256};         // 1 ether

    GenesisConfig config;
    config.chain_id = 14000;
    config.validators.assign(std::begin(kValidators), std::end(kValidators));
    config.consensus_params = ConsensusParams{
        .active_validators_length = 25,
        .epoch_block_interval = 12000,
        .misdemeanor_threshold = 50,
        .felony_threshold = 150,
        .validator_jail_epoch_length = 7,
        .undelegate_period = 6,
        .min_validator_stake_amount = kMinStake,
        .min_staking_amount = kMinStake,
    };
    config.voting_period = 60;
    config.faucet = {
        {0x00a601f45688dba8a070722073b015277cf36725_address, 0x21e19e0c9bab2400000_u256},
        {0xb891fe7b38f857f53a7b5529204c58d5c487280b_address, 0x52b7d2dcc80cd2e4000000_u256},
    };
    config.commission_rate = 0;
    for (const auto& validator : kValidators) {
        config.initial_stakes.emplace(validator, kInitialStake);
    }
    return config;
}

std::optional<GenesisConfig> lookup_known_network(std::string_view name) {
    if (iequals(name, "dev")) {
        return dev_network_config();
    }
    return std::nullopt;
}

std::vector<std::string> known_network_names() { return {"dev"}; }

}  // namespace gensim::genesis
