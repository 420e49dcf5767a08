// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <ostream>
#include <string>

#include <gensim/core/types/evmc_bytes32.hpp>

namespace gensim {

namespace {

    // JSON key -> member pointer, in emission order
    struct ForkField {
        const char* key;
        std::optional<BlockNum> ChainConfig::*member;
    };

    constexpr ForkField kForkFields[]{
        {"homesteadBlock", &ChainConfig::homestead_block},
        {"eip150Block", &ChainConfig::eip150_block},
        {"eip155Block", &ChainConfig::eip155_block},
        {"eip158Block", &ChainConfig::eip158_block},
        {"byzantiumBlock", &ChainConfig::byzantium_block},
        {"constantinopleBlock", &ChainConfig::constantinople_block},
        {"petersburgBlock", &ChainConfig::petersburg_block},
        {"istanbulBlock", &ChainConfig::istanbul_block},
        {"muirGlacierBlock", &ChainConfig::muir_glacier_block},
        {"berlinBlock", &ChainConfig::berlin_block},
        {"runtimeUpgradeBlock", &ChainConfig::runtime_upgrade_block},
        {"deployerProxyBlock", &ChainConfig::deployer_proxy_block},
        {"yoloV3Block", &ChainConfig::yolo_v3_block},
        {"ewasmBlock", &ChainConfig::ewasm_block},
        {"catalystBlock", &ChainConfig::catalyst_block},
        {"ramanujanBlock", &ChainConfig::ramanujan_block},
        {"nielsBlock", &ChainConfig::niels_block},
        {"mirrorSyncBlock", &ChainConfig::mirror_sync_block},
        {"brunoBlock", &ChainConfig::bruno_block},
    };

    constexpr const char* kEip150Hash{"eip150Hash"};
    constexpr const char* kParlia{"parlia"};

}  // namespace

nlohmann::json ChainConfig::to_json() const {
    nlohmann::json ret;

    ret["chainId"] = chain_id;

    for (const auto& [key, member] : kForkFields) {
        if (const auto& block{this->*member}; block) {
            ret[key] = *block;
        }
    }
    if (eip150_hash) {
        ret[kEip150Hash] = to_hex(*eip150_hash, /*with_prefix=*/true);
    }

    if (parlia) {
        ret[kParlia] = {{"period", parlia->period}, {"epoch", parlia->epoch}};
    }

    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.is_object() || !json.contains("chainId") ||
        !json["chainId"].is_number_unsigned()) {
        return std::nullopt;
    }

    ChainConfig config{};
    config.chain_id = json["chainId"].get<uint64_t>();

    for (const auto& [key, member] : kForkFields) {
        if (!json.contains(key)) {
            continue;
        }
        if (!json[key].is_number_unsigned()) {
            return std::nullopt;
        }
        config.*member = json[key].get<uint64_t>();
    }

    if (json.contains(kEip150Hash)) {
        if (!json[kEip150Hash].is_string()) {
            return std::nullopt;
        }
        config.eip150_hash = hex_to_bytes32(json[kEip150Hash].get<std::string>());
        if (!config.eip150_hash) {
            return std::nullopt;
        }
    }

    if (json.contains(kParlia)) {
        const nlohmann::json& parlia_json{json[kParlia]};
        if (!parlia_json.is_object() || !parlia_json.contains("period") || !parlia_json.contains("epoch") ||
            !parlia_json["period"].is_number_unsigned() || !parlia_json["epoch"].is_number_unsigned()) {
            return std::nullopt;
        }
        config.parlia = ParliaConfig{
            .period = parlia_json["period"].get<uint64_t>(),
            .epoch = parlia_json["epoch"].get<uint64_t>(),
        };
    }

    return config;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

}  // namespace gensim
