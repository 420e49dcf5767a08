// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>

#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <gensim/core/common/base.hpp>

namespace gensim {

using ChainId = uint64_t;
using BlockNum = uint64_t;

//! \brief Parlia proof-of-staked-authority consensus parameters
struct ParliaConfig {
    uint64_t period{3};  // block time in seconds
    uint64_t epoch{0};   // blocks per validator set rotation

    friend bool operator==(const ParliaConfig&, const ParliaConfig&) = default;
};

//! \brief Chain configuration block of the genesis document
//! \remarks Fork activation blocks are carried through unchanged: they do not affect the
//! deployment simulation, which always runs at the Istanbul revision.
struct ChainConfig {
    ChainId chain_id{0};

    std::optional<BlockNum> homestead_block{std::nullopt};
    std::optional<BlockNum> eip150_block{std::nullopt};
    std::optional<evmc::bytes32> eip150_hash{std::nullopt};
    std::optional<BlockNum> eip155_block{std::nullopt};
    std::optional<BlockNum> eip158_block{std::nullopt};
    std::optional<BlockNum> byzantium_block{std::nullopt};
    std::optional<BlockNum> constantinople_block{std::nullopt};
    std::optional<BlockNum> petersburg_block{std::nullopt};
    std::optional<BlockNum> istanbul_block{std::nullopt};
    std::optional<BlockNum> muir_glacier_block{std::nullopt};
    std::optional<BlockNum> berlin_block{std::nullopt};
    std::optional<BlockNum> runtime_upgrade_block{std::nullopt};
    std::optional<BlockNum> deployer_proxy_block{std::nullopt};
    std::optional<BlockNum> yolo_v3_block{std::nullopt};
    std::optional<BlockNum> ewasm_block{std::nullopt};
    std::optional<BlockNum> catalyst_block{std::nullopt};
    std::optional<BlockNum> ramanujan_block{std::nullopt};
    std::optional<BlockNum> niels_block{std::nullopt};
    std::optional<BlockNum> mirror_sync_block{std::nullopt};
    std::optional<BlockNum> bruno_block{std::nullopt};

    std::optional<ParliaConfig> parlia{std::nullopt};

    //! \brief Return the JSON representation of this object
    //! \remarks Fork blocks that are not set are omitted
    nlohmann::json to_json() const;

    /*Sample JSON input:
    {
            "chainId":14000,
            "istanbulBlock":0,
            "berlinBlock":0,
            "parlia":{"period":3,"epoch":12000}
    }
    */
    //! \brief Try parse a JSON object into strongly typed ChainConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ChainConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const ChainConfig&, const ChainConfig&) = default;
};

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj);

}  // namespace gensim
