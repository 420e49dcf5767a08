// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <gensim/core/chain/config.hpp>
#include <gensim/core/common/bytes.hpp>

// See https://arvanaghi.com/blog/explaining-the-genesis-block-in-ethereum/

namespace gensim {

//! \brief Persisted form of one account in the genesis allocation
struct GenesisAccount {
    Bytes code;
    std::map<evmc::bytes32, evmc::bytes32> storage;  // zero-valued slots are never present
    intx::uint256 balance;
    uint64_t nonce{0};

    nlohmann::json to_json() const;

    friend bool operator==(const GenesisAccount&, const GenesisAccount&) = default;
};

inline constexpr uint64_t kGenesisTimestamp{0x5e9da7ce};
inline constexpr uint64_t kGenesisGasLimit{0x2625a00};

struct GenesisDocument {
    ChainConfig config;
    uint64_t nonce{0};
    uint64_t timestamp{kGenesisTimestamp};
    Bytes extra_data;
    uint64_t gas_limit{kGenesisGasLimit};
    intx::uint256 difficulty{1};
    evmc::bytes32 mix_hash{};
    evmc::address coinbase{};
    std::map<evmc::address, GenesisAccount> alloc;
    uint64_t number{0};
    uint64_t gas_used{0};
    evmc::bytes32 parent_hash{};

    //! \brief JSON representation with "0x" hex quantities; alloc and storage come out in ascending key order
    nlohmann::json to_json() const;
};

}  // namespace gensim
