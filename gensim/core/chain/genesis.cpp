// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "genesis.hpp"

#include <gensim/core/common/util.hpp>
#include <gensim/core/types/address.hpp>
#include <gensim/core/types/evmc_bytes32.hpp>

namespace gensim {

nlohmann::json GenesisAccount::to_json() const {
    nlohmann::json storage_json = nlohmann::json::object();
    for (const auto& [key, value] : storage) {
        storage_json[to_hex(key, /*with_prefix=*/true)] = to_hex(value, /*with_prefix=*/true);
    }

    nlohmann::json ret;
    ret["code"] = to_hex(code, /*with_prefix=*/true);
    ret["storage"] = std::move(storage_json);
    ret["balance"] = to_hex_quantity(balance);
    ret["nonce"] = to_hex_quantity(nonce);
    return ret;
}

nlohmann::json GenesisDocument::to_json() const {
    nlohmann::json alloc_json = nlohmann::json::object();
    for (const auto& [address, account] : alloc) {
        alloc_json[address_to_hex(address)] = account.to_json();
    }

    nlohmann::json ret;
    ret["config"] = config.to_json();
    ret["nonce"] = to_hex_quantity(nonce);
    ret["timestamp"] = to_hex_quantity(timestamp);
    ret["extraData"] = to_hex(extra_data, /*with_prefix=*/true);
    ret["gasLimit"] = to_hex_quantity(gas_limit);
    ret["difficulty"] = to_hex_quantity(difficulty);
    ret["mixHash"] = to_hex(mix_hash, /*with_prefix=*/true);
    ret["coinbase"] = address_to_hex(coinbase);
    ret["alloc"] = std::move(alloc_json);
    ret["number"] = to_hex_quantity(number);
    ret["gasUsed"] = to_hex_quantity(gas_used);
    ret["parentHash"] = to_hex(parent_hash, /*with_prefix=*/true);
    return ret;
}

}  // namespace gensim
