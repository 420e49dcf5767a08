// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "assets.hpp"

#include <fstream>
#include <utility>

#include <gensim/core/common/util.hpp>

namespace gensim::genesis {

static nlohmann::json read_json_file(const std::filesystem::path& path) {
    std::ifstream in{path};
    if (!in.is_open()) {
        throw AssetError{"cannot open asset file " + path.string()};
    }
    auto json{nlohmann::json::parse(in, /*cb=*/nullptr, /*allow_exceptions=*/false)};
    if (json.is_discarded()) {
        throw AssetError{"invalid JSON in asset file " + path.string()};
    }
    return json;
}

std::optional<ContractArtifact> ContractArtifact::from_json(const nlohmann::json& json) noexcept {
    if (!json.is_object()) {
        return std::nullopt;
    }
    // Keys are accepted in the compiler's camelCase or in snake_case
    const auto read_hex = [&json](const char* key, const char* snake_case_key) -> std::optional<Bytes> {
        auto it{json.find(key)};
        if (it == json.end()) {
            it = json.find(snake_case_key);
        }
        if (it == json.end() || !it->is_string()) {
            return std::nullopt;
        }
        return from_hex(it->get_ref<const std::string&>());
    };
    auto bytecode{read_hex("bytecode", "byte_code")};
    auto deployed_bytecode{read_hex("deployedBytecode", "deployed_byte_code")};
    if (!bytecode || !deployed_bytecode) {
        return std::nullopt;
    }
    return ContractArtifact{std::move(*bytecode), std::move(*deployed_bytecode)};
}

AssetBundle::AssetBundle(std::filesystem::path root) : root_{std::move(root)} {
    if (!std::filesystem::is_directory(root_)) {
        throw AssetError{"asset directory not found: " + root_.string()};
    }
}

ContractArtifact AssetBundle::artifact(std::string_view name) const {
    const auto path{root_ / "contracts" / (std::string{name} + ".json")};
    auto artifact{ContractArtifact::from_json(read_json_file(path))};
    if (!artifact) {
        throw AssetError{"missing or malformed bytecode in " + path.string()};
    }
    if (artifact->bytecode.empty()) {
        throw AssetError{"empty creation bytecode in " + path.string()};
    }
    return std::move(*artifact);
}

ContractAbi AssetBundle::abi(std::string_view name) const {
    const auto path{root_ / "abi" / (std::string{name} + ".json")};
    auto abi{ContractAbi::from_json(read_json_file(path))};
    if (!abi) {
        throw AssetError{"malformed ABI in " + path.string()};
    }
    return std::move(*abi);
}

}  // namespace gensim::genesis
