// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string_view>

#include <nlohmann/json.hpp>

#include <gensim/core/common/bytes.hpp>
#include <gensim/genesis/abi.hpp>

namespace gensim::genesis {

//! Missing or malformed contract asset
class AssetError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief Compiler output for one contract
struct ContractArtifact {
    Bytes bytecode;           // creation code, constructor arguments not included
    Bytes deployed_bytecode;  // runtime code

    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ContractArtifact> from_json(const nlohmann::json& json) noexcept;
};

/**
 * @brief Read-only view of a build-output directory laid out as:
 *   <root>/contracts/<Name>.json  artifact with hex "bytecode" and "deployedBytecode"
 *   <root>/abi/<Name>.json        Solidity ABI array
 */
class AssetBundle {
  public:
    //! \throws AssetError if root is not an existing directory
    explicit AssetBundle(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }

    //! \throws AssetError
    ContractArtifact artifact(std::string_view name) const;

    //! \throws AssetError
    ContractAbi abi(std::string_view name) const;

  private:
    std::filesystem::path root_;
};

}  // namespace gensim::genesis
