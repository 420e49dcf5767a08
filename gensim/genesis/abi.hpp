// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <gensim/core/common/bytes.hpp>

// See https://docs.soliditylang.org/en/latest/abi-spec.html
namespace gensim::genesis {

//! Unknown function, wrong argument count or a value not matching its declared type
class AbiError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! \brief A Solidity value to be encoded
//! \details Integer types of any width take a uint256; dynamic arrays T[] take an Array.
class AbiValue {
  public:
    using Array = std::vector<AbiValue>;
    using Variant = std::variant<evmc::address, intx::uint256, bool, evmc::bytes32, Bytes, std::string, Array>;

    AbiValue(const evmc::address& address) : value_{address} {}  // NOLINT(google-explicit-constructor)
    AbiValue(const intx::uint256& number) : value_{number} {}    // NOLINT(google-explicit-constructor)
    AbiValue(const evmc::bytes32& word) : value_{word} {}        // NOLINT(google-explicit-constructor)
    AbiValue(Bytes bytes) : value_{std::move(bytes)} {}          // NOLINT(google-explicit-constructor)
    AbiValue(std::string text) : value_{std::move(text)} {}      // NOLINT(google-explicit-constructor)
    AbiValue(Array items) : value_{std::move(items)} {}          // NOLINT(google-explicit-constructor)
    explicit AbiValue(bool flag) : value_{flag} {}

    const Variant& value() const noexcept { return value_; }

  private:
    Variant value_;
};

struct AbiParam {
    std::string name;
    std::string type;  // canonical form, e.g. uint256 rather than uint
};

struct AbiFunction {
    std::string name;
    std::vector<AbiParam> inputs;

    //! Canonical signature such as "ctor(address[],uint256[],uint256)"
    std::string signature() const;

    //! First 4 bytes of the Keccak-256 of the signature
    std::array<uint8_t, 4> selector() const;
};

//! \brief The parts of a contract interface description used for deployment
struct ContractAbi {
    std::optional<AbiFunction> constructor;
    std::vector<AbiFunction> functions;

    //! \return The first function with the given name or nullptr
    const AbiFunction* find_function(std::string_view name) const noexcept;

    //! \brief Try parse a standard Solidity ABI array
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ContractAbi> from_json(const nlohmann::json& json) noexcept;
};

//! \brief Head/tail encoding of values against the parameter list, no selector
//! \throws AbiError
Bytes encode_arguments(const std::vector<AbiParam>& params, const std::vector<AbiValue>& values);

//! \brief Selector followed by the encoded arguments
//! \throws AbiError
Bytes encode_function_call(const ContractAbi& abi, std::string_view name, const std::vector<AbiValue>& values);

//! \brief Encoded constructor arguments, to be appended to the creation bytecode
//! \throws AbiError
Bytes encode_constructor(const ContractAbi& abi, const std::vector<AbiValue>& values);

}  // namespace gensim::genesis
