// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <intx/intx.hpp>

#include <gensim/core/common/base.hpp>
#include <gensim/core/common/bytes.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << "0x" << intx::hex(value);
    return out;
}

}  // namespace intx

namespace gensim {

//! \brief Strips leftmost zeroed bytes from byte sequence
//! \param [in] data : The view to process
//! \return A new view of the sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Returns the shortest "0x"-prefixed hex form of a quantity, i.e. "0x0" for zero
std::string to_hex_quantity(const intx::uint256& value);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Decodes a hex string, with or without the "0x" prefix
//! \remarks An odd number of digits is accepted and the string is treated as left-padded with one zero
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Parses a "0x"-prefixed hex or a plain decimal string into a uint256
std::optional<intx::uint256> parse_uint256(std::string_view str) noexcept;

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

}  // namespace gensim
