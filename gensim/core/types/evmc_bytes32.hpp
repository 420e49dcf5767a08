// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <gensim/core/common/bytes.hpp>

namespace gensim {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

//! \brief Parses a hex string of at most 32 bytes into a left-padded evmc::bytes32
std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex);

inline bool is_zero(const evmc::bytes32& value) noexcept { return value == evmc::bytes32{}; }

}  // namespace gensim
