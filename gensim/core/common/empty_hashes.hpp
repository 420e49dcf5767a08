// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace gensim {

using namespace evmc::literals;

inline constexpr evmc::bytes32 kZeroHash{};

// Keccak-256 hash of an empty string, KEC("").
// Accounts without code carry it as their code hash.
inline constexpr evmc::bytes32 kEmptyHash{0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

}  // namespace gensim
