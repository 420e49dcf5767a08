// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gensim/core/common/bytes.hpp>

namespace gensim::crypto {

//! \brief FIPS-202 SHA3-256 digest (not to be confused with the Keccak-256 used by the EVM)
//! \return The 32-byte digest or std::nullopt if the digest backend fails
std::optional<Bytes> sha3_256(ByteView input) noexcept;

}  // namespace gensim::crypto
