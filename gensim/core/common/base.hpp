// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

#include <gensim/core/common/assert.hpp>

#define GENSIM_THREAD_LOCAL thread_local

namespace gensim {

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

inline constexpr size_t kWordLength{32};

//! Number of 32-byte words needed to hold num_bytes
constexpr uint64_t num_words(uint64_t num_bytes) noexcept {
    return num_bytes / kWordLength + static_cast<uint64_t>(num_bytes % kWordLength != 0);
}

}  // namespace gensim
