// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <evmc/bytes.hpp>

namespace gensim {

using Bytes = evmc::bytes;

//! \brief Non-owning view over bytes, implicitly taken from owned bytes, EVMC views and C arrays
class ByteView : public evmc::bytes_view {
  public:
    constexpr ByteView() noexcept = default;

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const evmc::bytes_view& other) noexcept : evmc::bytes_view{other} {}

    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    ByteView(const Bytes& bytes) noexcept : evmc::bytes_view{bytes.data(), bytes.size()} {}

    constexpr ByteView(const uint8_t* data, size_type size) noexcept : evmc::bytes_view{data, size} {}

    template <size_t N>
    // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
    constexpr ByteView(const uint8_t (&array)[N]) noexcept : evmc::bytes_view{array, N} {}
};

}  // namespace gensim
