// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cctype>

namespace gensim {

ByteView zeroless_view(ByteView data) {
    const auto is_zero_byte = [](const auto& b) { return b == 0x0; };
    const auto first_nonzero_byte_it{std::ranges::find_if_not(data, is_zero_byte)};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_nonzero_byte_it)));
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string to_hex_quantity(const intx::uint256& value) {
    return "0x" + intx::hex(value);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos{hex.size() % 2};
    Bytes out((hex.size() + pos) / 2, '\0');
    auto dst{out.begin()};
    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) {
            return std::nullopt;
        }
        *dst++ = *lo;
    }
    for (size_t i{pos}; i < hex.size(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) {
            return std::nullopt;
        }
        *dst++ = static_cast<uint8_t>(*hi << 4 | *lo);
    }
    return out;
}

std::optional<intx::uint256> parse_uint256(std::string_view str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }
    if (has_hex_prefix(str)) {
        const auto bytes{from_hex(str)};
        if (!bytes || bytes->size() > kWordLength || str.size() == 2) {
            return std::nullopt;
        }
        uint8_t padded[kWordLength]{};
        std::ranges::copy(*bytes, padded + kWordLength - bytes->size());
        return intx::be::load<intx::uint256>(padded);
    }
    intx::uint256 value{0};
    for (const char c : str) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const intx::uint256 next{value * 10 + static_cast<uint64_t>(c - '0')};
        if (next / 10 != value) {
            return std::nullopt;  // overflow
        }
        value = next;
    }
    return value;
}

inline bool case_insensitive_char_comparer(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool iequals(const std::string_view a, const std::string_view b) {
    return (a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), case_insensitive_char_comparer));
}

}  // namespace gensim
