// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <gensim/core/common/util.hpp>

namespace gensim {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data() + bytes.size() - n, n);
    }
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return gensim::to_hex(ByteView{value.bytes}, with_prefix);
}

std::optional<evmc::bytes32> hex_to_bytes32(std::string_view hex) {
    const auto bytes{from_hex(hex)};
    if (!bytes || bytes->size() > kHashLength) {
        return std::nullopt;
    }
    return to_bytes32(*bytes);
}

}  // namespace gensim
