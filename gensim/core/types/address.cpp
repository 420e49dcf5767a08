// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <ethash/keccak.hpp>

#include <gensim/core/common/util.hpp>

namespace gensim {

evmc::address create_address(const evmc::address& caller, uint64_t nonce) noexcept {
    // RLP([caller, nonce]): a short list holding a 20-byte string and a scalar
    uint8_t nonce_be[8];
    intx::be::unsafe::store(nonce_be, nonce);
    const ByteView nonce_bytes{zeroless_view(ByteView{nonce_be})};

    Bytes rlp;
    const size_t nonce_length{nonce_bytes.size() == 1 && nonce_bytes[0] < 0x80 ? 1 : 1 + nonce_bytes.size()};
    rlp.push_back(static_cast<uint8_t>(0xc0 + 1 + kAddressLength + nonce_length));
    rlp.push_back(static_cast<uint8_t>(0x80 + kAddressLength));
    rlp.append(caller.bytes, kAddressLength);
    if (nonce_bytes.size() == 1 && nonce_bytes[0] < 0x80) {
        rlp.push_back(nonce_bytes[0]);
    } else {
        rlp.push_back(static_cast<uint8_t>(0x80 + nonce_bytes.size()));
        rlp.append(nonce_bytes);
    }

    const ethash::hash256 hash{keccak256(rlp)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address create2_address(const evmc::address& caller, const evmc::bytes32& salt,
                              const uint8_t (&code_hash)[32]) noexcept {
    static constexpr size_t kN{1 + kAddressLength + 2 * kHashLength};
    uint8_t buf[kN];

    buf[0] = 0xff;
    std::memcpy(buf + 1, caller.bytes, kAddressLength);
    std::memcpy(buf + 1 + kAddressLength, salt.bytes, kHashLength);
    std::memcpy(buf + 1 + kAddressLength + kHashLength, code_hash, kHashLength);

    const ethash::hash256 hash{ethash::keccak256(buf, kN)};

    evmc::address address{};
    std::memcpy(address.bytes, hash.bytes + 12, kAddressLength);
    return address;
}

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data() + bytes.size() - n, n);
    }
    return out;
}

std::optional<evmc::address> hex_to_address(std::string_view hex) {
    const std::optional<Bytes> bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kAddressLength) {
        return std::nullopt;
    }
    return bytes_to_address(*bytes);
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, true);
}

}  // namespace gensim

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    return out << gensim::address_to_hex(address);
}

}  // namespace evmc
