// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "precompile.hpp"

#include <gmp.h>

#include <algorithm>
#include <bit>
#include <cstring>
#include <limits>
#include <memory>

#include <evmone_precompiles/blake2b.hpp>
#include <evmone_precompiles/ripemd160.hpp>
#include <evmone_precompiles/sha256.hpp>

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wshadow"
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <libff/algebra/curves/alt_bn128/alt_bn128_pairing.hpp>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <libff/common/profiling.hpp>
#pragma GCC diagnostic pop

#include <gensim/core/common/base.hpp>
#include <gensim/core/crypto/curve25519.hpp>
#include <gensim/core/crypto/ecdsa.hpp>
#include <gensim/core/crypto/secp256k1n.hpp>
#include <gensim/core/crypto/sha3.hpp>

namespace gensim::precompile {

std::string_view to_string(PrecompileError error) noexcept {
    switch (error) {
        case PrecompileError::kOutOfGas:
            return "out of gas";
        case PrecompileError::kInvalidInput:
            return "invalid input";
    }
    return "unknown precompile error";
}

PrecompileResult Handler::operator()(ByteView input, std::optional<uint64_t> gas_limit, const CallContext&,
                                     bool) const noexcept {
    const uint64_t cost{contract_.gas(input)};
    if (gas_limit && cost > *gas_limit) {
        return tl::unexpected{PrecompileError::kOutOfGas};
    }
    std::optional<Bytes> output{contract_.run(input)};
    if (!output) {
        return tl::unexpected{PrecompileError::kInvalidInput};
    }
    return PrecompileOutput{std::move(*output), cost};
}

//! Copy of input zero-extended on the right to at least min_size bytes
static Bytes padded(ByteView input, size_t min_size) {
    Bytes out{input};
    if (out.size() < min_size) {
        out.resize(min_size, 0);
    }
    return out;
}

//! Big-endian word at offset, reading past the end of input as zeros
static intx::uint256 word_at(ByteView input, size_t offset) noexcept {
    uint8_t word[32]{};
    if (offset < input.size()) {
        std::ranges::copy(input.substr(offset, sizeof(word)), word);
    }
    return intx::be::load<intx::uint256>(word);
}

static uint64_t linear_gas(ByteView input, uint64_t base, uint64_t word) noexcept {
    return base + word * num_words(input.size());
}

// Shared by both ECDSA recovery contracts: the padded 128-byte input is hash || v || r || s
struct RecoveryInput {
    Bytes data;
    intx::uint256 v;
    intx::uint256 r;
    intx::uint256 s;
};

static RecoveryInput load_recovery_input(ByteView input) {
    RecoveryInput in{.data = padded(input, 128)};
    in.v = word_at(in.data, 32);
    in.r = word_at(in.data, 64);
    in.s = word_at(in.data, 96);
    return in;
}

static const secp256k1_context* recovery_context() noexcept {
    // magic static
    static const std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)> context{
        secp256k1_context_create(ecdsa::kContextFlags), secp256k1_context_destroy};
    return context.get();
}

uint64_t ecrec_gas(ByteView) noexcept { return 3'000; }

std::optional<Bytes> ecrec_run(ByteView input) noexcept {
    const RecoveryInput in{load_recovery_input(input)};

    const bool homestead{false};  // See EIP-2
    if (!is_valid_signature(in.r, in.s, homestead)) {
        return Bytes{};
    }
    if (in.v != 27 && in.v != 28) {
        return Bytes{};
    }

    Bytes out(32, 0);
    const ByteView message{in.data.data(), 32};
    const ByteView signature{&in.data[64], 64};
    if (!ecdsa::recover_address(&out[12], message, signature, in.v != 27, recovery_context())) {
        return Bytes{};
    }
    return out;
}

uint64_t sha256_gas(ByteView input) noexcept { return linear_gas(input, 60, 12); }

std::optional<Bytes> sha256_run(ByteView input) noexcept {
    Bytes out(32, 0);
    evmone::crypto::sha256(reinterpret_cast<std::byte*>(out.data()),
                           reinterpret_cast<const std::byte*>(input.data()),
                           input.size());
    return out;
}

uint64_t rip160_gas(ByteView input) noexcept { return linear_gas(input, 600, 120); }

std::optional<Bytes> rip160_run(ByteView input) noexcept {
    Bytes out(32, 0);
    GENSIM_ASSERT(input.size() <= std::numeric_limits<uint32_t>::max());
    evmone::crypto::ripemd160(reinterpret_cast<std::byte*>(&out[12]),
                              reinterpret_cast<const std::byte*>(input.data()),
                              input.size());
    return out;
}

uint64_t id_gas(ByteView input) noexcept { return linear_gas(input, 15, 3); }

std::optional<Bytes> id_run(ByteView input) noexcept {
    return Bytes{input};
}

// EIP-2565
uint64_t expmod_gas(ByteView input) noexcept {
    static constexpr uint64_t kMinGas{200};
    static constexpr size_t kHeaderLength{3 * 32};

    const intx::uint256 base_len{word_at(input, 0)};
    const intx::uint256 exp_len{word_at(input, 32)};
    const intx::uint256 mod_len{word_at(input, 64)};
    if (base_len == 0 && mod_len == 0) {
        return kMinGas;
    }
    if (base_len > UINT64_MAX || exp_len > UINT64_MAX || mod_len > UINT64_MAX) {
        return UINT64_MAX;
    }

    // Up to 32 leading bytes of the exponent, which follows the base
    intx::uint256 exp_head{0};
    const size_t body_size{input.size() > kHeaderLength ? input.size() - kHeaderLength : 0};
    if (intx::uint256{body_size} > base_len) {
        const ByteView exponent{input.substr(kHeaderLength + static_cast<size_t>(base_len))};
        const auto head_len{static_cast<unsigned>(std::min(exp_len, intx::uint256{32}))};
        exp_head = word_at(exponent, 0) >> (8 * (32 - head_len));
    }

    intx::uint256 iterations{exp_len > 32 ? 8 * (exp_len - 32) : intx::uint256{0}};
    if (const unsigned exp_bits{256 - clz(exp_head)}; exp_bits > 1) {
        iterations += exp_bits - 1;
    }
    iterations = std::max(iterations, intx::uint256{1});

    const intx::uint256 words{(std::max(base_len, mod_len) + 7) / 8};
    const intx::uint256 gas{words * words * iterations / 3};
    if (gas > UINT64_MAX) {
        return UINT64_MAX;
    }
    return std::max(kMinGas, static_cast<uint64_t>(gas));
}

namespace {

    // RAII holder for a GMP integer
    class MpzValue {
      public:
        MpzValue() noexcept { mpz_init(value_); }
        ~MpzValue() { mpz_clear(value_); }

        MpzValue(const MpzValue&) = delete;
        MpzValue& operator=(const MpzValue&) = delete;

        void import_be(const uint8_t* data, size_t length) noexcept {
            if (length) {
                mpz_import(value_, length, /*order=*/1, /*size=*/1, /*endian=*/0, /*nails=*/0, data);
            }
        }

        mpz_ptr get() noexcept { return value_; }
        bool is_zero() const noexcept { return mpz_sgn(value_) == 0; }

      private:
        mpz_t value_;
    };

}  // namespace

// Operand occupying [offset, offset + length) of the body, with bytes past the end read as zeros
static void load_operand(MpzValue& value, ByteView body, size_t offset, size_t length) noexcept {
    const size_t available{offset < body.size() ? std::min(length, body.size() - offset) : 0};
    if (available == 0) {
        return;
    }
    value.import_be(&body[offset], available);
    mpz_mul_2exp(value.get(), value.get(), 8 * (length - available));
}

std::optional<Bytes> expmod_run(ByteView input) noexcept {
    const intx::uint256 base_word{word_at(input, 0)};
    const intx::uint256 exp_word{word_at(input, 32)};
    const intx::uint256 mod_word{word_at(input, 64)};
    if (base_word > kMaxModExpLength || exp_word > kMaxModExpLength || mod_word > kMaxModExpLength) {
        return std::nullopt;
    }
    const auto base_len{static_cast<size_t>(base_word)};
    const auto exp_len{static_cast<size_t>(exp_word)};
    const auto mod_len{static_cast<size_t>(mod_word)};
    if (mod_len == 0) {
        return Bytes{};
    }

    const ByteView body{input.size() > 96 ? input.substr(96) : ByteView{}};

    MpzValue base;
    load_operand(base, body, 0, base_len);
    MpzValue exponent;
    load_operand(exponent, body, base_len, exp_len);
    MpzValue modulus;
    load_operand(modulus, body, base_len + exp_len, mod_len);

    Bytes out(mod_len, 0);
    if (modulus.is_zero()) {
        return out;
    }

    MpzValue result;
    mpz_powm(result.get(), base.get(), exponent.get(), modulus.get());

    if (mpz_sgn(result.get()) == 0) {
        return out;
    }
    // Right-aligned big-endian export; the result is below the modulus so it always fits
    const size_t length{(mpz_sizeinbase(result.get(), 2) + 7) / 8};
    mpz_export(&out[mod_len - length], nullptr, /*order=*/1, /*size=*/1, /*endian=*/0, /*nails=*/0, result.get());
    return out;
}

uint64_t ecrec_pubkey_gas(ByteView) noexcept { return 3'000; }

std::optional<Bytes> ecrec_pubkey_run(ByteView input) noexcept {
    const RecoveryInput in{load_recovery_input(input)};

    // Only the low byte of the v word is looked at
    const uint8_t v{in.data[63]};
    const int recovery_id{v > 26 ? v - 27 : v};

    // r and s at or above the group order are reduced, not rejected
    uint8_t signature[64];
    intx::be::unsafe::store(&signature[0], in.r % kSecp256k1n);
    intx::be::unsafe::store(&signature[32], in.s % kSecp256k1n);

    const ByteView message{in.data.data(), 32};
    std::optional<Bytes> key{ecdsa::recover(message, ByteView{signature, sizeof(signature)}, recovery_id,
                                            recovery_context())};
    if (!key || key->size() != ecdsa::kUncompressedPublicKeyLength) {
        return std::nullopt;
    }
    return key->substr(1);  // drop the 0x04 tag
}

uint64_t sha3_fips_gas(ByteView input) noexcept { return linear_gas(input, 60, 12); }

std::optional<Bytes> sha3_fips_run(ByteView input) noexcept {
    return crypto::sha3_256(input);
}

// Utility functions for zkSNARK related precompiled contracts.
using Scalar = libff::bigint<libff::alt_bn128_q_limbs>;

// Must be called prior to invoking any other method.
// May be called many times from multiple threads.
static void init_libff() noexcept {
    // magic static
    [[maybe_unused]] static bool initialized = []() noexcept {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        libff::alt_bn128_pp::init_public_params();
        return true;
    }();
}

static Scalar to_scalar(const uint8_t bytes_be[32]) noexcept {
    MpzValue m;
    m.import_be(bytes_be, 32);
    return Scalar{m.get()};
}

// Notation warning: Yellow Paper's p is the same libff's q.
// Returns x < p (YP notation).
static bool valid_element_of_fp(const Scalar& x) noexcept {
    return mpn_cmp(x.data, libff::alt_bn128_modulus_q.data, libff::alt_bn128_q_limbs) < 0;
}

static std::optional<libff::alt_bn128_G1> decode_g1_element(const uint8_t bytes_be[64]) noexcept {
    const Scalar x{to_scalar(bytes_be)};
    const Scalar y{to_scalar(bytes_be + 32)};
    if (!valid_element_of_fp(x) || !valid_element_of_fp(y)) {
        return std::nullopt;
    }
    if (x.is_zero() && y.is_zero()) {
        return libff::alt_bn128_G1::zero();
    }

    libff::alt_bn128_G1 point{x, y, libff::alt_bn128_Fq::one()};
    if (!point.is_well_formed()) {
        return std::nullopt;
    }
    return point;
}

static std::optional<libff::alt_bn128_Fq2> decode_fp2_element(const uint8_t bytes_be[64]) noexcept {
    // imaginary part first
    const Scalar c0{to_scalar(bytes_be + 32)};
    const Scalar c1{to_scalar(bytes_be)};
    if (!valid_element_of_fp(c0) || !valid_element_of_fp(c1)) {
        return std::nullopt;
    }
    return libff::alt_bn128_Fq2{c0, c1};
}

static std::optional<libff::alt_bn128_G2> decode_g2_element(const uint8_t bytes_be[128]) noexcept {
    const std::optional<libff::alt_bn128_Fq2> x{decode_fp2_element(bytes_be)};
    const std::optional<libff::alt_bn128_Fq2> y{decode_fp2_element(bytes_be + 64)};
    if (!x || !y) {
        return std::nullopt;
    }
    if (x->is_zero() && y->is_zero()) {
        return libff::alt_bn128_G2::zero();
    }

    libff::alt_bn128_G2 point{*x, *y, libff::alt_bn128_Fq2::one()};
    if (!point.is_well_formed()) {
        return std::nullopt;
    }
    // must belong to the subgroup G2
    if (!(libff::alt_bn128_G2::order() * point).is_zero()) {
        return std::nullopt;
    }
    return point;
}

static void store_fq(const libff::alt_bn128_Fq& element, uint8_t* out) noexcept {
    const Scalar value{element.as_bigint()};
    static_assert(sizeof(value.data) == 32);
    // libff limbs are little-endian
    const auto word{intx::le::unsafe::load<intx::uint256>(reinterpret_cast<const uint8_t*>(value.data))};
    intx::be::unsafe::store(out, word);
}

static Bytes encode_g1_element(libff::alt_bn128_G1 point) noexcept {
    Bytes out(64, 0);
    if (!point.is_zero()) {
        point.to_affine_coordinates();
        store_fq(point.X, &out[0]);
        store_fq(point.Y, &out[32]);
    }
    return out;
}

uint64_t bn_add_gas(ByteView) noexcept { return 150; }

std::optional<Bytes> bn_add_run(ByteView input_view) noexcept {
    const Bytes input{padded(input_view, 128)};

    init_libff();

    const std::optional<libff::alt_bn128_G1> x{decode_g1_element(input.data())};
    const std::optional<libff::alt_bn128_G1> y{decode_g1_element(&input[64])};
    if (!x || !y) {
        return std::nullopt;
    }
    return encode_g1_element(*x + *y);
}

uint64_t bn_mul_gas(ByteView) noexcept { return 6'000; }

std::optional<Bytes> bn_mul_run(ByteView input_view) noexcept {
    const Bytes input{padded(input_view, 96)};

    init_libff();

    const std::optional<libff::alt_bn128_G1> x{decode_g1_element(input.data())};
    if (!x) {
        return std::nullopt;
    }
    const Scalar n{to_scalar(&input[64])};
    return encode_g1_element(n * *x);
}

static constexpr size_t kSnarkvStride{192};

uint64_t snarkv_gas(ByteView input) noexcept {
    const uint64_t k{input.size() / kSnarkvStride};
    return 34'000 * k + 45'000;
}

std::optional<Bytes> snarkv_run(ByteView input) noexcept {
    if (input.size() % kSnarkvStride != 0) {
        return std::nullopt;
    }
    init_libff();

    libff::alt_bn128_Fq12 product{libff::alt_bn128_Fq12::one()};
    for (ByteView pair{input}; !pair.empty(); pair = pair.substr(kSnarkvStride)) {
        const std::optional<libff::alt_bn128_G1> g1{decode_g1_element(pair.data())};
        const std::optional<libff::alt_bn128_G2> g2{decode_g2_element(pair.data() + 64)};
        if (!g1 || !g2) {
            return std::nullopt;
        }
        // A pair with the point at infinity contributes the identity
        if (!g1->is_zero() && !g2->is_zero()) {
            product = product * libff::alt_bn128_miller_loop(libff::alt_bn128_precompute_G1(*g1),
                                                             libff::alt_bn128_precompute_G2(*g2));
        }
    }

    Bytes out(32, 0);
    out[31] = libff::alt_bn128_final_exponentiation(product) == libff::alt_bn128_GT::one() ? 1 : 0;
    return out;
}

static constexpr size_t kBlake2FInputLength{213};

uint64_t blake2_f_gas(ByteView input) noexcept {
    if (input.size() < 4) {
        // blake2_f_run rejects it anyway
        return 0;
    }
    return intx::be::unsafe::load<uint32_t>(input.data());
}

// EIP-152: rounds (4) || h (64) || m (128) || t (16) || f (1), words little-endian
std::optional<Bytes> blake2_f_run(ByteView input) noexcept {
    if (input.size() != kBlake2FInputLength || input.back() > 1) {
        return std::nullopt;
    }

    static_assert(std::endian::native == std::endian::little);
    struct {
        uint64_t h[8];
        uint64_t m[16];
        uint64_t t[2];
    } words;
    static_assert(sizeof(words) == kBlake2FInputLength - 5);
    std::memcpy(&words, &input[4], sizeof(words));

    const auto rounds{intx::be::unsafe::load<uint32_t>(input.data())};
    evmone::crypto::blake2b_compress(rounds, words.h, words.m, words.t, input.back() == 1);

    return Bytes{reinterpret_cast<const uint8_t*>(words.h), sizeof(words.h)};
}

static constexpr size_t kMaxRistrettoPoints{10};

uint64_t ristretto_add_gas(ByteView input) noexcept { return linear_gas(input, 60, 12); }

std::optional<Bytes> ristretto_add_run(ByteView input) noexcept {
    if (input.size() > kMaxRistrettoPoints * crypto::curve25519::kPointLength) {
        return std::nullopt;
    }
    return crypto::curve25519::ristretto_add(input);
}

uint64_t ristretto_mul_gas(ByteView input) noexcept { return linear_gas(input, 60, 12); }

// input is scalar || point
std::optional<Bytes> ristretto_mul_run(ByteView input) noexcept {
    using namespace crypto::curve25519;
    if (input.size() != kScalarLength + kPointLength) {
        return std::nullopt;
    }
    return ristretto_scalar_mul(input.substr(0, kScalarLength), input.substr(kScalarLength, kPointLength));
}

uint64_t ed25519_verify_gas(ByteView input) noexcept { return linear_gas(input, 15, 3); }

// input is message (32) || public key (32) || signature (64); trailing bytes are ignored
std::optional<Bytes> ed25519_verify_run(ByteView input) noexcept {
    using namespace crypto::curve25519;
    static constexpr size_t kMessageLength{32};
    if (input.size() < kMessageLength + kPublicKeyLength + kSignatureLength) {
        return std::nullopt;
    }

    const ByteView message{input.substr(0, kMessageLength)};
    const ByteView public_key{input.substr(kMessageLength, kPublicKeyLength)};
    const ByteView signature{input.substr(kMessageLength + kPublicKeyLength, kSignatureLength)};

    Bytes out(4, 0);
    switch (ed25519_verify(message, public_key, signature)) {
        case VerifyResult::kValid:
            break;
        case VerifyResult::kInvalid:
            out[3] = 1;
            break;
        case VerifyResult::kMalformedKey:
        case VerifyResult::kMalformedSignature:
            return std::nullopt;
    }
    return out;
}

Registry::Registry() : Registry{std::vector<RegisteredContract>{std::begin(kContracts), std::end(kContracts)}} {}

Registry::Registry(std::vector<RegisteredContract> contracts) {
    for (const auto& [address, handler] : contracts) {
        handlers_.insert_or_assign(address, handler);
    }
}

const Handler* Registry::resolve(const evmc::address& address) const noexcept {
    const auto it{handlers_.find(address)};
    if (it == handlers_.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace gensim::precompile
