// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <tl/expected.hpp>

#include <gensim/core/common/bytes.hpp>
#include <gensim/core/common/hash_maps.hpp>

// See Yellow Paper, Appendix E "Precompiled Contracts"
namespace gensim::precompile {

using namespace evmc::literals;

enum class [[nodiscard]] PrecompileError {
    kOutOfGas,      // declared cost exceeds the supplied gas limit
    kInvalidInput,  // malformed input (length, curve point, signature)
};

std::string_view to_string(PrecompileError error) noexcept;

struct PrecompileOutput {
    Bytes output;
    uint64_t gas_cost{0};
};

using PrecompileResult = tl::expected<PrecompileOutput, PrecompileError>;

//! Frame-level information about the call that reached the precompile
struct CallContext {
    evmc::address caller;
    evmc::address address;
    intx::uint256 apparent_value;
};

using GasFunction = uint64_t (*)(ByteView input) noexcept;
using RunFunction = std::optional<Bytes> (*)(ByteView input) noexcept;

struct Contract {
    GasFunction gas;
    RunFunction run;
};

//! A native contract bound to a reserved address
class Handler {
  public:
    constexpr Handler(std::string_view name, Contract contract) noexcept : name_{name}, contract_{contract} {}

    std::string_view name() const noexcept { return name_; }

    uint64_t gas(ByteView input) const noexcept { return contract_.gas(input); }

    //! \brief Prices and runs the contract
    //! \param [in] gas_limit : if present, a cost above it fails with kOutOfGas before anything runs
    //! \remarks None of the registered contracts depends on the call context or the static flag
    PrecompileResult operator()(ByteView input, std::optional<uint64_t> gas_limit, const CallContext& context,
                                bool is_static_call) const noexcept;

  private:
    std::string_view name_;
    Contract contract_;
};

uint64_t ecrec_gas(ByteView input) noexcept;
std::optional<Bytes> ecrec_run(ByteView input) noexcept;

uint64_t sha256_gas(ByteView input) noexcept;
std::optional<Bytes> sha256_run(ByteView input) noexcept;

uint64_t rip160_gas(ByteView input) noexcept;
std::optional<Bytes> rip160_run(ByteView input) noexcept;

uint64_t id_gas(ByteView input) noexcept;
std::optional<Bytes> id_run(ByteView input) noexcept;

// Base, exponent and modulus lengths above this are rejected as invalid input
inline constexpr size_t kMaxModExpLength{1024};

// EIP-2565: ModExp Gas Cost
uint64_t expmod_gas(ByteView input) noexcept;
// EIP-198: Big integer modular exponentiation
std::optional<Bytes> expmod_run(ByteView input) noexcept;

// Public-key variant of ecrec: returns the 64-byte uncompressed key instead of the address
uint64_t ecrec_pubkey_gas(ByteView input) noexcept;
std::optional<Bytes> ecrec_pubkey_run(ByteView input) noexcept;

// FIPS-202 SHA3-256
uint64_t sha3_fips_gas(ByteView input) noexcept;
std::optional<Bytes> sha3_fips_run(ByteView input) noexcept;

// EIP-152: Add BLAKE2 compression function `F` precompile
uint64_t blake2_f_gas(ByteView input) noexcept;
std::optional<Bytes> blake2_f_run(ByteView input) noexcept;

// EIP-197: Precompiled contracts for optimal ate pairing check on the elliptic curve alt_bn128
uint64_t snarkv_gas(ByteView input) noexcept;
std::optional<Bytes> snarkv_run(ByteView input) noexcept;

// EIP-196: Precompiled contracts for addition and scalar multiplication on the elliptic curve alt_bn128
uint64_t bn_add_gas(ByteView input) noexcept;
std::optional<Bytes> bn_add_run(ByteView input) noexcept;

uint64_t bn_mul_gas(ByteView input) noexcept;
std::optional<Bytes> bn_mul_run(ByteView input) noexcept;

// Ristretto255 point addition over up to 10 compressed points
uint64_t ristretto_add_gas(ByteView input) noexcept;
std::optional<Bytes> ristretto_add_run(ByteView input) noexcept;

// Ristretto255 scalar multiplication
uint64_t ristretto_mul_gas(ByteView input) noexcept;
std::optional<Bytes> ristretto_mul_run(ByteView input) noexcept;

// Ed25519 signature verification; 4-byte output, 0 on success and 1 on mismatch
uint64_t ed25519_verify_gas(ByteView input) noexcept;
std::optional<Bytes> ed25519_verify_run(ByteView input) noexcept;

inline constexpr evmc::address kEcRecoverAddress{0x0000000000000000000000000000000000000001_address};
inline constexpr evmc::address kSha256Address{0x0000000000000000000000000000000000000002_address};
inline constexpr evmc::address kRipemd160Address{0x0000000000000000000000000000000000000003_address};
inline constexpr evmc::address kIdentityAddress{0x0000000000000000000000000000000000000004_address};
inline constexpr evmc::address kModExpAddress{0x0000000000000000000000000000000000000005_address};
inline constexpr evmc::address kEcRecoverPublicKeyAddress{0x0000000000000000000000000000000000000006_address};
inline constexpr evmc::address kSha3FipsAddress{0x0000000000000000000000000000000000000007_address};
inline constexpr evmc::address kBlake2FAddress{0x0000000000000000000000000000000000000400_address};
inline constexpr evmc::address kBn128PairingAddress{0x0000000000000000000000000000000000000401_address};
inline constexpr evmc::address kBn128AddAddress{0x0000000000000000000000000000000000000402_address};
inline constexpr evmc::address kBn128MulAddress{0x0000000000000000000000000000000000000403_address};
inline constexpr evmc::address kCurve25519AddAddress{0x0000000000000000000000000000000000000404_address};
inline constexpr evmc::address kCurve25519ScalarMulAddress{0x0000000000000000000000000000000000000405_address};
inline constexpr evmc::address kEd25519VerifyAddress{0x0000000000000000000000000000000000000406_address};

struct RegisteredContract {
    evmc::address address;
    Handler handler;
};

inline constexpr RegisteredContract kContracts[]{
    {kEcRecoverAddress, {"ECRecover", {ecrec_gas, ecrec_run}}},
    {kSha256Address, {"Sha256", {sha256_gas, sha256_run}}},
    {kRipemd160Address, {"Ripemd160", {rip160_gas, rip160_run}}},
    {kIdentityAddress, {"Identity", {id_gas, id_run}}},
    {kModExpAddress, {"Modexp", {expmod_gas, expmod_run}}},
    {kEcRecoverPublicKeyAddress, {"ECRecoverPublicKey", {ecrec_pubkey_gas, ecrec_pubkey_run}}},
    {kSha3FipsAddress, {"Sha3FIPS256", {sha3_fips_gas, sha3_fips_run}}},
    {kBlake2FAddress, {"Blake2F", {blake2_f_gas, blake2_f_run}}},
    {kBn128PairingAddress, {"Bn128Pairing", {snarkv_gas, snarkv_run}}},
    {kBn128AddAddress, {"Bn128Add", {bn_add_gas, bn_add_run}}},
    {kBn128MulAddress, {"Bn128Mul", {bn_mul_gas, bn_mul_run}}},
    {kCurve25519AddAddress, {"Curve25519Add", {ristretto_add_gas, ristretto_add_run}}},
    {kCurve25519ScalarMulAddress, {"Curve25519ScalarMul", {ristretto_mul_gas, ristretto_mul_run}}},
    {kEd25519VerifyAddress, {"Ed25519Verify", {ed25519_verify_gas, ed25519_verify_run}}},
};

//! \brief Immutable address -> handler table
//! \details Built once and shared by const reference with every EVM; holds no per-call state,
//! so concurrent lookups from independent simulations are safe.
class Registry {
  public:
    //! Registry populated with kContracts
    Registry();

    explicit Registry(std::vector<RegisteredContract> contracts);

    // Not copyable nor movable
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    //! \return The handler bound to address or nullptr if address is not reserved
    const Handler* resolve(const evmc::address& address) const noexcept;

    bool contains(const evmc::address& address) const noexcept { return resolve(address) != nullptr; }

    size_t size() const noexcept { return handlers_.size(); }

  private:
    FlatHashMap<evmc::address, Handler> handlers_;
};

}  // namespace gensim::precompile
