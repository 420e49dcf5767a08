// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "precompile.hpp"

#include <cstdint>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <gensim/core/common/util.hpp>

namespace gensim::precompile {

static Bytes hex(std::string_view s) { return *from_hex(s); }

static constexpr std::string_view kEcRecoverInput{
    "18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c"
    "000000000000000000000000000000000000000000000000000000000000001c"
    "73b1693892219d736caba55bdb67216e485557ea6b6af75f37096c9aa6a5a75f"
    "eeb940b1d03b21e36b0e47e79769f095fe2ab855bd91e3a38756b7d75a9c4549"};

TEST_CASE("Ecrecover", "[core][execution][precompile]") {
    Bytes in{hex(kEcRecoverInput)};
    std::optional<Bytes> out{ecrec_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) == "000000000000000000000000a94f5374fce5edbc8e2a8697c15331677e6ebf0b");

    // Unrecoverable key
    in = hex(
        "a8b53bdf3306a35a7103ab5504a0c9b492295564b6202b1942a84ef3001072810000000000000000000000000000"
        "00000000000000000000000000000000001b30783565316530336635336365313862373732636362303039336666"
        "37316633663533663563373562373464636233316138356161386238383932623465386211223344556677889910"
        "11121314151617181920212223242526272829303132");
    out = ecrec_run(in);
    CHECK((out && out->empty()));
}

TEST_CASE("Ecrecover public key", "[core][execution][precompile]") {
    std::optional<Bytes> out{ecrec_pubkey_run(hex(kEcRecoverInput))};
    REQUIRE(out);
    REQUIRE(out->size() == 64);
    // The address is the tail of the key hash
    const auto key_hash{keccak256(*out)};
    CHECK(to_hex(ByteView{&key_hash.bytes[12], 20}) == "a94f5374fce5edbc8e2a8697c15331677e6ebf0b");

    Bytes bad_v{hex(kEcRecoverInput)};
    bad_v[63] = 0x05;
    CHECK(!ecrec_pubkey_run(bad_v));

    SECTION("scalars above the group order are reduced") {
        const std::string hash{"18c547e4f7b0f325ad1e56f57e26c745b09a3e503d86e00e5255ff7f715d3d1c"};
        const std::string v{"000000000000000000000000000000000000000000000000000000000000001b"};
        const std::string expected_key{
            "e67b3dc2132927334307fdb9aac6732f373598f773d51f13c654f8848f8b01ff"
            "d4b82e9efd8a685f1c886eb05bfbd7e93b26bd85c11a9c606c5150fb3115c5a1"};

        // r = 1, s = 2
        out = ecrec_pubkey_run(hex(hash + v +
                                   "0000000000000000000000000000000000000000000000000000000000000001"
                                   "0000000000000000000000000000000000000000000000000000000000000002"));
        REQUIRE(out);
        CHECK(to_hex(*out) == expected_key);

        // r = 1 + n, s = 2 + n
        out = ecrec_pubkey_run(hex(hash + v +
                                   "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364142"
                                   "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364143"));
        REQUIRE(out);
        CHECK(to_hex(*out) == expected_key);

        // r = n reduces to zero
        CHECK(!ecrec_pubkey_run(hex(hash + v +
                                    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"
                                    "0000000000000000000000000000000000000000000000000000000000000002")));
    }
}

TEST_CASE("SHA256", "[core][execution][precompile]") {
    std::optional<Bytes> out{sha256_run(hex(kEcRecoverInput))};
    REQUIRE(out);
    CHECK(to_hex(*out) == "4c9b4988d3e2da685fb53b44484202256fad76c018397910348eb4387ec891f3");

    out = sha256_run({});
    REQUIRE(out);
    CHECK(to_hex(*out) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("RIPEMD160", "[core][execution][precompile]") {
    std::optional<Bytes> out{rip160_run({})};
    REQUIRE(out);
    CHECK(to_hex(*out) == "0000000000000000000000009c1185a5c5e9fc54612808977ee8f548b2258d31");
}

TEST_CASE("Identity", "[core][execution][precompile]") {
    const Bytes in{hex("deadbeef")};
    std::optional<Bytes> out{id_run(in)};
    REQUIRE(out);
    CHECK(*out == in);
    CHECK(id_gas(in) == 18);
    CHECK(id_gas({}) == 15);
}

TEST_CASE("Modexp", "[core][execution][precompile]") {
    // 3^2 mod 5
    const Bytes in{hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "030205")};
    std::optional<Bytes> out{expmod_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) == "04");
    CHECK(expmod_gas(in) == 200);

    // zero modulus length gives empty output
    const Bytes zero_mod{hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000000"
        "0302")};
    out = expmod_run(zero_mod);
    REQUIRE(out);
    CHECK(out->empty());

    // 2^1 mod 0x0100 is left-padded to the modulus length
    const Bytes wide_mod{hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000002"
        "02010100")};
    out = expmod_run(wide_mod);
    REQUIRE(out);
    CHECK(to_hex(*out) == "0002");

    // lengths beyond 64 bits are unaffordable
    const Bytes huge_base{hex(
        "0000000000000000000000000000000000000000000000010000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000001")};
    CHECK(expmod_gas(huge_base) == UINT64_MAX);

    SECTION("missing operand bytes read as zeros") {
        // 3^2 mod 0x0500
        const Bytes truncated{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "030205")};
        out = expmod_run(truncated);
        REQUIRE(out);
        CHECK(to_hex(*out) == "0009");
    }

    SECTION("length limit") {
        // 1^1 mod 2^8184 with a 1024-byte modulus
        const Bytes at_limit{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000400"
            "010101")};
        out = expmod_run(at_limit);
        REQUIRE(out);
        CHECK(out->size() == kMaxModExpLength);
        CHECK(out->back() == 1);

        const Bytes over_limit{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000401"
            "010101")};
        CHECK_FALSE(expmod_run(over_limit));
    }

    SECTION("oversized exponent length") {
        // exp_len = 2^60 is affordable with a genesis gas allowance
        const Bytes oversized{hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000001000000000000000"
            "0000000000000000000000000000000000000000000000000000000000000001")};
        CHECK(expmod_gas(oversized) < static_cast<uint64_t>(INT64_MAX));
        CHECK_FALSE(expmod_run(oversized));

        const Handler handler{"Modexp", {expmod_gas, expmod_run}};
        const PrecompileResult result{handler(oversized, static_cast<uint64_t>(INT64_MAX), {}, true)};
        REQUIRE_FALSE(result);
        CHECK(result.error() == PrecompileError::kInvalidInput);
    }
}

TEST_CASE("SHA3 FIPS-202", "[core][execution][precompile]") {
    std::optional<Bytes> out{sha3_fips_run({})};
    REQUIRE(out);
    CHECK(to_hex(*out) == "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");

    out = sha3_fips_run(hex("616263"));  // "abc"
    REQUIRE(out);
    CHECK(to_hex(*out) == "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST_CASE("BLAKE2F", "[core][execution][precompile]") {
    // 12 rounds over "abc", i.e. the final compression of BLAKE2b-512("abc")
    Bytes in{hex(
        "0000000c48c9bdf267e6096a3ba7ca8485ae67bb2bf894fe72f36e3cf1361d5f3af54fa5d182e6ad7f520e511f6c3e2b8c68059b6b"
        "bd41fbabd9831f79217e1319cde05b6162630000000000000000000000000000000000000000000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000"
        "0000000000000000000000000000000000000000000000000000000000000000000000000003000000000000000000000000000000"
        "01")};
    REQUIRE(in.size() == 213);
    CHECK(blake2_f_gas(in) == 12);
    std::optional<Bytes> out{blake2_f_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) ==
          "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
          "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");

    SECTION("invalid final block flag") {
        in.back() = 0x02;
        CHECK(!blake2_f_run(in));
    }
    SECTION("wrong length") {
        in.pop_back();
        CHECK(!blake2_f_run(in));
    }
}

TEST_CASE("BN_ADD", "[core][execution][precompile]") {
    Bytes in{hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000002"
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000002")};
    std::optional<Bytes> out{bn_add_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) ==
          "030644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd3"
          "15ed738c0e0a7c92e7845f96b2ae9c0a68a6a449e3538fc7ff3ebf7a5a18a2c4");

    // (1, 3) is not on the curve
    in = hex(
        "0000000000000000000000000000000000000000000000000000000000000001"
        "0000000000000000000000000000000000000000000000000000000000000003");
    CHECK(!bn_add_run(in));
}

TEST_CASE("BN_MUL", "[core][execution][precompile]") {
    Bytes in{hex(
        "1a87b0584ce92f4593d161480614f2989035225609f08058ccfa3d0f940febe3"
        "1a2f3c951f6dadcc7ee9007dff81504b0fcd6d7cf59996efdc33d92bf7f9f8f6"
        "0000000000000000000000000000000000000000000000000000000000000009")};
    std::optional<Bytes> out{bn_mul_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) ==
          "1dbad7d39dbc56379f78fac1bca147dc8e66de1b9d183c7b167351bfe0aeab74"
          "2cd757d51289cd8dbd0acf9e673ad67d0f0a89f912af47ed1be53664f5692575");
}

TEST_CASE("SNARKV", "[core][execution][precompile]") {
    // empty input
    Bytes in{};
    std::optional<Bytes> out{snarkv_run(in)};
    REQUIRE(out);
    CHECK(to_hex(*out) == "0000000000000000000000000000000000000000000000000000000000000001");
    CHECK(snarkv_gas(in) == 45'000);

    // input size is not a multiple of 192
    in = hex("ab");
    out = snarkv_run(in);
    CHECK(!out);

    in = hex(
        "0f25929bcb43d5a57391564615c9e70a992b10eafa4db109709649cf48c50dd216da2f5cb6be7a0aa72c440c53c9"
        "bbdfec6c36c7d515536431b3a865468acbba2e89718ad33c8bed92e210e81d1853435399a271913a6520736a4729"
        "cf0d51eb01a9e2ffa2e92599b68e44de5bcf354fa2642bd4f26b259daa6f7ce3ed57aeb314a9a87b789a58af499b"
        "314e13c3d65bede56c07ea2d418d6874857b70763713178fb49a2d6cd347dc58973ff49613a20757d0fcc22079f9"
        "abd10c3baee245901b9e027bd5cfc2cb5db82d4dc9677ac795ec500ecd47deee3b5da006d6d049b811d7511c7815"
        "8de484232fc68daf8a45cf217d1c2fae693ff5871e8752d73b21198e9393920d483a7260bfb731fb5d25f1aa4933"
        "35a9e71297e485b7aef312c21800deef121f1e76426a00665e5c4479674322d4f75edadd46debd5cd992f6ed0906"
        "89d0585ff075ec9e99ad690c3395bc4b313370b38ef355acdadcd122975b12c85ea5db8c6deb4aab71808dcb408f"
        "e3d1e7690c43d37b4ce6cc0166fa7daa");
    out = snarkv_run(in);
    REQUIRE(out);
    CHECK(to_hex(*out) == "0000000000000000000000000000000000000000000000000000000000000001");
    CHECK(snarkv_gas(in) == 34'000 * 2 + 45'000);
}

// Multiples of the generator from RFC 9496 Appendix A.1
static constexpr std::string_view kRistrettoB{"e2f2ae0a6abc4e71a884a961c500515f58e30b6aa582dd8db6a65945e08d2d76"};
static constexpr std::string_view kRistretto2B{"6a493210f7499cd17fecb510ae0cea23a110e8d5b901f8acadd3095c73a3b919"};

TEST_CASE("Ristretto255 addition", "[core][execution][precompile]") {
    std::optional<Bytes> out{ristretto_add_run(hex(std::string{kRistrettoB} + std::string{kRistrettoB}))};
    REQUIRE(out);
    CHECK(to_hex(*out) == kRistretto2B);

    SECTION("identity is neutral") {
        out = ristretto_add_run(hex(std::string(64, '0') + std::string{kRistrettoB}));
        REQUIRE(out);
        CHECK(to_hex(*out) == kRistrettoB);
    }
    SECTION("more than ten points") {
        Bytes many;
        for (int i{0}; i < 11; ++i) {
            many += hex(kRistrettoB);
        }
        CHECK(!ristretto_add_run(many));
    }
    SECTION("partial point") {
        CHECK(!ristretto_add_run(hex("e2f2ae0a")));
    }
}

TEST_CASE("Ristretto255 scalar multiplication", "[core][execution][precompile]") {
    // little-endian scalar 2
    const std::string two{"02" + std::string(62, '0')};
    std::optional<Bytes> out{ristretto_mul_run(hex(two + std::string{kRistrettoB}))};
    REQUIRE(out);
    CHECK(to_hex(*out) == kRistretto2B);

    CHECK(!ristretto_mul_run(hex(two)));
}

TEST_CASE("Ed25519 verification", "[core][execution][precompile]") {
    // Public key of RFC 8032 test 1
    const std::string public_key{"d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};
    const std::string message(64, '1');

    SECTION("signature mismatch") {
        std::optional<Bytes> out{ed25519_verify_run(hex(message + public_key + std::string(128, '0')))};
        REQUIRE(out);
        CHECK(to_hex(*out) == "00000001");
    }
    SECTION("malformed signature") {
        CHECK(!ed25519_verify_run(hex(message + public_key + std::string(126, '0') + "ff")));
    }
    SECTION("short input") {
        CHECK(!ed25519_verify_run(hex(message + public_key)));
    }
    SECTION("small-order key") {
        // Encoding of the identity point
        const std::string identity{"01" + std::string(62, '0')};
        std::optional<Bytes> out{ed25519_verify_run(hex(message + identity + std::string(128, '0')))};
        REQUIRE(out);
        CHECK(to_hex(*out) == "00000001");
    }
    SECTION("key off the curve") {
        // y = 2 has no matching x
        const std::string off_curve{"02" + std::string(62, '0')};
        CHECK(!ed25519_verify_run(hex(message + off_curve + std::string(128, '0'))));
    }
}

TEST_CASE("Handler", "[core][execution][precompile]") {
    const Handler identity{"Identity", {id_gas, id_run}};
    const Bytes in(32, 0x01);
    const CallContext context{};

    SECTION("enough gas") {
        const auto result{identity(in, 18, context, /*is_static_call=*/false)};
        REQUIRE(result);
        CHECK(result->output == in);
        CHECK(result->gas_cost == 18);
    }
    SECTION("no limit") {
        const auto result{identity(in, std::nullopt, context, /*is_static_call=*/true)};
        REQUIRE(result);
        CHECK(result->gas_cost == 18);
    }
    SECTION("gas limit below cost") {
        const auto result{identity(in, 17, context, /*is_static_call=*/false)};
        REQUIRE(!result);
        CHECK(result.error() == PrecompileError::kOutOfGas);
    }
    SECTION("invalid input") {
        const Handler pairing{"Bn128Pairing", {snarkv_gas, snarkv_run}};
        const auto result{pairing(hex("ab"), std::nullopt, context, /*is_static_call=*/false)};
        REQUIRE(!result);
        CHECK(result.error() == PrecompileError::kInvalidInput);
    }
}

TEST_CASE("Registry", "[core][execution][precompile]") {
    const Registry registry;
    CHECK(registry.size() == std::size(kContracts));
    for (const auto& [address, handler] : kContracts) {
        const Handler* resolved{registry.resolve(address)};
        REQUIRE(resolved);
        CHECK(resolved->name() == handler.name());
    }
    CHECK(!registry.contains(0x0000000000000000000000000000000000000008_address));
    CHECK(!registry.contains(0x0000000000000000000000000000000000001000_address));

    const Registry custom{std::vector<RegisteredContract>{{kIdentityAddress, Handler{"Identity", {id_gas, id_run}}}}};
    CHECK(custom.size() == 1);
    CHECK(custom.contains(kIdentityAddress));
    CHECK(!custom.contains(kSha256Address));
}

}  // namespace gensim::precompile
