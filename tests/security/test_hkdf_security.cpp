#include <catch2/catch_test_macros.hpp>
#include "qkdnet/crypto/hkdf.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <vector>

using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol;

TEST_CASE("HKDF RFC 5869 Test Case 1", "[security][hkdf][conformance]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    const std::array<uint8_t, 22> ikm = {
        0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b,
        0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b,
        0x0b, 0x0b, 0x0b, 0x0b, 0x0b, 0x0b
    };

    const std::array<uint8_t, 13> salt = {
        0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
        0x08, 0x09, 0x0a, 0x0b, 0x0c
    };

    const std::array<uint8_t, 10> info = {
        0xf0, 0xf1, 0xf2, 0xf3, 0xf4, 0xf5, 0xf6, 0xf7,
        0xf8, 0xf9
    };

    const std::array<uint8_t, 42> expected_okm = {
        0x3c, 0xb2, 0x5f, 0x25, 0xfa, 0xac, 0xd5, 0x7a,
        0x90, 0x43, 0x4f, 0x64, 0xd0, 0x36, 0x2f, 0x2a,
        0x2d, 0x2d, 0x0a, 0x90, 0xcf, 0x1a, 0x5a, 0x4c,
        0x5d, 0xb0, 0x2d, 0x56, 0xec, 0xc4, 0xc5, 0xbf,
        0x34, 0x00, 0x72, 0x08, 0xd5, 0xb8, 0x87, 0x18,
        0x58, 0x65
    };

    auto result = Hkdf::DeriveKeyBytes(ikm, 42, salt, info);
    REQUIRE(result.IsOk());

    const auto okm = std::move(result).Unwrap();
    REQUIRE(okm.size() == 42);
    REQUIRE(std::equal(okm.begin(), okm.end(), expected_okm.begin()));
}

TEST_CASE("HKDF Info Separation", "[security][hkdf][info]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    std::vector<uint8_t> ikm(32);
    randombytes_buf(ikm.data(), ikm.size());

    SECTION("Different info produces different keys") {
        const std::vector<uint8_t> info1 = {'h', 'o', 'p', '0'};
        const std::vector<uint8_t> info2 = {'h', 'o', 'p', '1'};

        auto key1 = Hkdf::DeriveKeyBytes(ikm, 32, {}, info1);
        auto key2 = Hkdf::DeriveKeyBytes(ikm, 32, {}, info2);
        REQUIRE(key1.IsOk());
        REQUIRE(key2.IsOk());
        REQUIRE(std::move(key1).Unwrap() != std::move(key2).Unwrap());
    }

    SECTION("Empty info equals omitted info") {
        const std::vector<uint8_t> empty_info;

        auto key1 = Hkdf::DeriveKeyBytes(ikm, 32);
        auto key2 = Hkdf::DeriveKeyBytes(ikm, 32, {}, empty_info);
        REQUIRE(key1.IsOk());
        REQUIRE(key2.IsOk());
        REQUIRE(std::move(key1).Unwrap() == std::move(key2).Unwrap());
    }
}

TEST_CASE("HKDF Length Limits", "[security][hkdf][output-length]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    std::vector<uint8_t> ikm(32);
    randombytes_buf(ikm.data(), ikm.size());

    SECTION("Empty input key material must fail") {
        auto result = Hkdf::DeriveKeyBytes({}, 32);
        REQUIRE(result.IsErr());
        REQUIRE(std::move(result).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Zero output length must fail") {
        auto result = Hkdf::DeriveKeyBytes(ikm, 0);
        REQUIRE(result.IsErr());
        REQUIRE(std::move(result).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }

    SECTION("Maximum allowed output length (255 * 32 = 8160 bytes)") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN);
        REQUIRE(result.IsOk());
        REQUIRE(std::move(result).Unwrap().size() == Hkdf::MAX_OUTPUT_LEN);
    }

    SECTION("Output length exceeding maximum must fail") {
        auto result = Hkdf::DeriveKeyBytes(ikm, Hkdf::MAX_OUTPUT_LEN + 1);
        REQUIRE(result.IsErr());
        REQUIRE(std::move(result).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
