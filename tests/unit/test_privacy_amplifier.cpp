#include <catch2/catch_test_macros.hpp>
#include "qkdnet/crypto/privacy_amplifier.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/core/constants.hpp"
#include <algorithm>
#include <vector>
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
TEST_CASE("PrivacyAmplifier - Hash chain output", "[privacy_amplification][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(40, 0x3C);
    const std::vector<uint8_t> seed(32, 0x11);
    SECTION("First block is SHA-256(seed || key || 0)") {
        std::vector<uint8_t> input(seed);
        input.insert(input.end(), key.begin(), key.end());
        input.insert(input.end(), {0, 0, 0, 0});
        const auto expected = SodiumInterop::Sha256(input);
        auto result = PrivacyAmplifier::Amplify(key, 32, seed);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == expected);
    }
    SECTION("Longer outputs extend the shorter ones") {
        auto short_out = PrivacyAmplifier::Amplify(key, 20, seed);
        auto long_out = PrivacyAmplifier::Amplify(key, 70, seed);
        REQUIRE(short_out.IsOk());
        REQUIRE(long_out.IsOk());
        REQUIRE(long_out.Unwrap().size() == 70);
        REQUIRE(std::equal(short_out.Unwrap().begin(), short_out.Unwrap().end(), long_out.Unwrap().begin()));
    }
    SECTION("Output depends on the seed") {
        const std::vector<uint8_t> other_seed(32, 0x12);
        REQUIRE(PrivacyAmplifier::Amplify(key, 32, seed).Unwrap() !=
                PrivacyAmplifier::Amplify(key, 32, other_seed).Unwrap());
    }
}
TEST_CASE("PrivacyAmplifier - Validation", "[privacy_amplification][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(16, 0x01);
    const auto seed = PrivacyAmplifier::GenerateSeed();
    REQUIRE(seed.size() == Constants::PRIVACY_AMPLIFICATION_SEED_SIZE);
    REQUIRE(PrivacyAmplifier::Amplify({}, 16, seed).IsErr());
    REQUIRE(PrivacyAmplifier::Amplify(key, 16, {}).IsErr());
    REQUIRE(PrivacyAmplifier::Amplify(key, 0, seed).IsErr());
}
TEST_CASE("PrivacyAmplifier - Leakage bound", "[privacy_amplification][crypto]") {
    REQUIRE(PrivacyAmplifier::MaxSecureOutputLength(256, 64, 64) == 16);
    REQUIRE(PrivacyAmplifier::MaxSecureOutputLength(256, 200, 64) == 0);
    REQUIRE(PrivacyAmplifier::MaxSecureOutputLength(100, 0, 0) == 12);
}
