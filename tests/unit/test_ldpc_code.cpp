#include <catch2/catch_test_macros.hpp>
#include "qkdnet/reconciliation/ldpc_code.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include <algorithm>
#include <array>
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol::reconciliation;
namespace {
    Bits RandomMessage(size_t k) {
        Bits message = BitVector::FromBytes(SodiumInterop::GetRandomBytes((k + 7) / 8));
        message.resize(k);
        return message;
    }
}
TEST_CASE("LdpcCode - Construction", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Generator is orthogonal to the parity-check matrix") {
        auto result = LdpcCode::Create(256, 128);
        REQUIRE(result.IsOk());
        const auto& code = result.Unwrap();
        REQUIRE(code.N() == 256);
        REQUIRE(code.K() == 128);
        REQUIRE(code.M() == 128);
        REQUIRE(code.Rate() == 0.5);
        REQUIRE(code.ParityCheckMatrix().size() == 128);
        REQUIRE(code.GeneratorMatrix().size() == 128);
        REQUIRE(code.VerifyGeneratorOrthogonality());
    }
    SECTION("Invalid dimensions are rejected") {
        REQUIRE(LdpcCode::Create(64, 0).IsErr());
        REQUIRE(LdpcCode::Create(64, 64).IsErr());
        REQUIRE(LdpcCode::Create(64, 32, 0).IsErr());
        REQUIRE(LdpcCode::Create(64, 2, 3).IsErr());
    }
    SECTION("Equal seeds build equal codes") {
        std::array<uint8_t, LdpcCode::SEED_SIZE> seed{};
        seed.fill(0x42);
        auto first = LdpcCode::CreateFromSeed(128, 64, 3, seed);
        auto second = LdpcCode::CreateFromSeed(128, 64, 3, seed);
        REQUIRE(first.IsOk());
        REQUIRE(second.IsOk());
        REQUIRE(first.Unwrap().ParityCheckMatrix() == second.Unwrap().ParityCheckMatrix());
    }
}
TEST_CASE("LdpcCode - Encoding and syndromes", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto code = LdpcCode::Create(256, 128).Unwrap();
    SECTION("Encoded words are systematic codewords") {
        const Bits message = RandomMessage(128);
        auto encoded = code.Encode(message);
        REQUIRE(encoded.IsOk());
        const Bits& codeword = encoded.Unwrap();
        REQUIRE(codeword.size() == 256);
        REQUIRE(std::equal(message.begin(), message.end(), codeword.begin()));
        REQUIRE(code.IsCodeword(codeword));
        const Bits syndrome = code.Syndrome(codeword).Unwrap();
        REQUIRE(BitVector::Parity(syndrome) == 0);
        REQUIRE(std::all_of(syndrome.begin(), syndrome.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("A flipped bit breaks the parity checks") {
        Bits codeword = code.Encode(RandomMessage(128)).Unwrap();
        codeword[5] ^= 1U;
        REQUIRE_FALSE(code.IsCodeword(codeword));
    }
    SECTION("Wrong lengths are rejected") {
        REQUIRE(code.Encode(Bits(127, 0)).IsErr());
        REQUIRE(code.Syndrome(Bits(255, 0)).IsErr());
        REQUIRE(code.Decode(Bits(10, 0), 10, 0.05).IsErr());
    }
}
TEST_CASE("LdpcCode - Belief propagation", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto code = LdpcCode::Create(256, 128).Unwrap();
    SECTION("A clean codeword converges without iterating") {
        const Bits message = RandomMessage(128);
        const Bits codeword = code.Encode(message).Unwrap();
        auto decoded = code.Decode(codeword, 50, 0.02);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().converged);
        REQUIRE(decoded.Unwrap().iterations == 0);
        REQUIRE(decoded.Unwrap().message == message);
    }
    SECTION("Single message-bit errors are usually corrected") {
        int corrected = 0;
        constexpr int trials = 20;
        for (int trial = 0; trial < trials; ++trial) {
            const Bits message = RandomMessage(128);
            Bits received = code.Encode(message).Unwrap();
            received[SodiumInterop::RandomUniform(128)] ^= 1U;
            auto decoded = code.Decode(received, 50, 0.02);
            REQUIRE(decoded.IsOk());
            if (decoded.Unwrap().converged && decoded.Unwrap().message == message) {
                ++corrected;
            }
        }
        REQUIRE(corrected >= trials * 8 / 10);
    }
}
