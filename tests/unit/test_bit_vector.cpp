#include <catch2/catch_test_macros.hpp>
#include "qkdnet/core/bit_vector.hpp"
#include <vector>
using namespace qkdnet::protocol;
TEST_CASE("BitVector - Unpacking order", "[bits][core]") {
    SECTION("Bits are unpacked least-significant first") {
        const std::vector<uint8_t> bytes = {0x01, 0x80};
        const Bits bits = BitVector::FromBytes(bytes);
        REQUIRE(bits.size() == 16);
        REQUIRE(bits[0] == 1);
        REQUIRE(bits[7] == 0);
        REQUIRE(bits[8] == 0);
        REQUIRE(bits[15] == 1);
        REQUIRE(BitVector::BitAt(bytes, 15) == 1);
        REQUIRE(BitVector::BitAt(bytes, 1) == 0);
    }
    SECTION("BitAt past the end reads zero") {
        const std::vector<uint8_t> bytes = {0xFF};
        REQUIRE(BitVector::BitAt(bytes, 8) == 0);
    }
    SECTION("Packing pads the last byte with zeros") {
        const Bits bits = {1, 1, 0, 1, 0, 0, 0, 0, 1, 1};
        const auto bytes = BitVector::ToBytes(bits);
        REQUIRE(bytes == std::vector<uint8_t>{0x0B, 0x03});
    }
}
TEST_CASE("BitVector - Parity and distance", "[bits][core]") {
    SECTION("Parity is the XOR of the bits") {
        REQUIRE(BitVector::Parity(Bits{}) == 0);
        REQUIRE(BitVector::Parity(Bits{1, 0, 1}) == 0);
        REQUIRE(BitVector::Parity(Bits{1, 1, 1}) == 1);
    }
    SECTION("Hamming distance counts differing positions over the shorter length") {
        const Bits a = {1, 0, 1, 1, 0};
        const Bits b = {1, 1, 1, 0};
        REQUIRE(BitVector::HammingDistance(a, b) == 2);
        REQUIRE(BitVector::HammingDistance(a, a) == 0);
    }
}
TEST_CASE("BitVector - Removing disclosed bits", "[bits][core]") {
    const Bits bits = {0, 1, 0, 1, 1, 0, 1, 0};
    SECTION("Indices are removed regardless of order and duplication") {
        const std::vector<uint32_t> indices = {7, 1, 1, 3};
        auto result = BitVector::RemoveIndices(bits, indices);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == Bits{0, 0, 1, 0, 1});
    }
    SECTION("Out-of-range index is rejected") {
        const std::vector<uint32_t> indices = {8};
        auto result = BitVector::RemoveIndices(bits, indices);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Truncation keeps the common prefix") {
        Bits a = {1, 0, 1};
        Bits b = {0, 0, 1, 1, 1};
        BitVector::TruncateToCommonLength(a, b);
        REQUIRE(a.size() == 3);
        REQUIRE(b == Bits{0, 0, 1});
    }
}
