#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qkdnet::protocol {

/// One element per bit, each element 0 or 1.
using Bits = std::vector<uint8_t>;

/**
 * @brief Conversions between byte buffers and bit arrays
 *
 * Bits are unpacked least-significant first within each byte, so bit i of the
 * array is (bytes[i / 8] >> (i % 8)) & 1. Packing is the exact inverse; a bit
 * array whose length is not a multiple of 8 is zero padded in its last byte.
 */
class BitVector {
public:
    [[nodiscard]] static Bits FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] static std::vector<uint8_t> ToBytes(std::span<const uint8_t> bits);

    [[nodiscard]] static uint8_t BitAt(std::span<const uint8_t> bytes, size_t bit_index) noexcept;

    /// XOR-sum of the bits in the range, 0 or 1.
    [[nodiscard]] static uint8_t Parity(std::span<const uint8_t> bits) noexcept;

    /// Number of positions at which the two arrays differ, over the shorter length.
    [[nodiscard]] static size_t HammingDistance(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    /**
     * @brief Drop the bits at the given positions
     *
     * Used to discard bits whose values were disclosed during error estimation.
     * Indices may be unsorted; duplicates are ignored.
     *
     * @return Err(InvalidInput) if any index is out of range
     */
    [[nodiscard]] static Result<Bits, ProtocolFailure> RemoveIndices(
        std::span<const uint8_t> bits,
        std::span<const uint32_t> indices);

    /// Truncate both arrays to the shorter of the two.
    static void TruncateToCommonLength(Bits& a, Bits& b);

private:
    BitVector() = delete;
};

}
