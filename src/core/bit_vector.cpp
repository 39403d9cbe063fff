#include "qkdnet/core/bit_vector.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"

#include <algorithm>

namespace qkdnet::protocol {

Bits BitVector::FromBytes(std::span<const uint8_t> bytes) {
    Bits bits;
    bits.reserve(bytes.size() * Constants::BITS_PER_BYTE);
    for (const uint8_t byte : bytes) {
        for (size_t i = 0; i < Constants::BITS_PER_BYTE; ++i) {
            bits.push_back(static_cast<uint8_t>((byte >> i) & 1U));
        }
    }
    return bits;
}

std::vector<uint8_t> BitVector::ToBytes(std::span<const uint8_t> bits) {
    const size_t byte_count = (bits.size() + Constants::BITS_PER_BYTE - 1) / Constants::BITS_PER_BYTE;
    std::vector<uint8_t> bytes(byte_count, 0);
    for (size_t i = 0; i < bits.size(); ++i) {
        if (bits[i] & 1U) {
            bytes[i / Constants::BITS_PER_BYTE] |=
                static_cast<uint8_t>(1U << (i % Constants::BITS_PER_BYTE));
        }
    }
    return bytes;
}

uint8_t BitVector::BitAt(std::span<const uint8_t> bytes, const size_t bit_index) noexcept {
    const size_t byte_index = bit_index / Constants::BITS_PER_BYTE;
    if (byte_index >= bytes.size()) {
        return 0;
    }
    return static_cast<uint8_t>((bytes[byte_index] >> (bit_index % Constants::BITS_PER_BYTE)) & 1U);
}

uint8_t BitVector::Parity(std::span<const uint8_t> bits) noexcept {
    uint8_t parity = 0;
    for (const uint8_t bit : bits) {
        parity ^= static_cast<uint8_t>(bit & 1U);
    }
    return parity;
}

size_t BitVector::HammingDistance(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
    const size_t length = std::min(a.size(), b.size());
    size_t distance = 0;
    for (size_t i = 0; i < length; ++i) {
        if ((a[i] & 1U) != (b[i] & 1U)) {
            ++distance;
        }
    }
    return distance;
}

Result<Bits, ProtocolFailure> BitVector::RemoveIndices(
    std::span<const uint8_t> bits,
    std::span<const uint32_t> indices) {
    std::vector<bool> drop(bits.size(), false);
    for (const uint32_t index : indices) {
        if (index >= bits.size()) {
            return Result<Bits, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    compat::format("Bit index {} out of range for {} bits", index, bits.size())));
        }
        drop[index] = true;
    }
    Bits kept;
    kept.reserve(bits.size());
    for (size_t i = 0; i < bits.size(); ++i) {
        if (!drop[i]) {
            kept.push_back(bits[i]);
        }
    }
    return Result<Bits, ProtocolFailure>::Ok(std::move(kept));
}

void BitVector::TruncateToCommonLength(Bits& a, Bits& b) {
    const size_t length = std::min(a.size(), b.size());
    a.resize(length);
    b.resize(length);
}

}
