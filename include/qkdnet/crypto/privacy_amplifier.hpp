#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qkdnet::protocol::crypto {

/**
 * @brief SHA-256 hash-chain extractor
 *
 * Output block i is SHA-256(seed || key || i) with i encoded as a 32-bit
 * big-endian counter starting at 0. Blocks are concatenated and truncated to
 * the requested length. Both parties must use the same public seed and length.
 */
class PrivacyAmplifier {
public:
    /**
     * @return Err(InvalidInput) when the key is empty, the seed is empty or
     *         output_length is zero
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Amplify(
        std::span<const uint8_t> reconciled_key,
        size_t output_length,
        std::span<const uint8_t> seed);

    /// Fresh 32-byte public seed from the libsodium CSPRNG.
    [[nodiscard]] static std::vector<uint8_t> GenerateSeed();

    /**
     * @brief Largest output length in bytes that stays below the leakage bound
     *
     * (key_bits - leaked_bits - security_margin_bits) / 8, floored at zero.
     */
    [[nodiscard]] static size_t MaxSecureOutputLength(
        size_t key_bits,
        size_t leaked_bits,
        size_t security_margin_bits) noexcept;

private:
    PrivacyAmplifier() = delete;
};

}
