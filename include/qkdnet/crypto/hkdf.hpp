#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qkdnet::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over the OpenSSL 3 EVP_KDF interface
 *
 * Used for per-hop relay keys and for stretching a short hop key obtained from
 * a nested session to the length of the key in transit.
 */
class Hkdf {
public:
    /**
     * @brief Derive output_size bytes using HKDF-SHA256
     *
     * @param ikm Input key material, must not be empty
     * @param output_size Length of the derived key, in [1, MAX_OUTPUT_LEN]
     * @param salt Optional salt
     * @param info Optional context info
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace qkdnet::protocol::crypto
