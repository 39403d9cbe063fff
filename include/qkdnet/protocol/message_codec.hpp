#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/protocol/message.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace qkdnet::protocol {

/**
 * @brief Maps Message to and from the ProtocolMessage protobuf
 *
 * Signatures are HMAC-SHA-256 over CanonicalBytes(), the deterministic
 * serialization of the message with an empty signature field.
 */
class MessageCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Encode(const Message& message);

    /**
     * @return Err(Decode) for malformed bytes, a missing payload, a kind that
     *         disagrees with the payload or a signature that is neither empty
     *         nor 32 bytes
     */
    [[nodiscard]] static Result<Message, ProtocolFailure> Decode(std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> CanonicalBytes(const Message& message);

    [[nodiscard]] static Result<Message, ProtocolFailure> Sign(
        const Message& message,
        std::span<const uint8_t> key);

    /// Err(SignatureVerification) for an unsigned message or a tag mismatch.
    [[nodiscard]] static Result<Unit, ProtocolFailure> VerifySignature(
        const Message& message,
        std::span<const uint8_t> key);

private:
    MessageCodec() = delete;
};

}
