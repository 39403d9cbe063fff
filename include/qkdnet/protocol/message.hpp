#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/enums/message_kind.hpp"
#include "qkdnet/enums/reconciliation_method.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace qkdnet::protocol {

namespace payloads {

struct InitRequest {
    std::string party_id;
    enums::ReconciliationMethod method = enums::ReconciliationMethod::Cascade;
};

struct InitResponse {
    std::string party_id;
    bool accepted = false;
};

struct AuthChallenge {
    std::vector<uint8_t> challenge;
};

struct AuthResponse {
    std::vector<uint8_t> response;
};

struct KeyGenRequest {
    uint32_t shot_count = 0;
    bool use_hardware = false;
};

struct KeyGenResponse {
    std::vector<uint8_t> key_digest;
    double fidelity = 0.0;
    std::string source_id;
    uint64_t key_length_bits = 0;
};

struct ErrorDetect {
    std::vector<uint32_t> sampled_indices;
    uint32_t error_count = 0;
    double error_rate = 0.0;
};

struct ErrorCorrect {
    enums::ReconciliationMethod method = enums::ReconciliationMethod::Cascade;
    uint64_t errors_corrected = 0;
    uint64_t remaining_errors = 0;
    uint64_t leaked_bits = 0;
    bool converged = false;
};

struct PrivacyAmp {
    std::vector<uint8_t> seed;
    uint64_t output_length = 0;
};

struct KeyVerify {
    std::vector<uint8_t> local_digest;
    std::vector<uint8_t> peer_digest;
    bool keys_match = false;
};

struct KeyConfirm {
    uint64_t key_length = 0;
    std::vector<uint8_t> confirmation_tag;
};

} // namespace payloads

/// Alternatives are declared in MessageKind order, so index() is the kind.
using MessagePayload = std::variant<
    payloads::InitRequest,
    payloads::InitResponse,
    payloads::AuthChallenge,
    payloads::AuthResponse,
    payloads::KeyGenRequest,
    payloads::KeyGenResponse,
    payloads::ErrorDetect,
    payloads::ErrorCorrect,
    payloads::PrivacyAmp,
    payloads::KeyVerify,
    payloads::KeyConfirm>;

[[nodiscard]] inline enums::MessageKind KindOf(const MessagePayload& payload) noexcept {
    return static_cast<enums::MessageKind>(payload.index());
}

/**
 * @brief Protocol message with a typed payload
 *
 * The kind is derived from the payload alternative. Field sizes are checked
 * on construction. A message is immutable; signing produces a new instance.
 */
class Message {
public:
    /**
     * @return Err(InvalidInput) if a fixed-size field has the wrong length or a
     *         rate lies outside [0, 1]
     */
    [[nodiscard]] static Result<Message, ProtocolFailure> Create(
        std::string session_id,
        int64_t timestamp,
        MessagePayload payload);

    /// As above, additionally rejecting a payload that disagrees with kind.
    [[nodiscard]] static Result<Message, ProtocolFailure> Create(
        enums::MessageKind kind,
        std::string session_id,
        int64_t timestamp,
        MessagePayload payload);

    [[nodiscard]] Message WithSignature(std::vector<uint8_t> signature) const;

    [[nodiscard]] enums::MessageKind Kind() const noexcept { return KindOf(payload_); }
    [[nodiscard]] const std::string& SessionId() const noexcept { return session_id_; }
    /// Seconds since the Unix epoch.
    [[nodiscard]] int64_t Timestamp() const noexcept { return timestamp_; }
    [[nodiscard]] const MessagePayload& Payload() const noexcept { return payload_; }
    [[nodiscard]] const std::vector<uint8_t>& Signature() const noexcept { return signature_; }
    [[nodiscard]] bool IsSigned() const noexcept { return !signature_.empty(); }

    template<typename T>
    [[nodiscard]] const T* PayloadAs() const noexcept {
        return std::get_if<T>(&payload_);
    }

private:
    Message(std::string session_id, int64_t timestamp, MessagePayload payload);

    std::string session_id_;
    int64_t timestamp_;
    MessagePayload payload_;
    std::vector<uint8_t> signature_;
};

} // namespace qkdnet::protocol
