#include "qkdnet/protocol/message.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"

namespace qkdnet::protocol {

namespace {
    using ValidationResult = Result<Unit, ProtocolFailure>;

    ValidationResult RequireSize(
        const std::vector<uint8_t>& field,
        const size_t expected,
        const char* name) {
        if (field.size() != expected) {
            return ValidationResult::Err(ProtocolFailure::InvalidInput(
                compat::format("{} must be {} bytes, got {}", name, expected, field.size())));
        }
        return ValidationResult::Ok(unit);
    }

    ValidationResult RequireUnitInterval(const double value, const char* name) {
        if (!(value >= 0.0 && value <= 1.0)) {
            return ValidationResult::Err(ProtocolFailure::InvalidInput(
                compat::format("{} must lie in [0, 1], got {}", name, value)));
        }
        return ValidationResult::Ok(unit);
    }

    struct PayloadValidator {
        ValidationResult operator()(const payloads::InitRequest& p) const {
            if (p.party_id.empty()) {
                return ValidationResult::Err(ProtocolFailure::InvalidInput("InitRequest party id is empty"));
            }
            return ValidationResult::Ok(unit);
        }
        ValidationResult operator()(const payloads::InitResponse& p) const {
            if (p.party_id.empty()) {
                return ValidationResult::Err(ProtocolFailure::InvalidInput("InitResponse party id is empty"));
            }
            return ValidationResult::Ok(unit);
        }
        ValidationResult operator()(const payloads::AuthChallenge& p) const {
            return RequireSize(p.challenge, Constants::AUTH_CHALLENGE_SIZE, "AuthChallenge challenge");
        }
        ValidationResult operator()(const payloads::AuthResponse& p) const {
            return RequireSize(p.response, Constants::HMAC_SHA_256_TAG_SIZE, "AuthResponse response");
        }
        ValidationResult operator()(const payloads::KeyGenRequest&) const {
            return ValidationResult::Ok(unit);
        }
        ValidationResult operator()(const payloads::KeyGenResponse& p) const {
            QKDNET_TRY(RequireSize(p.key_digest, Constants::SHA_256_DIGEST_SIZE, "KeyGenResponse digest"));
            return RequireUnitInterval(p.fidelity, "KeyGenResponse fidelity");
        }
        ValidationResult operator()(const payloads::ErrorDetect& p) const {
            if (p.error_count > p.sampled_indices.size()) {
                return ValidationResult::Err(ProtocolFailure::InvalidInput(
                    "ErrorDetect error count exceeds sample size"));
            }
            return RequireUnitInterval(p.error_rate, "ErrorDetect error rate");
        }
        ValidationResult operator()(const payloads::ErrorCorrect&) const {
            return ValidationResult::Ok(unit);
        }
        ValidationResult operator()(const payloads::PrivacyAmp& p) const {
            if (p.seed.empty() || p.output_length == 0) {
                return ValidationResult::Err(ProtocolFailure::InvalidInput(
                    "PrivacyAmp requires a seed and a positive output length"));
            }
            return ValidationResult::Ok(unit);
        }
        ValidationResult operator()(const payloads::KeyVerify& p) const {
            QKDNET_TRY(RequireSize(p.local_digest, Constants::SHA_256_DIGEST_SIZE, "KeyVerify local digest"));
            return RequireSize(p.peer_digest, Constants::SHA_256_DIGEST_SIZE, "KeyVerify peer digest");
        }
        ValidationResult operator()(const payloads::KeyConfirm& p) const {
            return RequireSize(p.confirmation_tag, Constants::HMAC_SHA_256_TAG_SIZE, "KeyConfirm tag");
        }
    };
}

Message::Message(std::string session_id, const int64_t timestamp, MessagePayload payload)
    : session_id_(std::move(session_id))
    , timestamp_(timestamp)
    , payload_(std::move(payload)) {
}

Result<Message, ProtocolFailure> Message::Create(
    std::string session_id,
    const int64_t timestamp,
    MessagePayload payload) {

    if (auto valid = std::visit(PayloadValidator{}, payload); valid.IsErr()) {
        return Result<Message, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<Message, ProtocolFailure>::Ok(
        Message(std::move(session_id), timestamp, std::move(payload)));
}

Result<Message, ProtocolFailure> Message::Create(
    const enums::MessageKind kind,
    std::string session_id,
    const int64_t timestamp,
    MessagePayload payload) {

    if (KindOf(payload) != kind) {
        return Result<Message, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
            compat::format("Payload {} does not match message kind {}",
                enums::ToString(KindOf(payload)), enums::ToString(kind))));
    }
    return Create(std::move(session_id), timestamp, std::move(payload));
}

Message Message::WithSignature(std::vector<uint8_t> signature) const {
    Message signed_message = *this;
    signed_message.signature_ = std::move(signature);
    return signed_message;
}

} // namespace qkdnet::protocol
