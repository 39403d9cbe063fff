#include "qkdnet/protocol/message_codec.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"

#include "protocol/qkd_message.pb.h"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message.h>
#include <limits>
#include <string>

namespace qkdnet::protocol {
    using crypto::SodiumInterop;
    namespace wire = qkdnet::proto::protocol;

    namespace {
        Result<std::vector<uint8_t>, ProtocolFailure> SerializeDeterministic(
            const google::protobuf::Message& message) {
            std::string output;
            {
                google::protobuf::io::StringOutputStream stream(&output);
                google::protobuf::io::CodedOutputStream coded_out(&stream);
                coded_out.SetSerializationDeterministic(true);
                if (!message.SerializeToCodedStream(&coded_out) || coded_out.HadError()) {
                    return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                        ProtocolFailure::Encode("Failed to serialize protobuf deterministically"));
                }
            }
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
                std::vector<uint8_t>(output.begin(), output.end()));
        }

        std::string ToWireBytes(const std::vector<uint8_t>& bytes) {
            return std::string(bytes.begin(), bytes.end());
        }

        std::vector<uint8_t> FromWireBytes(const std::string& bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }

        wire::ReconciliationMethod ToWire(const enums::ReconciliationMethod method) {
            return method == enums::ReconciliationMethod::Ldpc
                ? wire::RECONCILIATION_METHOD_LDPC
                : wire::RECONCILIATION_METHOD_CASCADE;
        }

        Result<enums::ReconciliationMethod, ProtocolFailure> FromWire(const wire::ReconciliationMethod method) {
            switch (method) {
                case wire::RECONCILIATION_METHOD_CASCADE:
                    return Result<enums::ReconciliationMethod, ProtocolFailure>::Ok(
                        enums::ReconciliationMethod::Cascade);
                case wire::RECONCILIATION_METHOD_LDPC:
                    return Result<enums::ReconciliationMethod, ProtocolFailure>::Ok(
                        enums::ReconciliationMethod::Ldpc);
                default:
                    return Result<enums::ReconciliationMethod, ProtocolFailure>::Err(
                        ProtocolFailure::Decode(compat::format(
                            "Unknown reconciliation method {}", static_cast<int>(method))));
            }
        }

        struct PayloadWriter {
            wire::ProtocolMessage* out;

            void operator()(const payloads::InitRequest& p) const {
                auto* m = out->mutable_init_request();
                m->set_party_id(p.party_id);
                m->set_method(ToWire(p.method));
            }
            void operator()(const payloads::InitResponse& p) const {
                auto* m = out->mutable_init_response();
                m->set_party_id(p.party_id);
                m->set_accepted(p.accepted);
            }
            void operator()(const payloads::AuthChallenge& p) const {
                out->mutable_auth_challenge()->set_challenge(ToWireBytes(p.challenge));
            }
            void operator()(const payloads::AuthResponse& p) const {
                out->mutable_auth_response()->set_response(ToWireBytes(p.response));
            }
            void operator()(const payloads::KeyGenRequest& p) const {
                auto* m = out->mutable_key_gen_request();
                m->set_shot_count(p.shot_count);
                m->set_use_hardware(p.use_hardware);
            }
            void operator()(const payloads::KeyGenResponse& p) const {
                auto* m = out->mutable_key_gen_response();
                m->set_key_digest(ToWireBytes(p.key_digest));
                m->set_fidelity(p.fidelity);
                m->set_source_id(p.source_id);
                m->set_key_length_bits(p.key_length_bits);
            }
            void operator()(const payloads::ErrorDetect& p) const {
                auto* m = out->mutable_error_detect();
                for (const uint32_t index : p.sampled_indices) {
                    m->add_sampled_indices(index);
                }
                m->set_error_count(p.error_count);
                m->set_error_rate(p.error_rate);
            }
            void operator()(const payloads::ErrorCorrect& p) const {
                auto* m = out->mutable_error_correct();
                m->set_method(ToWire(p.method));
                m->set_errors_corrected(p.errors_corrected);
                m->set_remaining_errors(p.remaining_errors);
                m->set_leaked_bits(p.leaked_bits);
                m->set_converged(p.converged);
            }
            void operator()(const payloads::PrivacyAmp& p) const {
                auto* m = out->mutable_privacy_amp();
                m->set_seed(ToWireBytes(p.seed));
                m->set_output_length(p.output_length);
            }
            void operator()(const payloads::KeyVerify& p) const {
                auto* m = out->mutable_key_verify();
                m->set_local_digest(ToWireBytes(p.local_digest));
                m->set_peer_digest(ToWireBytes(p.peer_digest));
                m->set_keys_match(p.keys_match);
            }
            void operator()(const payloads::KeyConfirm& p) const {
                auto* m = out->mutable_key_confirm();
                m->set_key_length(p.key_length);
                m->set_confirmation_tag(ToWireBytes(p.confirmation_tag));
            }
        };

        wire::ProtocolMessage ToProto(const Message& message, const bool include_signature) {
            wire::ProtocolMessage proto;
            proto.set_kind(static_cast<wire::MessageKind>(message.Kind()));
            proto.set_session_id(message.SessionId());
            proto.set_timestamp(message.Timestamp());
            std::visit(PayloadWriter{&proto}, message.Payload());
            if (include_signature && message.IsSigned()) {
                proto.set_signature(ToWireBytes(message.Signature()));
            }
            return proto;
        }

        Result<MessagePayload, ProtocolFailure> PayloadFromProto(const wire::ProtocolMessage& proto) {
            using PayloadResult = Result<MessagePayload, ProtocolFailure>;
            switch (proto.payload_case()) {
                case wire::ProtocolMessage::kInitRequest: {
                    auto method = FromWire(proto.init_request().method());
                    if (method.IsErr()) {
                        return PayloadResult::Err(std::move(method).UnwrapErr());
                    }
                    return PayloadResult::Ok(payloads::InitRequest{
                        proto.init_request().party_id(), method.Unwrap()});
                }
                case wire::ProtocolMessage::kInitResponse:
                    return PayloadResult::Ok(payloads::InitResponse{
                        proto.init_response().party_id(), proto.init_response().accepted()});
                case wire::ProtocolMessage::kAuthChallenge:
                    return PayloadResult::Ok(payloads::AuthChallenge{
                        FromWireBytes(proto.auth_challenge().challenge())});
                case wire::ProtocolMessage::kAuthResponse:
                    return PayloadResult::Ok(payloads::AuthResponse{
                        FromWireBytes(proto.auth_response().response())});
                case wire::ProtocolMessage::kKeyGenRequest:
                    return PayloadResult::Ok(payloads::KeyGenRequest{
                        proto.key_gen_request().shot_count(), proto.key_gen_request().use_hardware()});
                case wire::ProtocolMessage::kKeyGenResponse: {
                    const auto& m = proto.key_gen_response();
                    return PayloadResult::Ok(payloads::KeyGenResponse{
                        FromWireBytes(m.key_digest()), m.fidelity(), m.source_id(), m.key_length_bits()});
                }
                case wire::ProtocolMessage::kErrorDetect: {
                    const auto& m = proto.error_detect();
                    payloads::ErrorDetect payload;
                    payload.sampled_indices.assign(m.sampled_indices().begin(), m.sampled_indices().end());
                    payload.error_count = m.error_count();
                    payload.error_rate = m.error_rate();
                    return PayloadResult::Ok(std::move(payload));
                }
                case wire::ProtocolMessage::kErrorCorrect: {
                    const auto& m = proto.error_correct();
                    auto method = FromWire(m.method());
                    if (method.IsErr()) {
                        return PayloadResult::Err(std::move(method).UnwrapErr());
                    }
                    return PayloadResult::Ok(payloads::ErrorCorrect{
                        method.Unwrap(), m.errors_corrected(), m.remaining_errors(),
                        m.leaked_bits(), m.converged()});
                }
                case wire::ProtocolMessage::kPrivacyAmp:
                    return PayloadResult::Ok(payloads::PrivacyAmp{
                        FromWireBytes(proto.privacy_amp().seed()), proto.privacy_amp().output_length()});
                case wire::ProtocolMessage::kKeyVerify: {
                    const auto& m = proto.key_verify();
                    return PayloadResult::Ok(payloads::KeyVerify{
                        FromWireBytes(m.local_digest()), FromWireBytes(m.peer_digest()), m.keys_match()});
                }
                case wire::ProtocolMessage::kKeyConfirm:
                    return PayloadResult::Ok(payloads::KeyConfirm{
                        proto.key_confirm().key_length(), FromWireBytes(proto.key_confirm().confirmation_tag())});
                case wire::ProtocolMessage::PAYLOAD_NOT_SET:
                default:
                    return PayloadResult::Err(ProtocolFailure::Decode("Protocol message has no payload"));
            }
        }
    }

    Result<std::vector<uint8_t>, ProtocolFailure> MessageCodec::Encode(const Message& message) {
        return SerializeDeterministic(ToProto(message, true));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> MessageCodec::CanonicalBytes(const Message& message) {
        return SerializeDeterministic(ToProto(message, false));
    }

    Result<Message, ProtocolFailure> MessageCodec::Decode(std::span<const uint8_t> bytes) {
        if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
            return Result<Message, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Protocol message is too large"));
        }
        wire::ProtocolMessage proto;
        if (!proto.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<Message, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Failed to parse protocol message"));
        }
        if (!wire::MessageKind_IsValid(proto.kind())) {
            return Result<Message, ProtocolFailure>::Err(ProtocolFailure::Decode(
                compat::format("Unknown message kind {}", static_cast<int>(proto.kind()))));
        }
        if (!proto.signature().empty() && proto.signature().size() != Constants::HMAC_SHA_256_TAG_SIZE) {
            return Result<Message, ProtocolFailure>::Err(ProtocolFailure::Decode(
                compat::format("Signature must be {} bytes, got {}",
                    Constants::HMAC_SHA_256_TAG_SIZE, proto.signature().size())));
        }

        auto payload_result = PayloadFromProto(proto);
        if (payload_result.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(payload_result).UnwrapErr());
        }

        auto message_result = Message::Create(
            static_cast<enums::MessageKind>(proto.kind()),
            proto.session_id(),
            proto.timestamp(),
            std::move(payload_result).Unwrap());
        if (message_result.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(ProtocolFailure::Decode(
                std::move(message_result).UnwrapErr().message));
        }

        Message message = std::move(message_result).Unwrap();
        if (!proto.signature().empty()) {
            return Result<Message, ProtocolFailure>::Ok(
                message.WithSignature(FromWireBytes(proto.signature())));
        }
        return Result<Message, ProtocolFailure>::Ok(std::move(message));
    }

    Result<Message, ProtocolFailure> MessageCodec::Sign(
        const Message& message,
        std::span<const uint8_t> key) {
        if (key.empty()) {
            return Result<Message, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Signing key must not be empty"));
        }
        auto canonical = CanonicalBytes(message);
        if (canonical.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(canonical).UnwrapErr());
        }
        return Result<Message, ProtocolFailure>::Ok(
            message.WithSignature(SodiumInterop::HmacSha256(key, canonical.Unwrap())));
    }

    Result<Unit, ProtocolFailure> MessageCodec::VerifySignature(
        const Message& message,
        std::span<const uint8_t> key) {
        if (!message.IsSigned()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::SignatureVerification(
                compat::format("{} message is not signed", enums::ToString(message.Kind()))));
        }
        auto canonical = CanonicalBytes(message);
        if (canonical.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(canonical).UnwrapErr());
        }
        const auto expected = SodiumInterop::HmacSha256(key, canonical.Unwrap());
        auto equal = SodiumInterop::ConstantTimeEquals(expected, message.Signature());
        if (equal.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(equal.UnwrapErr()));
        }
        if (!equal.Unwrap()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::SignatureVerification(
                std::string(ErrorMessages::SIGNATURE_MISMATCH)));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
