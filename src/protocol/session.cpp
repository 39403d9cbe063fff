#include "qkdnet/protocol/session.hpp"
#include "qkdnet/core/bit_vector.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"
#include "qkdnet/crypto/privacy_amplifier.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/protocol/message_codec.hpp"
#include <sodium.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <numeric>
#include <utility>

namespace qkdnet::protocol {
    using crypto::PrivacyAmplifier;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using enums::MessageKind;
    using enums::SessionPhase;

    namespace {
        int64_t NowSeconds() {
            return std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        std::string GenerateSessionId() {
            const auto bytes = SodiumInterop::GetRandomBytes(Constants::SESSION_ID_BYTES);
            std::string hex(bytes.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
            hex.pop_back();
            return hex;
        }

        /// First `count` entries of a partial Fisher-Yates shuffle of [0, population).
        std::vector<uint32_t> SampleWithoutReplacement(const uint32_t population, const uint32_t count) {
            std::vector<uint32_t> pool(population);
            std::iota(pool.begin(), pool.end(), 0U);
            for (uint32_t i = 0; i < count; ++i) {
                const uint32_t j = i + SodiumInterop::RandomUniform(population - i);
                std::swap(pool[i], pool[j]);
            }
            pool.resize(count);
            return pool;
        }

        void WipeVector(std::vector<uint8_t>& buffer) noexcept {
            if (!buffer.empty()) {
                sodium_memzero(buffer.data(), buffer.size());
            }
            buffer.clear();
        }
    }

    Session::Session(
        std::string party_id,
        SecureMemoryHandle shared_secret,
        configuration::SessionConfig config,
        std::shared_ptr<interfaces::IReconciler> reconciler,
        std::shared_ptr<interfaces::IRawKeySource> raw_key_source,
        std::shared_ptr<interfaces::ISessionEventHandler> event_handler)
        : party_id_(std::move(party_id))
          , shared_secret_(std::move(shared_secret))
          , config_(config)
          , reconciler_(std::move(reconciler))
          , raw_key_source_(std::move(raw_key_source))
          , event_handler_(std::move(event_handler))
          , replay_guard_(config.replay_capacity, config.max_clock_skew) {
    }

    Session::~Session() {
        std::lock_guard guard(lock_);
        WipeKeyMaterialLocked();
        shared_secret_.Release();
    }

    Result<std::unique_ptr<Session>, ProtocolFailure> Session::Create(
        std::string party_id,
        std::span<const uint8_t> shared_secret,
        configuration::SessionConfig config,
        std::shared_ptr<interfaces::IReconciler> reconciler,
        std::shared_ptr<interfaces::IRawKeySource> raw_key_source,
        std::shared_ptr<interfaces::ISessionEventHandler> event_handler) {
        if (party_id.empty()) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Party id must not be empty"));
        }
        if (shared_secret.empty()) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Shared secret must not be empty"));
        }
        if (!reconciler || !raw_key_source) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Session requires a reconciler and a raw key source"));
        }
        if (reconciler->Method() != config.reconciliation_method) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(compat::format(
                    "Reconciler implements {} but the session is configured for {}",
                    enums::ToString(reconciler->Method()),
                    enums::ToString(config.reconciliation_method))));
        }
        if (config.final_key_length == 0 || !(config.max_error_rate >= 0.0 && config.max_error_rate <= 0.5)) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Invalid session configuration"));
        }

        auto secret_result = SecureMemoryHandle::FromBytes(shared_secret);
        if (secret_result.IsErr()) {
            return Result<std::unique_ptr<Session>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(secret_result.UnwrapErr()));
        }

        return Result<std::unique_ptr<Session>, ProtocolFailure>::Ok(
            std::unique_ptr<Session>(new Session(
                std::move(party_id),
                std::move(secret_result).Unwrap(),
                config,
                std::move(reconciler),
                std::move(raw_key_source),
                std::move(event_handler))));
    }

    // ------------------------------------------------------------------------
    // State helpers
    // ------------------------------------------------------------------------

    Result<Unit, ProtocolFailure> Session::RequirePhase(
        const SessionPhase expected,
        const char* operation) const {
        if (phase_ != expected) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(compat::format(
                "{} requires phase {}, session is {}",
                operation, enums::ToString(expected), enums::ToString(phase_))));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void Session::TransitionLocked(const SessionPhase next) {
        const SessionPhase previous = phase_;
        phase_ = next;
        debug::LogPhaseChange(side_, session_id_, enums::ToString(previous), enums::ToString(next));
        if (event_handler_) {
            event_handler_->OnPhaseChanged(session_id_, previous, next);
        }
    }

    void Session::EnterAbortedLocked(const std::string& reason) {
        if (enums::IsTerminal(phase_)) {
            return;
        }
        WipeKeyMaterialLocked();
        TransitionLocked(SessionPhase::Aborted);
        QKDNET_LOG_MSG(side_, "ABORT", reason);
        if (event_handler_) {
            event_handler_->OnSessionAborted(session_id_, reason);
        }
    }

    ProtocolFailure Session::AbortLocked(ProtocolFailure failure) {
        EnterAbortedLocked(failure.message);
        return failure;
    }

    void Session::WipeKeyMaterialLocked() noexcept {
        WipeVector(pending_challenge_);
        WipeVector(raw_key_);
        WipeVector(reconciled_key_);
        final_key_.Release();
    }

    Result<Message, ProtocolFailure> Session::SignLocked(MessagePayload payload) const {
        auto message_result = Message::Create(session_id_, NowSeconds(), std::move(payload));
        if (message_result.IsErr()) {
            return message_result;
        }
        const Message& message = message_result.Unwrap();
        auto signed_result = shared_secret_.WithReadAccess([&message](std::span<const uint8_t> secret) {
            return MessageCodec::Sign(message, secret);
        });
        if (signed_result.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(signed_result.UnwrapErr()));
        }
        return std::move(signed_result).Unwrap();
    }

    Result<Unit, ProtocolFailure> Session::VerifyInboundLocked(const Message& message) {
        auto signature_result = shared_secret_.WithReadAccess([&message](std::span<const uint8_t> secret) {
            return MessageCodec::VerifySignature(message, secret);
        });
        if (signature_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(signature_result.UnwrapErr()));
        }
        if (auto verified = std::move(signature_result).Unwrap(); verified.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(std::move(verified).UnwrapErr()));
        }
        if (!session_id_.empty() && message.SessionId() != session_id_) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(ProtocolFailure::SignatureVerification(
                compat::format("Message belongs to session '{}', expected '{}'",
                    message.SessionId(), session_id_))));
        }
        if (auto fresh = replay_guard_.CheckAndRecord(message.Signature(), message.Timestamp()); fresh.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(std::move(fresh).UnwrapErr()));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> Session::VerifyInboundOfKind(const Message& message, const MessageKind kind) {
        if (message.Kind() != kind) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(compat::format(
                "Expected {} message, got {}", enums::ToString(kind), enums::ToString(message.Kind()))));
        }
        return VerifyInboundLocked(message);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Session::ExpectedAuthResponseLocked(
        std::span<const uint8_t> challenge) const {
        auto response = shared_secret_.WithReadAccess([challenge](std::span<const uint8_t> secret) {
            return SodiumInterop::HmacSha256(secret, challenge);
        });
        if (response.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(response.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(response).Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Session::ConfirmationTagLocked() const {
        std::vector<uint8_t> context(
            ProtocolConstants::KEY_CONFIRM_INFO.begin(),
            ProtocolConstants::KEY_CONFIRM_INFO.end());
        context.insert(context.end(), session_id_.begin(), session_id_.end());
        auto tag = final_key_.WithReadAccess([&context](std::span<const uint8_t> key) {
            return SodiumInterop::HmacSha256(key, context);
        });
        if (tag.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(tag.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(tag).Unwrap());
    }

    Result<Unit, ProtocolFailure> Session::StoreFinalKeyLocked(std::span<const uint8_t> key) {
        auto handle = SecureMemoryHandle::FromBytes(key);
        if (handle.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        final_key_ = std::move(handle).Unwrap();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ------------------------------------------------------------------------
    // Handshake
    // ------------------------------------------------------------------------

    Result<Message, ProtocolFailure> Session::CreateInitRequest() {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Idle, "CreateInitRequest"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        side_ = debug::Side::Initiator;
        return SignLocked(payloads::InitRequest{party_id_, config_.reconciliation_method});
    }

    Result<Message, ProtocolFailure> Session::AcceptInitRequest(const Message& request) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Idle, "AcceptInitRequest"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (auto verified = VerifyInboundOfKind(request, MessageKind::InitRequest); verified.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(verified).UnwrapErr());
        }
        side_ = debug::Side::Responder;
        const auto* payload = request.PayloadAs<payloads::InitRequest>();
        peer_party_id_ = payload->party_id;
        const bool accepted = payload->method == config_.reconciliation_method;
        QKDNET_LOG_MSG(side_, "INIT", compat::format("peer={} method={} accepted={}",
            peer_party_id_, enums::ToString(payload->method), accepted));
        return SignLocked(payloads::InitResponse{party_id_, accepted});
    }

    Result<Unit, ProtocolFailure> Session::AcceptInitResponse(const Message& response) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Idle, "AcceptInitResponse"); phase.IsErr()) {
            return phase;
        }
        QKDNET_TRY(VerifyInboundOfKind(response, MessageKind::InitResponse));
        const auto* payload = response.PayloadAs<payloads::InitResponse>();
        if (!payload->accepted) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(compat::format(
                "Peer '{}' rejected reconciliation method {}",
                payload->party_id, enums::ToString(config_.reconciliation_method))));
        }
        peer_party_id_ = payload->party_id;
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Message, ProtocolFailure> Session::GenerateAuthChallenge() {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Idle, "GenerateAuthChallenge"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        side_ = debug::Side::Initiator;
        session_id_ = GenerateSessionId();
        pending_challenge_ = SodiumInterop::GetRandomBytes(Constants::AUTH_CHALLENGE_SIZE);

        auto message = SignLocked(payloads::AuthChallenge{pending_challenge_});
        if (message.IsErr()) {
            return message;
        }
        TransitionLocked(SessionPhase::Authenticating);
        return message;
    }

    Result<Message, ProtocolFailure> Session::Authenticate(const Message& challenge) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Idle, "Authenticate"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (auto verified = VerifyInboundOfKind(challenge, MessageKind::AuthChallenge); verified.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(verified).UnwrapErr());
        }
        side_ = debug::Side::Responder;
        session_id_ = challenge.SessionId();
        TransitionLocked(SessionPhase::Authenticating);

        auto response = ExpectedAuthResponseLocked(challenge.PayloadAs<payloads::AuthChallenge>()->challenge);
        if (response.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(AbortLocked(std::move(response).UnwrapErr()));
        }
        auto message = SignLocked(payloads::AuthResponse{std::move(response).Unwrap()});
        if (message.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }
        TransitionLocked(SessionPhase::KeyGenerating);
        return message;
    }

    Result<Unit, ProtocolFailure> Session::VerifyAuthResponse(const Message& response) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Authenticating, "VerifyAuthResponse"); phase.IsErr()) {
            return phase;
        }
        QKDNET_TRY(VerifyInboundOfKind(response, MessageKind::AuthResponse));

        auto expected = ExpectedAuthResponseLocked(pending_challenge_);
        if (expected.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(std::move(expected).UnwrapErr()));
        }
        auto equal = SodiumInterop::ConstantTimeEquals(
            expected.Unwrap(), response.PayloadAs<payloads::AuthResponse>()->response);
        if (equal.IsErr() || !equal.Unwrap()) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::Authentication(std::string(ErrorMessages::AUTH_RESPONSE_MISMATCH))));
        }
        WipeVector(pending_challenge_);
        TransitionLocked(SessionPhase::KeyGenerating);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ------------------------------------------------------------------------
    // Key generation
    // ------------------------------------------------------------------------

    Result<Message, ProtocolFailure> Session::CreateKeyGenRequest(const bool use_hardware) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::KeyGenerating, "CreateKeyGenRequest"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        return SignLocked(payloads::KeyGenRequest{config_.shot_count, use_hardware});
    }

    Result<Session::KeyGenerationOutcome, ProtocolFailure> Session::GenerateQuantumKey(const bool use_hardware) {
        std::unique_lock guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::KeyGenerating, "GenerateQuantumKey"); phase.IsErr()) {
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (key_generation_pending_) {
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Raw key generation is already in progress"));
        }

        using SourceResult = Result<models::RawKeyMaterial, ProtocolFailure>;
        std::future<SourceResult> future = std::async(std::launch::async,
            [source = raw_key_source_, shots = config_.shot_count, use_hardware]() {
                return source->GenerateRawKey(shots, use_hardware);
            });
        key_generation_pending_ = true;

        guard.unlock();
        const std::future_status status = future.wait_for(config_.key_generation_timeout);
        guard.lock();
        key_generation_pending_ = false;

        if (status != std::future_status::ready) {
            // Joined when the session is destroyed.
            stalled_key_generation_ = std::move(future);
            if (auto phase = RequirePhase(SessionPhase::KeyGenerating, "GenerateQuantumKey"); phase.IsErr()) {
                return Result<KeyGenerationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
            }
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyGeneration(compat::format(
                    "Raw key source did not answer within {} ms",
                    config_.key_generation_timeout.count()))));
        }

        SourceResult source_result = future.get();
        if (auto phase = RequirePhase(SessionPhase::KeyGenerating, "GenerateQuantumKey"); phase.IsErr()) {
            if (source_result.IsOk()) {
                WipeVector(source_result.Unwrap().bytes);
            }
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (source_result.IsErr()) {
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyGeneration(source_result.UnwrapErr().message)));
        }
        models::RawKeyMaterial material = std::move(source_result).Unwrap();
        if (material.bytes.empty()) {
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyGeneration("Raw key source returned no key material")));
        }
        if (material.fidelity < config_.min_fidelity) {
            WipeVector(material.bytes);
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyGeneration(compat::format(
                    "Source fidelity {:.3f} below required {:.3f}",
                    material.fidelity, config_.min_fidelity))));
        }

        const auto digest = SodiumInterop::Sha256(material.bytes);
        QKDNET_LOG_DIGEST(side_, "KEYGEN", "raw key digest", digest);
        auto message = SignLocked(payloads::KeyGenResponse{
            digest,
            material.fidelity,
            material.source_id,
            static_cast<uint64_t>(material.bytes.size() * Constants::BITS_PER_BYTE)});
        if (message.IsErr()) {
            WipeVector(material.bytes);
            return Result<KeyGenerationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }

        raw_key_ = material.bytes;
        TransitionLocked(SessionPhase::ErrorDetecting);
        return Result<KeyGenerationOutcome, ProtocolFailure>::Ok(KeyGenerationOutcome{
            std::move(message).Unwrap(),
            std::move(material.bytes),
            material.fidelity,
            std::move(material.source_id)});
    }

    // ------------------------------------------------------------------------
    // Error detection
    // ------------------------------------------------------------------------

    Result<Session::ErrorDetectionOutcome, ProtocolFailure> Session::ErrorDetection(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b,
        const uint32_t sample_size) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::ErrorDetecting, "ErrorDetection"); phase.IsErr()) {
            return Result<ErrorDetectionOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }

        Bits bits_a = BitVector::FromBytes(key_a);
        Bits bits_b = BitVector::FromBytes(key_b);
        BitVector::TruncateToCommonLength(bits_a, bits_b);
        if (bits_a.empty() || sample_size == 0 || sample_size >= bits_a.size()) {
            return Result<ErrorDetectionOutcome, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Sample size {} must be positive and below the key length of {} bits",
                    sample_size, bits_a.size())));
        }

        std::vector<uint32_t> sampled = SampleWithoutReplacement(
            static_cast<uint32_t>(bits_a.size()), sample_size);
        uint32_t error_count = 0;
        for (const uint32_t index : sampled) {
            if (bits_a[index] != bits_b[index]) {
                ++error_count;
            }
        }
        const double error_rate = static_cast<double>(error_count) / static_cast<double>(sample_size);
        QKDNET_LOG_VALUE(side_, "DETECT", "sampled errors", error_count);

        auto retained_a = BitVector::RemoveIndices(bits_a, sampled);
        auto retained_b = BitVector::RemoveIndices(bits_b, sampled);
        if (retained_a.IsErr() || retained_b.IsErr()) {
            return Result<ErrorDetectionOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::Generic("Failed to discard sampled bits")));
        }

        measured_error_rate_ = error_rate;
        if (error_rate > config_.max_error_rate) {
            return Result<ErrorDetectionOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::ReconciliationDivergence(compat::format(
                    "Estimated error rate {:.4f} exceeds threshold {:.4f}",
                    error_rate, config_.max_error_rate))));
        }

        auto message = SignLocked(payloads::ErrorDetect{sampled, error_count, error_rate});
        if (message.IsErr()) {
            return Result<ErrorDetectionOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }

        const size_t retained_bits = retained_a.Unwrap().size();
        TransitionLocked(SessionPhase::Reconciling);
        return Result<ErrorDetectionOutcome, ProtocolFailure>::Ok(ErrorDetectionOutcome{
            std::move(message).Unwrap(),
            error_rate,
            error_count,
            std::move(sampled),
            BitVector::ToBytes(retained_a.Unwrap()),
            BitVector::ToBytes(retained_b.Unwrap()),
            retained_bits});
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Session::ApplyErrorDetection(
        const Message& error_detect,
        std::span<const uint8_t> local_key) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::ErrorDetecting, "ApplyErrorDetection"); phase.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (auto verified = VerifyInboundOfKind(error_detect, MessageKind::ErrorDetect); verified.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(verified).UnwrapErr());
        }
        const auto* payload = error_detect.PayloadAs<payloads::ErrorDetect>();

        auto retained = BitVector::RemoveIndices(BitVector::FromBytes(local_key), payload->sampled_indices);
        if (retained.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(AbortLocked(std::move(retained).UnwrapErr()));
        }

        measured_error_rate_ = payload->error_rate;
        if (payload->error_rate > config_.max_error_rate) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::ReconciliationDivergence(compat::format(
                    "Peer reported error rate {:.4f} above threshold {:.4f}",
                    payload->error_rate, config_.max_error_rate))));
        }

        TransitionLocked(SessionPhase::Reconciling);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(BitVector::ToBytes(retained.Unwrap()));
    }

    // ------------------------------------------------------------------------
    // Reconciliation
    // ------------------------------------------------------------------------

    Result<Session::ReconciliationOutcome, ProtocolFailure> Session::Reconcile(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Reconciling, "Reconcile"); phase.IsErr()) {
            return Result<ReconciliationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }

        auto reconciled = reconciler_->Reconcile(key_a, key_b, measured_error_rate_);
        if (reconciled.IsErr()) {
            return Result<ReconciliationOutcome, ProtocolFailure>::Err(std::move(reconciled).UnwrapErr());
        }
        models::ReconciliationResult result = std::move(reconciled).Unwrap();
        debug::LogReconciliation(side_, enums::ToString(result.method),
            result.errors_corrected, result.remaining_errors, result.leaked_bits, result.converged);

        auto message = SignLocked(payloads::ErrorCorrect{
            result.method,
            result.errors_corrected,
            result.remaining_errors,
            result.leaked_bits,
            result.converged});
        if (message.IsErr()) {
            return Result<ReconciliationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }

        if (!result.converged) {
            return Result<ReconciliationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::ReconciliationDivergence(compat::format(
                    "{} reconciliation left {} errors ({} failed blocks)",
                    enums::ToString(result.method), result.remaining_errors, result.failed_blocks))));
        }

        std::vector<uint8_t> reconciled_a = BitVector::ToBytes(result.corrected_key_a);
        std::vector<uint8_t> reconciled_b = BitVector::ToBytes(result.corrected_key_b);
        reconciled_key_ = reconciled_a;
        TransitionLocked(SessionPhase::PrivacyAmplifying);
        return Result<ReconciliationOutcome, ProtocolFailure>::Ok(ReconciliationOutcome{
            std::move(message).Unwrap(),
            std::move(result),
            std::move(reconciled_a),
            std::move(reconciled_b)});
    }

    Result<Unit, ProtocolFailure> Session::ApplyErrorCorrection(
        const Message& error_correct,
        std::span<const uint8_t> corrected_local_key) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Reconciling, "ApplyErrorCorrection"); phase.IsErr()) {
            return phase;
        }
        QKDNET_TRY(VerifyInboundOfKind(error_correct, MessageKind::ErrorCorrect));
        const auto* payload = error_correct.PayloadAs<payloads::ErrorCorrect>();
        if (!payload->converged || payload->remaining_errors != 0) {
            return Result<Unit, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::ReconciliationDivergence(compat::format(
                    "Peer reported {} remaining errors after {}",
                    payload->remaining_errors, enums::ToString(payload->method)))));
        }
        if (corrected_local_key.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Corrected key must not be empty"));
        }
        reconciled_key_.assign(corrected_local_key.begin(), corrected_local_key.end());
        TransitionLocked(SessionPhase::PrivacyAmplifying);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ------------------------------------------------------------------------
    // Privacy amplification
    // ------------------------------------------------------------------------

    Result<Session::AmplificationOutcome, ProtocolFailure> Session::PrivacyAmplification(
        std::span<const uint8_t> reconciled_key,
        const size_t output_length,
        std::span<const uint8_t> seed) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::PrivacyAmplifying, "PrivacyAmplification"); phase.IsErr()) {
            return Result<AmplificationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (output_length > reconciled_key.size()) {
            return Result<AmplificationOutcome, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Cannot extract {} bytes from a {}-byte reconciled key",
                    output_length, reconciled_key.size())));
        }

        std::vector<uint8_t> public_seed = seed.empty()
            ? PrivacyAmplifier::GenerateSeed()
            : std::vector<uint8_t>(seed.begin(), seed.end());
        auto amplified = PrivacyAmplifier::Amplify(reconciled_key, output_length, public_seed);
        if (amplified.IsErr()) {
            return Result<AmplificationOutcome, ProtocolFailure>::Err(std::move(amplified).UnwrapErr());
        }

        auto message = SignLocked(payloads::PrivacyAmp{std::move(public_seed), output_length});
        if (message.IsErr()) {
            return Result<AmplificationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }
        std::vector<uint8_t> final_key = std::move(amplified).Unwrap();
        if (auto stored = StoreFinalKeyLocked(final_key); stored.IsErr()) {
            return Result<AmplificationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(stored).UnwrapErr()));
        }
        WipeVector(raw_key_);
        WipeVector(reconciled_key_);
        TransitionLocked(SessionPhase::Verifying);
        return Result<AmplificationOutcome, ProtocolFailure>::Ok(AmplificationOutcome{
            std::move(message).Unwrap(),
            std::move(final_key)});
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Session::ApplyPrivacyAmplification(const Message& privacy_amp) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::PrivacyAmplifying, "ApplyPrivacyAmplification"); phase.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (auto verified = VerifyInboundOfKind(privacy_amp, MessageKind::PrivacyAmp); verified.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(verified).UnwrapErr());
        }
        const auto* payload = privacy_amp.PayloadAs<payloads::PrivacyAmp>();
        if (payload->output_length > reconciled_key_.size()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(AbortLocked(ProtocolFailure::InvalidInput(
                compat::format("Peer requested {} bytes from a {}-byte reconciled key",
                    payload->output_length, reconciled_key_.size()))));
        }

        auto amplified = PrivacyAmplifier::Amplify(
            reconciled_key_, static_cast<size_t>(payload->output_length), payload->seed);
        if (amplified.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(AbortLocked(std::move(amplified).UnwrapErr()));
        }
        std::vector<uint8_t> final_key = std::move(amplified).Unwrap();
        if (auto stored = StoreFinalKeyLocked(final_key); stored.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(AbortLocked(std::move(stored).UnwrapErr()));
        }
        WipeVector(raw_key_);
        WipeVector(reconciled_key_);
        TransitionLocked(SessionPhase::Verifying);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(final_key));
    }

    // ------------------------------------------------------------------------
    // Verification
    // ------------------------------------------------------------------------

    Result<Session::VerificationOutcome, ProtocolFailure> Session::VerifyKey(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Verifying, "VerifyKey"); phase.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }

        const auto digest_a = SodiumInterop::Sha256(key_a);
        const auto digest_b = SodiumInterop::Sha256(key_b);
        QKDNET_LOG_DIGEST(side_, "VERIFY", "local digest", digest_a);
        QKDNET_LOG_DIGEST(side_, "VERIFY", "peer digest", digest_b);
        auto equal = SodiumInterop::ConstantTimeEquals(digest_a, digest_b);
        if (equal.IsErr() || !equal.Unwrap()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyMismatch(std::string(ErrorMessages::KEY_DIGEST_MISMATCH))));
        }

        auto message = SignLocked(payloads::KeyVerify{digest_a, digest_b, true});
        if (message.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }
        if (auto stored = StoreFinalKeyLocked(key_a); stored.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(stored).UnwrapErr()));
        }
        TransitionLocked(SessionPhase::Confirmed);
        return Result<VerificationOutcome, ProtocolFailure>::Ok(
            VerificationOutcome{std::move(message).Unwrap(), true});
    }

    Result<Session::VerificationOutcome, ProtocolFailure> Session::ApplyKeyVerify(const Message& key_verify) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Verifying, "ApplyKeyVerify"); phase.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        if (auto verified = VerifyInboundOfKind(key_verify, MessageKind::KeyVerify); verified.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(std::move(verified).UnwrapErr());
        }
        auto local_digest = final_key_.WithReadAccess([](std::span<const uint8_t> key) {
            return SodiumInterop::Sha256(key);
        });
        if (local_digest.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::FromSodiumFailure(local_digest.UnwrapErr())));
        }
        const std::vector<uint8_t> digest = std::move(local_digest).Unwrap();
        const auto* payload = key_verify.PayloadAs<payloads::KeyVerify>();
        auto equal = SodiumInterop::ConstantTimeEquals(digest, payload->local_digest);
        if (equal.IsErr() || !equal.Unwrap()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(
                ProtocolFailure::KeyMismatch(std::string(ErrorMessages::KEY_DIGEST_MISMATCH))));
        }

        auto message = SignLocked(payloads::KeyVerify{digest, payload->local_digest, true});
        if (message.IsErr()) {
            return Result<VerificationOutcome, ProtocolFailure>::Err(AbortLocked(std::move(message).UnwrapErr()));
        }
        TransitionLocked(SessionPhase::Confirmed);
        return Result<VerificationOutcome, ProtocolFailure>::Ok(
            VerificationOutcome{std::move(message).Unwrap(), true});
    }

    Result<Message, ProtocolFailure> Session::CreateKeyConfirmation() {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Confirmed, "CreateKeyConfirmation"); phase.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        auto tag = ConfirmationTagLocked();
        if (tag.IsErr()) {
            return Result<Message, ProtocolFailure>::Err(std::move(tag).UnwrapErr());
        }
        return SignLocked(payloads::KeyConfirm{final_key_.Size(), std::move(tag).Unwrap()});
    }

    Result<Unit, ProtocolFailure> Session::VerifyKeyConfirmation(const Message& confirmation) {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Confirmed, "VerifyKeyConfirmation"); phase.IsErr()) {
            return phase;
        }
        QKDNET_TRY(VerifyInboundOfKind(confirmation, MessageKind::KeyConfirm));
        const auto* payload = confirmation.PayloadAs<payloads::KeyConfirm>();
        auto expected = ConfirmationTagLocked();
        if (expected.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(std::move(expected).UnwrapErr());
        }
        auto equal = SodiumInterop::ConstantTimeEquals(expected.Unwrap(), payload->confirmation_tag);
        if (payload->key_length != final_key_.Size() || equal.IsErr() || !equal.Unwrap()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::KeyMismatch(
                "Peer key confirmation does not match the local session key"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    // ------------------------------------------------------------------------
    // Control
    // ------------------------------------------------------------------------

    Result<Unit, ProtocolFailure> Session::VerifyInbound(const Message& message) {
        std::lock_guard guard(lock_);
        return VerifyInboundLocked(message);
    }

    Result<Unit, ProtocolFailure> Session::Abort(const std::string& reason) {
        std::lock_guard guard(lock_);
        if (enums::IsTerminal(phase_)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(compat::format(
                "Cannot abort a session that is already {}", enums::ToString(phase_))));
        }
        EnterAbortedLocked(reason);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Session::Status Session::GetStatus() const {
        std::lock_guard guard(lock_);
        Status status;
        status.phase = phase_;
        status.session_id = session_id_;
        if (phase_ == SessionPhase::Confirmed && !final_key_.IsInvalid()) {
            status.key_length = final_key_.Size();
        }
        return status;
    }

    SessionPhase Session::Phase() const {
        std::lock_guard guard(lock_);
        return phase_;
    }

    std::string Session::SessionId() const {
        std::lock_guard guard(lock_);
        return session_id_;
    }

    std::string Session::PeerPartyId() const {
        std::lock_guard guard(lock_);
        return peer_party_id_;
    }

    double Session::MeasuredErrorRate() const {
        std::lock_guard guard(lock_);
        return measured_error_rate_;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Session::SessionKey() const {
        std::lock_guard guard(lock_);
        if (auto phase = RequirePhase(SessionPhase::Confirmed, "SessionKey"); phase.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(std::move(phase).UnwrapErr());
        }
        auto key = final_key_.ReadBytes(final_key_.Size());
        if (key.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(key.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(key).Unwrap());
    }
}
