#pragma once
#include "qkdnet/core/failures.hpp"
#include "qkdnet/core/result.hpp"
#include "qkdnet/configuration/session_config.hpp"
#include "qkdnet/crypto/secure_memory_handle.hpp"
#include "qkdnet/debug/protocol_logger.hpp"
#include "qkdnet/enums/session_phase.hpp"
#include "qkdnet/interfaces/i_raw_key_source.hpp"
#include "qkdnet/interfaces/i_reconciler.hpp"
#include "qkdnet/interfaces/i_session_event_handler.hpp"
#include "qkdnet/models/reconciliation_result.hpp"
#include "qkdnet/protocol/message.hpp"
#include "qkdnet/security/message_replay_guard.hpp"
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace qkdnet::protocol {

/// Two-party key distribution session authenticated by a pre-shared secret.
///
/// Phases advance Idle, Authenticating, KeyGenerating, ErrorDetecting, Reconciling,
/// PrivacyAmplifying, Verifying, Confirmed. Any non-terminal phase may move to
/// Aborted. An operation called in the wrong phase returns InvalidState and changes
/// nothing. Every outbound message is signed with HMAC-SHA-256 under the shared
/// secret; every inbound message is checked for signature, session id, freshness
/// and replay before it is acted on.
///
/// The side that calls GenerateAuthChallenge drives the pipeline with both raw keys
/// (ErrorDetection, Reconcile, PrivacyAmplification, VerifyKey). The peer mirrors it
/// from the signed messages through the Apply* operations.
///
/// Thread Safety: All public methods are thread-safe; internal state is protected by mutex.
class Session {
public:
    struct Status {
        enums::SessionPhase phase = enums::SessionPhase::Idle;
        std::string session_id;
        /// Set only once the session is Confirmed.
        std::optional<size_t> key_length;
    };

    struct KeyGenerationOutcome {
        Message message;
        std::vector<uint8_t> raw_key;
        double fidelity = 0.0;
        std::string source_id;
    };

    struct ErrorDetectionOutcome {
        Message message;
        double error_rate = 0.0;
        uint32_t error_count = 0;
        std::vector<uint32_t> sampled_indices;
        /// Keys with the sampled bits removed, packed least-significant bit first.
        std::vector<uint8_t> retained_key_a;
        std::vector<uint8_t> retained_key_b;
        size_t retained_bits = 0;
    };

    struct ReconciliationOutcome {
        Message message;
        models::ReconciliationResult result;
        std::vector<uint8_t> reconciled_key_a;
        std::vector<uint8_t> reconciled_key_b;
    };

    struct AmplificationOutcome {
        Message message;
        std::vector<uint8_t> final_key;
    };

    struct VerificationOutcome {
        Message message;
        bool keys_match = false;
    };

    /**
     * @param reconciler must implement config.reconciliation_method
     * @param event_handler optional observer of phase changes
     */
    [[nodiscard]] static Result<std::unique_ptr<Session>, ProtocolFailure> Create(
        std::string party_id,
        std::span<const uint8_t> shared_secret,
        configuration::SessionConfig config,
        std::shared_ptr<interfaces::IReconciler> reconciler,
        std::shared_ptr<interfaces::IRawKeySource> raw_key_source,
        std::shared_ptr<interfaces::ISessionEventHandler> event_handler = nullptr);

    // Handshake

    [[nodiscard]] Result<Message, ProtocolFailure> CreateInitRequest();
    [[nodiscard]] Result<Message, ProtocolFailure> AcceptInitRequest(const Message& request);
    [[nodiscard]] Result<Unit, ProtocolFailure> AcceptInitResponse(const Message& response);

    [[nodiscard]] Result<Message, ProtocolFailure> GenerateAuthChallenge();
    [[nodiscard]] Result<Message, ProtocolFailure> Authenticate(const Message& challenge);
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifyAuthResponse(const Message& response);

    // Key generation and post-processing

    [[nodiscard]] Result<Message, ProtocolFailure> CreateKeyGenRequest(bool use_hardware);

    /// Calls the raw-key source and waits at most SessionConfig::key_generation_timeout.
    /// The session lock is released while waiting, so Phase, GetStatus and Abort stay available.
    [[nodiscard]] Result<KeyGenerationOutcome, ProtocolFailure> GenerateQuantumKey(bool use_hardware);

    /// Samples sample_size distinct bit positions, compares them and discards them from both keys.
    [[nodiscard]] Result<ErrorDetectionOutcome, ProtocolFailure> ErrorDetection(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b,
        uint32_t sample_size);

    /// Peer side of ErrorDetection: discards the announced positions from the local key.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ApplyErrorDetection(
        const Message& error_detect,
        std::span<const uint8_t> local_key);

    [[nodiscard]] Result<ReconciliationOutcome, ProtocolFailure> Reconcile(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b);

    [[nodiscard]] Result<Unit, ProtocolFailure> ApplyErrorCorrection(
        const Message& error_correct,
        std::span<const uint8_t> corrected_local_key);

    /// An empty seed is replaced by a fresh one.
    [[nodiscard]] Result<AmplificationOutcome, ProtocolFailure> PrivacyAmplification(
        std::span<const uint8_t> reconciled_key,
        size_t output_length,
        std::span<const uint8_t> seed = {});

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ApplyPrivacyAmplification(
        const Message& privacy_amp);

    /// Compares SHA-256 digests of both keys in constant time. key_a becomes the session key.
    [[nodiscard]] Result<VerificationOutcome, ProtocolFailure> VerifyKey(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b);

    /// Peer side of VerifyKey: compares the announced digest with the local final key.
    [[nodiscard]] Result<VerificationOutcome, ProtocolFailure> ApplyKeyVerify(const Message& key_verify);

    [[nodiscard]] Result<Message, ProtocolFailure> CreateKeyConfirmation();
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifyKeyConfirmation(const Message& confirmation);

    // Control

    /// Signature, session id, freshness and replay checks. A failure aborts the session.
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifyInbound(const Message& message);

    [[nodiscard]] Result<Unit, ProtocolFailure> Abort(const std::string& reason);

    [[nodiscard]] Status GetStatus() const;
    [[nodiscard]] enums::SessionPhase Phase() const;
    [[nodiscard]] std::string SessionId() const;
    [[nodiscard]] const std::string& PartyId() const noexcept { return party_id_; }
    [[nodiscard]] std::string PeerPartyId() const;
    [[nodiscard]] double MeasuredErrorRate() const;

    /// Copy of the confirmed key. InvalidState before Confirmed.
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> SessionKey() const;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) noexcept = delete;
    Session& operator=(Session&&) noexcept = delete;
    ~Session();

private:
    Session(
        std::string party_id,
        crypto::SecureMemoryHandle shared_secret,
        configuration::SessionConfig config,
        std::shared_ptr<interfaces::IReconciler> reconciler,
        std::shared_ptr<interfaces::IRawKeySource> raw_key_source,
        std::shared_ptr<interfaces::ISessionEventHandler> event_handler);

    [[nodiscard]] Result<Unit, ProtocolFailure> RequirePhase(enums::SessionPhase expected, const char* operation) const;
    void TransitionLocked(enums::SessionPhase next);
    void EnterAbortedLocked(const std::string& reason);
    [[nodiscard]] ProtocolFailure AbortLocked(ProtocolFailure failure);
    void WipeKeyMaterialLocked() noexcept;

    [[nodiscard]] Result<Message, ProtocolFailure> SignLocked(MessagePayload payload) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifyInboundLocked(const Message& message);
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifyInboundOfKind(const Message& message, enums::MessageKind kind);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ExpectedAuthResponseLocked(
        std::span<const uint8_t> challenge) const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> ConfirmationTagLocked() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> StoreFinalKeyLocked(std::span<const uint8_t> key);

    std::string party_id_;
    std::string peer_party_id_;
    std::string session_id_;
    crypto::SecureMemoryHandle shared_secret_;
    configuration::SessionConfig config_;
    std::shared_ptr<interfaces::IReconciler> reconciler_;
    std::shared_ptr<interfaces::IRawKeySource> raw_key_source_;
    std::shared_ptr<interfaces::ISessionEventHandler> event_handler_;
    security::MessageReplayGuard replay_guard_;
    enums::SessionPhase phase_ = enums::SessionPhase::Idle;
    debug::Side side_ = debug::Side::Unknown;
    std::vector<uint8_t> pending_challenge_;
    std::vector<uint8_t> raw_key_;
    std::vector<uint8_t> reconciled_key_;
    crypto::SecureMemoryHandle final_key_;
    double measured_error_rate_ = 0.0;
    bool key_generation_pending_ = false;
    std::future<Result<models::RawKeyMaterial, ProtocolFailure>> stalled_key_generation_;
    mutable std::mutex lock_;
};

}
