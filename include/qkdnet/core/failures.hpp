#pragma once
#include <string>
#include <string_view>
namespace qkdnet::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class ProtocolFailureType {
    Generic,
    Authentication,
    KeyGeneration,
    ReconciliationDivergence,
    KeyMismatch,
    NoPath,
    InvalidPath,
    SignatureVerification,
    DeriveKey,
    InvalidInput,
    InvalidState,
    Decode,
    Encode
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure reported by every fallible protocol, reconciliation and relay operation.
///
/// Authentication, KeyMismatch and SignatureVerification are fatal to the session
/// that raised them. KeyGeneration and ReconciliationDivergence abort the session
/// but the caller may start over with a fresh one. NoPath and InvalidPath only
/// affect the relay attempt that produced them.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;
    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure Authentication(std::string msg) {
        return {ProtocolFailureType::Authentication, std::move(msg)};
    }
    static ProtocolFailure KeyGeneration(std::string msg) {
        return {ProtocolFailureType::KeyGeneration, std::move(msg)};
    }
    static ProtocolFailure ReconciliationDivergence(std::string msg) {
        return {ProtocolFailureType::ReconciliationDivergence, std::move(msg)};
    }
    static ProtocolFailure KeyMismatch(std::string msg) {
        return {ProtocolFailureType::KeyMismatch, std::move(msg)};
    }
    static ProtocolFailure NoPath(std::string msg) {
        return {ProtocolFailureType::NoPath, std::move(msg)};
    }
    static ProtocolFailure InvalidPath(std::string msg) {
        return {ProtocolFailureType::InvalidPath, std::move(msg)};
    }
    static ProtocolFailure SignatureVerification(std::string msg) {
        return {ProtocolFailureType::SignatureVerification, std::move(msg)};
    }
    static ProtocolFailure DeriveKey(std::string msg) {
        return {ProtocolFailureType::DeriveKey, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsSessionFatal() const noexcept {
        return type == ProtocolFailureType::Authentication ||
               type == ProtocolFailureType::KeyMismatch ||
               type == ProtocolFailureType::SignatureVerification;
    }
};
[[nodiscard]] constexpr std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::Authentication: return "AuthenticationError";
        case ProtocolFailureType::KeyGeneration: return "KeyGenerationError";
        case ProtocolFailureType::ReconciliationDivergence: return "ReconciliationDivergenceError";
        case ProtocolFailureType::KeyMismatch: return "KeyMismatchError";
        case ProtocolFailureType::NoPath: return "NoPathError";
        case ProtocolFailureType::InvalidPath: return "InvalidPathError";
        case ProtocolFailureType::SignatureVerification: return "SignatureVerificationError";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Decode: return "Decode";
        case ProtocolFailureType::Encode: return "Encode";
    }
    return "Unknown";
}
}
