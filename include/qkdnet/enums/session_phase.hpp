#pragma once

#include <cstdint>

namespace qkdnet::protocol::enums {

/**
 * @brief Phase of a two-party key distribution session
 *
 * Phases advance strictly in declaration order from Idle to Confirmed.
 * Aborted is reachable from every non-terminal phase. Confirmed and Aborted
 * are terminal.
 */
enum class SessionPhase : uint8_t {
    Idle = 0,
    Authenticating = 1,
    KeyGenerating = 2,
    ErrorDetecting = 3,
    Reconciling = 4,
    PrivacyAmplifying = 5,
    Verifying = 6,
    Confirmed = 7,
    Aborted = 8
};

constexpr bool IsTerminal(SessionPhase phase) noexcept {
    return phase == SessionPhase::Confirmed || phase == SessionPhase::Aborted;
}

constexpr const char* ToString(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Idle:
            return "Idle";
        case SessionPhase::Authenticating:
            return "Authenticating";
        case SessionPhase::KeyGenerating:
            return "KeyGenerating";
        case SessionPhase::ErrorDetecting:
            return "ErrorDetecting";
        case SessionPhase::Reconciling:
            return "Reconciling";
        case SessionPhase::PrivacyAmplifying:
            return "PrivacyAmplifying";
        case SessionPhase::Verifying:
            return "Verifying";
        case SessionPhase::Confirmed:
            return "Confirmed";
        case SessionPhase::Aborted:
            return "Aborted";
        default:
            return "UNKNOWN";
    }
}

} // namespace qkdnet::protocol::enums
