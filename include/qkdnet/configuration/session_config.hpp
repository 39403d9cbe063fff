#pragma once

#include "qkdnet/core/constants.hpp"
#include "qkdnet/enums/reconciliation_method.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace qkdnet::protocol::configuration {

/**
 * @brief Per-session protocol parameters
 *
 * Both parties of a session must agree on sample_size, final_key_length and
 * reconciliation_method; the remaining fields are local policy.
 */
struct SessionConfig {
    uint32_t sample_size = ProtocolConstants::DEFAULT_SAMPLE_SIZE;
    uint32_t shot_count = ProtocolConstants::DEFAULT_SHOT_COUNT;
    size_t final_key_length = ProtocolConstants::DEFAULT_FINAL_KEY_LENGTH;
    /// Estimated error rate above which the session aborts before reconciling.
    double max_error_rate = ProtocolConstants::DEFAULT_MAX_ERROR_RATE;
    double min_fidelity = ProtocolConstants::DEFAULT_MIN_FIDELITY;
    std::chrono::milliseconds key_generation_timeout = ProtocolConstants::DEFAULT_KEY_GENERATION_TIMEOUT;
    std::chrono::seconds max_clock_skew = ProtocolConstants::DEFAULT_MAX_CLOCK_SKEW;
    size_t replay_capacity = ProtocolConstants::DEFAULT_REPLAY_CAPACITY;
    enums::ReconciliationMethod reconciliation_method = enums::ReconciliationMethod::Cascade;

    [[nodiscard]] static SessionConfig Default() noexcept {
        return SessionConfig{};
    }

    /// Stricter abort threshold and a fidelity floor for hardware sources.
    [[nodiscard]] static SessionConfig HighSecurity() noexcept {
        SessionConfig config;
        config.max_error_rate = 0.11;
        config.min_fidelity = 0.9;
        config.max_clock_skew = std::chrono::seconds{60};
        return config;
    }
};

} // namespace qkdnet::protocol::configuration
