#pragma once

#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qkdnet::protocol::configuration {

/**
 * @brief Parameters of the Cascade engine
 *
 * Pass p uses blocks of max(1, initial_block_size / 2^(p-1)) bits. With the
 * default 8/4 the last pass runs at block size 1, which locates every
 * remaining discrepancy. A zero-correction pass only ends the run early once
 * the block size has reached 1.
 */
struct CascadeConfig {
    size_t initial_block_size = ReconciliationConstants::CASCADE_DEFAULT_BLOCK_SIZE;
    uint32_t num_passes = ReconciliationConstants::CASCADE_DEFAULT_PASSES;
    /// Passes at block size 1 run when discrepancies survive the scheduled passes.
    uint32_t extra_passes = 1;

    [[nodiscard]] static CascadeConfig Default() noexcept {
        return CascadeConfig{};
    }

    /// Larger first blocks disclose fewer parities on low-noise keys.
    [[nodiscard]] static CascadeConfig LowNoise() noexcept {
        return CascadeConfig{32, 6, 1};
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (initial_block_size == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Cascade initial block size must be positive"));
        }
        if (num_passes == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Cascade pass count must be positive"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
};

/**
 * @brief Parameters of the LDPC engine
 *
 * code_rates is the retry ladder: a block that fails to converge at
 * code_rates[i] is re-encoded at code_rates[i + 1]. Rates must lie in (0, 1)
 * and should be decreasing.
 */
struct LdpcConfig {
    size_t code_length = ReconciliationConstants::LDPC_DEFAULT_CODE_LENGTH;
    std::vector<double> code_rates{0.5, 0.375, 0.25};
    size_t row_weight = ReconciliationConstants::LDPC_DEFAULT_ROW_WEIGHT;
    uint32_t max_iterations = ReconciliationConstants::LDPC_DEFAULT_MAX_ITERATIONS;
    double default_channel_error_rate = ReconciliationConstants::LDPC_DEFAULT_CHANNEL_ERROR_RATE;

    [[nodiscard]] static LdpcConfig Default() {
        return LdpcConfig{};
    }

    /// Single fixed rate, no fallback.
    [[nodiscard]] static LdpcConfig FixedRate(double rate) {
        LdpcConfig config;
        config.code_rates = {rate};
        return config;
    }

    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (code_length < 2) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("LDPC code length must be at least 2"));
        }
        if (code_rates.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("LDPC code rate ladder is empty"));
        }
        for (const double rate : code_rates) {
            if (!(rate > 0.0 && rate < 1.0)) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput("LDPC code rate must lie in (0, 1)"));
            }
        }
        if (row_weight == 0 || max_iterations == 0) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("LDPC row weight and iteration budget must be positive"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
};

} // namespace qkdnet::protocol::configuration
