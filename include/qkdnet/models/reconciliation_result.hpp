#pragma once

#include "qkdnet/core/bit_vector.hpp"
#include "qkdnet/enums/reconciliation_method.hpp"

#include <cstddef>
#include <cstdint>

namespace qkdnet::protocol::models {

/**
 * @brief Outcome of one reconciliation run
 *
 * corrected_key_a is the reference side and is never modified by Cascade.
 * leaked_bits counts the parity bits disclosed on the public channel, which
 * privacy amplification has to compress away.
 */
struct ReconciliationResult {
    Bits corrected_key_a;
    Bits corrected_key_b;
    size_t errors_corrected = 0;
    size_t remaining_errors = 0;
    bool converged = false;
    size_t leaked_bits = 0;
    uint32_t passes_run = 0;
    size_t blocks_processed = 0;
    size_t failed_blocks = 0;
    enums::ReconciliationMethod method = enums::ReconciliationMethod::Cascade;
};

} // namespace qkdnet::protocol::models
