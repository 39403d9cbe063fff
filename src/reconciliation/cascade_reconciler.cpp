#include "qkdnet/reconciliation/cascade_reconciler.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/debug/protocol_logger.hpp"

#include <algorithm>
#include <span>

namespace qkdnet::protocol::reconciliation {

using models::ReconciliationResult;

CascadeReconciler::CascadeReconciler(configuration::CascadeConfig config)
    : config_(config) {
}

size_t CascadeReconciler::BlockSizeForPass(const size_t initial_block_size, const uint32_t pass) noexcept {
    if (pass <= 1) {
        return std::max<size_t>(1, initial_block_size);
    }
    const uint32_t shift = pass - 1;
    if (shift >= sizeof(size_t) * Constants::BITS_PER_BYTE) {
        return 1;
    }
    return std::max<size_t>(1, initial_block_size >> shift);
}

Result<ReconciliationResult, ProtocolFailure> CascadeReconciler::Reconcile(
    std::span<const uint8_t> key_a,
    std::span<const uint8_t> key_b,
    double /*error_rate*/) {
    return ReconcileBits(BitVector::FromBytes(key_a), BitVector::FromBytes(key_b));
}

Result<ReconciliationResult, ProtocolFailure> CascadeReconciler::ReconcileBits(
    Bits bits_a,
    Bits bits_b) const {

    if (auto valid = config_.Validate(); valid.IsErr()) {
        return Result<ReconciliationResult, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
    }

    BitVector::TruncateToCommonLength(bits_a, bits_b);
    if (bits_a.empty()) {
        return Result<ReconciliationResult, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Cannot reconcile empty keys"));
    }

    std::unordered_set<size_t> corrected;
    PassState state{bits_a, bits_b, corrected};
    ReconciliationResult result;
    result.method = enums::ReconciliationMethod::Cascade;

    for (uint32_t pass = 1; pass <= config_.num_passes; ++pass) {
        const size_t block_size = BlockSizeForPass(config_.initial_block_size, pass);
        state.corrected_this_pass = 0;
        RunPass(state, block_size);
        result.passes_run = pass;
        result.blocks_processed += (bits_a.size() + block_size - 1) / block_size;

        // Even-count discrepancies inside a block are invisible to its parity,
        // so only a clean pass at single-bit blocks proves agreement.
        if (state.corrected_this_pass == 0 && block_size == 1) {
            break;
        }
    }

    for (uint32_t extra = 0;
         extra < config_.extra_passes && BitVector::HammingDistance(bits_a, bits_b) > 0;
         ++extra) {
        state.corrected_this_pass = 0;
        RunPass(state, 1);
        ++result.passes_run;
        result.blocks_processed += bits_a.size();
    }

    result.errors_corrected = corrected.size();
    result.remaining_errors = BitVector::HammingDistance(bits_a, bits_b);
    result.converged = result.remaining_errors == 0;
    result.leaked_bits = state.leaked_bits;
    result.corrected_key_a = std::move(bits_a);
    result.corrected_key_b = std::move(bits_b);

    debug::LogReconciliation(debug::Side::Unknown, "Cascade",
        result.errors_corrected, result.remaining_errors, result.leaked_bits, result.converged);

    return Result<ReconciliationResult, ProtocolFailure>::Ok(std::move(result));
}

void CascadeReconciler::RunPass(PassState& state, const size_t block_size) {
    const size_t length = state.reference.size();
    for (size_t start = 0; start < length; start += block_size) {
        const size_t block_length = std::min(block_size, length - start);
        ++state.leaked_bits;
        if (ParityDiffers(state, start, block_length)) {
            Bisect(state, start, block_length);
        }
    }
}

void CascadeReconciler::LocateErrors(PassState& state, const size_t start, const size_t length) {
    if (length <= ReconciliationConstants::CASCADE_DIRECT_SCAN_LENGTH) {
        ScanDirect(state, start, length);
        return;
    }
    ++state.leaked_bits;
    if (ParityDiffers(state, start, length)) {
        Bisect(state, start, length);
    }
}

void CascadeReconciler::Bisect(PassState& state, const size_t start, const size_t length) {
    if (length <= ReconciliationConstants::CASCADE_DIRECT_SCAN_LENGTH) {
        ScanDirect(state, start, length);
        return;
    }
    const size_t half = length / 2;
    LocateErrors(state, start, half);
    LocateErrors(state, start + half, length - half);
}

void CascadeReconciler::ScanDirect(PassState& state, const size_t start, const size_t length) {
    state.leaked_bits += length;
    for (size_t i = start; i < start + length; ++i) {
        if (state.reference[i] == state.target[i] || state.corrected.contains(i)) {
            continue;
        }
        state.target[i] = state.reference[i];
        state.corrected.insert(i);
        ++state.corrected_this_pass;
    }
}

bool CascadeReconciler::ParityDiffers(const PassState& state, const size_t start, const size_t length) {
    const std::span<const uint8_t> reference(state.reference.data() + start, length);
    const std::span<const uint8_t> target(state.target.data() + start, length);
    return BitVector::Parity(reference) != BitVector::Parity(target);
}

}
