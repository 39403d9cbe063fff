#include "qkdnet/reconciliation/ldpc_reconciler.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"
#include "qkdnet/debug/protocol_logger.hpp"

#include <algorithm>
#include <cmath>

namespace qkdnet::protocol::reconciliation {

using models::ReconciliationResult;

LdpcReconciler::LdpcReconciler(configuration::LdpcConfig config, std::vector<LdpcCode> codes)
    : config_(std::move(config))
    , codes_(std::move(codes)) {
}

Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure> LdpcReconciler::Create(
    configuration::LdpcConfig config) {

    if (auto valid = config.Validate(); valid.IsErr()) {
        return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Err(
            std::move(valid).UnwrapErr());
    }

    std::vector<LdpcCode> codes;
    codes.reserve(config.code_rates.size());
    for (const double rate : config.code_rates) {
        const auto scaled = static_cast<size_t>(std::lround(static_cast<double>(config.code_length) * rate));
        const size_t k = std::clamp<size_t>(scaled, 1, config.code_length - 1);
        auto code_result = LdpcCode::Create(config.code_length, k, std::min(config.row_weight, k));
        if (code_result.IsErr()) {
            return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Err(
                std::move(code_result).UnwrapErr());
        }
        codes.push_back(std::move(code_result).Unwrap());
    }

    return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Ok(
        std::unique_ptr<LdpcReconciler>(new LdpcReconciler(std::move(config), std::move(codes))));
}

Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure> LdpcReconciler::FromCodes(
    configuration::LdpcConfig config,
    std::vector<LdpcCode> codes) {

    if (codes.empty()) {
        return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("LDPC reconciler needs at least one code"));
    }
    if (config.max_iterations == 0) {
        return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("LDPC iteration budget must be positive"));
    }

    return Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure>::Ok(
        std::unique_ptr<LdpcReconciler>(new LdpcReconciler(std::move(config), std::move(codes))));
}

Result<ReconciliationResult, ProtocolFailure> LdpcReconciler::Reconcile(
    std::span<const uint8_t> key_a,
    std::span<const uint8_t> key_b,
    const double error_rate) {

    Bits bits_a = BitVector::FromBytes(key_a);
    Bits bits_b = BitVector::FromBytes(key_b);
    BitVector::TruncateToCommonLength(bits_a, bits_b);
    if (bits_a.empty()) {
        return Result<ReconciliationResult, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Cannot reconcile empty keys"));
    }

    const double channel_error_rate = error_rate > 0.0
        ? error_rate
        : config_.default_channel_error_rate;

    const Bits original_b = bits_b;
    auto outcome_result = ReconcileSegment(bits_a, bits_b, 0, channel_error_rate);
    if (outcome_result.IsErr()) {
        return Result<ReconciliationResult, ProtocolFailure>::Err(
            std::move(outcome_result).UnwrapErr());
    }
    const SegmentOutcome outcome = std::move(outcome_result).Unwrap();

    ReconciliationResult result;
    result.method = enums::ReconciliationMethod::Ldpc;
    result.errors_corrected = BitVector::HammingDistance(original_b, bits_b);
    result.remaining_errors = BitVector::HammingDistance(bits_a, bits_b);
    result.failed_blocks = outcome.failed_blocks;
    result.converged = outcome.failed_blocks == 0 && result.remaining_errors == 0;
    result.leaked_bits = outcome.leaked_bits;
    result.blocks_processed = outcome.blocks_processed;
    result.passes_run = static_cast<uint32_t>(outcome.deepest_rung + 1);
    result.corrected_key_a = std::move(bits_a);
    result.corrected_key_b = std::move(bits_b);

    debug::LogReconciliation(debug::Side::Unknown, "LDPC",
        result.errors_corrected, result.remaining_errors, result.leaked_bits, result.converged);

    return Result<ReconciliationResult, ProtocolFailure>::Ok(std::move(result));
}

Result<LdpcReconciler::SegmentOutcome, ProtocolFailure> LdpcReconciler::ReconcileSegment(
    std::span<const uint8_t> segment_a,
    std::span<uint8_t> segment_b,
    const size_t rung,
    const double channel_error_rate) const {

    const LdpcCode& code = codes_[rung];
    const size_t k = code.K();
    const size_t n = code.N();
    const double p = std::clamp(channel_error_rate,
        ReconciliationConstants::LDPC_MIN_CHANNEL_ERROR_RATE,
        ReconciliationConstants::LDPC_MAX_CHANNEL_ERROR_RATE);
    const double channel_magnitude = std::log((1.0 - p) / p);
    const double known_magnitude = ReconciliationConstants::LDPC_MAX_LLR;

    SegmentOutcome outcome;
    outcome.deepest_rung = rung;

    for (size_t start = 0; start < segment_a.size(); start += k) {
        const size_t length = std::min(k, segment_a.size() - start);

        Bits message_a(k, 0);
        std::copy_n(segment_a.begin() + static_cast<std::ptrdiff_t>(start), length, message_a.begin());
        auto encoded = code.Encode(message_a);
        if (encoded.IsErr()) {
            return Result<SegmentOutcome, ProtocolFailure>::Err(std::move(encoded).UnwrapErr());
        }
        const Bits codeword_a = std::move(encoded).Unwrap();
        if (!code.IsCodeword(codeword_a)) {
            return Result<SegmentOutcome, ProtocolFailure>::Err(
                ProtocolFailure::Generic("Encoded LDPC block fails its own parity checks"));
        }

        // B's message bits are noisy; padding and A's disclosed parity are exact.
        std::vector<double> llr_b(n);
        for (size_t i = 0; i < n; ++i) {
            if (i < length) {
                llr_b[i] = (segment_b[start + i] & 1U) ? -channel_magnitude : channel_magnitude;
            } else if (i < k) {
                llr_b[i] = known_magnitude;
            } else {
                llr_b[i] = codeword_a[i] ? -known_magnitude : known_magnitude;
            }
        }

        ++outcome.blocks_processed;
        outcome.leaked_bits += code.M();

        auto decoded = code.DecodeLlr(llr_b, config_.max_iterations);
        if (decoded.IsErr()) {
            return Result<SegmentOutcome, ProtocolFailure>::Err(std::move(decoded).UnwrapErr());
        }
        const LdpcDecodeResult block = std::move(decoded).Unwrap();

        if (block.converged) {
            std::copy_n(block.message.begin(), length,
                segment_b.begin() + static_cast<std::ptrdiff_t>(start));
            continue;
        }

        if (rung + 1 < codes_.size()) {
            auto retry = ReconcileSegment(
                segment_a.subspan(start, length),
                segment_b.subspan(start, length),
                rung + 1,
                channel_error_rate);
            if (retry.IsErr()) {
                return retry;
            }
            const SegmentOutcome& nested = retry.Unwrap();
            outcome.leaked_bits += nested.leaked_bits;
            outcome.blocks_processed += nested.blocks_processed;
            outcome.failed_blocks += nested.failed_blocks;
            outcome.deepest_rung = std::max(outcome.deepest_rung, nested.deepest_rung);
            continue;
        }

        ++outcome.failed_blocks;
        std::copy_n(block.message.begin(), length,
            segment_b.begin() + static_cast<std::ptrdiff_t>(start));
    }

    return Result<SegmentOutcome, ProtocolFailure>::Ok(outcome);
}

}
