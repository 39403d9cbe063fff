#pragma once

#include "qkdnet/configuration/reconciliation_config.hpp"
#include "qkdnet/interfaces/i_reconciler.hpp"
#include "qkdnet/reconciliation/ldpc_code.hpp"

#include <memory>
#include <vector>

namespace qkdnet::protocol::reconciliation {

/**
 * @brief Block reconciliation with a ladder of LDPC codes
 *
 * Side A's block is encoded and its parity bits are disclosed. Side B decodes
 * the word made of its own message bits and A's parity bits. A block that
 * does not converge is split into blocks of the next, lower rate code and
 * decoded again. When the ladder is exhausted the block is counted in
 * failed_blocks and the result does not converge.
 */
class LdpcReconciler final : public interfaces::IReconciler {
public:
    [[nodiscard]] static Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure> Create(
        configuration::LdpcConfig config = configuration::LdpcConfig::Default());

    /// Build from existing codes, highest rate first. Both parties must use the same codes.
    [[nodiscard]] static Result<std::unique_ptr<LdpcReconciler>, ProtocolFailure> FromCodes(
        configuration::LdpcConfig config,
        std::vector<LdpcCode> codes);

    [[nodiscard]] Result<models::ReconciliationResult, ProtocolFailure> Reconcile(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b,
        double error_rate) override;

    [[nodiscard]] enums::ReconciliationMethod Method() const noexcept override {
        return enums::ReconciliationMethod::Ldpc;
    }

    [[nodiscard]] const std::vector<LdpcCode>& Codes() const noexcept {
        return codes_;
    }

private:
    LdpcReconciler(configuration::LdpcConfig config, std::vector<LdpcCode> codes);

    struct SegmentOutcome {
        size_t leaked_bits = 0;
        size_t blocks_processed = 0;
        size_t failed_blocks = 0;
        size_t deepest_rung = 0;
    };

    [[nodiscard]] Result<SegmentOutcome, ProtocolFailure> ReconcileSegment(
        std::span<const uint8_t> segment_a,
        std::span<uint8_t> segment_b,
        size_t rung,
        double channel_error_rate) const;

    configuration::LdpcConfig config_;
    std::vector<LdpcCode> codes_;
};

}
