#pragma once

#include "qkdnet/configuration/reconciliation_config.hpp"
#include "qkdnet/interfaces/i_reconciler.hpp"

#include <cstddef>
#include <unordered_set>
#include <vector>

namespace qkdnet::protocol::reconciliation {

/**
 * @brief Multi-pass block-parity reconciliation
 *
 * Side A is the reference. Each pass splits the keys into contiguous blocks,
 * compares block parities and bisects every block whose parity differs.
 * Blocks of at most four bits report their differing positions directly.
 * Every located position is flipped on side B once and remembered across
 * passes.
 */
class CascadeReconciler final : public interfaces::IReconciler {
public:
    explicit CascadeReconciler(configuration::CascadeConfig config = configuration::CascadeConfig::Default());

    [[nodiscard]] Result<models::ReconciliationResult, ProtocolFailure> Reconcile(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b,
        double error_rate) override;

    /// Same algorithm on already unpacked bit arrays.
    [[nodiscard]] Result<models::ReconciliationResult, ProtocolFailure> ReconcileBits(
        Bits bits_a,
        Bits bits_b) const;

    [[nodiscard]] enums::ReconciliationMethod Method() const noexcept override {
        return enums::ReconciliationMethod::Cascade;
    }

    [[nodiscard]] const configuration::CascadeConfig& Config() const noexcept {
        return config_;
    }

    /// Block size used by the given 1-based pass.
    [[nodiscard]] static size_t BlockSizeForPass(size_t initial_block_size, uint32_t pass) noexcept;

private:
    struct PassState {
        const Bits& reference;
        Bits& target;
        std::unordered_set<size_t>& corrected;
        size_t leaked_bits = 0;
        size_t corrected_this_pass = 0;
    };

    static void RunPass(PassState& state, size_t block_size);
    static void LocateErrors(PassState& state, size_t start, size_t length);
    static void Bisect(PassState& state, size_t start, size_t length);
    static void ScanDirect(PassState& state, size_t start, size_t length);
    static bool ParityDiffers(const PassState& state, size_t start, size_t length);

    configuration::CascadeConfig config_;
};

}
