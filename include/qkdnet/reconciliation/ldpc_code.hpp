#pragma once

#include "qkdnet/core/bit_vector.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <utility>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace qkdnet::protocol::reconciliation {

struct LdpcDecodeResult {
    /// First k bits of the hard decision.
    Bits message;
    Bits codeword;
    bool converged = false;
    uint32_t iterations = 0;
};

/**
 * @brief Systematic sparse binary code
 *
 * H = [P^T | I_m] is m x n with m = n - k. Every row of P^T holds row_weight
 * ones, spread so that column usage stays balanced. G = [I_k | P] is k x n and
 * G * H^T = 0 (mod 2).
 *
 * Codes are immutable after construction; Encode and Decode may be called
 * concurrently.
 */
class LdpcCode {
public:
    static constexpr size_t SEED_SIZE = 32;

    /**
     * @brief Build a code with fresh random structure
     *
     * @return Err(InvalidInput) when k == 0, k >= n or row_weight is 0 or
     *         larger than k
     */
    [[nodiscard]] static Result<LdpcCode, ProtocolFailure> Create(
        size_t n,
        size_t k,
        size_t row_weight = ReconciliationConstants::LDPC_DEFAULT_ROW_WEIGHT);

    /// Reproducible construction: equal seeds give equal codes.
    [[nodiscard]] static Result<LdpcCode, ProtocolFailure> CreateFromSeed(
        size_t n,
        size_t k,
        size_t row_weight,
        std::span<const uint8_t, SEED_SIZE> seed);

    /// message * G (mod 2).
    [[nodiscard]] Result<Bits, ProtocolFailure> Encode(std::span<const uint8_t> message) const;

    /**
     * @brief Sum-product belief propagation
     *
     * Channel LLRs are +-log((1-p)/p) for received 0/1, with p clamped to
     * [LDPC_MIN_CHANNEL_ERROR_RATE, LDPC_MAX_CHANNEL_ERROR_RATE].
     */
    [[nodiscard]] Result<LdpcDecodeResult, ProtocolFailure> Decode(
        std::span<const uint8_t> received,
        uint32_t max_iterations,
        double channel_error_rate) const;

    /**
     * @brief Belief propagation from explicit per-bit channel LLRs
     *
     * Positive LLR favours 0. Bits known exactly (disclosed parity, padding)
     * should carry a large magnitude.
     */
    [[nodiscard]] Result<LdpcDecodeResult, ProtocolFailure> DecodeLlr(
        std::span<const double> channel_llr,
        uint32_t max_iterations) const;

    /// H * word^T (mod 2), m bits.
    [[nodiscard]] Result<Bits, ProtocolFailure> Syndrome(std::span<const uint8_t> word) const;

    [[nodiscard]] bool IsCodeword(std::span<const uint8_t> word) const;

    [[nodiscard]] bool VerifyGeneratorOrthogonality() const;

    [[nodiscard]] size_t N() const noexcept { return n_; }
    [[nodiscard]] size_t K() const noexcept { return k_; }
    [[nodiscard]] size_t M() const noexcept { return n_ - k_; }
    [[nodiscard]] double Rate() const noexcept {
        return static_cast<double>(k_) / static_cast<double>(n_);
    }

    [[nodiscard]] const std::vector<Bits>& ParityCheckMatrix() const noexcept { return h_; }
    [[nodiscard]] const std::vector<Bits>& GeneratorMatrix() const noexcept { return g_; }

private:
    LdpcCode(size_t n, size_t k);

    void BuildGenerator(const std::vector<std::vector<size_t>>& sparse_rows);
    void RederiveGeneratorFromParityCheck();
    void BuildTannerGraph();
    [[nodiscard]] bool SyndromeIsZero(std::span<const uint8_t> word) const;

    size_t n_;
    size_t k_;
    std::vector<Bits> h_;
    std::vector<Bits> g_;
    /// Variable indices touched by each check.
    std::vector<std::vector<size_t>> check_vars_;
    /// (check, slot) pairs for each variable.
    std::vector<std::vector<std::pair<size_t, size_t>>> var_edges_;
};

}
