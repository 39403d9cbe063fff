#include "qkdnet/reconciliation/ldpc_code.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/core/format.hpp"

#include <sodium.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace qkdnet::protocol::reconciliation {

namespace {
    double ClampLlr(const double llr) {
        return std::clamp(llr,
            -ReconciliationConstants::LDPC_MAX_LLR,
            ReconciliationConstants::LDPC_MAX_LLR);
    }

    /// Uniform draws from a libsodium deterministic stream keyed by the code seed.
    class SeededDraws {
    public:
        SeededDraws(std::span<const uint8_t, LdpcCode::SEED_SIZE> seed, size_t count)
            : values_(count) {
            if (count > 0) {
                randombytes_buf_deterministic(values_.data(), count * sizeof(uint32_t), seed.data());
            }
        }

        uint32_t Next(const size_t bound) {
            const uint32_t value = values_[position_++ % values_.size()];
            return static_cast<uint32_t>(value % bound);
        }

    private:
        std::vector<uint32_t> values_;
        size_t position_ = 0;
    };
}

LdpcCode::LdpcCode(const size_t n, const size_t k)
    : n_(n)
    , k_(k) {
}

Result<LdpcCode, ProtocolFailure> LdpcCode::Create(
    const size_t n,
    const size_t k,
    const size_t row_weight) {
    const auto seed = crypto::SodiumInterop::GetRandomBytes(SEED_SIZE);
    return CreateFromSeed(n, k, row_weight, std::span<const uint8_t, SEED_SIZE>(seed.data(), SEED_SIZE));
}

Result<LdpcCode, ProtocolFailure> LdpcCode::CreateFromSeed(
    const size_t n,
    const size_t k,
    const size_t row_weight,
    std::span<const uint8_t, SEED_SIZE> seed) {

    if (k == 0 || k >= n) {
        return Result<LdpcCode, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC message length {} must lie in [1, {})", k, n)));
    }
    if (row_weight == 0 || row_weight > k) {
        return Result<LdpcCode, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC row weight {} must lie in [1, {}]", row_weight, k)));
    }

    LdpcCode code(n, k);
    const size_t m = n - k;

    // Each row picks its columns among the least used ones so far, which
    // covers every message bit once m * row_weight >= k.
    SeededDraws draws(seed, m * row_weight);
    std::vector<size_t> column_usage(k, 0);
    std::vector<std::vector<size_t>> sparse_rows(m);
    std::vector<bool> taken(k, false);
    std::vector<size_t> candidates;
    candidates.reserve(k);

    for (size_t row = 0; row < m; ++row) {
        std::fill(taken.begin(), taken.end(), false);
        for (size_t pick = 0; pick < row_weight; ++pick) {
            size_t min_usage = std::numeric_limits<size_t>::max();
            for (size_t col = 0; col < k; ++col) {
                if (!taken[col]) {
                    min_usage = std::min(min_usage, column_usage[col]);
                }
            }
            candidates.clear();
            for (size_t col = 0; col < k; ++col) {
                if (!taken[col] && column_usage[col] == min_usage) {
                    candidates.push_back(col);
                }
            }
            const size_t chosen = candidates[draws.Next(candidates.size())];
            taken[chosen] = true;
            ++column_usage[chosen];
            sparse_rows[row].push_back(chosen);
        }
        std::sort(sparse_rows[row].begin(), sparse_rows[row].end());
    }

    code.h_.assign(m, Bits(n, 0));
    for (size_t row = 0; row < m; ++row) {
        for (const size_t col : sparse_rows[row]) {
            code.h_[row][col] = 1;
        }
        code.h_[row][k + row] = 1;
    }

    code.BuildGenerator(sparse_rows);
    if (!code.VerifyGeneratorOrthogonality()) {
        code.RederiveGeneratorFromParityCheck();
        if (!code.VerifyGeneratorOrthogonality()) {
            return Result<LdpcCode, ProtocolFailure>::Err(
                ProtocolFailure::Generic("LDPC generator matrix is not orthogonal to H"));
        }
    }
    code.BuildTannerGraph();

    return Result<LdpcCode, ProtocolFailure>::Ok(std::move(code));
}

void LdpcCode::BuildGenerator(const std::vector<std::vector<size_t>>& sparse_rows) {
    // G = [I_k | P] with P the transpose of the sparse block of H.
    g_.assign(k_, Bits(n_, 0));
    for (size_t i = 0; i < k_; ++i) {
        g_[i][i] = 1;
    }
    for (size_t row = 0; row < sparse_rows.size(); ++row) {
        for (const size_t col : sparse_rows[row]) {
            g_[col][k_ + row] = 1;
        }
    }
}

void LdpcCode::RederiveGeneratorFromParityCheck() {
    const size_t m = M();
    g_.assign(k_, Bits(n_, 0));
    for (size_t i = 0; i < k_; ++i) {
        g_[i][i] = 1;
        for (size_t j = 0; j < m; ++j) {
            g_[i][k_ + j] = h_[j][i];
        }
    }
}

void LdpcCode::BuildTannerGraph() {
    const size_t m = M();
    check_vars_.assign(m, {});
    var_edges_.assign(n_, {});
    for (size_t j = 0; j < m; ++j) {
        for (size_t i = 0; i < n_; ++i) {
            if (h_[j][i]) {
                var_edges_[i].emplace_back(j, check_vars_[j].size());
                check_vars_[j].push_back(i);
            }
        }
    }
}

bool LdpcCode::VerifyGeneratorOrthogonality() const {
    const size_t m = M();
    for (size_t i = 0; i < g_.size(); ++i) {
        for (size_t j = 0; j < m; ++j) {
            uint8_t acc = 0;
            for (size_t c = 0; c < n_; ++c) {
                acc ^= static_cast<uint8_t>(g_[i][c] & h_[j][c]);
            }
            if (acc != 0) {
                return false;
            }
        }
    }
    return true;
}

Result<Bits, ProtocolFailure> LdpcCode::Encode(std::span<const uint8_t> message) const {
    if (message.size() != k_) {
        return Result<Bits, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC message must be {} bits, got {}", k_, message.size())));
    }
    Bits codeword(n_, 0);
    for (size_t i = 0; i < k_; ++i) {
        if (!(message[i] & 1U)) {
            continue;
        }
        for (size_t c = 0; c < n_; ++c) {
            codeword[c] ^= g_[i][c];
        }
    }
    return Result<Bits, ProtocolFailure>::Ok(std::move(codeword));
}

Result<Bits, ProtocolFailure> LdpcCode::Syndrome(std::span<const uint8_t> word) const {
    if (word.size() != n_) {
        return Result<Bits, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC word must be {} bits, got {}", n_, word.size())));
    }
    const size_t m = M();
    Bits syndrome(m, 0);
    for (size_t j = 0; j < m; ++j) {
        uint8_t acc = 0;
        for (size_t c = 0; c < n_; ++c) {
            acc ^= static_cast<uint8_t>(h_[j][c] & word[c] & 1U);
        }
        syndrome[j] = acc;
    }
    return Result<Bits, ProtocolFailure>::Ok(std::move(syndrome));
}

bool LdpcCode::IsCodeword(std::span<const uint8_t> word) const {
    if (word.size() != n_) {
        return false;
    }
    return SyndromeIsZero(word);
}

bool LdpcCode::SyndromeIsZero(std::span<const uint8_t> word) const {
    for (const auto& vars : check_vars_) {
        uint8_t acc = 0;
        for (const size_t var : vars) {
            acc ^= static_cast<uint8_t>(word[var] & 1U);
        }
        if (acc != 0) {
            return false;
        }
    }
    return true;
}

Result<LdpcDecodeResult, ProtocolFailure> LdpcCode::Decode(
    std::span<const uint8_t> received,
    const uint32_t max_iterations,
    const double channel_error_rate) const {

    if (received.size() != n_) {
        return Result<LdpcDecodeResult, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC received word must be {} bits, got {}", n_, received.size())));
    }

    const double p = std::clamp(channel_error_rate,
        ReconciliationConstants::LDPC_MIN_CHANNEL_ERROR_RATE,
        ReconciliationConstants::LDPC_MAX_CHANNEL_ERROR_RATE);
    const double magnitude = std::log((1.0 - p) / p);

    std::vector<double> channel_llr(n_);
    for (size_t i = 0; i < n_; ++i) {
        channel_llr[i] = (received[i] & 1U) ? -magnitude : magnitude;
    }
    return DecodeLlr(channel_llr, max_iterations);
}

Result<LdpcDecodeResult, ProtocolFailure> LdpcCode::DecodeLlr(
    std::span<const double> channel_llr,
    const uint32_t max_iterations) const {

    if (channel_llr.size() != n_) {
        return Result<LdpcDecodeResult, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput(
                compat::format("LDPC channel LLR vector must have {} entries, got {}",
                    n_, channel_llr.size())));
    }

    const size_t m = M();
    std::vector<double> llr(n_);
    Bits hard(n_);
    for (size_t i = 0; i < n_; ++i) {
        llr[i] = ClampLlr(channel_llr[i]);
        hard[i] = llr[i] < 0.0 ? 1 : 0;
    }

    LdpcDecodeResult result;
    result.converged = SyndromeIsZero(hard);

    // Per-edge messages, indexed [check][slot].
    std::vector<std::vector<double>> var_to_check(m);
    std::vector<std::vector<double>> check_to_var(m);
    for (size_t j = 0; j < m; ++j) {
        var_to_check[j].resize(check_vars_[j].size());
        check_to_var[j].assign(check_vars_[j].size(), 0.0);
        for (size_t t = 0; t < check_vars_[j].size(); ++t) {
            var_to_check[j][t] = llr[check_vars_[j][t]];
        }
    }

    for (uint32_t iteration = 1; !result.converged && iteration <= max_iterations; ++iteration) {
        for (size_t j = 0; j < m; ++j) {
            const size_t degree = check_vars_[j].size();
            for (size_t t = 0; t < degree; ++t) {
                double product = 1.0;
                for (size_t u = 0; u < degree; ++u) {
                    if (u != t) {
                        product *= std::tanh(var_to_check[j][u] / 2.0);
                    }
                }
                product = std::clamp(product,
                    -ReconciliationConstants::LDPC_TANH_CLAMP,
                    ReconciliationConstants::LDPC_TANH_CLAMP);
                check_to_var[j][t] = 2.0 * std::atanh(product);
            }
        }

        for (size_t i = 0; i < n_; ++i) {
            double total = llr[i];
            for (const auto& [check, slot] : var_edges_[i]) {
                total += check_to_var[check][slot];
            }
            hard[i] = total < 0.0 ? 1 : 0;
            for (const auto& [check, slot] : var_edges_[i]) {
                var_to_check[check][slot] = ClampLlr(total - check_to_var[check][slot]);
            }
        }

        result.iterations = iteration;
        result.converged = SyndromeIsZero(hard);
    }

    result.message.assign(hard.begin(), hard.begin() + static_cast<std::ptrdiff_t>(k_));
    result.codeword = std::move(hard);
    return Result<LdpcDecodeResult, ProtocolFailure>::Ok(std::move(result));
}

}
