#include <catch2/catch_test_macros.hpp>
#include "qkdnet/reconciliation/ldpc_reconciler.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "../helpers/raw_key_sources.hpp"
#include <array>
#include <vector>
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol::reconciliation;
using namespace qkdnet::protocol::test_helpers;
namespace {
    LdpcCode SeededCode(size_t k, size_t row_weight, uint8_t seed_byte) {
        std::array<uint8_t, LdpcCode::SEED_SIZE> seed{};
        seed.fill(seed_byte);
        auto code = LdpcCode::CreateFromSeed(256, k, row_weight, seed);
        REQUIRE(code.IsOk());
        return std::move(code).Unwrap();
    }

    /// One belief propagation round with a near-uninformative channel cannot repair a complemented block.
    configuration::LdpcConfig SingleRoundConfig(std::vector<double> rates) {
        configuration::LdpcConfig config;
        config.code_rates = std::move(rates);
        config.max_iterations = 1;
        config.default_channel_error_rate = 0.45;
        return config;
    }

    std::vector<uint8_t> Complement(std::vector<uint8_t> key) {
        for (auto& byte : key) {
            byte = static_cast<uint8_t>(~byte);
        }
        return key;
    }
}
TEST_CASE("LdpcReconciler - Construction", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Default ladder builds one code per rate") {
        auto result = LdpcReconciler::Create();
        REQUIRE(result.IsOk());
        const auto& reconciler = result.Unwrap();
        REQUIRE(reconciler->Codes().size() == 3);
        REQUIRE(reconciler->Codes().front().K() == 128);
        REQUIRE(reconciler->Method() == enums::ReconciliationMethod::Ldpc);
    }
    SECTION("Invalid rates are rejected") {
        REQUIRE(LdpcReconciler::Create(configuration::LdpcConfig::FixedRate(1.0)).IsErr());
        REQUIRE(LdpcReconciler::FromCodes(configuration::LdpcConfig::Default(), {}).IsErr());
    }
}
TEST_CASE("LdpcReconciler - Reconciling keys", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto reconciler = LdpcReconciler::Create().Unwrap();
    SECTION("Identical keys converge and disclose one parity block per code block") {
        auto [key_a, key_b] = MakeCorrelatedKeys(32, 0);
        auto result = reconciler->Reconcile(key_a, key_b, 0.0);
        REQUIRE(result.IsOk());
        const auto& outcome = result.Unwrap();
        REQUIRE(outcome.converged);
        REQUIRE(outcome.errors_corrected == 0);
        REQUIRE(outcome.blocks_processed == 2);
        REQUIRE(outcome.leaked_bits == 256);
        REQUIRE(outcome.method == enums::ReconciliationMethod::Ldpc);
    }
    SECTION("Sparse errors are usually corrected") {
        int converged = 0;
        constexpr int trials = 10;
        for (int trial = 0; trial < trials; ++trial) {
            auto [key_a, key_b] = MakeCorrelatedKeys(32, 1);
            auto result = reconciler->Reconcile(key_a, key_b, 0.01);
            REQUIRE(result.IsOk());
            if (result.Unwrap().converged && result.Unwrap().corrected_key_b == result.Unwrap().corrected_key_a) {
                ++converged;
            }
        }
        REQUIRE(converged >= trials * 8 / 10);
    }
    SECTION("A partial final block is padded") {
        auto [key_a, key_b] = MakeCorrelatedKeys(20, 0);
        auto result = reconciler->Reconcile(key_a, key_b, 0.0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().corrected_key_a.size() == 160);
        REQUIRE(result.Unwrap().blocks_processed == 2);
    }
    SECTION("Empty keys are rejected") {
        auto result = reconciler->Reconcile({}, {}, 0.0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
TEST_CASE("LdpcReconciler - Rate ladder fallback", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const LdpcCode half_rate = SeededCode(128, 3, 0x11);
    // Weight-one rows disclose every message bit three times over.
    const LdpcCode quarter_rate = SeededCode(64, 1, 0x22);
    auto fixed = LdpcReconciler::FromCodes(SingleRoundConfig({0.5}), {half_rate});
    auto ladder = LdpcReconciler::FromCodes(SingleRoundConfig({0.5, 0.25}), {half_rate, quarter_rate});
    REQUIRE(fixed.IsOk());
    REQUIRE(ladder.IsOk());
    const std::vector<uint8_t> key_a = MakeCorrelatedKeys(16, 0).first;
    const std::vector<uint8_t> key_b = Complement(key_a);
    SECTION("A fixed rate leaves the failed block uncorrected") {
        auto result = fixed.Unwrap()->Reconcile(key_a, key_b, 0.45);
        REQUIRE(result.IsOk());
        const auto& outcome = result.Unwrap();
        REQUIRE(outcome.failed_blocks == 1);
        REQUIRE_FALSE(outcome.converged);
        REQUIRE(outcome.remaining_errors > 0);
        REQUIRE(outcome.passes_run == 1);
        REQUIRE(outcome.blocks_processed == 1);
        REQUIRE(outcome.leaked_bits == 128);
    }
    SECTION("The ladder re-encodes the failed block at the next rate") {
        auto result = ladder.Unwrap()->Reconcile(key_a, key_b, 0.45);
        REQUIRE(result.IsOk());
        const auto& outcome = result.Unwrap();
        REQUIRE(outcome.failed_blocks == 0);
        REQUIRE(outcome.converged);
        REQUIRE(outcome.remaining_errors == 0);
        REQUIRE(outcome.errors_corrected == 128);
        REQUIRE(outcome.passes_run == 2);
        REQUIRE(outcome.blocks_processed == 3);
        REQUIRE(outcome.leaked_bits == 128 + 2 * 192);
        REQUIRE(outcome.corrected_key_b == outcome.corrected_key_a);
        REQUIRE(outcome.corrected_key_a == BitVector::FromBytes(key_a));
    }
    SECTION("Blocks that decode at the first rate never reach the fallback") {
        auto [clean_a, clean_b] = MakeCorrelatedKeys(16, 0);
        auto result = ladder.Unwrap()->Reconcile(clean_a, clean_b, 0.45);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().converged);
        REQUIRE(result.Unwrap().passes_run == 1);
        REQUIRE(result.Unwrap().leaked_bits == 128);
    }
}
TEST_CASE("LdpcReconciler - Heavily corrupted keys", "[ldpc][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto reconciler = LdpcReconciler::FromCodes(SingleRoundConfig({0.5}), {SeededCode(128, 3, 0x33)});
    REQUIRE(reconciler.IsOk());
    const std::vector<uint8_t> key_a = MakeCorrelatedKeys(32, 0).first;
    auto result = reconciler.Unwrap()->Reconcile(key_a, Complement(key_a), 0.0);
    REQUIRE(result.IsOk());
    const auto& outcome = result.Unwrap();
    REQUIRE(outcome.failed_blocks == 2);
    REQUIRE_FALSE(outcome.converged);
    REQUIRE(outcome.remaining_errors > 0);
    REQUIRE(outcome.corrected_key_a != outcome.corrected_key_b);
}
