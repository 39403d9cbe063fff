#include <catch2/catch_test_macros.hpp>
#include "qkdnet/reconciliation/cascade_reconciler.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "../helpers/raw_key_sources.hpp"
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol::reconciliation;
using namespace qkdnet::protocol::test_helpers;
TEST_CASE("CascadeReconciler - Block schedule", "[cascade][reconciliation]") {
    REQUIRE(CascadeReconciler::BlockSizeForPass(8, 1) == 8);
    REQUIRE(CascadeReconciler::BlockSizeForPass(8, 2) == 4);
    REQUIRE(CascadeReconciler::BlockSizeForPass(8, 4) == 1);
    REQUIRE(CascadeReconciler::BlockSizeForPass(8, 9) == 1);
    REQUIRE(CascadeReconciler::BlockSizeForPass(8, 200) == 1);
}
TEST_CASE("CascadeReconciler - Correcting 256-bit keys", "[cascade][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    CascadeReconciler reconciler;
    SECTION("Three flipped bits are all corrected") {
        auto [key_a, key_b] = MakeCorrelatedKeys(32, 3);
        auto result = reconciler.Reconcile(key_a, key_b, 3.0 / 256.0);
        REQUIRE(result.IsOk());
        const auto& outcome = result.Unwrap();
        REQUIRE(outcome.converged);
        REQUIRE(outcome.errors_corrected == 3);
        REQUIRE(outcome.remaining_errors == 0);
        REQUIRE(outcome.corrected_key_b == outcome.corrected_key_a);
        REQUIRE(BitVector::ToBytes(outcome.corrected_key_a) == key_a);
        REQUIRE(outcome.method == enums::ReconciliationMethod::Cascade);
        REQUIRE(outcome.leaked_bits > 0);
    }
    SECTION("Identical keys need no correction") {
        auto [key_a, key_b] = MakeCorrelatedKeys(32, 0);
        auto result = reconciler.Reconcile(key_a, key_b, 0.0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().converged);
        REQUIRE(result.Unwrap().errors_corrected == 0);
    }
    SECTION("Dense errors still converge through the single-bit pass") {
        auto [key_a, key_b] = MakeCorrelatedKeys(32, 40);
        auto result = reconciler.Reconcile(key_a, key_b, 40.0 / 256.0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().converged);
        REQUIRE(result.Unwrap().errors_corrected == 40);
    }
}
TEST_CASE("CascadeReconciler - Input handling", "[cascade][reconciliation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Empty keys are rejected") {
        CascadeReconciler reconciler;
        auto result = reconciler.Reconcile({}, {}, 0.0);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Keys of different length are truncated") {
        CascadeReconciler reconciler;
        auto [key_a, key_b] = MakeCorrelatedKeys(16, 2);
        key_b.push_back(0xFF);
        auto result = reconciler.Reconcile(key_a, key_b, 0.0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().corrected_key_b.size() == 128);
        REQUIRE(result.Unwrap().converged);
    }
    SECTION("Invalid configuration is reported") {
        CascadeReconciler reconciler(configuration::CascadeConfig{0, 4, 1});
        auto result = reconciler.ReconcileBits(Bits{1, 0}, Bits{1, 1});
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Large first blocks stop early once single-bit blocks are clean") {
        CascadeReconciler reconciler(configuration::CascadeConfig::LowNoise());
        auto [key_a, key_b] = MakeCorrelatedKeys(64, 2);
        auto result = reconciler.Reconcile(key_a, key_b, 0.0);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().converged);
        REQUIRE(result.Unwrap().passes_run <= 7);
    }
}
