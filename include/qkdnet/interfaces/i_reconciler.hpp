#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/enums/reconciliation_method.hpp"
#include "qkdnet/models/reconciliation_result.hpp"
#include <cstdint>
#include <span>
namespace qkdnet::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
/**
 * @brief Error reconciliation engine
 *
 * key_a is the reference side. Keys are byte buffers unpacked least-significant
 * bit first; keys of different length are truncated to the shorter one.
 * error_rate is the estimate from error detection and may be zero.
 */
class IReconciler {
public:
    virtual ~IReconciler() = default;
    [[nodiscard]] virtual Result<models::ReconciliationResult, ProtocolFailure> Reconcile(
        std::span<const uint8_t> key_a,
        std::span<const uint8_t> key_b,
        double error_rate) = 0;
    [[nodiscard]] virtual enums::ReconciliationMethod Method() const noexcept = 0;
};
}
