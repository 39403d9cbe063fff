#include "qkdnet/security/message_replay_guard.hpp"
#include "qkdnet/core/format.hpp"

namespace qkdnet::protocol::security {
    MessageReplayGuard::MessageReplayGuard(
        const size_t capacity,
        const std::chrono::seconds max_skew)
        : capacity_(capacity == 0 ? 1 : capacity)
          , max_skew_(max_skew) {
    }

    Result<Unit, ProtocolFailure> MessageReplayGuard::CheckAndRecord(
        std::span<const uint8_t> signature,
        const int64_t timestamp,
        const std::chrono::system_clock::time_point now) {
        if (signature.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignatureVerification("Replay check requires a signed message"));
        }
        const int64_t now_seconds = std::chrono::duration_cast<std::chrono::seconds>(
            now.time_since_epoch()).count();
        // Two's complement wrap keeps the magnitude exact for any pair of int64 values.
        const uint64_t skew = now_seconds >= timestamp
            ? static_cast<uint64_t>(now_seconds) - static_cast<uint64_t>(timestamp)
            : static_cast<uint64_t>(timestamp) - static_cast<uint64_t>(now_seconds);
        if (max_skew_.count() < 0 || skew > static_cast<uint64_t>(max_skew_.count())) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignatureVerification(compat::format(
                    "Message timestamp outside freshness window ({} s skew)", skew)));
        }

        std::lock_guard guard(lock_);
        std::vector<uint8_t> key(signature.begin(), signature.end());
        if (seen_.contains(key)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::SignatureVerification(
                    "Replay attack detected: message already processed"));
        }
        if (order_.size() >= capacity_) {
            seen_.erase(order_.front());
            order_.pop_front();
        }
        seen_.insert(key);
        order_.push_back(std::move(key));
        return Result<Unit, ProtocolFailure>::Ok(Unit{});
    }

    size_t MessageReplayGuard::GetTrackedCount() const {
        std::lock_guard guard(lock_);
        return order_.size();
    }

    void MessageReplayGuard::Reset() {
        std::lock_guard guard(lock_);
        seen_.clear();
        order_.clear();
    }
}
