#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <span>
#include <vector>
namespace qkdnet::protocol::security {
/// Rejects inbound messages whose signature was already seen or whose
/// timestamp (seconds since the Unix epoch) lies outside the skew window.
/// At most `capacity` signatures are remembered; the oldest is evicted first.
class MessageReplayGuard {
public:
    MessageReplayGuard(size_t capacity, std::chrono::seconds max_skew);
    MessageReplayGuard(const MessageReplayGuard&) = delete;
    MessageReplayGuard& operator=(const MessageReplayGuard&) = delete;
    MessageReplayGuard(MessageReplayGuard&&) = delete;
    MessageReplayGuard& operator=(MessageReplayGuard&&) = delete;
    ~MessageReplayGuard() = default;
    Result<Unit, ProtocolFailure> CheckAndRecord(
        std::span<const uint8_t> signature,
        int64_t timestamp,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    size_t GetTrackedCount() const;
    void Reset();
private:
    size_t capacity_;
    std::chrono::seconds max_skew_;
    std::set<std::vector<uint8_t>> seen_;
    std::deque<std::vector<uint8_t>> order_;
    mutable std::mutex lock_;
};
}
