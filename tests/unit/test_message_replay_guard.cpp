#include <catch2/catch_test_macros.hpp>
#include "qkdnet/security/message_replay_guard.hpp"
#include <atomic>
#include <chrono>
#include <limits>
#include <thread>
#include <vector>
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::security;
using namespace std::chrono_literals;
namespace {
    std::vector<uint8_t> CreateSignature(uint8_t value) {
        return std::vector<uint8_t>(32, value);
    }
    int64_t NowSeconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}
TEST_CASE("MessageReplayGuard - Basic message acceptance", "[replay_protection][security]") {
    MessageReplayGuard guard(16, 30s);
    SECTION("First message is always accepted") {
        auto result = guard.CheckAndRecord(CreateSignature(1), NowSeconds());
        REQUIRE(result.IsOk());
        REQUIRE(guard.GetTrackedCount() == 1);
    }
    SECTION("Distinct signatures are independent") {
        for (uint8_t i = 0; i < 10; ++i) {
            REQUIRE(guard.CheckAndRecord(CreateSignature(i), NowSeconds()).IsOk());
        }
        REQUIRE(guard.GetTrackedCount() == 10);
    }
}
TEST_CASE("MessageReplayGuard - Replay rejection", "[replay_protection][security]") {
    MessageReplayGuard guard(16, 30s);
    SECTION("Exact replay is rejected") {
        const auto signature = CreateSignature(7);
        REQUIRE(guard.CheckAndRecord(signature, NowSeconds()).IsOk());
        auto result = guard.CheckAndRecord(signature, NowSeconds());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::SignatureVerification);
        REQUIRE(result.UnwrapErr().message.find("Replay attack") != std::string::npos);
    }
    SECTION("Unsigned messages are rejected") {
        auto result = guard.CheckAndRecord({}, NowSeconds());
        REQUIRE(result.IsErr());
    }
    SECTION("Reset forgets seen signatures") {
        const auto signature = CreateSignature(7);
        REQUIRE(guard.CheckAndRecord(signature, NowSeconds()).IsOk());
        guard.Reset();
        REQUIRE(guard.GetTrackedCount() == 0);
        REQUIRE(guard.CheckAndRecord(signature, NowSeconds()).IsOk());
    }
}
TEST_CASE("MessageReplayGuard - Freshness window", "[replay_protection][security]") {
    MessageReplayGuard guard(16, 5s);
    const auto now = std::chrono::system_clock::now();
    const int64_t now_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    SECTION("Timestamps inside the window are accepted") {
        REQUIRE(guard.CheckAndRecord(CreateSignature(1), now_seconds - 4, now).IsOk());
        REQUIRE(guard.CheckAndRecord(CreateSignature(2), now_seconds + 4, now).IsOk());
    }
    SECTION("Stale and future timestamps are rejected") {
        REQUIRE(guard.CheckAndRecord(CreateSignature(1), now_seconds - 6, now).IsErr());
        REQUIRE(guard.CheckAndRecord(CreateSignature(2), now_seconds + 6, now).IsErr());
        REQUIRE(guard.GetTrackedCount() == 0);
    }
    SECTION("Millisecond timestamps fall far outside the window") {
        REQUIRE(guard.CheckAndRecord(CreateSignature(1), now_seconds * 1000, now).IsErr());
    }
    SECTION("Extreme timestamps are rejected without overflow") {
        auto oldest = guard.CheckAndRecord(CreateSignature(1), std::numeric_limits<int64_t>::min(), now);
        REQUIRE(oldest.IsErr());
        REQUIRE(oldest.UnwrapErr().type == ProtocolFailureType::SignatureVerification);
        REQUIRE(guard.CheckAndRecord(CreateSignature(2), std::numeric_limits<int64_t>::max(), now).IsErr());
        REQUIRE(guard.GetTrackedCount() == 0);
    }
}
TEST_CASE("MessageReplayGuard - Capacity", "[replay_protection][security]") {
    MessageReplayGuard guard(3, 30s);
    for (uint8_t i = 0; i < 4; ++i) {
        REQUIRE(guard.CheckAndRecord(CreateSignature(i), NowSeconds()).IsOk());
    }
    REQUIRE(guard.GetTrackedCount() == 3);
    SECTION("Oldest signature is evicted first") {
        REQUIRE(guard.CheckAndRecord(CreateSignature(0), NowSeconds()).IsOk());
        REQUIRE(guard.CheckAndRecord(CreateSignature(3), NowSeconds()).IsErr());
    }
}
TEST_CASE("MessageReplayGuard - Concurrent checks", "[replay_protection][security][concurrency]") {
    MessageReplayGuard guard(1024, 30s);
    const auto signature = CreateSignature(0xAB);
    std::vector<std::thread> threads;
    std::atomic<int> accepted{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (guard.CheckAndRecord(signature, NowSeconds()).IsOk()) {
                ++accepted;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(accepted.load() == 1);
}
