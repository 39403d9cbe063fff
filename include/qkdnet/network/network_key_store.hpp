#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/models/network_models.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
namespace qkdnet::protocol::network {
/// Keys delivered to this node, by relay session id. Bounded; the oldest entry is evicted first.
class NetworkKeyStore {
public:
    explicit NetworkKeyStore(size_t capacity);
    NetworkKeyStore(const NetworkKeyStore&) = delete;
    NetworkKeyStore& operator=(const NetworkKeyStore&) = delete;
    ~NetworkKeyStore();
    [[nodiscard]] Result<Unit, ProtocolFailure> Store(models::NetworkKey key);
    /// Nothing for an unknown or expired key. Expired keys are removed.
    [[nodiscard]] std::optional<models::NetworkKey> GetKey(
        const std::string& session_id,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    size_t PurgeExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
    [[nodiscard]] size_t Size() const;
private:
    void EraseLocked(const std::string& session_id);
    size_t capacity_;
    std::map<std::string, models::NetworkKey> keys_;
    std::deque<std::string> order_;
    mutable std::mutex lock_;
};
}
