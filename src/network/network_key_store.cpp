#include "qkdnet/network/network_key_store.hpp"
#include <sodium.h>
#include <algorithm>

namespace qkdnet::protocol::network {
    namespace {
        void WipeKey(models::NetworkKey& key) noexcept {
            if (!key.key_bytes.empty()) {
                sodium_memzero(key.key_bytes.data(), key.key_bytes.size());
            }
        }
    }

    NetworkKeyStore::NetworkKeyStore(const size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {
    }

    NetworkKeyStore::~NetworkKeyStore() {
        std::lock_guard guard(lock_);
        for (auto& [session_id, key] : keys_) {
            WipeKey(key);
        }
    }

    Result<Unit, ProtocolFailure> NetworkKeyStore::Store(models::NetworkKey key) {
        if (key.session_id.empty() || key.key_bytes.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Network key needs a session id and key bytes"));
        }
        std::lock_guard guard(lock_);
        if (keys_.contains(key.session_id)) {
            EraseLocked(key.session_id);
        }
        while (order_.size() >= capacity_) {
            const std::string oldest = order_.front();
            EraseLocked(oldest);
        }
        order_.push_back(key.session_id);
        keys_.emplace(key.session_id, std::move(key));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    std::optional<models::NetworkKey> NetworkKeyStore::GetKey(
        const std::string& session_id,
        const std::chrono::system_clock::time_point now) {
        std::lock_guard guard(lock_);
        const auto it = keys_.find(session_id);
        if (it == keys_.end()) {
            return std::nullopt;
        }
        if (it->second.IsExpired(now)) {
            EraseLocked(session_id);
            return std::nullopt;
        }
        return it->second;
    }

    size_t NetworkKeyStore::PurgeExpired(const std::chrono::system_clock::time_point now) {
        std::lock_guard guard(lock_);
        std::vector<std::string> expired;
        for (const auto& [session_id, key] : keys_) {
            if (key.IsExpired(now)) {
                expired.push_back(session_id);
            }
        }
        for (const std::string& session_id : expired) {
            EraseLocked(session_id);
        }
        return expired.size();
    }

    size_t NetworkKeyStore::Size() const {
        std::lock_guard guard(lock_);
        return keys_.size();
    }

    void NetworkKeyStore::EraseLocked(const std::string& session_id) {
        if (const auto it = keys_.find(session_id); it != keys_.end()) {
            WipeKey(it->second);
            keys_.erase(it);
        }
        order_.erase(std::remove(order_.begin(), order_.end(), session_id), order_.end());
    }
}
