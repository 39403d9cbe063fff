#pragma once
#include "qkdnet/core/constants.hpp"
#include <chrono>
#include <cstddef>
namespace qkdnet::protocol::configuration {
struct NetworkConfig {
    size_t max_hops = NetworkConstants::DEFAULT_MAX_HOPS;
    std::chrono::seconds key_ttl = NetworkConstants::DEFAULT_KEY_TTL;
    size_t path_cache_capacity = NetworkConstants::DEFAULT_PATH_CACHE_CAPACITY;
    size_t key_store_capacity = NetworkConstants::DEFAULT_KEY_STORE_CAPACITY;
    double default_link_latency = NetworkConstants::DEFAULT_LINK_LATENCY;

    [[nodiscard]] static NetworkConfig Default() noexcept {
        return NetworkConfig{};
    }
};
}
