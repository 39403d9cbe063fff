#pragma once

#include "qkdnet/enums/node_role.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qkdnet::protocol::models {

struct NetworkPath {
    std::vector<std::string> node_sequence;
    size_t hop_count = 0;
    double trust_score = 0.0;
    double latency_estimate = 0.0;
};

/**
 * @brief Key delivered to a destination by the relay layer
 *
 * Expired once now - created_at exceeds ttl.
 */
struct NetworkKey {
    std::vector<uint8_t> key_bytes;
    std::string session_id;
    std::string source;
    std::string destination;
    std::vector<std::string> path_used;
    std::chrono::system_clock::time_point created_at;
    std::chrono::seconds ttl{0};

    [[nodiscard]] bool IsExpired(std::chrono::system_clock::time_point now) const noexcept {
        return now - created_at > ttl;
    }
};

/// What an observer on one hop sees: the masked key in transit.
struct HopRecord {
    std::string from;
    std::string to;
    std::vector<uint8_t> masked_key;
    bool hop_key_from_session = false;
};

struct RelayOutcome {
    NetworkKey network_key;
    std::vector<HopRecord> hop_records;
};

struct NodeView {
    std::string node_id;
    enums::NodeRole role = enums::NodeRole::Relay;
    std::vector<std::string> neighbor_ids;
};

struct EdgeView {
    std::string node_a;
    std::string node_b;
    double latency = 0.0;
};

/// Read-only snapshot of a topology. Secrets are not part of the view.
struct TopologyView {
    std::vector<NodeView> nodes;
    std::vector<EdgeView> edges;
    bool connected = false;
};

} // namespace qkdnet::protocol::models
