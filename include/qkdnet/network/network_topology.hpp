#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/configuration/network_config.hpp"
#include "qkdnet/crypto/secure_memory_handle.hpp"
#include "qkdnet/enums/node_role.hpp"
#include "qkdnet/models/network_models.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace qkdnet::protocol::network {

/**
 * @brief Undirected relay graph with per-link pre-shared secrets
 *
 * Path lookups take a shared lock; mutations take an exclusive lock and clear
 * the path cache. Cached results are keyed by (source, destination, max_hops)
 * and evicted oldest first once the cache is full.
 */
class NetworkTopology {
public:
    explicit NetworkTopology(configuration::NetworkConfig config = configuration::NetworkConfig::Default());

    NetworkTopology(const NetworkTopology&) = delete;
    NetworkTopology& operator=(const NetworkTopology&) = delete;

    [[nodiscard]] Result<Unit, ProtocolFailure> AddNode(const std::string& node_id, enums::NodeRole role);

    /// latency defaults to NetworkConfig::default_link_latency. Replaces an existing link.
    [[nodiscard]] Result<Unit, ProtocolFailure> AddLink(
        const std::string& node_a,
        const std::string& node_b,
        std::span<const uint8_t> shared_secret,
        std::optional<double> latency = std::nullopt);

    [[nodiscard]] Result<Unit, ProtocolFailure> RemoveLink(const std::string& node_a, const std::string& node_b);

    /// Removes the node and every link touching it.
    [[nodiscard]] Result<Unit, ProtocolFailure> RemoveNode(const std::string& node_id);

    /**
     * @brief All simple paths of at most max_hops links, best first
     *
     * Ordered by descending trust, then ascending latency, then hop count.
     * An empty vector means the endpoints are not connected within the limit.
     *
     * @return Err(InvalidInput) if either endpoint is unknown or they are equal
     */
    [[nodiscard]] Result<std::vector<models::NetworkPath>, ProtocolFailure> FindPaths(
        const std::string& source,
        const std::string& destination,
        std::optional<size_t> max_hops = std::nullopt) const;

    /// Err(InvalidPath) unless every consecutive pair is a distinct linked pair with a secret.
    [[nodiscard]] Result<Unit, ProtocolFailure> ValidatePath(const std::vector<std::string>& path) const;

    /// Validates the path and copies the secret of every hop under a single lock.
    /// Entry i is the secret of path[i] -> path[i + 1].
    [[nodiscard]] Result<std::vector<std::vector<uint8_t>>, ProtocolFailure> ResolveLinkSecrets(
        const std::vector<std::string>& path) const;

    [[nodiscard]] Result<models::NetworkPath, ProtocolFailure> ScorePath(const std::vector<std::string>& path) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> SharedSecret(
        const std::string& node_a,
        const std::string& node_b) const;

    [[nodiscard]] Result<enums::NodeRole, ProtocolFailure> Role(const std::string& node_id) const;

    [[nodiscard]] bool HasNode(const std::string& node_id) const;
    [[nodiscard]] bool HasLink(const std::string& node_a, const std::string& node_b) const;

    [[nodiscard]] models::TopologyView GetView() const;

    [[nodiscard]] size_t CachedPathCount() const;

    [[nodiscard]] const configuration::NetworkConfig& Config() const noexcept { return config_; }

private:
    using EdgeKey = std::pair<std::string, std::string>;
    using CacheKey = std::tuple<std::string, std::string, size_t>;

    struct Link {
        crypto::SecureMemoryHandle secret;
        double latency = 0.0;
    };

    static EdgeKey MakeEdgeKey(const std::string& a, const std::string& b);

    [[nodiscard]] models::NetworkPath ScorePathLocked(const std::vector<std::string>& path) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> ValidatePathLocked(const std::vector<std::string>& path) const;
    void CollectPathsLocked(
        const std::string& current,
        const std::string& destination,
        size_t max_hops,
        std::vector<std::string>& trail,
        std::set<std::string>& visited,
        std::vector<models::NetworkPath>& out) const;
    void InvalidateCacheLocked();

    configuration::NetworkConfig config_;
    std::map<std::string, enums::NodeRole> roles_;
    std::map<std::string, std::set<std::string>> adjacency_;
    std::map<EdgeKey, Link> links_;

    mutable std::shared_mutex lock_;
    mutable std::mutex cache_lock_;
    mutable std::map<CacheKey, std::vector<models::NetworkPath>> path_cache_;
    mutable std::deque<CacheKey> cache_order_;
};

}
