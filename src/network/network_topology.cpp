#include "qkdnet/network/network_topology.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"

#include <algorithm>
#include <cmath>
#include <queue>

#include <sodium.h>

namespace qkdnet::protocol::network {
    using crypto::SecureMemoryHandle;
    using models::NetworkPath;

    NetworkTopology::NetworkTopology(configuration::NetworkConfig config)
        : config_(config) {
    }

    NetworkTopology::EdgeKey NetworkTopology::MakeEdgeKey(const std::string& a, const std::string& b) {
        return a < b ? EdgeKey{a, b} : EdgeKey{b, a};
    }

    Result<Unit, ProtocolFailure> NetworkTopology::AddNode(const std::string& node_id, const enums::NodeRole role) {
        if (node_id.empty()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput("Node id must not be empty"));
        }
        std::unique_lock guard(lock_);
        if (roles_.contains(node_id)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Node '{}' already exists", node_id)));
        }
        roles_.emplace(node_id, role);
        adjacency_.emplace(node_id, std::set<std::string>{});
        InvalidateCacheLocked();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> NetworkTopology::AddLink(
        const std::string& node_a,
        const std::string& node_b,
        std::span<const uint8_t> shared_secret,
        const std::optional<double> latency) {
        if (node_a == node_b) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Cannot link node '{}' to itself", node_a)));
        }
        if (shared_secret.empty()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "Link shared secret must not be empty"));
        }
        const double link_latency = latency.value_or(config_.default_link_latency);
        if (!std::isfinite(link_latency) || link_latency < 0.0) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Link latency must be finite and non-negative, got {}", link_latency)));
        }
        auto secret = SecureMemoryHandle::FromBytes(shared_secret);
        if (secret.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::FromSodiumFailure(secret.UnwrapErr()));
        }

        std::unique_lock guard(lock_);
        if (!roles_.contains(node_a) || !roles_.contains(node_b)) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Cannot link unknown nodes '{}' and '{}'", node_a, node_b)));
        }
        links_.insert_or_assign(MakeEdgeKey(node_a, node_b), Link{std::move(secret).Unwrap(), link_latency});
        adjacency_[node_a].insert(node_b);
        adjacency_[node_b].insert(node_a);
        InvalidateCacheLocked();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> NetworkTopology::RemoveLink(const std::string& node_a, const std::string& node_b) {
        std::unique_lock guard(lock_);
        if (links_.erase(MakeEdgeKey(node_a, node_b)) == 0) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("No link between '{}' and '{}'", node_a, node_b)));
        }
        adjacency_[node_a].erase(node_b);
        adjacency_[node_b].erase(node_a);
        InvalidateCacheLocked();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> NetworkTopology::RemoveNode(const std::string& node_id) {
        std::unique_lock guard(lock_);
        const auto adjacency_it = adjacency_.find(node_id);
        if (adjacency_it == adjacency_.end()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Unknown node '{}'", node_id)));
        }
        for (const std::string& neighbor : adjacency_it->second) {
            links_.erase(MakeEdgeKey(node_id, neighbor));
            adjacency_[neighbor].erase(node_id);
        }
        adjacency_.erase(adjacency_it);
        roles_.erase(node_id);
        InvalidateCacheLocked();
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<NetworkPath>, ProtocolFailure> NetworkTopology::FindPaths(
        const std::string& source,
        const std::string& destination,
        const std::optional<size_t> max_hops) const {
        const size_t hop_limit = max_hops.value_or(config_.max_hops);
        std::shared_lock guard(lock_);
        if (!roles_.contains(source) || !roles_.contains(destination)) {
            return Result<std::vector<NetworkPath>, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Unknown endpoint in path query '{}' -> '{}'", source, destination)));
        }
        if (source == destination) {
            return Result<std::vector<NetworkPath>, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "Source and destination must differ"));
        }

        const CacheKey cache_key{source, destination, hop_limit};
        {
            std::lock_guard cache_guard(cache_lock_);
            if (const auto it = path_cache_.find(cache_key); it != path_cache_.end()) {
                return Result<std::vector<NetworkPath>, ProtocolFailure>::Ok(it->second);
            }
        }

        std::vector<NetworkPath> paths;
        std::vector<std::string> trail{source};
        std::set<std::string> visited{source};
        CollectPathsLocked(source, destination, hop_limit, trail, visited, paths);
        std::stable_sort(paths.begin(), paths.end(), [](const NetworkPath& lhs, const NetworkPath& rhs) {
            if (lhs.trust_score != rhs.trust_score) {
                return lhs.trust_score > rhs.trust_score;
            }
            if (lhs.latency_estimate != rhs.latency_estimate) {
                return lhs.latency_estimate < rhs.latency_estimate;
            }
            return lhs.hop_count < rhs.hop_count;
        });

        {
            std::lock_guard cache_guard(cache_lock_);
            if (!path_cache_.contains(cache_key)) {
                if (cache_order_.size() >= std::max<size_t>(config_.path_cache_capacity, 1)) {
                    path_cache_.erase(cache_order_.front());
                    cache_order_.pop_front();
                }
                path_cache_.emplace(cache_key, paths);
                cache_order_.push_back(cache_key);
            }
        }
        return Result<std::vector<NetworkPath>, ProtocolFailure>::Ok(std::move(paths));
    }

    void NetworkTopology::CollectPathsLocked(
        const std::string& current,
        const std::string& destination,
        const size_t max_hops,
        std::vector<std::string>& trail,
        std::set<std::string>& visited,
        std::vector<NetworkPath>& out) const {
        if (current == destination) {
            out.push_back(ScorePathLocked(trail));
            return;
        }
        if (trail.size() - 1 >= max_hops) {
            return;
        }
        const auto it = adjacency_.find(current);
        if (it == adjacency_.end()) {
            return;
        }
        for (const std::string& neighbor : it->second) {
            if (visited.contains(neighbor)) {
                continue;
            }
            visited.insert(neighbor);
            trail.push_back(neighbor);
            CollectPathsLocked(neighbor, destination, max_hops, trail, visited, out);
            trail.pop_back();
            visited.erase(neighbor);
        }
    }

    NetworkPath NetworkTopology::ScorePathLocked(const std::vector<std::string>& path) const {
        NetworkPath scored;
        scored.node_sequence = path;
        scored.hop_count = path.empty() ? 0 : path.size() - 1;
        scored.trust_score = NetworkConstants::DIRECT_PATH_TRUST;
        for (size_t i = 1; i + 1 < path.size(); ++i) {
            const auto role = roles_.find(path[i]);
            scored.trust_score *= (role != roles_.end() && role->second == enums::NodeRole::TrustedRelay)
                ? NetworkConstants::TRUSTED_RELAY_TRUST_FACTOR
                : NetworkConstants::RELAY_TRUST_FACTOR;
        }
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            const auto link = links_.find(MakeEdgeKey(path[i], path[i + 1]));
            scored.latency_estimate += link != links_.end() ? link->second.latency : config_.default_link_latency;
        }
        return scored;
    }

    Result<Unit, ProtocolFailure> NetworkTopology::ValidatePathLocked(const std::vector<std::string>& path) const {
        if (path.size() < 2) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                "A relay path needs at least two nodes"));
        }
        std::set<std::string> seen;
        for (size_t i = 0; i < path.size(); ++i) {
            if (!roles_.contains(path[i])) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                    compat::format("Path node '{}' is not part of the topology", path[i])));
            }
            if (!seen.insert(path[i]).second) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                    compat::format("Path visits node '{}' twice", path[i])));
            }
            if (i == 0) {
                continue;
            }
            const auto link = links_.find(MakeEdgeKey(path[i - 1], path[i]));
            if (link == links_.end() || link->second.secret.IsInvalid()) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                    compat::format("No secret-keyed link between '{}' and '{}'", path[i - 1], path[i])));
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<Unit, ProtocolFailure> NetworkTopology::ValidatePath(const std::vector<std::string>& path) const {
        std::shared_lock guard(lock_);
        return ValidatePathLocked(path);
    }

    Result<std::vector<std::vector<uint8_t>>, ProtocolFailure> NetworkTopology::ResolveLinkSecrets(
        const std::vector<std::string>& path) const {
        using R = Result<std::vector<std::vector<uint8_t>>, ProtocolFailure>;
        std::shared_lock guard(lock_);
        if (auto valid = ValidatePathLocked(path); valid.IsErr()) {
            return R::Err(std::move(valid).UnwrapErr());
        }
        std::vector<std::vector<uint8_t>> secrets;
        secrets.reserve(path.size() - 1);
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            const Link& link = links_.at(MakeEdgeKey(path[i], path[i + 1]));
            auto secret = link.secret.ReadBytes(link.secret.Size());
            if (secret.IsErr()) {
                for (auto& copied : secrets) {
                    sodium_memzero(copied.data(), copied.size());
                }
                return R::Err(ProtocolFailure::FromSodiumFailure(secret.UnwrapErr()));
            }
            secrets.push_back(std::move(secret).Unwrap());
        }
        return R::Ok(std::move(secrets));
    }

    Result<NetworkPath, ProtocolFailure> NetworkTopology::ScorePath(const std::vector<std::string>& path) const {
        std::shared_lock guard(lock_);
        if (auto valid = ValidatePathLocked(path); valid.IsErr()) {
            return Result<NetworkPath, ProtocolFailure>::Err(std::move(valid).UnwrapErr());
        }
        return Result<NetworkPath, ProtocolFailure>::Ok(ScorePathLocked(path));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> NetworkTopology::SharedSecret(
        const std::string& node_a,
        const std::string& node_b) const {
        std::shared_lock guard(lock_);
        const auto link = links_.find(MakeEdgeKey(node_a, node_b));
        if (link == links_.end()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                compat::format("No link between '{}' and '{}'", node_a, node_b)));
        }
        auto secret = link->second.secret.ReadBytes(link->second.secret.Size());
        if (secret.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(secret.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(secret).Unwrap());
    }

    Result<enums::NodeRole, ProtocolFailure> NetworkTopology::Role(const std::string& node_id) const {
        std::shared_lock guard(lock_);
        const auto it = roles_.find(node_id);
        if (it == roles_.end()) {
            return Result<enums::NodeRole, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Unknown node '{}'", node_id)));
        }
        return Result<enums::NodeRole, ProtocolFailure>::Ok(it->second);
    }

    bool NetworkTopology::HasNode(const std::string& node_id) const {
        std::shared_lock guard(lock_);
        return roles_.contains(node_id);
    }

    bool NetworkTopology::HasLink(const std::string& node_a, const std::string& node_b) const {
        std::shared_lock guard(lock_);
        return links_.contains(MakeEdgeKey(node_a, node_b));
    }

    models::TopologyView NetworkTopology::GetView() const {
        std::shared_lock guard(lock_);
        models::TopologyView view;
        for (const auto& [node_id, role] : roles_) {
            const auto& neighbors = adjacency_.at(node_id);
            view.nodes.push_back(models::NodeView{
                node_id, role, std::vector<std::string>(neighbors.begin(), neighbors.end())});
        }
        for (const auto& [edge, link] : links_) {
            view.edges.push_back(models::EdgeView{edge.first, edge.second, link.latency});
        }

        if (!roles_.empty()) {
            std::set<std::string> reached{roles_.begin()->first};
            std::queue<std::string> frontier;
            frontier.push(roles_.begin()->first);
            while (!frontier.empty()) {
                const std::string current = frontier.front();
                frontier.pop();
                for (const std::string& neighbor : adjacency_.at(current)) {
                    if (reached.insert(neighbor).second) {
                        frontier.push(neighbor);
                    }
                }
            }
            view.connected = reached.size() == roles_.size();
        }
        return view;
    }

    size_t NetworkTopology::CachedPathCount() const {
        std::lock_guard cache_guard(cache_lock_);
        return path_cache_.size();
    }

    void NetworkTopology::InvalidateCacheLocked() {
        std::lock_guard cache_guard(cache_lock_);
        path_cache_.clear();
        cache_order_.clear();
    }
}
