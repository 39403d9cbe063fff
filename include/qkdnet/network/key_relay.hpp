#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/interfaces/i_hop_key_provider.hpp"
#include "qkdnet/models/network_models.hpp"
#include "qkdnet/network/network_key_store.hpp"
#include "qkdnet/network/network_topology.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace qkdnet::protocol::network {

/**
 * @brief Node-local service that carries a key across a chain of links
 *
 * Every hop masks the key with a fresh hop key (XOR), hands the masked value to
 * the next node and unmasks it there. Hop keys come from the IHopKeyProvider
 * when one is set and succeeds, otherwise they are derived from the link secret.
 * Each hop only ever observes the masked value.
 */
class KeyRelay {
public:
    KeyRelay(
        std::shared_ptr<NetworkTopology> topology,
        std::shared_ptr<interfaces::IHopKeyProvider> hop_key_provider = nullptr);

    /**
     * @brief Relay key from source to destination and store it there
     *
     * @param path explicit route; the best path from FindPaths when absent
     * @param session_id relay session id; 16 hex characters are generated when absent
     * @param ttl lifetime of the delivered key; NetworkConfig::key_ttl when absent
     *
     * @return Err(InvalidInput) for unknown endpoints or an empty key,
     *         Err(NoPath) when no route exists,
     *         Err(InvalidPath) when a hop lacks a link or secret; every hop secret is
     *         resolved in one step before any hop runs, so later topology changes
     *         cannot interrupt a relay in progress
     */
    [[nodiscard]] Result<models::RelayOutcome, ProtocolFailure> DistributeKey(
        const std::string& source,
        const std::string& destination,
        std::span<const uint8_t> key,
        std::optional<std::vector<std::string>> path = std::nullopt,
        std::optional<std::string> session_id = std::nullopt,
        std::optional<std::chrono::seconds> ttl = std::nullopt);

    [[nodiscard]] std::optional<models::NetworkKey> GetKey(const std::string& session_id);

    [[nodiscard]] NetworkTopology& Topology() noexcept { return *topology_; }
    [[nodiscard]] NetworkKeyStore& KeyStore() noexcept { return key_store_; }

private:
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> HopKeyFor(
        const std::string& from,
        const std::string& to,
        std::span<const uint8_t> link_secret,
        const std::string& context,
        size_t length,
        bool& from_session);

    std::shared_ptr<NetworkTopology> topology_;
    std::shared_ptr<interfaces::IHopKeyProvider> hop_key_provider_;
    NetworkKeyStore key_store_;
};

}
