/**
 * @file relay_network_example.cpp
 * @brief Builds a small trusted-node network and relays a key across it
 */

#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/network/key_relay.hpp"
#include "qkdnet/network/network_topology.hpp"

#include <iomanip>
#include <iostream>
#include <memory>

using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol::network;
using enums::NodeRole;

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== qkdnet - Relay Network Example ===" << std::endl;
    std::cout << std::endl;

    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }

    std::cout << "1. Building topology Alice - R1 - R2 - Bob, Alice - T - Bob..." << std::endl;
    auto topology = std::make_shared<NetworkTopology>();
    const std::vector<std::pair<std::string, NodeRole>> nodes = {
        {"alice", NodeRole::Source},
        {"r1", NodeRole::Relay},
        {"r2", NodeRole::Relay},
        {"t", NodeRole::TrustedRelay},
        {"bob", NodeRole::Destination},
    };
    for (const auto& [id, role] : nodes) {
        if (auto added = topology->AddNode(id, role); added.IsErr()) {
            std::cerr << "Failed to add node: " << added.UnwrapErr().message << std::endl;
            return 1;
        }
    }
    const std::vector<std::pair<std::string, std::string>> links = {
        {"alice", "r1"}, {"r1", "r2"}, {"r2", "bob"}, {"alice", "t"}, {"t", "bob"},
    };
    for (const auto& [a, b] : links) {
        if (auto linked = topology->AddLink(a, b, SodiumInterop::GetRandomBytes(32)); linked.IsErr()) {
            std::cerr << "Failed to add link: " << linked.UnwrapErr().message << std::endl;
            return 1;
        }
    }
    std::cout << std::endl;

    std::cout << "2. Ranking paths..." << std::endl;
    auto paths = topology->FindPaths("alice", "bob");
    if (paths.IsErr()) {
        std::cerr << "Path search failed: " << paths.UnwrapErr().message << std::endl;
        return 1;
    }
    for (const auto& path : paths.Unwrap()) {
        std::cout << "   ";
        for (size_t i = 0; i < path.node_sequence.size(); ++i) {
            std::cout << (i ? " -> " : "") << path.node_sequence[i];
        }
        std::cout << "  trust=" << path.trust_score
                  << " latency=" << path.latency_estimate << std::endl;
    }
    std::cout << std::endl;

    std::cout << "3. Relaying a 32-byte key..." << std::endl;
    KeyRelay relay(topology);
    const auto key = SodiumInterop::GetRandomBytes(32);
    print_hex("   Sent", key);

    auto relayed = relay.DistributeKey("alice", "bob", key);
    if (relayed.IsErr()) {
        std::cerr << "Relay failed: " << relayed.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto outcome = std::move(relayed).Unwrap();
    for (const auto& hop : outcome.hop_records) {
        print_hex("   " + hop.from + " -> " + hop.to + " sees", hop.masked_key);
    }
    print_hex("   Delivered", outcome.network_key.key_bytes);
    std::cout << "   Session id: " << outcome.network_key.session_id << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed ===" << std::endl;
    return outcome.network_key.key_bytes == key ? 0 : 1;
}
