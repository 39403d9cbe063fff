#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "qkdnet/network/network_topology.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include <algorithm>
#include <vector>
using namespace qkdnet::protocol;
using namespace qkdnet::protocol::crypto;
using namespace qkdnet::protocol::network;
using enums::NodeRole;
namespace {
    const std::vector<uint8_t> kLinkSecret(32, 0x33);

    /// A - R - B and A - T - B, plus A - X - Y - B
    void BuildDiamond(NetworkTopology& topology) {
        REQUIRE(topology.AddNode("A", NodeRole::Source).IsOk());
        REQUIRE(topology.AddNode("B", NodeRole::Destination).IsOk());
        REQUIRE(topology.AddNode("R", NodeRole::Relay).IsOk());
        REQUIRE(topology.AddNode("T", NodeRole::TrustedRelay).IsOk());
        REQUIRE(topology.AddNode("X", NodeRole::TrustedRelay).IsOk());
        REQUIRE(topology.AddNode("Y", NodeRole::TrustedRelay).IsOk());
        REQUIRE(topology.AddLink("A", "R", kLinkSecret).IsOk());
        REQUIRE(topology.AddLink("R", "B", kLinkSecret).IsOk());
        REQUIRE(topology.AddLink("A", "T", kLinkSecret, 5.0).IsOk());
        REQUIRE(topology.AddLink("T", "B", kLinkSecret, 5.0).IsOk());
        REQUIRE(topology.AddLink("A", "X", kLinkSecret).IsOk());
        REQUIRE(topology.AddLink("X", "Y", kLinkSecret).IsOk());
        REQUIRE(topology.AddLink("Y", "B", kLinkSecret).IsOk());
    }
}
TEST_CASE("NetworkTopology - Building the graph", "[network][topology]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    NetworkTopology topology;
    REQUIRE(topology.AddNode("A", NodeRole::Source).IsOk());
    REQUIRE(topology.AddNode("B", NodeRole::Destination).IsOk());
    SECTION("Duplicate and empty node ids are rejected") {
        REQUIRE(topology.AddNode("A", NodeRole::Relay).IsErr());
        REQUIRE(topology.AddNode("", NodeRole::Relay).IsErr());
    }
    SECTION("Links need known, distinct endpoints and a secret") {
        REQUIRE(topology.AddLink("A", "A", kLinkSecret).IsErr());
        REQUIRE(topology.AddLink("A", "Z", kLinkSecret).IsErr());
        REQUIRE(topology.AddLink("A", "B", {}).IsErr());
        REQUIRE(topology.AddLink("A", "B", kLinkSecret, -1.0).IsErr());
        REQUIRE(topology.AddLink("A", "B", kLinkSecret).IsOk());
        REQUIRE(topology.HasLink("B", "A"));
    }
    SECTION("Link secrets are readable from either end") {
        REQUIRE(topology.AddLink("A", "B", kLinkSecret).IsOk());
        REQUIRE(topology.SharedSecret("B", "A").Unwrap() == kLinkSecret);
        REQUIRE(topology.Role("B").Unwrap() == NodeRole::Destination);
    }
    SECTION("Removing a node removes its links") {
        REQUIRE(topology.AddLink("A", "B", kLinkSecret).IsOk());
        REQUIRE(topology.RemoveNode("B").IsOk());
        REQUIRE_FALSE(topology.HasNode("B"));
        REQUIRE_FALSE(topology.HasLink("A", "B"));
        REQUIRE(topology.SharedSecret("A", "B").IsErr());
        REQUIRE(topology.RemoveNode("B").IsErr());
    }
    SECTION("View reports connectivity without secrets") {
        REQUIRE_FALSE(topology.GetView().connected);
        REQUIRE(topology.AddLink("A", "B", kLinkSecret, 2.5).IsOk());
        const auto view = topology.GetView();
        REQUIRE(view.connected);
        REQUIRE(view.nodes.size() == 2);
        REQUIRE(view.edges.size() == 1);
        REQUIRE(view.edges.front().latency == Catch::Approx(2.5));
    }
}
TEST_CASE("NetworkTopology - Path discovery", "[network][topology]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    NetworkTopology topology;
    BuildDiamond(topology);
    SECTION("Paths are ordered by trust, then latency") {
        auto result = topology.FindPaths("A", "B");
        REQUIRE(result.IsOk());
        const auto& paths = result.Unwrap();
        REQUIRE(paths.size() == 3);
        REQUIRE(paths[0].node_sequence == std::vector<std::string>{"A", "T", "B"});
        REQUIRE(paths[0].trust_score == Catch::Approx(0.9));
        REQUIRE(paths[0].latency_estimate == Catch::Approx(10.0));
        REQUIRE(paths[1].node_sequence == std::vector<std::string>{"A", "X", "Y", "B"});
        REQUIRE(paths[1].trust_score == Catch::Approx(0.81));
        REQUIRE(paths[1].hop_count == 3);
        REQUIRE(paths[2].node_sequence == std::vector<std::string>{"A", "R", "B"});
        REQUIRE(paths[2].trust_score == Catch::Approx(0.7));
    }
    SECTION("Hop limit prunes longer paths") {
        auto result = topology.FindPaths("A", "B", 2);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == 2);
        REQUIRE(std::all_of(result.Unwrap().begin(), result.Unwrap().end(),
            [](const auto& path) { return path.hop_count <= 2; }));
    }
    SECTION("A direct edge outranks every relayed path") {
        REQUIRE(topology.AddLink("A", "B", kLinkSecret).IsOk());
        auto result = topology.FindPaths("A", "B");
        REQUIRE(result.IsOk());
        const auto& paths = result.Unwrap();
        REQUIRE(paths.size() == 4);
        REQUIRE(paths.front().node_sequence == std::vector<std::string>{"A", "B"});
        REQUIRE(paths.front().trust_score == Catch::Approx(1.0));
        for (const auto& path : paths) {
            REQUIRE(paths.front().trust_score >= path.trust_score);
        }
    }
    SECTION("Disconnected endpoints yield no path") {
        REQUIRE(topology.AddNode("Z", NodeRole::Destination).IsOk());
        auto result = topology.FindPaths("A", "Z");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().empty());
    }
    SECTION("Unknown or equal endpoints are rejected") {
        REQUIRE(topology.FindPaths("A", "Q").IsErr());
        REQUIRE(topology.FindPaths("A", "A").IsErr());
    }
    SECTION("Results are cached until the graph changes") {
        REQUIRE(topology.FindPaths("A", "B").IsOk());
        REQUIRE(topology.FindPaths("A", "B").IsOk());
        REQUIRE(topology.CachedPathCount() == 1);
        REQUIRE(topology.FindPaths("A", "B", 2).IsOk());
        REQUIRE(topology.CachedPathCount() == 2);
        REQUIRE(topology.RemoveLink("A", "T").IsOk());
        REQUIRE(topology.CachedPathCount() == 0);
        auto result = topology.FindPaths("A", "B");
        REQUIRE(result.Unwrap().size() == 2);
        REQUIRE(result.Unwrap().front().node_sequence.front() == "A");
        REQUIRE(result.Unwrap().front().node_sequence[1] == "X");
    }
}
TEST_CASE("NetworkTopology - Path validation", "[network][topology]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    NetworkTopology topology;
    BuildDiamond(topology);
    SECTION("Linked chain is valid and scored") {
        REQUIRE(topology.ValidatePath({"A", "R", "B"}).IsOk());
        auto scored = topology.ScorePath({"A", "R", "B"});
        REQUIRE(scored.IsOk());
        REQUIRE(scored.Unwrap().hop_count == 2);
    }
    SECTION("Missing links and short paths are invalid") {
        auto missing = topology.ValidatePath({"A", "B"});
        REQUIRE(missing.IsErr());
        REQUIRE(missing.UnwrapErr().type == ProtocolFailureType::InvalidPath);
        REQUIRE(topology.ValidatePath({"A"}).IsErr());
        REQUIRE(topology.ValidatePath({"A", "R", "A", "R", "B"}).IsErr());
    }
}
