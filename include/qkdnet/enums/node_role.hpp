#pragma once
#include <cstdint>
namespace qkdnet::protocol::enums {
/// Role of a node in the relay topology. Only relay roles affect path trust.
enum class NodeRole : uint8_t {
    Source = 0,
    Destination = 1,
    Relay = 2,
    TrustedRelay = 3
};
inline const char* ToString(NodeRole role) {
    switch (role) {
        case NodeRole::Source:
            return "Source";
        case NodeRole::Destination:
            return "Destination";
        case NodeRole::Relay:
            return "Relay";
        case NodeRole::TrustedRelay:
            return "TrustedRelay";
        default:
            return "UNKNOWN";
    }
}
}
