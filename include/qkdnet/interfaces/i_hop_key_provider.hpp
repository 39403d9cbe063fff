#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace qkdnet::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
/**
 * @brief Source of fresh per-hop keys, typically a nested two-party session
 *
 * An Err makes the relay fall back to a key derived from the link secret.
 */
class IHopKeyProvider {
public:
    virtual ~IHopKeyProvider() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> ProvideHopKey(
        const std::string& from,
        const std::string& to,
        std::span<const uint8_t> link_secret) = 0;
};
}
