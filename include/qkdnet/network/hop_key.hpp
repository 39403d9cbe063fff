#pragma once
#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace qkdnet::protocol::network {
/// Per-hop masking keys derived from a link secret with HKDF-SHA-256.
class HopKey {
public:
    /// Same secret and context always give the same key. Context binds the key to one hop of one relay.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> DeriveHopKey(
        std::span<const uint8_t> link_secret,
        std::string_view context,
        size_t length);

    /// Stretch or shrink a key obtained from a nested session to the required length.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> FitToLength(
        std::span<const uint8_t> session_key,
        std::string_view context,
        size_t length);

    [[nodiscard]] static std::string BuildContext(
        std::string_view session_id,
        size_t hop_index,
        std::string_view from,
        std::string_view to);
private:
    HopKey() = delete;
};
}
