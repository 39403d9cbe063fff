#include "qkdnet/network/hop_key.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"
#include "qkdnet/crypto/hkdf.hpp"

namespace qkdnet::protocol::network {
    using crypto::Hkdf;

    namespace {
        std::vector<uint8_t> InfoBytes(std::string_view context) {
            std::vector<uint8_t> info(
                ProtocolConstants::HOP_KEY_INFO.begin(),
                ProtocolConstants::HOP_KEY_INFO.end());
            info.push_back(':');
            info.insert(info.end(), context.begin(), context.end());
            return info;
        }
    }

    Result<std::vector<uint8_t>, ProtocolFailure> HopKey::DeriveHopKey(
        std::span<const uint8_t> link_secret,
        std::string_view context,
        const size_t length) {
        if (link_secret.empty()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::DeriveKey("Hop key derivation requires a link secret"));
        }
        return Hkdf::DeriveKeyBytes(link_secret, length, {}, InfoBytes(context));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> HopKey::FitToLength(
        std::span<const uint8_t> session_key,
        std::string_view context,
        const size_t length) {
        if (session_key.size() == length) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
                std::vector<uint8_t>(session_key.begin(), session_key.end()));
        }
        return Hkdf::DeriveKeyBytes(session_key, length, {}, InfoBytes(context));
    }

    std::string HopKey::BuildContext(
        std::string_view session_id,
        const size_t hop_index,
        std::string_view from,
        std::string_view to) {
        return compat::format("{}:hop:{}:{}->{}", session_id, hop_index, from, to);
    }
}
