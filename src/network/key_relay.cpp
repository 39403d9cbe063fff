#include "qkdnet/network/key_relay.hpp"
#include "qkdnet/core/constants.hpp"
#include "qkdnet/core/format.hpp"
#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/debug/protocol_logger.hpp"
#include "qkdnet/network/hop_key.hpp"

#include <sodium.h>

namespace qkdnet::protocol::network {
    using crypto::SodiumInterop;
    using models::HopRecord;
    using models::NetworkKey;
    using models::RelayOutcome;

    namespace {
        std::string GenerateRelaySessionId(const std::string& source, const std::string& destination) {
            std::vector<uint8_t> material(source.begin(), source.end());
            material.push_back(':');
            material.insert(material.end(), destination.begin(), destination.end());
            material.push_back(':');
            const auto nonce = SodiumInterop::GetRandomBytes(Constants::SESSION_ID_BYTES);
            material.insert(material.end(), nonce.begin(), nonce.end());

            const auto digest = SodiumInterop::Sha256(material);
            std::string hex(digest.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
            hex.resize(Constants::RELAY_SESSION_ID_HEX_LENGTH);
            return hex;
        }

        void XorInto(std::span<const uint8_t> data, std::span<const uint8_t> mask, std::vector<uint8_t>& out) {
            out.resize(data.size());
            for (size_t i = 0; i < data.size(); ++i) {
                out[i] = static_cast<uint8_t>(data[i] ^ mask[i]);
            }
        }
    }

    KeyRelay::KeyRelay(
        std::shared_ptr<NetworkTopology> topology,
        std::shared_ptr<interfaces::IHopKeyProvider> hop_key_provider)
        : topology_(std::move(topology))
          , hop_key_provider_(std::move(hop_key_provider))
          , key_store_(topology_->Config().key_store_capacity) {
    }

    Result<std::vector<uint8_t>, ProtocolFailure> KeyRelay::HopKeyFor(
        const std::string& from,
        const std::string& to,
        std::span<const uint8_t> link_secret,
        const std::string& context,
        const size_t length,
        bool& from_session) {
        from_session = false;
        Result<std::vector<uint8_t>, ProtocolFailure> hop_key =
            Result<std::vector<uint8_t>, ProtocolFailure>::Err(ProtocolFailure::Generic("No hop key provider"));
        if (hop_key_provider_) {
            auto provided = hop_key_provider_->ProvideHopKey(from, to, link_secret);
            if (provided.IsOk() && !provided.Unwrap().empty()) {
                hop_key = HopKey::FitToLength(provided.Unwrap(), context, length);
                from_session = hop_key.IsOk();
                auto& session_key = provided.Unwrap();
                sodium_memzero(session_key.data(), session_key.size());
            } else if (provided.IsErr()) {
                QKDNET_LOG_MSG(debug::Side::Relay, "HOP", compat::format(
                    "session key for {}->{} unavailable ({}), deriving from link secret",
                    from, to, provided.UnwrapErr().message));
            }
        }
        if (!from_session) {
            hop_key = HopKey::DeriveHopKey(link_secret, context, length);
        }
        return hop_key;
    }

    Result<RelayOutcome, ProtocolFailure> KeyRelay::DistributeKey(
        const std::string& source,
        const std::string& destination,
        std::span<const uint8_t> key,
        std::optional<std::vector<std::string>> path,
        std::optional<std::string> session_id,
        std::optional<std::chrono::seconds> ttl) {
        if (key.empty()) {
            return Result<RelayOutcome, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Cannot relay an empty key"));
        }
        if (session_id.has_value() && session_id->empty()) {
            return Result<RelayOutcome, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Relay session id must not be empty"));
        }
        if (!topology_->HasNode(source) || !topology_->HasNode(destination)) {
            return Result<RelayOutcome, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                compat::format("Unknown relay endpoint '{}' or '{}'", source, destination)));
        }

        std::vector<std::string> route;
        if (path.has_value()) {
            route = std::move(*path);
            if (route.empty() || route.front() != source || route.back() != destination) {
                return Result<RelayOutcome, ProtocolFailure>::Err(ProtocolFailure::InvalidPath(
                    compat::format("Path must run from '{}' to '{}'", source, destination)));
            }
        } else {
            auto paths = topology_->FindPaths(source, destination);
            if (paths.IsErr()) {
                return Result<RelayOutcome, ProtocolFailure>::Err(std::move(paths).UnwrapErr());
            }
            if (paths.Unwrap().empty()) {
                return Result<RelayOutcome, ProtocolFailure>::Err(ProtocolFailure::NoPath(
                    compat::format("No route from '{}' to '{}' within {} hops",
                        source, destination, topology_->Config().max_hops)));
            }
            route = paths.Unwrap().front().node_sequence;
        }
        auto secrets_result = topology_->ResolveLinkSecrets(route);
        if (secrets_result.IsErr()) {
            return Result<RelayOutcome, ProtocolFailure>::Err(std::move(secrets_result).UnwrapErr());
        }
        std::vector<std::vector<uint8_t>> link_secrets = std::move(secrets_result).Unwrap();
        const auto wipe_secrets = [&link_secrets]() {
            for (auto& secret : link_secrets) {
                sodium_memzero(secret.data(), secret.size());
            }
        };

        const std::string relay_session_id = session_id.has_value()
            ? *session_id
            : GenerateRelaySessionId(source, destination);
        RelayOutcome outcome;
        std::vector<uint8_t> in_transit(key.begin(), key.end());
        std::vector<uint8_t> masked;
        for (size_t hop = 0; hop + 1 < route.size(); ++hop) {
            const std::string& from = route[hop];
            const std::string& to = route[hop + 1];
            const std::string context = HopKey::BuildContext(relay_session_id, hop, from, to);

            bool from_session = false;
            auto hop_key_result = HopKeyFor(from, to, link_secrets[hop], context, in_transit.size(), from_session);
            if (hop_key_result.IsErr()) {
                wipe_secrets();
                sodium_memzero(in_transit.data(), in_transit.size());
                return Result<RelayOutcome, ProtocolFailure>::Err(std::move(hop_key_result).UnwrapErr());
            }
            std::vector<uint8_t> hop_key = std::move(hop_key_result).Unwrap();

            XorInto(in_transit, hop_key, masked);
            outcome.hop_records.push_back(HopRecord{from, to, masked, from_session});
            XorInto(masked, hop_key, in_transit);
            sodium_memzero(hop_key.data(), hop_key.size());
            debug::LogRelayHop(from, to, hop, !from_session);
        }
        wipe_secrets();

        auto intact = SodiumInterop::ConstantTimeEquals(in_transit, key);
        if (intact.IsErr() || !intact.Unwrap()) {
            sodium_memzero(in_transit.data(), in_transit.size());
            return Result<RelayOutcome, ProtocolFailure>::Err(ProtocolFailure::Generic(
                "Relayed key does not match the key sent"));
        }

        NetworkKey network_key;
        network_key.key_bytes = std::move(in_transit);
        network_key.session_id = relay_session_id;
        network_key.source = source;
        network_key.destination = destination;
        network_key.path_used = route;
        network_key.created_at = std::chrono::system_clock::now();
        network_key.ttl = ttl.value_or(topology_->Config().key_ttl);

        if (auto stored = key_store_.Store(network_key); stored.IsErr()) {
            return Result<RelayOutcome, ProtocolFailure>::Err(std::move(stored).UnwrapErr());
        }
        outcome.network_key = std::move(network_key);
        return Result<RelayOutcome, ProtocolFailure>::Ok(std::move(outcome));
    }

    std::optional<NetworkKey> KeyRelay::GetKey(const std::string& session_id) {
        return key_store_.GetKey(session_id);
    }
}
