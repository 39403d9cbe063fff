#pragma once

/**
 * @file protocol_logger.hpp
 * @brief Debug logging for session phases, reconciliation statistics and relays.
 *
 * Only digests, rates and counters are printed. Raw, reconciled and final key
 * bytes are never passed to these macros.
 *
 * Enable via CMake: -DQKDNET_DEBUG_LOG=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace qkdnet::debug {

enum class Side {
    Initiator,
    Responder,
    Relay,
    Unknown
};

#ifdef QKDNET_DEBUG_LOG

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Initiator: return "INITIATOR";
        case Side::Responder: return "RESPONDER";
        case Side::Relay: return "RELAY";
        default: return "UNKNOWN";
    }
}

#define QKDNET_LOG_DIGEST(side, operation, name, digest) \
    do { \
        fprintf(stdout, "[QKDNET] %s %s %s: %s\n", \
            ::qkdnet::debug::SideToString(side), \
            operation, \
            name, \
            ::qkdnet::debug::ToHex(digest).c_str()); \
        fflush(stdout); \
    } while(0)

#define QKDNET_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[QKDNET] %s %s %s: %s\n", \
            ::qkdnet::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define QKDNET_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[QKDNET] %s %s %s\n", \
            ::qkdnet::debug::SideToString(side), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define QKDNET_LOG_SECTION(side, section_name) \
    do { \
        fprintf(stdout, "[QKDNET] %s ========== %s ==========\n", \
            ::qkdnet::debug::SideToString(side), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogPhaseChange(Side side, std::string_view session_id, std::string_view from, std::string_view to) {
    fprintf(stdout, "[QKDNET] %s PHASE %.*s: %.*s -> %.*s\n",
        SideToString(side),
        static_cast<int>(session_id.size()), session_id.data(),
        static_cast<int>(from.size()), from.data(),
        static_cast<int>(to.size()), to.data());
    fflush(stdout);
}

inline void LogReconciliation(
    Side side,
    std::string_view method,
    size_t errors_corrected,
    size_t remaining_errors,
    size_t leaked_bits,
    bool converged) {

    QKDNET_LOG_SECTION(side, "RECONCILIATION");
    QKDNET_LOG_MSG(side, "RECONCILE", method);
    QKDNET_LOG_VALUE(side, "RECONCILE", "errors_corrected", errors_corrected);
    QKDNET_LOG_VALUE(side, "RECONCILE", "remaining_errors", remaining_errors);
    QKDNET_LOG_VALUE(side, "RECONCILE", "leaked_bits", leaked_bits);
    QKDNET_LOG_MSG(side, "RECONCILE", converged ? "converged: YES" : "converged: NO");
}

inline void LogRelayHop(
    std::string_view from,
    std::string_view to,
    size_t hop_index,
    bool derived_locally) {

    fprintf(stdout, "[QKDNET] RELAY HOP[%zu] %.*s -> %.*s (%s)\n",
        hop_index,
        static_cast<int>(from.size()), from.data(),
        static_cast<int>(to.size()), to.data(),
        derived_locally ? "derived hop key" : "session hop key");
    fflush(stdout);
}

#else // !QKDNET_DEBUG_LOG

#define QKDNET_LOG_DIGEST(side, operation, name, digest) ((void)0)
#define QKDNET_LOG_VALUE(side, operation, name, value) ((void)0)
#define QKDNET_LOG_MSG(side, operation, message) ((void)0)
#define QKDNET_LOG_SECTION(side, section_name) ((void)0)

inline void LogPhaseChange(Side, std::string_view, std::string_view, std::string_view) {}
inline void LogReconciliation(Side, std::string_view, size_t, size_t, size_t, bool) {}
inline void LogRelayHop(std::string_view, std::string_view, size_t, bool) {}

#endif // QKDNET_DEBUG_LOG

} // namespace qkdnet::debug
