#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace qkdnet::protocol {
struct Constants {
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t HMAC_SHA_256_TAG_SIZE = 32;
    static constexpr size_t HMAC_SHA_256_KEY_SIZE = 32;
    static constexpr size_t AUTH_CHALLENGE_SIZE = 32;
    static constexpr size_t SESSION_ID_BYTES = 16;
    static constexpr size_t PRIVACY_AMPLIFICATION_SEED_SIZE = 32;
    static constexpr size_t HOP_KEY_SIZE = 32;
    static constexpr size_t RELAY_SESSION_ID_HEX_LENGTH = 16;
    static constexpr size_t BITS_PER_BYTE = 8;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
};
struct ReconciliationConstants {
    static constexpr size_t CASCADE_DEFAULT_BLOCK_SIZE = 8;
    static constexpr uint32_t CASCADE_DEFAULT_PASSES = 4;
    static constexpr size_t CASCADE_DIRECT_SCAN_LENGTH = 4;
    static constexpr size_t LDPC_DEFAULT_CODE_LENGTH = 256;
    static constexpr size_t LDPC_DEFAULT_ROW_WEIGHT = 3;
    static constexpr uint32_t LDPC_DEFAULT_MAX_ITERATIONS = 50;
    static constexpr double LDPC_DEFAULT_CHANNEL_ERROR_RATE = 0.05;
    static constexpr double LDPC_MIN_CHANNEL_ERROR_RATE = 1e-4;
    static constexpr double LDPC_MAX_CHANNEL_ERROR_RATE = 0.45;
    static constexpr double LDPC_TANH_CLAMP = 0.999999999999;
    static constexpr double LDPC_MAX_LLR = 50.0;
};
struct ProtocolConstants {
    static constexpr uint32_t DEFAULT_SAMPLE_SIZE = 100;
    static constexpr uint32_t DEFAULT_SHOT_COUNT = 100;
    static constexpr size_t DEFAULT_FINAL_KEY_LENGTH = 32;
    static constexpr double DEFAULT_MAX_ERROR_RATE = 0.25;
    static constexpr double DEFAULT_MIN_FIDELITY = 0.0;
    static constexpr std::chrono::milliseconds DEFAULT_KEY_GENERATION_TIMEOUT{30'000};
    static constexpr std::chrono::seconds DEFAULT_MAX_CLOCK_SKEW{300};
    static constexpr size_t DEFAULT_REPLAY_CAPACITY = 256;
    static constexpr std::string_view KEY_CONFIRM_INFO = "qkdnet-key-confirm";
    static constexpr std::string_view HOP_KEY_INFO = "qkdnet-hop-key-v1";
};
struct NetworkConstants {
    static constexpr size_t DEFAULT_MAX_HOPS = 5;
    static constexpr std::chrono::seconds DEFAULT_KEY_TTL{3600};
    static constexpr double DIRECT_PATH_TRUST = 1.0;
    static constexpr double TRUSTED_RELAY_TRUST_FACTOR = 0.9;
    static constexpr double RELAY_TRUST_FACTOR = 0.7;
    static constexpr double DEFAULT_LINK_LATENCY = 1.0;
    static constexpr size_t DEFAULT_PATH_CACHE_CAPACITY = 128;
    static constexpr size_t DEFAULT_KEY_STORE_CAPACITY = 1024;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view SESSION_ABORTED = "Session has been aborted";
    static constexpr std::string_view SESSION_CONFIRMED = "Session is already confirmed";
    static constexpr std::string_view SIGNATURE_MISMATCH = "Message signature verification failed";
    static constexpr std::string_view AUTH_RESPONSE_MISMATCH = "Authentication response does not match challenge";
    static constexpr std::string_view KEY_DIGEST_MISMATCH = "Key digests differ after privacy amplification";
};
}
