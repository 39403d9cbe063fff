#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"
#include "qkdnet/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace qkdnet::protocol::crypto {

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Randomness, SHA-256, HMAC-SHA-256, constant-time comparison, wiping and
 * guarded allocations used by the session, reconciliation and relay layers.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without inspecting content.
     *
     * @return Ok(true) if equal, Ok(false) if different
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Hashing
    // ========================================================================

    static std::vector<uint8_t> Sha256(std::span<const uint8_t> data);

    /**
     * @brief HMAC-SHA-256 with an arbitrary-length key
     *
     * Keys of any length are accepted through the init/update/final API, so the
     * pre-shared secret does not have to be exactly 32 bytes.
     */
    static std::vector<uint8_t> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> data);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Uniform value in [0, upper_bound), unbiased.
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace qkdnet::protocol::crypto
