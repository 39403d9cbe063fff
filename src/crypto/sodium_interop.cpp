#include "qkdnet/crypto/sodium_interop.hpp"
#include "qkdnet/core/format.hpp"

namespace qkdnet::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                compat::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                compat::format("{}: {}",
                    ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED,
                    ErrorMessages::NOT_INITIALIZED)));
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == 0);
}

// ============================================================================
// Hashing
// ============================================================================

std::vector<uint8_t> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

std::vector<uint8_t> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> data) {

    crypto_auth_hmacsha256_state state;
    std::vector<uint8_t> tag(crypto_auth_hmacsha256_BYTES);
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    crypto_auth_hmacsha256_update(&state, data.data(), data.size());
    crypto_auth_hmacsha256_final(&state, tag.data());
    sodium_memzero(&state, sizeof(state));
    return tag;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::RandomUniform(const uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace qkdnet::protocol::crypto
