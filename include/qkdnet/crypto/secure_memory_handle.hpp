#pragma once

#include "qkdnet/core/result.hpp"
#include "qkdnet/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace qkdnet::protocol::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Holds the pre-shared secret and the confirmed session key. Memory comes from
 * sodium_malloc (guard pages, locked, zeroed on free). Move-only.
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocate exactly data.size() bytes and copy data in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Write data to secure memory
     *
     * Bytes past data.size() are zeroed.
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Execute a function with read-only access to the secure memory
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /// Zero the contents and release the allocation. The handle becomes invalid.
    void Release() noexcept;

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace qkdnet::protocol::crypto
