#pragma once

#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

namespace custodian::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Owns a sodium_malloc region: guard pages on both sides, locked in RAM,
 * zeroed on free. Move-only. Secrets that outlive a single function
 * (unlocked long-term secrets, cached wrap-key seeds, the expanded signing
 * key) live in one of these rather than in a std::vector.
 */
class SecureMemoryHandle {
public:
    // ========================================================================
    // Construction / Destruction
    // ========================================================================

    /**
     * @brief Allocate zeroed secure memory
     *
     * @param size Number of bytes, must be non-zero
     * @return Ok(SecureMemoryHandle) or Err on allocation failure
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocates exactly @p data.size() bytes and copies @p data in.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    /// Wipes and frees. A moved-from handle owns nothing.
    ~SecureMemoryHandle();

    /// Empty handle, for members filled in later.
    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    // ========================================================================
    // Memory Operations
    // ========================================================================

    /**
     * @brief Write data to secure memory
     *
     * Bytes past @p data.size() are zeroed.
     *
     * @param data Data to write (must be <= allocated size)
     * @return Ok on success, Err if too large or the handle is empty
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into @p output
     *
     * @param output Buffer of at least Size() bytes
     * @return Ok on success, Err if too small or the handle is empty
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    /// Copies the first @p size bytes out. The caller owns wiping the copy.
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /// Independent copy in a fresh secure allocation.
    Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    /**
     * @brief Run @p func over a read-only view of the secret
     *
     * The signing unit and the derivation pipeline use this so the secret
     * never leaves secure memory.
     *
     * @return Ok(func's result), or Err if the handle is empty
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    /// Writable counterpart of WithReadAccess, for deriving straight into the handle.
    template<typename F>
    auto WithWriteAccess(F&& func) -> Result<std::invoke_result_t<F, std::span<uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<uint8_t> secure_span(static_cast<uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

} // namespace custodian::crypto
