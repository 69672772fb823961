#pragma once

#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include "custodian/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace custodian::crypto {

/**
 * @brief Interop layer for libsodium primitives used by the custody engine
 *
 * Static facade: initialization, wiping, constant-time comparison,
 * randomness, hashing and the secure allocator backing SecureMemoryHandle.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    /// True once Initialize has succeeded in this process.
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers go through a volatile loop, larger ones through
     * sodium_memzero. Every transient copy of a secret ends here.
     *
     * @param buffer Buffer to zero; empty is fine
     * @return Ok, or Err if the buffer exceeds MAX_BUFFER_SIZE
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Compare two buffers without leaking where they differ
     *
     * Used for VRF outputs, block hashes and recovered public keys.
     * Lengths are public: a size mismatch is simply Ok(false).
     *
     * @param a First buffer
     * @param b Second buffer
     * @return Ok(equal), or Err before Initialize
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Randomness and Hashing
    // ========================================================================

    /**
     * @brief Fill a new buffer from the libsodium CSPRNG
     *
     * Source of wrap-key salts, long-term secrets and signing seeds.
     *
     * @param size Number of bytes
     * @return Random bytes
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// SHA-256 over the concatenation of @p parts.
    static std::vector<uint8_t> Sha256(std::initializer_list<std::span<const uint8_t>> parts);

    /// SHA-512 over the concatenation of @p parts.
    static std::vector<uint8_t> Sha512(std::initializer_list<std::span<const uint8_t>> parts);

    /// URL-safe base64 without padding. Cooperator key ids are this over a SHA-256.
    static std::string ToBase64Url(std::span<const uint8_t> data);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory via sodium_malloc
     *
     * @param size Number of bytes
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    /// Zeroes and releases memory from AllocateSecure. Null is a no-op.
    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace custodian::crypto
