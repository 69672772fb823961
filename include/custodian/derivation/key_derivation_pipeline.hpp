#pragma once
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace custodian::derivation {
using crypto::SecureMemoryHandle;

/**
 * Two-factor derivation chain, HKDF-SHA256 throughout, 32-byte outputs:
 *
 *   pass_factor = HKDF(auth_secret,                     info="wrap-pass")
 *   seed        = HKDF(pass_factor || long_term_secret, info="wrap-seed")
 *   kek         = HKDF(seed, salt=wrap_key_salt,        info="near-kek")
 *
 * Pure functions; every input must be non-empty.
 */
class KeyDerivationPipeline {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure> DerivePassFactor(
        std::span<const uint8_t> auth_secret);

    [[nodiscard]] static Result<SecureMemoryHandle, CustodyFailure> DeriveWrapKeySeed(
        std::span<const uint8_t> pass_factor,
        std::span<const uint8_t> long_term_secret);

    [[nodiscard]] static Result<SecureMemoryHandle, CustodyFailure> DeriveWrapKeySeedFromCeremony(
        std::span<const uint8_t> auth_secret,
        std::span<const uint8_t> long_term_secret);

    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure> DeriveKek(
        std::span<const uint8_t> wrap_key_seed,
        std::span<const uint8_t> wrap_key_salt);

    /// Random, generated once per account at registration.
    [[nodiscard]] static std::vector<uint8_t> GenerateWrapKeySalt();

    /// Long-term secret recovered from the ceremony's secondary secret.
    [[nodiscard]] static Result<SecureMemoryHandle, CustodyFailure> DeriveRecoverySeed(
        std::span<const uint8_t> secondary_secret,
        std::string_view account_id);

private:
    KeyDerivationPipeline() = delete;
};

}
