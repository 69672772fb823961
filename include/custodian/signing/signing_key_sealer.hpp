#pragma once
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace custodian::signing {
using crypto::SecureMemoryHandle;

/**
 * AES-256-GCM envelope for the Ed25519 signing seed under the per-account
 * KEK. The signing public key is bound as associated data, so a record whose
 * public key was swapped no longer opens.
 */
class SigningKeySealer {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure> Seal(
        std::span<const uint8_t> signing_seed,
        std::span<const uint8_t> kek,
        std::span<const uint8_t> signing_public_key);

    [[nodiscard]] static Result<SecureMemoryHandle, CustodyFailure> Open(
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> kek,
        std::span<const uint8_t> signing_public_key);

    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure> PublicKeyFromSeed(
        std::span<const uint8_t> signing_seed);

private:
    SigningKeySealer() = delete;
};

}
