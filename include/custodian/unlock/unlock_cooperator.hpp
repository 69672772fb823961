#pragma once
#include "custodian/unlock/cooperator_client.hpp"
#include "custodian/unlock/shamir_three_pass.hpp"
#include "custodian/unlock/wrapped_secret_blob.hpp"
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <memory>
#include <optional>
#include <span>

namespace custodian::unlock {
using crypto::SecureMemoryHandle;

/**
 * Client side of the three-pass unlock.
 *
 * Register:
 *   KEK random, ciphertext = AEAD(HKDF(KEK, "kek-aead"), secret)
 *   kek_c  = lock_c(KEK)            client, ephemeral
 *   kek_cs = lock_s(kek_c)          cooperator
 *   kek_s  = unlock_c(kek_cs)       persisted with the cooperator's key id
 *
 * Unlock:
 *   kek_st = lock_t(kek_s)          client, fresh ephemeral
 *   kek_t  = unlock_s(kek_st, id)   cooperator, strict key id
 *   KEK    = unlock_t(kek_t)
 *
 * The cooperator only ever sees values carrying a client lock.
 */
class UnlockCooperator {
public:
    UnlockCooperator(std::shared_ptr<CooperatorClient> client,
                     std::shared_ptr<const ShamirThreePass> group);

    [[nodiscard]] Result<WrappedSecretBlob, CustodyFailure> Register(
        std::span<const uint8_t> long_term_secret) const;

    /// Register with a caller-chosen KEK (big-endian, must lie in [2, p - 2]).
    [[nodiscard]] Result<WrappedSecretBlob, CustodyFailure> RegisterWithKek(
        std::span<const uint8_t> long_term_secret,
        std::span<const uint8_t> kek) const;

    [[nodiscard]] Result<SecureMemoryHandle, CustodyFailure> Unlock(const WrappedSecretBlob& blob) const;

    /// Re-wraps under the cooperator's current key when @p blob uses an older
    /// one. Returns nullopt when the blob is already current.
    [[nodiscard]] Result<std::optional<WrappedSecretBlob>, CustodyFailure> MigrateIfRotated(
        const WrappedSecretBlob& blob,
        std::span<const uint8_t> long_term_secret) const;

private:
    [[nodiscard]] Result<WrappedSecretBlob, CustodyFailure> Wrap(
        const BigNum& kek,
        std::span<const uint8_t> long_term_secret) const;

    [[nodiscard]] Result<std::vector<uint8_t>, CustodyFailure> DeriveAeadKey(const BigNum& kek) const;

    std::shared_ptr<CooperatorClient> client_;
    std::shared_ptr<const ShamirThreePass> group_;
};

}
