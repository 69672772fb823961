#include "custodian/derivation/key_derivation_pipeline.hpp"
#include "custodian/crypto/hkdf.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"

#include <algorithm>
#include <string>

namespace custodian::derivation {
using crypto::Hkdf;
using crypto::SodiumInterop;
using Derivation = DerivationConstants;

namespace {
    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    Result<SecureMemoryHandle, CustodyFailure> DeriveIntoSecureMemory(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt,
        std::string_view info) {
        auto handle = SecureMemoryHandle::Allocate(Derivation::OUTPUT_SIZE);
        if (handle.IsErr()) {
            return Result<SecureMemoryHandle, CustodyFailure>::Err(
                CustodyFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        auto derived = handle.Unwrap().WithWriteAccess([&](std::span<uint8_t> out) {
            return Hkdf::DeriveKey(ikm, out, salt, AsBytes(info));
        });
        if (derived.IsErr()) {
            return Result<SecureMemoryHandle, CustodyFailure>::Err(
                CustodyFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        if (derived.Unwrap().IsErr()) {
            return Result<SecureMemoryHandle, CustodyFailure>::Err(derived.Unwrap().UnwrapErr());
        }
        return Result<SecureMemoryHandle, CustodyFailure>::Ok(std::move(handle).Unwrap());
    }

    Result<Unit, CustodyFailure> RequireNonEmpty(std::span<const uint8_t> input, std::string_view name) {
        if (input.empty()) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::InvalidInput(std::string(name) + " cannot be empty"));
        }
        return Result<Unit, CustodyFailure>::Ok(unit);
    }
}

Result<std::vector<uint8_t>, CustodyFailure> KeyDerivationPipeline::DerivePassFactor(
    std::span<const uint8_t> auth_secret) {
    if (auto check = RequireNonEmpty(auth_secret, "Authentication secret"); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    return Hkdf::DeriveKeyBytes(auth_secret, Derivation::OUTPUT_SIZE, {}, Derivation::PASS_FACTOR_INFO);
}

Result<SecureMemoryHandle, CustodyFailure> KeyDerivationPipeline::DeriveWrapKeySeed(
    std::span<const uint8_t> pass_factor,
    std::span<const uint8_t> long_term_secret) {
    if (auto check = RequireNonEmpty(pass_factor, "Pass factor"); check.IsErr()) {
        return std::move(check).PropagateErr<SecureMemoryHandle>();
    }
    if (auto check = RequireNonEmpty(long_term_secret, "Long-term secret"); check.IsErr()) {
        return std::move(check).PropagateErr<SecureMemoryHandle>();
    }

    auto ikm = SecureMemoryHandle::Allocate(pass_factor.size() + long_term_secret.size());
    if (ikm.IsErr()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(ikm.UnwrapErr()));
    }
    auto seed = ikm.Unwrap().WithWriteAccess([&](std::span<uint8_t> buffer) {
        std::copy(pass_factor.begin(), pass_factor.end(), buffer.begin());
        std::copy(long_term_secret.begin(), long_term_secret.end(),
                  buffer.begin() + static_cast<std::ptrdiff_t>(pass_factor.size()));
        return DeriveIntoSecureMemory(buffer, {}, Derivation::WRAP_KEY_SEED_INFO);
    });
    if (seed.IsErr()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(seed.UnwrapErr()));
    }
    return std::move(seed).Unwrap();
}

Result<SecureMemoryHandle, CustodyFailure> KeyDerivationPipeline::DeriveWrapKeySeedFromCeremony(
    std::span<const uint8_t> auth_secret,
    std::span<const uint8_t> long_term_secret) {
    auto pass_factor = DerivePassFactor(auth_secret);
    if (pass_factor.IsErr()) {
        return std::move(pass_factor).PropagateErr<SecureMemoryHandle>();
    }
    auto seed = DeriveWrapKeySeed(pass_factor.Unwrap(), long_term_secret);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(pass_factor.Unwrap()));
    return seed;
}

Result<std::vector<uint8_t>, CustodyFailure> KeyDerivationPipeline::DeriveKek(
    std::span<const uint8_t> wrap_key_seed,
    std::span<const uint8_t> wrap_key_salt) {
    if (auto check = RequireNonEmpty(wrap_key_seed, "Wrap-key seed"); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    if (auto check = RequireNonEmpty(wrap_key_salt, "Wrap-key salt"); check.IsErr()) {
        return std::move(check).PropagateErr<std::vector<uint8_t>>();
    }
    return Hkdf::DeriveKeyBytes(wrap_key_seed, Derivation::OUTPUT_SIZE, wrap_key_salt, Derivation::KEK_INFO);
}

std::vector<uint8_t> KeyDerivationPipeline::GenerateWrapKeySalt() {
    return SodiumInterop::GetRandomBytes(Derivation::WRAP_KEY_SALT_SIZE);
}

Result<SecureMemoryHandle, CustodyFailure> KeyDerivationPipeline::DeriveRecoverySeed(
    std::span<const uint8_t> secondary_secret,
    std::string_view account_id) {
    if (auto check = RequireNonEmpty(secondary_secret, "Secondary secret"); check.IsErr()) {
        return std::move(check).PropagateErr<SecureMemoryHandle>();
    }
    if (account_id.empty()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Account id cannot be empty"));
    }
    return DeriveIntoSecureMemory(secondary_secret, AsBytes(account_id), Derivation::RECOVERY_SEED_INFO);
}

}
