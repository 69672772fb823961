#include "custodian/signing/signing_key_sealer.hpp"
#include "custodian/crypto/aes_gcm.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"

#include <sodium.h>
#include <format>

namespace custodian::signing {
using crypto::AesGcm;
using crypto::SodiumInterop;

Result<std::vector<uint8_t>, CustodyFailure> SigningKeySealer::Seal(
    std::span<const uint8_t> signing_seed,
    std::span<const uint8_t> kek,
    std::span<const uint8_t> signing_public_key) {
    if (signing_seed.size() != Constants::ED_25519_SEED_SIZE) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(
                std::format("Signing seed must be {} bytes, got {}", Constants::ED_25519_SEED_SIZE,
                            signing_seed.size())));
    }
    if (kek.size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(std::format("KEK must be {} bytes", Constants::AES_KEY_SIZE)));
    }
    return AesGcm::Seal(kek, signing_seed, signing_public_key);
}

Result<SecureMemoryHandle, CustodyFailure> SigningKeySealer::Open(
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> kek,
    std::span<const uint8_t> signing_public_key) {
    if (kek.size() != Constants::AES_KEY_SIZE) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(std::format("KEK must be {} bytes", Constants::AES_KEY_SIZE)));
    }
    auto opened = AesGcm::Open(kek, sealed, signing_public_key);
    if (opened.IsErr()) {
        return std::move(opened).PropagateErr<SecureMemoryHandle>();
    }
    auto& seed = opened.Unwrap();
    if (seed.size() != Constants::ED_25519_SEED_SIZE) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(seed));
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::Decryption("Sealed signing key has the wrong length"));
    }
    auto handle = SecureMemoryHandle::FromBytes(seed);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(seed));
    if (handle.IsErr()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SecureMemoryHandle, CustodyFailure>::Ok(std::move(handle).Unwrap());
}

Result<std::vector<uint8_t>, CustodyFailure> SigningKeySealer::PublicKeyFromSeed(
    std::span<const uint8_t> signing_seed) {
    if (signing_seed.size() != Constants::ED_25519_SEED_SIZE) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Signing seed has the wrong length"));
    }
    auto secret_key = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (secret_key.IsErr()) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(secret_key.UnwrapErr()));
    }
    std::vector<uint8_t> public_key(Constants::ED_25519_PUBLIC_KEY_SIZE);
    auto generated = secret_key.Unwrap().WithWriteAccess([&](std::span<uint8_t> sk) {
        return crypto_sign_seed_keypair(public_key.data(), sk.data(), signing_seed.data());
    });
    if (generated.IsErr() || generated.Unwrap() != 0) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::KeyGeneration("Failed to expand Ed25519 seed"));
    }
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(public_key));
}

}
