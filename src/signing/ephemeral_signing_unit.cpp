#include "custodian/signing/ephemeral_signing_unit.hpp"
#include "custodian/signing/signing_key_sealer.hpp"
#include "custodian/derivation/key_derivation_pipeline.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"

#include <sodium.h>

namespace custodian::signing {
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using derivation::KeyDerivationPipeline;

Result<SignedPayload, CustodyFailure> SigningTask::Await() {
    if (!future_.valid()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::Generic("Signing task already awaited"));
    }
    return future_.get();
}

SigningTask EphemeralSigningUnit::Spawn(SigningRequest request, OneShotReceiver<WrapKeyMaterial> receiver) {
    return SigningTask(std::async(std::launch::async,
        [request = std::move(request), receiver = std::move(receiver)]() mutable {
            return Run(request, std::move(receiver));
        }));
}

Result<SignedPayload, CustodyFailure> EphemeralSigningUnit::Run(
    const SigningRequest& request,
    OneShotReceiver<WrapKeyMaterial> receiver) {
    auto received = receiver.Receive();
    if (received.IsErr()) {
        return std::move(received).PropagateErr<SignedPayload>();
    }
    WrapKeyMaterial material = std::move(received).Unwrap();

    auto kek = material.seed.WithReadAccess([&material](std::span<const uint8_t> seed) {
        return KeyDerivationPipeline::DeriveKek(seed, material.salt);
    });
    if (kek.IsErr()) {
        return Result<SignedPayload, CustodyFailure>::Err(CustodyFailure::FromSodiumFailure(kek.UnwrapErr()));
    }
    if (kek.Unwrap().IsErr()) {
        return std::move(kek).Unwrap().PropagateErr<SignedPayload>();
    }
    auto& kek_bytes = kek.Unwrap().Unwrap();

    auto signing_seed = SigningKeySealer::Open(request.encrypted_signing_key, kek_bytes, request.expected_public_key);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(kek_bytes));
    if (signing_seed.IsErr()) {
        CUSTODIAN_LOG_MSG(debug::Side::Client, "SIGN", "signing key did not open under derived KEK");
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::DerivationMismatch("Derived KEK does not open the signing key"));
    }

    auto secret_key = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (secret_key.IsErr()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(secret_key.UnwrapErr()));
    }
    std::vector<uint8_t> public_key(Constants::ED_25519_PUBLIC_KEY_SIZE);
    auto expanded = signing_seed.Unwrap().WithReadAccess([&](std::span<const uint8_t> seed) {
        auto written = secret_key.Unwrap().WithWriteAccess([&](std::span<uint8_t> sk) {
            return crypto_sign_seed_keypair(public_key.data(), sk.data(), seed.data());
        });
        return written.IsOk() && written.Unwrap() == 0;
    });
    if (expanded.IsErr() || !expanded.Unwrap()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::KeyGeneration("Failed to rebuild signing keypair"));
    }

    auto same_key = SodiumInterop::ConstantTimeEquals(public_key, request.expected_public_key);
    if (same_key.IsErr() || !same_key.Unwrap()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::DerivationMismatch("Decrypted signing key does not match the expected public key"));
    }

    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    auto signed_ok = secret_key.Unwrap().WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_sign_detached(signature.data(), nullptr, request.payload.data(),
                                    request.payload.size(), sk.data()) == 0;
    });
    if (signed_ok.IsErr() || !signed_ok.Unwrap()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::Generic("Ed25519 signing failed"));
    }

    CUSTODIAN_LOG_PUBLIC(debug::Side::Client, "SIGN", "public_key", public_key);
    return Result<SignedPayload, CustodyFailure>::Ok(SignedPayload{std::move(signature), std::move(public_key)});
}

}
