#pragma once
#include "custodian/session/one_shot_channel.hpp"
#include "custodian/session/wrap_key_material.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <future>
#include <vector>

namespace custodian::signing {
using session::OneShotReceiver;
using session::WrapKeyMaterial;

struct SigningRequest {
    std::vector<uint8_t> payload;
    std::vector<uint8_t> encrypted_signing_key;
    std::vector<uint8_t> expected_public_key;
};

struct SignedPayload {
    std::vector<uint8_t> signature;
    std::vector<uint8_t> public_key;
};

/// Handle to a running signing unit.
class SigningTask {
public:
    explicit SigningTask(std::future<Result<SignedPayload, CustodyFailure>> future) noexcept
        : future_(std::move(future)) {}

    SigningTask(SigningTask&&) noexcept = default;
    SigningTask& operator=(SigningTask&&) noexcept = default;

    /// Blocks until the unit terminates. Valid once.
    [[nodiscard]] Result<SignedPayload, CustodyFailure> Await();

    [[nodiscard]] bool IsValid() const noexcept { return future_.valid(); }

private:
    std::future<Result<SignedPayload, CustodyFailure>> future_;
};

/**
 * Single-use signer on its own thread.
 *
 * spawn -> receive {seed, salt} -> KEK = HKDF(seed, salt) -> open signing
 * seed -> rebuild keypair -> check public key -> sign -> wipe -> exit.
 *
 * Blocks on the channel until material arrives; if the sender is dropped
 * first it exits with ChannelClosed. An AEAD failure or a rebuilt public key
 * that differs from the expected one is DerivationMismatch.
 */
class EphemeralSigningUnit {
public:
    [[nodiscard]] static SigningTask Spawn(SigningRequest request, OneShotReceiver<WrapKeyMaterial> receiver);

    /// Body of the unit, run on the calling thread.
    [[nodiscard]] static Result<SignedPayload, CustodyFailure> Run(
        const SigningRequest& request,
        OneShotReceiver<WrapKeyMaterial> receiver);

private:
    EphemeralSigningUnit() = delete;
};

}
