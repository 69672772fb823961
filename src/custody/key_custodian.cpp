#include "custodian/custody/key_custodian.hpp"
#include "custodian/derivation/key_derivation_pipeline.hpp"
#include "custodian/signing/signing_key_sealer.hpp"
#include "custodian/challenge/ecvrf.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"

#include <format>
#include <type_traits>
#include <utility>

namespace custodian::custody {
using challenge::ChallengeContext;
using challenge::ChallengeEngine;
using challenge::Ecvrf;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using derivation::KeyDerivationPipeline;
using interfaces::CeremonyKind;
using interfaces::CeremonyRequest;
using interfaces::CeremonyResult;
using interfaces::CustodyEvent;
using session::MakeOneShotChannel;
using session::OneShotSender;
using session::WrapKeyMaterial;
using signing::EphemeralSigningUnit;
using signing::SigningKeySealer;
using signing::SigningRequest;
using storage::AccountRecord;

namespace {
    // Runs @p func over the handle's bytes, folding the sodium failure into the
    // function's own Result type.
    template<typename F>
    auto WithSecret(const SecureMemoryHandle& handle, F&& func)
        -> std::invoke_result_t<F, std::span<const uint8_t>> {
        using R = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto outcome = handle.WithReadAccess(std::forward<F>(func));
        if (outcome.IsErr()) {
            return R::Err(CustodyFailure::FromSodiumFailure(outcome.UnwrapErr()));
        }
        return std::move(outcome).Unwrap();
    }

    void WipeCeremonySecrets(CeremonyResult& result) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(result.primary_secret));
        if (result.secondary_secret.has_value()) {
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(*result.secondary_secret));
        }
    }

    std::vector<uint8_t> ToBytes(std::string_view text) {
        return {text.begin(), text.end()};
    }

    void AppendLittleEndian(std::vector<uint8_t>& out, uint64_t value, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<uint8_t>(value >> (8 * i)));
        }
    }
}

KeyCustodian::KeyCustodian(KeyCustodianDependencies dependencies, CustodyConfig config)
    : dependencies_(std::move(dependencies))
    , config_(config)
    , engine_(config.challenge) {
    if (!dependencies_.sessions) {
        dependencies_.sessions = std::make_shared<session::SessionCapabilityStore>();
    }
}

Result<RegistrationResult, CustodyFailure> KeyCustodian::RegisterAccount(
    std::string_view account_id,
    std::string_view rp_id,
    std::stop_token stop) {
    if (account_id.empty() || rp_id.empty()) {
        return Result<RegistrationResult, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Account id and relying party id are required"));
    }
    if (!dependencies_.cooperator || !dependencies_.store || !dependencies_.ceremony) {
        return Result<RegistrationResult, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Registration needs a cooperator, a store and a ceremony"));
    }

    Emit(CustodyEvent::CeremonyPrompt, account_id);
    auto ceremony = dependencies_.ceremony->Perform(
        CeremonyRequest{CeremonyKind::Registration, std::string(account_id), std::string(rp_id), {}}, stop);
    if (stop.stop_requested()) {
        if (ceremony.IsOk()) {
            WipeCeremonySecrets(ceremony.Unwrap());
        }
        return Result<RegistrationResult, CustodyFailure>::Err(
            CustodyFailure::Cancelled("Registration cancelled"));
    }
    if (ceremony.IsErr()) {
        return std::move(ceremony).PropagateErr<RegistrationResult>();
    }
    CeremonyResult& outcome = ceremony.Unwrap();
    if (!outcome.presence_confirmed) {
        WipeCeremonySecrets(outcome);
        return Result<RegistrationResult, CustodyFailure>::Err(
            CustodyFailure::CeremonyRejected("User presence was not confirmed"));
    }
    if (!outcome.secondary_secret.has_value()) {
        WipeCeremonySecrets(outcome);
        return Result<RegistrationResult, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Registration ceremony returned no secondary secret"));
    }

    auto long_term_secret = KeyDerivationPipeline::DeriveRecoverySeed(*outcome.secondary_secret, account_id);
    if (long_term_secret.IsErr()) {
        WipeCeremonySecrets(outcome);
        return std::move(long_term_secret).PropagateErr<RegistrationResult>();
    }
    const SecureMemoryHandle& lts = long_term_secret.Unwrap();

    auto vrf_public_key = WithSecret(lts, [](std::span<const uint8_t> seed) {
        return Ecvrf::PublicKeyFromSeed(seed);
    });
    if (vrf_public_key.IsErr()) {
        WipeCeremonySecrets(outcome);
        return std::move(vrf_public_key).PropagateErr<RegistrationResult>();
    }

    auto blob = WithSecret(lts, [this](std::span<const uint8_t> secret) {
        return dependencies_.cooperator->Register(secret);
    });
    if (blob.IsErr()) {
        WipeCeremonySecrets(outcome);
        return std::move(blob).PropagateErr<RegistrationResult>();
    }

    auto wrap_key_salt = KeyDerivationPipeline::GenerateWrapKeySalt();
    auto wrap_key_seed = WithSecret(lts, [&outcome](std::span<const uint8_t> secret) {
        return KeyDerivationPipeline::DeriveWrapKeySeedFromCeremony(outcome.primary_secret, secret);
    });
    WipeCeremonySecrets(outcome);
    if (wrap_key_seed.IsErr()) {
        return std::move(wrap_key_seed).PropagateErr<RegistrationResult>();
    }
    auto kek = WithSecret(wrap_key_seed.Unwrap(), [&wrap_key_salt](std::span<const uint8_t> seed) {
        return KeyDerivationPipeline::DeriveKek(seed, wrap_key_salt);
    });
    if (kek.IsErr()) {
        return std::move(kek).PropagateErr<RegistrationResult>();
    }

    auto signing_seed = SodiumInterop::GetRandomBytes(Constants::ED_25519_SEED_SIZE);
    auto signing_public_key = SigningKeySealer::PublicKeyFromSeed(signing_seed);
    if (signing_public_key.IsErr()) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(signing_seed));
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(kek.Unwrap()));
        return std::move(signing_public_key).PropagateErr<RegistrationResult>();
    }
    auto sealed = SigningKeySealer::Seal(signing_seed, kek.Unwrap(), signing_public_key.Unwrap());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(signing_seed));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(kek.Unwrap()));
    if (sealed.IsErr()) {
        return std::move(sealed).PropagateErr<RegistrationResult>();
    }

    AccountRecord record;
    record.blob = std::move(blob).Unwrap();
    record.wrap_key_salt = std::move(wrap_key_salt);
    record.vrf_public_key = vrf_public_key.Unwrap();
    record.encrypted_signing_key = std::move(sealed).Unwrap();
    record.signing_public_key = signing_public_key.Unwrap();
    record.rp_id = std::string(rp_id);

    if (auto saved = dependencies_.store->Save(account_id, record); saved.IsErr()) {
        return std::move(saved).PropagateErr<RegistrationResult>();
    }
    CUSTODIAN_LOG_ID(debug::Side::Client, "REGISTER", "account", account_id);
    return Result<RegistrationResult, CustodyFailure>::Ok(RegistrationResult{
        record.blob.key_id,
        std::move(vrf_public_key).Unwrap(),
        std::move(signing_public_key).Unwrap()
    });
}

Result<SignedPayload, CustodyFailure> KeyCustodian::Sign(
    std::string_view account_id,
    std::string_view session_id,
    std::span<const uint8_t> payload,
    std::stop_token stop) {
    if (session_id.empty()) {
        return Result<SignedPayload, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Session id cannot be empty"));
    }
    auto record = LoadRecord(account_id);
    if (record.IsErr()) {
        return std::move(record).PropagateErr<SignedPayload>();
    }
    SigningRequest request{
        std::vector<uint8_t>(payload.begin(), payload.end()),
        record.Unwrap().encrypted_signing_key,
        record.Unwrap().signing_public_key
    };

    const std::string capability_key = CapabilityKey(account_id, session_id);
    auto warm = dependencies_.sessions->Dispense(capability_key);
    if (warm.IsOk()) {
        Emit(CustodyEvent::SessionReused, account_id);
        auto signed_payload = EphemeralSigningUnit::Spawn(std::move(request), std::move(warm).Unwrap()).Await();
        return Finish(account_id, capability_key, std::move(signed_payload));
    }
    // Without a ceremony or a chain there is no cold path to fall back on.
    if (!warm.UnwrapErr().IsSessionMiss() || !dependencies_.ceremony || !dependencies_.chain) {
        return std::move(warm).PropagateErr<SignedPayload>();
    }
    CUSTODIAN_LOG_MSG(debug::Side::Client, "SIGN", warm.UnwrapErr().message.c_str());

    auto [sender, receiver] = MakeOneShotChannel<WrapKeyMaterial>();
    auto task = EphemeralSigningUnit::Spawn(std::move(request), std::move(receiver));
    auto cold = RunColdPath(account_id, session_id, payload, std::move(sender), stop);
    if (cold.IsErr()) {
        // The sender died inside RunColdPath, so the unit has already seen
        // ChannelClosed; join it and report the cold-path failure instead.
        (void)task.Await();
        return std::move(cold).PropagateErr<SignedPayload>();
    }
    return Finish(account_id, capability_key, task.Await());
}

Result<SignedPayload, CustodyFailure> KeyCustodian::Finish(
    std::string_view account_id,
    std::string_view capability_key,
    Result<SignedPayload, CustodyFailure> signed_payload) {
    if (signed_payload.IsOk()) {
        Emit(CustodyEvent::Signed, account_id);
    } else if (signed_payload.UnwrapErr().type == CustodyFailureType::DerivationMismatch) {
        // The key is scoped to this account, so only its own dead capability goes.
        (void)dependencies_.sessions->Clear(capability_key);
    }
    return signed_payload;
}

std::string KeyCustodian::CapabilityKey(std::string_view account_id, std::string_view session_id) {
    // Length-prefixed so no (account, session) pair can alias another.
    return std::format("{}:{}:{}", account_id.size(), account_id, session_id);
}

void KeyCustodian::Logout() {
    dependencies_.sessions->ClearAll();
}

Result<Unit, CustodyFailure> KeyCustodian::RunColdPath(
    std::string_view account_id,
    std::string_view session_id,
    std::span<const uint8_t> payload,
    OneShotSender<WrapKeyMaterial> sender,
    std::stop_token stop) {
    auto record = LoadRecord(account_id);
    if (record.IsErr()) {
        return std::move(record).PropagateErr<Unit>();
    }
    auto unlocked = UnlockLongTermSecret(account_id, std::move(record).Unwrap(), stop);
    if (unlocked.IsErr()) {
        return std::move(unlocked).PropagateErr<Unit>();
    }
    UnlockedSecret& secret = unlocked.Unwrap();
    MigrateIfRotated(account_id, secret);

    if (stop.stop_requested()) {
        return Result<Unit, CustodyFailure>::Err(CustodyFailure::Cancelled("Signing cancelled"));
    }

    auto block = dependencies_.chain->LatestBlock();
    if (block.IsErr()) {
        return std::move(block).PropagateErr<Unit>();
    }
    ChallengeContext context;
    context.user_id = std::string(account_id);
    context.rp_id = secret.record.rp_id;
    context.block_height = block.Unwrap().height;
    context.block_hash = block.Unwrap().hash;
    context.intent_digest = SodiumInterop::Sha256({payload});
    context.session_policy_digest = SessionPolicyDigest(session_id);
    auto input = engine_.BuildChallenge(context);
    if (input.IsErr()) {
        return std::move(input).PropagateErr<Unit>();
    }
    auto proof = ChallengeEngine::Evaluate(secret.long_term_secret, input.Unwrap());
    if (proof.IsErr()) {
        return std::move(proof).PropagateErr<Unit>();
    }
    auto same_vrf_key = SodiumInterop::ConstantTimeEquals(proof.Unwrap().public_key, secret.record.vrf_public_key);
    if (same_vrf_key.IsErr() || !same_vrf_key.Unwrap()) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::DerivationMismatch("Unlocked secret does not match the registered VRF key"));
    }
    CUSTODIAN_LOG_VALUE(debug::Side::Client, "CHALLENGE", "block_height", context.block_height);
    CUSTODIAN_LOG_PUBLIC(debug::Side::Client, "CHALLENGE", "vrf_output", proof.Unwrap().output);

    Emit(CustodyEvent::CeremonyPrompt, account_id);
    auto ceremony = dependencies_.ceremony->Perform(
        CeremonyRequest{CeremonyKind::Authentication, std::string(account_id), secret.record.rp_id,
                        proof.Unwrap().output},
        stop);
    if (stop.stop_requested()) {
        if (ceremony.IsOk()) {
            WipeCeremonySecrets(ceremony.Unwrap());
        }
        return Result<Unit, CustodyFailure>::Err(CustodyFailure::Cancelled("Signing cancelled"));
    }
    if (ceremony.IsErr()) {
        return std::move(ceremony).PropagateErr<Unit>();
    }
    CeremonyResult& outcome = ceremony.Unwrap();
    if (!outcome.presence_confirmed) {
        WipeCeremonySecrets(outcome);
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::CeremonyRejected("User presence was not confirmed"));
    }
    if (dependencies_.verifier) {
        auto verified = dependencies_.verifier->Verify(input.Unwrap(), proof.Unwrap(), outcome.assertion);
        if (verified.IsErr()) {
            WipeCeremonySecrets(outcome);
            return std::move(verified).PropagateErr<Unit>();
        }
    }

    auto wrap_key_seed = WithSecret(secret.long_term_secret, [&outcome](std::span<const uint8_t> lts) {
        return KeyDerivationPipeline::DeriveWrapKeySeedFromCeremony(outcome.primary_secret, lts);
    });
    WipeCeremonySecrets(outcome);
    if (wrap_key_seed.IsErr()) {
        return std::move(wrap_key_seed).PropagateErr<Unit>();
    }

    const std::string capability_key = CapabilityKey(account_id, session_id);
    auto minted = dependencies_.sessions->Mint(capability_key, std::move(wrap_key_seed).Unwrap(),
                                               secret.record.wrap_key_salt, config_.session);
    if (minted.IsErr()) {
        return minted;
    }
    Emit(CustodyEvent::SessionMinted, account_id);
    return dependencies_.sessions->DispenseInto(capability_key, std::move(sender));
}

Result<KeyCustodian::UnlockedSecret, CustodyFailure> KeyCustodian::UnlockLongTermSecret(
    std::string_view account_id,
    AccountRecord record,
    std::stop_token stop) {
    if (!dependencies_.cooperator) {
        CUSTODIAN_LOG_MSG(debug::Side::Client, "UNLOCK", "no cooperator configured");
        return RecoverLongTermSecret(account_id, std::move(record), stop);
    }
    auto unlocked = dependencies_.cooperator->Unlock(record.blob);
    if (unlocked.IsOk()) {
        Emit(CustodyEvent::CooperatorUnlock, account_id);
        return Result<UnlockedSecret, CustodyFailure>::Ok(
            UnlockedSecret{std::move(unlocked).Unwrap(), std::move(record)});
    }
    // Any unlock failure (unreachable, rotated away, corrupted blob) leaves the
    // recovery ceremony as the only way back in; it also re-wraps the blob.
    CUSTODIAN_LOG_MSG(debug::Side::Client, "UNLOCK", unlocked.UnwrapErr().message.c_str());
    return RecoverLongTermSecret(account_id, std::move(record), stop);
}

Result<KeyCustodian::UnlockedSecret, CustodyFailure> KeyCustodian::RecoverLongTermSecret(
    std::string_view account_id,
    AccountRecord record,
    std::stop_token stop) {
    Emit(CustodyEvent::FallbackPrompt, account_id);
    auto ceremony = dependencies_.ceremony->Perform(
        CeremonyRequest{CeremonyKind::Recovery, std::string(account_id), record.rp_id, {}}, stop);
    if (stop.stop_requested()) {
        if (ceremony.IsOk()) {
            WipeCeremonySecrets(ceremony.Unwrap());
        }
        return Result<UnlockedSecret, CustodyFailure>::Err(CustodyFailure::Cancelled("Recovery cancelled"));
    }
    if (ceremony.IsErr()) {
        return std::move(ceremony).PropagateErr<UnlockedSecret>();
    }
    CeremonyResult& outcome = ceremony.Unwrap();
    if (!outcome.presence_confirmed) {
        WipeCeremonySecrets(outcome);
        return Result<UnlockedSecret, CustodyFailure>::Err(
            CustodyFailure::CeremonyRejected("User presence was not confirmed"));
    }
    if (!outcome.secondary_secret.has_value()) {
        WipeCeremonySecrets(outcome);
        return Result<UnlockedSecret, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Recovery ceremony returned no secondary secret"));
    }
    auto long_term_secret = KeyDerivationPipeline::DeriveRecoverySeed(*outcome.secondary_secret, account_id);
    WipeCeremonySecrets(outcome);
    if (long_term_secret.IsErr()) {
        return std::move(long_term_secret).PropagateErr<UnlockedSecret>();
    }

    auto vrf_public_key = WithSecret(long_term_secret.Unwrap(), [](std::span<const uint8_t> seed) {
        return Ecvrf::PublicKeyFromSeed(seed);
    });
    if (vrf_public_key.IsErr()) {
        return std::move(vrf_public_key).PropagateErr<UnlockedSecret>();
    }
    auto same_key = SodiumInterop::ConstantTimeEquals(vrf_public_key.Unwrap(), record.vrf_public_key);
    if (same_key.IsErr() || !same_key.Unwrap()) {
        return Result<UnlockedSecret, CustodyFailure>::Err(
            CustodyFailure::DerivationMismatch("Recovered secret does not match the registered VRF key"));
    }

    // Re-wrapping needs a reachable cooperator; without one the recovered
    // secret still serves this request and the old blob stays on disk.
    if (!dependencies_.cooperator) {
        return Result<UnlockedSecret, CustodyFailure>::Ok(
            UnlockedSecret{std::move(long_term_secret).Unwrap(), std::move(record)});
    }
    auto rewrapped = WithSecret(long_term_secret.Unwrap(), [this](std::span<const uint8_t> secret) {
        return dependencies_.cooperator->Register(secret);
    });
    if (rewrapped.IsErr()) {
        CUSTODIAN_LOG_MSG(debug::Side::Client, "RECOVER", rewrapped.UnwrapErr().message.c_str());
    } else {
        AccountRecord updated = record;
        updated.blob = std::move(rewrapped).Unwrap();
        if (auto saved = dependencies_.store->Save(account_id, updated); saved.IsErr()) {
            return std::move(saved).PropagateErr<UnlockedSecret>();
        }
        record = std::move(updated);
        CUSTODIAN_LOG_ID(debug::Side::Client, "RECOVER", "key_id", record.blob.key_id);
    }
    return Result<UnlockedSecret, CustodyFailure>::Ok(
        UnlockedSecret{std::move(long_term_secret).Unwrap(), std::move(record)});
}

void KeyCustodian::MigrateIfRotated(std::string_view account_id, UnlockedSecret& unlocked) {
    if (!dependencies_.cooperator) {
        return;
    }
    auto migrated = WithSecret(unlocked.long_term_secret, [&](std::span<const uint8_t> secret) {
        return dependencies_.cooperator->MigrateIfRotated(unlocked.record.blob, secret);
    });
    if (migrated.IsErr()) {
        CUSTODIAN_LOG_MSG(debug::Side::Client, "MIGRATE", migrated.UnwrapErr().message.c_str());
        return;
    }
    if (!migrated.Unwrap().has_value()) {
        return;
    }
    AccountRecord updated = unlocked.record;
    updated.blob = std::move(*migrated.Unwrap());
    if (auto saved = dependencies_.store->Save(account_id, updated); saved.IsErr()) {
        CUSTODIAN_LOG_MSG(debug::Side::Client, "MIGRATE", saved.UnwrapErr().message.c_str());
        return;
    }
    unlocked.record = std::move(updated);
    Emit(CustodyEvent::KeyMigrated, account_id);
}

Result<AccountRecord, CustodyFailure> KeyCustodian::LoadRecord(std::string_view account_id) {
    if (!dependencies_.store) {
        return Result<AccountRecord, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("No wrapped secret store configured"));
    }
    auto loaded = dependencies_.store->Load(account_id);
    if (loaded.IsErr()) {
        return std::move(loaded).PropagateErr<AccountRecord>();
    }
    if (!loaded.Unwrap().has_value()) {
        return Result<AccountRecord, CustodyFailure>::Err(
            CustodyFailure::NotFound(std::format("No record for account '{}'", account_id)));
    }
    return Result<AccountRecord, CustodyFailure>::Ok(std::move(*loaded.Unwrap()));
}

std::vector<uint8_t> KeyCustodian::SessionPolicyDigest(std::string_view session_id) const {
    // session_id || ttl_ms (u64 LE) || max_uses (u32 LE)
    std::vector<uint8_t> encoded = ToBytes(session_id);
    AppendLittleEndian(encoded, static_cast<uint64_t>(config_.session.Ttl().count()), 8);
    AppendLittleEndian(encoded, config_.session.MaxUses(), 4);
    return SodiumInterop::Sha256({encoded});
}

void KeyCustodian::Emit(CustodyEvent event, std::string_view account_id) const {
    if (dependencies_.events) {
        dependencies_.events->OnCustodyEvent(event, std::string(account_id));
    }
}

}
