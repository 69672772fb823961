#pragma once
#include "custodian/challenge/challenge_engine.hpp"
#include "custodian/unlock/unlock_cooperator.hpp"
#include "custodian/session/session_capability_store.hpp"
#include "custodian/signing/ephemeral_signing_unit.hpp"
#include "custodian/interfaces/i_authentication_ceremony.hpp"
#include "custodian/interfaces/i_freshness_oracle.hpp"
#include "custodian/interfaces/i_verification_oracle.hpp"
#include "custodian/interfaces/i_custody_event_handler.hpp"
#include "custodian/interfaces/i_wrapped_secret_store.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace custodian::custody {
using configuration::CustodyConfig;
using signing::SignedPayload;

struct RegistrationResult {
    std::string key_id;
    std::vector<uint8_t> vrf_public_key;
    std::vector<uint8_t> signing_public_key;
};

struct KeyCustodianDependencies {
    // Null sends every cold path through the recovery ceremony.
    std::shared_ptr<unlock::UnlockCooperator> cooperator;
    std::shared_ptr<interfaces::IWrappedSecretStore> store;
    std::shared_ptr<interfaces::IFreshnessOracle> chain;
    // Null ceremony or chain means no cold path: session misses are returned as-is.
    std::shared_ptr<interfaces::IAuthenticationCeremony> ceremony;
    std::shared_ptr<interfaces::IVerificationOracle> verifier;
    std::shared_ptr<interfaces::ICustodyEventHandler> events;
    std::shared_ptr<session::SessionCapabilityStore> sessions;
};

/**
 * Orchestrates the custody flow for one client.
 *
 * Warm path: dispense the session capability straight to a fresh signing unit.
 * Cold path (on any session miss): unlock the long-term secret through the
 * cooperator, falling back to ceremony-based recovery when the cooperator
 * cannot help, migrate to the cooperator's current key if it rotated, run a
 * VRF-bound ceremony, derive the wrap-key seed and mint a capability.
 * The signing unit is spawned before the cold path starts and blocks on its
 * channel until the capability is minted; nothing is minted unless every
 * step succeeds.
 *
 * The orchestrator never holds the KEK or the decrypted signing key.
 */
class KeyCustodian {
public:
    explicit KeyCustodian(KeyCustodianDependencies dependencies,
                          CustodyConfig config = CustodyConfig::Default());

    [[nodiscard]] Result<RegistrationResult, CustodyFailure> RegisterAccount(
        std::string_view account_id,
        std::string_view rp_id,
        std::stop_token stop = {});

    [[nodiscard]] Result<SignedPayload, CustodyFailure> Sign(
        std::string_view account_id,
        std::string_view session_id,
        std::span<const uint8_t> payload,
        std::stop_token stop = {});

    /// Drops every session capability.
    void Logout();

    [[nodiscard]] session::SessionCapabilityStore& Sessions() const noexcept { return *dependencies_.sessions; }

    /// Store key of the capability minted for @p session_id of @p account_id.
    [[nodiscard]] static std::string CapabilityKey(std::string_view account_id, std::string_view session_id);

private:
    struct UnlockedSecret {
        crypto::SecureMemoryHandle long_term_secret;
        storage::AccountRecord record;
    };

    [[nodiscard]] Result<Unit, CustodyFailure> RunColdPath(
        std::string_view account_id,
        std::string_view session_id,
        std::span<const uint8_t> payload,
        session::OneShotSender<session::WrapKeyMaterial> sender,
        std::stop_token stop);

    [[nodiscard]] Result<SignedPayload, CustodyFailure> Finish(
        std::string_view account_id,
        std::string_view capability_key,
        Result<SignedPayload, CustodyFailure> signed_payload);

    [[nodiscard]] Result<UnlockedSecret, CustodyFailure> UnlockLongTermSecret(
        std::string_view account_id,
        storage::AccountRecord record,
        std::stop_token stop);

    [[nodiscard]] Result<UnlockedSecret, CustodyFailure> RecoverLongTermSecret(
        std::string_view account_id,
        storage::AccountRecord record,
        std::stop_token stop);

    void MigrateIfRotated(std::string_view account_id, UnlockedSecret& unlocked);

    [[nodiscard]] Result<storage::AccountRecord, CustodyFailure> LoadRecord(std::string_view account_id);

    [[nodiscard]] std::vector<uint8_t> SessionPolicyDigest(std::string_view session_id) const;

    void Emit(interfaces::CustodyEvent event, std::string_view account_id) const;

    KeyCustodianDependencies dependencies_;
    CustodyConfig config_;
    challenge::ChallengeEngine engine_;
};

}
