#include <catch2/catch_test_macros.hpp>
#include "custodian/unlock/unlock_cooperator.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "helpers/custody_harness.hpp"
#include <vector>

using namespace custodian;
using namespace custodian::unlock;
using namespace custodian::test_helpers;
using custodian::crypto::SodiumInterop;

TEST_CASE("Tamper Resistance - Wrapped secret blob", "[security][tamper][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    const auto secret = SodiumInterop::GetRandomBytes(32);
    const auto blob = harness.cooperator->Register(secret).Unwrap();

    SECTION("Every single-bit flip in the ciphertext is detected") {
        for (size_t byte = 0; byte < blob.ciphertext.size(); byte += 7) {
            WrappedSecretBlob tampered = blob;
            tampered.ciphertext[byte] ^= 0x01;
            auto result = harness.cooperator->Unlock(tampered);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == CustodyFailureType::Decryption);
        }
    }

    SECTION("Truncated ciphertext is rejected") {
        WrappedSecretBlob tampered = blob;
        tampered.ciphertext.resize(tampered.ciphertext.size() - 1);
        REQUIRE(harness.cooperator->Unlock(tampered).UnwrapErr().type == CustodyFailureType::Decryption);
    }

    SECTION("Modified server-locked value yields a KEK that does not open") {
        WrappedSecretBlob tampered = blob;
        tampered.server_locked_value.back() ^= 0x02;
        auto result = harness.cooperator->Unlock(tampered);
        REQUIRE(result.IsErr());
        REQUIRE((result.UnwrapErr().type == CustodyFailureType::Decryption ||
                 result.UnwrapErr().type == CustodyFailureType::InvalidInput));
    }

    SECTION("Server-locked value of the wrong width is a decode failure") {
        WrappedSecretBlob tampered = blob;
        tampered.server_locked_value.pop_back();
        REQUIRE(harness.cooperator->Unlock(tampered).UnwrapErr().type == CustodyFailureType::Decode);
    }

    SECTION("Blobs from two registrations cannot be mixed") {
        const auto other = harness.cooperator->Register(secret).Unwrap();
        WrappedSecretBlob mixed = blob;
        mixed.server_locked_value = other.server_locked_value;
        REQUIRE(harness.cooperator->Unlock(mixed).UnwrapErr().type == CustodyFailureType::Decryption);
    }
}

TEST_CASE("Tamper Resistance - Persisted account record", "[security][tamper][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CustodyHarness::Create().Unwrap();
    REQUIRE(harness.Register("alice").IsOk());
    const std::vector<uint8_t> payload{'p', 'a', 'y'};
    const auto original = harness.store->Load("alice").Unwrap().value();

    SECTION("Flipped sealed signing key is a derivation mismatch") {
        auto record = original;
        record.encrypted_signing_key[record.encrypted_signing_key.size() / 2] ^= 0x10;
        REQUIRE(harness.store->Save("alice", record).IsOk());
        auto result = harness.custodian->Sign("alice", "s1", payload);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::DerivationMismatch);
    }

    SECTION("Swapped signing public key is a derivation mismatch") {
        auto record = original;
        record.signing_public_key[0] ^= 0x01;
        REQUIRE(harness.store->Save("alice", record).IsOk());
        REQUIRE(harness.custodian->Sign("alice", "s1", payload).UnwrapErr().type ==
                CustodyFailureType::DerivationMismatch);
    }

    SECTION("Swapped salt is a derivation mismatch") {
        auto record = original;
        record.wrap_key_salt = SodiumInterop::GetRandomBytes(32);
        REQUIRE(harness.store->Save("alice", record).IsOk());
        REQUIRE(harness.custodian->Sign("alice", "s1", payload).UnwrapErr().type ==
                CustodyFailureType::DerivationMismatch);
    }

    SECTION("Swapped VRF public key is refused before the ceremony") {
        auto record = original;
        record.vrf_public_key[5] ^= 0x40;
        REQUIRE(harness.store->Save("alice", record).IsOk());
        auto result = harness.custodian->Sign("alice", "s1", payload);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::DerivationMismatch);
        REQUIRE(harness.ceremony->CountOf(interfaces::CeremonyKind::Authentication) == 0);
        REQUIRE_FALSE(harness.sessions->Contains(custody::KeyCustodian::CapabilityKey("alice", "s1")));
    }

    SECTION("Corrupted server-locked value is healed by the recovery ceremony") {
        auto record = original;
        record.blob.server_locked_value.back() ^= 0x02;
        REQUIRE(harness.store->Save("alice", record).IsOk());

        auto result = harness.custodian->Sign("alice", "s1", payload);
        REQUIRE(result.IsOk());
        REQUIRE(harness.ceremony->CountOf(interfaces::CeremonyKind::Recovery) == 1);

        const auto healed = harness.store->Load("alice").Unwrap().value();
        REQUIRE(healed.blob.server_locked_value != record.blob.server_locked_value);
        REQUIRE(harness.remote.cooperator->Unlock(healed.blob).IsOk());
    }
}
