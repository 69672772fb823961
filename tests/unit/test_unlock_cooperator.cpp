#include <catch2/catch_test_macros.hpp>
#include "custodian/unlock/unlock_cooperator.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "helpers/custody_harness.hpp"
#include "cooperator/lock_exchange.pb.h"
#include <numeric>
#include <vector>

using namespace custodian;
using namespace custodian::unlock;
using namespace custodian::test_helpers;
using custodian::crypto::SodiumInterop;

namespace {
    std::vector<uint8_t> ReadSecret(const SecureMemoryHandle& handle) {
        return handle.ReadBytes(handle.Size()).Unwrap();
    }

    std::vector<uint8_t> SequentialKek() {
        std::vector<uint8_t> kek(32);
        std::iota(kek.begin(), kek.end(), static_cast<uint8_t>(0x01));
        return kek;
    }
}

TEST_CASE("UnlockCooperator - Register and unlock", "[unlock][cooperator]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    const auto& cooperator = *harness.cooperator;
    const auto secret = SodiumInterop::GetRandomBytes(32);

    SECTION("Round trip through a random KEK") {
        auto blob = cooperator.Register(secret);
        REQUIRE(blob.IsOk());
        REQUIRE(blob.Unwrap().key_id == harness.keyring->CurrentKeyId());
        REQUIRE(blob.Unwrap().server_locked_value.size() == harness.group->ElementSize());
        REQUIRE(blob.Unwrap().updated_at_ms > 0);

        auto unlocked = cooperator.Unlock(blob.Unwrap());
        REQUIRE(unlocked.IsOk());
        REQUIRE(ReadSecret(unlocked.Unwrap()) == secret);
    }

    SECTION("Caller-chosen KEK") {
        auto blob = cooperator.RegisterWithKek(secret, SequentialKek());
        REQUIRE(blob.IsOk());
        REQUIRE(ReadSecret(cooperator.Unlock(blob.Unwrap()).Unwrap()) == secret);
    }

    SECTION("Same secret wraps differently each time") {
        auto first = cooperator.Register(secret).Unwrap();
        auto second = cooperator.Register(secret).Unwrap();
        REQUIRE(first.ciphertext != second.ciphertext);
        REQUIRE(first.server_locked_value != second.server_locked_value);
    }

    SECTION("Every unlock uses a fresh transit lock") {
        auto blob = cooperator.Register(secret).Unwrap();
        REQUIRE(ReadSecret(cooperator.Unlock(blob).Unwrap()) == secret);
        REQUIRE(ReadSecret(cooperator.Unlock(blob).Unwrap()) == secret);
    }

    SECTION("Empty secret is rejected") {
        auto blob = cooperator.Register({});
        REQUIRE(blob.IsErr());
        REQUIRE(blob.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("KEK outside the group is rejected") {
        std::vector<uint8_t> one{0x01};
        auto blob = cooperator.RegisterWithKek(secret, one);
        REQUIRE(blob.IsErr());
        REQUIRE(blob.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Incomplete blob is rejected before any request") {
        WrappedSecretBlob blob;
        const size_t before = harness.transport->RequestCount();
        auto result = cooperator.Unlock(blob);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
        REQUIRE(harness.transport->RequestCount() == before);
    }

    SECTION("Unreachable cooperator") {
        auto blob = cooperator.Register(secret).Unwrap();
        harness.transport->SetReachable(false);
        REQUIRE(cooperator.Unlock(blob).UnwrapErr().type == CustodyFailureType::CooperatorUnavailable);
        REQUIRE(cooperator.Register(secret).UnwrapErr().type == CustodyFailureType::CooperatorUnavailable);
    }
}

TEST_CASE("UnlockCooperator - Migration after rotation", "[unlock][cooperator][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    const auto& cooperator = *harness.cooperator;
    const auto secret = SodiumInterop::GetRandomBytes(32);
    auto blob = cooperator.Register(secret).Unwrap();

    SECTION("Current blob needs no migration") {
        auto migrated = cooperator.MigrateIfRotated(blob, secret);
        REQUIRE(migrated.IsOk());
        REQUIRE_FALSE(migrated.Unwrap().has_value());
    }

    SECTION("Rotated blob is re-wrapped under the current key") {
        const auto new_key = harness.keyring->Rotate().Unwrap();
        auto migrated = cooperator.MigrateIfRotated(blob, secret);
        REQUIRE(migrated.IsOk());
        REQUIRE(migrated.Unwrap().has_value());
        const auto& fresh = *migrated.Unwrap();
        REQUIRE(fresh.key_id == new_key);
        REQUIRE(ReadSecret(cooperator.Unlock(fresh).Unwrap()) == secret);

        // The old blob keeps working for the length of the grace window.
        REQUIRE(ReadSecret(cooperator.Unlock(blob).Unwrap()) == secret);
    }

    SECTION("Key info for a different group is refused") {
        const auto new_key = harness.keyring->Rotate().Unwrap();
        proto::cooperator::KeyInfoResponse foreign;
        foreign.set_current_key_id(new_key);
        foreign.set_modulus(std::string(80, '\xff'));
        std::string body;
        REQUIRE(foreign.SerializeToString(&body));
        harness.transport->ForceResponse(interfaces::CooperatorResponse{200, body});

        auto migrated = cooperator.MigrateIfRotated(blob, secret);
        REQUIRE(migrated.IsErr());
        REQUIRE(migrated.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Unknown key id once the old key leaves grace") {
        const auto old_key = blob.key_id;
        (void)harness.keyring->Rotate().Unwrap();
        REQUIRE(harness.keyring->RemoveGraceKey(old_key));
        auto result = cooperator.Unlock(blob);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }
}
