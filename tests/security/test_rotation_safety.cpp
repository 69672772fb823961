#include <catch2/catch_test_macros.hpp>
#include "custodian/unlock/unlock_cooperator.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "helpers/custody_harness.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace custodian;
using namespace custodian::unlock;
using namespace custodian::test_helpers;
using custodian::crypto::SodiumInterop;

TEST_CASE("Rotation Safety - Blobs outlive rotation only through grace", "[security][rotation][critical]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create(GracePolicy::Custom(2, std::chrono::hours(24))).Unwrap();
    const auto secret = SodiumInterop::GetRandomBytes(32);

    auto generation_0 = harness.cooperator->Register(secret).Unwrap();
    (void)harness.keyring->Rotate().Unwrap();
    auto generation_1 = harness.cooperator->Register(secret).Unwrap();
    (void)harness.keyring->Rotate().Unwrap();
    auto generation_2 = harness.cooperator->Register(secret).Unwrap();

    SECTION("Every generation still within grace unlocks") {
        for (const auto* blob : {&generation_0, &generation_1, &generation_2}) {
            auto unlocked = harness.cooperator->Unlock(*blob);
            REQUIRE(unlocked.IsOk());
            REQUIRE(unlocked.Unwrap().ReadBytes(32).Unwrap() == secret);
        }
    }

    SECTION("A third rotation evicts the oldest generation") {
        (void)harness.keyring->Rotate().Unwrap();
        REQUIRE(harness.cooperator->Unlock(generation_0).UnwrapErr().type == CustodyFailureType::UnknownKeyId);
        REQUIRE(harness.cooperator->Unlock(generation_1).IsOk());
        REQUIRE(harness.cooperator->Unlock(generation_2).IsOk());
    }

    SECTION("Grace expiry evicts every retired generation") {
        harness.clock.Advance(std::chrono::hours(25));
        REQUIRE(harness.cooperator->Unlock(generation_0).UnwrapErr().type == CustodyFailureType::UnknownKeyId);
        REQUIRE(harness.cooperator->Unlock(generation_1).UnwrapErr().type == CustodyFailureType::UnknownKeyId);
        REQUIRE(harness.cooperator->Unlock(generation_2).IsOk());
    }

    SECTION("Migration rescues a generation before it leaves grace") {
        auto migrated = harness.cooperator->MigrateIfRotated(generation_0, secret);
        REQUIRE(migrated.IsOk());
        REQUIRE(migrated.Unwrap().has_value());
        harness.clock.Advance(std::chrono::hours(25));
        REQUIRE(harness.cooperator->Unlock(*migrated.Unwrap()).IsOk());
    }

    SECTION("A key id that was never issued is never accepted") {
        WrappedSecretBlob forged = generation_2;
        forged.key_id = "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA";
        REQUIRE(harness.cooperator->Unlock(forged).UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }

    SECTION("Swapping key ids between generations fails closed") {
        WrappedSecretBlob swapped = generation_1;
        swapped.key_id = generation_2.key_id;
        auto result = harness.cooperator->Unlock(swapped);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::Decryption);
    }
}

TEST_CASE("Rotation Safety - Unlocks racing a rotation", "[security][rotation][concurrency]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    const auto secret = SodiumInterop::GetRandomBytes(32);
    const auto blob = harness.cooperator->Register(secret).Unwrap();

    constexpr int THREAD_COUNT = 8;
    constexpr int UNLOCKS_PER_THREAD = 10;
    std::atomic<int> successes{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < UNLOCKS_PER_THREAD; ++i) {
                auto unlocked = harness.cooperator->Unlock(blob);
                if (unlocked.IsOk() && unlocked.Unwrap().ReadBytes(32).Unwrap() == secret) {
                    successes.fetch_add(1);
                } else {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (int r = 0; r < 3; ++r) {
        REQUIRE(harness.keyring->Rotate().IsOk());
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Default grace holds four entries, so three rotations never strand the blob.
    REQUIRE(failures.load() == 0);
    REQUIRE(successes.load() == THREAD_COUNT * UNLOCKS_PER_THREAD);
}
