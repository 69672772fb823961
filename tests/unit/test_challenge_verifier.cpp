#include <catch2/catch_test_macros.hpp>
#include "custodian/challenge/challenge_verifier.hpp"
#include "custodian/challenge/challenge_engine.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "helpers/in_memory_chain.hpp"
#include <memory>
#include <vector>

using namespace custodian;
using namespace custodian::challenge;
using namespace custodian::crypto;
using custodian::test_helpers::InMemoryChain;

namespace {
    struct VerifierFixture {
        std::shared_ptr<InMemoryChain> chain = std::make_shared<InMemoryChain>(1000);
        ChallengeEngine engine{ChallengePolicy::Custom("custodian_vrf_challenge_v1", 10)};
        ChallengeVerifier verifier{chain, ChallengePolicy::Custom("custodian_vrf_challenge_v1", 10)};
        VrfKeyPair keypair = ChallengeEngine::DeriveKeyPairFromSeed(std::vector<uint8_t>(32, 0x5C)).Unwrap();

        ChallengeInput BuildAt(const uint64_t height) {
            auto block = chain->BlockAt(height).Unwrap();
            ChallengeContext ctx;
            ctx.user_id = "alice";
            ctx.rp_id = "wallet.example";
            ctx.block_height = block.height;
            ctx.block_hash = block.hash;
            return engine.BuildChallenge(ctx).Unwrap();
        }
    };
}

TEST_CASE("ChallengeVerifier - Accepts a fresh bound challenge", "[challenge][verifier]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VerifierFixture fx;
    auto input = fx.BuildAt(995);
    auto proof = ChallengeEngine::Evaluate(fx.keypair.secret_key, input).Unwrap();

    auto result = fx.verifier.Verify(fx.keypair.public_key, input, proof, proof.output);
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap() == proof.output);
}

TEST_CASE("ChallengeVerifier - Freshness window", "[challenge][verifier]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VerifierFixture fx;

    SECTION("Block exactly at the window edge is fresh") {
        auto input = fx.BuildAt(990);
        REQUIRE(fx.verifier.CheckFreshness(input).IsOk());
    }

    SECTION("Block one past the window is stale") {
        auto input = fx.BuildAt(989);
        auto result = fx.verifier.CheckFreshness(input);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::StaleChallenge);
    }

    SECTION("Challenge ages out as the chain advances") {
        auto input = fx.BuildAt(1000);
        REQUIRE(fx.verifier.CheckFreshness(input).IsOk());
        fx.chain->Mine(11);
        auto result = fx.verifier.CheckFreshness(input);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::StaleChallenge);
    }

    SECTION("Height ahead of the tip is stale") {
        fx.chain->MineTo(1005);
        auto input = fx.BuildAt(1005);
        fx.chain->MineTo(1000);
        auto result = fx.verifier.CheckFreshness(input);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::StaleChallenge);
    }

    SECTION("Rewritten block hash is stale") {
        auto input = fx.BuildAt(998);
        fx.chain->Rewrite(998);
        auto result = fx.verifier.CheckFreshness(input);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::StaleChallenge);
    }

    SECTION("Missing chain oracle is a configuration error") {
        const ChallengeVerifier orphan(nullptr);
        auto input = fx.BuildAt(1000);
        auto result = orphan.CheckFreshness(input);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }
}

TEST_CASE("ChallengeVerifier - Check order", "[challenge][verifier]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    VerifierFixture fx;

    SECTION("Bad proof wins over stale block") {
        auto input = fx.BuildAt(900);
        auto proof = ChallengeEngine::Evaluate(fx.keypair.secret_key, input).Unwrap();
        proof.proof[40] ^= 0x01;
        auto result = fx.verifier.Verify(fx.keypair.public_key, input, proof, proof.output);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidProof);
    }

    SECTION("Stale block wins over a mismatched challenge") {
        auto input = fx.BuildAt(900);
        auto proof = ChallengeEngine::Evaluate(fx.keypair.secret_key, input).Unwrap();
        const std::vector<uint8_t> observed(64, 0x00);
        auto result = fx.verifier.Verify(fx.keypair.public_key, input, proof, observed);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::StaleChallenge);
    }

    SECTION("Authenticator signed something else") {
        auto input = fx.BuildAt(1000);
        auto proof = ChallengeEngine::Evaluate(fx.keypair.secret_key, input).Unwrap();
        auto observed = proof.output;
        observed.back() ^= 0x80;
        auto result = fx.verifier.Verify(fx.keypair.public_key, input, proof, observed);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::ChallengeMismatch);
    }
}
