#include "custodian/challenge/challenge_verifier.hpp"
#include "custodian/challenge/challenge_engine.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/debug/event_logger.hpp"
#include <format>

namespace custodian::challenge {
    using crypto::SodiumInterop;

    ChallengeVerifier::ChallengeVerifier(std::shared_ptr<interfaces::IFreshnessOracle> chain,
                                         ChallengePolicy policy)
        : chain_(std::move(chain))
          , policy_(policy) {
    }

    Result<std::vector<uint8_t>, CustodyFailure> ChallengeVerifier::Verify(
        std::span<const uint8_t> public_key,
        const ChallengeInput &input,
        const VrfProof &proof,
        std::span<const uint8_t> observed_challenge) const {
        auto output = ChallengeEngine::Verify(public_key, input, proof);
        if (output.IsErr()) {
            return output;
        }

        if (auto fresh = CheckFreshness(input); fresh.IsErr()) {
            return std::move(fresh).PropagateErr<std::vector<uint8_t>>();
        }

        auto bound = SodiumInterop::ConstantTimeEquals(output.Unwrap(), observed_challenge);
        if (bound.IsErr() || !bound.Unwrap()) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::ChallengeMismatch("Observed challenge is not the VRF output"));
        }
        return output;
    }

    Result<Unit, CustodyFailure> ChallengeVerifier::CheckFreshness(const ChallengeInput &input) const {
        if (!chain_) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::InvalidInput("No chain oracle configured"));
        }
        auto latest = chain_->LatestBlock();
        if (latest.IsErr()) {
            return std::move(latest).PropagateErr<Unit>();
        }
        const uint64_t current = latest.Unwrap().height;
        const uint64_t claimed = input.BlockHeight();
        if (claimed > current) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::StaleChallenge(
                    std::format("Block {} is ahead of the chain tip {}", claimed, current)));
        }
        if (current - claimed > policy_.FreshnessWindowBlocks()) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::StaleChallenge(
                    std::format("Block {} is {} blocks old, window is {}", claimed, current - claimed,
                                policy_.FreshnessWindowBlocks())));
        }
        auto block = chain_->BlockAt(claimed);
        if (block.IsErr()) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::StaleChallenge(
                    std::format("Block {} is unknown to the chain: {}", claimed, block.UnwrapErr().message)));
        }
        auto same_hash = SodiumInterop::ConstantTimeEquals(block.Unwrap().hash, input.BlockHash());
        if (same_hash.IsErr() || !same_hash.Unwrap()) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::StaleChallenge(std::format("Block hash at height {} does not match", claimed)));
        }
        CUSTODIAN_LOG_VALUE(debug::Side::Cooperator, "VERIFY", "fresh_block_height", claimed);
        return Result<Unit, CustodyFailure>::Ok(unit);
    }
}
