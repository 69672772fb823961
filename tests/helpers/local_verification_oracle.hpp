#pragma once
#include "custodian/interfaces/i_verification_oracle.hpp"
#include "custodian/challenge/challenge_verifier.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace custodian::test_helpers {

/// Relying-party verifier run in-process against a fixed VRF public key.
class LocalVerificationOracle : public interfaces::IVerificationOracle {
public:
    LocalVerificationOracle(std::shared_ptr<interfaces::IFreshnessOracle> chain,
                            configuration::ChallengePolicy policy = configuration::ChallengePolicy::Default())
        : verifier_(std::move(chain), policy) {}

    void SetPublicKey(std::vector<uint8_t> public_key) {
        std::lock_guard lock(mutex_);
        public_key_ = std::move(public_key);
    }

    [[nodiscard]] size_t Calls() const { return calls_.load(); }

    [[nodiscard]] Result<Unit, CustodyFailure> Verify(
        const challenge::ChallengeInput& input,
        const challenge::VrfProof& proof,
        std::span<const uint8_t> ceremony_assertion) override {
        calls_.fetch_add(1);
        std::vector<uint8_t> public_key;
        {
            std::lock_guard lock(mutex_);
            public_key = public_key_;
        }
        auto verified = verifier_.Verify(public_key, input, proof, ceremony_assertion);
        if (verified.IsErr()) {
            return std::move(verified).PropagateErr<Unit>();
        }
        return Result<Unit, CustodyFailure>::Ok(unit);
    }

private:
    challenge::ChallengeVerifier verifier_;
    std::mutex mutex_;
    std::vector<uint8_t> public_key_;
    std::atomic<size_t> calls_{0};
};

}
