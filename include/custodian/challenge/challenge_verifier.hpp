#pragma once
#include "custodian/challenge/challenge_input.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/interfaces/i_freshness_oracle.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <memory>
#include <span>
#include <vector>

namespace custodian::challenge {
    using configuration::ChallengePolicy;

    /**
     * Verifier-side acceptance of a ceremony challenge.
     *
     * Checks run in a fixed order and stop at the first failure:
     *   1. proof        -> InvalidProof
     *   2. freshness    -> StaleChallenge
     *   3. binding      -> ChallengeMismatch
     */
    class ChallengeVerifier {
    public:
        explicit ChallengeVerifier(std::shared_ptr<interfaces::IFreshnessOracle> chain,
                                   ChallengePolicy policy = ChallengePolicy::Default());

        /// @param observed_challenge the challenge the authenticator actually signed
        [[nodiscard]] Result<std::vector<uint8_t>, CustodyFailure> Verify(
            std::span<const uint8_t> public_key,
            const ChallengeInput &input,
            const VrfProof &proof,
            std::span<const uint8_t> observed_challenge) const;

        [[nodiscard]] Result<Unit, CustodyFailure> CheckFreshness(const ChallengeInput &input) const;

    private:
        std::shared_ptr<interfaces::IFreshnessOracle> chain_;
        ChallengePolicy policy_;
    };
}
