#pragma once
#include "custodian/challenge/challenge_input.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <span>
#include <vector>

namespace custodian::challenge {
    using configuration::ChallengePolicy;

    class ChallengeEngine {
    public:
        explicit ChallengeEngine(ChallengePolicy policy = ChallengePolicy::Default()) noexcept;

        /**
         * Canonical input, hashed as
         *   SHA-256(len||domain || len||user_id || len||lower(rp_id) ||
         *           height(u64 LE) || len||block_hash || [intent] || [policy])
         * with u32 little-endian lengths. Optional digests must be 32 bytes.
         */
        [[nodiscard]] Result<ChallengeInput, CustodyFailure> BuildChallenge(const ChallengeContext &ctx) const;

        [[nodiscard]] static Result<VrfKeyPair, CustodyFailure> GenerateKeyPair();

        [[nodiscard]] static Result<VrfKeyPair, CustodyFailure> DeriveKeyPairFromSeed(std::span<const uint8_t> seed);

        /// Deterministic for a fixed (secret_key, input).
        [[nodiscard]] static Result<VrfProof, CustodyFailure> Evaluate(
            const SecureMemoryHandle &secret_key, const ChallengeInput &input);

        [[nodiscard]] static Result<VrfProof, CustodyFailure> Evaluate(
            std::span<const uint8_t> secret_key, const ChallengeInput &input);

        /// Recomputes the input digest and returns the output only when it
        /// matches the one carried in @p proof.
        [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure> Verify(
            std::span<const uint8_t> public_key, const ChallengeInput &input, const VrfProof &proof);

        [[nodiscard]] const ChallengePolicy &Policy() const noexcept { return policy_; }

    private:
        ChallengePolicy policy_;
    };
}
