#include "custodian/challenge/challenge_engine.hpp"
#include "custodian/challenge/ecvrf.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace custodian::challenge {
    using crypto::SodiumInterop;

    namespace {
        void AppendU32(std::vector<uint8_t> &out, uint32_t value) {
            for (size_t i = 0; i < sizeof(value); ++i) {
                out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
            }
        }

        void AppendU64(std::vector<uint8_t> &out, uint64_t value) {
            for (size_t i = 0; i < ChallengeConstants::BLOCK_HEIGHT_SIZE; ++i) {
                out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
            }
        }

        void AppendField(std::vector<uint8_t> &out, std::span<const uint8_t> field) {
            AppendU32(out, static_cast<uint32_t>(field.size()));
            out.insert(out.end(), field.begin(), field.end());
        }

        void AppendOptionalDigest(std::vector<uint8_t> &out, const std::optional<std::vector<uint8_t>> &digest) {
            if (!digest.has_value()) {
                out.push_back(ChallengeConstants::DIGEST_ABSENT_TAG);
                return;
            }
            out.push_back(ChallengeConstants::DIGEST_PRESENT_TAG);
            out.insert(out.end(), digest->begin(), digest->end());
        }

        std::span<const uint8_t> AsBytes(std::string_view text) {
            return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
        }

        Result<Unit, CustodyFailure> CheckDigest(const std::optional<std::vector<uint8_t>> &digest,
                                                 std::string_view name) {
            if (digest.has_value() && digest->size() != ChallengeConstants::DIGEST_SIZE) {
                return Result<Unit, CustodyFailure>::Err(
                    CustodyFailure::InvalidInput(
                        std::format("{} must be {} bytes, got {}", name,
                                    ChallengeConstants::DIGEST_SIZE, digest->size())));
            }
            return Result<Unit, CustodyFailure>::Ok(unit);
        }
    }

    ChallengeEngine::ChallengeEngine(ChallengePolicy policy) noexcept
        : policy_(policy) {
    }

    Result<ChallengeInput, CustodyFailure> ChallengeEngine::BuildChallenge(const ChallengeContext &ctx) const {
        if (ctx.user_id.empty() || ctx.rp_id.empty()) {
            return Result<ChallengeInput, CustodyFailure>::Err(
                CustodyFailure::InvalidInput("Challenge requires a user id and an rp id"));
        }
        if (ctx.block_hash.empty()) {
            return Result<ChallengeInput, CustodyFailure>::Err(
                CustodyFailure::InvalidInput("Challenge requires a block hash"));
        }
        if (auto check = CheckDigest(ctx.intent_digest, "Intent digest"); check.IsErr()) {
            return std::move(check).PropagateErr<ChallengeInput>();
        }
        if (auto check = CheckDigest(ctx.session_policy_digest, "Session policy digest"); check.IsErr()) {
            return std::move(check).PropagateErr<ChallengeInput>();
        }

        ChallengeInput input;
        input.domain_separator_ = std::string(policy_.DomainSeparator());
        input.user_id_ = ctx.user_id;
        input.rp_id_ = ctx.rp_id;
        std::transform(input.rp_id_.begin(), input.rp_id_.end(), input.rp_id_.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        input.block_height_ = ctx.block_height;
        input.block_hash_ = ctx.block_hash;
        input.intent_digest_ = ctx.intent_digest;
        input.session_policy_digest_ = ctx.session_policy_digest;

        std::vector<uint8_t> encoded;
        AppendField(encoded, AsBytes(input.domain_separator_));
        AppendField(encoded, AsBytes(input.user_id_));
        AppendField(encoded, AsBytes(input.rp_id_));
        AppendU64(encoded, input.block_height_);
        AppendField(encoded, input.block_hash_);
        AppendOptionalDigest(encoded, input.intent_digest_);
        AppendOptionalDigest(encoded, input.session_policy_digest_);
        input.digest_ = SodiumInterop::Sha256({encoded});

        CUSTODIAN_LOG_VALUE(debug::Side::Client, "CHALLENGE", "block_height", input.block_height_);
        return Result<ChallengeInput, CustodyFailure>::Ok(std::move(input));
    }

    Result<VrfKeyPair, CustodyFailure> ChallengeEngine::GenerateKeyPair() {
        auto seed = SodiumInterop::GetRandomBytes(VrfConstants::SEED_SIZE);
        auto result = DeriveKeyPairFromSeed(seed);
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(seed));
        return result;
    }

    Result<VrfKeyPair, CustodyFailure> ChallengeEngine::DeriveKeyPairFromSeed(std::span<const uint8_t> seed) {
        auto public_key = Ecvrf::PublicKeyFromSeed(seed);
        if (public_key.IsErr()) {
            return std::move(public_key).PropagateErr<VrfKeyPair>();
        }
        auto secret = SecureMemoryHandle::FromBytes(seed);
        if (secret.IsErr()) {
            return Result<VrfKeyPair, CustodyFailure>::Err(
                CustodyFailure::FromSodiumFailure(secret.UnwrapErr()));
        }
        return Result<VrfKeyPair, CustodyFailure>::Ok(
            VrfKeyPair{std::move(secret).Unwrap(), std::move(public_key).Unwrap()});
    }

    Result<VrfProof, CustodyFailure> ChallengeEngine::Evaluate(const SecureMemoryHandle &secret_key,
                                                              const ChallengeInput &input) {
        auto evaluated = secret_key.WithReadAccess([&input](std::span<const uint8_t> seed) {
            return Evaluate(seed, input);
        });
        if (evaluated.IsErr()) {
            return Result<VrfProof, CustodyFailure>::Err(
                CustodyFailure::FromSodiumFailure(evaluated.UnwrapErr()));
        }
        return std::move(evaluated).Unwrap();
    }

    Result<VrfProof, CustodyFailure> ChallengeEngine::Evaluate(std::span<const uint8_t> secret_key,
                                                              const ChallengeInput &input) {
        auto public_key = Ecvrf::PublicKeyFromSeed(secret_key);
        if (public_key.IsErr()) {
            return std::move(public_key).PropagateErr<VrfProof>();
        }
        auto proof = Ecvrf::Prove(secret_key, input.Digest());
        if (proof.IsErr()) {
            return std::move(proof).PropagateErr<VrfProof>();
        }
        auto output = Ecvrf::ProofToHash(proof.Unwrap());
        if (output.IsErr()) {
            return std::move(output).PropagateErr<VrfProof>();
        }
        return Result<VrfProof, CustodyFailure>::Ok(VrfProof{
            std::move(output).Unwrap(),
            std::move(proof).Unwrap(),
            std::move(public_key).Unwrap()
        });
    }

    Result<std::vector<uint8_t>, CustodyFailure> ChallengeEngine::Verify(std::span<const uint8_t> public_key,
                                                                        const ChallengeInput &input,
                                                                        const VrfProof &proof) {
        if (!proof.public_key.empty()) {
            auto same_key = SodiumInterop::ConstantTimeEquals(proof.public_key, public_key);
            if (same_key.IsErr() || !same_key.Unwrap()) {
                return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                    CustodyFailure::InvalidProof("Proof was produced under a different public key"));
            }
        }
        auto output = Ecvrf::Verify(public_key, input.Digest(), proof.proof);
        if (output.IsErr()) {
            return output;
        }
        auto matches = SodiumInterop::ConstantTimeEquals(output.Unwrap(), proof.output);
        if (matches.IsErr() || !matches.Unwrap()) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("VRF output does not match the proof"));
        }
        return output;
    }
}
