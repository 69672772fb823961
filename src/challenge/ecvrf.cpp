#include "custodian/challenge/ecvrf.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include <sodium.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <memory>

namespace custodian::challenge {
    using crypto::SodiumInterop;

    namespace {
        using Point = std::array<uint8_t, VrfConstants::POINT_SIZE>;
        using Scalar = std::array<uint8_t, VrfConstants::SCALAR_SIZE>;
        using Challenge = std::array<uint8_t, VrfConstants::CHALLENGE_SIZE>;

        constexpr std::array<uint8_t, 2> HASH_TO_CURVE_PREFIX = {
            VrfConstants::SUITE, VrfConstants::HASH_TO_CURVE_DOMAIN
        };
        constexpr std::array<uint8_t, 2> CHALLENGE_PREFIX = {
            VrfConstants::SUITE, VrfConstants::CHALLENGE_DOMAIN
        };
        constexpr std::array<uint8_t, 2> PROOF_TO_HASH_PREFIX = {
            VrfConstants::SUITE, VrfConstants::PROOF_TO_HASH_DOMAIN
        };
        constexpr std::array<uint8_t, 1> TRAILER = {VrfConstants::DOMAIN_TRAILER};

        struct ExpandedKey {
            Scalar scalar{};
            std::array<uint8_t, 32> nonce_prefix{};
            Point public_key{};

            ~ExpandedKey() {
                sodium_memzero(scalar.data(), scalar.size());
                sodium_memzero(nonce_prefix.data(), nonce_prefix.size());
            }
        };

        void ReduceScalar(Scalar &out, std::span<const uint8_t> wide) {
            std::array<uint8_t, VrfConstants::NONREDUCED_SCALAR_SIZE> buffer{};
            std::memcpy(buffer.data(), wide.data(), std::min(wide.size(), buffer.size()));
            crypto_core_ed25519_scalar_reduce(out.data(), buffer.data());
            sodium_memzero(buffer.data(), buffer.size());
        }

        bool IsCanonicalScalar(std::span<const uint8_t> s) {
            Scalar reduced{};
            ReduceScalar(reduced, s);
            return sodium_memcmp(reduced.data(), s.data(), reduced.size()) == 0;
        }

        Scalar WidenChallenge(std::span<const uint8_t> c) {
            Scalar wide{};
            std::memcpy(wide.data(), c.data(), VrfConstants::CHALLENGE_SIZE);
            return wide;
        }

        Result<std::unique_ptr<ExpandedKey>, CustodyFailure> Expand(std::span<const uint8_t> seed) {
            if (seed.size() != VrfConstants::SEED_SIZE) {
                return Result<std::unique_ptr<ExpandedKey>, CustodyFailure>::Err(
                    CustodyFailure::InvalidInput(
                        std::format("VRF seed must be {} bytes, got {}", VrfConstants::SEED_SIZE, seed.size())));
            }
            auto key = std::make_unique<ExpandedKey>();
            auto h = SodiumInterop::Sha512({seed});
            h[0] &= 248;
            h[31] &= 127;
            h[31] |= 64;
            ReduceScalar(key->scalar, std::span<const uint8_t>(h.data(), 32));
            std::memcpy(key->nonce_prefix.data(), h.data() + 32, key->nonce_prefix.size());
            (void)SodiumInterop::SecureWipe(std::span<uint8_t>(h));

            if (crypto_scalarmult_ed25519_base_noclamp(key->public_key.data(), key->scalar.data()) != 0) {
                return Result<std::unique_ptr<ExpandedKey>, CustodyFailure>::Err(
                    CustodyFailure::KeyGeneration("VRF secret scalar is degenerate"));
            }
            return Result<std::unique_ptr<ExpandedKey>, CustodyFailure>::Ok(std::move(key));
        }

        Result<Point, CustodyFailure> HashToCurve(std::span<const uint8_t> public_key,
                                                  std::span<const uint8_t> alpha) {
            const auto digest = SodiumInterop::Sha512({HASH_TO_CURVE_PREFIX, public_key, alpha});
            Point h{};
            if (crypto_core_ed25519_from_uniform(h.data(), digest.data()) != 0 ||
                crypto_core_ed25519_is_valid_point(h.data()) != 1) {
                return Result<Point, CustodyFailure>::Err(
                    CustodyFailure::InvalidProof("Hash-to-curve produced an invalid point"));
            }
            return Result<Point, CustodyFailure>::Ok(h);
        }

        Challenge ChallengeHash(std::span<const uint8_t> public_key, const Point &h,
                                std::span<const uint8_t> gamma, const Point &u, const Point &v) {
            const auto digest = SodiumInterop::Sha512({CHALLENGE_PREFIX, public_key, h, gamma, u, v, TRAILER});
            Challenge c{};
            std::memcpy(c.data(), digest.data(), c.size());
            return c;
        }

        Result<Point, CustodyFailure> Multiply(std::span<const uint8_t> scalar, std::span<const uint8_t> point) {
            Point out{};
            if (crypto_scalarmult_ed25519_noclamp(out.data(), scalar.data(), point.data()) != 0) {
                return Result<Point, CustodyFailure>::Err(
                    CustodyFailure::InvalidProof("Scalar multiplication rejected its input"));
            }
            return Result<Point, CustodyFailure>::Ok(out);
        }
    }

    Result<std::vector<uint8_t>, CustodyFailure> Ecvrf::PublicKeyFromSeed(std::span<const uint8_t> seed) {
        auto expanded = Expand(seed);
        if (expanded.IsErr()) {
            return std::move(expanded).PropagateErr<std::vector<uint8_t>>();
        }
        const auto &pk = expanded.Unwrap()->public_key;
        return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::vector<uint8_t>(pk.begin(), pk.end()));
    }

    Result<std::vector<uint8_t>, CustodyFailure> Ecvrf::Prove(std::span<const uint8_t> seed,
                                                             std::span<const uint8_t> alpha) {
        auto expanded_result = Expand(seed);
        if (expanded_result.IsErr()) {
            return std::move(expanded_result).PropagateErr<std::vector<uint8_t>>();
        }
        const auto key = std::move(expanded_result).Unwrap();

        auto h_result = HashToCurve(key->public_key, alpha);
        if (h_result.IsErr()) {
            return std::move(h_result).PropagateErr<std::vector<uint8_t>>();
        }
        const Point h = h_result.Unwrap();

        auto gamma_result = Multiply(key->scalar, h);
        if (gamma_result.IsErr()) {
            return std::move(gamma_result).PropagateErr<std::vector<uint8_t>>();
        }
        const Point gamma = gamma_result.Unwrap();

        auto nonce_hash = SodiumInterop::Sha512({key->nonce_prefix, h});
        Scalar k{};
        ReduceScalar(k, nonce_hash);
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(nonce_hash));

        Point u{};
        if (crypto_scalarmult_ed25519_base_noclamp(u.data(), k.data()) != 0) {
            sodium_memzero(k.data(), k.size());
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::KeyGeneration("VRF nonce is degenerate"));
        }
        auto v_result = Multiply(k, h);
        if (v_result.IsErr()) {
            sodium_memzero(k.data(), k.size());
            return std::move(v_result).PropagateErr<std::vector<uint8_t>>();
        }
        const Point v = v_result.Unwrap();

        const Challenge c = ChallengeHash(key->public_key, h, gamma, u, v);
        const Scalar c_wide = WidenChallenge(c);
        Scalar cx{};
        Scalar s{};
        crypto_core_ed25519_scalar_mul(cx.data(), c_wide.data(), key->scalar.data());
        crypto_core_ed25519_scalar_add(s.data(), k.data(), cx.data());
        sodium_memzero(k.data(), k.size());
        sodium_memzero(cx.data(), cx.size());

        std::vector<uint8_t> proof;
        proof.reserve(VrfConstants::PROOF_SIZE);
        proof.insert(proof.end(), gamma.begin(), gamma.end());
        proof.insert(proof.end(), c.begin(), c.end());
        proof.insert(proof.end(), s.begin(), s.end());
        return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(proof));
    }

    Result<std::vector<uint8_t>, CustodyFailure> Ecvrf::ProofToHash(std::span<const uint8_t> proof) {
        if (proof.size() != VrfConstants::PROOF_SIZE) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof(
                    std::format("VRF proof must be {} bytes, got {}", VrfConstants::PROOF_SIZE, proof.size())));
        }
        const auto gamma = proof.subspan(0, VrfConstants::POINT_SIZE);
        if (crypto_core_ed25519_is_valid_point(gamma.data()) != 1) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Gamma is not a valid prime-order point"));
        }
        Scalar cofactor{};
        cofactor[0] = VrfConstants::COFACTOR;
        auto cleared = Multiply(cofactor, gamma);
        if (cleared.IsErr()) {
            return std::move(cleared).PropagateErr<std::vector<uint8_t>>();
        }
        return Result<std::vector<uint8_t>, CustodyFailure>::Ok(
            SodiumInterop::Sha512({PROOF_TO_HASH_PREFIX, cleared.Unwrap(), TRAILER}));
    }

    Result<std::vector<uint8_t>, CustodyFailure> Ecvrf::Verify(std::span<const uint8_t> public_key,
                                                              std::span<const uint8_t> alpha,
                                                              std::span<const uint8_t> proof) {
        if (public_key.size() != VrfConstants::POINT_SIZE ||
            crypto_core_ed25519_is_valid_point(public_key.data()) != 1) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("VRF public key is not a valid point"));
        }
        if (proof.size() != VrfConstants::PROOF_SIZE) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof(
                    std::format("VRF proof must be {} bytes, got {}", VrfConstants::PROOF_SIZE, proof.size())));
        }
        const auto gamma = proof.subspan(0, VrfConstants::POINT_SIZE);
        const auto c = proof.subspan(VrfConstants::POINT_SIZE, VrfConstants::CHALLENGE_SIZE);
        const auto s = proof.subspan(VrfConstants::POINT_SIZE + VrfConstants::CHALLENGE_SIZE);
        if (crypto_core_ed25519_is_valid_point(gamma.data()) != 1) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Gamma is not a valid prime-order point"));
        }
        if (!IsCanonicalScalar(s)) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Proof scalar is not canonical"));
        }

        auto h_result = HashToCurve(public_key, alpha);
        if (h_result.IsErr()) {
            return std::move(h_result).PropagateErr<std::vector<uint8_t>>();
        }
        const Point h = h_result.Unwrap();
        const Scalar c_wide = WidenChallenge(c);

        // U = s*B - c*Y
        Point s_b{};
        if (crypto_scalarmult_ed25519_base_noclamp(s_b.data(), s.data()) != 0) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Proof scalar is degenerate"));
        }
        auto c_y = Multiply(c_wide, public_key);
        if (c_y.IsErr()) {
            return std::move(c_y).PropagateErr<std::vector<uint8_t>>();
        }
        Point u{};
        if (crypto_core_ed25519_sub(u.data(), s_b.data(), c_y.Unwrap().data()) != 0) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Failed to reconstruct U"));
        }

        // V = s*H - c*Gamma
        auto s_h = Multiply(s, h);
        auto c_gamma = Multiply(c_wide, gamma);
        if (s_h.IsErr() || c_gamma.IsErr()) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Failed to reconstruct V"));
        }
        Point v{};
        if (crypto_core_ed25519_sub(v.data(), s_h.Unwrap().data(), c_gamma.Unwrap().data()) != 0) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("Failed to reconstruct V"));
        }

        const Challenge expected = ChallengeHash(public_key, h, gamma, u, v);
        if (sodium_memcmp(expected.data(), c.data(), expected.size()) != 0) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::InvalidProof("VRF proof does not verify"));
        }
        return ProofToHash(proof);
    }
}
