#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace custodian::challenge {

/**
 * ECVRF over edwards25519 with SHA-512.
 *
 * Follows the ECVRF-EDWARDS25519-SHA512-ELL2 layout of RFC 9381 with
 * libsodium's Elligator 2 map (crypto_core_ed25519_from_uniform) for
 * hash-to-curve. Outputs are therefore not byte-compatible with other
 * ELL2 implementations, only with this one.
 *
 *   secret key : 32-byte seed
 *   public key : Y = x*B, x = clamp(SHA-512(seed)[0..32]) mod L
 *   proof      : Gamma (32) || c (16) || s (32)
 *   output     : SHA-512(suite || 0x03 || 8*Gamma || 0x00)
 *
 * Proving is deterministic in (seed, alpha).
 */
class Ecvrf {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    PublicKeyFromSeed(std::span<const uint8_t> seed);

    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Prove(std::span<const uint8_t> seed, std::span<const uint8_t> alpha);

    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    ProofToHash(std::span<const uint8_t> proof);

    /// Returns the VRF output when @p proof is valid for (@p public_key, @p alpha).
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Verify(std::span<const uint8_t> public_key,
           std::span<const uint8_t> alpha,
           std::span<const uint8_t> proof);

private:
    Ecvrf() = delete;
};

}
