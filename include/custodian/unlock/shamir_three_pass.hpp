#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/crypto/big_num.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace custodian::unlock {
using crypto::BigNum;

/// One party's commuting lock: encrypt * decrypt == 1 mod (p - 1).
struct LockKeys {
    BigNum encrypt;
    BigNum decrypt;
};

/**
 * Commutative exponentiation lock over a shared prime p (Shamir's
 * three-pass protocol).
 *
 *   ApplyLock(v)  = v^e mod p
 *   RemoveLock(v) = v^d mod p
 *
 * Locks from different parties commute, so they can be removed in any
 * order. Group elements are transported fixed-width big-endian with width
 * ElementSize() and must lie in [2, p - 2].
 */
class ShamirThreePass {
public:
    /// Rejects composites and moduli shorter than @p min_bits.
    static Result<ShamirThreePass, CustodyFailure> Create(
        BigNum prime,
        size_t min_bits = CooperatorConstants::DEFAULT_MIN_MODULUS_BITS);

    /// RFC 3526 2048-bit MODP prime.
    static Result<ShamirThreePass, CustodyFailure> Rfc3526Default();

    ShamirThreePass(ShamirThreePass&&) noexcept = default;
    ShamirThreePass& operator=(ShamirThreePass&&) noexcept = default;
    ShamirThreePass(const ShamirThreePass&) = delete;
    ShamirThreePass& operator=(const ShamirThreePass&) = delete;

    [[nodiscard]] Result<LockKeys, CustodyFailure> GenerateLockKeys() const;

    /// Uniform in [2, p - 2].
    [[nodiscard]] Result<BigNum, CustodyFailure> GenerateKek() const;

    [[nodiscard]] Result<BigNum, CustodyFailure> ApplyLock(const BigNum& value, const LockKeys& keys) const;

    [[nodiscard]] Result<BigNum, CustodyFailure> RemoveLock(const BigNum& value, const LockKeys& keys) const;

    [[nodiscard]] Result<Unit, CustodyFailure> ValidateElement(const BigNum& value) const;

    [[nodiscard]] Result<std::vector<uint8_t>, CustodyFailure> Encode(const BigNum& value) const;

    /// Requires exactly ElementSize() bytes and a value in [2, p - 2].
    [[nodiscard]] Result<BigNum, CustodyFailure> Decode(std::span<const uint8_t> encoded) const;

    [[nodiscard]] size_t ElementSize() const noexcept { return element_size_; }

    [[nodiscard]] const BigNum& Modulus() const noexcept { return prime_; }

    /// base64url(SHA-256(encrypt exponent, minimal big-endian)).
    [[nodiscard]] static std::string KeyIdFor(const LockKeys& keys);

private:
    ShamirThreePass(BigNum prime, BigNum prime_minus_one, size_t element_size) noexcept
        : prime_(std::move(prime))
        , prime_minus_one_(std::move(prime_minus_one))
        , element_size_(element_size) {}

    [[nodiscard]] Result<BigNum, CustodyFailure> ModExp(const BigNum& value, const BigNum& exponent) const;

    BigNum prime_;
    BigNum prime_minus_one_;
    size_t element_size_;
};

}
