#pragma once

#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"

#include <openssl/bn.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace custodian::crypto {

/**
 * @brief Move-only owner of an OpenSSL BIGNUM
 *
 * Values handled here are lock exponents and blinded key material, so the
 * destructor always clears before freeing. Byte conversions are big-endian.
 */
class BigNum {
public:
    static Result<BigNum, CustodyFailure> Zero();

    static Result<BigNum, CustodyFailure> FromWord(unsigned long value);

    static Result<BigNum, CustodyFailure> FromBytes(std::span<const uint8_t> big_endian);

    /// 2^exponent - 1
    static Result<BigNum, CustodyFailure> MersenneNumber(int exponent);

    /// RFC 3526 group 14 (2048-bit MODP) prime.
    static Result<BigNum, CustodyFailure> Rfc3526Prime2048();

    ~BigNum();
    BigNum(BigNum&& other) noexcept;
    BigNum& operator=(BigNum&& other) noexcept;
    BigNum(const BigNum&) = delete;
    BigNum& operator=(const BigNum&) = delete;

    Result<BigNum, CustodyFailure> Clone() const;

    /// Minimal big-endian encoding (empty for zero).
    [[nodiscard]] std::vector<uint8_t> ToBytes() const;

    /// Left-padded big-endian encoding; fails if the value does not fit.
    Result<std::vector<uint8_t>, CustodyFailure> ToBytesPadded(size_t width) const;

    [[nodiscard]] size_t BitLength() const noexcept;
    [[nodiscard]] size_t ByteLength() const noexcept;
    [[nodiscard]] int Compare(const BigNum& other) const noexcept;
    [[nodiscard]] bool IsWord(unsigned long value) const noexcept;

    [[nodiscard]] BIGNUM* Get() noexcept { return bn_; }
    [[nodiscard]] const BIGNUM* Get() const noexcept { return bn_; }

private:
    explicit BigNum(BIGNUM* bn) noexcept : bn_(bn) {}

    BIGNUM* bn_;
};

} // namespace custodian::crypto
