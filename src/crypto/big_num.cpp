#include "custodian/crypto/big_num.hpp"
#include "custodian/core/constants.hpp"

#include <format>

namespace custodian::crypto {
using OpenSSL = OpenSSLConstants;

Result<BigNum, CustodyFailure> BigNum::Zero() {
    BIGNUM* bn = BN_secure_new();
    if (bn == nullptr) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("Failed to allocate BIGNUM"));
    }
    BN_zero(bn);
    return Result<BigNum, CustodyFailure>::Ok(BigNum(bn));
}

Result<BigNum, CustodyFailure> BigNum::FromWord(unsigned long value) {
    auto result = Zero();
    if (result.IsErr()) {
        return result;
    }
    if (BN_set_word(result.Unwrap().Get(), value) != OpenSSL::SUCCESS) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("BN_set_word failed"));
    }
    return result;
}

Result<BigNum, CustodyFailure> BigNum::FromBytes(std::span<const uint8_t> big_endian) {
    auto result = Zero();
    if (result.IsErr()) {
        return result;
    }
    if (!big_endian.empty() &&
        BN_bin2bn(big_endian.data(), static_cast<int>(big_endian.size()), result.Unwrap().Get()) == nullptr) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Decode("BN_bin2bn failed"));
    }
    return result;
}

Result<BigNum, CustodyFailure> BigNum::MersenneNumber(int exponent) {
    if (exponent < 2) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(std::format("Mersenne exponent {} too small", exponent)));
    }
    auto result = Zero();
    if (result.IsErr()) {
        return result;
    }
    BIGNUM* bn = result.Unwrap().Get();
    if (BN_set_bit(bn, exponent) != OpenSSL::SUCCESS || BN_sub_word(bn, 1) != OpenSSL::SUCCESS) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("Failed to build Mersenne number"));
    }
    return result;
}

Result<BigNum, CustodyFailure> BigNum::Rfc3526Prime2048() {
    BIGNUM* bn = BN_get_rfc3526_prime_2048(nullptr);
    if (bn == nullptr) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("Failed to load RFC 3526 prime"));
    }
    return Result<BigNum, CustodyFailure>::Ok(BigNum(bn));
}

BigNum::~BigNum() {
    if (bn_ != nullptr) {
        BN_clear_free(bn_);
        bn_ = nullptr;
    }
}

BigNum::BigNum(BigNum&& other) noexcept : bn_(other.bn_) {
    other.bn_ = nullptr;
}

BigNum& BigNum::operator=(BigNum&& other) noexcept {
    if (this != &other) {
        if (bn_ != nullptr) {
            BN_clear_free(bn_);
        }
        bn_ = other.bn_;
        other.bn_ = nullptr;
    }
    return *this;
}

Result<BigNum, CustodyFailure> BigNum::Clone() const {
    auto result = Zero();
    if (result.IsErr()) {
        return result;
    }
    if (BN_copy(result.Unwrap().Get(), bn_) == nullptr) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("BN_copy failed"));
    }
    return result;
}

std::vector<uint8_t> BigNum::ToBytes() const {
    std::vector<uint8_t> out(static_cast<size_t>(BN_num_bytes(bn_)));
    if (!out.empty()) {
        BN_bn2bin(bn_, out.data());
    }
    return out;
}

Result<std::vector<uint8_t>, CustodyFailure> BigNum::ToBytesPadded(size_t width) const {
    if (ByteLength() > width) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encode(
                std::format("Value of {} bytes does not fit in {}", ByteLength(), width)));
    }
    std::vector<uint8_t> out(width);
    if (BN_bn2binpad(bn_, out.data(), static_cast<int>(width)) < 0) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encode("BN_bn2binpad failed"));
    }
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(out));
}

size_t BigNum::BitLength() const noexcept {
    return static_cast<size_t>(BN_num_bits(bn_));
}

size_t BigNum::ByteLength() const noexcept {
    return static_cast<size_t>(BN_num_bytes(bn_));
}

int BigNum::Compare(const BigNum& other) const noexcept {
    return BN_cmp(bn_, other.bn_);
}

bool BigNum::IsWord(unsigned long value) const noexcept {
    return BN_is_word(bn_, value) == 1;
}

} // namespace custodian::crypto
