#include "custodian/unlock/shamir_three_pass.hpp"
#include "custodian/crypto/sodium_interop.hpp"

#include <openssl/bn.h>
#include <algorithm>
#include <format>
#include <memory>

namespace custodian::unlock {
using crypto::SodiumInterop;
using OpenSSL = OpenSSLConstants;

namespace {
    constexpr int kMaxExponentAttempts = 256;
    constexpr size_t kMinimumModulusBits = 8;

    struct BN_CTX_Deleter {
        void operator()(BN_CTX* ctx) const {
            BN_CTX_free(ctx);
        }
    };
    using BN_CTX_ptr = std::unique_ptr<BN_CTX, BN_CTX_Deleter>;

    Result<BN_CTX_ptr, CustodyFailure> NewContext() {
        BN_CTX_ptr ctx(BN_CTX_secure_new());
        if (!ctx) {
            return Result<BN_CTX_ptr, CustodyFailure>::Err(
                CustodyFailure::Generic("Failed to allocate BN_CTX"));
        }
        return Result<BN_CTX_ptr, CustodyFailure>::Ok(std::move(ctx));
    }

    // Uniform in [low, modulus - 2], drawn as low + rand[0, modulus - 1 - low).
    Result<BigNum, CustodyFailure> RandomBelowModulus(const BigNum& modulus, unsigned long low) {
        auto range = modulus.Clone();
        if (range.IsErr()) {
            return range;
        }
        if (BN_sub_word(range.Unwrap().Get(), low + 1) != OpenSSL::SUCCESS) {
            return Result<BigNum, CustodyFailure>::Err(
                CustodyFailure::KeyGeneration("Modulus too small for requested range"));
        }
        auto value = BigNum::Zero();
        if (value.IsErr()) {
            return value;
        }
        if (BN_priv_rand_range(value.Unwrap().Get(), range.Unwrap().Get()) != OpenSSL::SUCCESS ||
            BN_add_word(value.Unwrap().Get(), low) != OpenSSL::SUCCESS) {
            return Result<BigNum, CustodyFailure>::Err(
                CustodyFailure::KeyGeneration("BN_priv_rand_range failed"));
        }
        return value;
    }
}

Result<ShamirThreePass, CustodyFailure> ShamirThreePass::Create(BigNum prime, size_t min_bits) {
    const size_t bits = prime.BitLength();
    if (bits < min_bits || bits < kMinimumModulusBits) {
        return Result<ShamirThreePass, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(
                std::format("Modulus has {} bits, at least {} required", bits,
                            std::max(min_bits, kMinimumModulusBits))));
    }
    auto ctx = NewContext();
    if (ctx.IsErr()) {
        return std::move(ctx).PropagateErr<ShamirThreePass>();
    }
    if (BN_check_prime(prime.Get(), ctx.Unwrap().get(), nullptr) != 1) {
        return Result<ShamirThreePass, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Modulus is not prime"));
    }
    auto prime_minus_one = prime.Clone();
    if (prime_minus_one.IsErr()) {
        return std::move(prime_minus_one).PropagateErr<ShamirThreePass>();
    }
    if (BN_sub_word(prime_minus_one.Unwrap().Get(), 1) != OpenSSL::SUCCESS) {
        return Result<ShamirThreePass, CustodyFailure>::Err(
            CustodyFailure::Generic("BN_sub_word failed"));
    }
    const size_t element_size = prime.ByteLength();
    return Result<ShamirThreePass, CustodyFailure>::Ok(
        ShamirThreePass(std::move(prime), std::move(prime_minus_one).Unwrap(), element_size));
}

Result<ShamirThreePass, CustodyFailure> ShamirThreePass::Rfc3526Default() {
    auto prime = BigNum::Rfc3526Prime2048();
    if (prime.IsErr()) {
        return std::move(prime).PropagateErr<ShamirThreePass>();
    }
    return Create(std::move(prime).Unwrap());
}

Result<LockKeys, CustodyFailure> ShamirThreePass::GenerateLockKeys() const {
    auto ctx = NewContext();
    if (ctx.IsErr()) {
        return std::move(ctx).PropagateErr<LockKeys>();
    }
    auto gcd = BigNum::Zero();
    if (gcd.IsErr()) {
        return std::move(gcd).PropagateErr<LockKeys>();
    }

    for (int attempt = 0; attempt < kMaxExponentAttempts; ++attempt) {
        auto encrypt = RandomBelowModulus(prime_, 3);
        if (encrypt.IsErr()) {
            return std::move(encrypt).PropagateErr<LockKeys>();
        }
        BN_set_flags(encrypt.Unwrap().Get(), BN_FLG_CONSTTIME);

        if (BN_gcd(gcd.Unwrap().Get(), encrypt.Unwrap().Get(), prime_minus_one_.Get(),
                   ctx.Unwrap().get()) != OpenSSL::SUCCESS) {
            return Result<LockKeys, CustodyFailure>::Err(
                CustodyFailure::KeyGeneration("BN_gcd failed"));
        }
        if (!gcd.Unwrap().IsWord(1)) {
            continue;
        }

        auto decrypt = BigNum::Zero();
        if (decrypt.IsErr()) {
            return std::move(decrypt).PropagateErr<LockKeys>();
        }
        if (BN_mod_inverse(decrypt.Unwrap().Get(), encrypt.Unwrap().Get(), prime_minus_one_.Get(),
                           ctx.Unwrap().get()) == nullptr) {
            return Result<LockKeys, CustodyFailure>::Err(
                CustodyFailure::KeyGeneration("BN_mod_inverse failed for a unit exponent"));
        }
        BN_set_flags(decrypt.Unwrap().Get(), BN_FLG_CONSTTIME);
        return Result<LockKeys, CustodyFailure>::Ok(
            LockKeys{std::move(encrypt).Unwrap(), std::move(decrypt).Unwrap()});
    }
    return Result<LockKeys, CustodyFailure>::Err(
        CustodyFailure::KeyGeneration(
            std::format("No exponent coprime to p - 1 after {} attempts", kMaxExponentAttempts)));
}

Result<BigNum, CustodyFailure> ShamirThreePass::GenerateKek() const {
    return RandomBelowModulus(prime_, 2);
}

Result<BigNum, CustodyFailure> ShamirThreePass::ApplyLock(const BigNum& value, const LockKeys& keys) const {
    if (auto valid = ValidateElement(value); valid.IsErr()) {
        return std::move(valid).PropagateErr<BigNum>();
    }
    return ModExp(value, keys.encrypt);
}

Result<BigNum, CustodyFailure> ShamirThreePass::RemoveLock(const BigNum& value, const LockKeys& keys) const {
    if (auto valid = ValidateElement(value); valid.IsErr()) {
        return std::move(valid).PropagateErr<BigNum>();
    }
    return ModExp(value, keys.decrypt);
}

Result<Unit, CustodyFailure> ShamirThreePass::ValidateElement(const BigNum& value) const {
    // [2, p - 2]: 0, 1 and p - 1 are fixed by every odd exponent.
    if (BN_is_negative(value.Get()) || BN_cmp(value.Get(), BN_value_one()) <= 0) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Group element must be at least 2"));
    }
    if (BN_cmp(value.Get(), prime_minus_one_.Get()) >= 0) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Group element must be at most p - 2"));
    }
    return Result<Unit, CustodyFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CustodyFailure> ShamirThreePass::Encode(const BigNum& value) const {
    return value.ToBytesPadded(element_size_);
}

Result<BigNum, CustodyFailure> ShamirThreePass::Decode(std::span<const uint8_t> encoded) const {
    if (encoded.size() != element_size_) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Decode(
                std::format("Group element must be {} bytes, got {}", element_size_, encoded.size())));
    }
    auto value = BigNum::FromBytes(encoded);
    if (value.IsErr()) {
        return value;
    }
    if (auto valid = ValidateElement(value.Unwrap()); valid.IsErr()) {
        return std::move(valid).PropagateErr<BigNum>();
    }
    return value;
}

std::string ShamirThreePass::KeyIdFor(const LockKeys& keys) {
    auto exponent = keys.encrypt.ToBytes();
    auto digest = SodiumInterop::Sha256({exponent});
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(exponent));
    return SodiumInterop::ToBase64Url(digest);
}

Result<BigNum, CustodyFailure> ShamirThreePass::ModExp(const BigNum& value, const BigNum& exponent) const {
    auto ctx = NewContext();
    if (ctx.IsErr()) {
        return std::move(ctx).PropagateErr<BigNum>();
    }
    auto result = BigNum::Zero();
    if (result.IsErr()) {
        return result;
    }
    if (BN_mod_exp_mont_consttime(result.Unwrap().Get(), value.Get(), exponent.Get(), prime_.Get(),
                                  ctx.Unwrap().get(), nullptr) != OpenSSL::SUCCESS) {
        return Result<BigNum, CustodyFailure>::Err(
            CustodyFailure::Generic("Modular exponentiation failed"));
    }
    return result;
}

}
