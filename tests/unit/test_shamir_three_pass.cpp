#include <catch2/catch_test_macros.hpp>
#include "custodian/unlock/shamir_three_pass.hpp"
#include "custodian/crypto/big_num.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include <openssl/bn.h>
#include <vector>

using namespace custodian;
using namespace custodian::unlock;
using namespace custodian::crypto;

namespace {
    ShamirThreePass SmallGroup() {
        return ShamirThreePass::Create(BigNum::MersenneNumber(127).Unwrap(), 127).Unwrap();
    }
}

TEST_CASE("ShamirThreePass - Group construction", "[unlock][shamir]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Mersenne prime is accepted") {
        auto group = ShamirThreePass::Create(BigNum::MersenneNumber(127).Unwrap(), 127);
        REQUIRE(group.IsOk());
        REQUIRE(group.Unwrap().ElementSize() == 16);
    }

    SECTION("Composite modulus is rejected") {
        auto composite = BigNum::MersenneNumber(128).Unwrap();
        auto group = ShamirThreePass::Create(std::move(composite), 64);
        REQUIRE(group.IsErr());
        REQUIRE(group.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Modulus below the minimum size is rejected") {
        auto group = ShamirThreePass::Create(BigNum::MersenneNumber(127).Unwrap());
        REQUIRE(group.IsErr());
        REQUIRE(group.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("RFC 3526 default group") {
        auto group = ShamirThreePass::Rfc3526Default();
        REQUIRE(group.IsOk());
        REQUIRE(group.Unwrap().ElementSize() == 256);
        REQUIRE(group.Unwrap().Modulus().BitLength() == 2048);
    }
}

TEST_CASE("ShamirThreePass - Commutative locks", "[unlock][shamir]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto group = SmallGroup();

    SECTION("Exponents invert each other") {
        auto keys = group.GenerateLockKeys().Unwrap();
        auto value = group.GenerateKek().Unwrap();
        auto locked = group.ApplyLock(value, keys).Unwrap();
        auto unlocked = group.RemoveLock(locked, keys).Unwrap();
        REQUIRE(unlocked.Compare(value) == 0);
    }

    SECTION("Locks from two parties remove in either order") {
        for (int round = 0; round < 16; ++round) {
            auto a = group.GenerateLockKeys().Unwrap();
            auto b = group.GenerateLockKeys().Unwrap();
            auto value = group.GenerateKek().Unwrap();

            auto a_then_b = group.ApplyLock(group.ApplyLock(value, a).Unwrap(), b).Unwrap();
            auto b_then_a = group.ApplyLock(group.ApplyLock(value, b).Unwrap(), a).Unwrap();
            REQUIRE(a_then_b.Compare(b_then_a) == 0);

            auto only_b = group.RemoveLock(a_then_b, a).Unwrap();
            auto recovered = group.RemoveLock(only_b, b).Unwrap();
            REQUIRE(recovered.Compare(value) == 0);
        }
    }

    SECTION("Locking changes the value") {
        auto keys = group.GenerateLockKeys().Unwrap();
        auto value = group.GenerateKek().Unwrap();
        auto locked = group.ApplyLock(value, keys).Unwrap();
        REQUIRE(locked.Compare(value) != 0);
    }

    SECTION("Fresh keys every time") {
        auto a = group.GenerateLockKeys().Unwrap();
        auto b = group.GenerateLockKeys().Unwrap();
        REQUIRE(ShamirThreePass::KeyIdFor(a) != ShamirThreePass::KeyIdFor(b));
    }
}

TEST_CASE("ShamirThreePass - Element validation", "[unlock][shamir]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto group = SmallGroup();
    auto keys = group.GenerateLockKeys().Unwrap();

    SECTION("Degenerate elements are refused") {
        for (const unsigned long word : {0UL, 1UL}) {
            auto value = BigNum::FromWord(word).Unwrap();
            auto result = group.ApplyLock(value, keys);
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
        }
        auto p_minus_one = BigNum::MersenneNumber(127).Unwrap();
        REQUIRE(BN_sub_word(p_minus_one.Get(), 1) == 1);
        REQUIRE(group.ValidateElement(p_minus_one).IsErr());
    }

    SECTION("Bounds of the valid range are accepted") {
        REQUIRE(group.ValidateElement(BigNum::FromWord(2).Unwrap()).IsOk());
        auto p_minus_two = BigNum::MersenneNumber(127).Unwrap();
        REQUIRE(BN_sub_word(p_minus_two.Get(), 2) == 1);
        REQUIRE(group.ValidateElement(p_minus_two).IsOk());
    }

    SECTION("Decode requires the exact element width") {
        std::vector<uint8_t> short_encoding(15, 0x01);
        auto result = group.Decode(short_encoding);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::Decode);
    }

    SECTION("Decode rejects values outside the group") {
        std::vector<uint8_t> too_large(16, 0xFF);
        REQUIRE(group.Decode(too_large).IsErr());
    }

    SECTION("Encode pads to the element width") {
        auto two = BigNum::FromWord(2).Unwrap();
        auto encoded = group.Encode(two).Unwrap();
        REQUIRE(encoded.size() == group.ElementSize());
        REQUIRE(encoded.back() == 0x02);
        REQUIRE(group.Decode(encoded).Unwrap().IsWord(2));
    }
}

TEST_CASE("ShamirThreePass - Key ids", "[unlock][shamir]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto group = SmallGroup();
    auto keys = group.GenerateLockKeys().Unwrap();

    SECTION("Stable, unpadded base64url of a SHA-256") {
        const auto id = ShamirThreePass::KeyIdFor(keys);
        REQUIRE(id == ShamirThreePass::KeyIdFor(keys));
        REQUIRE(id.size() == 43);
        REQUIRE(id.find('=') == std::string::npos);
        REQUIRE(id.find('+') == std::string::npos);
        REQUIRE(id.find('/') == std::string::npos);
    }
}
