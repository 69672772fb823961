#include <catch2/catch_test_macros.hpp>
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <string>
#include <vector>

using namespace custodian;

namespace {
    Result<std::vector<uint8_t>, CustodyFailure> ReadBlob(const bool present) {
        if (!present) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::NotFound("No record for 'alice'"));
        }
        return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::vector<uint8_t>(48, 0xA5));
    }

    // Same early-return shape the custody pipeline uses at every step.
    Result<size_t, CustodyFailure> BlobLength(const bool present) {
        auto blob = ReadBlob(present);
        if (blob.IsErr()) {
            return std::move(blob).PropagateErr<size_t>();
        }
        return Result<size_t, CustodyFailure>::Ok(blob.Unwrap().size());
    }
}

TEST_CASE("Result - Custody values and failures", "[result][core]") {
    SECTION("Ok carries the value") {
        auto result = ReadBlob(true);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap().size() == 48);
    }

    SECTION("Err carries type and message") {
        auto result = ReadBlob(false);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::NotFound);
        REQUIRE(result.UnwrapErr().message == "No record for 'alice'");
    }

    SECTION("Unit result for operations without a value") {
        auto cleared = Result<Unit, CustodyFailure>::Ok(unit);
        REQUIRE(cleared.IsOk());
        REQUIRE(cleared.Unwrap() == unit);
    }

    SECTION("Unwrapping the wrong side throws") {
        auto ok = ReadBlob(true);
        auto err = ReadBlob(false);
        REQUIRE_THROWS_AS(ok.UnwrapErr(), std::runtime_error);
        REQUIRE_THROWS_AS(err.Unwrap(), std::runtime_error);
    }

    SECTION("Rvalue Unwrap moves the value out") {
        auto moved = ReadBlob(true).Unwrap();
        REQUIRE(moved.size() == 48);
        auto failure = ReadBlob(false).UnwrapErr();
        REQUIRE(failure.type == CustodyFailureType::NotFound);
    }
}

TEST_CASE("Result - PropagateErr across steps", "[result][core]") {
    SECTION("Failure reaches the caller unchanged") {
        auto result = BlobLength(false);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::NotFound);
        REQUIRE(result.UnwrapErr().message == "No record for 'alice'");
    }

    SECTION("Success skips the early return") {
        auto result = BlobLength(true);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 48);
    }

    SECTION("Propagating an Ok is a programming error") {
        auto result = Result<int, CustodyFailure>::Ok(7);
        REQUIRE_THROWS_AS(std::move(result).PropagateErr<std::string>(), std::runtime_error);
    }
}

TEST_CASE("CustodyFailure - Classification", "[result][core]") {
    SECTION("Expired, exhausted and missing capabilities are session misses") {
        REQUIRE(CustodyFailure::Expired("x").IsSessionMiss());
        REQUIRE(CustodyFailure::Exhausted("x").IsSessionMiss());
        REQUIRE(CustodyFailure::NotFound("x").IsSessionMiss());
    }

    SECTION("Other failures end the request") {
        REQUIRE_FALSE(CustodyFailure::DerivationMismatch("x").IsSessionMiss());
        REQUIRE_FALSE(CustodyFailure::UnknownKeyId("x").IsSessionMiss());
        REQUIRE_FALSE(CustodyFailure::CooperatorUnavailable("x").IsSessionMiss());
        REQUIRE_FALSE(CustodyFailure::Cancelled("x").IsSessionMiss());
    }

    SECTION("Sodium failures surface as Generic with their message") {
        const auto failure = CustodyFailure::FromSodiumFailure(SodiumFailure::InvalidOperation("Handle has been disposed"));
        REQUIRE(failure.type == CustodyFailureType::Generic);
        REQUIRE(failure.message == "Handle has been disposed");
    }

    SECTION("Type names") {
        REQUIRE(ToString(CustodyFailureType::Exhausted) == "Exhausted");
        REQUIRE(ToString(CustodyFailureType::StaleChallenge) == "StaleChallenge");
        REQUIRE(ToString(CustodyFailureType::CooperatorUnavailable) == "CooperatorUnavailable");
    }
}
