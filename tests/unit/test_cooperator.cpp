#include <catch2/catch_test_macros.hpp>
#include "custodian/unlock/cooperator_keyring.hpp"
#include "custodian/unlock/cooperator_service.hpp"
#include "custodian/unlock/cooperator_client.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "helpers/custody_harness.hpp"
#include "cooperator/lock_exchange.pb.h"
#include <string>
#include <vector>

using namespace custodian;
using namespace custodian::unlock;
using namespace custodian::test_helpers;
using custodian::crypto::SodiumInterop;
using custodian::interfaces::CooperatorResponse;
using Cooperator = custodian::CooperatorConstants;

namespace {
    std::vector<uint8_t> RandomElement(const ShamirThreePass& group) {
        return group.Encode(group.GenerateKek().Unwrap()).Unwrap();
    }

    // Locks with the current key and checks the lock comes off with @p key_id.
    bool RoundTripsThrough(const CooperatorKeyring& keyring, const std::string& key_id,
                           const std::vector<uint8_t>& locked_by_that_key,
                           const std::vector<uint8_t>& original) {
        auto removed = keyring.RemoveLock(locked_by_that_key, key_id);
        return removed.IsOk() && removed.Unwrap() == original;
    }

    std::string Serialize(const google::protobuf::MessageLite& message) {
        std::string body;
        REQUIRE(message.SerializeToString(&body));
        return body;
    }

    std::string ErrorBody(std::string_view code, const std::string& message) {
        proto::cooperator::ErrorResponse error;
        error.set_code(std::string(code));
        error.set_message(message);
        return Serialize(error);
    }
}

TEST_CASE("CooperatorKeyring - Lock and unlock with the current key", "[unlock][keyring]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    auto& keyring = *harness.keyring;
    const auto& group = *harness.group;

    SECTION("ApplyLock reports the current key id") {
        auto reply = keyring.ApplyLock(RandomElement(group));
        REQUIRE(reply.IsOk());
        REQUIRE(reply.Unwrap().key_id == keyring.CurrentKeyId());
        REQUIRE(reply.Unwrap().double_blinded_value.size() == group.ElementSize());
    }

    SECTION("RemoveLock inverts ApplyLock") {
        const auto value = RandomElement(group);
        auto reply = keyring.ApplyLock(value).Unwrap();
        REQUIRE(reply.double_blinded_value != value);
        REQUIRE(RoundTripsThrough(keyring, reply.key_id, reply.double_blinded_value, value));
    }

    SECTION("Empty key id is invalid input") {
        auto result = keyring.RemoveLock(RandomElement(group), "");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Never-issued key id is unknown") {
        auto result = keyring.RemoveLock(RandomElement(group), "never-issued");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }

    SECTION("Malformed elements are rejected") {
        std::vector<uint8_t> short_value(group.ElementSize() - 1, 0x05);
        REQUIRE(keyring.ApplyLock(short_value).IsErr());
        std::vector<uint8_t> one(group.ElementSize(), 0x00);
        one.back() = 0x01;
        auto result = keyring.ApplyLock(one);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Key info lists the modulus and current id") {
        const auto info = keyring.GetKeyInfo();
        REQUIRE(info.current_key_id == keyring.CurrentKeyId());
        REQUIRE(info.modulus == group.Modulus().ToBytes());
        REQUIRE(info.grace_key_ids.empty());
    }
}

TEST_CASE("CooperatorKeyring - Rotation and grace", "[unlock][keyring][rotation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Retired key keeps removing locks during grace") {
        auto harness = CooperatorHarness::Create(GracePolicy::Custom(2, std::chrono::hours(1))).Unwrap();
        auto& keyring = *harness.keyring;
        const auto value = RandomElement(*harness.group);
        auto old_reply = keyring.ApplyLock(value).Unwrap();

        auto rotated = keyring.Rotate();
        REQUIRE(rotated.IsOk());
        REQUIRE(rotated.Unwrap() != old_reply.key_id);
        REQUIRE(keyring.CurrentKeyId() == rotated.Unwrap());
        REQUIRE(keyring.GraceSize() == 1);
        REQUIRE(RoundTripsThrough(keyring, old_reply.key_id, old_reply.double_blinded_value, value));

        const auto info = keyring.GetKeyInfo();
        REQUIRE(info.grace_key_ids == std::vector<std::string>{old_reply.key_id});
    }

    SECTION("New locks use the new key") {
        auto harness = CooperatorHarness::Create().Unwrap();
        auto& keyring = *harness.keyring;
        const auto first = keyring.CurrentKeyId();
        const auto second = keyring.Rotate().Unwrap();
        auto reply = keyring.ApplyLock(RandomElement(*harness.group)).Unwrap();
        REQUIRE(reply.key_id == second);
        REQUIRE(reply.key_id != first);
    }

    SECTION("Grace entry past max age is refused before pruning") {
        auto harness = CooperatorHarness::Create(GracePolicy::Custom(4, std::chrono::seconds(60))).Unwrap();
        auto& keyring = *harness.keyring;
        const auto value = RandomElement(*harness.group);
        auto old_reply = keyring.ApplyLock(value).Unwrap();
        (void)keyring.Rotate().Unwrap();

        harness.clock.Advance(std::chrono::seconds(60));
        REQUIRE(keyring.GetKeyInfo().grace_key_ids.size() == 1);
        REQUIRE(RoundTripsThrough(keyring, old_reply.key_id, old_reply.double_blinded_value, value));

        harness.clock.Advance(std::chrono::seconds(1));
        REQUIRE(keyring.GraceSize() == 1);
        REQUIRE(keyring.GetKeyInfo().grace_key_ids.empty());
        auto expired = keyring.RemoveLock(old_reply.double_blinded_value, old_reply.key_id);
        REQUIRE(expired.IsErr());
        REQUIRE(expired.UnwrapErr().type == CustodyFailureType::UnknownKeyId);

        REQUIRE(keyring.PruneGrace() == 1);
        REQUIRE(keyring.GraceSize() == 0);
        REQUIRE(keyring.PruneGrace() == 0);
    }

    SECTION("Grace list keeps only the newest entries") {
        auto harness = CooperatorHarness::Create(GracePolicy::Custom(2, std::chrono::hours(1))).Unwrap();
        auto& keyring = *harness.keyring;
        std::vector<std::string> retired{keyring.CurrentKeyId()};
        for (int i = 0; i < 3; ++i) {
            retired.push_back(keyring.Rotate().Unwrap());
        }
        // retired[3] is current; retired[2] and retired[1] are in grace, newest first.
        const auto info = keyring.GetKeyInfo();
        REQUIRE(info.current_key_id == retired[3]);
        const std::vector<std::string> newest_first{retired[2], retired[1]};
        REQUIRE(info.grace_key_ids == newest_first);

        auto dropped = keyring.RemoveLock(RandomElement(*harness.group), retired[0]);
        REQUIRE(dropped.IsErr());
        REQUIRE(dropped.UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }

    SECTION("No grace retires the previous key immediately") {
        auto harness = CooperatorHarness::Create(GracePolicy::NoGrace()).Unwrap();
        auto& keyring = *harness.keyring;
        const auto old_id = keyring.CurrentKeyId();
        (void)keyring.Rotate().Unwrap();
        REQUIRE(keyring.GraceSize() == 0);
        auto result = keyring.RemoveLock(RandomElement(*harness.group), old_id);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }

    SECTION("Rotation can drop the current key from grace") {
        auto harness = CooperatorHarness::Create().Unwrap();
        (void)harness.keyring->Rotate(false).Unwrap();
        REQUIRE(harness.keyring->GraceSize() == 0);
    }

    SECTION("Grace keys can be revoked individually") {
        auto harness = CooperatorHarness::Create().Unwrap();
        auto& keyring = *harness.keyring;
        const auto old_id = keyring.CurrentKeyId();
        (void)keyring.Rotate().Unwrap();
        REQUIRE(keyring.RemoveGraceKey(old_id));
        REQUIRE_FALSE(keyring.RemoveGraceKey(old_id));
        REQUIRE_FALSE(keyring.RemoveGraceKey(keyring.CurrentKeyId()));
        REQUIRE(keyring.RemoveLock(RandomElement(*harness.group), old_id).IsErr());
    }
}

TEST_CASE("CooperatorService - Routing and status codes", "[unlock][service]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    const auto& service = *harness.service;

    SECTION("Apply succeeds with 200 and a parseable body") {
        proto::cooperator::ApplyLockRequest request;
        const auto value = RandomElement(*harness.group);
        request.set_blinded_value(value.data(), value.size());
        auto response = service.Handle(Cooperator::METHOD_POST, Cooperator::APPLY_LOCK_ROUTE, Serialize(request));
        REQUIRE(response.status == Cooperator::STATUS_OK);
        proto::cooperator::ApplyLockResponse reply;
        REQUIRE(reply.ParseFromString(response.body));
        REQUIRE(reply.key_id() == harness.keyring->CurrentKeyId());
    }

    SECTION("Unknown route is 404 not_found") {
        auto response = service.Handle(Cooperator::METHOD_GET, "/nowhere", "");
        REQUIRE(response.status == Cooperator::STATUS_NOT_FOUND);
        proto::cooperator::ErrorResponse error;
        REQUIRE(error.ParseFromString(response.body));
        REQUIRE(error.code() == Cooperator::ERROR_NOT_FOUND);
    }

    SECTION("Wrong method is 405") {
        REQUIRE(service.Handle(Cooperator::METHOD_GET, Cooperator::APPLY_LOCK_ROUTE, "").status ==
                Cooperator::STATUS_METHOD_NOT_ALLOWED);
        REQUIRE(service.Handle(Cooperator::METHOD_POST, Cooperator::KEY_INFO_ROUTE, "").status ==
                Cooperator::STATUS_METHOD_NOT_ALLOWED);
    }

    SECTION("Empty or malformed bodies are 400") {
        auto empty = service.Handle(Cooperator::METHOD_POST, Cooperator::APPLY_LOCK_ROUTE, "");
        REQUIRE(empty.status == Cooperator::STATUS_BAD_REQUEST);

        proto::cooperator::ApplyLockRequest request;
        request.set_blinded_value("short");
        auto wrong_width = service.Handle(Cooperator::METHOD_POST, Cooperator::APPLY_LOCK_ROUTE, Serialize(request));
        REQUIRE(wrong_width.status == Cooperator::STATUS_BAD_REQUEST);
        proto::cooperator::ErrorResponse error;
        REQUIRE(error.ParseFromString(wrong_width.body));
        REQUIRE(error.code() == Cooperator::ERROR_INVALID_REQUEST);

        proto::cooperator::RemoveLockRequest missing_key;
        const auto value = RandomElement(*harness.group);
        missing_key.set_blinded_value(value.data(), value.size());
        REQUIRE(service.Handle(Cooperator::METHOD_POST, Cooperator::REMOVE_LOCK_ROUTE, Serialize(missing_key)).status ==
                Cooperator::STATUS_BAD_REQUEST);
    }

    SECTION("Unknown key id is 404 unknown_key_id") {
        proto::cooperator::RemoveLockRequest request;
        const auto value = RandomElement(*harness.group);
        request.set_blinded_value(value.data(), value.size());
        request.set_key_id("retired-long-ago");
        auto response = service.Handle(Cooperator::METHOD_POST, Cooperator::REMOVE_LOCK_ROUTE, Serialize(request));
        REQUIRE(response.status == Cooperator::STATUS_NOT_FOUND);
        proto::cooperator::ErrorResponse error;
        REQUIRE(error.ParseFromString(response.body));
        REQUIRE(error.code() == Cooperator::ERROR_UNKNOWN_KEY_ID);
    }

    SECTION("Key info is served over GET") {
        auto response = service.Handle(Cooperator::METHOD_GET, Cooperator::KEY_INFO_ROUTE, "");
        REQUIRE(response.status == Cooperator::STATUS_OK);
        proto::cooperator::KeyInfoResponse info;
        REQUIRE(info.ParseFromString(response.body));
        REQUIRE(info.current_key_id() == harness.keyring->CurrentKeyId());
    }
}

TEST_CASE("CooperatorClient - Status mapping", "[unlock][client]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto harness = CooperatorHarness::Create().Unwrap();
    auto& client = *harness.client;
    auto& transport = *harness.transport;
    const auto value = RandomElement(*harness.group);

    SECTION("Healthy round trip") {
        auto reply = client.ApplyLock(value);
        REQUIRE(reply.IsOk());
        auto removed = client.RemoveLock(reply.Unwrap().double_blinded_value, reply.Unwrap().key_id);
        REQUIRE(removed.IsOk());
        REQUIRE(removed.Unwrap() == value);
        auto info = client.GetKeyInfo();
        REQUIRE(info.IsOk());
        REQUIRE(info.Unwrap().current_key_id == reply.Unwrap().key_id);
    }

    SECTION("Unreachable transport is CooperatorUnavailable") {
        transport.SetReachable(false);
        auto result = client.ApplyLock(value);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::CooperatorUnavailable);
        REQUIRE(client.GetKeyInfo().UnwrapErr().type == CustodyFailureType::CooperatorUnavailable);
    }

    SECTION("Server errors are CooperatorUnavailable") {
        transport.ForceResponse(CooperatorResponse{503, ErrorBody(Cooperator::ERROR_INTERNAL, "overloaded")});
        auto result = client.RemoveLock(value, "any");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::CooperatorUnavailable);
    }

    SECTION("404 unknown_key_id is UnknownKeyId") {
        auto result = client.RemoveLock(value, "never-issued");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::UnknownKeyId);
    }

    SECTION("Plain 404 is not mistaken for an unknown key") {
        transport.ForceResponse(CooperatorResponse{404, ErrorBody(Cooperator::ERROR_NOT_FOUND, "gone")});
        auto result = client.RemoveLock(value, "any");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("400 is InvalidInput") {
        transport.ForceResponse(CooperatorResponse{400, ErrorBody(Cooperator::ERROR_INVALID_REQUEST, "bad")});
        auto result = client.ApplyLock(value);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Malformed success bodies are Decode failures") {
        transport.ForceResponse(CooperatorResponse{200, std::string()});
        REQUIRE(client.ApplyLock(value).UnwrapErr().type == CustodyFailureType::Decode);
        REQUIRE(client.GetKeyInfo().UnwrapErr().type == CustodyFailureType::Decode);

        transport.ForceResponse(CooperatorResponse{200, std::string("\x0a\x05" "ab", 4)});
        REQUIRE(client.RemoveLock(value, "any").UnwrapErr().type == CustodyFailureType::Decode);
    }

    SECTION("Key info carries the group modulus") {
        auto info = client.GetKeyInfo();
        REQUIRE(info.IsOk());
        REQUIRE(info.Unwrap().modulus == harness.group->Modulus().ToBytes());
    }

    SECTION("Modulus below the configured minimum is rejected") {
        proto::cooperator::KeyInfoResponse weak;
        weak.set_current_key_id("k-weak");
        weak.set_modulus(std::string("\x00\xff\xff\xff", 4));
        transport.ForceResponse(CooperatorResponse{200, Serialize(weak)});
        auto info = client.GetKeyInfo();
        REQUIRE(info.IsErr());
        REQUIRE(info.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }

    SECTION("Stricter minimum rejects the test group") {
        CooperatorClient strict(harness.transport,
                                CooperatorConfig::Custom(CooperatorConstants::DEFAULT_REQUEST_TIMEOUT, 1024));
        auto info = strict.GetKeyInfo();
        REQUIRE(info.IsErr());
        REQUIRE(info.UnwrapErr().type == CustodyFailureType::InvalidInput);
    }
}
