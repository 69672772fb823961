#include "custodian/unlock/cooperator_client.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"
#include "cooperator/lock_exchange.pb.h"

#include <format>

namespace custodian::unlock {
using Cooperator = CooperatorConstants;
using interfaces::CooperatorResponse;

namespace {
    std::vector<uint8_t> ToBytes(const std::string& field) {
        return {field.begin(), field.end()};
    }

    size_t BitLength(std::span<const uint8_t> big_endian) {
        size_t leading = 0;
        while (leading < big_endian.size() && big_endian[leading] == 0) {
            ++leading;
        }
        if (leading == big_endian.size()) {
            return 0;
        }
        size_t bits = (big_endian.size() - leading - 1) * 8;
        for (uint8_t top = big_endian[leading]; top != 0; top >>= 1) {
            ++bits;
        }
        return bits;
    }

    template<typename T>
    Result<T, CustodyFailure> MapErrorStatus(const CooperatorResponse& response, std::string_view route) {
        proto::cooperator::ErrorResponse error;
        const bool has_error = error.ParseFromString(response.body);
        const std::string detail = has_error && !error.message().empty()
                                       ? error.message()
                                       : std::format("status {}", response.status);

        if (response.status >= Cooperator::STATUS_INTERNAL_ERROR) {
            return Result<T, CustodyFailure>::Err(
                CustodyFailure::CooperatorUnavailable(std::format("{} failed: {}", route, detail)));
        }
        if (response.status == Cooperator::STATUS_NOT_FOUND && has_error &&
            error.code() == Cooperator::ERROR_UNKNOWN_KEY_ID) {
            return Result<T, CustodyFailure>::Err(CustodyFailure::UnknownKeyId(detail));
        }
        return Result<T, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(std::format("{} rejected: {}", route, detail)));
    }
}

CooperatorClient::CooperatorClient(std::shared_ptr<interfaces::ICooperatorTransport> transport,
                                   CooperatorConfig config)
    : transport_(std::move(transport))
    , config_(config) {
}

Result<ApplyLockReply, CustodyFailure> CooperatorClient::ApplyLock(std::span<const uint8_t> blinded_value) const {
    proto::cooperator::ApplyLockRequest request;
    request.set_blinded_value(blinded_value.data(), blinded_value.size());
    std::string body;
    if (!request.SerializeToString(&body)) {
        return Result<ApplyLockReply, CustodyFailure>::Err(
            CustodyFailure::Encode("Failed to serialize apply-lock request"));
    }

    auto sent = transport_->Post(config_.ApplyRoute(), body, config_.RequestTimeout());
    if (sent.IsErr()) {
        return Result<ApplyLockReply, CustodyFailure>::Err(
            CustodyFailure::CooperatorUnavailable(sent.UnwrapErr().message));
    }
    const auto& response = sent.Unwrap();
    if (response.status != Cooperator::STATUS_OK) {
        return MapErrorStatus<ApplyLockReply>(response, config_.ApplyRoute());
    }

    proto::cooperator::ApplyLockResponse reply;
    if (!reply.ParseFromString(response.body) || reply.key_id().empty()) {
        return Result<ApplyLockReply, CustodyFailure>::Err(
            CustodyFailure::Decode("Malformed apply-lock response"));
    }
    return Result<ApplyLockReply, CustodyFailure>::Ok(
        ApplyLockReply{ToBytes(reply.double_blinded_value()), reply.key_id()});
}

Result<std::vector<uint8_t>, CustodyFailure> CooperatorClient::RemoveLock(
    std::span<const uint8_t> blinded_value,
    std::string_view key_id) const {
    proto::cooperator::RemoveLockRequest request;
    request.set_blinded_value(blinded_value.data(), blinded_value.size());
    request.set_key_id(std::string(key_id));
    std::string body;
    if (!request.SerializeToString(&body)) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encode("Failed to serialize remove-lock request"));
    }

    auto sent = transport_->Post(config_.RemoveRoute(), body, config_.RequestTimeout());
    if (sent.IsErr()) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::CooperatorUnavailable(sent.UnwrapErr().message));
    }
    const auto& response = sent.Unwrap();
    if (response.status != Cooperator::STATUS_OK) {
        CUSTODIAN_LOG_VALUE(debug::Side::Client, "REMOVE", "status", response.status);
        return MapErrorStatus<std::vector<uint8_t>>(response, config_.RemoveRoute());
    }

    proto::cooperator::RemoveLockResponse reply;
    if (!reply.ParseFromString(response.body)) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decode("Malformed remove-lock response"));
    }
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(ToBytes(reply.value()));
}

Result<CooperatorKeyInfo, CustodyFailure> CooperatorClient::GetKeyInfo() const {
    auto sent = transport_->Get(config_.KeyInfoRoute(), config_.RequestTimeout());
    if (sent.IsErr()) {
        return Result<CooperatorKeyInfo, CustodyFailure>::Err(
            CustodyFailure::CooperatorUnavailable(sent.UnwrapErr().message));
    }
    const auto& response = sent.Unwrap();
    if (response.status != Cooperator::STATUS_OK) {
        return MapErrorStatus<CooperatorKeyInfo>(response, config_.KeyInfoRoute());
    }

    proto::cooperator::KeyInfoResponse reply;
    if (!reply.ParseFromString(response.body) || reply.current_key_id().empty()) {
        return Result<CooperatorKeyInfo, CustodyFailure>::Err(
            CustodyFailure::Decode("Malformed key-info response"));
    }
    const size_t modulus_bits = BitLength(ToBytes(reply.modulus()));
    if (modulus_bits < config_.MinModulusBits()) {
        return Result<CooperatorKeyInfo, CustodyFailure>::Err(CustodyFailure::InvalidInput(
            std::format("Advertised modulus has {} bits, below the {}-bit minimum",
                        modulus_bits, config_.MinModulusBits())));
    }
    CooperatorKeyInfo info;
    info.current_key_id = reply.current_key_id();
    info.modulus = ToBytes(reply.modulus());
    info.grace_key_ids.assign(reply.grace_key_ids().begin(), reply.grace_key_ids().end());
    return Result<CooperatorKeyInfo, CustodyFailure>::Ok(std::move(info));
}

}
