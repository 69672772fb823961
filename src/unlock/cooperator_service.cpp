#include "custodian/unlock/cooperator_service.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"
#include "cooperator/lock_exchange.pb.h"

namespace custodian::unlock {
using Cooperator = CooperatorConstants;

namespace {
    CooperatorResponse ErrorReply(int status, std::string_view code, const std::string& message) {
        proto::cooperator::ErrorResponse error;
        error.set_code(std::string(code));
        error.set_message(message);
        std::string serialized;
        if (!error.SerializeToString(&serialized)) {
            serialized.clear();
        }
        return CooperatorResponse{status, std::move(serialized)};
    }

    template<typename Message>
    CooperatorResponse OkReply(const Message& message) {
        std::string serialized;
        if (!message.SerializeToString(&serialized)) {
            return ErrorReply(Cooperator::STATUS_INTERNAL_ERROR, Cooperator::ERROR_INTERNAL,
                              "Failed to serialize response");
        }
        return CooperatorResponse{Cooperator::STATUS_OK, std::move(serialized)};
    }

    CooperatorResponse FailureReply(const CustodyFailure& failure) {
        switch (failure.type) {
            case CustodyFailureType::UnknownKeyId:
                return ErrorReply(Cooperator::STATUS_NOT_FOUND, Cooperator::ERROR_UNKNOWN_KEY_ID, failure.message);
            case CustodyFailureType::InvalidInput:
            case CustodyFailureType::Decode:
                return ErrorReply(Cooperator::STATUS_BAD_REQUEST, Cooperator::ERROR_INVALID_REQUEST, failure.message);
            default:
                return ErrorReply(Cooperator::STATUS_INTERNAL_ERROR, Cooperator::ERROR_INTERNAL, failure.message);
        }
    }
}

CooperatorService::CooperatorService(std::shared_ptr<CooperatorKeyring> keyring)
    : keyring_(std::move(keyring)) {
}

CooperatorResponse CooperatorService::Handle(std::string_view method,
                                             std::string_view route,
                                             const std::string& body) const {
    if (route == Cooperator::APPLY_LOCK_ROUTE || route == Cooperator::REMOVE_LOCK_ROUTE) {
        if (method != Cooperator::METHOD_POST) {
            return ErrorReply(Cooperator::STATUS_METHOD_NOT_ALLOWED, Cooperator::ERROR_METHOD,
                              "Lock routes accept POST only");
        }
        return route == Cooperator::APPLY_LOCK_ROUTE ? HandleApply(body) : HandleRemove(body);
    }
    if (route == Cooperator::KEY_INFO_ROUTE) {
        if (method != Cooperator::METHOD_GET) {
            return ErrorReply(Cooperator::STATUS_METHOD_NOT_ALLOWED, Cooperator::ERROR_METHOD,
                              "Key info accepts GET only");
        }
        return HandleKeyInfo();
    }
    return ErrorReply(Cooperator::STATUS_NOT_FOUND, Cooperator::ERROR_NOT_FOUND,
                      "No such route: " + std::string(route));
}

CooperatorResponse CooperatorService::HandleApply(const std::string& body) const {
    proto::cooperator::ApplyLockRequest request;
    if (!request.ParseFromString(body) || request.blinded_value().empty()) {
        return ErrorReply(Cooperator::STATUS_BAD_REQUEST, Cooperator::ERROR_INVALID_REQUEST,
                          "Malformed apply-lock request");
    }
    const auto& blinded = request.blinded_value();
    auto reply = keyring_->ApplyLock(std::span(reinterpret_cast<const uint8_t*>(blinded.data()), blinded.size()));
    if (reply.IsErr()) {
        return FailureReply(reply.UnwrapErr());
    }
    proto::cooperator::ApplyLockResponse response;
    const auto& value = reply.Unwrap().double_blinded_value;
    response.set_double_blinded_value(value.data(), value.size());
    response.set_key_id(reply.Unwrap().key_id);
    CUSTODIAN_LOG_ID(debug::Side::Cooperator, "APPLY", "key_id", reply.Unwrap().key_id);
    return OkReply(response);
}

CooperatorResponse CooperatorService::HandleRemove(const std::string& body) const {
    proto::cooperator::RemoveLockRequest request;
    if (!request.ParseFromString(body) || request.blinded_value().empty() || request.key_id().empty()) {
        return ErrorReply(Cooperator::STATUS_BAD_REQUEST, Cooperator::ERROR_INVALID_REQUEST,
                          "Malformed remove-lock request");
    }
    const auto& blinded = request.blinded_value();
    auto value = keyring_->RemoveLock(
        std::span(reinterpret_cast<const uint8_t*>(blinded.data()), blinded.size()), request.key_id());
    if (value.IsErr()) {
        return FailureReply(value.UnwrapErr());
    }
    proto::cooperator::RemoveLockResponse response;
    response.set_value(value.Unwrap().data(), value.Unwrap().size());
    CUSTODIAN_LOG_ID(debug::Side::Cooperator, "REMOVE", "key_id", request.key_id());
    return OkReply(response);
}

CooperatorResponse CooperatorService::HandleKeyInfo() const {
    const auto info = keyring_->GetKeyInfo();
    proto::cooperator::KeyInfoResponse response;
    response.set_current_key_id(info.current_key_id);
    response.set_modulus(info.modulus.data(), info.modulus.size());
    for (const auto& key_id : info.grace_key_ids) {
        response.add_grace_key_ids(key_id);
    }
    return OkReply(response);
}

}
