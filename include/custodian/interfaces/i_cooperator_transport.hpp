#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <chrono>
#include <string>
#include <string_view>
namespace custodian::interfaces {
struct CooperatorResponse {
    int status = 0;
    std::string body;
};
/// Request/response carrier to the remote cooperator. Connection failures
/// and timeouts come back as CooperatorUnavailable; any HTTP status,
/// including errors, comes back as Ok.
class ICooperatorTransport {
public:
    virtual ~ICooperatorTransport() = default;
    [[nodiscard]] virtual Result<CooperatorResponse, CustodyFailure> Post(
        std::string_view route, const std::string& body, std::chrono::milliseconds timeout) = 0;
    [[nodiscard]] virtual Result<CooperatorResponse, CustodyFailure> Get(
        std::string_view route, std::chrono::milliseconds timeout) = 0;
};
}
