#pragma once
#include "custodian/unlock/cooperator_keyring.hpp"
#include "custodian/interfaces/i_cooperator_transport.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace custodian::unlock {
using interfaces::CooperatorResponse;

/**
 * Request router for the cooperator endpoints. Bodies are serialized
 * custodian.proto.cooperator messages; errors carry an ErrorResponse.
 *
 *   POST /lock/apply   ApplyLockRequest  -> ApplyLockResponse
 *   POST /lock/remove  RemoveLockRequest -> RemoveLockResponse | 404 unknown_key_id
 *   GET  /key-info                       -> KeyInfoResponse
 */
class CooperatorService {
public:
    explicit CooperatorService(std::shared_ptr<CooperatorKeyring> keyring);

    [[nodiscard]] CooperatorResponse Handle(std::string_view method,
                                            std::string_view route,
                                            const std::string& body) const;

    [[nodiscard]] CooperatorKeyring& Keyring() const noexcept { return *keyring_; }

private:
    [[nodiscard]] CooperatorResponse HandleApply(const std::string& body) const;
    [[nodiscard]] CooperatorResponse HandleRemove(const std::string& body) const;
    [[nodiscard]] CooperatorResponse HandleKeyInfo() const;

    std::shared_ptr<CooperatorKeyring> keyring_;
};

}
