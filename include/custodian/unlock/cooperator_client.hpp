#pragma once
#include "custodian/unlock/cooperator_types.hpp"
#include "custodian/interfaces/i_cooperator_transport.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace custodian::unlock {
using configuration::CooperatorConfig;

/**
 * Typed calls to the remote cooperator.
 *
 * Status mapping: 404 with code unknown_key_id -> UnknownKeyId; other 4xx
 * -> InvalidInput; transport failures and 5xx -> CooperatorUnavailable.
 * Every call carries the configured per-request timeout.
 */
class CooperatorClient {
public:
    CooperatorClient(std::shared_ptr<interfaces::ICooperatorTransport> transport,
                     CooperatorConfig config = CooperatorConfig::Default());

    [[nodiscard]] Result<ApplyLockReply, CustodyFailure> ApplyLock(std::span<const uint8_t> blinded_value) const;

    [[nodiscard]] Result<std::vector<uint8_t>, CustodyFailure> RemoveLock(
        std::span<const uint8_t> blinded_value,
        std::string_view key_id) const;

    [[nodiscard]] Result<CooperatorKeyInfo, CustodyFailure> GetKeyInfo() const;

    [[nodiscard]] const CooperatorConfig& Config() const noexcept { return config_; }

private:
    std::shared_ptr<interfaces::ICooperatorTransport> transport_;
    CooperatorConfig config_;
};

}
