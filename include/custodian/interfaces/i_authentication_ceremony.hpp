#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
namespace custodian::interfaces {
enum class CeremonyKind {
    Registration,
    Authentication,
    Recovery
};
struct CeremonyRequest {
    CeremonyKind kind = CeremonyKind::Authentication;
    std::string account_id;
    std::string rp_id;
    // VRF output presented to the authenticator; empty for registration.
    std::vector<uint8_t> challenge;
};
struct CeremonyResult {
    bool presence_confirmed = false;
    std::vector<uint8_t> primary_secret;
    // Only populated for registration and recovery ceremonies.
    std::optional<std::vector<uint8_t>> secondary_secret;
    std::vector<uint8_t> assertion;
};
/**
 * User-interactive authentication (platform authenticator, passkey, ...).
 *
 * Perform may block for as long as the user takes. Implementations must
 * return promptly once @p stop is requested; the caller reports Cancelled
 * regardless of what is returned after that point.
 */
class IAuthenticationCeremony {
public:
    virtual ~IAuthenticationCeremony() = default;
    [[nodiscard]] virtual Result<CeremonyResult, CustodyFailure> Perform(
        const CeremonyRequest& request, std::stop_token stop) = 0;
};
}
