#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include "custodian/challenge/challenge_input.hpp"
#include <cstdint>
#include <span>
namespace custodian::interfaces {
/// Remote check of a ceremony: proof validity, freshness window and binding
/// of the output to the assertion the authenticator signed.
class IVerificationOracle {
public:
    virtual ~IVerificationOracle() = default;
    [[nodiscard]] virtual Result<Unit, CustodyFailure> Verify(
        const challenge::ChallengeInput& input,
        const challenge::VrfProof& proof,
        std::span<const uint8_t> ceremony_assertion) = 0;
};
}
