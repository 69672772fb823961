#pragma once
#include "custodian/interfaces/i_authentication_ceremony.hpp"
#include <algorithm>
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace custodian::test_helpers {

using interfaces::CeremonyKind;
using interfaces::CeremonyRequest;
using interfaces::CeremonyResult;
using interfaces::IAuthenticationCeremony;

/**
 * Authenticator stand-in with fixed secrets. The assertion it returns is the
 * challenge it was asked to sign, which is what LocalVerificationOracle
 * compares against the VRF output.
 */
class ScriptedCeremony : public IAuthenticationCeremony {
public:
    ScriptedCeremony(std::vector<uint8_t> primary_secret, std::vector<uint8_t> secondary_secret)
        : primary_secret_(std::move(primary_secret))
        , secondary_secret_(std::move(secondary_secret)) {}

    void SetPrimarySecret(std::vector<uint8_t> secret) {
        std::lock_guard lock(mutex_);
        primary_secret_ = std::move(secret);
    }

    void SetPresenceConfirmed(const bool confirmed) {
        std::lock_guard lock(mutex_);
        presence_confirmed_ = confirmed;
    }

    void FailWith(std::optional<CustodyFailure> failure) {
        std::lock_guard lock(mutex_);
        failure_ = std::move(failure);
    }

    void OmitSecondarySecret(const bool omit) {
        std::lock_guard lock(mutex_);
        omit_secondary_ = omit;
    }

    /// The next ceremony requests a stop on @p source before returning, as a
    /// user dismissing the prompt would.
    void CancelVia(std::stop_source source) {
        std::lock_guard lock(mutex_);
        cancel_source_ = std::move(source);
    }

    [[nodiscard]] std::vector<CeremonyRequest> Requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    [[nodiscard]] size_t CountOf(const CeremonyKind kind) const {
        std::lock_guard lock(mutex_);
        return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(),
            [kind](const CeremonyRequest& request) { return request.kind == kind; }));
    }

    [[nodiscard]] Result<CeremonyResult, CustodyFailure> Perform(
        const CeremonyRequest& request, std::stop_token) override {
        std::lock_guard lock(mutex_);
        requests_.push_back(request);
        if (cancel_source_.has_value()) {
            cancel_source_->request_stop();
            cancel_source_.reset();
        }
        if (failure_.has_value()) {
            return Result<CeremonyResult, CustodyFailure>::Err(*failure_);
        }
        CeremonyResult result;
        result.presence_confirmed = presence_confirmed_;
        result.primary_secret = primary_secret_;
        if (!omit_secondary_) {
            result.secondary_secret = secondary_secret_;
        }
        result.assertion = request.challenge;
        return Result<CeremonyResult, CustodyFailure>::Ok(std::move(result));
    }

private:
    mutable std::mutex mutex_;
    std::vector<uint8_t> primary_secret_;
    std::vector<uint8_t> secondary_secret_;
    bool presence_confirmed_ = true;
    bool omit_secondary_ = false;
    std::optional<CustodyFailure> failure_;
    std::optional<std::stop_source> cancel_source_;
    std::vector<CeremonyRequest> requests_;
};

}
