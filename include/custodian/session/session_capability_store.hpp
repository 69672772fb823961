#pragma once
#include "custodian/session/one_shot_channel.hpp"
#include "custodian/session/wrap_key_material.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace custodian::session {
using configuration::SessionPolicy;
using crypto::SecureMemoryHandle;

/**
 * TTL- and use-budget-scoped cache of wrap-key seeds, keyed by session id.
 *
 * Holds only the intermediate seed and its salt. Every dispense is a single
 * critical section (lookup, expiry check, budget check, decrement), so N
 * remaining uses can never be served to more than N callers. Expired or
 * exhausted entries are removed by the dispense that observes them.
 */
class SessionCapabilityStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SessionCapabilityStore(Clock clock = {});

    SessionCapabilityStore(const SessionCapabilityStore&) = delete;
    SessionCapabilityStore& operator=(const SessionCapabilityStore&) = delete;

    /// Replaces any capability already held for @p session_id.
    [[nodiscard]] Result<Unit, CustodyFailure> Mint(
        std::string_view session_id,
        SecureMemoryHandle wrap_key_seed,
        std::vector<uint8_t> wrap_key_salt,
        std::chrono::milliseconds ttl,
        uint32_t max_uses);

    [[nodiscard]] Result<Unit, CustodyFailure> Mint(
        std::string_view session_id,
        SecureMemoryHandle wrap_key_seed,
        std::vector<uint8_t> wrap_key_salt,
        const SessionPolicy& policy);

    /// Consumes @p uses and hands the material out over a fresh channel.
    [[nodiscard]] Result<OneShotReceiver<WrapKeyMaterial>, CustodyFailure> Dispense(
        std::string_view session_id,
        uint32_t uses = SessionConstants::DEFAULT_DISPENSE_USES);

    /// Same as Dispense, delivering into a receiver the caller already handed out.
    [[nodiscard]] Result<Unit, CustodyFailure> DispenseInto(
        std::string_view session_id,
        OneShotSender<WrapKeyMaterial> sender,
        uint32_t uses = SessionConstants::DEFAULT_DISPENSE_USES);

    bool Clear(std::string_view session_id);

    void ClearAll();

    [[nodiscard]] bool Contains(std::string_view session_id) const;

    [[nodiscard]] std::optional<uint32_t> RemainingUses(std::string_view session_id) const;

    [[nodiscard]] size_t Size() const;

private:
    struct SessionCapability {
        SecureMemoryHandle wrap_key_seed;
        std::vector<uint8_t> wrap_key_salt;
        std::chrono::milliseconds ttl;
        uint32_t remaining_uses;
        std::chrono::steady_clock::time_point minted_at;
    };

    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, SessionCapability, std::less<>> capabilities_;
};

}
