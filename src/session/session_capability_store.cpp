#include "custodian/session/session_capability_store.hpp"
#include "custodian/debug/event_logger.hpp"

#include <format>

namespace custodian::session {

SessionCapabilityStore::SessionCapabilityStore(Clock clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

Result<Unit, CustodyFailure> SessionCapabilityStore::Mint(
    std::string_view session_id,
    SecureMemoryHandle wrap_key_seed,
    std::vector<uint8_t> wrap_key_salt,
    std::chrono::milliseconds ttl,
    uint32_t max_uses) {
    if (session_id.empty()) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Session id cannot be empty"));
    }
    if (wrap_key_seed.IsInvalid() || wrap_key_seed.Size() == 0 || wrap_key_salt.empty()) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Session capability requires a seed and a salt"));
    }
    if (ttl.count() <= 0 || max_uses == 0) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(
                std::format("Session capability needs a positive ttl and use budget, got {}ms / {}",
                            ttl.count(), max_uses)));
    }

    const auto now = clock_();
    std::lock_guard lock(mutex_);
    capabilities_.insert_or_assign(std::string(session_id), SessionCapability{
        std::move(wrap_key_seed),
        std::move(wrap_key_salt),
        ttl,
        max_uses,
        now
    });
    CUSTODIAN_LOG_ID(debug::Side::Client, "SESSION", "minted", session_id);
    CUSTODIAN_LOG_VALUE(debug::Side::Client, "SESSION", "max_uses", max_uses);
    return Result<Unit, CustodyFailure>::Ok(unit);
}

Result<Unit, CustodyFailure> SessionCapabilityStore::Mint(
    std::string_view session_id,
    SecureMemoryHandle wrap_key_seed,
    std::vector<uint8_t> wrap_key_salt,
    const SessionPolicy& policy) {
    return Mint(session_id, std::move(wrap_key_seed), std::move(wrap_key_salt), policy.Ttl(), policy.MaxUses());
}

Result<OneShotReceiver<WrapKeyMaterial>, CustodyFailure> SessionCapabilityStore::Dispense(
    std::string_view session_id,
    uint32_t uses) {
    auto [sender, receiver] = MakeOneShotChannel<WrapKeyMaterial>();
    auto dispensed = DispenseInto(session_id, std::move(sender), uses);
    if (dispensed.IsErr()) {
        return std::move(dispensed).PropagateErr<OneShotReceiver<WrapKeyMaterial>>();
    }
    return Result<OneShotReceiver<WrapKeyMaterial>, CustodyFailure>::Ok(std::move(receiver));
}

Result<Unit, CustodyFailure> SessionCapabilityStore::DispenseInto(
    std::string_view session_id,
    OneShotSender<WrapKeyMaterial> sender,
    uint32_t uses) {
    if (uses == 0) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Dispense must consume at least one use"));
    }

    WrapKeyMaterial material;
    {
        const auto now = clock_();
        std::lock_guard lock(mutex_);
        const auto it = capabilities_.find(session_id);
        if (it == capabilities_.end()) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::NotFound(std::format("No capability for session '{}'", session_id)));
        }
        SessionCapability& capability = it->second;
        if (now >= capability.minted_at + capability.ttl) {
            capabilities_.erase(it);
            CUSTODIAN_LOG_ID(debug::Side::Client, "SESSION", "expired", session_id);
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::Expired(std::format("Capability for session '{}' expired", session_id)));
        }
        if (capability.remaining_uses < uses) {
            capabilities_.erase(it);
            CUSTODIAN_LOG_ID(debug::Side::Client, "SESSION", "exhausted", session_id);
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::Exhausted(std::format("Capability for session '{}' is exhausted", session_id)));
        }

        auto seed = capability.wrap_key_seed.Clone();
        if (seed.IsErr()) {
            return Result<Unit, CustodyFailure>::Err(CustodyFailure::FromSodiumFailure(seed.UnwrapErr()));
        }
        capability.remaining_uses -= uses;
        material.seed = std::move(seed).Unwrap();
        material.salt = capability.wrap_key_salt;
        CUSTODIAN_LOG_VALUE(debug::Side::Client, "SESSION", "remaining_uses", capability.remaining_uses);
    }
    return sender.Send(std::move(material));
}

bool SessionCapabilityStore::Clear(std::string_view session_id) {
    std::lock_guard lock(mutex_);
    const auto it = capabilities_.find(session_id);
    if (it == capabilities_.end()) {
        return false;
    }
    capabilities_.erase(it);
    return true;
}

void SessionCapabilityStore::ClearAll() {
    std::lock_guard lock(mutex_);
    capabilities_.clear();
}

bool SessionCapabilityStore::Contains(std::string_view session_id) const {
    std::lock_guard lock(mutex_);
    return capabilities_.find(session_id) != capabilities_.end();
}

std::optional<uint32_t> SessionCapabilityStore::RemainingUses(std::string_view session_id) const {
    std::lock_guard lock(mutex_);
    const auto it = capabilities_.find(session_id);
    if (it == capabilities_.end()) {
        return std::nullopt;
    }
    return it->second.remaining_uses;
}

size_t SessionCapabilityStore::Size() const {
    std::lock_guard lock(mutex_);
    return capabilities_.size();
}

}
