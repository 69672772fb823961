#include "custodian/unlock/cooperator_keyring.hpp"
#include "custodian/debug/event_logger.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <utility>

namespace custodian::unlock {

CooperatorKeyring::CooperatorKeyring(std::shared_ptr<const ShamirThreePass> group,
                                     GracePolicy grace_policy,
                                     SystemClock clock,
                                     ServerKeypair current)
    : group_(std::move(group))
    , grace_policy_(grace_policy)
    , clock_(std::move(clock))
    , current_(std::move(current)) {
}

Result<std::unique_ptr<CooperatorKeyring>, CustodyFailure> CooperatorKeyring::Create(
    std::shared_ptr<const ShamirThreePass> group,
    GracePolicy grace_policy,
    SystemClock clock) {
    if (!group) {
        return Result<std::unique_ptr<CooperatorKeyring>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Cooperator keyring requires a group"));
    }
    if (!clock) {
        clock = [] { return std::chrono::system_clock::now(); };
    }
    auto keypair = GenerateKeypair(*group);
    if (keypair.IsErr()) {
        return std::move(keypair).PropagateErr<std::unique_ptr<CooperatorKeyring>>();
    }
    CUSTODIAN_LOG_ID(debug::Side::Cooperator, "KEYRING", "initial_key_id", keypair.Unwrap().key_id);
    return Result<std::unique_ptr<CooperatorKeyring>, CustodyFailure>::Ok(
        std::unique_ptr<CooperatorKeyring>(new CooperatorKeyring(
            std::move(group), grace_policy, std::move(clock), std::move(keypair).Unwrap())));
}

Result<CooperatorKeyring::ServerKeypair, CustodyFailure> CooperatorKeyring::GenerateKeypair(
    const ShamirThreePass& group) {
    auto keys = group.GenerateLockKeys();
    if (keys.IsErr()) {
        return std::move(keys).PropagateErr<ServerKeypair>();
    }
    std::string key_id = ShamirThreePass::KeyIdFor(keys.Unwrap());
    return Result<ServerKeypair, CustodyFailure>::Ok(
        ServerKeypair{std::move(keys).Unwrap(), std::move(key_id), {}});
}

Result<ApplyLockReply, CustodyFailure> CooperatorKeyring::ApplyLock(std::span<const uint8_t> blinded_value) const {
    auto value = group_->Decode(blinded_value);
    if (value.IsErr()) {
        return std::move(value).PropagateErr<ApplyLockReply>();
    }

    std::shared_lock lock(mutex_);
    auto locked = group_->ApplyLock(value.Unwrap(), current_.keys);
    if (locked.IsErr()) {
        return std::move(locked).PropagateErr<ApplyLockReply>();
    }
    auto encoded = group_->Encode(locked.Unwrap());
    if (encoded.IsErr()) {
        return std::move(encoded).PropagateErr<ApplyLockReply>();
    }
    return Result<ApplyLockReply, CustodyFailure>::Ok(
        ApplyLockReply{std::move(encoded).Unwrap(), current_.key_id});
}

Result<std::vector<uint8_t>, CustodyFailure> CooperatorKeyring::RemoveLock(
    std::span<const uint8_t> blinded_value,
    std::string_view key_id) const {
    if (key_id.empty()) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Lock removal requires a key id"));
    }
    auto value = group_->Decode(blinded_value);
    if (value.IsErr()) {
        return std::move(value).PropagateErr<std::vector<uint8_t>>();
    }

    const auto now = clock_();
    std::shared_lock lock(mutex_);
    const ServerKeypair* keypair = FindKey(key_id, now);
    if (keypair == nullptr) {
        CUSTODIAN_LOG_ID(debug::Side::Cooperator, "KEYRING", "unknown_key_id", key_id);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::UnknownKeyId(std::format("Key id '{}' is neither current nor in grace", key_id)));
    }
    auto unlocked = group_->RemoveLock(value.Unwrap(), keypair->keys);
    if (unlocked.IsErr()) {
        return std::move(unlocked).PropagateErr<std::vector<uint8_t>>();
    }
    return group_->Encode(unlocked.Unwrap());
}

CooperatorKeyInfo CooperatorKeyring::GetKeyInfo() const {
    const auto now = clock_();
    std::shared_lock lock(mutex_);
    CooperatorKeyInfo info;
    info.current_key_id = current_.key_id;
    info.modulus = group_->Modulus().ToBytes();
    info.grace_key_ids.reserve(grace_.size());
    for (const auto& entry : grace_) {
        if (InGrace(entry, now)) {
            info.grace_key_ids.push_back(entry.key_id);
        }
    }
    return info;
}

Result<std::string, CustodyFailure> CooperatorKeyring::Rotate(bool keep_current_in_grace) {
    auto fresh = GenerateKeypair(*group_);
    if (fresh.IsErr()) {
        return std::move(fresh).PropagateErr<std::string>();
    }
    const auto now = clock_();

    std::unique_lock lock(mutex_);
    ServerKeypair retired = std::exchange(current_, std::move(fresh).Unwrap());
    if (keep_current_in_grace && grace_policy_.MaxEntries() > 0) {
        retired.retired_at = now;
        grace_.push_front(std::move(retired));
        while (grace_.size() > grace_policy_.MaxEntries()) {
            grace_.pop_back();
        }
    }
    PruneGraceLocked(now);
    CUSTODIAN_LOG_ID(debug::Side::Cooperator, "KEYRING", "rotated_to", current_.key_id);
    return Result<std::string, CustodyFailure>::Ok(current_.key_id);
}

size_t CooperatorKeyring::PruneGrace() {
    const auto now = clock_();
    std::unique_lock lock(mutex_);
    const size_t before = grace_.size();
    PruneGraceLocked(now);
    return before - grace_.size();
}

bool CooperatorKeyring::RemoveGraceKey(std::string_view key_id) {
    std::unique_lock lock(mutex_);
    const auto it = std::find_if(grace_.begin(), grace_.end(),
                                 [key_id](const ServerKeypair& entry) { return entry.key_id == key_id; });
    if (it == grace_.end()) {
        return false;
    }
    grace_.erase(it);
    return true;
}

std::string CooperatorKeyring::CurrentKeyId() const {
    std::shared_lock lock(mutex_);
    return current_.key_id;
}

size_t CooperatorKeyring::GraceSize() const {
    std::shared_lock lock(mutex_);
    return grace_.size();
}

const CooperatorKeyring::ServerKeypair* CooperatorKeyring::FindKey(
    std::string_view key_id,
    std::chrono::system_clock::time_point now) const {
    if (current_.key_id == key_id) {
        return &current_;
    }
    for (const auto& entry : grace_) {
        if (entry.key_id != key_id) {
            continue;
        }
        // Past max age counts as pruned even before PruneGrace runs.
        return InGrace(entry, now) ? &entry : nullptr;
    }
    return nullptr;
}

bool CooperatorKeyring::InGrace(const ServerKeypair& entry, std::chrono::system_clock::time_point now) const {
    return now - entry.retired_at <= grace_policy_.MaxAge();
}

void CooperatorKeyring::PruneGraceLocked(std::chrono::system_clock::time_point now) {
    std::erase_if(grace_, [this, now](const ServerKeypair& entry) { return !InGrace(entry, now); });
}

}
