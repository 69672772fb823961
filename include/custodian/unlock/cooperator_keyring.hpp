#pragma once
#include "custodian/unlock/shamir_three_pass.hpp"
#include "custodian/unlock/cooperator_types.hpp"
#include "custodian/configuration/custody_config.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace custodian::unlock {
using configuration::GracePolicy;

/**
 * Cooperator-side lock keys: one current keypair and a bounded,
 * time-boxed grace list of retired ones.
 *
 * New locks always use the current key. Lock removal is addressed by key
 * id and must match the current key or a grace entry exactly. Rotation
 * holds the writer lock, so every RemoveLock observes the keyring either
 * wholly before or wholly after a rotation.
 */
class CooperatorKeyring {
public:
    using SystemClock = std::function<std::chrono::system_clock::time_point()>;

    [[nodiscard]] static Result<std::unique_ptr<CooperatorKeyring>, CustodyFailure> Create(
        std::shared_ptr<const ShamirThreePass> group,
        GracePolicy grace_policy = GracePolicy::Default(),
        SystemClock clock = {});

    [[nodiscard]] Result<ApplyLockReply, CustodyFailure> ApplyLock(std::span<const uint8_t> blinded_value) const;

    [[nodiscard]] Result<std::vector<uint8_t>, CustodyFailure> RemoveLock(
        std::span<const uint8_t> blinded_value,
        std::string_view key_id) const;

    [[nodiscard]] CooperatorKeyInfo GetKeyInfo() const;

    /// Installs a fresh current key and returns its id.
    [[nodiscard]] Result<std::string, CustodyFailure> Rotate(bool keep_current_in_grace = true);

    /// Drops grace entries older than the policy's max age; returns how many.
    size_t PruneGrace();

    bool RemoveGraceKey(std::string_view key_id);

    [[nodiscard]] std::string CurrentKeyId() const;

    [[nodiscard]] size_t GraceSize() const;

    [[nodiscard]] const ShamirThreePass& Group() const noexcept { return *group_; }

    CooperatorKeyring(const CooperatorKeyring&) = delete;
    CooperatorKeyring& operator=(const CooperatorKeyring&) = delete;

private:
    struct ServerKeypair {
        LockKeys keys;
        std::string key_id;
        std::chrono::system_clock::time_point retired_at;
    };

    CooperatorKeyring(std::shared_ptr<const ShamirThreePass> group,
                      GracePolicy grace_policy,
                      SystemClock clock,
                      ServerKeypair current);

    [[nodiscard]] static Result<ServerKeypair, CustodyFailure> GenerateKeypair(const ShamirThreePass& group);

    [[nodiscard]] const ServerKeypair* FindKey(std::string_view key_id,
                                               std::chrono::system_clock::time_point now) const;

    [[nodiscard]] bool InGrace(const ServerKeypair& entry, std::chrono::system_clock::time_point now) const;
    void PruneGraceLocked(std::chrono::system_clock::time_point now);

    std::shared_ptr<const ShamirThreePass> group_;
    GracePolicy grace_policy_;
    SystemClock clock_;
    mutable std::shared_mutex mutex_;
    ServerKeypair current_;
    std::deque<ServerKeypair> grace_;
};

}
