#pragma once

#include "custodian/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace custodian::configuration {

/// Lifetime and use budget of a minted session capability.
///
/// @example
/// ```cpp
/// auto policy = SessionPolicy::Default();            // 5 minutes, 3 uses
/// auto once = SessionPolicy::SingleUse(std::chrono::seconds(30));
/// ```
class SessionPolicy {
public:
    [[nodiscard]] static constexpr SessionPolicy Default() noexcept {
        return SessionPolicy(SessionConstants::DEFAULT_TTL, SessionConstants::DEFAULT_MAX_USES);
    }

    [[nodiscard]] static constexpr SessionPolicy SingleUse(std::chrono::milliseconds ttl) noexcept {
        return SessionPolicy(ttl, 1);
    }

    [[nodiscard]] static constexpr SessionPolicy Custom(std::chrono::milliseconds ttl,
                                                        uint32_t max_uses) noexcept {
        return SessionPolicy(ttl, max_uses);
    }

    [[nodiscard]] constexpr std::chrono::milliseconds Ttl() const noexcept { return ttl_; }
    [[nodiscard]] constexpr uint32_t MaxUses() const noexcept { return max_uses_; }

    [[nodiscard]] constexpr bool operator==(const SessionPolicy& other) const noexcept {
        return ttl_ == other.ttl_ && max_uses_ == other.max_uses_;
    }

private:
    constexpr SessionPolicy(std::chrono::milliseconds ttl, uint32_t max_uses) noexcept
        : ttl_(ttl), max_uses_(max_uses) {}

    std::chrono::milliseconds ttl_;
    uint32_t max_uses_;
};

/// How long retired cooperator keys stay usable for lock removal.
class GracePolicy {
public:
    [[nodiscard]] static constexpr GracePolicy Default() noexcept {
        return GracePolicy(4, std::chrono::hours(24 * 7));
    }

    /// Rotation retires the previous key immediately.
    [[nodiscard]] static constexpr GracePolicy NoGrace() noexcept {
        return GracePolicy(0, std::chrono::seconds(0));
    }

    [[nodiscard]] static constexpr GracePolicy Custom(size_t max_entries,
                                                      std::chrono::seconds max_age) noexcept {
        return GracePolicy(max_entries, max_age);
    }

    [[nodiscard]] constexpr size_t MaxEntries() const noexcept { return max_entries_; }
    [[nodiscard]] constexpr std::chrono::seconds MaxAge() const noexcept { return max_age_; }

private:
    constexpr GracePolicy(size_t max_entries, std::chrono::seconds max_age) noexcept
        : max_entries_(max_entries), max_age_(max_age) {}

    size_t max_entries_;
    std::chrono::seconds max_age_;
};

/// Client-side view of the remote cooperator.
///
/// Each network round-trip carries request_timeout, independent of how long
/// the authentication ceremony is allowed to take.
class CooperatorConfig {
public:
    [[nodiscard]] static constexpr CooperatorConfig Default() noexcept {
        return CooperatorConfig(CooperatorConstants::DEFAULT_REQUEST_TIMEOUT,
                                CooperatorConstants::DEFAULT_MIN_MODULUS_BITS);
    }

    [[nodiscard]] static constexpr CooperatorConfig Custom(std::chrono::milliseconds request_timeout,
                                                           size_t min_modulus_bits) noexcept {
        return CooperatorConfig(request_timeout, min_modulus_bits);
    }

    [[nodiscard]] constexpr std::string_view ApplyRoute() const noexcept {
        return CooperatorConstants::APPLY_LOCK_ROUTE;
    }
    [[nodiscard]] constexpr std::string_view RemoveRoute() const noexcept {
        return CooperatorConstants::REMOVE_LOCK_ROUTE;
    }
    [[nodiscard]] constexpr std::string_view KeyInfoRoute() const noexcept {
        return CooperatorConstants::KEY_INFO_ROUTE;
    }
    [[nodiscard]] constexpr std::chrono::milliseconds RequestTimeout() const noexcept {
        return request_timeout_;
    }
    [[nodiscard]] constexpr size_t MinModulusBits() const noexcept { return min_modulus_bits_; }

private:
    constexpr CooperatorConfig(std::chrono::milliseconds request_timeout, size_t min_modulus_bits) noexcept
        : request_timeout_(request_timeout), min_modulus_bits_(min_modulus_bits) {}

    std::chrono::milliseconds request_timeout_;
    size_t min_modulus_bits_;
};

class ChallengePolicy {
public:
    [[nodiscard]] static constexpr ChallengePolicy Default() noexcept {
        return ChallengePolicy(ChallengeConstants::DEFAULT_DOMAIN_SEPARATOR,
                               ChallengeConstants::DEFAULT_FRESHNESS_WINDOW_BLOCKS);
    }

    [[nodiscard]] static constexpr ChallengePolicy Custom(std::string_view domain_separator,
                                                          uint64_t freshness_window_blocks) noexcept {
        return ChallengePolicy(domain_separator, freshness_window_blocks);
    }

    [[nodiscard]] constexpr std::string_view DomainSeparator() const noexcept { return domain_separator_; }
    [[nodiscard]] constexpr uint64_t FreshnessWindowBlocks() const noexcept { return freshness_window_blocks_; }

private:
    constexpr ChallengePolicy(std::string_view domain_separator, uint64_t freshness_window_blocks) noexcept
        : domain_separator_(domain_separator), freshness_window_blocks_(freshness_window_blocks) {}

    std::string_view domain_separator_;
    uint64_t freshness_window_blocks_;
};

/// Everything KeyCustodian needs to know that is not a collaborator.
struct CustodyConfig {
    SessionPolicy session = SessionPolicy::Default();
    CooperatorConfig cooperator = CooperatorConfig::Default();
    ChallengePolicy challenge = ChallengePolicy::Default();

    [[nodiscard]] static constexpr CustodyConfig Default() noexcept {
        return CustodyConfig{};
    }
};

} // namespace custodian::configuration
