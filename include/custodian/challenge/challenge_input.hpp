#pragma once
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace custodian::challenge {
    using crypto::SecureMemoryHandle;

    /// Caller-supplied facts a challenge is bound to. The block must come from
    /// the chain oracle; the verifier enforces how old it may be.
    struct ChallengeContext {
        std::string user_id;
        std::string rp_id;
        uint64_t block_height = 0;
        std::vector<uint8_t> block_hash;
        std::optional<std::vector<uint8_t>> intent_digest;
        std::optional<std::vector<uint8_t>> session_policy_digest;
    };

    /**
     * Canonical, immutable challenge input. Only ChallengeEngine builds these;
     * the digest is fixed at construction and never recomputed.
     */
    class ChallengeInput {
    public:
        [[nodiscard]] const std::string &DomainSeparator() const noexcept { return domain_separator_; }
        [[nodiscard]] const std::string &UserId() const noexcept { return user_id_; }
        [[nodiscard]] const std::string &RpId() const noexcept { return rp_id_; }
        [[nodiscard]] uint64_t BlockHeight() const noexcept { return block_height_; }
        [[nodiscard]] std::span<const uint8_t> BlockHash() const noexcept { return block_hash_; }
        [[nodiscard]] const std::optional<std::vector<uint8_t>> &IntentDigest() const noexcept {
            return intent_digest_;
        }
        [[nodiscard]] const std::optional<std::vector<uint8_t>> &SessionPolicyDigest() const noexcept {
            return session_policy_digest_;
        }
        /// SHA-256 of the canonical encoding; this is the VRF alpha string.
        [[nodiscard]] std::span<const uint8_t> Digest() const noexcept { return digest_; }

    private:
        friend class ChallengeEngine;
        ChallengeInput() = default;

        std::string domain_separator_;
        std::string user_id_;
        std::string rp_id_;
        uint64_t block_height_ = 0;
        std::vector<uint8_t> block_hash_;
        std::optional<std::vector<uint8_t>> intent_digest_;
        std::optional<std::vector<uint8_t>> session_policy_digest_;
        std::vector<uint8_t> digest_;
    };

    struct VrfProof {
        std::vector<uint8_t> output;
        std::vector<uint8_t> proof;
        std::vector<uint8_t> public_key;
    };

    struct VrfKeyPair {
        SecureMemoryHandle secret_key;
        std::vector<uint8_t> public_key;
    };
}
