#pragma once

#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"

#include <span>
#include <string_view>
#include <vector>
#include <cstdint>

namespace custodian::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Extract and expand run as one operation. Every derivation in the
 * custody pipeline goes through here with its own info label:
 * - "wrap-pass": pass factor from the authenticator secret
 * - "wrap-seed": wrap-key seed from pass factor and long-term secret
 * - "near-kek": KEK from the wrap-key seed and the stored salt
 * - "kek-aead": AES key from the cooperator KEK
 */
class Hkdf {
public:
    /**
     * @brief Derive into a caller-owned buffer
     *
     * Used when the output lands directly in secure memory.
     *
     * @param ikm Input key material, must not be empty
     * @param output Buffer to fill, at most MAX_OUTPUT_LEN bytes
     * @param salt Optional salt (empty means none)
     * @param info Domain label separating this derivation from the others
     * @return Ok on success, Err(DeriveKey) on failure
     */
    static Result<Unit, CustodyFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief Derive and return a freshly allocated key
     *
     * @param ikm Input key material
     * @param output_size Desired output size in bytes
     * @param salt Optional salt
     * @param info Optional domain label
     * @return Ok(derived_key) or Err
     */
    static Result<std::vector<uint8_t>, CustodyFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Same as DeriveKeyBytes with a textual info label.
    static Result<std::vector<uint8_t>, CustodyFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;  // RFC 5869 limit

private:
    Hkdf() = delete;
};

} // namespace custodian::crypto
