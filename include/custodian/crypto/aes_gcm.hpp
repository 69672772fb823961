#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace custodian::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Encrypt/Decrypt take an explicit 12-byte nonce and produce or consume
 * `ciphertext || tag`. Every key in this library is used for a handful of
 * messages at most (the lock AEAD key and the KEK wrap one value each), so
 * Seal/Open draw a random nonce per call and prepend it:
 *
 *   [0..11]   nonce
 *   [12..n]   ciphertext
 *   [n..n+16] tag
 *
 * The signing-key sealer passes the public key as associated data, so a
 * sealed secret cannot be paired with another account's public key.
 */
class AesGcm {
public:
    /**
     * @brief Encrypt with a caller-chosen nonce
     *
     * @param key 32-byte key
     * @param nonce 12-byte nonce, never reused under the same key
     * @param plaintext Data to encrypt
     * @param associated_data Authenticated but not encrypted
     * @return Ok(ciphertext || tag) or Err(Encryption)
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /**
     * @brief Decrypt and authenticate
     *
     * @param key 32-byte key
     * @param nonce Nonce used at encryption
     * @param ciphertext_with_tag Output of Encrypt
     * @param associated_data Must equal the data given to Encrypt
     * @return Ok(plaintext), or Err(Decryption) on any tag mismatch
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

    /**
     * @brief Encrypt under a random nonce and prepend it
     *
     * @return Ok(nonce || ciphertext || tag) or Err
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /**
     * @brief Reverse of Seal
     *
     * @param sealed Output of Seal; shorter than nonce plus tag is Err(Decryption)
     * @return Ok(plaintext) or Err
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, CustodyFailure>
    Open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
