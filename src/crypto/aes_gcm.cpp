#include "custodian/crypto/aes_gcm.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <format>
#include <memory>
namespace custodian::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    Result<Unit, CustodyFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::InvalidInput(
                    std::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::InvalidInput(
                    std::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, CustodyFailure>::Ok(unit);
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        (void)SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
    }
}
Result<std::vector<uint8_t>, CustodyFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return std::move(valid).PropagateErr<std::vector<uint8_t>>();
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encryption(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encryption(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::Encryption(
                    std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encryption(
                std::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encryption(
                std::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Encryption(
                std::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CustodyFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return std::move(valid).PropagateErr<std::vector<uint8_t>>();
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(
                std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(
                std::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(
                std::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, CustodyFailure>::Err(
                CustodyFailure::Decryption(
                    std::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    // One spare byte keeps output.data() valid for an empty plaintext
    std::vector<uint8_t> output(ciphertext_len + 1);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(
                std::format("Decryption failed: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(
                std::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    output.resize(static_cast<size_t>(plaintext_len + final_len));
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, CustodyFailure>
AesGcm::Seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    auto nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto encrypted = Encrypt(key, nonce, plaintext, associated_data);
    if (encrypted.IsErr()) {
        return encrypted;
    }
    auto body = std::move(encrypted).Unwrap();
    std::vector<uint8_t> sealed;
    sealed.reserve(nonce.size() + body.size());
    sealed.insert(sealed.end(), nonce.begin(), nonce.end());
    sealed.insert(sealed.end(), body.begin(), body.end());
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(sealed));
}
Result<std::vector<uint8_t>, CustodyFailure>
AesGcm::Open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> associated_data) {
    if (sealed.size() < Constants::AES_GCM_NONCE_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(
            CustodyFailure::Decryption(
                std::format("Sealed payload too small: {} bytes", sealed.size())));
    }
    return Decrypt(key,
                   sealed.subspan(0, Constants::AES_GCM_NONCE_SIZE),
                   sealed.subspan(Constants::AES_GCM_NONCE_SIZE),
                   associated_data);
}
}
