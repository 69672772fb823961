#include "custodian/crypto/hkdf.hpp"
#include "custodian/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <format>
#include <memory>

namespace custodian::crypto {
using OpenSSL = OpenSSLConstants;

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            EVP_KDF_free(kdf);
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            EVP_KDF_CTX_free(ctx);
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, CustodyFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput(
                std::format("HKDF output size must be in [1, {}], got {}", MAX_OUTPUT_LEN, output.size())));
    }
    if (ikm.empty()) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, OpenSSL::ALGORITHM_HKDF.data(), nullptr));
    if (!kdf) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::DeriveKey("Failed to fetch HKDF algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::DeriveKey("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSL::PARAM_DIGEST.data(), const_cast<char*>(OpenSSL::ALGORITHM_SHA256.data()), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSL::PARAM_KEY.data(), const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSL::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSL::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSL::SUCCESS) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::DeriveKey("HKDF key derivation failed"));
    }
    return Result<Unit, CustodyFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, CustodyFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    if (auto result = DeriveKey(ikm, output, salt, info); result.IsErr()) {
        return Result<std::vector<uint8_t>, CustodyFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, CustodyFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, CustodyFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view info) {

    return DeriveKeyBytes(
        ikm, output_size, salt,
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(info.data()), info.size()));
}

} // namespace custodian::crypto
