#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>
namespace custodian {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t SHA_256_SIZE = 32;
    static constexpr size_t SHA_512_SIZE = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct VrfConstants {
    static constexpr size_t SEED_SIZE = 32;
    static constexpr size_t SCALAR_SIZE = 32;
    static constexpr size_t NONREDUCED_SCALAR_SIZE = 64;
    static constexpr size_t POINT_SIZE = 32;
    static constexpr size_t CHALLENGE_SIZE = 16;
    static constexpr size_t PROOF_SIZE = POINT_SIZE + CHALLENGE_SIZE + SCALAR_SIZE;
    static constexpr size_t OUTPUT_SIZE = 64;
    static constexpr uint8_t SUITE = 0x04;
    static constexpr uint8_t HASH_TO_CURVE_DOMAIN = 0x01;
    static constexpr uint8_t CHALLENGE_DOMAIN = 0x02;
    static constexpr uint8_t PROOF_TO_HASH_DOMAIN = 0x03;
    static constexpr uint8_t DOMAIN_TRAILER = 0x00;
    static constexpr uint8_t COFACTOR = 8;
};
struct ChallengeConstants {
    static constexpr std::string_view DEFAULT_DOMAIN_SEPARATOR = "custodian_vrf_challenge_v1";
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BLOCK_HEIGHT_SIZE = 8;
    static constexpr uint8_t DIGEST_ABSENT_TAG = 0x00;
    static constexpr uint8_t DIGEST_PRESENT_TAG = 0x01;
    static constexpr uint64_t DEFAULT_FRESHNESS_WINDOW_BLOCKS = 100;
};
struct DerivationConstants {
    static constexpr size_t OUTPUT_SIZE = 32;
    static constexpr size_t WRAP_KEY_SALT_SIZE = 32;
    static constexpr std::string_view PASS_FACTOR_INFO = "wrap-pass";
    static constexpr std::string_view WRAP_KEY_SEED_INFO = "wrap-seed";
    static constexpr std::string_view KEK_INFO = "near-kek";
    static constexpr std::string_view RECOVERY_SEED_INFO = "recovery-seed";
    static constexpr std::string_view LOCK_AEAD_INFO = "kek-aead";
};
struct CooperatorConstants {
    static constexpr std::string_view APPLY_LOCK_ROUTE = "/lock/apply";
    static constexpr std::string_view REMOVE_LOCK_ROUTE = "/lock/remove";
    static constexpr std::string_view KEY_INFO_ROUTE = "/key-info";
    static constexpr std::string_view METHOD_GET = "GET";
    static constexpr std::string_view METHOD_POST = "POST";
    static constexpr std::string_view ERROR_UNKNOWN_KEY_ID = "unknown_key_id";
    static constexpr std::string_view ERROR_INVALID_REQUEST = "invalid_request";
    static constexpr std::string_view ERROR_NOT_FOUND = "not_found";
    static constexpr std::string_view ERROR_METHOD = "method_not_allowed";
    static constexpr std::string_view ERROR_INTERNAL = "internal";
    static constexpr int STATUS_OK = 200;
    static constexpr int STATUS_BAD_REQUEST = 400;
    static constexpr int STATUS_NOT_FOUND = 404;
    static constexpr int STATUS_METHOD_NOT_ALLOWED = 405;
    static constexpr int STATUS_INTERNAL_ERROR = 500;
    static constexpr size_t DEFAULT_MIN_MODULUS_BITS = 256;
    static constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT{5000};
};
struct SessionConstants {
    static constexpr std::chrono::milliseconds DEFAULT_TTL{5 * 60 * 1000};
    static constexpr uint32_t DEFAULT_MAX_USES = 3;
    static constexpr uint32_t DEFAULT_DISPENSE_USES = 1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view AES_GCM_DECRYPTION_FAILED = "AES-GCM decryption failed (authentication tag mismatch)";
    static constexpr std::string_view CHANNEL_SENDER_USED = "One-shot sender already used";
    static constexpr std::string_view CHANNEL_RECEIVER_USED = "One-shot receiver already used";
    static constexpr std::string_view CHANNEL_CLOSED = "Channel closed before delivery";
};
}
