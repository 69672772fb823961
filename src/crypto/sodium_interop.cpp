#include "custodian/crypto/sodium_interop.hpp"

#include <format>

namespace custodian::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}", buffer.size(), MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        WipeSmallBuffer(buffer);
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) + ": " +
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    // Lengths are public; only contents are compared in constant time
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Randomness and Hashing
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    if (size > 0) {
        randombytes_buf(buffer.data(), size);
    }
    return buffer;
}

std::vector<uint8_t> SodiumInterop::Sha256(std::initializer_list<std::span<const uint8_t>> parts) {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    for (const auto part : parts) {
        crypto_hash_sha256_update(&state, part.data(), part.size());
    }
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state, digest.data());
    sodium_memzero(&state, sizeof(state));
    return digest;
}

std::vector<uint8_t> SodiumInterop::Sha512(std::initializer_list<std::span<const uint8_t>> parts) {
    crypto_hash_sha512_state state;
    crypto_hash_sha512_init(&state);
    for (const auto part : parts) {
        crypto_hash_sha512_update(&state, part.data(), part.size());
    }
    std::vector<uint8_t> digest(crypto_hash_sha512_BYTES);
    crypto_hash_sha512_final(&state, digest.data());
    sodium_memzero(&state, sizeof(state));
    return digest;
}

std::string SodiumInterop::ToBase64Url(std::span<const uint8_t> data) {
    constexpr int variant = sodium_base64_VARIANT_URLSAFE_NO_PADDING;
    std::string encoded(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), variant);
    // sodium_base64_ENCODED_LEN counts the terminating NUL
    encoded.resize(encoded.size() - 1);
    return encoded;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace custodian::crypto
