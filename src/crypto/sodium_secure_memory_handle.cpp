#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"

#include <cstring>
#include <format>

namespace custodian::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Allocate(size_t size) {
    if (!SodiumInterop::IsInitialized()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (size == 0) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed("Cannot allocate zero-sized secure memory"));
    }

    void* ptr = SodiumInterop::AllocateSecure(size);
    if (ptr == nullptr) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::AllocationFailed(
                std::format("{}: {} bytes", ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY, size)));
    }
    std::memset(ptr, 0, size);

    return Result<SecureMemoryHandle, SodiumFailure>::Ok(SecureMemoryHandle(ptr, size));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::FromBytes(std::span<const uint8_t> data) {
    auto handle_result = Allocate(data.size());
    if (handle_result.IsErr()) {
        return handle_result;
    }
    auto handle = std::move(handle_result).Unwrap();
    if (auto write_result = handle.Write(data); write_result.IsErr()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(std::move(write_result).UnwrapErr());
    }
    return Result<SecureMemoryHandle, SodiumFailure>::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Release();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(other.ptr_)
    , size_(other.size_) {
    other.ptr_ = nullptr;
    other.size_ = 0;
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Release();
        ptr_ = other.ptr_;
        size_ = other.size_;
        other.ptr_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void SecureMemoryHandle::Release() noexcept {
    if (ptr_ != nullptr) {
        // sodium_free zeroes the region before unmapping it
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Write(std::span<const uint8_t> data) {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (data.size() > size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("{} (data: {}, buffer: {})",
                    ErrorMessages::DATA_EXCEEDS_BUFFER, data.size(), size_)));
    }

    if (!data.empty()) {
        std::memcpy(ptr_, data.data(), data.size());
    }
    if (data.size() < size_) {
        std::memset(static_cast<uint8_t*>(ptr_) + data.size(), 0, size_ - data.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SecureMemoryHandle::Read(std::span<uint8_t> output) const {
    if (IsInvalid()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (output.size() < size_) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooSmall(
                std::format("Output buffer too small (requested: {}, provided: {})",
                    size_, output.size())));
    }

    std::memcpy(output.data(), ptr_, size_);
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, SodiumFailure> SecureMemoryHandle::ReadBytes(size_t size) const {
    if (IsInvalid()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }

    if (size > size_) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(
            SodiumFailure::ReadOperationFailed(
                std::format("{}: requested {} of {} bytes",
                    ErrorMessages::FAILED_TO_READ_SECURE_MEMORY, size, size_)));
    }

    std::vector<uint8_t> result(size);
    if (size > 0) {
        std::memcpy(result.data(), ptr_, size);
    }
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(result));
}

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Clone() const {
    if (IsInvalid()) {
        return Result<SecureMemoryHandle, SodiumFailure>::Err(
            SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED)));
    }
    return FromBytes(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_));
}

} // namespace custodian::crypto
