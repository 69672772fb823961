#include "custodian/storage/wrapped_secret_store.hpp"
#include "custodian/crypto/sodium_interop.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace custodian::storage {
using crypto::SodiumInterop;

namespace {
    constexpr std::string_view kRecordExtension = ".record";
    constexpr std::string_view kTemporaryExtension = ".tmp";

    std::span<const uint8_t> AsBytes(std::string_view text) {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }
}

Result<std::optional<AccountRecord>, CustodyFailure> InMemoryWrappedSecretStore::Load(std::string_view account_id) {
    std::lock_guard lock(mutex_);
    const auto it = records_.find(account_id);
    if (it == records_.end()) {
        return Result<std::optional<AccountRecord>, CustodyFailure>::Ok(std::nullopt);
    }
    auto record = AccountRecordCodec::Decode(it->second);
    if (record.IsErr()) {
        return std::move(record).PropagateErr<std::optional<AccountRecord>>();
    }
    return Result<std::optional<AccountRecord>, CustodyFailure>::Ok(std::move(record).Unwrap());
}

Result<Unit, CustodyFailure> InMemoryWrappedSecretStore::Save(std::string_view account_id, const AccountRecord& record) {
    auto serialized = AccountRecordCodec::Encode(record);
    if (serialized.IsErr()) {
        return std::move(serialized).PropagateErr<Unit>();
    }
    std::lock_guard lock(mutex_);
    records_.insert_or_assign(std::string(account_id), std::move(serialized).Unwrap());
    return Result<Unit, CustodyFailure>::Ok(unit);
}

Result<Unit, CustodyFailure> InMemoryWrappedSecretStore::Remove(std::string_view account_id) {
    std::lock_guard lock(mutex_);
    if (const auto it = records_.find(account_id); it != records_.end()) {
        records_.erase(it);
    }
    return Result<Unit, CustodyFailure>::Ok(unit);
}

FileWrappedSecretStore::FileWrappedSecretStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

std::filesystem::path FileWrappedSecretStore::RecordPath(std::string_view account_id) const {
    const auto digest = SodiumInterop::Sha256({AsBytes(account_id)});
    return directory_ / (SodiumInterop::ToBase64Url(digest) + std::string(kRecordExtension));
}

Result<std::optional<AccountRecord>, CustodyFailure> FileWrappedSecretStore::Load(std::string_view account_id) {
    const auto path = RecordPath(account_id);
    std::lock_guard lock(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return Result<std::optional<AccountRecord>, CustodyFailure>::Err(
                CustodyFailure::Storage(std::format("Cannot stat {}: {}", path.string(), ec.message())));
        }
        return Result<std::optional<AccountRecord>, CustodyFailure>::Ok(std::nullopt);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::optional<AccountRecord>, CustodyFailure>::Err(
            CustodyFailure::Storage(std::format("Cannot open {}", path.string())));
    }
    std::string serialized((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::optional<AccountRecord>, CustodyFailure>::Err(
            CustodyFailure::Storage(std::format("Failed reading {}", path.string())));
    }
    auto record = AccountRecordCodec::Decode(serialized);
    if (record.IsErr()) {
        return std::move(record).PropagateErr<std::optional<AccountRecord>>();
    }
    return Result<std::optional<AccountRecord>, CustodyFailure>::Ok(std::move(record).Unwrap());
}

Result<Unit, CustodyFailure> FileWrappedSecretStore::Save(std::string_view account_id, const AccountRecord& record) {
    auto serialized = AccountRecordCodec::Encode(record);
    if (serialized.IsErr()) {
        return std::move(serialized).PropagateErr<Unit>();
    }
    const auto path = RecordPath(account_id);
    auto temporary = path;
    temporary += std::string(kTemporaryExtension);

    std::lock_guard lock(mutex_);
    std::error_code ec;
    (void)std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::Storage(std::format("Cannot create {}: {}", directory_.string(), ec.message())));
    }
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::Storage(std::format("Cannot open {}", temporary.string())));
        }
        const auto& bytes = serialized.Unwrap();
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            out.close();
            (void)std::filesystem::remove(temporary, ec);
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::Storage(std::format("Failed writing {}", temporary.string())));
        }
    }
    std::filesystem::rename(temporary, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        (void)std::filesystem::remove(temporary, ec);
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::Storage(std::format("Cannot replace {}: {}", path.string(), reason)));
    }
    return Result<Unit, CustodyFailure>::Ok(unit);
}

Result<Unit, CustodyFailure> FileWrappedSecretStore::Remove(std::string_view account_id) {
    const auto path = RecordPath(account_id);
    std::lock_guard lock(mutex_);
    std::error_code ec;
    (void)std::filesystem::remove(path, ec);
    if (ec) {
        return Result<Unit, CustodyFailure>::Err(
            CustodyFailure::Storage(std::format("Cannot remove {}: {}", path.string(), ec.message())));
    }
    return Result<Unit, CustodyFailure>::Ok(unit);
}

}
