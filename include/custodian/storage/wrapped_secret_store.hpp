#pragma once
#include "custodian/interfaces/i_wrapped_secret_store.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace custodian::storage {

/// Records kept serialized in memory; used by tests and short-lived tools.
class InMemoryWrappedSecretStore final : public interfaces::IWrappedSecretStore {
public:
    [[nodiscard]] Result<std::optional<AccountRecord>, CustodyFailure> Load(std::string_view account_id) override;
    [[nodiscard]] Result<Unit, CustodyFailure> Save(std::string_view account_id, const AccountRecord& record) override;
    [[nodiscard]] Result<Unit, CustodyFailure> Remove(std::string_view account_id) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> records_;
};

/**
 * One file per account under a directory. Files are named by the hashed
 * account id; each Save writes a temporary file and renames it over the
 * previous record so readers never observe a torn record.
 */
class FileWrappedSecretStore final : public interfaces::IWrappedSecretStore {
public:
    explicit FileWrappedSecretStore(std::filesystem::path directory);

    [[nodiscard]] Result<std::optional<AccountRecord>, CustodyFailure> Load(std::string_view account_id) override;
    [[nodiscard]] Result<Unit, CustodyFailure> Save(std::string_view account_id, const AccountRecord& record) override;
    [[nodiscard]] Result<Unit, CustodyFailure> Remove(std::string_view account_id) override;

    [[nodiscard]] std::filesystem::path RecordPath(std::string_view account_id) const;

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
};

}
