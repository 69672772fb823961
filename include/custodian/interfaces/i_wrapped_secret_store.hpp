#pragma once
#include "custodian/storage/account_record.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <optional>
#include <string_view>
namespace custodian::interfaces {
/// Durable per-account storage. Save replaces the whole record atomically.
class IWrappedSecretStore {
public:
    virtual ~IWrappedSecretStore() = default;
    [[nodiscard]] virtual Result<std::optional<storage::AccountRecord>, CustodyFailure> Load(
        std::string_view account_id) = 0;
    [[nodiscard]] virtual Result<Unit, CustodyFailure> Save(
        std::string_view account_id, const storage::AccountRecord& record) = 0;
    [[nodiscard]] virtual Result<Unit, CustodyFailure> Remove(std::string_view account_id) = 0;
};
}
