#pragma once
#include "custodian/unlock/wrapped_secret_blob.hpp"
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace custodian::storage {

/// Everything persisted per account. Written whole, never patched.
struct AccountRecord {
    unlock::WrappedSecretBlob blob;
    std::vector<uint8_t> wrap_key_salt;
    std::vector<uint8_t> vrf_public_key;
    std::vector<uint8_t> encrypted_signing_key;
    std::vector<uint8_t> signing_public_key;
    std::string rp_id;
};

/// custodian.proto.storage.WrappedSecretRecord <-> AccountRecord.
class AccountRecordCodec {
public:
    [[nodiscard]] static Result<std::string, CustodyFailure> Encode(const AccountRecord& record);

    /// Rejects records missing any of the wrapped-secret triple or the salt.
    [[nodiscard]] static Result<AccountRecord, CustodyFailure> Decode(const std::string& serialized);

private:
    AccountRecordCodec() = delete;
};

}
