#include "custodian/storage/account_record.hpp"
#include "storage/wrapped_secret_record.pb.h"

namespace custodian::storage {

namespace {
    std::vector<uint8_t> ToBytes(const std::string& field) {
        return {field.begin(), field.end()};
    }
}

Result<std::string, CustodyFailure> AccountRecordCodec::Encode(const AccountRecord& record) {
    proto::storage::WrappedSecretRecord message;
    message.set_ciphertext(record.blob.ciphertext.data(), record.blob.ciphertext.size());
    message.set_server_locked_value(record.blob.server_locked_value.data(),
                                    record.blob.server_locked_value.size());
    message.set_key_id(record.blob.key_id);
    message.set_wrap_key_salt(record.wrap_key_salt.data(), record.wrap_key_salt.size());
    message.set_updated_at_ms(record.blob.updated_at_ms);
    message.set_vrf_public_key(record.vrf_public_key.data(), record.vrf_public_key.size());
    message.set_encrypted_signing_key(record.encrypted_signing_key.data(), record.encrypted_signing_key.size());
    message.set_signing_public_key(record.signing_public_key.data(), record.signing_public_key.size());
    message.set_rp_id(record.rp_id);

    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        return Result<std::string, CustodyFailure>::Err(
            CustodyFailure::Encode("Failed to serialize wrapped secret record"));
    }
    return Result<std::string, CustodyFailure>::Ok(std::move(serialized));
}

Result<AccountRecord, CustodyFailure> AccountRecordCodec::Decode(const std::string& serialized) {
    proto::storage::WrappedSecretRecord message;
    if (!message.ParseFromString(serialized)) {
        return Result<AccountRecord, CustodyFailure>::Err(
            CustodyFailure::Decode("Failed to parse wrapped secret record"));
    }
    if (message.ciphertext().empty() || message.server_locked_value().empty() ||
        message.key_id().empty() || message.wrap_key_salt().empty()) {
        return Result<AccountRecord, CustodyFailure>::Err(
            CustodyFailure::Decode("Wrapped secret record is incomplete"));
    }

    AccountRecord record;
    record.blob.ciphertext = ToBytes(message.ciphertext());
    record.blob.server_locked_value = ToBytes(message.server_locked_value());
    record.blob.key_id = message.key_id();
    record.blob.updated_at_ms = message.updated_at_ms();
    record.wrap_key_salt = ToBytes(message.wrap_key_salt());
    record.vrf_public_key = ToBytes(message.vrf_public_key());
    record.encrypted_signing_key = ToBytes(message.encrypted_signing_key());
    record.signing_public_key = ToBytes(message.signing_public_key());
    record.rp_id = message.rp_id();
    return Result<AccountRecord, CustodyFailure>::Ok(std::move(record));
}

}
