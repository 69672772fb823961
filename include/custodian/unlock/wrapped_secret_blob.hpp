#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace custodian::unlock {
/// Durable form of the long-term secret. Never holds the plaintext secret
/// or the KEK; server_locked_value is the KEK under the cooperator's lock only.
struct WrappedSecretBlob {
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> server_locked_value;
    std::string key_id;
    uint64_t updated_at_ms = 0;
};
}
