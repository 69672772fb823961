#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace custodian::unlock {
struct ApplyLockReply {
    std::vector<uint8_t> double_blinded_value;
    std::string key_id;
};
struct CooperatorKeyInfo {
    std::string current_key_id;
    std::vector<uint8_t> modulus;
    std::vector<std::string> grace_key_ids;
};
}
