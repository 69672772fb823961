#pragma once
#include "custodian/crypto/sodium_secure_memory_handle.hpp"
#include <cstdint>
#include <vector>
namespace custodian::session {
/// What a signing unit receives: the wrap-key seed and the account's salt.
/// Never the long-term secret, never the KEK.
struct WrapKeyMaterial {
    crypto::SecureMemoryHandle seed;
    std::vector<uint8_t> salt;
};
}
