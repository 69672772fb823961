#include "custodian/unlock/unlock_cooperator.hpp"
#include "custodian/crypto/aes_gcm.hpp"
#include "custodian/crypto/hkdf.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/core/constants.hpp"
#include "custodian/debug/event_logger.hpp"

#include <chrono>

namespace custodian::unlock {
using crypto::AesGcm;
using crypto::Hkdf;
using crypto::SodiumInterop;

namespace {
    uint64_t NowMillis() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
}

UnlockCooperator::UnlockCooperator(std::shared_ptr<CooperatorClient> client,
                                   std::shared_ptr<const ShamirThreePass> group)
    : client_(std::move(client))
    , group_(std::move(group)) {
}

Result<WrappedSecretBlob, CustodyFailure> UnlockCooperator::Register(
    std::span<const uint8_t> long_term_secret) const {
    auto kek = group_->GenerateKek();
    if (kek.IsErr()) {
        return std::move(kek).PropagateErr<WrappedSecretBlob>();
    }
    return Wrap(kek.Unwrap(), long_term_secret);
}

Result<WrappedSecretBlob, CustodyFailure> UnlockCooperator::RegisterWithKek(
    std::span<const uint8_t> long_term_secret,
    std::span<const uint8_t> kek) const {
    auto value = BigNum::FromBytes(kek);
    if (value.IsErr()) {
        return std::move(value).PropagateErr<WrappedSecretBlob>();
    }
    if (auto valid = group_->ValidateElement(value.Unwrap()); valid.IsErr()) {
        return std::move(valid).PropagateErr<WrappedSecretBlob>();
    }
    return Wrap(value.Unwrap(), long_term_secret);
}

Result<WrappedSecretBlob, CustodyFailure> UnlockCooperator::Wrap(
    const BigNum& kek,
    std::span<const uint8_t> long_term_secret) const {
    if (long_term_secret.empty()) {
        return Result<WrappedSecretBlob, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Long-term secret cannot be empty"));
    }

    auto aead_key = DeriveAeadKey(kek);
    if (aead_key.IsErr()) {
        return std::move(aead_key).PropagateErr<WrappedSecretBlob>();
    }
    auto ciphertext = AesGcm::Seal(aead_key.Unwrap(), long_term_secret);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(aead_key.Unwrap()));
    if (ciphertext.IsErr()) {
        return std::move(ciphertext).PropagateErr<WrappedSecretBlob>();
    }

    auto client_keys = group_->GenerateLockKeys();
    if (client_keys.IsErr()) {
        return std::move(client_keys).PropagateErr<WrappedSecretBlob>();
    }
    auto kek_c = group_->ApplyLock(kek, client_keys.Unwrap());
    if (kek_c.IsErr()) {
        return std::move(kek_c).PropagateErr<WrappedSecretBlob>();
    }
    auto kek_c_bytes = group_->Encode(kek_c.Unwrap());
    if (kek_c_bytes.IsErr()) {
        return std::move(kek_c_bytes).PropagateErr<WrappedSecretBlob>();
    }

    auto reply = client_->ApplyLock(kek_c_bytes.Unwrap());
    if (reply.IsErr()) {
        return std::move(reply).PropagateErr<WrappedSecretBlob>();
    }
    auto kek_cs = group_->Decode(reply.Unwrap().double_blinded_value);
    if (kek_cs.IsErr()) {
        return std::move(kek_cs).PropagateErr<WrappedSecretBlob>();
    }
    auto kek_s = group_->RemoveLock(kek_cs.Unwrap(), client_keys.Unwrap());
    if (kek_s.IsErr()) {
        return std::move(kek_s).PropagateErr<WrappedSecretBlob>();
    }
    auto kek_s_bytes = group_->Encode(kek_s.Unwrap());
    if (kek_s_bytes.IsErr()) {
        return std::move(kek_s_bytes).PropagateErr<WrappedSecretBlob>();
    }

    CUSTODIAN_LOG_ID(debug::Side::Client, "REGISTER", "key_id", reply.Unwrap().key_id);
    return Result<WrappedSecretBlob, CustodyFailure>::Ok(WrappedSecretBlob{
        std::move(ciphertext).Unwrap(),
        std::move(kek_s_bytes).Unwrap(),
        std::move(reply).Unwrap().key_id,
        NowMillis()
    });
}

Result<SecureMemoryHandle, CustodyFailure> UnlockCooperator::Unlock(const WrappedSecretBlob& blob) const {
    if (blob.key_id.empty() || blob.ciphertext.empty()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Wrapped secret blob is incomplete"));
    }
    auto kek_s = group_->Decode(blob.server_locked_value);
    if (kek_s.IsErr()) {
        return std::move(kek_s).PropagateErr<SecureMemoryHandle>();
    }

    auto transit_keys = group_->GenerateLockKeys();
    if (transit_keys.IsErr()) {
        return std::move(transit_keys).PropagateErr<SecureMemoryHandle>();
    }
    auto kek_st = group_->ApplyLock(kek_s.Unwrap(), transit_keys.Unwrap());
    if (kek_st.IsErr()) {
        return std::move(kek_st).PropagateErr<SecureMemoryHandle>();
    }
    auto kek_st_bytes = group_->Encode(kek_st.Unwrap());
    if (kek_st_bytes.IsErr()) {
        return std::move(kek_st_bytes).PropagateErr<SecureMemoryHandle>();
    }

    auto kek_t_bytes = client_->RemoveLock(kek_st_bytes.Unwrap(), blob.key_id);
    if (kek_t_bytes.IsErr()) {
        return std::move(kek_t_bytes).PropagateErr<SecureMemoryHandle>();
    }
    auto kek_t = group_->Decode(kek_t_bytes.Unwrap());
    if (kek_t.IsErr()) {
        return std::move(kek_t).PropagateErr<SecureMemoryHandle>();
    }
    auto kek = group_->RemoveLock(kek_t.Unwrap(), transit_keys.Unwrap());
    if (kek.IsErr()) {
        return std::move(kek).PropagateErr<SecureMemoryHandle>();
    }

    auto aead_key = DeriveAeadKey(kek.Unwrap());
    if (aead_key.IsErr()) {
        return std::move(aead_key).PropagateErr<SecureMemoryHandle>();
    }
    auto plaintext = AesGcm::Open(aead_key.Unwrap(), blob.ciphertext);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(aead_key.Unwrap()));
    if (plaintext.IsErr()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::Decryption("Recovered KEK does not open the wrapped secret"));
    }

    auto secret = SecureMemoryHandle::FromBytes(plaintext.Unwrap());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext.Unwrap()));
    if (secret.IsErr()) {
        return Result<SecureMemoryHandle, CustodyFailure>::Err(
            CustodyFailure::FromSodiumFailure(secret.UnwrapErr()));
    }
    CUSTODIAN_LOG_ID(debug::Side::Client, "UNLOCK", "key_id", blob.key_id);
    return Result<SecureMemoryHandle, CustodyFailure>::Ok(std::move(secret).Unwrap());
}

Result<std::optional<WrappedSecretBlob>, CustodyFailure> UnlockCooperator::MigrateIfRotated(
    const WrappedSecretBlob& blob,
    std::span<const uint8_t> long_term_secret) const {
    auto info = client_->GetKeyInfo();
    if (info.IsErr()) {
        return std::move(info).PropagateErr<std::optional<WrappedSecretBlob>>();
    }
    if (info.Unwrap().modulus != group_->Modulus().ToBytes()) {
        return Result<std::optional<WrappedSecretBlob>, CustodyFailure>::Err(
            CustodyFailure::InvalidInput("Cooperator advertises a different group"));
    }
    if (info.Unwrap().current_key_id == blob.key_id) {
        return Result<std::optional<WrappedSecretBlob>, CustodyFailure>::Ok(std::nullopt);
    }
    auto rewrapped = Register(long_term_secret);
    if (rewrapped.IsErr()) {
        return std::move(rewrapped).PropagateErr<std::optional<WrappedSecretBlob>>();
    }
    CUSTODIAN_LOG_ID(debug::Side::Client, "MIGRATE", "to_key_id", rewrapped.Unwrap().key_id);
    return Result<std::optional<WrappedSecretBlob>, CustodyFailure>::Ok(std::move(rewrapped).Unwrap());
}

Result<std::vector<uint8_t>, CustodyFailure> UnlockCooperator::DeriveAeadKey(const BigNum& kek) const {
    auto kek_bytes = group_->Encode(kek);
    if (kek_bytes.IsErr()) {
        return kek_bytes;
    }
    auto key = Hkdf::DeriveKeyBytes(kek_bytes.Unwrap(), Constants::AES_KEY_SIZE, {},
                                    DerivationConstants::LOCK_AEAD_INFO);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(kek_bytes.Unwrap()));
    return key;
}

}
