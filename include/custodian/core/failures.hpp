#pragma once
#include <string>
#include <string_view>
namespace custodian {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class CustodyFailureType {
    InvalidProof,
    UnknownKeyId,
    Expired,
    Exhausted,
    NotFound,
    DerivationMismatch,
    CooperatorUnavailable,
    Cancelled,
    CeremonyRejected,
    StaleChallenge,
    ChallengeMismatch,
    InvalidInput,
    DeriveKey,
    KeyGeneration,
    Encryption,
    Decryption,
    Encode,
    Decode,
    Storage,
    ChannelClosed,
    Generic
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class CustodyFailure {
public:
    CustodyFailureType type;
    std::string message;
    CustodyFailure(const CustodyFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static CustodyFailure InvalidProof(std::string msg) {
        return {CustodyFailureType::InvalidProof, std::move(msg)};
    }
    static CustodyFailure UnknownKeyId(std::string msg) {
        return {CustodyFailureType::UnknownKeyId, std::move(msg)};
    }
    static CustodyFailure Expired(std::string msg) {
        return {CustodyFailureType::Expired, std::move(msg)};
    }
    static CustodyFailure Exhausted(std::string msg) {
        return {CustodyFailureType::Exhausted, std::move(msg)};
    }
    static CustodyFailure NotFound(std::string msg) {
        return {CustodyFailureType::NotFound, std::move(msg)};
    }
    static CustodyFailure DerivationMismatch(std::string msg) {
        return {CustodyFailureType::DerivationMismatch, std::move(msg)};
    }
    static CustodyFailure CooperatorUnavailable(std::string msg) {
        return {CustodyFailureType::CooperatorUnavailable, std::move(msg)};
    }
    static CustodyFailure Cancelled(std::string msg) {
        return {CustodyFailureType::Cancelled, std::move(msg)};
    }
    static CustodyFailure CeremonyRejected(std::string msg) {
        return {CustodyFailureType::CeremonyRejected, std::move(msg)};
    }
    static CustodyFailure StaleChallenge(std::string msg) {
        return {CustodyFailureType::StaleChallenge, std::move(msg)};
    }
    static CustodyFailure ChallengeMismatch(std::string msg) {
        return {CustodyFailureType::ChallengeMismatch, std::move(msg)};
    }
    static CustodyFailure InvalidInput(std::string msg) {
        return {CustodyFailureType::InvalidInput, std::move(msg)};
    }
    static CustodyFailure DeriveKey(std::string msg) {
        return {CustodyFailureType::DeriveKey, std::move(msg)};
    }
    static CustodyFailure KeyGeneration(std::string msg) {
        return {CustodyFailureType::KeyGeneration, std::move(msg)};
    }
    static CustodyFailure Encryption(std::string msg) {
        return {CustodyFailureType::Encryption, std::move(msg)};
    }
    static CustodyFailure Decryption(std::string msg) {
        return {CustodyFailureType::Decryption, std::move(msg)};
    }
    static CustodyFailure Encode(std::string msg) {
        return {CustodyFailureType::Encode, std::move(msg)};
    }
    static CustodyFailure Decode(std::string msg) {
        return {CustodyFailureType::Decode, std::move(msg)};
    }
    static CustodyFailure Storage(std::string msg) {
        return {CustodyFailureType::Storage, std::move(msg)};
    }
    static CustodyFailure ChannelClosed(std::string msg) {
        return {CustodyFailureType::ChannelClosed, std::move(msg)};
    }
    static CustodyFailure Generic(std::string msg) {
        return {CustodyFailureType::Generic, std::move(msg)};
    }
    static CustodyFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsSessionMiss() const noexcept {
        return type == CustodyFailureType::Expired ||
               type == CustodyFailureType::Exhausted ||
               type == CustodyFailureType::NotFound;
    }
};
[[nodiscard]] constexpr std::string_view ToString(const CustodyFailureType type) noexcept {
    switch (type) {
        case CustodyFailureType::InvalidProof: return "InvalidProof";
        case CustodyFailureType::UnknownKeyId: return "UnknownKeyId";
        case CustodyFailureType::Expired: return "Expired";
        case CustodyFailureType::Exhausted: return "Exhausted";
        case CustodyFailureType::NotFound: return "NotFound";
        case CustodyFailureType::DerivationMismatch: return "DerivationMismatch";
        case CustodyFailureType::CooperatorUnavailable: return "CooperatorUnavailable";
        case CustodyFailureType::Cancelled: return "Cancelled";
        case CustodyFailureType::CeremonyRejected: return "CeremonyRejected";
        case CustodyFailureType::StaleChallenge: return "StaleChallenge";
        case CustodyFailureType::ChallengeMismatch: return "ChallengeMismatch";
        case CustodyFailureType::InvalidInput: return "InvalidInput";
        case CustodyFailureType::DeriveKey: return "DeriveKey";
        case CustodyFailureType::KeyGeneration: return "KeyGeneration";
        case CustodyFailureType::Encryption: return "Encryption";
        case CustodyFailureType::Decryption: return "Decryption";
        case CustodyFailureType::Encode: return "Encode";
        case CustodyFailureType::Decode: return "Decode";
        case CustodyFailureType::Storage: return "Storage";
        case CustodyFailureType::ChannelClosed: return "ChannelClosed";
        case CustodyFailureType::Generic: return "Generic";
    }
    return "Unknown";
}
}
