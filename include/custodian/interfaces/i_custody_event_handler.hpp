#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace custodian::interfaces {
enum class CustodyEvent {
    CeremonyPrompt,
    FallbackPrompt,
    CooperatorUnlock,
    KeyMigrated,
    SessionMinted,
    SessionReused,
    Signed
};
[[nodiscard]] constexpr std::string_view ToString(const CustodyEvent event) noexcept {
    switch (event) {
        case CustodyEvent::CeremonyPrompt: return "CeremonyPrompt";
        case CustodyEvent::FallbackPrompt: return "FallbackPrompt";
        case CustodyEvent::CooperatorUnlock: return "CooperatorUnlock";
        case CustodyEvent::KeyMigrated: return "KeyMigrated";
        case CustodyEvent::SessionMinted: return "SessionMinted";
        case CustodyEvent::SessionReused: return "SessionReused";
        case CustodyEvent::Signed: return "Signed";
    }
    return "Unknown";
}
class ICustodyEventHandler {
public:
    virtual ~ICustodyEventHandler() = default;
    virtual void OnCustodyEvent(CustodyEvent event, const std::string& account_id) = 0;
};
}
