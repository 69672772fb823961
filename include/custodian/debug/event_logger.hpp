#pragma once

/**
 * @file event_logger.hpp
 * @brief Debug tracing for the custody pipeline.
 *
 * Traces public values only: key ids, block heights, public keys, session
 * ids, use counters. Secret material (long-term secrets, KEKs, wrap-key
 * seeds, signing seeds) is never passed to these macros.
 *
 * Enable via CMake: -DCUSTODIAN_DEBUG_EVENTS=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace custodian::debug {

enum class Side {
    Client,
    Cooperator,
    Unknown
};

#ifdef CUSTODIAN_DEBUG_EVENTS

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32) {
    if (data.size() <= max_bytes) {
        return ToHex(data);
    }
    auto truncated = ToHex(data.subspan(0, max_bytes));
    truncated += "...(" + std::to_string(data.size()) + " bytes)";
    return truncated;
}

inline const char* SideToString(Side side) {
    switch (side) {
        case Side::Client: return "CLIENT";
        case Side::Cooperator: return "COOPERATOR";
        default: return "UNKNOWN";
    }
}

#define CUSTODIAN_LOG_PUBLIC(side, operation, name, data) \
    do { \
        fprintf(stdout, "[CUSTODIAN-DEBUG] %s %s %s: %s\n", \
            ::custodian::debug::SideToString(side), \
            operation, \
            name, \
            ::custodian::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define CUSTODIAN_LOG_VALUE(side, operation, name, value) \
    do { \
        fprintf(stdout, "[CUSTODIAN-DEBUG] %s %s %s: %s\n", \
            ::custodian::debug::SideToString(side), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define CUSTODIAN_LOG_ID(side, operation, name, id) \
    do { \
        fprintf(stdout, "[CUSTODIAN-DEBUG] %s %s %s: %.*s\n", \
            ::custodian::debug::SideToString(side), \
            operation, \
            name, \
            static_cast<int>(std::string_view(id).size()), \
            std::string_view(id).data()); \
        fflush(stdout); \
    } while(0)

#define CUSTODIAN_LOG_MSG(side, operation, message) \
    do { \
        fprintf(stdout, "[CUSTODIAN-DEBUG] %s %s %s\n", \
            ::custodian::debug::SideToString(side), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#else // !CUSTODIAN_DEBUG_EVENTS

#define CUSTODIAN_LOG_PUBLIC(side, operation, name, data) ((void)0)
#define CUSTODIAN_LOG_VALUE(side, operation, name, value) ((void)0)
#define CUSTODIAN_LOG_ID(side, operation, name, id) ((void)0)
#define CUSTODIAN_LOG_MSG(side, operation, message) ((void)0)

#endif // CUSTODIAN_DEBUG_EVENTS

} // namespace custodian::debug
