// src/protocol/mcp_version.h
#pragma once

#include <algorithm>
#include <array>
#include <string>

namespace mcpmail::protocol {

    namespace header {
        constexpr const char *SESSION_ID = "Mcp-Session-Id";
        constexpr const char *PROTOCOL_VERSION = "Mcp-Protocol-Version";
        constexpr const char *LAST_EVENT_ID = "Last-Event-Id";
    }// namespace header

    constexpr const char *DEFAULT_PROTOCOL_VERSION = "2024-11-05";

    inline constexpr std::array<const char *, 3> SUPPORTED_PROTOCOL_VERSIONS = {
            "2024-11-05", "2025-03-26", "2025-06-18"};

    inline bool is_supported_version(const std::string &version) {
        return std::any_of(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                           [&](const char *v) { return version == v; });
    }

    /**
     * @brief Pick the version for a new session: the client's request when we speak it,
     * otherwise our default.
     */
    inline std::string negotiate_version(const std::string &requested) {
        if (!requested.empty() && is_supported_version(requested)) {
            return requested;
        }
        return DEFAULT_PROTOCOL_VERSION;
    }

}// namespace mcpmail::protocol
