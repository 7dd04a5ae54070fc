#pragma once
#include "protocol/json_rpc.h"
#include "protocol/mcp_version.h"
#include <asio/awaitable.hpp>
#include <version.h>

namespace mcpmail::routers {
    /**
     * @brief Handle initialization request
     * @param params initialize params, may carry the client's protocolVersion
     * @return Server capabilities, negotiated protocol version and server identity
     */
    inline asio::awaitable<nlohmann::json> handle_initialize(nlohmann::json params) {
        std::string requested;
        if (params.is_object() && params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
            requested = params["protocolVersion"].get<std::string>();
        }

        co_return nlohmann::json{
                {"protocolVersion", protocol::negotiate_version(requested)},
                {"capabilities", {{"tools", {{"listChanged", false}}}, {"logging", nlohmann::json::object()}}},
                {"serverInfo", {{"name", MCPMAIL_SERVER_NAME}, {"version", MCPMAIL_SERVER_VERSION}}}};
    }
}// namespace mcpmail::routers
