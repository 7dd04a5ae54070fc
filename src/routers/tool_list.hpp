#pragma once
#include "business/tool_registry.h"
#include <asio/awaitable.hpp>

namespace mcpmail::routers {
    /**
     * @brief Handle tool list request
     * @param registry Tool registry containing available tools
     * @return {"tools": [...]} in registration order
     */
    inline asio::awaitable<nlohmann::json> handle_tools_list(const business::ToolRegistry &registry) {
        nlohmann::json tools_json = nlohmann::json::array();
        for (const auto &tool: registry.list()) {
            tools_json.push_back(tool.to_json());
        }
        co_return nlohmann::json{{"tools", tools_json}};
    }
}// namespace mcpmail::routers
