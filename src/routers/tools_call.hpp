#pragma once
#include "business/tool_registry.h"
#include "core/errors.h"
#include "core/logger.h"
#include <asio/awaitable.hpp>

namespace mcpmail::routers {

    /**
     * @brief Wrap a tool payload as MCP text content.
     * isError mirrors a payload reporting "success": false.
     */
    inline nlohmann::json make_tool_result(const nlohmann::json &payload) {
        bool failed = payload.is_object() && payload.contains("success") &&
                      payload["success"].is_boolean() && !payload["success"].get<bool>();
        return nlohmann::json{
                {"content", nlohmann::json::array({{{"type", "text"}, {"text", payload.dump()}}})},
                {"isError", failed}};
    }

    /**
     * @brief Handle tools/call
     *
     * Requires a string "name"; "arguments" is optional but must be an object.
     * An unknown tool is a tool-level failure, reported inside a successful result.
     */
    inline asio::awaitable<nlohmann::json> handle_tools_call(const business::ToolRegistry &registry,
                                                             nlohmann::json params) {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            throw core::InvalidParams("Tool name is required");
        }
        std::string tool_name = params["name"].get<std::string>();

        nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
        if (arguments.is_null()) {
            arguments = nlohmann::json::object();
        }
        if (!arguments.is_object()) {
            throw core::InvalidParams("Tool arguments must be an object");
        }

        if (!registry.contains(tool_name)) {
            MCPMAIL_WARN("tools/call for unknown tool '{}'", tool_name);
            co_return make_tool_result(nlohmann::json{
                    {"success", false},
                    {"error", core::ToolNotFound(tool_name).what()}});
        }

        nlohmann::json payload = co_await registry.invoke(tool_name, std::move(arguments));
        nlohmann::json result = make_tool_result(payload);
        MCPMAIL_INFO("Tool '{}' finished (isError={})", tool_name, result["isError"].get<bool>());
        co_return result;
    }
}// namespace mcpmail::routers
