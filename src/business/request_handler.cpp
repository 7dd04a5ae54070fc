#include "request_handler.h"
#include "core/logger.h"
#include "routers/initialize.hpp"
#include "routers/tool_list.hpp"
#include "routers/tools_call.hpp"


namespace mcpmail::business {

    using namespace routers;

    RequestHandler::RequestHandler(std::shared_ptr<ToolRegistry> registry)
        : registry_(std::move(registry)) {
        router_.register_method("initialize", handle_initialize);
        router_.register_method("ping", [](nlohmann::json) -> asio::awaitable<nlohmann::json> {
            co_return nlohmann::json::object();
        });
        router_.register_method("tools/list", [registry = registry_](nlohmann::json) {
            return handle_tools_list(*registry);
        });
        router_.register_method("tools/call", [registry = registry_](nlohmann::json params) {
            return handle_tools_call(*registry, std::move(params));
        });
        router_.register_method("notifications/initialized", [](nlohmann::json) -> asio::awaitable<nlohmann::json> {
            MCPMAIL_DEBUG("Client finished initialization");
            co_return nullptr;
        });
    }

}// namespace mcpmail::business
