// src/business/request_handler.h
#pragma once

#include "business/rpc_router.h"
#include "business/tool_registry.h"
#include <memory>
#include <optional>


namespace mcpmail::business {

    /**
     * @brief Binds the MCP methods (initialize, ping, tools/list, tools/call,
     * notifications/initialized) onto a dispatcher backed by a tool registry.
     */
    class RequestHandler {
    public:
        explicit RequestHandler(std::shared_ptr<ToolRegistry> registry);

        asio::awaitable<std::optional<protocol::Response>> handle(const protocol::Request &req) const {
            return router_.handle(req);
        }

        RpcRouter &router() { return router_; }
        const ToolRegistry &registry() const { return *registry_; }

    private:
        std::shared_ptr<ToolRegistry> registry_;
        RpcRouter router_;
    };

}// namespace mcpmail::business
