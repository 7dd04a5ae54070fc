#pragma once
#include "protocol/json_rpc.h"
#include <asio/awaitable.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpmail::business {

    // A method handler receives the request params and produces the `result` value.
    // Throwing core::InvalidParams maps to -32602, any other exception to -32603.
    using RpcHandler = std::function<asio::awaitable<nlohmann::json>(nlohmann::json)>;

    /**
     * @brief JSON-RPC 2.0 dispatcher: a method table plus the outcome-to-envelope mapping.
     */
    class RpcRouter {
    public:
        /**
         * @brief Register RPC method handler
         * @throws core::DuplicateMethod if the method is already bound
         */
        void register_method(const std::string &method, RpcHandler handler);

        /**
         * @brief Route a validated request to its handler
         * @return The response envelope, or nullopt for notifications
         */
        asio::awaitable<std::optional<protocol::Response>> handle(const protocol::Request &req) const;

    private:
        std::unordered_map<std::string, RpcHandler> handlers_;
    };

}// namespace mcpmail::business
