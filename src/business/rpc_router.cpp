#include "rpc_router.h"
#include "core/errors.h"
#include "core/logger.h"

namespace mcpmail::business {

    void RpcRouter::register_method(const std::string &method, RpcHandler handler) {
        if (handlers_.count(method)) {
            throw core::DuplicateMethod(method);
        }
        handlers_.emplace(method, std::move(handler));
    }

    asio::awaitable<std::optional<protocol::Response>> RpcRouter::handle(const protocol::Request &req) const {
        auto it = handlers_.find(req.method);

        if (req.is_notification()) {
            if (it == handlers_.end()) {
                MCPMAIL_DEBUG("Ignoring notification for unknown method: {}", req.method);
                co_return std::nullopt;
            }
            std::string failure;
            try {
                co_await it->second(req.params);
            } catch (const std::exception &e) {
                failure = e.what();
            }
            if (!failure.empty()) {
                MCPMAIL_WARN("Notification '{}' failed: {}", req.method, failure);
            }
            co_return std::nullopt;
        }

        const nlohmann::json id = req.id.value();
        if (it == handlers_.end()) {
            co_return protocol::Response::failure(protocol::error_code::METHOD_NOT_FOUND,
                                                  "Method not found: " + req.method, id);
        }

        // Errors are captured and mapped outside the catch blocks; no co_await may run inside one.
        int code = 0;
        std::string message;
        nlohmann::json result;
        try {
            result = co_await it->second(req.params);
        } catch (const core::InvalidParams &e) {
            code = protocol::error_code::INVALID_PARAMS;
            message = e.what();
        } catch (const std::exception &e) {
            code = protocol::error_code::INTERNAL_ERROR;
            message = e.what();
        }

        if (code != 0) {
            if (code == protocol::error_code::INTERNAL_ERROR) {
                MCPMAIL_ERROR("Method '{}' failed: {}", req.method, message);
            } else {
                MCPMAIL_DEBUG("Method '{}' rejected params: {}", req.method, message);
            }
            co_return protocol::Response::failure(code, message, id);
        }
        co_return protocol::Response::success(std::move(result), id);
    }

}// namespace mcpmail::business
