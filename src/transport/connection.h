#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <memory>
#include <string>


namespace mcpmail::transport {
    class HttpHandler;
}// namespace mcpmail::transport

namespace mcpmail::transport {

    /**
     * @brief Base class for one client connection.
     * Handles IO operations only, no business logic.
     */
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        virtual ~Connection() = default;

        /**
         * @brief Run the read loop, handing each complete request to the handler.
         */
        virtual asio::awaitable<void> start(HttpHandler *handler) = 0;

        /**
         * @brief Send data to the client.
         * @throws std::system_error when the peer is gone
         */
        virtual asio::awaitable<void> write(const std::string &message) = 0;

        /**
         * @brief Complete once the peer hangs up or the connection fails.
         * Only awaited while a stream owns the connection; inbound bytes are discarded.
         */
        virtual asio::awaitable<void> wait_for_disconnect() = 0;

        /**
         * @brief Close the connection. Idempotent.
         */
        virtual void close() = 0;

        virtual bool is_closed() const = 0;

        // Executor the connection's coroutine runs on
        virtual asio::any_io_executor get_executor() = 0;

        /**
         * @brief Set streaming state; a streaming connection is closed once the stream ends.
         */
        void set_streaming(bool streaming) { is_streaming_ = streaming; }
        bool is_streaming() const { return is_streaming_; }

        // Identifier used in log lines; unrelated to MCP session ids
        const std::string &get_connection_id() const { return connection_id_; }

    protected:
        Connection() = default;

        std::string connection_id_;
        bool is_streaming_ = false;
        bool closed_ = false;
    };

}// namespace mcpmail::transport
