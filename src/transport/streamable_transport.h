// src/transport/streamable_transport.h
#pragma once

#include "business/request_handler.h"
#include "session/session_store.h"
#include "transport_types.h"
#include <memory>
#include <variant>

namespace mcpmail::transport {

    /**
     * @brief Sink for an open SSE stream.
     */
    class StreamWriter {
    public:
        virtual ~StreamWriter() = default;

        /**
         * @brief Write raw SSE text.
         * @return false once the client is gone
         */
        virtual asio::awaitable<bool> write(const std::string &data) = 0;
    };

    struct TransportOptions {
        std::chrono::seconds keepalive_interval{15};
        std::string smtp_host;
        unsigned short smtp_port = 0;
    };

    /**
     * @brief Streamable HTTP orchestration, independent of sockets.
     *
     * POST requests are bound to sessions (created on initialize) and answered
     * with the response that was just appended to the session's event log.
     * GET requests attach the session's single stream consumer and drain the log.
     */
    class StreamableTransport {
    public:
        using StreamOpenResult = std::variant<std::shared_ptr<session::StreamSubscription>, HttpReply>;

        StreamableTransport(std::shared_ptr<business::RequestHandler> handler,
                            std::shared_ptr<session::SessionStore> store,
                            TransportOptions options = {});

        /**
         * @brief POST /mcp
         */
        asio::awaitable<HttpReply> handle_post(const HttpRequest &req);

        /**
         * @brief POST /, /rpc, /jsonrpc: plain request/response, no session semantics
         */
        asio::awaitable<HttpReply> handle_stateless_post(const HttpRequest &req);

        /**
         * @brief Validate a GET /mcp and attach its stream consumer.
         * @return The subscription, or the error reply to send instead
         */
        StreamOpenResult open_stream(const HttpRequest &req, const asio::any_io_executor &executor);

        /**
         * @brief Deliver replayed and new events until the client leaves or the session closes.
         * The subscription is detached on every exit path.
         */
        asio::awaitable<void> run_stream(std::shared_ptr<session::StreamSubscription> subscription,
                                         StreamWriter &writer);

        HttpReply health() const;
        HttpReply legacy_sse() const;

        static std::string format_event(const session::StreamEvent &event);
        static std::string format_keepalive();
        static std::string format_session_closed(const std::string &session_id);

        // Start the eviction sweep
        void start();
        // Stop the sweep (joining an in-progress one), then close every session
        void stop();

        session::SessionStore &store() { return *store_; }
        const TransportOptions &options() const { return options_; }

    private:
        asio::awaitable<HttpReply> initialize_session(const protocol::Request &req);
        static std::optional<HttpReply> envelope_error(const std::optional<protocol::Error> &error);

        std::shared_ptr<business::RequestHandler> handler_;
        std::shared_ptr<session::SessionStore> store_;
        TransportOptions options_;
    };

}// namespace mcpmail::transport
