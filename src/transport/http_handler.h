#pragma once

#include "connection.h"
#include "streamable_transport.h"
#include "transport_types.h"
#include <memory>
#include <optional>
#include <string>


namespace mcpmail::transport {

    /**
     * @brief HTTP/1.1 boundary: request parsing, the route table and response framing.
     *
     * Route table:
     *   POST   /mcp                  session-bound JSON-RPC
     *   GET    /mcp                  SSE stream (chunked) for the session
     *   DELETE /mcp                  405
     *   POST   / , /rpc , /jsonrpc   stateless JSON-RPC
     *   GET    /health               status JSON
     *   GET    /sse                  legacy one-shot notification
     */
    class HttpHandler {
    public:
        HttpHandler(std::shared_ptr<StreamableTransport> transport, size_t max_request_size);

        /**
         * @brief Process one complete raw request read from a connection.
         * @param connection Active connection
         * @param raw_request Headers and body, framed by Content-Length
         */
        asio::awaitable<void> handle_request(std::shared_ptr<Connection> connection, const std::string &raw_request);

        /**
         * @brief Answer every route that is not an SSE stream.
         */
        asio::awaitable<HttpReply> route(const HttpRequest &req);

        // GET /mcp
        static bool is_stream_request(const HttpRequest &req);

        /**
         * @brief Send a complete response. Write failures close the connection.
         */
        asio::awaitable<void> send_http_response(std::shared_ptr<Connection> connection, const HttpReply &reply,
                                                 bool keep_alive);

        /**
         * @brief Parse raw HTTP request into structured data.
         * @return nullopt for a malformed request line
         */
        static std::optional<HttpRequest> parse_request(const std::string &raw_request);

        /**
         * @brief Find Content-Length in a header block (case-insensitive).
         * @param length Set to the value, or 0 when the header is absent
         * @return false if the value is not a number
         */
        static bool read_content_length(const std::string &head, size_t &length);

        static std::string serialize(const HttpReply &reply, bool keep_alive);
        static const char *status_text(int status_code);

        size_t max_request_size() const { return max_request_size_; }

    private:
        asio::awaitable<void> serve_stream(std::shared_ptr<Connection> connection, const HttpRequest &req);
        static bool wants_keep_alive(const HttpRequest &req);

        std::shared_ptr<StreamableTransport> transport_;
        size_t max_request_size_;
    };

}// namespace mcpmail::transport
