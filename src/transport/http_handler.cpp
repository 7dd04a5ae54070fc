#include "http_handler.h"
#include "core/logger.h"
#include "protocol/mcp_version.h"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <sstream>
#include <variant>
#include <version.h>


using asio::awaitable;

namespace mcpmail::transport {

    namespace {
        std::string trim(const std::string &s) {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                return "";
            }
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        /**
         * @brief Writes each SSE frame as one HTTP chunk.
         */
        class ChunkedSseWriter : public StreamWriter {
        public:
            explicit ChunkedSseWriter(std::shared_ptr<Connection> connection) : connection_(std::move(connection)) {}

            asio::awaitable<bool> write(const std::string &data) override {
                if (connection_->is_closed()) {
                    co_return false;
                }
                std::ostringstream oss;
                oss << std::hex << data.size() << "\r\n"
                    << data << "\r\n";
                bool ok = true;
                try {
                    co_await connection_->write(oss.str());
                } catch (const std::exception &e) {
                    MCPMAIL_DEBUG("SSE write failed on connection {}: {}", connection_->get_connection_id(), e.what());
                    ok = false;
                }
                if (!ok) {
                    connection_->close();
                }
                co_return ok;
            }

        private:
            std::shared_ptr<Connection> connection_;
        };
    }// namespace

    HttpHandler::HttpHandler(std::shared_ptr<StreamableTransport> transport, size_t max_request_size)
        : transport_(std::move(transport)), max_request_size_(max_request_size) {}

    bool HttpHandler::read_content_length(const std::string &head, size_t &length) {
        length = 0;
        std::istringstream hss(head);
        std::string line;
        while (std::getline(hss, line)) {
            auto pos = line.find(':');
            if (pos == std::string::npos || !iequals(trim(line.substr(0, pos)), "Content-Length")) {
                continue;
            }
            std::string value = trim(line.substr(pos + 1));
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 18) {
                return false;
            }
            length = static_cast<size_t>(std::stoull(value));
            return true;
        }
        return true;
    }

    std::optional<HttpRequest> HttpHandler::parse_request(const std::string &raw_request) {
        size_t header_end = raw_request.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            return std::nullopt;
        }

        HttpRequest req;
        std::istringstream iss(raw_request.substr(0, header_end));
        std::string line;

        // Parse request line (method, target, version)
        if (!std::getline(iss, line)) {
            return std::nullopt;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::istringstream request_line(line);
        request_line >> req.method >> req.target >> req.version;
        if (request_line.fail() || req.version.rfind("HTTP/", 0) != 0) {
            return std::nullopt;
        }

        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            size_t colon_pos = line.find(':');
            if (colon_pos == std::string::npos) {
                continue;// Invalid header format, skip
            }
            req.headers[trim(line.substr(0, colon_pos))] = trim(line.substr(colon_pos + 1));
        }

        req.body = raw_request.substr(header_end + 4);
        return req;
    }

    const char *HttpHandler::status_text(int status_code) {
        switch (status_code) {
            case 200:
                return "OK";
            case 202:
                return "Accepted";
            case 204:
                return "No Content";
            case 400:
                return "Bad Request";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 409:
                return "Conflict";
            case 410:
                return "Gone";
            case 413:
                return "Payload Too Large";
            case 500:
                return "Internal Server Error";
            case 503:
                return "Service Unavailable";
            default:
                return "Unknown";
        }
    }

    std::string HttpHandler::serialize(const HttpReply &reply, bool keep_alive) {
        std::ostringstream oss;
        oss << "HTTP/1.1 " << reply.status << " " << status_text(reply.status) << "\r\n";
        oss << "Server: " << MCPMAIL_SERVER_NAME << "\r\n";

        bool has_body = reply.status != 202 && reply.status != 204 && !reply.body.empty();
        if (has_body) {
            oss << "Content-Type: " << reply.content_type << "\r\n";
        }
        oss << "Content-Length: " << (has_body ? reply.body.size() : 0) << "\r\n";
        for (const auto &[key, value]: reply.headers) {
            oss << key << ": " << value << "\r\n";
        }
        oss << (keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
        oss << "\r\n";
        if (has_body) {
            oss << reply.body;
        }
        return oss.str();
    }

    bool HttpHandler::wants_keep_alive(const HttpRequest &req) {
        auto connection = req.header("Connection");
        if (connection.has_value()) {
            return !iequals(connection.value(), "close");
        }
        return req.version != "HTTP/1.0";
    }

    bool HttpHandler::is_stream_request(const HttpRequest &req) {
        return req.method == "GET" && req.path() == "/mcp";
    }

    asio::awaitable<HttpReply> HttpHandler::route(const HttpRequest &req) {
        const std::string path = req.path();

        if (req.body.size() > max_request_size_) {
            co_return HttpReply::error(413, "Request body too large");
        }

        if (path == "/mcp") {
            if (req.method == "POST") {
                co_return co_await transport_->handle_post(req);
            }
            HttpReply reply = HttpReply::error(405, "Method not allowed");
            reply.headers.emplace_back("Allow", "GET, POST");
            co_return reply;
        }
        if (req.method == "POST" && (path == "/" || path == "/rpc" || path == "/jsonrpc")) {
            co_return co_await transport_->handle_stateless_post(req);
        }
        if (req.method == "GET" && path == "/health") {
            co_return transport_->health();
        }
        if (req.method == "GET" && path == "/sse") {
            co_return transport_->legacy_sse();
        }
        co_return HttpReply::error(404, "Not found");
    }

    asio::awaitable<void> HttpHandler::handle_request(std::shared_ptr<Connection> connection,
                                                      const std::string &raw_request) {
        auto req = parse_request(raw_request);
        if (!req.has_value()) {
            MCPMAIL_WARN("Invalid HTTP request on connection {}", connection->get_connection_id());
            co_await send_http_response(connection, HttpReply::error(400, "Invalid HTTP request"), false);
            connection->close();
            co_return;
        }

        MCPMAIL_DEBUG("{} {} (connection {})", req->method, req->target, connection->get_connection_id());

        if (is_stream_request(req.value())) {
            co_await serve_stream(connection, req.value());
            co_return;
        }

        HttpReply reply;
        bool failed = false;
        try {
            reply = co_await route(req.value());
        } catch (const std::exception &e) {
            MCPMAIL_ERROR("Unhandled error serving {} {}: {}", req->method, req->target, e.what());
            failed = true;
        }
        if (failed) {
            reply = HttpReply::error(500, "Internal server error");
        }

        bool keep_alive = wants_keep_alive(req.value());
        co_await send_http_response(connection, reply, keep_alive);
        if (!keep_alive) {
            connection->close();
        }
    }

    asio::awaitable<void> HttpHandler::send_http_response(std::shared_ptr<Connection> connection,
                                                          const HttpReply &reply, bool keep_alive) {
        try {
            co_await connection->write(serialize(reply, keep_alive));
            MCPMAIL_DEBUG("Sent HTTP {} response (connection {})", reply.status, connection->get_connection_id());
        } catch (const std::exception &e) {
            MCPMAIL_DEBUG("Failed to send HTTP response on connection {}: {}", connection->get_connection_id(),
                          e.what());
            connection->close();
        }
    }

    asio::awaitable<void> HttpHandler::serve_stream(std::shared_ptr<Connection> connection, const HttpRequest &req) {
        auto opened = transport_->open_stream(req, connection->get_executor());
        if (auto *reply = std::get_if<HttpReply>(&opened)) {
            co_await send_http_response(connection, *reply, wants_keep_alive(req));
            co_return;
        }
        auto subscription = std::get<std::shared_ptr<session::StreamSubscription>>(std::move(opened));

        std::ostringstream oss;
        oss << "HTTP/1.1 200 OK\r\n";
        oss << "Server: " << MCPMAIL_SERVER_NAME << "\r\n";
        oss << "Content-Type: text/event-stream\r\n";
        oss << "Cache-Control: no-cache\r\n";
        oss << "Transfer-Encoding: chunked\r\n";
        oss << protocol::header::SESSION_ID << ": " << subscription->session_id() << "\r\n";
        oss << protocol::header::PROTOCOL_VERSION << ": " << subscription->session()->protocol_version() << "\r\n";
        oss << "Connection: keep-alive\r\n";
        oss << "\r\n";

        bool headers_sent = true;
        try {
            co_await connection->write(oss.str());
        } catch (const std::exception &e) {
            MCPMAIL_DEBUG("Client left before the stream started: {}", e.what());
            headers_sent = false;
        }

        if (headers_sent) {
            connection->set_streaming(true);

            // Release the session as soon as the client hangs up, not at the next keep-alive
            asio::co_spawn(
                    connection->get_executor(),
                    [connection, subscription]() -> asio::awaitable<void> {
                        co_await connection->wait_for_disconnect();
                        if (subscription->active()) {
                            MCPMAIL_INFO("Stream client for session {} disconnected", subscription->session_id());
                        }
                        connection->close();
                        subscription->detach();
                        subscription->notify();
                    },
                    asio::detached);

            ChunkedSseWriter writer(connection);
            co_await transport_->run_stream(subscription, writer);

            // Final zero-length chunk
            if (!connection->is_closed()) {
                try {
                    co_await connection->write("0\r\n\r\n");
                } catch (const std::exception &e) {
                    MCPMAIL_DEBUG("Failed to terminate stream: {}", e.what());
                }
            }
        }
        subscription->detach();
        connection->set_streaming(false);
        connection->close();
    }

}// namespace mcpmail::transport
