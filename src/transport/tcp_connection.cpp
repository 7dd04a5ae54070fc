#include "tcp_connection.h"
#include "core/logger.h"
#include "http_handler.h"
#include "utils/random_id.h"
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>


using asio::use_awaitable;

namespace mcpmail::transport {

    namespace {
        // Headers alone may not exceed this, whatever the body limit is
        constexpr size_t MAX_HEADER_BYTES = 64 * 1024;
    }// namespace

    TcpConnection::TcpConnection(asio::ip::tcp::socket socket, size_t max_request_size)
        : socket_(std::move(socket)), max_request_size_(max_request_size) {
        connection_id_ = utils::random_hex_id(8);
    }

    /**
     * @brief Read requests until the peer disconnects, framing them by Content-Length.
     * @param handler HTTP handler for processing requests
     */
    asio::awaitable<void> TcpConnection::start(HttpHandler *handler) {
        std::string request_buffer;
        int reject_status = 0;
        std::string reject_message;
        try {
            while (socket_.is_open() && !closed_) {
                auto n = co_await socket_.async_read_some(asio::buffer(buffer_), use_awaitable);
                if (n == 0) break;
                request_buffer.append(buffer_.data(), n);

                while (!request_buffer.empty() && !closed_) {
                    size_t header_end = request_buffer.find("\r\n\r\n");
                    if (header_end == std::string::npos) {
                        if (request_buffer.size() > MAX_HEADER_BYTES) {
                            reject_status = 413;
                            reject_message = "Request headers too large";
                        }
                        break;// Incomplete headers - wait for more data
                    }

                    size_t content_length = 0;
                    if (!HttpHandler::read_content_length(request_buffer.substr(0, header_end), content_length)) {
                        reject_status = 400;
                        reject_message = "Invalid Content-Length";
                        break;
                    }
                    if (content_length > max_request_size_) {
                        reject_status = 413;
                        reject_message = "Request body too large";
                        break;
                    }

                    size_t total_required = header_end + 4 + content_length;
                    if (request_buffer.length() < total_required) {
                        break;// Incomplete body - wait for more data
                    }
                    std::string complete_request = request_buffer.substr(0, total_required);
                    request_buffer.erase(0, total_required);
                    co_await handler->handle_request(shared_from_this(), complete_request);
                }
                if (reject_status != 0) {
                    break;
                }
            }
        } catch (const std::exception &e) {
            if (!closed_) {
                MCPMAIL_DEBUG("Connection {} read ended: {}", connection_id_, e.what());
            }
        }

        if (reject_status != 0 && !closed_) {
            MCPMAIL_WARN("Connection {} rejected: {} ({})", connection_id_, reject_message, reject_status);
            co_await handler->send_http_response(shared_from_this(), HttpReply::error(reject_status, reject_message),
                                                 false);
        }
        close();
    }

    asio::awaitable<void> TcpConnection::write(const std::string &message) {
        if (closed_ || !socket_.is_open()) {
            throw std::system_error(asio::error::not_connected);
        }
        co_await asio::async_write(socket_, asio::buffer(message), use_awaitable);
    }

    asio::awaitable<void> TcpConnection::wait_for_disconnect() {
        // The request loop is parked in the stream handler, so the buffer is free
        asio::error_code ec;
        while (!ec && !closed_) {
            co_await socket_.async_read_some(asio::buffer(buffer_), asio::redirect_error(use_awaitable, ec));
        }
        if (!closed_) {
            MCPMAIL_DEBUG("Connection {} dropped by peer: {}", connection_id_, ec.message());
        }
    }

    /**
     * @brief Close the TCP connection and release the socket.
     */
    void TcpConnection::close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        asio::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

    bool TcpConnection::is_closed() const {
        return closed_ || !socket_.is_open();
    }

}// namespace mcpmail::transport
