#include "http_transport.h"
#include "core/logger.h"
#include "tcp_connection.h"
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>


using asio::use_awaitable;

namespace mcpmail::transport {

    /**
     * @brief Bind the acceptor on address:port.
     * @throws std::system_error if the address cannot be bound
     */
    HttpTransport::HttpTransport(asio::io_context &io_context, core::IoContextPool &pool,
                                 const std::string &address, unsigned short port,
                                 std::shared_ptr<HttpHandler> handler)
        : io_context_(io_context),
          pool_(pool),
          acceptor_(io_context, asio::ip::tcp::endpoint(asio::ip::make_address(address), port)),
          handler_(std::move(handler)) {
        MCPMAIL_INFO("HTTP Transport initialized on {}:{}", address, acceptor_.local_endpoint().port());
    }

    HttpTransport::~HttpTransport() {
        // No thread runs io_context_ any more at this point
        is_running_ = false;
        asio::error_code ec;
        acceptor_.close(ec);
    }

    bool HttpTransport::start() {
        is_running_ = true;
        MCPMAIL_INFO("Streamable HTTP Transport listening on {}:{}",
                     acceptor_.local_endpoint().address().to_string(),
                     acceptor_.local_endpoint().port());
        asio::co_spawn(io_context_, do_accept(), asio::detached);
        return true;
    }

    asio::awaitable<void> HttpTransport::do_accept() {
        try {
            while (is_running_) {
                // Each connection lives on one pool context
                auto &connection_context = pool_.get_io_context();
                auto socket = co_await acceptor_.async_accept(connection_context, use_awaitable);

                asio::error_code ec;
                auto remote = socket.remote_endpoint(ec);
                if (!ec) {
                    MCPMAIL_DEBUG("HTTP client connected from {}:{}", remote.address().to_string(), remote.port());
                }

                auto connection = std::make_shared<TcpConnection>(std::move(socket), handler_->max_request_size());
                asio::co_spawn(
                        connection_context,
                        [connection, handler = handler_]() -> asio::awaitable<void> {
                            co_await connection->start(handler.get());
                        },
                        asio::detached);
            }
        } catch (const std::exception &e) {
            if (is_running_) {
                MCPMAIL_ERROR("Error accepting HTTP connections: {}", e.what());
            }
        }
    }

    void HttpTransport::stop() {
        if (!is_running_.exchange(false)) {
            return;
        }
        // The acceptor belongs to io_context_; close it from there
        asio::post(io_context_, [this]() {
            asio::error_code ec;
            acceptor_.close(ec);
        });
    }

    unsigned short HttpTransport::port() const {
        return acceptor_.local_endpoint().port();
    }

}// namespace mcpmail::transport
