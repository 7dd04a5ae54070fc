#pragma once

#include "connection.h"
#include <array>
#include <asio/ip/tcp.hpp>

namespace mcpmail::transport {

    /**
     * @brief Plain TCP connection carrying HTTP/1.1.
     */
    class TcpConnection : public Connection {
    public:
        TcpConnection(asio::ip::tcp::socket socket, size_t max_request_size);
        ~TcpConnection() override = default;

        asio::awaitable<void> start(HttpHandler *handler) override;
        asio::awaitable<void> write(const std::string &message) override;
        asio::awaitable<void> wait_for_disconnect() override;

        void close() override;
        bool is_closed() const override;
        asio::any_io_executor get_executor() override { return socket_.get_executor(); }

    private:
        asio::ip::tcp::socket socket_;///< Underlying TCP socket
        std::array<char, 8192> buffer_;///< Buffer for reading data
        size_t max_request_size_;
    };

}// namespace mcpmail::transport
