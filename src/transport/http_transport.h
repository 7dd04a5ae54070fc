#pragma once

#include "core/io_context_pool.hpp"
#include "http_handler.h"
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <atomic>
#include <memory>

namespace mcpmail::transport {

    /**
     * @brief HTTP listener using plain TCP sockets.
     * Accepts on the given io_context and spreads connections over the pool.
     */
    class HttpTransport {
    public:
        HttpTransport(asio::io_context &io_context, core::IoContextPool &pool,
                      const std::string &address, unsigned short port,
                      std::shared_ptr<HttpHandler> handler);
        ~HttpTransport();

        /**
         * @brief Start the accept loop.
         * @return True if startup successful
         */
        bool start();

        /**
         * @brief Stop accepting connections.
         */
        void stop();

        unsigned short port() const;

    private:
        asio::awaitable<void> do_accept();

        asio::io_context &io_context_;
        core::IoContextPool &pool_;
        asio::ip::tcp::acceptor acceptor_;
        std::shared_ptr<HttpHandler> handler_;
        std::atomic<bool> is_running_{false};
    };

}// namespace mcpmail::transport
