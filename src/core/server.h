// src/core/server.h
#pragma once
#if defined(_WIN32) && !defined(_WIN32_WINNT)
#define _WIN32_WINNT 0x0601
#endif

#include "business/mail/email_tools.h"
#include "business/mail/mailer.h"
#include "business/request_handler.h"
#include "business/tool_registry.h"
#include "core/io_context_pool.hpp"
#include "session/session_store.h"
#include "transport/http_handler.h"
#include "transport/http_transport.h"
#include "transport/streamable_transport.h"
#include <asio/io_context.hpp>
#include <atomic>
#include <memory>


namespace mcpmail::core {

    class MCPMailServer {
    public:
        class Builder;

        ~MCPMailServer();

        /**
         * @brief Start the eviction sweep and serve until stop() is called.
         */
        void run();

        /**
         * @brief Tear down in order: acceptor, sweep and sessions, io pool, accept loop.
         * Safe to call from any thread, including a signal handler on the run() thread.
         */
        void stop();

        unsigned short port() const { return http_transport_->port(); }
        asio::io_context &get_io_context() { return io_context_; }
        const business::ToolRegistry &registry() const { return *registry_; }
        session::SessionStore &session_store() { return *store_; }

    private:
        MCPMailServer() = default;
        friend class Builder;

        // Declared first so they outlive everything bound to them
        asio::io_context io_context_;
        std::unique_ptr<IoContextPool> pool_;

        std::shared_ptr<business::ToolRegistry> registry_;
        std::shared_ptr<business::mail::Mailer> mailer_;
        std::shared_ptr<business::mail::EmailTools> email_tools_;
        std::shared_ptr<business::RequestHandler> request_handler_;
        std::shared_ptr<session::SessionStore> store_;
        std::shared_ptr<transport::StreamableTransport> transport_;
        std::shared_ptr<transport::HttpHandler> http_handler_;
        std::unique_ptr<transport::HttpTransport> http_transport_;

        std::atomic<bool> stopped_{false};
    };

    class MCPMailServer::Builder {
    public:
        Builder();
        Builder &with_address(const std::string &address = "0.0.0.0") {
            address_ = address;
            return *this;
        }
        Builder &with_port(unsigned short port = 8000) {
            port_ = port;
            return *this;
        }
        Builder &with_io_threads(size_t threads) {
            io_threads_ = threads;
            return *this;
        }
        Builder &with_max_request_size(size_t bytes) {
            max_request_size_ = bytes;
            return *this;
        }
        Builder &with_session_options(const session::SessionStoreOptions &options) {
            session_options_ = options;
            return *this;
        }
        Builder &with_keepalive_interval(std::chrono::seconds interval) {
            keepalive_interval_ = interval;
            return *this;
        }
        Builder &with_smtp_settings(const business::mail::SmtpSettings &settings) {
            smtp_settings_ = settings;
            return *this;
        }
        // Replace the SMTP mailer, e.g. with a test double
        Builder &with_mailer(std::shared_ptr<business::mail::Mailer> mailer) {
            mailer_ = std::move(mailer);
            return *this;
        }

        /**
         * @brief Wire registry, dispatcher, session store and transport, and bind the listener.
         * @throws std::system_error if the address cannot be bound
         */
        std::unique_ptr<MCPMailServer> build();

    private:
        std::unique_ptr<MCPMailServer> server_ = nullptr;

        std::string address_ = "0.0.0.0";
        unsigned short port_ = 8000;
        size_t io_threads_ = 4;
        size_t max_request_size_ = 1024 * 1024;
        session::SessionStoreOptions session_options_;
        std::chrono::seconds keepalive_interval_{15};
        business::mail::SmtpSettings smtp_settings_;
        std::shared_ptr<business::mail::Mailer> mailer_;
    };

}// namespace mcpmail::core
