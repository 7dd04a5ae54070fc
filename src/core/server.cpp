#include "server.h"
#include "business/mail/smtp_mailer.h"
#include "core/logger.h"
#include <version.h>


namespace mcpmail::core {

    MCPMailServer::Builder::Builder() {
        server_ = std::unique_ptr<MCPMailServer>(new MCPMailServer());
    }

    std::unique_ptr<MCPMailServer> MCPMailServer::Builder::build() {
        // init core components
        server_->registry_ = std::make_shared<business::ToolRegistry>();
        server_->mailer_ = mailer_ ? mailer_ : std::make_shared<business::mail::SmtpMailer>(smtp_settings_);

        server_->email_tools_ = std::make_shared<business::mail::EmailTools>(server_->mailer_);
        server_->email_tools_->register_all(*server_->registry_);

        MCPMAIL_INFO("Final tools in registry (total: {}):", server_->registry_->size());
        for (const auto &tool: server_->registry_->list()) {
            MCPMAIL_INFO("  - '{}'", tool.name);
        }

        server_->request_handler_ = std::make_shared<business::RequestHandler>(server_->registry_);
        server_->store_ = std::make_shared<session::SessionStore>(session_options_);

        transport::TransportOptions transport_options;
        transport_options.keepalive_interval = keepalive_interval_;
        transport_options.smtp_host = server_->mailer_->settings().host;
        transport_options.smtp_port = server_->mailer_->settings().port;
        server_->transport_ = std::make_shared<transport::StreamableTransport>(
                server_->request_handler_, server_->store_, transport_options);
        server_->http_handler_ = std::make_shared<transport::HttpHandler>(server_->transport_, max_request_size_);

        server_->pool_ = std::make_unique<IoContextPool>(io_threads_);
        MCPMAIL_DEBUG("Started io_context pool with {} threads", server_->pool_->size());

        server_->http_transport_ = std::make_unique<transport::HttpTransport>(
                server_->io_context_, *server_->pool_, address_, port_, server_->http_handler_);
        server_->http_transport_->start();

        return std::move(server_);
    }

    MCPMailServer::~MCPMailServer() {
        stop();
    }

    void MCPMailServer::run() {
        transport_->start();
        MCPMAIL_INFO("{} {} serving MCP Streamable HTTP on port {}", MCPMAIL_SERVER_NAME, MCPMAIL_VERSION, port());
        io_context_.run();
        MCPMAIL_INFO("Server event loop finished");
    }

    void MCPMailServer::stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        MCPMAIL_INFO("Stopping server...");
        if (http_transport_) {
            http_transport_->stop();
        }
        if (transport_) {
            transport_->stop();
        }
        if (pool_) {
            pool_->stop();
        }
        io_context_.stop();
    }

}// namespace mcpmail::core
