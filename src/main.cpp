#include "business/mail/mailer.h"
#include "config/config.hpp"// Configuration management using INI file
#include "core/logger.h"
#include "core/server.h"
#include <asio/signal_set.hpp>
#include <csignal>
#include <iostream>

/**
 * Entry point of the MCPMail server.
 * Loads the configuration, sets up logging, builds the server and runs the
 * event loop until SIGINT or SIGTERM.
 *
 * @return 0 on clean shutdown, 1 if an exception occurs.
 */
int main() {
    try {
        // Step 1: Load config.ini (created with defaults when missing) plus SMTP_* overrides
        auto config = mcpmail::config::load_config(mcpmail::config::ConfigMode::STATIC);

        // Step 2: Initialize the asynchronous logger using settings from the config
        mcpmail::core::initialize_logger(
                config.server.log_path,
                config.server.log_level,
                config.server.max_file_size,
                config.server.max_files);
        MCPMAIL_INFO("Starting MCPMail server with configuration: {}", mcpmail::config::get_config_file_path());
        mcpmail::config::print_config(config);

        // Step 3: Map the [smtp] section onto the mailer settings
        mcpmail::business::mail::SmtpSettings smtp;
        smtp.host = config.smtp.host;
        smtp.port = config.smtp.port;
        smtp.user = config.smtp.user;
        smtp.password = config.smtp.password;
        smtp.tls = mcpmail::business::mail::resolve_tls_mode(config.smtp.use_tls, config.smtp.port);
        smtp.timeout = std::chrono::seconds(config.smtp.timeout);
        smtp.verify_timeout = std::chrono::seconds(config.smtp.verify_timeout);
        smtp.helo_name = config.smtp.helo_name;
        smtp.verify_certificate = config.smtp.verify_certificate;

        mcpmail::session::SessionStoreOptions session_options;
        session_options.idle_timeout = std::chrono::seconds(config.session.idle_timeout);
        session_options.sweep_interval = std::chrono::seconds(config.session.sweep_interval);
        session_options.retention.max_events = config.session.max_events;
        session_options.retention.retention_window = std::chrono::seconds(config.session.retention_window);

        // Step 4: Build the server
        auto server = mcpmail::core::MCPMailServer::Builder{}
                              .with_address(config.server.ip)
                              .with_port(config.server.http_port)
                              .with_io_threads(config.server.io_threads)
                              .with_max_request_size(config.server.max_request_size)
                              .with_session_options(session_options)
                              .with_keepalive_interval(std::chrono::seconds(config.session.keepalive_interval))
                              .with_smtp_settings(smtp)
                              .build();

        {
            // Graceful shutdown; the handler runs on the server's own loop
            asio::signal_set signals(server->get_io_context(), SIGINT, SIGTERM);
            signals.async_wait([&server](const asio::error_code &error, int signal_number) {
                if (!error) {
                    MCPMAIL_INFO("Received signal {}, initiating graceful shutdown...", signal_number);
                    server->stop();
                }
            });

            MCPMAIL_INFO("MCPMail is ready. Send JSON-RPC messages via /mcp.");

            // Step 5: Blocks until stop()
            server->run();
        }

        server.reset();
        MCPMAIL_INFO("Server shutdown complete.");
        mcpmail::core::Logger::instance().shutdown();
        return 0;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        MCPMAIL_ERROR("Server error: {}", e.what());
        return 1;
    }
}
