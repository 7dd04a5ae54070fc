#ifndef MCPMAIL_CONFIG_HPP
#define MCPMAIL_CONFIG_HPP

#include "core/executable_path.h"
#include "core/logger.h"
#include "inicpp.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>


namespace mcpmail {
    namespace config {

        constexpr const char *CONFIG_FILE = "config.ini";
        constexpr const char *CONFIG_PATH_ENV = "MCPMAIL_CONFIG";

        inline std::string g_config_file_path;

        inline void set_config_file_path(const std::string &path) {
            g_config_file_path = path;
        }

        // Explicit override, then $MCPMAIL_CONFIG, then config.ini next to the executable
        inline std::string get_config_file_path() {
            if (!g_config_file_path.empty()) {
                return g_config_file_path;
            }
            if (const char *env = std::getenv(CONFIG_PATH_ENV); env != nullptr && *env != '\0') {
                return env;
            }
            std::filesystem::path exe_dir(mcpmail::core::executable_directory());
            return (exe_dir / CONFIG_FILE).string();
        }

        enum class ConfigMode {
            NONE,  // Use default settings without file
            STATIC // Load from file once, creating it with defaults when absent
        };

        /**
 * HTTP listener, threads and logging
 */
        struct ServerConfig {
            std::string ip = "0.0.0.0";
            unsigned short http_port = 8000;
            size_t io_threads = 4;
            std::string log_level = "info";
            std::string log_path = "logs/mcpmail_server.log";
            size_t max_file_size = 10485760;
            size_t max_files = 10;
            size_t max_request_size = 1024 * 1024;

            static ServerConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["server"];
                    ServerConfig config;

                    config.ip = section["ip"].String().empty() ? config.ip : section["ip"].String();
                    config.http_port = section["http_port"].String().empty() ? config.http_port : static_cast<unsigned short>(section["http_port"]);
                    config.io_threads = section["io_threads"].String().empty() ? config.io_threads : static_cast<size_t>(section["io_threads"]);
                    config.log_level = section["log_level"].String().empty() ? config.log_level : section["log_level"].String();
                    // An explicitly empty log_path keeps logging on the console only
                    config.log_path = section["log_path"].String();
                    config.max_file_size = section["max_file_size"].String().empty() ? config.max_file_size : static_cast<size_t>(section["max_file_size"]);
                    config.max_files = section["max_files"].String().empty() ? config.max_files : static_cast<size_t>(section["max_files"]);
                    config.max_request_size = section["max_request_size"].String().empty() ? config.max_request_size : static_cast<size_t>(section["max_request_size"]);

                    if (config.io_threads == 0) {
                        config.io_threads = 1;
                    }
                    return config;
                } catch (const std::exception &e) {
                    MCPMAIL_ERROR("Failed to load server config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Session lifetime and event log retention, all durations in seconds
 */
        struct SessionConfig {
            size_t idle_timeout = 1800;
            size_t sweep_interval = 60;
            size_t max_events = 1000;
            size_t retention_window = 3600;
            size_t keepalive_interval = 15;

            static SessionConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["session"];
                    SessionConfig config;

                    config.idle_timeout = section["idle_timeout"].String().empty() ? config.idle_timeout : static_cast<size_t>(section["idle_timeout"]);
                    config.sweep_interval = section["sweep_interval"].String().empty() ? config.sweep_interval : static_cast<size_t>(section["sweep_interval"]);
                    config.max_events = section["max_events"].String().empty() ? config.max_events : static_cast<size_t>(section["max_events"]);
                    config.retention_window = section["retention_window"].String().empty() ? config.retention_window : static_cast<size_t>(section["retention_window"]);
                    config.keepalive_interval = section["keepalive_interval"].String().empty() ? config.keepalive_interval : static_cast<size_t>(section["keepalive_interval"]);

                    if (config.sweep_interval == 0) {
                        config.sweep_interval = 1;
                    }
                    if (config.keepalive_interval == 0) {
                        config.keepalive_interval = 1;
                    }
                    return config;
                } catch (const std::exception &e) {
                    MCPMAIL_ERROR("Failed to load session config: {}", e.what());
                    throw;
                }
            }
        };

        /**
 * Outbound SMTP server
 */
        struct SmtpConfig {
            std::string host = "localhost";
            unsigned short port = 587;
            std::string user;
            std::string password;
            std::string use_tls = "auto";
            size_t timeout = 30;
            size_t verify_timeout = 10;
            std::string helo_name = "localhost";
            bool verify_certificate = true;

            static SmtpConfig load(inicpp::IniManager &ini) {
                try {
                    auto section = ini["smtp"];
                    SmtpConfig config;

                    config.host = section["host"].String().empty() ? config.host : section["host"].String();
                    config.port = section["port"].String().empty() ? config.port : static_cast<unsigned short>(section["port"]);
                    config.user = section["user"].String();
                    config.password = section["password"].String();
                    config.use_tls = section["use_tls"].String().empty() ? config.use_tls : section["use_tls"].String();
                    config.timeout = section["timeout"].String().empty() ? config.timeout : static_cast<size_t>(section["timeout"]);
                    config.verify_timeout = section["verify_timeout"].String().empty() ? config.verify_timeout : static_cast<size_t>(section["verify_timeout"]);
                    config.helo_name = section["helo_name"].String().empty() ? config.helo_name : section["helo_name"].String();
                    config.verify_certificate = section["verify_certificate"].String().empty() ? true : static_cast<bool>(section["verify_certificate"]);
                    return config;
                } catch (const std::exception &e) {
                    MCPMAIL_ERROR("Failed to load smtp config: {}", e.what());
                    throw;
                }
            }

            /**
             * @brief Apply SMTP_HOST, SMTP_PORT, SMTP_USER, SMTP_PASSWORD and SMTP_USE_TLS.
             * Environment values win over the file; an unparsable port is ignored.
             */
            void apply_environment() {
                auto env = [](const char *name) -> std::string {
                    const char *value = std::getenv(name);
                    return value == nullptr ? "" : value;
                };

                if (auto value = env("SMTP_HOST"); !value.empty()) {
                    host = value;
                }
                if (auto value = env("SMTP_PORT"); !value.empty()) {
                    try {
                        unsigned long parsed = std::stoul(value);
                        if (parsed == 0 || parsed > 65535) {
                            throw std::out_of_range("port");
                        }
                        port = static_cast<unsigned short>(parsed);
                    } catch (const std::exception &) {
                        MCPMAIL_WARN("Ignoring invalid SMTP_PORT value: {}", value);
                    }
                }
                if (auto value = env("SMTP_USER"); !value.empty()) {
                    user = value;
                }
                if (auto value = env("SMTP_PASSWORD"); !value.empty()) {
                    password = value;
                }
                if (auto value = env("SMTP_USE_TLS"); !value.empty()) {
                    use_tls = value;
                }
            }
        };

        /**
 * Global configuration
 */
        struct GlobalConfig {
            std::string title = "MCPMail Server Configuration";
            ServerConfig server;
            SessionConfig session;
            SmtpConfig smtp;

            static GlobalConfig load(const std::string &path) {
                try {
                    inicpp::IniManager ini(path);
                    MCPMAIL_INFO("Loading configuration from: {}", path);

                    GlobalConfig config;
                    config.title = ini[""]["title"].String().empty() ? config.title : ini[""]["title"].String();
                    config.server = ServerConfig::load(ini);
                    config.session = SessionConfig::load(ini);
                    config.smtp = SmtpConfig::load(ini);
                    return config;
                } catch (const std::exception &e) {
                    MCPMAIL_ERROR("Failed to load global config: {}", e.what());
                    throw;
                }
            }
        };

        inline void initialize_default_config(const std::string &config_file) {
            try {
                if (std::filesystem::exists(config_file) && std::filesystem::file_size(config_file) > 0) {
                    return;
                }
                auto parent = std::filesystem::path(config_file).parent_path();
                if (!parent.empty()) {
                    std::filesystem::create_directories(parent);
                }

                inicpp::IniManager ini(config_file);
                MCPMAIL_INFO("Creating default config file: {}", config_file);
                const GlobalConfig defaults;

                // [server]
                ini.set("server", "ip", defaults.server.ip);
                ini.set("server", "http_port", defaults.server.http_port);
                ini.set("server", "io_threads", defaults.server.io_threads);
                ini.set("server", "log_level", defaults.server.log_level);
                ini.set("server", "log_path", defaults.server.log_path);
                ini.set("server", "max_file_size", defaults.server.max_file_size);
                ini.set("server", "max_files", defaults.server.max_files);
                ini.set("server", "max_request_size", defaults.server.max_request_size);

                // [session]
                ini.set("session", "idle_timeout", defaults.session.idle_timeout);
                ini.set("session", "sweep_interval", defaults.session.sweep_interval);
                ini.set("session", "max_events", defaults.session.max_events);
                ini.set("session", "retention_window", defaults.session.retention_window);
                ini.set("session", "keepalive_interval", defaults.session.keepalive_interval);

                // [smtp]
                ini.set("smtp", "host", defaults.smtp.host);
                ini.set("smtp", "port", defaults.smtp.port);
                ini.set("smtp", "user", "");
                ini.set("smtp", "password", "");
                ini.set("smtp", "use_tls", defaults.smtp.use_tls);
                ini.set("smtp", "timeout", defaults.smtp.timeout);
                ini.set("smtp", "verify_timeout", defaults.smtp.verify_timeout);
                ini.set("smtp", "helo_name", defaults.smtp.helo_name);
                ini.set("smtp", "verify_certificate", 1);

                ini.setComment("server", "ip", "IP address the server binds to");
                ini.setComment("server", "http_port", "HTTP port for the MCP endpoint");
                ini.setComment("server", "io_threads", "Number of io_context threads");
                ini.setComment("server", "log_level", "Logging severity (trace, debug, info, warn, error)");
                ini.setComment("server", "log_path", "Log file path (empty for console only)");
                ini.setComment("server", "max_file_size", "Maximum size per log file in bytes");
                ini.setComment("server", "max_files", "Maximum number of rotated log files");
                ini.setComment("server", "max_request_size", "Maximum request body size in bytes");

                ini.setComment("session", "idle_timeout", "Seconds of inactivity before a session is evicted");
                ini.setComment("session", "sweep_interval", "Seconds between eviction sweeps");
                ini.setComment("session", "max_events", "Events retained per session for stream resumption (0 = unlimited)");
                ini.setComment("session", "retention_window", "Seconds an event is retained (0 = unlimited)");
                ini.setComment("session", "keepalive_interval", "Seconds between SSE keep-alive comments");

                ini.setComment("smtp", "host", "SMTP server hostname (env SMTP_HOST)");
                ini.setComment("smtp", "port", "SMTP server port (env SMTP_PORT)");
                ini.setComment("smtp", "user", "SMTP username, also the default sender (env SMTP_USER)");
                ini.setComment("smtp", "password", "SMTP password (env SMTP_PASSWORD)");
                ini.setComment("smtp", "use_tls", "auto, 1 (STARTTLS or implicit on 465), 0 (plain), ssl (env SMTP_USE_TLS)");
                ini.setComment("smtp", "timeout", "Connect and command timeout in seconds");
                ini.setComment("smtp", "verify_timeout", "Timeout in seconds for verify_connection");
                ini.setComment("smtp", "helo_name", "Name announced in EHLO");
                ini.setComment("smtp", "verify_certificate", "Verify the server certificate (1=yes, 0=no)");

                ini.set("title", defaults.title);
                ini.setComment("title", "Auto-generated configuration file");
                ini.parse();

                MCPMAIL_INFO("Default config created successfully");
            } catch (const std::exception &e) {
                MCPMAIL_ERROR("Failed to initialize default config: {}", e.what());
                throw;
            }
        }

        /**
 * Load the configuration for the given mode and apply SMTP_* environment overrides
 */
        inline GlobalConfig load_config(ConfigMode mode = ConfigMode::STATIC) {
            GlobalConfig config;
            if (mode == ConfigMode::STATIC) {
                std::string path = get_config_file_path();
                if (!std::filesystem::exists(path)) {
                    initialize_default_config(path);
                }
                config = GlobalConfig::load(path);
            }
            config.smtp.apply_environment();
            return config;
        }

        inline void print_config(const GlobalConfig &config) {
            MCPMAIL_DEBUG("===== MCPMail Configuration =====");
            MCPMAIL_DEBUG("Title: {}", config.title);
            MCPMAIL_DEBUG("Listen: {}:{}", config.server.ip, config.server.http_port);
            MCPMAIL_DEBUG("IO threads: {}", config.server.io_threads);
            MCPMAIL_DEBUG("Log Level: {}", config.server.log_level);
            MCPMAIL_DEBUG("Max request size: {}", config.server.max_request_size);
            MCPMAIL_DEBUG("Session idle timeout: {}s (sweep every {}s)", config.session.idle_timeout, config.session.sweep_interval);
            MCPMAIL_DEBUG("Event retention: {} events / {}s", config.session.max_events, config.session.retention_window);
            MCPMAIL_DEBUG("SMTP: {}:{} (tls {}, user {})", config.smtp.host, config.smtp.port, config.smtp.use_tls,
                          config.smtp.user.empty() ? "<none>" : config.smtp.user);
            MCPMAIL_DEBUG("=================================");
        }

    }// namespace config
}// namespace mcpmail

#endif// MCPMAIL_CONFIG_HPP
