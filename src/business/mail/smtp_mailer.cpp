#include "smtp_mailer.h"
#include "core/logger.h"
#include "utils/base64.h"
#include <algorithm>
#include <asio/co_spawn.hpp>
#include <asio/connect.hpp>
#include <asio/detached.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>
#include <asio/this_coro.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>
#include <cctype>
#include <exception>

using asio::use_awaitable;

namespace mcpmail::business::mail {

    TlsMode resolve_tls_mode(const std::string &use_tls, unsigned short port) {
        std::string value = use_tls;
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (value == "0" || value == "false" || value == "no" || value == "off") {
            return TlsMode::None;
        }
        if (value == "1" || value == "true" || value == "yes" || value == "on" || value == "starttls") {
            return port == 465 ? TlsMode::Implicit : TlsMode::StartTls;
        }
        if (value == "ssl" || value == "implicit") {
            return TlsMode::Implicit;
        }
        if (port == 465) {
            return TlsMode::Implicit;
        }
        return port == 25 ? TlsMode::None : TlsMode::StartTls;
    }

    const char *to_string(TlsMode mode) {
        switch (mode) {
            case TlsMode::None:
                return "none";
            case TlsMode::StartTls:
                return "starttls";
            case TlsMode::Implicit:
                return "implicit";
        }
        return "unknown";
    }

    namespace {

        struct SmtpReply {
            int code = 0;
            std::vector<std::string> lines;

            std::string text() const {
                std::string out;
                for (const auto &line: lines) {
                    if (!out.empty()) {
                        out += " ";
                    }
                    out += line;
                }
                return out;
            }
        };

        asio::ssl::context make_ssl_context(const SmtpSettings &settings) {
            asio::ssl::context ctx(asio::ssl::context::tls_client);
            ctx.set_options(asio::ssl::context::default_workarounds |
                            asio::ssl::context::no_sslv2 |
                            asio::ssl::context::no_sslv3 |
                            asio::ssl::context::no_tlsv1 |
                            asio::ssl::context::no_tlsv1_1);
            if (settings.verify_certificate) {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(asio::ssl::verify_peer);
            } else {
                ctx.set_verify_mode(asio::ssl::verify_none);
            }
            return ctx;
        }

        /**
         * @brief One SMTP conversation. A watchdog coroutine aborts the socket when
         * the current step outlives the configured timeout.
         */
        class SmtpClient : public std::enable_shared_from_this<SmtpClient> {
        public:
            SmtpClient(const asio::any_io_executor &executor, const SmtpSettings &settings)
                : settings_(settings),
                  ssl_ctx_(make_ssl_context(settings)),
                  stream_(executor, ssl_ctx_),
                  resolver_(executor),
                  timer_(executor) {
                if (settings_.verify_certificate) {
                    stream_.set_verify_callback(asio::ssl::host_name_verification(settings_.host));
                }
            }

            asio::awaitable<void> connect() {
                arm();
                start_watchdog();

                auto endpoints = co_await resolver_.async_resolve(settings_.host, std::to_string(settings_.port),
                                                                  use_awaitable);
                co_await asio::async_connect(stream_.next_layer(), endpoints, use_awaitable);
                MCPMAIL_DEBUG("Connected to SMTP server {}:{} (tls {})", settings_.host, settings_.port,
                              to_string(settings_.tls));

                if (settings_.tls == TlsMode::Implicit) {
                    co_await handshake();
                }

                arm();
                auto greeting = co_await read_reply();
                if (greeting.code / 100 != 2) {
                    throw SmtpError(greeting.code, greeting.text());
                }

                co_await ehlo();
                if (settings_.tls == TlsMode::StartTls) {
                    if (!has_capability("STARTTLS")) {
                        throw SmtpError(0, "SMTP server " + settings_.host + " does not offer STARTTLS");
                    }
                    co_await command("STARTTLS", 2);
                    co_await handshake();
                    co_await ehlo();
                }
            }

            /**
             * @return true if the server accepted the credentials; a rejection is
             * logged and the conversation continues unauthenticated
             */
            asio::awaitable<bool> authenticate() {
                if (!settings_.has_credentials()) {
                    co_return false;
                }
                std::string failure;
                try {
                    if (supports_auth("PLAIN") || !supports_auth("LOGIN")) {
                        std::string token;
                        token.push_back('\0');
                        token += settings_.user;
                        token.push_back('\0');
                        token += settings_.password;
                        co_await command("AUTH PLAIN " + utils::base64_encode(token), 2, true);
                    } else {
                        co_await command("AUTH LOGIN", 3, true);
                        co_await command(utils::base64_encode(settings_.user), 3, true);
                        co_await command(utils::base64_encode(settings_.password), 2, true);
                    }
                } catch (const SmtpError &e) {
                    failure = e.what();
                }
                if (!failure.empty()) {
                    MCPMAIL_WARN("SMTP authentication failed, continuing without auth: {}", failure);
                    co_return false;
                }
                MCPMAIL_DEBUG("Authenticated to SMTP server as {}", settings_.user);
                co_return true;
            }

            asio::awaitable<void> transmit(const MailMessage &message) {
                co_await command("MAIL FROM:<" + extract_address(message.from) + ">", 2);
                for (const auto &recipient: message.recipients()) {
                    co_await command("RCPT TO:<" + extract_address(recipient) + ">", 2);
                }
                co_await command("DATA", 3);

                std::string data = dot_stuff(compose_mime(message, make_boundary()));
                if (data.size() < 2 || data.compare(data.size() - 2, 2, "\r\n") != 0) {
                    data += "\r\n";
                }
                data += ".\r\n";

                arm();
                co_await write_raw(data);
                auto reply = co_await read_reply();
                if (reply.code / 100 != 2) {
                    throw SmtpError(reply.code, reply.text());
                }
            }

            asio::awaitable<void> quit() {
                std::string failure;
                try {
                    co_await command("QUIT", 2);
                } catch (const std::exception &e) {
                    failure = e.what();
                }
                if (!failure.empty()) {
                    MCPMAIL_DEBUG("SMTP QUIT not acknowledged: {}", failure);
                }
            }

            // Stop the watchdog and release the socket
            void finish() {
                finished_ = true;
                timer_.cancel();
                abort_io();
            }

            bool timed_out() const { return timed_out_; }

        private:
            void arm() {
                timer_.expires_after(settings_.timeout);
            }

            void start_watchdog() {
                asio::co_spawn(
                        timer_.get_executor(),
                        [self = shared_from_this()]() -> asio::awaitable<void> {
                            co_await self->watchdog();
                        },
                        asio::detached);
            }

            asio::awaitable<void> watchdog() {
                while (!finished_) {
                    std::error_code ec;
                    co_await timer_.async_wait(asio::redirect_error(use_awaitable, ec));
                    if (finished_) {
                        break;
                    }
                    // A re-arm cancels the wait; only a real expiry aborts
                    if (timer_.expiry() <= asio::steady_timer::clock_type::now()) {
                        timed_out_ = true;
                        abort_io();
                        break;
                    }
                }
            }

            void abort_io() {
                resolver_.cancel();
                asio::error_code ec;
                stream_.next_layer().close(ec);
            }

            asio::awaitable<void> handshake() {
                if (!SSL_set_tlsext_host_name(stream_.native_handle(), settings_.host.c_str())) {
                    throw SmtpError(0, "Failed to set TLS server name");
                }
                arm();
                co_await stream_.async_handshake(asio::ssl::stream_base::client, use_awaitable);
                tls_active_ = true;
                // Anything buffered before the handshake came over plaintext
                inbuf_.clear();
            }

            asio::awaitable<void> ehlo() {
                auto reply = co_await exchange("EHLO " + settings_.helo_name, false);
                if (reply.code / 100 != 2) {
                    co_await command("HELO " + settings_.helo_name, 2);
                    capabilities_.clear();
                    co_return;
                }
                capabilities_.clear();
                for (size_t i = 1; i < reply.lines.size(); ++i) {
                    std::string cap = reply.lines[i];
                    std::transform(cap.begin(), cap.end(), cap.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                    capabilities_.push_back(cap);
                }
            }

            bool has_capability(const std::string &name) const {
                return std::any_of(capabilities_.begin(), capabilities_.end(), [&](const std::string &cap) {
                    return cap == name || cap.rfind(name + " ", 0) == 0;
                });
            }

            bool supports_auth(const std::string &mechanism) const {
                for (const auto &cap: capabilities_) {
                    if (cap.rfind("AUTH ", 0) == 0 || cap.rfind("AUTH=", 0) == 0) {
                        if ((" " + cap.substr(5) + " ").find(" " + mechanism + " ") != std::string::npos) {
                            return true;
                        }
                    }
                }
                return false;
            }

            asio::awaitable<SmtpReply> exchange(const std::string &line, bool secret) {
                if (line.find_first_of("\r\n") != std::string::npos) {
                    throw SmtpError(0, "SMTP command contains a line break");
                }
                if (secret) {
                    MCPMAIL_TRACE("SMTP > [credentials]");
                } else {
                    MCPMAIL_TRACE("SMTP > {}", line);
                }
                arm();
                co_await write_raw(line + "\r\n");
                co_return co_await read_reply();
            }

            // Send a command and require a reply of the given class (2xx, 3xx)
            asio::awaitable<SmtpReply> command(const std::string &line, int expected_class, bool secret = false) {
                auto reply = co_await exchange(line, secret);
                if (reply.code / 100 != expected_class) {
                    throw SmtpError(reply.code, reply.text());
                }
                co_return reply;
            }

            asio::awaitable<void> write_raw(const std::string &data) {
                if (tls_active_) {
                    co_await asio::async_write(stream_, asio::buffer(data), use_awaitable);
                } else {
                    co_await asio::async_write(stream_.next_layer(), asio::buffer(data), use_awaitable);
                }
            }

            asio::awaitable<std::string> read_line() {
                size_t n = 0;
                if (tls_active_) {
                    n = co_await asio::async_read_until(stream_, asio::dynamic_buffer(inbuf_), "\r\n", use_awaitable);
                } else {
                    n = co_await asio::async_read_until(stream_.next_layer(), asio::dynamic_buffer(inbuf_), "\r\n",
                                                        use_awaitable);
                }
                std::string line = inbuf_.substr(0, n - 2);
                inbuf_.erase(0, n);
                co_return line;
            }

            asio::awaitable<SmtpReply> read_reply() {
                SmtpReply reply;
                while (true) {
                    std::string line = co_await read_line();
                    MCPMAIL_TRACE("SMTP < {}", line);
                    if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
                        !std::isdigit(static_cast<unsigned char>(line[1])) ||
                        !std::isdigit(static_cast<unsigned char>(line[2]))) {
                        throw SmtpError(0, "Malformed SMTP reply: " + line);
                    }
                    reply.code = std::stoi(line.substr(0, 3));
                    reply.lines.push_back(line.size() > 4 ? line.substr(4) : "");
                    if (line.size() < 4 || line[3] != '-') {
                        break;
                    }
                }
                co_return reply;
            }

            const SmtpSettings settings_;
            asio::ssl::context ssl_ctx_;
            asio::ssl::stream<asio::ip::tcp::socket> stream_;
            asio::ip::tcp::resolver resolver_;
            asio::steady_timer timer_;
            std::string inbuf_;
            std::vector<std::string> capabilities_;
            bool tls_active_ = false;
            bool finished_ = false;
            bool timed_out_ = false;
        };

        template<typename Conversation>
        asio::awaitable<void> run_conversation(const SmtpSettings &settings, Conversation conversation) {
            auto executor = co_await asio::this_coro::executor;
            auto client = std::make_shared<SmtpClient>(executor, settings);

            std::exception_ptr failure;
            try {
                co_await client->connect();
                co_await conversation(*client);
                co_await client->quit();
            } catch (const std::exception &) {
                failure = std::current_exception();
            }
            bool timed_out = client->timed_out();
            client->finish();

            if (failure) {
                if (timed_out) {
                    throw SmtpError(0, "Timed out after " + std::to_string(settings.timeout.count()) +
                                               "s talking to " + settings.host + ":" + std::to_string(settings.port));
                }
                std::rethrow_exception(failure);
            }
        }
    }// namespace

    SmtpMailer::SmtpMailer(SmtpSettings settings) : settings_(std::move(settings)) {
        MCPMAIL_INFO("SMTP mailer configured for {}:{} (tls {}, auth {})", settings_.host, settings_.port,
                     to_string(settings_.tls), settings_.has_credentials() ? "yes" : "no");
    }

    asio::awaitable<void> SmtpMailer::send(const MailMessage &message) {
        co_await run_conversation(settings_, [&message](SmtpClient &client) -> asio::awaitable<void> {
            co_await client.authenticate();
            co_await client.transmit(message);
        });
        MCPMAIL_INFO("Mail delivered to {} recipient(s) via {}:{}", message.recipients().size(), settings_.host,
                     settings_.port);
    }

    asio::awaitable<VerifyResult> SmtpMailer::verify() {
        VerifyResult result;
        SmtpSettings settings = settings_;
        settings.timeout = settings_.verify_timeout;
        co_await run_conversation(settings, [&result](SmtpClient &client) -> asio::awaitable<void> {
            result.authenticated = co_await client.authenticate();
        });
        co_return result;
    }

}// namespace mcpmail::business::mail
