#include "business/mail/smtp_mailer.h"
#include "utils/base64.h"
#include <algorithm>
#include <array>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <asio/write.hpp>
#include <chrono>
#include <gtest/gtest.h>

using namespace mcpmail::business::mail;
using asio::use_awaitable;

namespace {
    /**
     * @brief Scripted SMTP server on a loopback port. Serves a single conversation
     * and records every command line it receives.
     */
    class FakeSmtpServer {
    public:
        explicit FakeSmtpServer(asio::io_context &io)
            : acceptor_(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)) {}

        unsigned short port() const { return acceptor_.local_endpoint().port(); }

        void start() {
            asio::co_spawn(acceptor_.get_executor(), serve(), asio::detached);
        }

        bool has_command(const std::string &prefix) const {
            return std::any_of(commands.begin(), commands.end(),
                               [&](const std::string &c) { return c.rfind(prefix, 0) == 0; });
        }

        // Script
        bool greet = true;
        bool ehlo_supported = true;
        std::vector<std::string> capabilities = {"PIPELINING", "AUTH PLAIN LOGIN"};
        std::string auth_reply = "235 2.7.0 Authentication successful";
        std::string rejected_recipient;

        // Transcript
        std::vector<std::string> commands;
        std::string data;

    private:
        asio::awaitable<void> serve() {
            auto socket = co_await acceptor_.async_accept(use_awaitable);
            std::string buffer;

            if (!greet) {
                // Say nothing and wait for the client to give up
                std::array<char, 256> scratch;
                asio::error_code ec;
                while (!ec) {
                    co_await socket.async_read_some(asio::buffer(scratch), asio::redirect_error(use_awaitable, ec));
                }
                co_return;
            }

            bool open = co_await send(socket, "220 fake.test ESMTP ready\r\n");
            while (open) {
                std::string line;
                if (!co_await read_line(socket, buffer, line)) {
                    break;
                }
                commands.push_back(line);

                if (line.rfind("EHLO ", 0) == 0) {
                    open = co_await send(socket, ehlo_reply());
                } else if (line.rfind("HELO ", 0) == 0) {
                    open = co_await send(socket, "250 fake.test\r\n");
                } else if (line.rfind("AUTH PLAIN", 0) == 0) {
                    open = co_await send(socket, auth_reply + "\r\n");
                } else if (line == "AUTH LOGIN") {
                    open = co_await send(socket, "334 VXNlcm5hbWU6\r\n") &&
                           co_await read_line(socket, buffer, line);
                    commands.push_back(line);
                    open = open && co_await send(socket, "334 UGFzc3dvcmQ6\r\n") &&
                           co_await read_line(socket, buffer, line);
                    commands.push_back(line);
                    open = open && co_await send(socket, auth_reply + "\r\n");
                } else if (line.rfind("MAIL FROM:", 0) == 0) {
                    open = co_await send(socket, "250 2.1.0 Ok\r\n");
                } else if (line.rfind("RCPT TO:", 0) == 0) {
                    bool rejected = !rejected_recipient.empty() && line.find(rejected_recipient) != std::string::npos;
                    open = co_await send(socket, rejected ? "550 5.1.1 Mailbox unavailable\r\n" : "250 2.1.5 Ok\r\n");
                } else if (line == "DATA") {
                    open = co_await send(socket, "354 End data with <CR><LF>.<CR><LF>\r\n") &&
                           co_await read_data(socket, buffer) && co_await send(socket, "250 2.0.0 Queued as 42\r\n");
                } else if (line == "QUIT") {
                    co_await send(socket, "221 2.0.0 Bye\r\n");
                    break;
                } else {
                    open = co_await send(socket, "500 5.5.1 Command unrecognized\r\n");
                }
            }
        }

        std::string ehlo_reply() const {
            if (!ehlo_supported) {
                return "502 5.5.2 Error: command not recognized\r\n";
            }
            std::string reply = capabilities.empty() ? "250 fake.test\r\n" : "250-fake.test\r\n";
            for (size_t i = 0; i < capabilities.size(); ++i) {
                reply += (i + 1 == capabilities.size() ? "250 " : "250-") + capabilities[i] + "\r\n";
            }
            return reply;
        }

        static asio::awaitable<bool> send(asio::ip::tcp::socket &socket, const std::string &text) {
            asio::error_code ec;
            co_await asio::async_write(socket, asio::buffer(text), asio::redirect_error(use_awaitable, ec));
            co_return !ec;
        }

        static asio::awaitable<bool> read_line(asio::ip::tcp::socket &socket, std::string &buffer, std::string &line) {
            asio::error_code ec;
            auto n = co_await asio::async_read_until(socket, asio::dynamic_buffer(buffer), "\r\n",
                                                     asio::redirect_error(use_awaitable, ec));
            if (ec) {
                co_return false;
            }
            line = buffer.substr(0, n - 2);
            buffer.erase(0, n);
            co_return true;
        }

        asio::awaitable<bool> read_data(asio::ip::tcp::socket &socket, std::string &buffer) {
            asio::error_code ec;
            auto n = co_await asio::async_read_until(socket, asio::dynamic_buffer(buffer), "\r\n.\r\n",
                                                     asio::redirect_error(use_awaitable, ec));
            if (ec) {
                co_return false;
            }
            data = buffer.substr(0, n);
            buffer.erase(0, n);
            co_return true;
        }

        asio::ip::tcp::acceptor acceptor_;
    };

    MailMessage sample_message() {
        MailMessage msg;
        msg.from = "Robot <robot@example.com>";
        msg.to = "alice@example.com";
        msg.cc = {"bob@example.com"};
        msg.bcc = {"hidden@example.com"};
        msg.subject = "Status";
        msg.body = "All systems nominal.";
        return msg;
    }
}// namespace

class SmtpMailerTest : public ::testing::Test {
protected:
    SmtpSettings settings() const {
        SmtpSettings s;
        s.host = "127.0.0.1";
        s.port = server.port();
        s.user = "robot@example.com";
        s.password = "secret";
        s.tls = TlsMode::None;
        s.timeout = std::chrono::seconds(5);
        return s;
    }

    // Empty string on success, otherwise the error text
    std::string send(const SmtpSettings &s, const MailMessage &message) {
        SmtpMailer mailer(s);
        server.start();
        auto future = asio::co_spawn(io, mailer.send(message), asio::use_future);
        io.run();
        try {
            future.get();
        } catch (const std::exception &e) {
            return e.what();
        }
        return "";
    }

    VerifyResult verify(const SmtpSettings &s) {
        SmtpMailer mailer(s);
        server.start();
        auto future = asio::co_spawn(io, mailer.verify(), asio::use_future);
        io.run();
        return future.get();
    }

    asio::io_context io;
    FakeSmtpServer server{io};
};

TEST_F(SmtpMailerTest, DeliversWithAuthPlain) {
    auto message = sample_message();
    EXPECT_EQ(send(settings(), message), "");

    std::string token;
    token.push_back('\0');
    token += "robot@example.com";
    token.push_back('\0');
    token += "secret";

    std::vector<std::string> expected = {"EHLO localhost",
                                         "AUTH PLAIN " + mcpmail::utils::base64_encode(token),
                                         "MAIL FROM:<robot@example.com>",
                                         "RCPT TO:<alice@example.com>",
                                         "RCPT TO:<bob@example.com>",
                                         "RCPT TO:<hidden@example.com>",
                                         "DATA",
                                         "QUIT"};
    EXPECT_EQ(server.commands, expected);

    // Message text ends with the lone-dot terminator and never names Bcc recipients
    ASSERT_GE(server.data.size(), 5u);
    EXPECT_EQ(server.data.substr(server.data.size() - 5), "\r\n.\r\n");
    EXPECT_NE(server.data.find("Subject: Status\r\n"), std::string::npos);
    EXPECT_NE(server.data.find(mcpmail::utils::base64_encode(message.body)), std::string::npos);
    EXPECT_EQ(server.data.find("hidden@example.com"), std::string::npos);
}

TEST_F(SmtpMailerTest, FallsBackToAuthLogin) {
    server.capabilities = {"AUTH LOGIN"};
    EXPECT_EQ(send(settings(), sample_message()), "");

    ASSERT_GE(server.commands.size(), 4u);
    EXPECT_EQ(server.commands[1], "AUTH LOGIN");
    EXPECT_EQ(server.commands[2], mcpmail::utils::base64_encode("robot@example.com"));
    EXPECT_EQ(server.commands[3], mcpmail::utils::base64_encode("secret"));
    EXPECT_TRUE(server.has_command("MAIL FROM:"));
}

TEST_F(SmtpMailerTest, NoAuthWithoutCredentials) {
    auto s = settings();
    s.password.clear();
    EXPECT_EQ(send(s, sample_message()), "");
    EXPECT_FALSE(server.has_command("AUTH"));
    EXPECT_TRUE(server.has_command("DATA"));
}

TEST_F(SmtpMailerTest, RejectedCredentialsStillDeliver) {
    server.auth_reply = "535 5.7.8 Authentication credentials invalid";
    EXPECT_EQ(send(settings(), sample_message()), "");
    EXPECT_TRUE(server.has_command("DATA"));
}

TEST_F(SmtpMailerTest, VerifyReportsRejectedCredentials) {
    server.auth_reply = "535 5.7.8 Authentication credentials invalid";
    EXPECT_FALSE(verify(settings()).authenticated);
    EXPECT_EQ(server.commands.back(), "QUIT");
    EXPECT_FALSE(server.has_command("MAIL FROM:"));
}

TEST_F(SmtpMailerTest, VerifyAuthenticates) {
    EXPECT_TRUE(verify(settings()).authenticated);
}

TEST_F(SmtpMailerTest, HeloWhenEhloIsRefused) {
    server.ehlo_supported = false;
    EXPECT_EQ(send(settings(), sample_message()), "");
    ASSERT_GE(server.commands.size(), 2u);
    EXPECT_EQ(server.commands[0], "EHLO localhost");
    EXPECT_EQ(server.commands[1], "HELO localhost");
    EXPECT_TRUE(server.has_command("DATA"));
}

TEST_F(SmtpMailerTest, StartTlsMustBeOffered) {
    auto s = settings();
    s.tls = TlsMode::StartTls;
    auto error = send(s, sample_message());
    EXPECT_NE(error.find("does not offer STARTTLS"), std::string::npos) << error;
    EXPECT_FALSE(server.has_command("STARTTLS"));
    EXPECT_FALSE(server.has_command("MAIL FROM:"));
}

TEST_F(SmtpMailerTest, RejectedRecipientFailsTheSend) {
    server.rejected_recipient = "bob@example.com";
    auto error = send(settings(), sample_message());
    EXPECT_EQ(error, "SMTP 550: 5.1.1 Mailbox unavailable");
    EXPECT_FALSE(server.has_command("DATA"));
}

TEST_F(SmtpMailerTest, LineBreakInAddressNeverReachesTheServer) {
    auto message = sample_message();
    message.to = "victim@example.com>\r\nRSET\r\nMAIL FROM:<spoof@bank.com";
    EXPECT_EQ(send(settings(), message), "SMTP command contains a line break");
    EXPECT_FALSE(server.has_command("RSET"));
    EXPECT_FALSE(server.has_command("RCPT TO:"));
    EXPECT_FALSE(server.has_command("DATA"));
}

TEST_F(SmtpMailerTest, SilentServerTimesOut) {
    server.greet = false;
    auto s = settings();
    s.timeout = std::chrono::seconds(1);

    auto started = std::chrono::steady_clock::now();
    auto error = send(s, sample_message());
    EXPECT_EQ(error, "Timed out after 1s talking to 127.0.0.1:" + std::to_string(s.port));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST_F(SmtpMailerTest, VerifyUsesItsOwnTimeout) {
    server.greet = false;
    auto s = settings();
    s.timeout = std::chrono::seconds(30);
    s.verify_timeout = std::chrono::seconds(1);

    auto started = std::chrono::steady_clock::now();
    try {
        verify(s);
        FAIL() << "verify() should time out";
    } catch (const SmtpError &e) {
        EXPECT_EQ(std::string(e.what()), "Timed out after 1s talking to 127.0.0.1:" + std::to_string(s.port));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}
