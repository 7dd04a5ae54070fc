// src/business/mail/mailer.h
#pragma once

#include "core/errors.h"
#include "mail_message.h"
#include <asio/awaitable.hpp>
#include <chrono>
#include <string>

namespace mcpmail::business::mail {

    enum class TlsMode {
        None,    ///< Plain SMTP
        StartTls,///< Upgrade after EHLO
        Implicit ///< TLS from the first byte (SMTPS)
    };

    /**
     * @brief Map the configured use_tls value to a mode.
     * "auto" (or empty) picks by port: 465 implicit, 25 plain, anything else STARTTLS.
     * A true value on port 465 means implicit TLS.
     */
    TlsMode resolve_tls_mode(const std::string &use_tls, unsigned short port);

    const char *to_string(TlsMode mode);

    struct SmtpSettings {
        std::string host = "localhost";
        unsigned short port = 587;
        std::string user;
        std::string password;
        TlsMode tls = TlsMode::StartTls;
        std::chrono::seconds timeout{30};
        std::chrono::seconds verify_timeout{10};// Applies to verify() instead of timeout
        std::string helo_name = "localhost";
        bool verify_certificate = true;

        bool has_credentials() const { return !user.empty() && !password.empty(); }
    };

    struct VerifyResult {
        bool authenticated = false;
    };

    /**
     * @brief SMTP-level failure: a negative reply, a protocol violation or a timeout.
     */
    class SmtpError : public core::McpMailError {
    public:
        SmtpError(int reply_code, const std::string &message)
            : McpMailError(reply_code > 0 ? "SMTP " + std::to_string(reply_code) + ": " + message : message),
              reply_code_(reply_code) {}

        int reply_code() const { return reply_code_; }

    private:
        int reply_code_;
    };

    /**
     * @brief Mail delivery collaborator used by the mail tools.
     */
    class Mailer {
    public:
        virtual ~Mailer() = default;

        /**
         * @brief Deliver one message to all of its recipients.
         * @throws SmtpError or std::system_error on failure
         */
        virtual asio::awaitable<void> send(const MailMessage &message) = 0;

        /**
         * @brief Connect, negotiate TLS and try to authenticate, then quit.
         * @throws SmtpError or std::system_error when the server is unusable
         */
        virtual asio::awaitable<VerifyResult> verify() = 0;

        virtual const SmtpSettings &settings() const = 0;
    };

}// namespace mcpmail::business::mail
