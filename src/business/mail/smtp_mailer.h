// src/business/mail/smtp_mailer.h
#pragma once

#include "mailer.h"

namespace mcpmail::business::mail {

    /**
     * @brief Mailer speaking SMTP over asio, with STARTTLS or implicit TLS via asio::ssl.
     *
     * Each call opens its own connection on the caller's executor; nothing blocks
     * the io thread. Every network step is bounded by settings().timeout, or by
     * verify_timeout during verify().
     */
    class SmtpMailer : public Mailer {
    public:
        explicit SmtpMailer(SmtpSettings settings);

        asio::awaitable<void> send(const MailMessage &message) override;
        asio::awaitable<VerifyResult> verify() override;
        const SmtpSettings &settings() const override { return settings_; }

    private:
        SmtpSettings settings_;
    };

}// namespace mcpmail::business::mail
