// src/business/mail/email_tools.h
#pragma once

#include "business/tool_registry.h"
#include "mailer.h"
#include <memory>

namespace mcpmail::business::mail {

    /**
     * @brief The four mail tools exposed over tools/call.
     *
     * Every handler answers with a {success: bool, ...} payload and never throws;
     * SMTP and input failures end up in the payload's "error" field.
     */
    class EmailTools : public std::enable_shared_from_this<EmailTools> {
    public:
        explicit EmailTools(std::shared_ptr<Mailer> mailer);

        // Registers send_email, send_bulk_email, send_template_email and verify_connection, in that order
        void register_all(ToolRegistry &registry);

        asio::awaitable<nlohmann::json> send_email(nlohmann::json args);
        asio::awaitable<nlohmann::json> send_bulk_email(nlohmann::json args);
        asio::awaitable<nlohmann::json> send_template_email(nlohmann::json args);
        asio::awaitable<nlohmann::json> verify_connection(nlohmann::json args);

    private:
        /**
         * @brief Fill sender, recipients and body options shared by all send tools.
         * @return an error message, empty on success
         */
        std::string build_message(const nlohmann::json &args, const std::string &to, const std::string &body,
                                  MailMessage &message) const;

        asio::awaitable<nlohmann::json> deliver(MailMessage message);

        std::shared_ptr<Mailer> mailer_;
    };

}// namespace mcpmail::business::mail
