// src/business/mail/mail_message.h
#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <vector>

namespace mcpmail::business::mail {

    struct Attachment {
        std::string filename;
        std::string content;// decoded bytes
    };

    struct MailMessage {
        std::string from;
        std::string to;
        std::vector<std::string> cc;
        std::vector<std::string> bcc;
        std::string subject;
        std::string body;
        bool html = false;
        std::vector<Attachment> attachments;

        // Envelope recipients: to, then cc, then bcc
        std::vector<std::string> recipients() const;
    };

    /**
     * @brief Render the message as RFC 5322 text with CRLF line endings.
     *
     * multipart/mixed with a base64 text part followed by one part per attachment.
     * Bcc recipients never appear in the headers.
     */
    std::string compose_mime(const MailMessage &message, const std::string &boundary);

    // Random multipart boundary
    std::string make_boundary();

    // RFC 2047 encoded-word for non-ASCII header text, the text itself otherwise
    std::string encode_header_word(const std::string &text);

    // "Name <a@b>" -> "a@b"
    std::string extract_address(const std::string &mailbox);

    /**
     * @brief Replace every "{key}" in the template with the variable's value.
     * Non-string values are substituted as their JSON text.
     */
    std::string render_template(const std::string &tmpl, const nlohmann::json &variables);

    /**
     * @brief Prepare message text for the SMTP DATA phase: normalize line endings
     * to CRLF and double any leading dot.
     */
    std::string dot_stuff(const std::string &data);

}// namespace mcpmail::business::mail
