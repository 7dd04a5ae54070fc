#include "email_tools.h"
#include "core/logger.h"
#include "utils/base64.h"

namespace mcpmail::business::mail {

    namespace {
        nlohmann::json failure(const std::string &error) {
            return {{"success", false}, {"error", error}};
        }

        std::string string_field(const nlohmann::json &args, const char *key) {
            auto it = args.find(key);
            if (it == args.end() || !it->is_string()) {
                return "";
            }
            return it->get<std::string>();
        }

        bool bool_field(const nlohmann::json &args, const char *key) {
            auto it = args.find(key);
            return it != args.end() && it->is_boolean() && it->get<bool>();
        }

        // Empty string on success, otherwise the reason the list was rejected
        std::string string_list(const nlohmann::json &args, const char *key, std::vector<std::string> &out) {
            auto it = args.find(key);
            if (it == args.end() || it->is_null()) {
                return "";
            }
            if (!it->is_array()) {
                return std::string(key) + " must be an array of strings";
            }
            for (const auto &item: *it) {
                if (!item.is_string()) {
                    return std::string(key) + " must be an array of strings";
                }
                out.push_back(item.get<std::string>());
            }
            return "";
        }

        bool has_line_break(const std::string &value) {
            return value.find_first_of("\r\n") != std::string::npos;
        }

        nlohmann::json address_list_schema(const std::string &description) {
            return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", description}};
        }
    }// namespace

    EmailTools::EmailTools(std::shared_ptr<Mailer> mailer) : mailer_(std::move(mailer)) {}

    void EmailTools::register_all(ToolRegistry &registry) {
        auto self = shared_from_this();
        const nlohmann::json from_addr = {
                {"type", "string"},
                {"description", "Sender email address (optional, defaults to SMTP_USER)"}};

        registry.register_tool(
                "send_email", "Send an email with optional attachments",
                {{"type", "object"},
                 {"properties",
                  {{"to", {{"type", "string"}, {"description", "Recipient email address"}}},
                   {"subject", {{"type", "string"}, {"description", "Email subject"}}},
                   {"body", {{"type", "string"}, {"description", "Email body content"}}},
                   {"from_addr", from_addr},
                   {"cc", address_list_schema("List of CC recipients (optional)")},
                   {"bcc", address_list_schema("List of BCC recipients (optional)")},
                   {"html", {{"type", "boolean"}, {"description", "Whether body is HTML (default: false for plain text)"}}},
                   {"attachments",
                    {{"type", "array"},
                     {"items",
                      {{"type", "object"},
                       {"properties",
                        {{"filename", {{"type", "string"}}},
                         {"content", {{"type", "string"}, {"description", "Base64 encoded content"}}}}}}},
                     {"description", "List of attachments (optional)"}}}}},
                 {"required", {"to", "subject", "body"}}},
                [self](nlohmann::json args) { return self->send_email(std::move(args)); });

        registry.register_tool(
                "send_bulk_email", "Send the same email to multiple recipients",
                {{"type", "object"},
                 {"properties",
                  {{"recipients", address_list_schema("List of recipient email addresses")},
                   {"subject", {{"type", "string"}, {"description", "Email subject"}}},
                   {"body", {{"type", "string"}, {"description", "Email body content"}}},
                   {"from_addr", from_addr},
                   {"html", {{"type", "boolean"}, {"description", "Whether body is HTML (default: false)"}}}}},
                 {"required", {"recipients", "subject", "body"}}},
                [self](nlohmann::json args) { return self->send_bulk_email(std::move(args)); });

        registry.register_tool(
                "send_template_email", "Send an email using a template with variable substitution",
                {{"type", "object"},
                 {"properties",
                  {{"to", {{"type", "string"}, {"description", "Recipient email address"}}},
                   {"subject", {{"type", "string"}, {"description", "Email subject"}}},
                   {"template", {{"type", "string"}, {"description", "Email template with {variable} placeholders"}}},
                   {"variables",
                    {{"type", "object"}, {"description", "Dictionary of variable names and values to substitute"}}},
                   {"from_addr", from_addr},
                   {"html", {{"type", "boolean"}, {"description", "Whether template is HTML (default: false)"}}}}},
                 {"required", {"to", "subject", "template", "variables"}}},
                [self](nlohmann::json args) { return self->send_template_email(std::move(args)); });

        registry.register_tool(
                "verify_connection", "Verify SMTP connection and credentials",
                {{"type", "object"}, {"properties", nlohmann::json::object()}, {"required", nlohmann::json::array()}},
                [self](nlohmann::json args) { return self->verify_connection(std::move(args)); });

        MCPMAIL_INFO("Registered {} mail tools", 4);
    }

    std::string EmailTools::build_message(const nlohmann::json &args, const std::string &to,
                                          const std::string &body, MailMessage &message) const {
        message.from = string_field(args, "from_addr");
        if (message.from.empty()) {
            message.from = mailer_->settings().user;
        }
        if (message.from.empty()) {
            return "No sender address: pass from_addr or configure an SMTP user";
        }
        if (to.empty()) {
            return "Recipient address is empty";
        }
        message.to = to;
        message.subject = string_field(args, "subject");
        message.body = body;
        message.html = bool_field(args, "html");

        auto error = string_list(args, "cc", message.cc);
        if (error.empty()) {
            error = string_list(args, "bcc", message.bcc);
        }
        if (!error.empty()) {
            return error;
        }

        // Addresses end up verbatim in MAIL FROM / RCPT TO command lines
        for (const auto &address: message.recipients()) {
            if (has_line_break(address)) {
                return "Invalid email address: contains a line break";
            }
        }
        if (has_line_break(message.from)) {
            return "Invalid sender address: contains a line break";
        }

        auto attachments = args.find("attachments");
        if (attachments == args.end() || !attachments->is_array()) {
            return "";
        }
        for (const auto &item: *attachments) {
            if (!item.is_object()) {
                continue;
            }
            std::string filename = string_field(item, "filename");
            std::string content = string_field(item, "content");
            if (filename.empty() || content.empty()) {
                continue;
            }
            auto decoded = utils::base64_decode(content);
            if (!decoded) {
                return "Invalid base64 content for attachment: " + filename;
            }
            message.attachments.push_back({filename, std::move(*decoded)});
        }
        return "";
    }

    asio::awaitable<nlohmann::json> EmailTools::deliver(MailMessage message) {
        bool failed = false;
        std::string error;
        try {
            co_await mailer_->send(message);
        } catch (const std::exception &e) {
            failed = true;
            error = e.what();
        }
        if (failed) {
            MCPMAIL_ERROR("Failed to send email to {}: {}", message.to, error);
            co_return failure(error);
        }

        MCPMAIL_INFO("Email sent successfully to {}", message.to);
        co_return nlohmann::json{{"success", true},
                                 {"message", "Email sent successfully to " + message.to},
                                 {"recipients", message.recipients()}};
    }

    asio::awaitable<nlohmann::json> EmailTools::send_email(nlohmann::json args) {
        MailMessage message;
        auto error = build_message(args, string_field(args, "to"), string_field(args, "body"), message);
        if (!error.empty()) {
            MCPMAIL_ERROR("Failed to send email: {}", error);
            co_return failure(error);
        }
        co_return co_await deliver(std::move(message));
    }

    asio::awaitable<nlohmann::json> EmailTools::send_bulk_email(nlohmann::json args) {
        const auto &recipients = args["recipients"];
        nlohmann::json results = nlohmann::json::array();
        size_t success_count = 0;
        size_t failed_count = 0;

        // Bulk mail never carries cc/bcc/attachments
        nlohmann::json single = {{"subject", args["subject"]}, {"html", bool_field(args, "html")}};
        if (args.contains("from_addr")) {
            single["from_addr"] = args["from_addr"];
        }

        for (const auto &recipient: recipients) {
            nlohmann::json result;
            if (!recipient.is_string()) {
                result = failure("Recipient must be a string");
            } else {
                MailMessage message;
                auto error = build_message(single, recipient.get<std::string>(), string_field(args, "body"), message);
                result = error.empty() ? co_await deliver(std::move(message)) : failure(error);
            }

            if (result.value("success", false)) {
                ++success_count;
            } else {
                ++failed_count;
            }
            results.push_back({{"recipient", recipient}, {"result", result}});
        }

        MCPMAIL_INFO("Bulk email finished: {} sent, {} failed", success_count, failed_count);
        co_return nlohmann::json{{"success", failed_count == 0},
                                 {"total", recipients.size()},
                                 {"success_count", success_count},
                                 {"failed_count", failed_count},
                                 {"results", results}};
    }

    asio::awaitable<nlohmann::json> EmailTools::send_template_email(nlohmann::json args) {
        std::string body = render_template(string_field(args, "template"), args["variables"]);
        MailMessage message;
        auto error = build_message(args, string_field(args, "to"), body, message);
        if (!error.empty()) {
            MCPMAIL_ERROR("Failed to send template email: {}", error);
            co_return failure(error);
        }
        co_return co_await deliver(std::move(message));
    }

    asio::awaitable<nlohmann::json> EmailTools::verify_connection(nlohmann::json) {
        const auto &settings = mailer_->settings();
        VerifyResult verified;
        bool failed = false;
        std::string error;
        try {
            verified = co_await mailer_->verify();
        } catch (const std::exception &e) {
            failed = true;
            error = e.what();
        }

        if (failed) {
            MCPMAIL_ERROR("SMTP connection failed: {}", error);
            co_return nlohmann::json{{"success", false},
                                     {"error", error},
                                     {"server", settings.host},
                                     {"port", settings.port}};
        }

        std::string auth_note;
        if (settings.has_credentials()) {
            auth_note = verified.authenticated ? " (authenticated)" : " (no authentication)";
        }
        co_return nlohmann::json{{"success", true},
                                 {"message", "SMTP connection verified successfully" + auth_note},
                                 {"server", settings.host},
                                 {"port", settings.port},
                                 {"tls", settings.tls != TlsMode::None},
                                 {"authenticated", verified.authenticated}};
    }

}// namespace mcpmail::business::mail
