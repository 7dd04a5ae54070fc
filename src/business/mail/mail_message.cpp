#include "mail_message.h"
#include "utils/base64.h"
#include "utils/random_id.h"
#include <ctime>
#include <sstream>

namespace mcpmail::business::mail {

    namespace {
        std::string join(const std::vector<std::string> &items, const std::string &sep) {
            std::string out;
            for (const auto &item: items) {
                if (!out.empty()) {
                    out += sep;
                }
                out += item;
            }
            return out;
        }

        std::string rfc2822_date() {
            std::time_t now = std::time(nullptr);
            std::tm tm{};
#ifdef _WIN32
            gmtime_s(&tm, &now);
#else
            gmtime_r(&now, &tm);
#endif
            char buf[64];
            std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
            return buf;
        }

        bool is_ascii(const std::string &text) {
            for (unsigned char c: text) {
                if (c >= 0x80) {
                    return false;
                }
            }
            return true;
        }

        // Header values must not smuggle extra header lines
        std::string sanitize_header(const std::string &value) {
            std::string out;
            for (char c: value) {
                out.push_back(c == '\r' || c == '\n' ? ' ' : c);
            }
            return out;
        }
    }// namespace

    std::vector<std::string> MailMessage::recipients() const {
        std::vector<std::string> out{to};
        out.insert(out.end(), cc.begin(), cc.end());
        out.insert(out.end(), bcc.begin(), bcc.end());
        return out;
    }

    std::string make_boundary() {
        return "=_mcpmail_" + utils::random_hex_id();
    }

    std::string encode_header_word(const std::string &text) {
        if (is_ascii(text)) {
            return text;
        }
        return "=?UTF-8?B?" + utils::base64_encode(text) + "?=";
    }

    std::string extract_address(const std::string &mailbox) {
        auto open = mailbox.rfind('<');
        auto close = mailbox.rfind('>');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            return mailbox.substr(open + 1, close - open - 1);
        }
        size_t start = mailbox.find_first_not_of(" \t");
        if (start == std::string::npos) {
            return "";
        }
        size_t end = mailbox.find_last_not_of(" \t");
        return mailbox.substr(start, end - start + 1);
    }

    std::string compose_mime(const MailMessage &message, const std::string &boundary) {
        std::ostringstream oss;
        oss << "From: " << sanitize_header(message.from) << "\r\n";
        oss << "To: " << sanitize_header(message.to) << "\r\n";
        if (!message.cc.empty()) {
            oss << "Cc: " << sanitize_header(join(message.cc, ", ")) << "\r\n";
        }
        oss << "Subject: " << encode_header_word(sanitize_header(message.subject)) << "\r\n";
        oss << "Date: " << rfc2822_date() << "\r\n";
        oss << "MIME-Version: 1.0\r\n";
        oss << "Content-Type: multipart/mixed; boundary=\"" << boundary << "\"\r\n";
        oss << "\r\n";

        oss << "--" << boundary << "\r\n";
        oss << "Content-Type: text/" << (message.html ? "html" : "plain") << "; charset=\"utf-8\"\r\n";
        oss << "Content-Transfer-Encoding: base64\r\n";
        oss << "\r\n";
        oss << utils::base64_encode_mime(message.body);

        for (const auto &attachment: message.attachments) {
            oss << "--" << boundary << "\r\n";
            oss << "Content-Type: application/octet-stream\r\n";
            oss << "Content-Transfer-Encoding: base64\r\n";
            oss << "Content-Disposition: attachment; filename=\""
                << encode_header_word(sanitize_header(attachment.filename)) << "\"\r\n";
            oss << "\r\n";
            oss << utils::base64_encode_mime(attachment.content);
        }

        oss << "--" << boundary << "--\r\n";
        return oss.str();
    }

    std::string render_template(const std::string &tmpl, const nlohmann::json &variables) {
        std::string body = tmpl;
        if (!variables.is_object()) {
            return body;
        }
        for (const auto &[key, value]: variables.items()) {
            const std::string placeholder = "{" + key + "}";
            const std::string replacement = value.is_string() ? value.get<std::string>() : value.dump();
            size_t pos = 0;
            while ((pos = body.find(placeholder, pos)) != std::string::npos) {
                body.replace(pos, placeholder.size(), replacement);
                pos += replacement.size();
            }
        }
        return body;
    }

    std::string dot_stuff(const std::string &data) {
        std::string out;
        out.reserve(data.size() + data.size() / 64);
        bool line_start = true;
        for (size_t i = 0; i < data.size(); ++i) {
            char c = data[i];
            if (c == '\r') {
                continue;
            }
            if (c == '\n') {
                out += "\r\n";
                line_start = true;
                continue;
            }
            if (line_start && c == '.') {
                out.push_back('.');
            }
            out.push_back(c);
            line_start = false;
        }
        return out;
    }

}// namespace mcpmail::business::mail
