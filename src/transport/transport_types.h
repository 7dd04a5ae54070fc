#pragma once

#include "nlohmann/json.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mcpmail::transport {

    inline bool iequals(const std::string &a, const std::string &b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    /**
     * @brief HTTP request structure for parsing incoming requests.
     */
    struct HttpRequest {
        std::string method;                                  ///< HTTP method (GET, POST, etc.)
        std::string target;                                  ///< Request target/URL
        std::string version;                                 ///< HTTP version
        std::unordered_map<std::string, std::string> headers;///< HTTP headers as received
        std::string body;                                    ///< Request body

        // Case-insensitive header lookup
        std::optional<std::string> header(const std::string &name) const {
            for (const auto &[key, value]: headers) {
                if (iequals(key, name)) {
                    return value;
                }
            }
            return std::nullopt;
        }

        // Target without the query string
        std::string path() const {
            return target.substr(0, target.find('?'));
        }
    };

    /**
     * @brief A complete (non-streaming) HTTP response.
     */
    struct HttpReply {
        int status = 200;
        std::string content_type = "application/json";
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;

        static HttpReply json(int status, const nlohmann::json &body) {
            HttpReply reply;
            reply.status = status;
            reply.body = body.dump();
            return reply;
        }

        // {"error": message}
        static HttpReply error(int status, const std::string &message) {
            return json(status, nlohmann::json{{"error", message}});
        }

        static HttpReply accepted() {
            HttpReply reply;
            reply.status = 202;
            return reply;
        }

        std::optional<std::string> header(const std::string &name) const {
            for (const auto &[key, value]: headers) {
                if (iequals(key, name)) {
                    return value;
                }
            }
            return std::nullopt;
        }
    };

}// namespace mcpmail::transport
