#include "json_rpc.h"
#include <string>

namespace mcpmail::protocol {

    // ==================== Helper Functions ====================
    namespace {
        bool has_valid_jsonrpc(const nlohmann::json &j) {
            return j.contains("jsonrpc") && j["jsonrpc"].is_string() &&
                   j["jsonrpc"].get<std::string>() == "2.0";
        }

        // Echo the id back only when it has a legal type
        nlohmann::json echo_id(const nlohmann::json &j) {
            if (j.contains("id") && (j["id"].is_string() || j["id"].is_number())) {
                return j["id"];
            }
            return nullptr;
        }

        std::pair<std::optional<Request>, std::optional<Error>> invalid(const nlohmann::json &j,
                                                                        const std::string &message) {
            return {std::nullopt, Error{error_code::INVALID_REQUEST, message, std::nullopt, echo_id(j)}};
        }
    }// namespace

    // ==================== parse_request implementation ====================
    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const std::string &text) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error &e) {
            return {
                    std::nullopt,
                    Error{
                            error_code::PARSE_ERROR,
                            "Parse error",
                            std::make_optional(nlohmann::json{{"details", e.what()}, {"byte", e.byte}}),
                            nullptr}};
        }
        return parse_request(j);
    }

    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const nlohmann::json &j) {
        if (!j.is_object()) {
            return {std::nullopt, Error{error_code::INVALID_REQUEST, "Request must be a JSON object"}};
        }

        if (!has_valid_jsonrpc(j)) {
            return invalid(j, "'jsonrpc' must be '2.0'");
        }

        if (!j.contains("method") || !j["method"].is_string()) {
            return invalid(j, "'method' must be a string");
        }

        nlohmann::json params = nlohmann::json::object();
        if (j.contains("params")) {
            const auto &p = j["params"];
            if (!p.is_object() && !p.is_array()) {
                return invalid(j, "'params' must be an object or an array");
            }
            params = p;
        }

        // A null id is treated like an absent one: the message is a notification.
        std::optional<nlohmann::json> req_id;
        if (j.contains("id") && !j["id"].is_null()) {
            const auto &id = j["id"];
            if (!id.is_number() && !id.is_string()) {
                return invalid(j, "'id' must be a number or a string");
            }
            req_id = id;
        }

        return {Request{j["method"].get<std::string>(), std::move(params), std::move(req_id)}, std::nullopt};
    }

    // ==================== serialization ====================
    nlohmann::json to_json(const Error &err) {
        nlohmann::json error_obj{{"code", err.code}, {"message", err.message}};
        if (err.data.has_value()) {
            error_obj["data"] = err.data.value();
        }
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", err.id}, {"error", error_obj}};
    }

    nlohmann::json to_json(const Response &resp) {
        if (resp.error.has_value()) {
            Error err = resp.error.value();
            err.id = resp.id;
            return to_json(err);
        }
        return nlohmann::json{{"jsonrpc", "2.0"}, {"id", resp.id}, {"result", resp.result}};
    }

}// namespace mcpmail::protocol
