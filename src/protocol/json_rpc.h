#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace mcpmail::protocol {

    // JSON-RPC 2.0 error codes
    namespace error_code {
        constexpr int PARSE_ERROR = -32700;     // Invalid JSON was received by the server
        constexpr int INVALID_REQUEST = -32600; // The JSON sent is not a valid Request object
        constexpr int METHOD_NOT_FOUND = -32601;// The method does not exist / is not available
        constexpr int INVALID_PARAMS = -32602;  // Invalid method parameter(s)
        constexpr int INTERNAL_ERROR = -32603;  // Internal JSON-RPC error
    }// namespace error_code

    // JSON-RPC 2.0 Request Object
    // https://www.jsonrpc.org/specification#request_object
    struct Request {
        std::string method;                      // A String containing the name of the method to be invoked
        nlohmann::json params = nlohmann::json::object();// Object or array; an absent member becomes {}
        std::optional<nlohmann::json> id;        // String or number; absent for notifications

        Request() = default;
        explicit Request(std::string method) : method(std::move(method)) {}
        Request(std::string method, nlohmann::json params) : method(std::move(method)), params(std::move(params)) {}
        Request(std::string method, nlohmann::json params, std::optional<nlohmann::json> id)
            : method(std::move(method)), params(std::move(params)), id(std::move(id)) {}

        bool is_notification() const { return !id.has_value(); }
    };

    // JSON-RPC 2.0 Error Object
    // https://www.jsonrpc.org/specification#error_object
    struct Error {
        int code;
        std::string message;
        std::optional<nlohmann::json> data;
        nlohmann::json id = nullptr;// Request id, null when it could not be determined

        Error(int code, std::string message) : code(code), message(std::move(message)) {}
        Error(int code, std::string message, std::optional<nlohmann::json> data)
            : code(code), message(std::move(message)), data(std::move(data)) {}
        Error(int code, std::string message, std::optional<nlohmann::json> data, nlohmann::json id)
            : code(code), message(std::move(message)), data(std::move(data)), id(std::move(id)) {}
    };

    // JSON-RPC 2.0 Response Object
    // https://www.jsonrpc.org/specification#response_object
    struct Response {
        nlohmann::json result = nullptr;
        nlohmann::json id = nullptr;
        std::optional<Error> error;

        Response() = default;
        Response(nlohmann::json result, nlohmann::json id) : result(std::move(result)), id(std::move(id)) {}
        Response(Error error_, nlohmann::json id_) : id(std::move(id_)), error(std::move(error_)) {}

        static Response success(nlohmann::json result, nlohmann::json id) {
            return Response{std::move(result), std::move(id)};
        }

        static Response failure(int code, std::string message, nlohmann::json id) {
            return Response{Error{code, std::move(message)}, std::move(id)};
        }

        bool is_error() const { return error.has_value(); }
    };

    /**
     * @brief Parses a JSON-RPC 2.0 request from text
     * @return Pair containing:
     *         - std::optional<Request>: Valid request if parsing succeeded
     *         - std::optional<Error>: PARSE_ERROR for un-parseable text, INVALID_REQUEST
     *           for a well-formed document that is not a valid envelope
     */
    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const std::string &text);

    /**
     * @brief Same validation as parse_request() for an already parsed document
     */
    std::pair<std::optional<Request>, std::optional<Error>> parse_request(const nlohmann::json &j);

    /**
     * @brief Build the wire object {"jsonrpc":"2.0", "id":..., "result"|"error":...}
     */
    nlohmann::json to_json(const Response &resp);
    nlohmann::json to_json(const Error &err);

}// namespace mcpmail::protocol
