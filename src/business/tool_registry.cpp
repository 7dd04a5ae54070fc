#include "tool_registry.h"
#include "core/errors.h"
#include "core/logger.h"

namespace mcpmail::business {

    namespace {
        bool matches_type(const std::string &type, const nlohmann::json &value) {
            if (type == "string") return value.is_string();
            if (type == "integer") return value.is_number_integer();
            if (type == "number") return value.is_number();
            if (type == "boolean") return value.is_boolean();
            if (type == "object") return value.is_object();
            if (type == "array") return value.is_array();
            if (type == "null") return value.is_null();
            // Unknown type keywords are not enforced
            return true;
        }

        bool matches_any(const nlohmann::json &type_decl, const nlohmann::json &value) {
            if (type_decl.is_string()) {
                return matches_type(type_decl.get<std::string>(), value);
            }
            if (type_decl.is_array()) {
                for (const auto &t: type_decl) {
                    if (t.is_string() && matches_type(t.get<std::string>(), value)) {
                        return true;
                    }
                }
                return false;
            }
            return true;
        }
    }// namespace

    void ToolRegistry::register_tool(const std::string &name, const std::string &description,
                                     nlohmann::json input_schema, ToolHandler handler) {
        if (index_.count(name)) {
            throw core::DuplicateTool(name);
        }
        if (input_schema.is_null()) {
            input_schema = nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
        }
        index_.emplace(name, tools_.size());
        tools_.push_back({protocol::Tool{name, description, std::move(input_schema)}, std::move(handler)});
        MCPMAIL_TRACE("Registered tool: {}", name);
    }

    std::vector<protocol::Tool> ToolRegistry::list() const {
        std::vector<protocol::Tool> all_tools;
        all_tools.reserve(tools_.size());
        for (const auto &registered: tools_) {
            all_tools.push_back(registered.metadata);
        }
        return all_tools;
    }

    std::optional<protocol::Tool> ToolRegistry::find(const std::string &name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return tools_[it->second].metadata;
    }

    bool ToolRegistry::contains(const std::string &name) const {
        return index_.count(name) > 0;
    }

    void ToolRegistry::validate_arguments(const nlohmann::json &schema, const nlohmann::json &arguments) {
        if (!arguments.is_object()) {
            throw core::InvalidParams("Tool arguments must be an object");
        }

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto &key: schema["required"]) {
                if (key.is_string() && !arguments.contains(key.get<std::string>())) {
                    throw core::InvalidParams("Missing required argument: " + key.get<std::string>());
                }
            }
        }

        if (!schema.contains("properties") || !schema["properties"].is_object()) {
            return;
        }
        const auto &properties = schema["properties"];
        for (const auto &[key, value]: arguments.items()) {
            auto prop = properties.find(key);
            if (prop == properties.end() || !prop->is_object() || !prop->contains("type")) {
                continue;
            }
            if (!matches_any((*prop)["type"], value)) {
                throw core::InvalidParams("Argument '" + key + "' must be of type " + (*prop)["type"].dump());
            }
        }
    }

    asio::awaitable<nlohmann::json> ToolRegistry::invoke(const std::string &name, nlohmann::json arguments) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw core::ToolNotFound(name);
        }
        const auto &tool = tools_[it->second];

        if (arguments.is_null()) {
            arguments = nlohmann::json::object();
        }
        validate_arguments(tool.metadata.input_schema, arguments);

        MCPMAIL_DEBUG("Invoking tool '{}'", name);
        co_return co_await tool.handler(std::move(arguments));
    }

}// namespace mcpmail::business
