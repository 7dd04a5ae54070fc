// src/business/tool_registry.h
#pragma once

#include "protocol/tool.h"
#include <asio/awaitable.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcpmail::business {

    // Tool execution function signature. Handlers report domain failures in their
    // payload; anything they throw is surfaced to the caller untouched.
    using ToolHandler = std::function<asio::awaitable<nlohmann::json>(nlohmann::json)>;

    // Tool metadata + handler
    struct RegisteredTool {
        protocol::Tool metadata;
        ToolHandler handler;
    };

    class ToolRegistry {
    public:
        /**
         * @brief Register a tool. Intended for startup only.
         * @throws core::DuplicateTool if the name is already taken
         */
        void register_tool(const std::string &name, const std::string &description,
                           nlohmann::json input_schema, ToolHandler handler);

        // Descriptors in registration order
        std::vector<protocol::Tool> list() const;

        std::optional<protocol::Tool> find(const std::string &name) const;
        bool contains(const std::string &name) const;
        size_t size() const { return tools_.size(); }

        /**
         * @brief Validate arguments against the tool's input schema and await its handler.
         * @throws core::ToolNotFound for an unregistered name
         * @throws core::InvalidParams when the arguments violate the schema
         */
        asio::awaitable<nlohmann::json> invoke(const std::string &name, nlohmann::json arguments) const;

        /**
         * @brief Check object-ness, required keys and declared property types.
         * @throws core::InvalidParams describing the first violation found
         */
        static void validate_arguments(const nlohmann::json &schema, const nlohmann::json &arguments);

    private:
        std::vector<RegisteredTool> tools_;
        std::unordered_map<std::string, size_t> index_;
    };

}// namespace mcpmail::business
