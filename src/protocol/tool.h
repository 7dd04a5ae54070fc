// src/protocol/tool.h
#pragma once

#include "nlohmann/json.hpp"
#include <string>

namespace mcpmail::protocol {

    /**
     * @brief Client-visible description of a tool, as returned by tools/list.
     */
    struct Tool {
        std::string name;
        std::string description;
        nlohmann::json input_schema;// JSON Schema

        nlohmann::json to_json() const {
            return nlohmann::json{
                    {"name", name},
                    {"description", description},
                    {"inputSchema", input_schema}};
        }
    };

}// namespace mcpmail::protocol
