// src/core/errors.h
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mcpmail::core {

    /**
     * @brief Base class of every failure raised by the server's own components.
     */
    class McpMailError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class DuplicateTool : public McpMailError {
    public:
        explicit DuplicateTool(const std::string &name)
            : McpMailError("Tool already registered: " + name) {}
    };

    class ToolNotFound : public McpMailError {
    public:
        explicit ToolNotFound(const std::string &name)
            : McpMailError("Tool not found: " + name) {}
    };

    class DuplicateMethod : public McpMailError {
    public:
        explicit DuplicateMethod(const std::string &method)
            : McpMailError("Method already registered: " + method) {}
    };

    /**
     * @brief Raised by method handlers and the tool registry when the caller's
     * parameters are unusable. Mapped to JSON-RPC -32602.
     */
    class InvalidParams : public McpMailError {
    public:
        using McpMailError::McpMailError;
    };

    class SessionNotFound : public McpMailError {
    public:
        explicit SessionNotFound(const std::string &session_id)
            : McpMailError("Session not found: " + session_id) {}
    };

    class SessionBusy : public McpMailError {
    public:
        explicit SessionBusy(const std::string &session_id)
            : McpMailError("Session already has an attached stream: " + session_id) {}
    };

    /**
     * @brief Resumption asked for events that were already pruned from the log.
     */
    class HistoryLost : public McpMailError {
    public:
        HistoryLost(std::uint64_t last_event_id, std::uint64_t pruned_through)
            : McpMailError("Events after " + std::to_string(last_event_id) +
                           " are no longer retained (pruned through " + std::to_string(pruned_through) + ")"),
              last_event_id_(last_event_id), pruned_through_(pruned_through) {}

        std::uint64_t last_event_id() const { return last_event_id_; }
        std::uint64_t pruned_through() const { return pruned_through_; }

    private:
        std::uint64_t last_event_id_;
        std::uint64_t pruned_through_;
    };

    /**
     * @brief Resumption named an event id the session never produced.
     */
    class InvalidEventId : public McpMailError {
    public:
        InvalidEventId(std::uint64_t last_event_id, std::uint64_t newest)
            : McpMailError("Unknown event id " + std::to_string(last_event_id) +
                           " (newest is " + std::to_string(newest) + ")") {}
    };

}// namespace mcpmail::core
