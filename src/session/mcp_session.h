// src/session/mcp_session.h
#pragma once

#include "nlohmann/json.hpp"
#include <asio/any_io_executor.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpmail::session {

    using Clock = std::chrono::steady_clock;

    /**
     * @brief One entry of a session's outbound event log
     */
    struct StreamEvent {
        std::uint64_t id = 0;          ///< Per-session event id, starts at 1
        nlohmann::json payload;        ///< JSON-RPC message delivered on the stream
        Clock::time_point appended_at; ///< Used by the age-based retention cap
    };

    /**
     * @brief Bounds on the retained event log. A zero value disables that cap.
     */
    struct RetentionPolicy {
        size_t max_events = 1000;
        std::chrono::seconds retention_window{3600};
    };

    class StreamSubscription;

    /**
     * @brief Server-side state of one client conversation.
     *
     * All mutable state is guarded by the session's own mutex, so sessions never
     * contend with each other. At most one StreamSubscription is attached at a time.
     */
    class McpSession : public std::enable_shared_from_this<McpSession> {
    public:
        McpSession(std::string id, std::string protocol_version, RetentionPolicy retention,
                   Clock::time_point now = Clock::now());

        McpSession(const McpSession &) = delete;
        McpSession &operator=(const McpSession &) = delete;

        const std::string &id() const { return id_; }
        const std::string &protocol_version() const { return protocol_version_; }
        Clock::time_point created_at() const { return created_at_; }
        Clock::time_point last_activity() const;

        void touch(Clock::time_point now = Clock::now());

        /**
         * @brief Append a payload to the event log and wake the attached stream.
         * @return The event id assigned to the payload
         * @throws core::SessionNotFound if the session was already closed
         */
        std::uint64_t append(nlohmann::json payload, Clock::time_point now = Clock::now());

        /**
         * @brief Retained events with id > cursor, in append order.
         * @throws core::HistoryLost if events after cursor were pruned
         */
        std::vector<StreamEvent> events_after(std::uint64_t cursor) const;

        /**
         * @brief Attach the single stream consumer.
         *
         * Without last_event_id the subscription replays the whole retained log;
         * with it, only the events after that id.
         * @param executor Executor the consumer runs on; wake-ups are posted there
         * @throws core::SessionNotFound if closed
         * @throws core::SessionBusy if a consumer is already attached
         * @throws core::InvalidEventId if last_event_id is newer than any appended event
         * @throws core::HistoryLost if events after last_event_id were pruned
         */
        std::shared_ptr<StreamSubscription> attach(const asio::any_io_executor &executor,
                                                   std::optional<std::uint64_t> last_event_id);

        // Detach the consumer holding token; no-op for a stale token
        void detach(std::uint64_t token);
        // Detach whoever is attached and wake it
        void force_detach();

        bool is_attached(std::uint64_t token) const;
        bool attached() const;

        /**
         * @brief Mark closed, release the log and wake the attached consumer. Idempotent.
         */
        void close();
        bool closed() const;

        std::uint64_t newest_event_id() const;
        std::uint64_t pruned_through() const;
        size_t retained_events() const;

    private:
        void prune_locked(Clock::time_point now);

        const std::string id_;
        const std::string protocol_version_;
        const RetentionPolicy retention_;
        const Clock::time_point created_at_;

        mutable std::mutex mtx_;
        Clock::time_point last_activity_;
        std::deque<StreamEvent> events_;
        std::uint64_t next_event_id_ = 1;
        std::uint64_t pruned_through_ = 0;///< Highest event id dropped by retention
        bool closed_ = false;

        std::uint64_t attached_token_ = 0;///< 0 while detached
        std::uint64_t next_token_ = 1;
        std::weak_ptr<StreamSubscription> subscriber_;
    };

}// namespace mcpmail::session
