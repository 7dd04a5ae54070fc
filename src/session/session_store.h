// src/session/session_store.h
#pragma once

#include "mcp_session.h"
#include "stream_subscription.h"
#include <condition_variable>
#include <thread>
#include <unordered_map>

namespace mcpmail::session {

    struct SessionStoreOptions {
        std::chrono::seconds idle_timeout{1800};///< Sessions idle longer than this are evicted
        std::chrono::seconds sweep_interval{60};///< Period of the background sweep
        RetentionPolicy retention;
    };

    /**
     * @brief Concurrency-safe table of live sessions plus the eviction sweeper.
     *
     * The store mutex only guards the map; per-session state is guarded by each
     * session's own mutex. Sessions are closed outside the store lock.
     */
    class SessionStore {
    public:
        explicit SessionStore(SessionStoreOptions options = {});
        ~SessionStore();

        SessionStore(const SessionStore &) = delete;
        SessionStore &operator=(const SessionStore &) = delete;

        /**
         * @brief Allocate a session with a fresh id and an empty event log
         */
        std::shared_ptr<McpSession> create(const std::string &protocol_version);

        /**
         * @throws core::SessionNotFound
         */
        std::shared_ptr<McpSession> get(const std::string &id) const;

        // nullptr when absent
        std::shared_ptr<McpSession> find(const std::string &id) const;

        void touch(const std::string &id);

        /**
         * @brief Append to the session's log; see McpSession::append
         * @return The assigned event id
         */
        std::uint64_t append(const std::string &id, nlohmann::json payload);

        /**
         * @brief Attach the session's stream consumer; see McpSession::attach
         */
        std::shared_ptr<StreamSubscription> attach_stream(const std::string &id, const asio::any_io_executor &executor,
                                                          std::optional<std::uint64_t> last_event_id = std::nullopt);

        // Idempotent, also for unknown ids
        void detach_stream(const std::string &id);

        // Remove and close; false if the id was unknown
        bool destroy(const std::string &id);

        /**
         * @brief Evict every session idle longer than idle_timeout.
         * A failure while closing one session does not stop the others.
         * @return Number of sessions evicted
         */
        size_t sweep();
        size_t sweep(Clock::time_point now);

        /**
         * @brief Run sweep() every sweep_interval on a dedicated thread
         */
        void start_sweeper();

        /**
         * @brief Stop the sweeper thread; returns only after any running sweep has finished
         */
        void stop_sweeper();

        bool sweeper_running() const;

        // Close every session (shutdown)
        void close_all();

        size_t size() const;
        const SessionStoreOptions &options() const { return options_; }

    private:
        void sweeper_loop();
        void close_isolated(const std::shared_ptr<McpSession> &session, const char *reason);

        const SessionStoreOptions options_;

        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<McpSession>> sessions_;

        mutable std::mutex sweeper_mtx_;
        std::condition_variable sweeper_cv_;
        std::thread sweeper_;
        bool stop_requested_ = false;
    };

}// namespace mcpmail::session
