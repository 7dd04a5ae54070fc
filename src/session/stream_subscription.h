// src/session/stream_subscription.h
#pragma once

#include "mcp_session.h"
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>
#include <atomic>

namespace mcpmail::session {

    enum class WaitResult {
        Ready,  ///< New events may be available
        Timeout,///< Nothing happened within the timeout
        Closed  ///< Session closed or the stream was detached
    };

    /**
     * @brief Handle of the single attached stream consumer of a session.
     *
     * Owned by the consumer coroutine and used only on its executor, except for
     * notify() which may be called from any thread. Destruction detaches.
     */
    class StreamSubscription : public std::enable_shared_from_this<StreamSubscription> {
    public:
        StreamSubscription(std::shared_ptr<McpSession> session, const asio::any_io_executor &executor,
                           std::uint64_t token, std::uint64_t cursor, std::vector<StreamEvent> replay);
        ~StreamSubscription();

        StreamSubscription(const StreamSubscription &) = delete;
        StreamSubscription &operator=(const StreamSubscription &) = delete;

        const std::string &session_id() const { return session_->id(); }
        const std::shared_ptr<McpSession> &session() const { return session_; }

        // Id of the last event handed out by poll() or captured for replay
        std::uint64_t cursor() const { return cursor_; }

        // Events captured at attach time that poll() has not returned yet
        const std::vector<StreamEvent> &pending_replay() const { return replay_; }

        /**
         * @brief Next batch: the replay captured at attach time first, then newly appended events.
         * @throws core::HistoryLost if the consumer fell behind the retention window
         */
        std::vector<StreamEvent> poll();

        /**
         * @brief Suspend until an append, a close/detach, or the timeout.
         */
        asio::awaitable<WaitResult> wait(std::chrono::steady_clock::duration timeout);

        // Thread-safe wake-up; posted onto the consumer's executor
        void notify();

        // Idempotent
        void detach();

        // Still attached and the session is open
        bool active() const;

    private:
        std::shared_ptr<McpSession> session_;
        asio::steady_timer timer_;
        const std::uint64_t token_;
        std::uint64_t cursor_;
        std::vector<StreamEvent> replay_;
        std::atomic<bool> detached_{false};
    };

}// namespace mcpmail::session
