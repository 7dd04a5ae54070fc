#include "mcp_session.h"
#include "core/errors.h"
#include "core/logger.h"
#include "stream_subscription.h"

namespace mcpmail::session {

    McpSession::McpSession(std::string id, std::string protocol_version, RetentionPolicy retention,
                           Clock::time_point now)
        : id_(std::move(id)), protocol_version_(std::move(protocol_version)), retention_(retention),
          created_at_(now), last_activity_(now) {}

    Clock::time_point McpSession::last_activity() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_activity_;
    }

    void McpSession::touch(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (now > last_activity_) {
            last_activity_ = now;
        }
    }

    std::uint64_t McpSession::append(nlohmann::json payload, Clock::time_point now) {
        std::shared_ptr<StreamSubscription> subscriber;
        std::uint64_t event_id = 0;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                throw core::SessionNotFound(id_);
            }
            event_id = next_event_id_++;
            events_.push_back(StreamEvent{event_id, std::move(payload), now});
            prune_locked(now);
            subscriber = subscriber_.lock();
        }
        // Wake outside the lock; the consumer reads the log under the same mutex
        if (subscriber) {
            subscriber->notify();
        }
        return event_id;
    }

    void McpSession::prune_locked(Clock::time_point now) {
        if (retention_.max_events > 0) {
            while (events_.size() > retention_.max_events) {
                pruned_through_ = events_.front().id;
                events_.pop_front();
            }
        }
        if (retention_.retention_window.count() > 0) {
            while (!events_.empty() && now - events_.front().appended_at > retention_.retention_window) {
                pruned_through_ = events_.front().id;
                events_.pop_front();
            }
        }
    }

    std::vector<StreamEvent> McpSession::events_after(std::uint64_t cursor) const {
        std::lock_guard<std::mutex> lock(mtx_);
        if (cursor < pruned_through_) {
            throw core::HistoryLost(cursor, pruned_through_);
        }
        // Retained ids are contiguous: front() is pruned_through_ + 1
        std::vector<StreamEvent> out;
        size_t skip = static_cast<size_t>(cursor - pruned_through_);
        for (size_t i = skip; i < events_.size(); ++i) {
            out.push_back(events_[i]);
        }
        return out;
    }

    std::shared_ptr<StreamSubscription> McpSession::attach(const asio::any_io_executor &executor,
                                                           std::optional<std::uint64_t> last_event_id) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_) {
            throw core::SessionNotFound(id_);
        }
        if (attached_token_ != 0) {
            throw core::SessionBusy(id_);
        }

        std::uint64_t newest = next_event_id_ - 1;
        std::uint64_t cursor = pruned_through_;
        if (last_event_id.has_value()) {
            cursor = last_event_id.value();
            if (cursor > newest) {
                throw core::InvalidEventId(cursor, newest);
            }
            if (cursor < pruned_through_) {
                throw core::HistoryLost(cursor, pruned_through_);
            }
        }

        std::vector<StreamEvent> replay;
        for (size_t i = static_cast<size_t>(cursor - pruned_through_); i < events_.size(); ++i) {
            replay.push_back(events_[i]);
        }
        std::uint64_t replay_end = replay.empty() ? cursor : replay.back().id;

        std::uint64_t token = next_token_++;
        auto subscription = std::make_shared<StreamSubscription>(shared_from_this(), executor, token,
                                                                 replay_end, std::move(replay));
        attached_token_ = token;
        subscriber_ = subscription;
        return subscription;
    }

    void McpSession::detach(std::uint64_t token) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (attached_token_ == token) {
            attached_token_ = 0;
            subscriber_.reset();
        }
    }

    void McpSession::force_detach() {
        std::shared_ptr<StreamSubscription> subscriber;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            subscriber = subscriber_.lock();
            attached_token_ = 0;
            subscriber_.reset();
        }
        if (subscriber) {
            subscriber->notify();
        }
    }

    bool McpSession::is_attached(std::uint64_t token) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return !closed_ && attached_token_ == token;
    }

    bool McpSession::attached() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return attached_token_ != 0;
    }

    void McpSession::close() {
        std::shared_ptr<StreamSubscription> subscriber;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (closed_) {
                return;
            }
            closed_ = true;
            events_.clear();
            subscriber = subscriber_.lock();
        }
        MCPMAIL_DEBUG("Session {} closed", id_);
        if (subscriber) {
            subscriber->notify();
        }
    }

    bool McpSession::closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    std::uint64_t McpSession::newest_event_id() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return next_event_id_ - 1;
    }

    std::uint64_t McpSession::pruned_through() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return pruned_through_;
    }

    size_t McpSession::retained_events() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_.size();
    }

}// namespace mcpmail::session
