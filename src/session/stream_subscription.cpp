#include "stream_subscription.h"
#include <asio/post.hpp>
#include <asio/redirect_error.hpp>
#include <asio/use_awaitable.hpp>

namespace mcpmail::session {

    StreamSubscription::StreamSubscription(std::shared_ptr<McpSession> session, const asio::any_io_executor &executor,
                                           std::uint64_t token, std::uint64_t cursor, std::vector<StreamEvent> replay)
        : session_(std::move(session)), timer_(executor), token_(token), cursor_(cursor), replay_(std::move(replay)) {}

    StreamSubscription::~StreamSubscription() {
        detach();
    }

    std::vector<StreamEvent> StreamSubscription::poll() {
        if (!replay_.empty()) {
            std::vector<StreamEvent> batch;
            batch.swap(replay_);
            return batch;
        }
        auto batch = session_->events_after(cursor_);
        if (!batch.empty()) {
            cursor_ = batch.back().id;
        }
        return batch;
    }

    asio::awaitable<WaitResult> StreamSubscription::wait(std::chrono::steady_clock::duration timeout) {
        if (!active()) {
            co_return WaitResult::Closed;
        }
        // An append that raced with the last poll() is picked up here; later ones
        // post their cancel() behind this suspension point on the same executor.
        if (!replay_.empty() || session_->newest_event_id() > cursor_) {
            co_return WaitResult::Ready;
        }

        timer_.expires_after(timeout);
        std::error_code ec;
        co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));

        if (!active()) {
            co_return WaitResult::Closed;
        }
        if (session_->newest_event_id() > cursor_) {
            co_return WaitResult::Ready;
        }
        co_return ec == asio::error::operation_aborted ? WaitResult::Ready : WaitResult::Timeout;
    }

    void StreamSubscription::notify() {
        asio::post(timer_.get_executor(), [weak = weak_from_this()] {
            if (auto self = weak.lock()) {
                self->timer_.cancel();
            }
        });
    }

    void StreamSubscription::detach() {
        if (!detached_.exchange(true)) {
            session_->detach(token_);
        }
    }

    bool StreamSubscription::active() const {
        return !detached_.load() && session_->is_attached(token_);
    }

}// namespace mcpmail::session
