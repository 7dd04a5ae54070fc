#include "session_store.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/random_id.h"

namespace mcpmail::session {

    SessionStore::SessionStore(SessionStoreOptions options) : options_(options) {}

    SessionStore::~SessionStore() {
        stop_sweeper();
    }

    std::shared_ptr<McpSession> SessionStore::create(const std::string &protocol_version) {
        std::lock_guard<std::mutex> lock(mtx_);
        std::string id = utils::random_hex_id();
        while (sessions_.count(id)) {
            id = utils::random_hex_id();
        }
        auto session = std::make_shared<McpSession>(id, protocol_version, options_.retention);
        sessions_.emplace(id, session);
        MCPMAIL_INFO("Session created: {} (protocol {}, active {})", id, protocol_version, sessions_.size());
        return session;
    }

    std::shared_ptr<McpSession> SessionStore::get(const std::string &id) const {
        auto session = find(id);
        if (!session) {
            throw core::SessionNotFound(id);
        }
        return session;
    }

    std::shared_ptr<McpSession> SessionStore::find(const std::string &id) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = sessions_.find(id);
        return it == sessions_.end() ? nullptr : it->second;
    }

    void SessionStore::touch(const std::string &id) {
        get(id)->touch();
    }

    std::uint64_t SessionStore::append(const std::string &id, nlohmann::json payload) {
        return get(id)->append(std::move(payload));
    }

    std::shared_ptr<StreamSubscription> SessionStore::attach_stream(const std::string &id,
                                                                    const asio::any_io_executor &executor,
                                                                    std::optional<std::uint64_t> last_event_id) {
        auto subscription = get(id)->attach(executor, last_event_id);
        MCPMAIL_DEBUG("Stream attached to session {} (cursor {}, replay {})", id, subscription->cursor(),
                      subscription->pending_replay().size());
        return subscription;
    }

    void SessionStore::detach_stream(const std::string &id) {
        if (auto session = find(id)) {
            session->force_detach();
        }
    }

    bool SessionStore::destroy(const std::string &id) {
        std::shared_ptr<McpSession> session;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) {
                return false;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        close_isolated(session, "destroyed");
        return true;
    }

    size_t SessionStore::sweep() {
        return sweep(Clock::now());
    }

    size_t SessionStore::sweep(Clock::time_point now) {
        std::vector<std::shared_ptr<McpSession>> expired;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto it = sessions_.begin(); it != sessions_.end();) {
                if (now - it->second->last_activity() > options_.idle_timeout) {
                    expired.push_back(std::move(it->second));
                    it = sessions_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (const auto &session: expired) {
            close_isolated(session, "evicted after idle timeout");
        }
        if (!expired.empty()) {
            MCPMAIL_INFO("Session sweep evicted {} session(s), {} remaining", expired.size(), size());
        }
        return expired.size();
    }

    void SessionStore::close_isolated(const std::shared_ptr<McpSession> &session, const char *reason) {
        try {
            session->close();
            MCPMAIL_INFO("Session {} {}", session->id(), reason);
        } catch (const std::exception &e) {
            MCPMAIL_WARN("Failed to close session {}: {}", session->id(), e.what());
        }
    }

    void SessionStore::start_sweeper() {
        std::lock_guard<std::mutex> lock(sweeper_mtx_);
        if (sweeper_.joinable()) {
            return;
        }
        stop_requested_ = false;
        sweeper_ = std::thread([this]() { sweeper_loop(); });
        MCPMAIL_DEBUG("Session sweeper started (interval {}s, idle timeout {}s)",
                      options_.sweep_interval.count(), options_.idle_timeout.count());
    }

    void SessionStore::sweeper_loop() {
        std::unique_lock<std::mutex> lock(sweeper_mtx_);
        while (!stop_requested_) {
            if (sweeper_cv_.wait_for(lock, options_.sweep_interval, [this]() { return stop_requested_; })) {
                break;
            }
            lock.unlock();
            try {
                sweep();
            } catch (const std::exception &e) {
                MCPMAIL_ERROR("Session sweep failed: {}", e.what());
            }
            lock.lock();
        }
    }

    void SessionStore::stop_sweeper() {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(sweeper_mtx_);
            stop_requested_ = true;
            worker = std::move(sweeper_);
        }
        sweeper_cv_.notify_all();
        if (worker.joinable()) {
            worker.join();
            MCPMAIL_DEBUG("Session sweeper stopped");
        }
    }

    bool SessionStore::sweeper_running() const {
        std::lock_guard<std::mutex> lock(sweeper_mtx_);
        return sweeper_.joinable();
    }

    void SessionStore::close_all() {
        std::unordered_map<std::string, std::shared_ptr<McpSession>> sessions;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            sessions.swap(sessions_);
        }
        for (const auto &[id, session]: sessions) {
            close_isolated(session, "closed on shutdown");
        }
    }

    size_t SessionStore::size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sessions_.size();
    }

}// namespace mcpmail::session
