#pragma once
#include "core/logger.h"
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <memory>
#include <system_error>
#include <thread>
#include <vector>

namespace mcpmail::core {

    /**
     * @brief Round-robin pool of io_contexts, one thread each.
     *
     * A connection is bound to one context for its whole life, so everything it
     * touches (socket, stream timer) stays on a single thread.
     */
    class IoContextPool {
    public:
        using Work = asio::executor_work_guard<asio::io_context::executor_type>;
        using WorkPtr = std::unique_ptr<Work>;

        explicit IoContextPool(std::size_t size);
        ~IoContextPool();

        IoContextPool(const IoContextPool &) = delete;
        IoContextPool &operator=(const IoContextPool &) = delete;

        asio::io_context &get_io_context();
        std::size_t size() const { return io_contexts_.size(); }
        void stop();

    private:
        std::vector<std::unique_ptr<asio::io_context>> io_contexts_;
        std::vector<WorkPtr> works_;
        std::vector<std::thread> threads_;
        std::size_t next_ = 0;
    };

    inline IoContextPool::IoContextPool(std::size_t size) {
        if (size == 0) {
            size = 1;
        }
        for (std::size_t i = 0; i < size; ++i) {
            io_contexts_.push_back(std::make_unique<asio::io_context>(1));
            works_.push_back(std::make_unique<Work>(asio::make_work_guard(*io_contexts_.back())));
        }
        for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
            threads_.emplace_back([this, i]() {
                try {
                    io_contexts_[i]->run();
                } catch (const std::exception &e) {
                    MCPMAIL_ERROR("io_context worker {} stopped: {}", i, e.what());
                }
            });
        }
    }

    inline IoContextPool::~IoContextPool() {
        stop();
    }

    inline asio::io_context &IoContextPool::get_io_context() {
        auto &context = *io_contexts_[next_++];
        if (next_ == io_contexts_.size()) {
            next_ = 0;
        }
        return context;
    }

    inline void IoContextPool::stop() {
        for (auto &work: works_) {
            work.reset();
        }
        for (auto &io: io_contexts_) {
            io->stop();
        }
        for (auto &t: threads_) {
            if (t.joinable() && t.get_id() != std::this_thread::get_id()) {
                try {
                    t.join();
                } catch (const std::system_error &e) {
                    MCPMAIL_ERROR("Error joining io_context thread: {}", e.what());
                }
            }
        }
        threads_.clear();
    }

}// namespace mcpmail::core
