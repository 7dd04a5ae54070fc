#include "logger.h"
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace mcpmail::core {

    namespace {
        spdlog::level::level_enum to_spdlog(LogLevel level) {
            switch (level) {
                case LogLevel::TRACE:
                    return spdlog::level::trace;
                case LogLevel::DEBUG:
                    return spdlog::level::debug;
                case LogLevel::INFO:
                    return spdlog::level::info;
                case LogLevel::WARN:
                    return spdlog::level::warn;
                case LogLevel::ERR:
                    return spdlog::level::err;
                case LogLevel::CRITICAL:
                    return spdlog::level::critical;
                default:
                    return spdlog::level::off;
            }
        }
    }// namespace

    LogLevel parse_log_level(const std::string &name) {
        if (name == "trace") return LogLevel::TRACE;
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERR;
        if (name == "critical") return LogLevel::CRITICAL;
        if (name == "off") return LogLevel::OFF;
        return LogLevel::INFO;
    }

    Logger &Logger::instance() {
        static Logger instance;
        return instance;
    }

    void Logger::set_level(LogLevel level) {
        level_ = level;
        if (logger_) {
            logger_->set_level(to_spdlog(level));
        }
    }

    void Logger::attach(std::shared_ptr<spdlog::logger> logger, LogLevel level) {
        logger_ = std::move(logger);
        set_level(level);
    }

    void Logger::shutdown() {
        if (logger_) {
            logger_->flush();
        }
        logger_.reset();
        spdlog::shutdown();
    }

    void Logger::write(LogLevel level, const std::string &msg) {
        if (!enabled(level)) {
            return;
        }
        logger_->log(to_spdlog(level), msg);
    }

    void initialize_logger(const std::string &log_path, const std::string &log_level, size_t max_file_size,
                           size_t max_files) {
        spdlog::init_thread_pool(8192, 1);

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
#ifndef _WIN32
        console_sink->set_color(spdlog::level::trace, "\033[36m");
        console_sink->set_color(spdlog::level::debug, "\033[34m");
        console_sink->set_color(spdlog::level::info, "\033[32m");
        console_sink->set_color(spdlog::level::warn, "\033[33m");
        console_sink->set_color(spdlog::level::err, "\033[31m");
        console_sink->set_color(spdlog::level::critical, "\033[41m\033[37m");
#endif
        sinks.push_back(console_sink);

        if (!log_path.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path, max_file_size, max_files));
        }

        auto logger = std::make_shared<spdlog::async_logger>(
                "mcpmail", sinks.begin(), sinks.end(), spdlog::thread_pool(),
                spdlog::async_overflow_policy::block);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
        logger->flush_on(spdlog::level::err);

        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(3));

        Logger::instance().attach(std::move(logger), parse_log_level(log_level));
    }

}// namespace mcpmail::core
