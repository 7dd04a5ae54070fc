#pragma once

#include <memory>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

#define MCPMAIL_TRACE(...) ::mcpmail::core::Logger::instance().trace(__VA_ARGS__)
#define MCPMAIL_DEBUG(...) ::mcpmail::core::Logger::instance().debug(__VA_ARGS__)
#define MCPMAIL_INFO(...) ::mcpmail::core::Logger::instance().info(__VA_ARGS__)
#define MCPMAIL_WARN(...) ::mcpmail::core::Logger::instance().warn(__VA_ARGS__)
#define MCPMAIL_ERROR(...) ::mcpmail::core::Logger::instance().error(__VA_ARGS__)
#define MCPMAIL_CRITICAL(...) ::mcpmail::core::Logger::instance().critical(__VA_ARGS__)

namespace mcpmail::core {

    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    /**
     * @brief Map a config string (trace, debug, info, warn, error, critical, off) to a level.
     * Unknown names fall back to INFO.
     */
    LogLevel parse_log_level(const std::string &name);

    /**
     * @brief Process-wide facade over the spdlog logger.
     *
     * Until initialize_logger() has run every call is a no-op, which keeps
     * unit tests quiet without any setup.
     */
    class Logger {
    public:
        static Logger &instance();

        template<typename... Args>
        void trace(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::TRACE, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void debug(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::DEBUG, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::INFO, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::WARN, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::ERR, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void critical(fmt::format_string<Args...> fmt, Args &&...args) {
            log(LogLevel::CRITICAL, fmt, std::forward<Args>(args)...);
        }

        void trace(const char *msg) { write(LogLevel::TRACE, msg); }
        void debug(const char *msg) { write(LogLevel::DEBUG, msg); }
        void info(const char *msg) { write(LogLevel::INFO, msg); }
        void warn(const char *msg) { write(LogLevel::WARN, msg); }
        void error(const char *msg) { write(LogLevel::ERR, msg); }
        void critical(const char *msg) { write(LogLevel::CRITICAL, msg); }

        void set_level(LogLevel level);
        LogLevel get_level() const { return level_; }

        void attach(std::shared_ptr<spdlog::logger> logger, LogLevel level);
        void shutdown();

    private:
        Logger() = default;

        bool enabled(LogLevel level) const {
            return logger_ && static_cast<int>(level) >= static_cast<int>(level_);
        }

        void write(LogLevel level, const std::string &msg);

        template<typename... Args>
        void log(LogLevel level, fmt::format_string<Args...> fmt, Args &&...args) {
            if (!enabled(level)) {
                return;
            }
            try {
                write(level, fmt::format(fmt, std::forward<Args>(args)...));
            } catch (const std::exception &e) {
                logger_->error("Log formatting error: {}", e.what());
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        LogLevel level_ = LogLevel::INFO;
    };

    /**
     * @brief Install the asynchronous spdlog logger used by the MCPMAIL_* macros.
     * @param log_path Rotating log file path; empty keeps console output only
     * @param log_level Level name, see parse_log_level()
     * @param max_file_size Maximum size of each log file (bytes)
     * @param max_files Maximum number of rotated files
     */
    void initialize_logger(const std::string &log_path,
                           const std::string &log_level = "info",
                           size_t max_file_size = 1048576 * 5,
                           size_t max_files = 3);

}// namespace mcpmail::core
