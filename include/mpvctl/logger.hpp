/*
* @license
* (C) zachbabanov
*
*/

#ifndef MPVCTL_LOGGER_HPP
#define MPVCTL_LOGGER_HPP

#pragma once

#include <fstream>
#include <functional>
#include <string>
#include <atomic>
#include <mutex>

#include <fmt/core.h>

namespace mpvctl::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Categories to attach to each log line.
 */
    enum class Category {
        GENERAL,
        PLAYER,
        IPC,
        PROCESS,
        NETWORK
    };

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   Logger::instance().log(Level::INFO, Category::GENERAL, "message", __FILE__, __LINE__);
 *   LOG_GEN_INFO("Hello {}", name);
 */
    class Logger {
    public:
        using Sink = std::function<void(const std::string &line)>;

        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);
        Level level() const;

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Turns the stdout copy on or off; the file and sink still get every line.
        void set_console(bool enabled);
        bool console() const;

        /// Test-only: receives every formatted line in addition to stdout. Pass nullptr to clear.
        void set_sink(Sink sink);

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - convenience template that formats a message using fmt.
         *
         * Formats straight into a std::string through std::back_inserter.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, Args&&... args) {
            if (lvl < min_level_.load()) return;
            std::string msg;
            try {
                if (fmt_str && fmt_str[0] != '\0') {
                    fmt::format_to(std::back_inserter(msg), fmt::runtime(fmt_str), std::forward<Args>(args)...);
                }
            } catch (const std::exception &e) {
                msg = fmt::format("[format_error:{}] {}", e.what(), fmt_str ? fmt_str : "");
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;
        std::atomic<bool> console_;
        Sink sink_;

        std::string timestamp_now();

        // non-copyable
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

    /// Parses "trace|debug|info|warn|error" (case-insensitive); returns def for anything else.
    Level parse_level(const std::string &s, Level def = Level::INFO);

// Convenience macros for easy calls (automatically add file:line)
#define LOG_GEN_TRACE(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::TRACE, mpvctl::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::DEBUG, mpvctl::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::INFO,  mpvctl::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::WARN,  mpvctl::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::ERROR, mpvctl::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_PLAYER_TRACE(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::TRACE, mpvctl::log::Category::PLAYER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_DEBUG(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::DEBUG, mpvctl::log::Category::PLAYER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_INFO(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::INFO,  mpvctl::log::Category::PLAYER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_WARN(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::WARN,  mpvctl::log::Category::PLAYER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_ERROR(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::ERROR, mpvctl::log::Category::PLAYER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_IPC_TRACE(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::TRACE, mpvctl::log::Category::IPC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_IPC_DEBUG(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::DEBUG, mpvctl::log::Category::IPC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_IPC_INFO(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::INFO,  mpvctl::log::Category::IPC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_IPC_WARN(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::WARN,  mpvctl::log::Category::IPC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_IPC_ERROR(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::ERROR, mpvctl::log::Category::IPC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_PROC_TRACE(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::TRACE, mpvctl::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_DEBUG(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::DEBUG, mpvctl::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_INFO(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::INFO,  mpvctl::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_WARN(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::WARN,  mpvctl::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_PROC_ERROR(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::ERROR, mpvctl::log::Category::PROCESS, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::TRACE, mpvctl::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::DEBUG, mpvctl::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::INFO,  mpvctl::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  mpvctl::log::Logger::instance().logf(mpvctl::log::Level::WARN,  mpvctl::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) mpvctl::log::Logger::instance().logf(mpvctl::log::Level::ERROR, mpvctl::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace mpvctl::log

#endif // MPVCTL_LOGGER_HPP
