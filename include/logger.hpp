/*
* @license
* (C) zachbabanov
*
*/

#ifndef CANVASRELAY_LOGGER_HPP
#define CANVASRELAY_LOGGER_HPP

#pragma once

#include <fstream>
#include <iterator>
#include <string>
#include <atomic>
#include <mutex>

#include <fmt/core.h>

namespace canvasrelay::log {

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
        SESSION,
        ENCODER,
        CODEC,
        NETWORK
    };

/**
 * @brief Thread-safe singleton logger using fmt for formatting.
 *
 * Usage:
 *   Logger::instance().log(Level::INFO, Category::GENERAL, "message", __FILE__, __LINE__);
 *   LOG_GEN_INFO("Hello {}", name);
 *
 * Never pass a stream key into a log call; use common::redactDestination().
 */
    class Logger {
    public:
        static Logger &instance();

        /// Set global minimal log level (messages below will be ignored)
        void set_level(Level l);

        Level level() const;

        /// Open file to duplicate logs into
        bool open_logfile(const std::string &path);

        /// Close log file
        void close_logfile();

        /// Core logging call: prints a ready message
        void log(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        /**
         * @brief logf - formats a message using fmt and forwards it to log().
         *
         * The format string is a runtime string here, so vformat_to is used.
         */
        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, const char *fmt_str, const Args &...args) {
            if (lvl < min_level_.load()) return;
            std::string msg;
            try {
                if (fmt_str && fmt_str[0] != '\0') {
                    fmt::vformat_to(std::back_inserter(msg), fmt::string_view(fmt_str), fmt::make_format_args(args...));
                }
            } catch (const std::exception &e) {
                // formatting error: keep the raw format string so the line is not lost
                msg = std::string("[format_error:") + e.what() + "] " + (fmt_str ? fmt_str : "");
            }
            log(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;

        std::string timestamp_now();

        // non-copyable
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

/// Parse "trace|debug|info|warn|error" (case-insensitive). Returns false for anything else.
    bool parse_level(const std::string &s, Level &out);

// Convenience macros for easy calls (automatically add file:line)
#define LOG_GEN_TRACE(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::TRACE, canvasrelay::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::DEBUG, canvasrelay::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::INFO,  canvasrelay::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::WARN,  canvasrelay::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::ERROR, canvasrelay::log::Category::GENERAL, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_SESSION_TRACE(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::TRACE, canvasrelay::log::Category::SESSION, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_SESSION_DEBUG(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::DEBUG, canvasrelay::log::Category::SESSION, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_SESSION_INFO(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::INFO,  canvasrelay::log::Category::SESSION, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_SESSION_WARN(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::WARN,  canvasrelay::log::Category::SESSION, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_SESSION_ERROR(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::ERROR, canvasrelay::log::Category::SESSION, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ENC_TRACE(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::TRACE, canvasrelay::log::Category::ENCODER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ENC_DEBUG(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::DEBUG, canvasrelay::log::Category::ENCODER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ENC_INFO(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::INFO,  canvasrelay::log::Category::ENCODER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ENC_WARN(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::WARN,  canvasrelay::log::Category::ENCODER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ENC_ERROR(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::ERROR, canvasrelay::log::Category::ENCODER, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_CODEC_TRACE(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::TRACE, canvasrelay::log::Category::CODEC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CODEC_DEBUG(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::DEBUG, canvasrelay::log::Category::CODEC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CODEC_INFO(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::INFO,  canvasrelay::log::Category::CODEC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CODEC_WARN(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::WARN,  canvasrelay::log::Category::CODEC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_CODEC_ERROR(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::ERROR, canvasrelay::log::Category::CODEC, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_NET_TRACE(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::TRACE, canvasrelay::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_DEBUG(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::DEBUG, canvasrelay::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_INFO(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::INFO,  canvasrelay::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_WARN(fmt, ...)  canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::WARN,  canvasrelay::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_NET_ERROR(fmt, ...) canvasrelay::log::Logger::instance().logf(canvasrelay::log::Level::ERROR, canvasrelay::log::Category::NETWORK, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

} // namespace canvasrelay::log

#endif // CANVASRELAY_LOGGER_HPP
