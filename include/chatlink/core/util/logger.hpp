/**
 * @file logger.hpp
 * @brief Logging utilities for chatlink.
 *
 * Provides a singleton Logger class and logging macros for different log levels.
 */
#pragma once
#include <atomic>
#include <string>
#include <string_view>
#include <functional>
#include <mutex>
#include <chrono>
#include <iostream>

namespace chatlink {

    /**
     * @enum LogLevel
     * @brief Log levels for the logger.
     */
    enum class LogLevel { Trace, Debug, Info, Warn, Error, Off };

    /**
     * @class Logger
     * @brief Singleton logger class for chatlink.
     *
     * Provides thread-safe logging with customizable log sinks and log levels.
     */
    class Logger {
    public:
        using Sink = std::function<void(LogLevel, const std::string&)>;

        /**
         * @brief Get the singleton Logger instance.
         * @return Reference to the Logger instance
         */
        static Logger& inst() {
            static Logger L;  return L;
        }

        /**
         * @brief Set the minimum log level.
         * @param lvl LogLevel to set
         */
        void setLevel(LogLevel lvl) { level_ = lvl; }
        LogLevel level() const { return level_.load(); }

        /**
         * @brief Set a custom log sink function.
         * @param s Sink function to use
         */
        void setSink(Sink s) {
            std::scoped_lock lk(m_);
            sink_ = std::move(s);
        }

        /**
         * @brief Log a message at the specified log level.
         * @param lvl LogLevel for the message
         * @param msg Message to log
         */
        void log(LogLevel lvl, const std::string& msg) {
            if (lvl < level_.load() || lvl == LogLevel::Off) return;
            std::scoped_lock lk(m_);
            if (sink_) sink_(lvl, msg);
        }

        /**
         * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "off").
         * @param name Case-sensitive lower-case level name
         * @param fallback Level returned for unknown names
         */
        static LogLevel parseLevel(std::string_view name, LogLevel fallback = LogLevel::Info) {
            if (name == "trace") return LogLevel::Trace;
            if (name == "debug") return LogLevel::Debug;
            if (name == "info")  return LogLevel::Info;
            if (name == "warn")  return LogLevel::Warn;
            if (name == "error") return LogLevel::Error;
            if (name == "off")   return LogLevel::Off;
            return fallback;
        }

    private:
        Logger() {
            /* default sink → stdout */
            sink_ = [](LogLevel l, const std::string& m) {
                static const char* names[]{ "TRACE","DEBUG","INFO","WARN","ERROR","OFF" };
                std::cout << "[" << names[(int)l] << "] " << m << '\n';
            };
        }
        std::mutex m_;
        std::atomic<LogLevel> level_{ LogLevel::Info };
        Sink       sink_;
    };

#define LOG_TRACE(msg) ::chatlink::Logger::inst().log(::chatlink::LogLevel::Trace, msg)
#define LOG_DEBUG(msg) ::chatlink::Logger::inst().log(::chatlink::LogLevel::Debug, msg)
#define LOG_INFO(msg)  ::chatlink::Logger::inst().log(::chatlink::LogLevel::Info,  msg)
#define LOG_WARN(msg)  ::chatlink::Logger::inst().log(::chatlink::LogLevel::Warn,  msg)
#define LOG_ERROR(msg) ::chatlink::Logger::inst().log(::chatlink::LogLevel::Error, msg)
}
