/**
 * @file logger.h
 * @brief Stream-style logging with severity levels, channels and a capture sink
 *
 * Worker threads of the job scheduler and the chunk pipeline log through this
 * class, so output is serialized behind a mutex. Tests install a sink to
 * capture messages instead of printing them.
 */

#pragma once

#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Verbose debugging information
    INFO,     ///< General informational messages
    WARNING,  ///< Warning messages (non-critical issues)
    ERROR     ///< Error messages (critical issues)
};

/**
 * @brief Converts a LogLevel to its display tag
 */
const char* logLevelToString(LogLevel level);

/**
 * @brief Parses "debug", "info", "warning" or "error" (case-insensitive)
 * @param text Level name
 * @param fallback Level returned when text is not recognized
 */
LogLevel logLevelFromString(const std::string& text, LogLevel fallback);

/**
 * @brief Thread-safe logger with severity levels and optional channel tags
 *
 * Usage:
 * @code
 * Logger::info() << "Scheduler started with " << count << " workers";
 * Logger::error("JobScheduler") << "Job " << id << " threw: " << e.what();
 * @endcode
 *
 * A sink installed with setSink() receives every message that passes the
 * minimum level; the console is bypassed while a sink is installed.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /**
     * @brief Log stream that outputs when destroyed
     */
    class LogStream {
    public:
        LogStream(LogLevel level, const char* channel)
            : m_level(level), m_channel(channel) {}

        LogStream(LogStream&& other) noexcept
            : m_level(other.m_level)
            , m_channel(other.m_channel)
            , m_stream(std::move(other.m_stream))
            , m_active(other.m_active) {
            other.m_active = false;
        }

        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;

        ~LogStream() {
            if (m_active && Logger::enabled(m_level)) {
                Logger::write(m_level, m_channel, m_stream.str());
            }
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (m_active && Logger::enabled(m_level)) {
                m_stream << value;
            }
            return *this;
        }

    private:
        LogLevel m_level;
        const char* m_channel;         ///< May be null (no channel tag)
        std::ostringstream m_stream;   ///< Accumulated message
        bool m_active = true;          ///< False once moved from
    };

    // ========== Static Logging Methods ==========

    static LogStream debug(const char* channel = nullptr) { return LogStream(LogLevel::DEBUG, channel); }
    static LogStream info(const char* channel = nullptr) { return LogStream(LogLevel::INFO, channel); }
    static LogStream warning(const char* channel = nullptr) { return LogStream(LogLevel::WARNING, channel); }
    static LogStream error(const char* channel = nullptr) { return LogStream(LogLevel::ERROR, channel); }

    // ========== Configuration ==========

    /**
     * @brief Sets the minimum log level; messages below it are suppressed
     */
    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    /**
     * @brief Enables or disables ANSI colored level prefixes
     */
    static void setUseColors(bool enable);

    /**
     * @brief Routes messages to a callback instead of the console
     *
     * Pass an empty function to restore console output. The sink is called
     * with the logger mutex held, so it must not log itself.
     */
    static void setSink(Sink sink);

    static bool enabled(LogLevel level);

private:
    static void write(LogLevel level, const char* channel, const std::string& message);

    static LogLevel s_minLevel;
    static bool s_useColors;
    static Sink s_sink;
    static std::mutex s_mutex;
};
