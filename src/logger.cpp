/**
 * @file logger.cpp
 * @brief Implementation of the logging system
 */

#include "logger.h"

#include <algorithm>
#include <cctype>

LogLevel Logger::s_minLevel = LogLevel::INFO;
bool Logger::s_useColors = true;
Logger::Sink Logger::s_sink;
std::mutex Logger::s_mutex;

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& text, LogLevel fallback) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_minLevel = level;
}

LogLevel Logger::minLevel() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_minLevel;
}

void Logger::setUseColors(bool enable) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_useColors = enable;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(s_mutex);
    s_sink = std::move(sink);
}

bool Logger::enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    return level >= s_minLevel;
}

void Logger::write(LogLevel level, const char* channel, const std::string& message) {
    std::lock_guard<std::mutex> lock(s_mutex);

    std::string text;
    if (channel) {
        text.reserve(message.size() + 16);
        text += "[";
        text += channel;
        text += "] ";
    }
    text += message;

    if (s_sink) {
        s_sink(level, text);
        return;
    }

    std::ostream& out = (level >= LogLevel::ERROR) ? std::cerr : std::cout;

    if (s_useColors) {
        switch (level) {
            case LogLevel::DEBUG:   out << "\033[36m[DEBUG]\033[0m "; break;   // Cyan
            case LogLevel::INFO:    out << "\033[32m[INFO]\033[0m "; break;    // Green
            case LogLevel::WARNING: out << "\033[33m[WARNING]\033[0m "; break; // Yellow
            case LogLevel::ERROR:   out << "\033[31m[ERROR]\033[0m "; break;   // Red
        }
    } else {
        out << "[" << logLevelToString(level) << "] ";
    }

    out << text << std::endl;
}
