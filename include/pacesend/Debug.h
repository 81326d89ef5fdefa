/**
 * @file Debug.h
 * @brief Leveled diagnostic logging with timestamps
 */

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace PaceSend {

/**
 * @brief Severity of a log line, most severe first
 */
enum class LogLevel : int {
    ERROR = 0,
    WARNING = 1,
    INFO = 2,
    DEBUG = 3
};

// Global mutex: concurrent writes to std::cerr from tests and tools interleave otherwise
inline std::mutex g_logMutex;

// Lines above this level are discarded
inline std::atomic<int> g_logLevel{static_cast<int>(LogLevel::INFO)};

inline void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<int>(level));
}

inline bool isLogEnabled(LogLevel level) {
    return static_cast<int>(level) <= g_logLevel.load();
}

/**
 * @brief Parse a level name (ERROR, WARN, WARNING, INFO, DEBUG), case-insensitive
 * @return true if recognized
 */
inline bool parseLogLevel(const std::string& name, LogLevel& out) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    if (upper == "ERROR") { out = LogLevel::ERROR; return true; }
    if (upper == "WARN" || upper == "WARNING") { out = LogLevel::WARNING; return true; }
    if (upper == "INFO") { out = LogLevel::INFO; return true; }
    if (upper == "DEBUG" || upper == "TRACE") { out = LogLevel::DEBUG; return true; }
    return false;
}

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

#define PACESEND_LOG(level, tag, msg) \
    do { \
        if (PaceSend::isLogEnabled(level)) { \
            std::lock_guard<std::mutex> lock(PaceSend::g_logMutex); \
            std::cerr << PaceSend::getTimestamp() << " [" tag "] " << msg << std::endl; \
        } \
    } while(0)

#define LOG_ERROR(msg) PACESEND_LOG(PaceSend::LogLevel::ERROR, "ERROR", msg)
#define LOG_WARNING(msg) PACESEND_LOG(PaceSend::LogLevel::WARNING, "WARNING", msg)
#define LOG_INFO(msg) PACESEND_LOG(PaceSend::LogLevel::INFO, "INFO", msg)
#define LOG_DEBUG(msg) PACESEND_LOG(PaceSend::LogLevel::DEBUG, "DEBUG", msg)

/**
 * @brief Format a 64-bit identifier as 16 lowercase hex digits
 */
inline std::string toHex64(uint64_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0') << std::setw(16) << value;
    return oss.str();
}

} // namespace PaceSend
