/**
 * @file ProtocolLog.h
 * @brief JSON-lines log of transport events
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace PaceSend {

/**
 * @class ProtocolLog
 * @brief Appends one JSON object per line
 *
 * The first line written after open() describes the trace:
 * @code
 * {"title":"client protocol log","description":"...","vantage_point":"client"}
 * @endcode
 * Every later line is an event:
 * @code
 * {"time_us":1234,"category":"transport","name":"datagram_sent","conn":"...","data":{...}}
 * @endcode
 * time_us counts from open().
 */
class ProtocolLog {
public:
    ProtocolLog();
    ~ProtocolLog();

    ProtocolLog(const ProtocolLog&) = delete;
    ProtocolLog& operator=(const ProtocolLog&) = delete;

    bool open(const std::filesystem::path& path,
              const std::string& title,
              const std::string& vantagePoint,
              std::string& errorMsg);

    void event(const std::string& category,
               const std::string& name,
               const std::string& connId,
               const nlohmann::json& data = nlohmann::json::object());

    void close();

    bool isEnabled() const { return m_file.is_open(); }

    uint64_t eventCount() const { return m_count; }

private:
    std::ofstream m_file;
    uint64_t m_startNs;
    uint64_t m_count;
};

}  // namespace PaceSend
