/**
 * @file ProtocolLog.cpp
 * @brief JSON-lines transport event log
 */

#include "pacesend/ProtocolLog.h"
#include "pacesend/TelemetrySink.h"

#include <system_error>

namespace PaceSend {

ProtocolLog::ProtocolLog()
    : m_startNs(0)
    , m_count(0)
{
}

ProtocolLog::~ProtocolLog() {
    close();
}

bool ProtocolLog::open(const std::filesystem::path& path,
                       const std::string& title,
                       const std::string& vantagePoint,
                       std::string& errorMsg)
{
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            errorMsg = "Failed to create protocol log directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
        errorMsg = "Failed to open protocol log: " + path.string();
        return false;
    }

    m_startNs = monotonicNs();

    nlohmann::json header;
    header["title"] = title;
    header["description"] = "pacesend transport events";
    header["vantage_point"] = vantagePoint;
    m_file << header.dump() << '\n';
    m_file.flush();
    return true;
}

void ProtocolLog::event(const std::string& category,
                        const std::string& name,
                        const std::string& connId,
                        const nlohmann::json& data)
{
    if (!m_file.is_open()) {
        return;
    }

    nlohmann::json line;
    line["time_us"] = (monotonicNs() - m_startNs) / 1000;
    line["category"] = category;
    line["name"] = name;
    line["conn"] = connId;
    line["data"] = data;
    m_file << line.dump() << '\n';
    ++m_count;
}

void ProtocolLog::close() {
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

}  // namespace PaceSend
