/**
 * @file TelemetrySink.cpp
 * @brief CSV telemetry writer
 */

#include "pacesend/TelemetrySink.h"
#include "pacesend/Debug.h"

#include <chrono>
#include <sstream>
#include <system_error>

namespace PaceSend {

uint64_t monotonicNs() {
    static const auto start = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start).count());
}

TelemetrySink::TelemetrySink(size_t flushEvery)
    : m_flushEvery(flushEvery == 0 ? 1 : flushEvery)
    , m_count(0)
{
}

TelemetrySink::~TelemetrySink() {
    close();
}

bool TelemetrySink::open(const std::filesystem::path& path, std::string& errorMsg) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            errorMsg = "Failed to create telemetry directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
        errorMsg = "Failed to open telemetry log: " + path.string();
        return false;
    }
    return true;
}

std::string TelemetrySink::formatRecord(const TelemetryRecord& entry) {
    std::ostringstream oss;
    oss << (entry.kind == TelemetryKind::SEND ? "send" : "recv") << ','
        << entry.timestampNs << ','
        << toHex64(entry.transferId) << ','
        << entry.offset << ','
        << entry.size << ','
        << channelKindToString(entry.mode);
    return oss.str();
}

void TelemetrySink::record(const TelemetryRecord& entry) {
    if (!m_file.is_open()) {
        return;
    }

    m_file << formatRecord(entry) << '\n';
    ++m_count;
    if (m_count % m_flushEvery == 0) {
        m_file.flush();
    }
}

void TelemetrySink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void TelemetrySink::close() {
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

}  // namespace PaceSend
