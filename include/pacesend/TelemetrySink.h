/**
 * @file TelemetrySink.h
 * @brief Append-only CSV record writer for sent and received chunks
 */

#pragma once

#include "config.h"
#include "Transport.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace PaceSend {

/**
 * @brief Direction of a telemetry record
 */
enum class TelemetryKind : uint8_t {
    SEND = 0,
    RECV = 1
};

/**
 * @brief One sent or received chunk/segment
 */
struct TelemetryRecord {
    TelemetryKind kind = TelemetryKind::SEND;
    uint64_t timestampNs = 0;   ///< Monotonic, local to the writing process
    uint64_t transferId = 0;    ///< Transfer id (datagram) or stream id (stream)
    uint64_t offset = 0;
    uint64_t size = 0;
    ChannelKind mode = ChannelKind::DATAGRAM;
};

/**
 * @class TelemetrySink
 * @brief Writes one line per record: kind,timestamp,transfer_id_hex,offset,size,mode
 *
 * A sink that was never opened is disabled and silently ignores records.
 * The file is flushed every flushEvery records and on close(). Writes block
 * the caller when storage is slow; there is no back-pressure.
 *
 * Not thread-safe: owned by the single transport thread.
 */
class TelemetrySink {
public:
    explicit TelemetrySink(size_t flushEvery = DEFAULT_FLUSH_EVERY);
    ~TelemetrySink();

    TelemetrySink(const TelemetrySink&) = delete;
    TelemetrySink& operator=(const TelemetrySink&) = delete;

    /**
     * @brief Open (append) the log file, creating parent directories
     * @param path CSV path
     * @param errorMsg Output error message on failure
     * @return true if the sink is now enabled
     */
    bool open(const std::filesystem::path& path, std::string& errorMsg);

    void record(const TelemetryRecord& entry);

    void flush();

    /**
     * @brief Flush and release the file; the sink becomes disabled
     */
    void close();

    bool isEnabled() const { return m_file.is_open(); }

    uint64_t recordCount() const { return m_count; }

    static std::string formatRecord(const TelemetryRecord& entry);

private:
    std::ofstream m_file;
    size_t m_flushEvery;
    uint64_t m_count;
};

/**
 * @brief Nanoseconds since the first call in this process (monotonic)
 */
uint64_t monotonicNs();

}  // namespace PaceSend
