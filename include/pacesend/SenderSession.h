/**
 * @file SenderSession.h
 * @brief Rate-paced sender that walks a file into chunks
 */

#pragma once

#include "config.h"
#include "TelemetrySink.h"
#include "Transport.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace PaceSend {

/**
 * @brief Sender parameters
 */
struct SenderConfig {
    std::filesystem::path sourcePath;
    size_t chunkBytes = DEFAULT_CHUNK_BYTES;
    double rateBitsPerSec = DEFAULT_RATE_MBPS * 1e6;
    ChannelKind channel = ChannelKind::DATAGRAM;
};

/**
 * @class SenderSession
 * @brief Reads a file and submits it chunk by chunk at a fixed pace
 *
 * The pace is open-loop: one chunk every chunkBytes / rate seconds,
 * regardless of what the transport reports. The deadline advances by a
 * fixed step per chunk, so a late call sends a burst to catch up.
 *
 * Datagram channel: every chunk is framed with a TransferHeader and
 * submitted as one unreliable message. Nothing is retransmitted.
 *
 * Stream channel: raw chunk bytes are written to one stream opened in
 * start(); the final chunk carries the fin flag.
 *
 * Once every byte has been submitted the session asks the connection for a
 * graceful close.
 *
 * Usage:
 * @code
 * SenderSession session(config, &telemetry);
 * std::string error;
 * if (!session.initialize(error)) { ... }
 * // on connection established:
 * session.start(conn, std::chrono::steady_clock::now(), error);
 * session.advance(conn);
 * // on every writable / datagram outcome / timer event:
 * session.advance(conn);
 * @endcode
 */
class SenderSession {
public:
    using Clock = std::chrono::steady_clock;

    explicit SenderSession(SenderConfig config, TelemetrySink* telemetry = nullptr);

    SenderSession(const SenderSession&) = delete;
    SenderSession& operator=(const SenderSession&) = delete;

    /**
     * @brief Open the source file and derive size and transfer id
     * @param errorMsg Output error message on failure
     */
    bool initialize(std::string& errorMsg);

    /**
     * @brief Begin pacing at now; opens the stream for the stream channel
     * @return false if the stream could not be opened
     */
    bool start(Connection& conn, Clock::time_point now, std::string& errorMsg);

    /**
     * @brief Submit every chunk whose deadline has passed
     * @return Number of chunks submitted in this call
     */
    size_t advance(Connection& conn);

    size_t advance(Connection& conn, Clock::time_point now);

    /**
     * @brief true once every byte (or the single empty chunk) was submitted
     */
    bool isComplete() const;

    bool isStarted() const { return m_started; }
    bool closeRequested() const { return m_closeRequested; }

    uint64_t totalSize() const { return m_totalSize; }
    uint64_t sentBytes() const { return m_sentBytes; }
    uint64_t chunksSent() const { return m_chunksSent; }
    uint64_t transferId() const { return m_transferId; }
    ChannelKind channel() const { return m_config.channel; }
    std::optional<uint64_t> streamId() const { return m_streamId; }
    Clock::time_point nextDeadline() const { return m_nextDeadline; }
    Clock::duration pacingInterval() const { return m_interval; }
    const std::string& sourceSha256() const { return m_sourceSha256; }

    /**
     * @brief Time between chunks: chunkBytes / (rateBitsPerSec / 8)
     */
    static Clock::duration computePacingInterval(size_t chunkBytes, double rateBitsPerSec);

private:
    bool readChunk(uint64_t offset, size_t size, std::vector<uint8_t>& out, std::string& errorMsg);

    IoStatus submitChunk(Connection& conn,
                         uint64_t offset,
                         const std::vector<uint8_t>& payload,
                         bool last,
                         uint64_t& timestampNs,
                         std::string& errorMsg);

    void logProgress();

    SenderConfig m_config;
    TelemetrySink* m_telemetry;

    std::ifstream m_file;
    uint64_t m_totalSize;
    uint64_t m_sentBytes;
    uint64_t m_chunksSent;
    uint64_t m_transferId;
    std::string m_sourceSha256;

    Clock::duration m_interval;
    Clock::time_point m_nextDeadline;
    std::optional<uint64_t> m_streamId;

    bool m_initialized;
    bool m_started;
    bool m_closeRequested;
    uint64_t m_nextProgressMark;
};

}  // namespace PaceSend
