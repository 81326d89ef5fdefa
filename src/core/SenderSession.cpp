/**
 * @file SenderSession.cpp
 * @brief Rate-paced sender state machine
 */

#include "pacesend/SenderSession.h"
#include "pacesend/Debug.h"
#include "pacesend/ErrorCodes.h"
#include "pacesend/HashUtils.h"
#include "pacesend/TransferHeader.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <system_error>

namespace PaceSend {

SenderSession::SenderSession(SenderConfig config, TelemetrySink* telemetry)
    : m_config(std::move(config))
    , m_telemetry(telemetry)
    , m_totalSize(0)
    , m_sentBytes(0)
    , m_chunksSent(0)
    , m_transferId(0)
    , m_interval(computePacingInterval(m_config.chunkBytes, m_config.rateBitsPerSec))
    , m_nextDeadline()
    , m_initialized(false)
    , m_started(false)
    , m_closeRequested(false)
    , m_nextProgressMark(PROGRESS_LOG_STEP_BYTES)
{
}

SenderSession::Clock::duration SenderSession::computePacingInterval(size_t chunkBytes,
                                                                    double rateBitsPerSec)
{
    if (rateBitsPerSec <= 0.0) {
        return Clock::duration::zero();
    }
    const double bytesPerSec = rateBitsPerSec / 8.0;
    const double nanos = static_cast<double>(chunkBytes) * 1e9 / bytesPerSec;
    return std::chrono::duration_cast<Clock::duration>(
        std::chrono::nanoseconds(static_cast<int64_t>(std::llround(nanos))));
}

bool SenderSession::initialize(std::string& errorMsg) {
    if (m_config.chunkBytes == 0) {
        errorMsg = "Chunk size must be > 0";
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(m_config.sourcePath, ec)) {
        errorMsg = std::string(ErrorCodes::TRANSFER_SOURCE_UNREADABLE) +
                   ": not a regular file: " + m_config.sourcePath.string();
        return false;
    }

    m_totalSize = std::filesystem::file_size(m_config.sourcePath, ec);
    if (ec) {
        errorMsg = std::string(ErrorCodes::TRANSFER_SOURCE_UNREADABLE) +
                   ": cannot stat " + m_config.sourcePath.string() + ": " + ec.message();
        return false;
    }

    m_file.open(m_config.sourcePath, std::ios::binary);
    if (!m_file.is_open()) {
        errorMsg = std::string(ErrorCodes::TRANSFER_SOURCE_UNREADABLE) +
                   ": cannot open " + m_config.sourcePath.string();
        return false;
    }

    m_transferId = HashUtils::computeTransferId(m_config.sourcePath, m_totalSize);
    m_sourceSha256 = HashUtils::fileHashHex(m_config.sourcePath);
    m_initialized = true;

    LOG_INFO("Sender ready: file=" << m_config.sourcePath.string()
             << " total=" << m_totalSize << "B"
             << " transfer_id=" << toHex64(m_transferId)
             << " mode=" << channelKindToString(m_config.channel)
             << " chunk=" << m_config.chunkBytes << "B"
             << " interval_ns=" << std::chrono::duration_cast<std::chrono::nanoseconds>(m_interval).count()
             << " sha256=" << m_sourceSha256);
    return true;
}

bool SenderSession::start(Connection& conn, Clock::time_point now, std::string& errorMsg) {
    if (!m_initialized) {
        errorMsg = "Sender not initialized";
        return false;
    }

    if (m_config.channel == ChannelKind::STREAM && !m_streamId) {
        uint64_t streamId = 0;
        if (!conn.openBidiStream(SENDER_STREAM_URGENCY, streamId, errorMsg)) {
            return false;
        }
        m_streamId = streamId;
        LOG_DEBUG(conn.traceId() << " opened stream " << streamId);
    }

    m_nextDeadline = now;
    m_started = true;
    return true;
}

bool SenderSession::isComplete() const {
    // An empty file still produces one (empty, last) chunk
    return m_initialized && m_sentBytes >= m_totalSize && m_chunksSent > 0;
}

size_t SenderSession::advance(Connection& conn) {
    return advance(conn, Clock::now());
}

size_t SenderSession::advance(Connection& conn, Clock::time_point now) {
    if (!m_started || m_closeRequested) {
        return 0;
    }

    size_t submitted = 0;
    std::vector<uint8_t> payload;

    while (!isComplete() && now >= m_nextDeadline) {
        const uint64_t offset = m_sentBytes;
        const size_t payloadSize = static_cast<size_t>(
            std::min<uint64_t>(m_config.chunkBytes, m_totalSize - offset));
        const bool last = (offset + payloadSize == m_totalSize);

        std::string errorMsg;
        if (!readChunk(offset, payloadSize, payload, errorMsg)) {
            LOG_ERROR(conn.traceId() << " file read error at offset " << offset << ": " << errorMsg);
            break;
        }

        uint64_t timestampNs = 0;
        IoStatus status = submitChunk(conn, offset, payload, last, timestampNs, errorMsg);
        if (status == IoStatus::WOULD_BLOCK) {
            break;
        }
        if (status == IoStatus::FAILED) {
            LOG_ERROR(conn.traceId() << " " << channelKindToString(m_config.channel)
                      << " send error at offset " << offset << ": " << errorMsg);
            break;
        }

        if (m_telemetry) {
            TelemetryRecord rec;
            rec.kind = TelemetryKind::SEND;
            rec.timestampNs = timestampNs;
            rec.transferId = m_transferId;
            rec.offset = offset;
            rec.size = payloadSize;
            rec.mode = m_config.channel;
            m_telemetry->record(rec);
        }

        m_sentBytes += payloadSize;
        ++m_chunksSent;
        ++submitted;
        m_nextDeadline += m_interval;
        logProgress();
    }

    if (isComplete() && !m_closeRequested) {
        m_closeRequested = true;
        LOG_INFO(conn.traceId() << " all " << m_totalSize << " bytes submitted in "
                 << m_chunksSent << " chunks, closing");
        conn.close(true, 0x00, "ok");
    }

    return submitted;
}

bool SenderSession::readChunk(uint64_t offset, size_t size,
                              std::vector<uint8_t>& out, std::string& errorMsg)
{
    out.resize(size);
    if (size == 0) {
        return true;
    }

    m_file.clear();
    m_file.seekg(static_cast<std::streamoff>(offset));
    if (!m_file) {
        errorMsg = "seek failed";
        return false;
    }

    m_file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(m_file.gcount()) != size) {
        errorMsg = "short read (" + std::to_string(m_file.gcount()) + " of " +
                   std::to_string(size) + " bytes)";
        return false;
    }
    return true;
}

IoStatus SenderSession::submitChunk(Connection& conn,
                                    uint64_t offset,
                                    const std::vector<uint8_t>& payload,
                                    bool last,
                                    uint64_t& timestampNs,
                                    std::string& errorMsg)
{
    if (m_config.channel == ChannelKind::DATAGRAM) {
        TransferHeader hdr;
        hdr.transferId = m_transferId;
        hdr.totalSize = m_totalSize;
        hdr.offset = offset;
        hdr.length = static_cast<uint32_t>(payload.size());
        hdr.setLast(last);
        hdr.timestampNs = monotonicNs();
        timestampNs = hdr.timestampNs;

        IoStatus status = conn.sendDatagram(frameChunk(hdr, payload.data(), payload.size()), errorMsg);
        if (status == IoStatus::OK) {
            LOG_DEBUG("[DGRAM] send offset=" << hdr.offset << " len=" << hdr.length
                      << " total_size=" << hdr.totalSize << " last=" << hdr.isLast()
                      << " send_ts_ns=" << hdr.timestampNs);
        }
        return status;
    }

    if (!m_streamId) {
        errorMsg = "no stream id";
        return IoStatus::FAILED;
    }

    timestampNs = monotonicNs();
    IoStatus status = conn.streamWrite(*m_streamId, payload.data(), payload.size(), last, errorMsg);
    if (status == IoStatus::OK) {
        LOG_DEBUG("[STREAM] send stream=" << *m_streamId << " offset=" << offset
                  << " len=" << payload.size() << " fin=" << last);
    }
    return status;
}

void SenderSession::logProgress() {
    if (m_totalSize == 0 || m_sentBytes < m_nextProgressMark) {
        return;
    }

    const double percent = static_cast<double>(m_sentBytes) * 100.0 / static_cast<double>(m_totalSize);
    LOG_INFO("[PROGRESS] " << m_sentBytes << "/" << m_totalSize << " bytes ("
             << std::fixed << std::setprecision(1) << percent << "%)");

    while (m_nextProgressMark <= m_sentBytes) {
        m_nextProgressMark += PROGRESS_LOG_STEP_BYTES;
    }
}

}  // namespace PaceSend
