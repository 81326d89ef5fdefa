/**
 * @file ReceiverSession.cpp
 * @brief Datagram and stream receive paths
 */

#include "pacesend/ReceiverSession.h"
#include "pacesend/Debug.h"
#include "pacesend/ErrorCodes.h"
#include "pacesend/HashUtils.h"
#include "pacesend/TransferHeader.h"

#include <algorithm>
#include <system_error>

namespace PaceSend {

const char* datagramOutcomeToString(DatagramOutcome outcome) {
    switch (outcome) {
        case DatagramOutcome::WRITTEN:      return "written";
        case DatagramOutcome::COMPLETED:    return "completed";
        case DatagramOutcome::MALFORMED:    return "malformed";
        case DatagramOutcome::WRITE_FAILED: return "write failed";
        default:                            return "unknown";
    }
}

ReceiverSession::ReceiverSession(ReceiverConfig config, TelemetrySink* telemetry)
    : m_config(std::move(config))
    , m_telemetry(telemetry)
    , m_buffer(MAX_BUF_SIZE)
{
}

bool ReceiverSession::prepare(std::string& errorMsg) {
    std::error_code ec;
    std::filesystem::create_directories(m_config.outDir, ec);
    if (ec) {
        errorMsg = std::string(ErrorCodes::TRANSFER_OUTPUT_UNWRITABLE) +
                   ": cannot create " + m_config.outDir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

std::string ReceiverSession::datagramFileName(uint64_t transferId, uint64_t totalSize) {
    return toHex64(transferId) + "_size" + std::to_string(totalSize) + ".bin";
}

std::string ReceiverSession::streamFileName(uint64_t streamId) {
    return toHex64(streamId) + ".bin";
}

// ============================================================================
// Datagram path
// ============================================================================

ReceiverFileState* ReceiverSession::resolveFile(uint64_t transferId, uint64_t totalSize,
                                                std::string& errorMsg)
{
    auto it = m_files.find(transferId);
    if (it != m_files.end()) {
        return &it->second;
    }

    ReceiverFileState state;
    state.path = m_config.outDir / datagramFileName(transferId, totalSize);
    state.totalSize = totalSize;

    // Open read/write without truncating; create first if missing
    state.file.open(state.path, std::ios::in | std::ios::out | std::ios::binary);
    if (!state.file.is_open()) {
        std::ofstream create(state.path, std::ios::out | std::ios::binary);
        if (!create.is_open()) {
            errorMsg = std::string(ErrorCodes::TRANSFER_OUTPUT_UNWRITABLE) +
                       ": cannot create " + state.path.string();
            return nullptr;
        }
        create.close();
        state.file.open(state.path, std::ios::in | std::ios::out | std::ios::binary);
        if (!state.file.is_open()) {
            errorMsg = std::string(ErrorCodes::TRANSFER_OUTPUT_UNWRITABLE) +
                       ": cannot open " + state.path.string();
            return nullptr;
        }
    }

    LOG_INFO("[DGRAM] transfer " << toHex64(transferId) << " total=" << totalSize
             << "B -> " << state.path.string());

    auto inserted = m_files.emplace(transferId, std::move(state));
    return &inserted.first->second;
}

DatagramOutcome ReceiverSession::handleDatagram(const uint8_t* data, size_t size) {
    const uint64_t nowNs = monotonicNs();

    DecodedChunk chunk;
    CodecError codecError = decodeChunk(data, size, chunk);
    if (codecError != CodecError::NONE) {
        LOG_WARNING("[DGRAM] bad header (" << codecErrorToString(codecError)
                    << "), drop " << size << "B");
        return DatagramOutcome::MALFORMED;
    }

    const TransferHeader& hdr = chunk.header;
    LOG_DEBUG("[DGRAM] recv transfer=" << toHex64(hdr.transferId) << " offset=" << hdr.offset
              << " len=" << hdr.length << " last=" << hdr.isLast() << " total=" << hdr.totalSize
              << " send_ts_ns=" << hdr.timestampNs << " payload=" << chunk.payloadSize << "B");

    if (chunk.payloadSize < hdr.length) {
        LOG_WARNING("[DGRAM] payload shorter than header length (" << chunk.payloadSize
                    << " < " << hdr.length << ") at offset " << hdr.offset);
    }
    const size_t toWrite = std::min<size_t>(chunk.payloadSize, hdr.length);

    std::string errorMsg;
    ReceiverFileState* state = resolveFile(hdr.transferId, hdr.totalSize, errorMsg);
    if (!state) {
        LOG_ERROR("[DGRAM] " << errorMsg);
        return DatagramOutcome::WRITE_FAILED;
    }

    state->file.clear();
    state->file.seekp(static_cast<std::streamoff>(hdr.offset));
    if (toWrite > 0) {
        state->file.write(reinterpret_cast<const char*>(chunk.payload),
                          static_cast<std::streamsize>(toWrite));
        state->file.flush();
    }
    if (!state->file) {
        LOG_ERROR("[DGRAM] write error at offset " << hdr.offset << " -> " << state->path.string());
        return DatagramOutcome::WRITE_FAILED;
    }

    state->bytesWritten += toWrite;
    ++state->chunksWritten;

    if (m_telemetry) {
        TelemetryRecord rec;
        rec.kind = TelemetryKind::RECV;
        rec.timestampNs = nowNs;
        rec.transferId = hdr.transferId;
        rec.offset = hdr.offset;
        rec.size = toWrite;
        rec.mode = ChannelKind::DATAGRAM;
        m_telemetry->record(rec);
    }

    if (hdr.isLast() && checkComplete(hdr.transferId, *state)) {
        return DatagramOutcome::COMPLETED;
    }
    return DatagramOutcome::WRITTEN;
}

bool ReceiverSession::checkComplete(uint64_t transferId, ReceiverFileState& state) {
    state.file.flush();

    // Length heuristic: a hole before the last chunk still passes
    std::error_code ec;
    const uint64_t fileSize = std::filesystem::file_size(state.path, ec);
    if (ec) {
        LOG_WARNING("[DGRAM] cannot stat " << state.path.string() << ": " << ec.message());
        return false;
    }
    if (fileSize < state.totalSize) {
        LOG_DEBUG("[DGRAM] last chunk seen, file at " << fileSize << "/" << state.totalSize << "B");
        return false;
    }

    state.completed = true;
    LOG_INFO("[DGRAM] transfer " << toHex64(transferId) << " completed: " << state.totalSize
             << " bytes -> " << state.path.string()
             << " sha256=" << HashUtils::fileHashHex(state.path));
    return true;
}

size_t ReceiverSession::drainDatagrams(Connection& conn) {
    size_t count = 0;
    std::vector<uint8_t> message;
    while (conn.recvDatagram(message)) {
        handleDatagram(message.data(), message.size());
        ++count;
    }
    return count;
}

// ============================================================================
// Stream path
// ============================================================================

ReceiverStreamState* ReceiverSession::resolveStream(uint64_t streamId, std::string& errorMsg) {
    auto it = m_streams.find(streamId);
    if (it != m_streams.end()) {
        return &it->second;
    }

    ReceiverStreamState state;
    state.path = m_config.outDir / streamFileName(streamId);
    state.file.open(state.path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!state.file.is_open()) {
        errorMsg = std::string(ErrorCodes::TRANSFER_OUTPUT_UNWRITABLE) +
                   ": cannot create " + state.path.string();
        return nullptr;
    }

    LOG_INFO("[STREAM] create file for stream " << streamId << " -> " << state.path.string());

    auto inserted = m_streams.emplace(streamId, std::move(state));
    return &inserted.first->second;
}

bool ReceiverSession::handleStreamReadable(Connection& conn, uint64_t streamId) {
    std::string errorMsg;
    ReceiverStreamState* state = resolveStream(streamId, errorMsg);
    if (!state) {
        LOG_ERROR("[STREAM] " << errorMsg);
        return false;
    }

    while (!state->finished) {
        size_t bytesRead = 0;
        bool fin = false;
        IoStatus status = conn.streamRead(streamId, m_buffer.data(), m_buffer.size(),
                                          bytesRead, fin, errorMsg);
        if (status == IoStatus::WOULD_BLOCK) {
            break;
        }
        if (status == IoStatus::FAILED) {
            LOG_ERROR("[STREAM] read error on stream " << streamId << ": " << errorMsg);
            break;
        }

        if (bytesRead > 0) {
            state->file.write(reinterpret_cast<const char*>(m_buffer.data()),
                              static_cast<std::streamsize>(bytesRead));
            if (!state->file) {
                LOG_ERROR("[STREAM] write error -> " << state->path.string());
                return false;
            }

            if (m_telemetry) {
                TelemetryRecord rec;
                rec.kind = TelemetryKind::RECV;
                rec.timestampNs = monotonicNs();
                rec.transferId = streamId;
                rec.offset = state->receivedBytes;
                rec.size = bytesRead;
                rec.mode = ChannelKind::STREAM;
                m_telemetry->record(rec);
            }
            state->receivedBytes += bytesRead;
        }

        if (fin) {
            finalizeStream(streamId, *state);
        }
    }
    return true;
}

void ReceiverSession::finalizeStream(uint64_t streamId, ReceiverStreamState& state) {
    state.file.flush();
    state.finished = true;
    LOG_INFO("[STREAM] " << streamId << " finished: " << state.receivedBytes << " bytes -> "
             << state.path.string() << " sha256=" << HashUtils::fileHashHex(state.path));
}

void ReceiverSession::releaseStreams() {
    for (auto& entry : m_streams) {
        ReceiverStreamState& state = entry.second;
        if (!state.finished) {
            LOG_WARNING("[STREAM] " << entry.first << " closed before fin: "
                        << state.receivedBytes << " bytes -> " << state.path.string());
        }
        state.file.flush();
    }
    m_streams.clear();
}

}  // namespace PaceSend
