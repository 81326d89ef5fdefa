/**
 * @file ReceiverSession.h
 * @brief Offset-addressed reassembly of incoming transfers
 */

#pragma once

#include "config.h"
#include "TelemetrySink.h"
#include "Transport.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

namespace PaceSend {

/**
 * @brief Result of handling one inbound datagram
 */
enum class DatagramOutcome : uint8_t {
    WRITTEN = 0,      ///< Payload written at its offset
    COMPLETED = 1,    ///< Written, flagged last, and the file reached total size
    MALFORMED = 2,    ///< Header could not be decoded; dropped
    WRITE_FAILED = 3  ///< Output file could not be opened or written
};

const char* datagramOutcomeToString(DatagramOutcome outcome);

/**
 * @brief Output file for one datagram transfer, keyed by transfer id
 *
 * There is no record of which byte ranges arrived. The file is only a write
 * target; completion is judged by its length.
 */
struct ReceiverFileState {
    std::filesystem::path path;
    std::fstream file;
    uint64_t totalSize = 0;   ///< From the first chunk seen for this id
    uint64_t bytesWritten = 0;
    uint64_t chunksWritten = 0;
    bool completed = false;
};

/**
 * @brief Output file for one stream, keyed by stream id
 */
struct ReceiverStreamState {
    std::filesystem::path path;
    std::ofstream file;
    uint64_t receivedBytes = 0;
    bool finished = false;
};

struct ReceiverConfig {
    std::filesystem::path outDir = DEFAULT_OUT_DIR;
};

/**
 * @class ReceiverSession
 * @brief Writes incoming chunks and stream segments to files under outDir
 *
 * Datagram path: each chunk is written at its absolute offset, so duplicate
 * and out-of-order delivery are harmless. When a chunk flagged last arrives
 * the transfer is reported complete if the file length has reached the
 * declared total. A hole before the last chunk is not detected.
 *
 * Stream path: bytes are appended in arrival order and the file is finalized
 * when the stream reports fin.
 *
 * All state lives in this object; one instance serves every connection the
 * process accepts.
 */
class ReceiverSession {
public:
    explicit ReceiverSession(ReceiverConfig config, TelemetrySink* telemetry = nullptr);

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    /**
     * @brief Create the output directory
     * @param errorMsg Output error message on failure
     */
    bool prepare(std::string& errorMsg);

    /**
     * @brief Handle one inbound unreliable message
     * @param data Message bytes (header + payload)
     * @param size Message length
     */
    DatagramOutcome handleDatagram(const uint8_t* data, size_t size);

    /**
     * @brief Pop and handle every pending datagram on the connection
     * @return Number of datagrams processed
     */
    size_t drainDatagrams(Connection& conn);

    /**
     * @brief Read everything currently available on a stream
     * @return false if the output file could not be created or written
     */
    bool handleStreamReadable(Connection& conn, uint64_t streamId);

    /**
     * @brief Flush and forget per-stream state when its connection ends
     *
     * Stream ids restart at 0 on every connection, so a later connection
     * recreates (and truncates) the file for the same id.
     */
    void releaseStreams();

    const std::filesystem::path& outDir() const { return m_config.outDir; }

    const std::map<uint64_t, ReceiverFileState>& files() const { return m_files; }
    const std::map<uint64_t, ReceiverStreamState>& streams() const { return m_streams; }

    static std::string datagramFileName(uint64_t transferId, uint64_t totalSize);
    static std::string streamFileName(uint64_t streamId);

private:
    ReceiverFileState* resolveFile(uint64_t transferId, uint64_t totalSize, std::string& errorMsg);
    ReceiverStreamState* resolveStream(uint64_t streamId, std::string& errorMsg);
    bool checkComplete(uint64_t transferId, ReceiverFileState& state);
    void finalizeStream(uint64_t streamId, ReceiverStreamState& state);

    ReceiverConfig m_config;
    TelemetrySink* m_telemetry;
    std::map<uint64_t, ReceiverFileState> m_files;
    std::map<uint64_t, ReceiverStreamState> m_streams;
    std::vector<uint8_t> m_buffer;
};

}  // namespace PaceSend
