/**
 * @file Transport.h
 * @brief Connection abstraction consumed by the sender and receiver sessions
 *
 * A Connection exposes two channel kinds: unreliable datagrams and ordered
 * reliable streams. The transport delivers lifecycle and readiness events to
 * a TransportHandler, one event at a time, on a single thread. Handlers may
 * call back into the Connection from inside any event.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PaceSend {

/**
 * @brief Which channel a transfer uses
 */
enum class ChannelKind : uint8_t {
    DATAGRAM = 0,  ///< Independently addressed unreliable messages
    STREAM = 1     ///< One ordered reliable byte stream
};

/**
 * @brief Wire/telemetry name of a channel kind ("datagram" or "stream")
 */
const char* channelKindToString(ChannelKind kind);

/**
 * @brief Parse "datagram"/"dg" or "stream"/"str", case-insensitive
 */
bool parseChannelKind(const std::string& name, ChannelKind& out);

/**
 * @brief Outcome of a non-blocking transport operation
 */
enum class IoStatus : uint8_t {
    OK = 0,           ///< Operation completed
    WOULD_BLOCK = 1,  ///< No capacity (send) or no data (receive); retry later
    FAILED = 2        ///< Hard error; errorMsg describes it
};

const char* ioStatusToString(IoStatus status);

/**
 * @class Connection
 * @brief One established transport connection
 */
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Queue one unreliable message
     * @param data Complete message bytes (moved into the transport)
     * @param errorMsg Set when FAILED is returned
     */
    virtual IoStatus sendDatagram(std::vector<uint8_t> data, std::string& errorMsg) = 0;

    /**
     * @brief Pop the next received unreliable message
     * @return false when none is pending
     */
    virtual bool recvDatagram(std::vector<uint8_t>& out) = 0;

    /**
     * @brief Write bytes to a stream, all or nothing
     * @param fin true if these are the final bytes of the stream
     */
    virtual IoStatus streamWrite(uint64_t streamId,
                                 const uint8_t* data,
                                 size_t size,
                                 bool fin,
                                 std::string& errorMsg) = 0;

    /**
     * @brief Read available bytes from a stream
     * @param bytesRead Number of bytes copied into buffer
     * @param fin Set once the final byte of the stream has been returned
     * @return WOULD_BLOCK when nothing is readable yet
     */
    virtual IoStatus streamRead(uint64_t streamId,
                                uint8_t* buffer,
                                size_t capacity,
                                size_t& bytesRead,
                                bool& fin,
                                std::string& errorMsg) = 0;

    /**
     * @brief Open a locally initiated bidirectional stream
     * @param urgency Scheduling hint, lower is more urgent
     */
    virtual bool openBidiStream(uint8_t urgency, uint64_t& streamId, std::string& errorMsg) = 0;

    /**
     * @brief Ask the transport to close the connection
     * @param graceful Drain queued data before closing
     */
    virtual void close(bool graceful, uint64_t errorCode, const std::string& reason) = 0;

    virtual bool isClosed() const = 0;

    /**
     * @brief Short identifier used to prefix log lines
     */
    virtual std::string traceId() const = 0;
};

/**
 * @class TransportHandler
 * @brief Receives connection events; every method defaults to a no-op
 */
class TransportHandler {
public:
    virtual ~TransportHandler() = default;

    virtual void onConnCreated(Connection& conn) { (void)conn; }
    virtual void onConnEstablished(Connection& conn) { (void)conn; }
    virtual void onConnClosed(Connection& conn) { (void)conn; }

    virtual void onStreamCreated(Connection& conn, uint64_t streamId) { (void)conn; (void)streamId; }
    virtual void onStreamReadable(Connection& conn, uint64_t streamId) { (void)conn; (void)streamId; }
    virtual void onStreamWritable(Connection& conn, uint64_t streamId) { (void)conn; (void)streamId; }
    virtual void onStreamClosed(Connection& conn, uint64_t streamId) { (void)conn; (void)streamId; }

    virtual void onDatagramReceived(Connection& conn) { (void)conn; }
    virtual void onDatagramAcked(Connection& conn) { (void)conn; }
    virtual void onDatagramDropped(Connection& conn) { (void)conn; }
    virtual void onDatagramExpired(Connection& conn) { (void)conn; }
    virtual void onDatagramLost(Connection& conn) { (void)conn; }

    /**
     * @brief Periodic tick from the transport's timer
     */
    virtual void onTimeout(Connection& conn) { (void)conn; }

    /**
     * @brief Earliest instant the handler wants a tick, if any
     */
    virtual std::optional<std::chrono::steady_clock::time_point> nextDeadline() const {
        return std::nullopt;
    }
};

}  // namespace PaceSend
