/**
 * @file SocketEndpoint.h
 * @brief POSIX transport: TCP/TLS control channel plus UDP datagrams
 */

#pragma once

#include "config.h"
#include "CongestionControl.h"
#include "ControlFrame.h"
#include "ProtocolLog.h"
#include "TransferOptions.h"
#include "Transport.h"
#include "TransportStream.h"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/socket.h>

namespace PaceSend {

/**
 * @brief Settings shared by client and server endpoints
 */
struct EndpointConfig {
    bool useTls = true;
    std::string certFile = DEFAULT_CERT_FILE;   ///< Server only
    std::string keyFile = DEFAULT_KEY_FILE;     ///< Server only
    uint64_t idleTimeoutUs = DEFAULT_IDLE_TIMEOUT_US;  ///< 0 disables
    size_t maxDatagramFrameSize = DEFAULT_MAX_DATAGRAM_FRAME_SIZE;
    uint64_t datagramSendTimeoutUs = DEFAULT_CLIENT_DATAGRAM_SEND_TIMEOUT_US;  ///< 0 disables expiry
    std::optional<CongestionControl> cca;
    ProtocolLog* protocolLog = nullptr;
};

/**
 * @brief Where datagrams for a connection go
 */
struct UdpTarget {
    int fd = -1;
    bool connected = false;   ///< Client: socket is connect()ed, use send()
    sockaddr_storage addr{};  ///< Server: peer address for sendto()
    socklen_t addrLen = 0;
};

/**
 * @class SocketConnection
 * @brief One established connection
 *
 * Only dispatchEvents() calls into the TransportHandler. Outcomes are queued
 * as events, so handler code that calls back into the connection never
 * re-enters the handler.
 *
 * Datagrams: sendDatagram() queues (bounded); process() hands them to the
 * UDP socket. Each queued datagram ends in exactly one of acked (handed to
 * the network), expired (queued longer than the send timeout), lost (socket
 * error) or dropped (connection closed first).
 *
 * Streams: streamWrite() is all-or-nothing into a bounded send buffer shared
 * by all frames. A stream that saw WOULD_BLOCK gets a writable event once the
 * buffer has room again.
 */
class SocketConnection final : public Connection {
public:
    using Clock = std::chrono::steady_clock;

    SocketConnection(bool isServer,
                     int tcpFd,
                     std::unique_ptr<TransportStream> stream,
                     UdpTarget udp,
                     uint64_t token,
                     const EndpointConfig& config);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    IoStatus sendDatagram(std::vector<uint8_t> data, std::string& errorMsg) override;
    bool recvDatagram(std::vector<uint8_t>& out) override;
    IoStatus streamWrite(uint64_t streamId, const uint8_t* data, size_t size, bool fin,
                         std::string& errorMsg) override;
    IoStatus streamRead(uint64_t streamId, uint8_t* buffer, size_t capacity, size_t& bytesRead,
                        bool& fin, std::string& errorMsg) override;
    bool openBidiStream(uint8_t urgency, uint64_t& streamId, std::string& errorMsg) override;
    void close(bool graceful, uint64_t errorCode, const std::string& reason) override;
    bool isClosed() const override { return m_state == State::CLOSED; }
    std::string traceId() const override { return m_traceId; }

    uint64_t token() const { return m_token; }
    int tcpFd() const { return m_tcpFd; }
    bool wantsTcpWrite() const;
    bool wantsUdpWrite() const { return !m_sendQueue.empty() && m_state != State::CLOSED; }

    /**
     * @brief Queue an inbound datagram (token already stripped)
     */
    void deliverDatagram(const uint8_t* data, size_t size);

    /**
     * @brief Drain the control socket and parse complete frames
     */
    void readControl();

    /**
     * @brief Flush queued output, run timers, advance a graceful close
     */
    void process(Clock::time_point now);

    /**
     * @brief Deliver queued events to the handler, in order
     *
     * Once the connection is closed and the queue is empty, reports
     * onConnClosed() exactly once. Events queued after that are discarded.
     */
    void dispatchEvents(TransportHandler& handler);

    bool hasPendingEvents() const { return !m_events.empty(); }
    bool closeReported() const { return m_closeReported; }

    std::optional<Clock::time_point> nextTimeout() const;

    uint64_t datagramsAcked() const { return m_datagramsAcked; }
    uint64_t datagramsExpired() const { return m_datagramsExpired; }
    uint64_t datagramsLost() const { return m_datagramsLost; }
    uint64_t datagramsDropped() const { return m_datagramsDropped; }
    uint64_t datagramsReceived() const { return m_datagramsReceived; }

private:
    enum class State : uint8_t {
        ESTABLISHED = 0,
        DRAINING = 1,  ///< Graceful close requested; flushing queued output
        CLOSED = 2
    };

    enum class EventType : uint8_t {
        STREAM_CREATED,
        STREAM_READABLE,
        STREAM_WRITABLE,
        STREAM_CLOSED,
        DATAGRAM_RECEIVED,
        DATAGRAM_ACKED,
        DATAGRAM_DROPPED,
        DATAGRAM_EXPIRED,
        DATAGRAM_LOST
    };

    struct Event {
        EventType type;
        uint64_t streamId;
    };

    struct QueuedDatagram {
        std::vector<uint8_t> bytes;  ///< Token prefix + message
        Clock::time_point queuedAt;
    };

    struct RecvStream {
        std::vector<uint8_t> data;
        size_t readOffset = 0;
        bool finReceived = false;
        bool finDelivered = false;
        bool readableQueued = false;
    };

    struct SendStream {
        bool finQueued = false;
        bool blocked = false;
    };

    void pushEvent(EventType type, uint64_t streamId = 0);
    void flushDatagrams(Clock::time_point now);
    bool flushControl();
    bool parseFrames();
    bool handleFrame(const FrameHeader& hdr, const uint8_t* payload);
    void queueFrame(FrameType type, uint64_t streamId, const uint8_t* payload, size_t size);
    void dropQueuedDatagrams();
    void finishClose(const std::string& why);
    void protocolEvent(const std::string& name, const nlohmann::json& data);
    size_t pendingControlBytes() const { return m_outBuf.size() - m_outOffset; }
    size_t maxDatagramSize() const;

    bool m_isServer;
    int m_tcpFd;
    std::unique_ptr<TransportStream> m_stream;
    UdpTarget m_udp;
    uint64_t m_token;
    std::string m_traceId;
    const EndpointConfig& m_config;

    State m_state;
    bool m_closeFrameQueued;
    bool m_closeReported;
    uint64_t m_closeCode;
    std::string m_closeReason;

    std::deque<QueuedDatagram> m_sendQueue;
    std::deque<std::vector<uint8_t>> m_recvQueue;
    bool m_datagramEventQueued;

    std::vector<uint8_t> m_outBuf;
    size_t m_outOffset;
    std::vector<uint8_t> m_inBuf;
    std::vector<uint8_t> m_readBuf;

    std::map<uint64_t, SendStream> m_sendStreams;
    std::map<uint64_t, RecvStream> m_recvStreams;
    uint64_t m_nextLocalStreamId;

    std::deque<Event> m_events;
    Clock::time_point m_lastActivity;

    uint64_t m_datagramsAcked;
    uint64_t m_datagramsExpired;
    uint64_t m_datagramsLost;
    uint64_t m_datagramsDropped;
    uint64_t m_datagramsReceived;
    uint64_t m_streamBytesSent;
    uint64_t m_streamBytesReceived;
};

/**
 * @class SocketEndpoint
 * @brief Owns the sockets and runs the single-threaded event loop
 *
 * Client: connect() performs TCP connect, optional TLS handshake and the
 * HELLO/HELLO_ACK exchange (blocking, bounded by HANDSHAKE_TIMEOUT_MS), then
 * reports created + established to the handler.
 *
 * Server: listen() binds TCP and UDP to the same port. One connection is
 * served at a time; further clients wait in the listen backlog.
 *
 * Each runOnce(): deliver pending events, tick the handler if its deadline
 * passed, flush output, poll, read UDP before TCP, accept, then repeat the
 * first steps.
 */
class SocketEndpoint {
public:
    SocketEndpoint(EndpointConfig config, TransportHandler& handler, bool isServer);
    ~SocketEndpoint();

    SocketEndpoint(const SocketEndpoint&) = delete;
    SocketEndpoint& operator=(const SocketEndpoint&) = delete;

    bool listen(const SocketAddress& address, std::string& errorMsg);
    bool connect(const SocketAddress& address, std::string& errorMsg);

    /**
     * @brief One loop iteration
     * @param maxWaitMs Upper bound on the poll wait
     * @return false on a fatal endpoint error (errorMsg set)
     */
    bool runOnce(int maxWaitMs, std::string& errorMsg);

    /**
     * @brief Abort the active connection, if any, and report it closed
     */
    void shutdown();

    uint16_t localPort() const { return m_localPort; }
    bool hasActiveConnection() const { return m_conn != nullptr; }
    SocketConnection* connection() { return m_conn.get(); }
    uint64_t connectionsServed() const { return m_connectionsServed; }

private:
    void serviceConnection();
    void readUdp();
    void acceptConnection();
    bool completeServerHandshake(int fd, const sockaddr_storage& peer, socklen_t peerLen,
                                 std::string& errorMsg);
    void adoptConnection(std::unique_ptr<SocketConnection> conn);
    void closeSocket(int& fd);

    EndpointConfig m_config;
    TransportHandler& m_handler;
    bool m_isServer;

    int m_listenFd;
    int m_udpFd;
    uint16_t m_localPort;

    std::unique_ptr<SocketConnection> m_conn;
    std::vector<uint8_t> m_udpBuf;
    uint64_t m_connectionsServed;
    uint64_t m_unknownTokenDrops;
};

}  // namespace PaceSend
