/**
 * @file SocketEndpoint.cpp
 * @brief POSIX socket transport: connection state machine and event loop
 */

#include "pacesend/SocketEndpoint.h"
#include "pacesend/ByteOrder.h"
#include "pacesend/CertificateManager.h"
#include "pacesend/Debug.h"
#include "pacesend/ErrorCodes.h"
#include "pacesend/TlsSocket.h"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

namespace PaceSend {

namespace {

/// Close code sent when the peer violates the framing
constexpr uint64_t PROTOCOL_ERROR_CODE = 0x0A;

/// Upper bound on datagrams read per readiness event
constexpr size_t MAX_DATAGRAMS_PER_READ = 4096;

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

/**
 * @brief Closes a descriptor unless released
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : m_fd(fd) {}
    ~SocketGuard() {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return m_fd; }
    int release() {
        const int fd = m_fd;
        m_fd = -1;
        return fd;
    }

private:
    int m_fd;
};

void tuneSocketBuffers(int socket) {
    const int buf = SOCKET_BUFFER_SIZE;
    (void)setsockopt(socket, SOL_SOCKET, SO_SNDBUF, &buf, sizeof(buf));
    (void)setsockopt(socket, SOL_SOCKET, SO_RCVBUF, &buf, sizeof(buf));
}

void setHandshakeTimeouts(int socket) {
    timeval tv{};
    tv.tv_sec = HANDSHAKE_TIMEOUT_MS / 1000;
    tv.tv_usec = (HANDSHAKE_TIMEOUT_MS % 1000) * 1000;
    (void)setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool setNonBlocking(int socket, std::string& errorMsg) {
    const int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0 || fcntl(socket, F_SETFL, flags | O_NONBLOCK) < 0) {
        errorMsg = errnoMessage("fcntl(O_NONBLOCK) failed");
        return false;
    }
    return true;
}

void configureControlSocket(int socket, const std::optional<CongestionControl>& cca) {
    const int one = 1;
    (void)setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    if (cca) {
        const char* name = congestionControlKernelName(*cca);
        if (setsockopt(socket, IPPROTO_TCP, TCP_CONGESTION, name, std::strlen(name)) != 0) {
            LOG_WARNING("Congestion control '" << name << "' not available on this host ("
                        << std::strerror(errno) << "), keeping the kernel default");
        } else {
            LOG_DEBUG("Control channel congestion control: " << name);
        }
    }
}

bool resolveAddress(const SocketAddress& address,
                    int socketType,
                    bool passive,
                    sockaddr_storage& out,
                    socklen_t& outLen,
                    std::string& errorMsg) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socketType;
    hints.ai_flags = passive ? AI_PASSIVE : 0;

    const std::string port = std::to_string(address.port);
    addrinfo* result = nullptr;
    const int rc = getaddrinfo(address.host.empty() ? nullptr : address.host.c_str(),
                               port.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_CONNECT_FAILED) + ": cannot resolve " +
                   address.toString() + ": " + gai_strerror(rc);
        return false;
    }

    std::memcpy(&out, result->ai_addr, result->ai_addrlen);
    outLen = static_cast<socklen_t>(result->ai_addrlen);
    freeaddrinfo(result);
    return true;
}

uint16_t localPortOf(int socket) {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

void setPort(sockaddr_storage& addr, uint16_t port) {
    if (addr.ss_family == AF_INET6) {
        reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port = htons(port);
    } else {
        reinterpret_cast<sockaddr_in*>(&addr)->sin_port = htons(port);
    }
}

std::string describeAddress(const sockaddr_storage& addr, socklen_t len) {
    char host[NI_MAXHOST] = {};
    char serv[NI_MAXSERV] = {};
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&addr), len, host, sizeof(host),
                    serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "<unknown>";
    }
    if (addr.ss_family == AF_INET6) {
        return "[" + std::string(host) + "]:" + serv;
    }
    return std::string(host) + ":" + serv;
}

bool generateToken(uint64_t& token, std::string& errorMsg) {
    std::array<uint8_t, 8> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        errorMsg = "RAND_bytes failed: " + TlsSocket::getLastError();
        return false;
    }
    token = loadLe64(bytes.data());
    return true;
}

bool readFrame(TransportStream& stream,
               FrameType expected,
               std::vector<uint8_t>& payload,
               std::string& errorMsg) {
    std::array<uint8_t, FRAME_HEADER_SIZE> headerBytes{};
    if (!stream.recvExact(headerBytes.data(), headerBytes.size(), errorMsg)) {
        return false;
    }

    FrameHeader header;
    if (!FrameHeader::decode(headerBytes.data(), headerBytes.size(), header, errorMsg)) {
        return false;
    }
    if (header.type != expected) {
        errorMsg = std::string("expected ") + frameTypeToString(expected) + " frame, got " +
                   frameTypeToString(header.type);
        return false;
    }

    payload.assign(header.length, 0);
    return header.length == 0 || stream.recvExact(payload.data(), payload.size(), errorMsg);
}

}  // anonymous namespace

//=============================================================================
// SocketConnection: Constructor / Destructor
//=============================================================================

SocketConnection::SocketConnection(bool isServer,
                                   int tcpFd,
                                   std::unique_ptr<TransportStream> stream,
                                   UdpTarget udp,
                                   uint64_t token,
                                   const EndpointConfig& config)
    : m_isServer(isServer)
    , m_tcpFd(tcpFd)
    , m_stream(std::move(stream))
    , m_udp(udp)
    , m_token(token)
    , m_traceId(toHex64(token))
    , m_config(config)
    , m_state(State::ESTABLISHED)
    , m_closeFrameQueued(false)
    , m_closeReported(false)
    , m_closeCode(0)
    , m_datagramEventQueued(false)
    , m_outOffset(0)
    , m_readBuf(MAX_BUF_SIZE)
    , m_nextLocalStreamId(isServer ? 1 : 0)
    , m_lastActivity(Clock::now())
    , m_datagramsAcked(0)
    , m_datagramsExpired(0)
    , m_datagramsLost(0)
    , m_datagramsDropped(0)
    , m_datagramsReceived(0)
    , m_streamBytesSent(0)
    , m_streamBytesReceived(0)
{
    protocolEvent("connection_started", {
        {"role", m_isServer ? "server" : "client"},
        {"control", m_stream->describe()},
        {"max_datagram_size", maxDatagramSize()}
    });
}

SocketConnection::~SocketConnection() {
    if (m_stream) {
        if (m_state != State::CLOSED) {
            m_stream->shutdown();
        }
        m_stream.reset();
    }
    if (m_tcpFd >= 0) {
        ::close(m_tcpFd);
        m_tcpFd = -1;
    }
}

//=============================================================================
// SocketConnection: Datagrams
//=============================================================================

size_t SocketConnection::maxDatagramSize() const {
    return std::min(m_config.maxDatagramFrameSize, MAX_UDP_PAYLOAD - DATAGRAM_TOKEN_SIZE);
}

IoStatus SocketConnection::sendDatagram(std::vector<uint8_t> data, std::string& errorMsg) {
    if (m_state != State::ESTABLISHED) {
        errorMsg = "connection is closing";
        return IoStatus::FAILED;
    }
    if (data.size() > maxDatagramSize()) {
        errorMsg = "datagram of " + std::to_string(data.size()) + " bytes exceeds the limit of " +
                   std::to_string(maxDatagramSize());
        return IoStatus::FAILED;
    }
    if (m_sendQueue.size() >= DATAGRAM_SEND_QUEUE_CAPACITY) {
        return IoStatus::WOULD_BLOCK;
    }

    QueuedDatagram queued;
    queued.bytes.resize(DATAGRAM_TOKEN_SIZE + data.size());
    storeLe64(queued.bytes.data(), m_token);
    std::copy(data.begin(), data.end(), queued.bytes.begin() + DATAGRAM_TOKEN_SIZE);
    queued.queuedAt = Clock::now();
    m_sendQueue.push_back(std::move(queued));
    return IoStatus::OK;
}

bool SocketConnection::recvDatagram(std::vector<uint8_t>& out) {
    if (m_recvQueue.empty()) {
        return false;
    }
    out = std::move(m_recvQueue.front());
    m_recvQueue.pop_front();
    return true;
}

void SocketConnection::deliverDatagram(const uint8_t* data, size_t size) {
    if (m_closeReported) {
        return;
    }

    if (m_recvQueue.size() >= DATAGRAM_RECV_QUEUE_CAPACITY) {
        LOG_DEBUG("[" << m_traceId << "] receive queue full, discarding oldest datagram");
        m_recvQueue.pop_front();
    }
    m_recvQueue.emplace_back(data, data + size);
    ++m_datagramsReceived;
    m_lastActivity = Clock::now();

    protocolEvent("datagram_received", {{"length", size}});

    if (!m_datagramEventQueued) {
        m_datagramEventQueued = true;
        pushEvent(EventType::DATAGRAM_RECEIVED);
    }
}

void SocketConnection::flushDatagrams(Clock::time_point now) {
    const auto sendTimeout = std::chrono::microseconds(m_config.datagramSendTimeoutUs);

    while (!m_sendQueue.empty()) {
        QueuedDatagram& front = m_sendQueue.front();
        const size_t length = front.bytes.size() - DATAGRAM_TOKEN_SIZE;

        if (sendTimeout.count() > 0 && now - front.queuedAt > sendTimeout) {
            ++m_datagramsExpired;
            protocolEvent("datagram_expired", {{"length", length}});
            pushEvent(EventType::DATAGRAM_EXPIRED);
            m_sendQueue.pop_front();
            continue;
        }

        ssize_t sent;
        if (m_udp.connected) {
            sent = ::send(m_udp.fd, front.bytes.data(), front.bytes.size(), MSG_DONTWAIT);
        } else {
            sent = ::sendto(m_udp.fd, front.bytes.data(), front.bytes.size(), MSG_DONTWAIT,
                            reinterpret_cast<const sockaddr*>(&m_udp.addr), m_udp.addrLen);
        }

        if (sent >= 0) {
            ++m_datagramsAcked;
            m_lastActivity = now;
            protocolEvent("datagram_sent", {{"length", length}});
            pushEvent(EventType::DATAGRAM_ACKED);
            m_sendQueue.pop_front();
            continue;
        }

        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS) {
            break;
        }

        const std::string error = std::strerror(errno);
        LOG_DEBUG("[" << m_traceId << "] datagram send failed: " << error);
        ++m_datagramsLost;
        protocolEvent("datagram_lost", {{"length", length}, {"error", error}});
        pushEvent(EventType::DATAGRAM_LOST);
        m_sendQueue.pop_front();
    }
}

void SocketConnection::dropQueuedDatagrams() {
    for (const QueuedDatagram& queued : m_sendQueue) {
        ++m_datagramsDropped;
        protocolEvent("datagram_dropped", {{"length", queued.bytes.size() - DATAGRAM_TOKEN_SIZE}});
        pushEvent(EventType::DATAGRAM_DROPPED);
    }
    m_sendQueue.clear();
}

//=============================================================================
// SocketConnection: Streams
//=============================================================================

bool SocketConnection::openBidiStream(uint8_t urgency, uint64_t& streamId, std::string& errorMsg) {
    if (m_state != State::ESTABLISHED) {
        errorMsg = "connection is closing";
        return false;
    }

    streamId = m_nextLocalStreamId;
    m_nextLocalStreamId += 4;
    m_sendStreams[streamId] = SendStream{};
    m_recvStreams[streamId] = RecvStream{};

    LOG_DEBUG("[" << m_traceId << "] opened stream " << streamId
              << " (urgency " << static_cast<int>(urgency) << ")");
    return true;
}

IoStatus SocketConnection::streamWrite(uint64_t streamId,
                                       const uint8_t* data,
                                       size_t size,
                                       bool fin,
                                       std::string& errorMsg) {
    if (m_state != State::ESTABLISHED) {
        errorMsg = "connection is closing";
        return IoStatus::FAILED;
    }

    auto it = m_sendStreams.find(streamId);
    if (it == m_sendStreams.end()) {
        // Peer-initiated streams are bidirectional too
        if (m_recvStreams.count(streamId) == 0) {
            errorMsg = "unknown stream " + std::to_string(streamId);
            return IoStatus::FAILED;
        }
        it = m_sendStreams.emplace(streamId, SendStream{}).first;
    }

    SendStream& stream = it->second;
    if (stream.finQueued) {
        errorMsg = "stream " + std::to_string(streamId) + " already finished";
        return IoStatus::FAILED;
    }
    if (size == 0 && !fin) {
        return IoStatus::OK;
    }

    const size_t pending = pendingControlBytes();
    if (pending > 0 && pending + size > STREAM_SEND_BUFFER_LIMIT) {
        stream.blocked = true;
        return IoStatus::WOULD_BLOCK;
    }

    size_t offset = 0;
    do {
        const size_t piece = std::min(size - offset, MAX_FRAME_PAYLOAD);
        const bool lastPiece = (offset + piece == size);
        const FrameType type = (lastPiece && fin) ? FrameType::STREAM_FIN : FrameType::STREAM;
        queueFrame(type, streamId, data + offset, piece);
        offset += piece;
    } while (offset < size);

    stream.finQueued = fin;
    m_streamBytesSent += size;
    protocolEvent("stream_data_sent", {{"stream_id", streamId}, {"length", size}, {"fin", fin}});
    return IoStatus::OK;
}

IoStatus SocketConnection::streamRead(uint64_t streamId,
                                      uint8_t* buffer,
                                      size_t capacity,
                                      size_t& bytesRead,
                                      bool& fin,
                                      std::string& errorMsg) {
    bytesRead = 0;
    fin = false;

    auto it = m_recvStreams.find(streamId);
    if (it == m_recvStreams.end()) {
        errorMsg = "unknown stream " + std::to_string(streamId);
        return IoStatus::FAILED;
    }

    RecvStream& stream = it->second;
    if (stream.finDelivered) {
        fin = true;
        return IoStatus::OK;
    }

    const size_t available = stream.data.size() - stream.readOffset;
    if (available == 0) {
        if (stream.finReceived) {
            stream.finDelivered = true;
            fin = true;
            pushEvent(EventType::STREAM_CLOSED, streamId);
            return IoStatus::OK;
        }
        if (m_state == State::CLOSED) {
            errorMsg = "connection closed before stream " + std::to_string(streamId) + " finished";
            return IoStatus::FAILED;
        }
        return IoStatus::WOULD_BLOCK;
    }

    const size_t n = std::min(capacity, available);
    std::memcpy(buffer, stream.data.data() + stream.readOffset, n);
    stream.readOffset += n;
    bytesRead = n;

    if (stream.readOffset == stream.data.size()) {
        stream.data.clear();
        stream.readOffset = 0;
        if (stream.finReceived) {
            stream.finDelivered = true;
            fin = true;
            pushEvent(EventType::STREAM_CLOSED, streamId);
        }
    } else if (stream.readOffset >= MAX_FRAME_PAYLOAD) {
        stream.data.erase(stream.data.begin(),
                          stream.data.begin() + static_cast<std::ptrdiff_t>(stream.readOffset));
        stream.readOffset = 0;
    }

    return IoStatus::OK;
}

//=============================================================================
// SocketConnection: Control Channel
//=============================================================================

bool SocketConnection::wantsTcpWrite() const {
    return m_state != State::CLOSED && pendingControlBytes() > 0;
}

void SocketConnection::queueFrame(FrameType type, uint64_t streamId, const uint8_t* payload, size_t size) {
    appendFrame(m_outBuf, type, streamId, payload, size);
}

bool SocketConnection::flushControl() {
    while (m_outOffset < m_outBuf.size()) {
        size_t written = 0;
        std::string errorMsg;
        const IoStatus status = m_stream->writeSome(m_outBuf.data() + m_outOffset,
                                                    m_outBuf.size() - m_outOffset,
                                                    written, errorMsg);
        if (status == IoStatus::WOULD_BLOCK || (status == IoStatus::OK && written == 0)) {
            break;
        }
        if (status == IoStatus::FAILED) {
            LOG_WARNING("[" << m_traceId << "] control channel write failed: " << errorMsg);
            return false;
        }
        m_outOffset += written;
        m_lastActivity = Clock::now();
    }

    if (m_outOffset == m_outBuf.size()) {
        m_outBuf.clear();
        m_outOffset = 0;
    } else if (m_outOffset >= STREAM_SEND_BUFFER_LIMIT) {
        m_outBuf.erase(m_outBuf.begin(), m_outBuf.begin() + static_cast<std::ptrdiff_t>(m_outOffset));
        m_outOffset = 0;
    }
    return true;
}

void SocketConnection::readControl() {
    if (m_state == State::CLOSED) {
        return;
    }

    bool sawEof = false;
    for (;;) {
        size_t bytesRead = 0;
        bool eof = false;
        std::string errorMsg;
        const IoStatus status = m_stream->readSome(m_readBuf.data(), m_readBuf.size(),
                                                   bytesRead, eof, errorMsg);
        if (status == IoStatus::WOULD_BLOCK) {
            break;
        }
        if (status == IoStatus::FAILED) {
            if (parseFrames()) {
                finishClose("control channel read failed: " + errorMsg);
            }
            return;
        }
        if (bytesRead > 0) {
            m_inBuf.insert(m_inBuf.end(), m_readBuf.begin(),
                           m_readBuf.begin() + static_cast<std::ptrdiff_t>(bytesRead));
            m_lastActivity = Clock::now();
        }
        if (eof) {
            sawEof = true;
            break;
        }
    }

    if (!parseFrames()) {
        return;
    }
    if (sawEof) {
        finishClose("peer closed the control channel");
    }
}

bool SocketConnection::parseFrames() {
    size_t offset = 0;
    bool open = true;

    while (open && m_inBuf.size() - offset >= FRAME_HEADER_SIZE) {
        FrameHeader header;
        std::string errorMsg;
        if (!FrameHeader::decode(m_inBuf.data() + offset, m_inBuf.size() - offset, header, errorMsg)) {
            LOG_WARNING("[" << m_traceId << "] protocol error: " << errorMsg);
            m_inBuf.clear();
            close(false, PROTOCOL_ERROR_CODE, "protocol error");
            return false;
        }
        if (m_inBuf.size() - offset < FRAME_HEADER_SIZE + header.length) {
            break;
        }

        const uint8_t* payload = m_inBuf.data() + offset + FRAME_HEADER_SIZE;
        offset += FRAME_HEADER_SIZE + header.length;
        open = handleFrame(header, payload);
    }

    if (!m_inBuf.empty()) {
        m_inBuf.erase(m_inBuf.begin(), m_inBuf.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return open;
}

bool SocketConnection::handleFrame(const FrameHeader& header, const uint8_t* payload) {
    switch (header.type) {
        case FrameType::STREAM:
        case FrameType::STREAM_FIN: {
            auto it = m_recvStreams.find(header.streamId);
            if (it == m_recvStreams.end()) {
                it = m_recvStreams.emplace(header.streamId, RecvStream{}).first;
                pushEvent(EventType::STREAM_CREATED, header.streamId);
            }

            RecvStream& stream = it->second;
            if (stream.finReceived) {
                LOG_WARNING("[" << m_traceId << "] data after FIN on stream " << header.streamId);
                close(false, PROTOCOL_ERROR_CODE, "data after fin");
                return false;
            }

            stream.data.insert(stream.data.end(), payload, payload + header.length);
            const bool fin = (header.type == FrameType::STREAM_FIN);
            if (fin) {
                stream.finReceived = true;
            }
            m_streamBytesReceived += header.length;
            protocolEvent("stream_data_received", {
                {"stream_id", header.streamId}, {"length", header.length}, {"fin", fin}
            });

            if (!stream.readableQueued) {
                stream.readableQueued = true;
                pushEvent(EventType::STREAM_READABLE, header.streamId);
            }
            return true;
        }

        case FrameType::CLOSE: {
            ClosePayload info;
            if (!ClosePayload::decode(payload, header.length, info)) {
                info.reason = "<malformed close>";
            }
            m_closeCode = info.code;
            m_closeReason = info.reason;
            finishClose("closed by peer, code " + std::to_string(info.code) + ": " + info.reason);
            return false;
        }

        default:
            LOG_WARNING("[" << m_traceId << "] unexpected " << frameTypeToString(header.type)
                        << " frame after handshake");
            close(false, PROTOCOL_ERROR_CODE, "unexpected frame");
            return false;
    }
}

//=============================================================================
// SocketConnection: Lifecycle
//=============================================================================

void SocketConnection::close(bool graceful, uint64_t errorCode, const std::string& reason) {
    if (m_state == State::CLOSED) {
        return;
    }

    m_closeCode = errorCode;
    m_closeReason = reason;

    if (graceful) {
        if (m_state == State::ESTABLISHED) {
            LOG_DEBUG("[" << m_traceId << "] draining before close (" << reason << ")");
            m_state = State::DRAINING;
        }
        return;
    }

    dropQueuedDatagrams();
    m_outBuf.clear();
    m_outOffset = 0;

    const std::vector<uint8_t> payload = ClosePayload{errorCode, reason}.encode();
    queueFrame(FrameType::CLOSE, 0, payload.data(), payload.size());
    m_closeFrameQueued = true;
    if (!flushControl()) {
        LOG_DEBUG("[" << m_traceId << "] CLOSE frame not delivered");
    }

    finishClose("closed locally, code " + std::to_string(errorCode) + ": " + reason);
}

void SocketConnection::finishClose(const std::string& why) {
    if (m_state == State::CLOSED) {
        return;
    }

    dropQueuedDatagrams();
    m_state = State::CLOSED;

    if (m_stream) {
        m_stream->shutdown();
    }
    if (m_tcpFd >= 0) {
        (void)::shutdown(m_tcpFd, SHUT_RDWR);
    }

    LOG_INFO("[" << m_traceId << "] Connection closed (" << why << "); datagrams sent="
             << m_datagramsAcked << " expired=" << m_datagramsExpired
             << " lost=" << m_datagramsLost << " dropped=" << m_datagramsDropped
             << " received=" << m_datagramsReceived
             << "; stream bytes sent=" << m_streamBytesSent
             << " received=" << m_streamBytesReceived);

    protocolEvent("connection_closed", {
        {"code", m_closeCode},
        {"reason", m_closeReason},
        {"datagrams_sent", m_datagramsAcked},
        {"datagrams_received", m_datagramsReceived}
    });
}

void SocketConnection::process(Clock::time_point now) {
    if (m_state == State::CLOSED) {
        return;
    }

    if (m_config.idleTimeoutUs > 0 &&
        now - m_lastActivity >= std::chrono::microseconds(m_config.idleTimeoutUs)) {
        LOG_INFO("[" << m_traceId << "] idle timeout");
        close(false, 0, "idle timeout");
        return;
    }

    flushDatagrams(now);
    if (!flushControl()) {
        finishClose("control channel write failed");
        return;
    }

    if (m_state == State::DRAINING) {
        if (!m_closeFrameQueued && m_sendQueue.empty() && pendingControlBytes() == 0) {
            const std::vector<uint8_t> payload = ClosePayload{m_closeCode, m_closeReason}.encode();
            queueFrame(FrameType::CLOSE, 0, payload.data(), payload.size());
            m_closeFrameQueued = true;
            if (!flushControl()) {
                finishClose("control channel write failed");
                return;
            }
        }
        if (m_closeFrameQueued && pendingControlBytes() == 0) {
            finishClose("closed locally, code " + std::to_string(m_closeCode) + ": " + m_closeReason);
            return;
        }
    }

    if (pendingControlBytes() < STREAM_SEND_BUFFER_LIMIT) {
        for (auto& entry : m_sendStreams) {
            if (entry.second.blocked) {
                entry.second.blocked = false;
                pushEvent(EventType::STREAM_WRITABLE, entry.first);
            }
        }
    }
}

std::optional<SocketConnection::Clock::time_point> SocketConnection::nextTimeout() const {
    if (m_state == State::CLOSED) {
        return std::nullopt;
    }

    std::optional<Clock::time_point> earliest;
    if (m_config.idleTimeoutUs > 0) {
        earliest = m_lastActivity + std::chrono::microseconds(m_config.idleTimeoutUs);
    }
    if (!m_sendQueue.empty() && m_config.datagramSendTimeoutUs > 0) {
        const Clock::time_point expiry =
            m_sendQueue.front().queuedAt + std::chrono::microseconds(m_config.datagramSendTimeoutUs);
        if (!earliest || expiry < *earliest) {
            earliest = expiry;
        }
    }
    return earliest;
}

//=============================================================================
// SocketConnection: Event Dispatch
//=============================================================================

void SocketConnection::pushEvent(EventType type, uint64_t streamId) {
    m_events.push_back(Event{type, streamId});
}

void SocketConnection::dispatchEvents(TransportHandler& handler) {
    while (!m_events.empty()) {
        const Event event = m_events.front();
        m_events.pop_front();

        if (m_closeReported) {
            continue;
        }

        switch (event.type) {
            case EventType::STREAM_CREATED:
                handler.onStreamCreated(*this, event.streamId);
                break;
            case EventType::STREAM_READABLE: {
                auto it = m_recvStreams.find(event.streamId);
                if (it != m_recvStreams.end()) {
                    it->second.readableQueued = false;
                }
                handler.onStreamReadable(*this, event.streamId);
                break;
            }
            case EventType::STREAM_WRITABLE:
                handler.onStreamWritable(*this, event.streamId);
                break;
            case EventType::STREAM_CLOSED:
                handler.onStreamClosed(*this, event.streamId);
                break;
            case EventType::DATAGRAM_RECEIVED:
                m_datagramEventQueued = false;
                handler.onDatagramReceived(*this);
                break;
            case EventType::DATAGRAM_ACKED:
                handler.onDatagramAcked(*this);
                break;
            case EventType::DATAGRAM_DROPPED:
                handler.onDatagramDropped(*this);
                break;
            case EventType::DATAGRAM_EXPIRED:
                handler.onDatagramExpired(*this);
                break;
            case EventType::DATAGRAM_LOST:
                handler.onDatagramLost(*this);
                break;
        }
    }

    if (m_state == State::CLOSED && !m_closeReported) {
        m_closeReported = true;
        handler.onConnClosed(*this);
        m_events.clear();
    }
}

void SocketConnection::protocolEvent(const std::string& name, const nlohmann::json& data) {
    if (m_config.protocolLog && m_config.protocolLog->isEnabled()) {
        m_config.protocolLog->event("transport", name, m_traceId, data);
    }
}

//=============================================================================
// SocketEndpoint: Constructor / Destructor
//=============================================================================

SocketEndpoint::SocketEndpoint(EndpointConfig config, TransportHandler& handler, bool isServer)
    : m_config(std::move(config))
    , m_handler(handler)
    , m_isServer(isServer)
    , m_listenFd(-1)
    , m_udpFd(-1)
    , m_localPort(0)
    , m_udpBuf(MAX_UDP_PAYLOAD + 1)
    , m_connectionsServed(0)
    , m_unknownTokenDrops(0)
{
    // OpenSSL writes through the socket BIO without MSG_NOSIGNAL
    std::signal(SIGPIPE, SIG_IGN);
}

SocketEndpoint::~SocketEndpoint() {
    m_conn.reset();
    closeSocket(m_listenFd);
    closeSocket(m_udpFd);
}

void SocketEndpoint::closeSocket(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

//=============================================================================
// SocketEndpoint: Server Setup
//=============================================================================

bool SocketEndpoint::listen(const SocketAddress& address, std::string& errorMsg) {
    if (!m_isServer) {
        errorMsg = "listen() called on a client endpoint";
        return false;
    }

    if (m_config.useTls &&
        !CertificateManager::ensureCertificateExists(m_config.certFile, m_config.keyFile, errorMsg)) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_TLS_ERROR) + ": " + errorMsg;
        return false;
    }

    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!resolveAddress(address, SOCK_STREAM, true, addr, addrLen, errorMsg)) {
        return false;
    }

    SocketGuard tcp(::socket(addr.ss_family, SOCK_STREAM, IPPROTO_TCP));
    if (tcp.get() < 0) {
        errorMsg = errnoMessage("socket(SOCK_STREAM) failed");
        return false;
    }

    const int one = 1;
    if (setsockopt(tcp.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) != 0) {
        errorMsg = errnoMessage("SO_REUSEADDR failed");
        return false;
    }
    if (::bind(tcp.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        errorMsg = errnoMessage("bind(" + address.toString() + ") failed");
        return false;
    }
    if (::listen(tcp.get(), LISTEN_BACKLOG) != 0) {
        errorMsg = errnoMessage("listen() failed");
        return false;
    }

    // Port 0 resolves to an ephemeral port; UDP binds the same one
    const uint16_t port = localPortOf(tcp.get());
    setPort(addr, port);

    SocketGuard udp(::socket(addr.ss_family, SOCK_DGRAM, IPPROTO_UDP));
    if (udp.get() < 0) {
        errorMsg = errnoMessage("socket(SOCK_DGRAM) failed");
        return false;
    }
    tuneSocketBuffers(udp.get());
    if (::bind(udp.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        errorMsg = errnoMessage("UDP bind to port " + std::to_string(port) + " failed");
        return false;
    }

    if (!setNonBlocking(tcp.get(), errorMsg) || !setNonBlocking(udp.get(), errorMsg)) {
        return false;
    }

    m_listenFd = tcp.release();
    m_udpFd = udp.release();
    m_localPort = port;

    LOG_INFO("Listening on " << address.host << ":" << port << " (tcp+udp, "
             << (m_config.useTls ? "tls" : "plain") << " control channel)");
    return true;
}

void SocketEndpoint::acceptConnection() {
    sockaddr_storage peer{};
    socklen_t peerLen = sizeof(peer);
    const int fd = ::accept(m_listenFd, reinterpret_cast<sockaddr*>(&peer), &peerLen);
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_WARNING("accept() failed: " << std::strerror(errno));
        }
        return;
    }

    std::string errorMsg;
    if (!completeServerHandshake(fd, peer, peerLen, errorMsg)) {
        LOG_WARNING("Handshake with " << describeAddress(peer, peerLen) << " failed: " << errorMsg);
    }
}

bool SocketEndpoint::completeServerHandshake(int fd,
                                             const sockaddr_storage& peer,
                                             socklen_t peerLen,
                                             std::string& errorMsg) {
    SocketGuard tcp(fd);
    setHandshakeTimeouts(fd);
    configureControlSocket(fd, m_config.cca);

    std::unique_ptr<TransportStream> stream;
    if (m_config.useTls) {
        auto tls = std::make_unique<TlsSocket>(fd, TlsRole::SERVER);
        tls->setServerCertificate(m_config.certFile, m_config.keyFile);
        if (!tls->handshake(errorMsg)) {
            errorMsg = std::string(ErrorCodes::TRANSPORT_TLS_ERROR) + ": " + errorMsg;
            return false;
        }
        stream = std::make_unique<TlsTransportStream>(std::move(tls));
    } else {
        stream = std::make_unique<PlainSocketStream>(fd);
    }

    std::vector<uint8_t> payload;
    HelloPayload hello;
    if (!readFrame(*stream, FrameType::HELLO, payload, errorMsg) ||
        !HelloPayload::decode(payload.data(), payload.size(), hello)) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_HANDSHAKE_FAILED) + ": invalid HELLO" +
                   (errorMsg.empty() ? std::string() : ": " + errorMsg);
        return false;
    }

    std::array<uint8_t, 8> ack{};
    storeLe64(ack.data(), hello.token);
    std::vector<uint8_t> frame;
    appendFrame(frame, FrameType::HELLO_ACK, 0, ack.data(), ack.size());
    if (!stream->sendExact(frame.data(), frame.size(), errorMsg)) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_HANDSHAKE_FAILED) + ": " + errorMsg;
        return false;
    }

    if (!setNonBlocking(fd, errorMsg)) {
        return false;
    }

    UdpTarget target;
    target.fd = m_udpFd;
    target.connected = false;
    target.addr = peer;
    target.addrLen = peerLen;
    setPort(target.addr, hello.udpPort);

    const std::string control = stream->describe();
    auto conn = std::make_unique<SocketConnection>(true, tcp.release(), std::move(stream), target,
                                                   hello.token, m_config);
    LOG_INFO("[" << conn->traceId() << "] Accepted " << describeAddress(peer, peerLen)
             << " (control " << control << ", datagrams to "
             << describeAddress(target.addr, target.addrLen) << ")");
    adoptConnection(std::move(conn));
    return true;
}

//=============================================================================
// SocketEndpoint: Client Setup
//=============================================================================

bool SocketEndpoint::connect(const SocketAddress& address, std::string& errorMsg) {
    if (m_isServer) {
        errorMsg = "connect() called on a server endpoint";
        return false;
    }
    if (m_conn) {
        errorMsg = "endpoint already has a connection";
        return false;
    }

    sockaddr_storage addr{};
    socklen_t addrLen = 0;
    if (!resolveAddress(address, SOCK_STREAM, false, addr, addrLen, errorMsg)) {
        return false;
    }

    SocketGuard tcp(::socket(addr.ss_family, SOCK_STREAM, IPPROTO_TCP));
    if (tcp.get() < 0) {
        errorMsg = errnoMessage("socket(SOCK_STREAM) failed");
        return false;
    }
    setHandshakeTimeouts(tcp.get());
    configureControlSocket(tcp.get(), m_config.cca);

    if (::connect(tcp.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_CONNECT_FAILED) + ": " +
                   errnoMessage("connect to " + address.toString() + " failed");
        return false;
    }

    SocketGuard udp(::socket(addr.ss_family, SOCK_DGRAM, IPPROTO_UDP));
    if (udp.get() < 0) {
        errorMsg = errnoMessage("socket(SOCK_DGRAM) failed");
        return false;
    }
    tuneSocketBuffers(udp.get());
    if (::connect(udp.get(), reinterpret_cast<const sockaddr*>(&addr), addrLen) != 0) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_CONNECT_FAILED) + ": " +
                   errnoMessage("UDP connect to " + address.toString() + " failed");
        return false;
    }
    const uint16_t udpPort = localPortOf(udp.get());

    std::unique_ptr<TransportStream> stream;
    if (m_config.useTls) {
        auto tls = std::make_unique<TlsSocket>(tcp.get(), TlsRole::CLIENT);
        if (!tls->handshake(errorMsg)) {
            errorMsg = std::string(ErrorCodes::TRANSPORT_TLS_ERROR) + ": " + errorMsg;
            return false;
        }
        stream = std::make_unique<TlsTransportStream>(std::move(tls));
    } else {
        stream = std::make_unique<PlainSocketStream>(tcp.get());
    }

    uint64_t token = 0;
    if (!generateToken(token, errorMsg)) {
        return false;
    }

    const std::vector<uint8_t> hello = HelloPayload{token, udpPort}.encode();
    std::vector<uint8_t> frame;
    appendFrame(frame, FrameType::HELLO, 0, hello.data(), hello.size());
    if (!stream->sendExact(frame.data(), frame.size(), errorMsg)) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_HANDSHAKE_FAILED) + ": " + errorMsg;
        return false;
    }

    std::vector<uint8_t> ack;
    if (!readFrame(*stream, FrameType::HELLO_ACK, ack, errorMsg)) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_HANDSHAKE_FAILED) + ": " + errorMsg;
        return false;
    }
    if (ack.size() != 8 || loadLe64(ack.data()) != token) {
        errorMsg = std::string(ErrorCodes::TRANSPORT_HANDSHAKE_FAILED) + ": HELLO_ACK token mismatch";
        return false;
    }

    if (!setNonBlocking(tcp.get(), errorMsg) || !setNonBlocking(udp.get(), errorMsg)) {
        return false;
    }

    m_udpFd = udp.release();
    m_localPort = udpPort;

    UdpTarget target;
    target.fd = m_udpFd;
    target.connected = true;

    const std::string control = stream->describe();
    auto conn = std::make_unique<SocketConnection>(false, tcp.release(), std::move(stream), target,
                                                   token, m_config);
    LOG_INFO("[" << conn->traceId() << "] Connected to " << address.toString()
             << " (control " << control << ", local udp port " << udpPort << ")");
    adoptConnection(std::move(conn));
    return true;
}

void SocketEndpoint::adoptConnection(std::unique_ptr<SocketConnection> conn) {
    m_conn = std::move(conn);
    ++m_connectionsServed;

    m_handler.onConnCreated(*m_conn);
    m_handler.onConnEstablished(*m_conn);
    m_conn->dispatchEvents(m_handler);
}

//=============================================================================
// SocketEndpoint: Event Loop
//=============================================================================

void SocketEndpoint::readUdp() {
    for (size_t i = 0; i < MAX_DATAGRAMS_PER_READ; ++i) {
        const ssize_t received = ::recv(m_udpFd, m_udpBuf.data(), m_udpBuf.size(), MSG_DONTWAIT);
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            if (errno == ECONNREFUSED) {
                // ICMP port unreachable reported on a connected UDP socket
                LOG_DEBUG("UDP peer unreachable");
                continue;
            }
            LOG_WARNING("UDP receive failed: " << std::strerror(errno));
            return;
        }

        const size_t size = static_cast<size_t>(received);
        if (size < DATAGRAM_TOKEN_SIZE || !m_conn || loadLe64(m_udpBuf.data()) != m_conn->token()) {
            ++m_unknownTokenDrops;
            LOG_DEBUG("Dropped UDP packet of " << size << " bytes with unknown token ("
                      << m_unknownTokenDrops << " so far)");
            continue;
        }
        m_conn->deliverDatagram(m_udpBuf.data() + DATAGRAM_TOKEN_SIZE, size - DATAGRAM_TOKEN_SIZE);
    }
}

void SocketEndpoint::serviceConnection() {
    if (!m_conn) {
        return;
    }

    m_conn->dispatchEvents(m_handler);

    if (!m_conn->isClosed()) {
        const auto deadline = m_handler.nextDeadline();
        if (deadline && *deadline <= SocketConnection::Clock::now()) {
            m_handler.onTimeout(*m_conn);
        }
    }

    m_conn->process(SocketConnection::Clock::now());
    m_conn->dispatchEvents(m_handler);

    if (m_conn->closeReported()) {
        LOG_DEBUG("[" << m_conn->traceId() << "] connection released");
        m_conn.reset();
    }
}

bool SocketEndpoint::runOnce(int maxWaitMs, std::string& errorMsg) {
    serviceConnection();

    using Clock = SocketConnection::Clock;
    const Clock::time_point now = Clock::now();
    int waitMs = std::max(0, maxWaitMs);

    if (m_conn) {
        std::optional<Clock::time_point> deadline = m_conn->nextTimeout();
        if (!m_conn->isClosed()) {
            const auto handlerDeadline = m_handler.nextDeadline();
            if (handlerDeadline && (!deadline || *handlerDeadline < *deadline)) {
                deadline = handlerDeadline;
            }
        }

        if (m_conn->hasPendingEvents() || m_conn->isClosed()) {
            waitMs = 0;
        } else if (deadline) {
            if (*deadline <= now) {
                waitMs = 0;
            } else {
                const auto remaining =
                    std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count();
                waitMs = static_cast<int>(std::min<int64_t>(waitMs, remaining));
            }
        }
    }

    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    int udpIndex = -1;
    int tcpIndex = -1;
    int listenIndex = -1;

    if (m_udpFd >= 0) {
        short events = POLLIN;
        if (m_conn && m_conn->wantsUdpWrite()) {
            events |= POLLOUT;
        }
        fds[count] = pollfd{m_udpFd, events, 0};
        udpIndex = static_cast<int>(count++);
    }
    if (m_conn && !m_conn->isClosed()) {
        short events = POLLIN;
        if (m_conn->wantsTcpWrite()) {
            events |= POLLOUT;
        }
        fds[count] = pollfd{m_conn->tcpFd(), events, 0};
        tcpIndex = static_cast<int>(count++);
    }
    if (m_isServer && !m_conn && m_listenFd >= 0) {
        fds[count] = pollfd{m_listenFd, POLLIN, 0};
        listenIndex = static_cast<int>(count++);
    }

    const int rc = ::poll(fds.data(), count, waitMs);
    if (rc < 0) {
        if (errno == EINTR) {
            return true;
        }
        errorMsg = errnoMessage("poll() failed");
        return false;
    }

    if (rc > 0) {
        if (udpIndex >= 0 && (fds[udpIndex].revents & (POLLIN | POLLERR))) {
            readUdp();
        }
        if (tcpIndex >= 0 && m_conn &&
            (fds[tcpIndex].revents & (POLLIN | POLLHUP | POLLERR))) {
            m_conn->readControl();
            if (m_conn->isClosed() && m_udpFd >= 0) {
                // Datagrams sent just before the peer's CLOSE may still be queued
                readUdp();
            }
        }
        if (listenIndex >= 0 && (fds[listenIndex].revents & POLLIN)) {
            acceptConnection();
        }
    }

    serviceConnection();
    return true;
}

void SocketEndpoint::shutdown() {
    if (!m_conn) {
        return;
    }
    m_conn->close(false, 0, "shutdown");
    m_conn->dispatchEvents(m_handler);
    m_conn.reset();
}

}  // namespace PaceSend
