/**
 * @file TransportAdapter.cpp
 * @brief Event routing between the transport and the sessions
 */

#include "pacesend/TransportAdapter.h"
#include "pacesend/Debug.h"

namespace PaceSend {

// ============================================================================
// SenderHandler
// ============================================================================

SenderHandler::SenderHandler(SenderSession& session, TelemetrySink* telemetry)
    : m_session(session)
    , m_telemetry(telemetry)
    , m_finished(false)
{
}

void SenderHandler::onConnCreated(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn created, mode=" << channelKindToString(m_session.channel())
             << " total=" << m_session.totalSize() << "B"
             << " transfer_id=" << toHex64(m_session.transferId()));
}

void SenderHandler::onConnEstablished(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn established");

    std::string errorMsg;
    if (!m_session.start(conn, std::chrono::steady_clock::now(), errorMsg)) {
        LOG_ERROR(conn.traceId() << " cannot start transfer: " << errorMsg);
        conn.close(false, 0x01, "start failed");
        return;
    }
    trySend(conn);
}

void SenderHandler::onConnClosed(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn closed, sent " << m_session.sentBytes() << "/"
             << m_session.totalSize() << " bytes");
    if (m_telemetry) {
        m_telemetry->flush();
    }
    m_finished = true;
}

void SenderHandler::onStreamCreated(Connection& conn, uint64_t streamId) {
    LOG_DEBUG(conn.traceId() << " stream " << streamId << " created");
}

void SenderHandler::onStreamReadable(Connection& conn, uint64_t streamId) {
    LOG_DEBUG(conn.traceId() << " stream " << streamId << " readable");
}

void SenderHandler::onStreamWritable(Connection& conn, uint64_t streamId) {
    (void)streamId;
    trySend(conn);
}

void SenderHandler::onStreamClosed(Connection& conn, uint64_t streamId) {
    LOG_DEBUG(conn.traceId() << " stream " << streamId << " closed");
}

void SenderHandler::onDatagramReceived(Connection& conn) {
    std::vector<uint8_t> discard;
    while (conn.recvDatagram(discard)) {
        LOG_DEBUG(conn.traceId() << " ignoring " << discard.size() << "B datagram from peer");
    }
}

void SenderHandler::onDatagramAcked(Connection& conn) {
    trySend(conn);
}

void SenderHandler::onDatagramDropped(Connection& conn) {
    trySend(conn);
}

void SenderHandler::onDatagramExpired(Connection& conn) {
    trySend(conn);
}

void SenderHandler::onDatagramLost(Connection& conn) {
    trySend(conn);
}

void SenderHandler::onTimeout(Connection& conn) {
    trySend(conn);
}

std::optional<std::chrono::steady_clock::time_point> SenderHandler::nextDeadline() const {
    if (!m_session.isStarted() || m_session.isComplete()) {
        return std::nullopt;
    }
    return m_session.nextDeadline();
}

void SenderHandler::trySend(Connection& conn) {
    if (conn.isClosed()) {
        return;
    }
    m_session.advance(conn);
}

// ============================================================================
// ReceiverHandler
// ============================================================================

ReceiverHandler::ReceiverHandler(ReceiverSession& session, TelemetrySink* telemetry)
    : m_session(session)
    , m_telemetry(telemetry)
    , m_connectionsClosed(0)
{
}

void ReceiverHandler::onConnCreated(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn created");
}

void ReceiverHandler::onConnEstablished(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn established");
}

void ReceiverHandler::onConnClosed(Connection& conn) {
    LOG_INFO(conn.traceId() << " conn closed");
    m_session.releaseStreams();
    if (m_telemetry) {
        m_telemetry->flush();
    }
    ++m_connectionsClosed;
}

void ReceiverHandler::onStreamCreated(Connection& conn, uint64_t streamId) {
    LOG_DEBUG(conn.traceId() << " stream " << streamId << " created");
}

void ReceiverHandler::onStreamReadable(Connection& conn, uint64_t streamId) {
    if (!m_session.handleStreamReadable(conn, streamId)) {
        conn.close(false, 0x02, "output unwritable");
    }
}

void ReceiverHandler::onStreamClosed(Connection& conn, uint64_t streamId) {
    LOG_DEBUG(conn.traceId() << " stream " << streamId << " closed");
}

void ReceiverHandler::onDatagramReceived(Connection& conn) {
    m_session.drainDatagrams(conn);
}

}  // namespace PaceSend
