/**
 * @file TransportAdapter.h
 * @brief Routes transport events to the sender and receiver sessions
 */

#pragma once

#include "ReceiverSession.h"
#include "SenderSession.h"
#include "TelemetrySink.h"
#include "Transport.h"
#include <chrono>
#include <optional>

namespace PaceSend {

/**
 * @class SenderHandler
 * @brief Client-side event routing
 *
 * Stream-writable, every datagram outcome (acked, dropped, expired, lost)
 * and the timer tick all call SenderSession::advance. None of them is
 * treated differently; lost datagrams are not resent.
 */
class SenderHandler : public TransportHandler {
public:
    SenderHandler(SenderSession& session, TelemetrySink* telemetry = nullptr);

    void onConnCreated(Connection& conn) override;
    void onConnEstablished(Connection& conn) override;
    void onConnClosed(Connection& conn) override;
    void onStreamCreated(Connection& conn, uint64_t streamId) override;
    void onStreamReadable(Connection& conn, uint64_t streamId) override;
    void onStreamWritable(Connection& conn, uint64_t streamId) override;
    void onStreamClosed(Connection& conn, uint64_t streamId) override;
    void onDatagramReceived(Connection& conn) override;
    void onDatagramAcked(Connection& conn) override;
    void onDatagramDropped(Connection& conn) override;
    void onDatagramExpired(Connection& conn) override;
    void onDatagramLost(Connection& conn) override;
    void onTimeout(Connection& conn) override;

    std::optional<std::chrono::steady_clock::time_point> nextDeadline() const override;

    /**
     * @brief true once the connection has closed
     */
    bool isFinished() const { return m_finished; }

private:
    void trySend(Connection& conn);

    SenderSession& m_session;
    TelemetrySink* m_telemetry;
    bool m_finished;
};

/**
 * @class ReceiverHandler
 * @brief Server-side event routing
 */
class ReceiverHandler : public TransportHandler {
public:
    ReceiverHandler(ReceiverSession& session, TelemetrySink* telemetry = nullptr);

    void onConnCreated(Connection& conn) override;
    void onConnEstablished(Connection& conn) override;
    void onConnClosed(Connection& conn) override;
    void onStreamCreated(Connection& conn, uint64_t streamId) override;
    void onStreamReadable(Connection& conn, uint64_t streamId) override;
    void onStreamClosed(Connection& conn, uint64_t streamId) override;
    void onDatagramReceived(Connection& conn) override;

    uint64_t connectionsClosed() const { return m_connectionsClosed; }

private:
    ReceiverSession& m_session;
    TelemetrySink* m_telemetry;
    uint64_t m_connectionsClosed;
};

}  // namespace PaceSend
