/**
 * @file TransportStream.cpp
 * @brief Plain and TLS stream implementations
 */

#include "pacesend/TransportStream.h"
#include "pacesend/TlsSocket.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>

namespace PaceSend {

// ============================================================================
// PlainSocketStream
// ============================================================================

bool PlainSocketStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    size_t totalSent = 0;
    while (totalSent < size) {
        const ssize_t sent = ::send(m_socket, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = std::string("send failed: ") + std::strerror(errno);
            return false;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return true;
}

bool PlainSocketStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    size_t totalReceived = 0;
    while (totalReceived < size) {
        const ssize_t received = ::recv(m_socket, buffer + totalReceived, size - totalReceived, 0);
        if (received == 0) {
            errorMsg = "Connection closed by peer";
            return false;
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = std::string("recv failed: ") + std::strerror(errno);
            return false;
        }
        totalReceived += static_cast<size_t>(received);
    }
    return true;
}

IoStatus PlainSocketStream::writeSome(const uint8_t* data, size_t size, size_t& written,
                                      std::string& errorMsg) {
    written = 0;
    if (size == 0) {
        return IoStatus::OK;
    }

    for (;;) {
        const ssize_t sent = ::send(m_socket, data, size, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (sent >= 0) {
            written = static_cast<size_t>(sent);
            return IoStatus::OK;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::WOULD_BLOCK;
        }
        errorMsg = std::string("send failed: ") + std::strerror(errno);
        return IoStatus::FAILED;
    }
}

IoStatus PlainSocketStream::readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                                     std::string& errorMsg) {
    bytesRead = 0;
    eof = false;

    for (;;) {
        const ssize_t received = ::recv(m_socket, buffer, size, MSG_DONTWAIT);
        if (received > 0) {
            bytesRead = static_cast<size_t>(received);
            return IoStatus::OK;
        }
        if (received == 0) {
            eof = true;
            return IoStatus::OK;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IoStatus::WOULD_BLOCK;
        }
        errorMsg = std::string("recv failed: ") + std::strerror(errno);
        return IoStatus::FAILED;
    }
}

// ============================================================================
// TlsTransportStream
// ============================================================================

TlsTransportStream::TlsTransportStream(std::unique_ptr<TlsSocket> tls)
    : m_tls(std::move(tls))
{
}

TlsTransportStream::~TlsTransportStream() = default;

bool TlsTransportStream::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    return m_tls->sendExact(data, size, errorMsg);
}

bool TlsTransportStream::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    return m_tls->recvExact(buffer, size, errorMsg);
}

IoStatus TlsTransportStream::writeSome(const uint8_t* data, size_t size, size_t& written,
                                       std::string& errorMsg) {
    return m_tls->writeSome(data, size, written, errorMsg);
}

IoStatus TlsTransportStream::readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                                      std::string& errorMsg) {
    return m_tls->readSome(buffer, size, bytesRead, eof, errorMsg);
}

void TlsTransportStream::shutdown() {
    m_tls->shutdown();
}

std::string TlsTransportStream::describe() const {
    return "tls(" + m_tls->cipherName() + ")";
}

}  // namespace PaceSend
