/**
 * @file TlsSocket.cpp
 * @brief TLS 1.3 wrapper for the control channel
 */

#include "pacesend/TlsSocket.h"
#include "pacesend/CertificateManager.h"
#include "pacesend/KeyLog.h"
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace PaceSend {

namespace {

std::string formatSslFailureDetails(int sslErrorCode, int savedErrno) {
    // Prefer OpenSSL's error queue when present.
    const unsigned long opensslErr = ERR_get_error();
    if (opensslErr != 0) {
        char buf[256];
        ERR_error_string_n(opensslErr, buf, sizeof(buf));
        return std::string(buf);
    }

    // SSL_ERROR_SYSCALL often indicates an underlying socket error (or EOF)
    // and may not populate the OpenSSL error queue.
    if (sslErrorCode == SSL_ERROR_SYSCALL) {
        if (savedErrno != 0) {
            return "errno=" + std::to_string(savedErrno) + " (" + std::strerror(savedErrno) + ")";
        }
        return "Socket I/O failed without an errno (peer may have closed the connection)";
    }

    return "Unknown error";
}

}  // namespace

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int socketFd, TlsRole role)
    : m_socket(socketFd)
    , m_ctx(nullptr)
    , m_ssl(nullptr)
    , m_role(role)
    , m_connected(false)
{
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }

    if (m_ctx) {
        SSL_CTX_free(m_ctx);
        m_ctx = nullptr;
    }
}

void TlsSocket::setServerCertificate(const std::string& certPath, const std::string& keyPath) {
    m_certPath = certPath;
    m_keyPath = keyPath;
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

bool TlsSocket::createContext(std::string& errorMsg) {
    const SSL_METHOD* method = (m_role == TlsRole::SERVER) ? TLS_server_method() : TLS_client_method();

    m_ctx = SSL_CTX_new(method);
    if (!m_ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return false;
    }

    // TLS 1.3 only (no legacy protocol negotiation).
    if (SSL_CTX_set_min_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set minimum TLS version: " + getLastError();
        return false;
    }
    if (SSL_CTX_set_max_proto_version(m_ctx, TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set maximum TLS version: " + getLastError();
        return false;
    }

    if (SSL_CTX_set_ciphersuites(m_ctx, TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return false;
    }

    if (SSL_CTX_set1_groups_list(m_ctx, TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return false;
    }

    uint64_t options = SSL_OP_NO_COMPRESSION;
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // A peer that closes without close_notify reads as a clean EOF
    options |= SSL_OP_IGNORE_UNEXPECTED_EOF;
#endif
    SSL_CTX_set_options(m_ctx, options);

    // Non-blocking writes: accept partial writes and a relocated retry buffer
    SSL_CTX_set_mode(m_ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

    if (KeyLog::isEnabled()) {
        SSL_CTX_set_keylog_callback(m_ctx, KeyLog::sslCallback);
    }

    if (m_role == TlsRole::SERVER) {
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, nullptr);
        if (!CertificateManager::loadCertificate(m_ctx, m_certPath, m_keyPath, errorMsg)) {
            return false;
        }
    } else {
        SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, tlsVerifyCallback);
    }

    return true;
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    m_ssl = SSL_new(m_ctx);
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }

    if (SSL_set_fd(m_ssl, m_socket) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }

    return true;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    if (!createContext(errorMsg)) {
        return false;
    }

    if (!createSsl(errorMsg)) {
        return false;
    }

    ERR_clear_error();
    errno = 0;
    const int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        const int savedErrno = errno;
        const int err = SSL_get_error(m_ssl, result);
        errorMsg = "TLS handshake failed (" + getErrorDescription(err) + "): " +
                   formatSslFailureDetails(err, savedErrno);
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Blocking Send / Receive
//=============================================================================

bool TlsSocket::sendExact(const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const size_t chunkSize = std::min(size - totalSent, TLS_MAX_PACKET_SIZE);

        ERR_clear_error();
        errno = 0;
        const int sent = SSL_write(m_ssl, data + totalSent, static_cast<int>(chunkSize));
        if (sent <= 0) {
            const int savedErrno = errno;
            const int err = SSL_get_error(m_ssl, sent);
            errorMsg = "TLS send failed (" + getErrorDescription(err) + "): " +
                       formatSslFailureDetails(err, savedErrno);
            return false;
        }

        totalSent += static_cast<size_t>(sent);
    }

    return true;
}

bool TlsSocket::recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return false;
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        ERR_clear_error();
        errno = 0;
        const int received = SSL_read(m_ssl, buffer + totalReceived,
                                      static_cast<int>(size - totalReceived));
        if (received <= 0) {
            const int savedErrno = errno;
            const int err = SSL_get_error(m_ssl, received);

            if (err == SSL_ERROR_ZERO_RETURN) {
                errorMsg = "Connection closed by peer";
                return false;
            }

            errorMsg = "TLS recv failed (" + getErrorDescription(err) + "): " +
                       formatSslFailureDetails(err, savedErrno);
            return false;
        }

        totalReceived += static_cast<size_t>(received);
    }

    return true;
}

//=============================================================================
// TlsSocket: Non-blocking Send / Receive
//=============================================================================

IoStatus TlsSocket::writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg) {
    written = 0;
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return IoStatus::FAILED;
    }
    if (size == 0) {
        return IoStatus::OK;
    }

    const size_t chunkSize = std::min(size, TLS_MAX_PACKET_SIZE);

    ERR_clear_error();
    errno = 0;
    const int sent = SSL_write(m_ssl, data, static_cast<int>(chunkSize));
    if (sent > 0) {
        written = static_cast<size_t>(sent);
        return IoStatus::OK;
    }

    const int savedErrno = errno;
    const int err = SSL_get_error(m_ssl, sent);
    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ) {
        return IoStatus::WOULD_BLOCK;
    }

    errorMsg = "TLS write failed (" + getErrorDescription(err) + "): " +
               formatSslFailureDetails(err, savedErrno);
    return IoStatus::FAILED;
}

IoStatus TlsSocket::readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                             std::string& errorMsg) {
    bytesRead = 0;
    eof = false;
    if (!m_connected || !m_ssl) {
        errorMsg = "TLS not connected";
        return IoStatus::FAILED;
    }

    ERR_clear_error();
    errno = 0;
    const int received = SSL_read(m_ssl, buffer, static_cast<int>(std::min<size_t>(size, INT32_MAX)));
    if (received > 0) {
        bytesRead = static_cast<size_t>(received);
        return IoStatus::OK;
    }

    const int savedErrno = errno;
    const int err = SSL_get_error(m_ssl, received);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        return IoStatus::WOULD_BLOCK;
    }
    if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && savedErrno == 0)) {
        eof = true;
        return IoStatus::OK;
    }

    errorMsg = "TLS read failed (" + getErrorDescription(err) + "): " +
               formatSslFailureDetails(err, savedErrno);
    return IoStatus::FAILED;
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        // Best effort close_notify; the socket may already be gone
        if (SSL_shutdown(m_ssl) < 0) {
            ERR_clear_error();
        }
        m_connected = false;
    }
}

std::string TlsSocket::cipherName() const {
    if (!m_ssl) {
        return {};
    }
    const char* name = SSL_get_cipher_name(m_ssl);
    return name ? std::string(name) : std::string();
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

//=============================================================================
// Certificate Verification Callback
//=============================================================================

int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx) {
    const int err = X509_STORE_CTX_get_error(ctx);

    if (!preverifyOk) {
        // The server certificate is self-signed; every other error is a real failure
        if (err == X509_V_ERR_SELF_SIGNED_CERT_IN_CHAIN ||
            err == X509_V_ERR_DEPTH_ZERO_SELF_SIGNED_CERT) {
            return 1;
        }
        return 0;
    }

    return 1;
}

}  // namespace PaceSend
