/**
 * @file TlsSocket.h
 * @brief TLS 1.3 wrapper around a connected TCP socket
 */

#pragma once

#include "config.h"
#include "Transport.h"
#include <cstddef>
#include <cstdint>
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct ssl_st;
typedef struct ssl_st SSL;
struct x509_store_ctx_st;
typedef struct x509_store_ctx_st X509_STORE_CTX;

namespace PaceSend {

enum class TlsRole : uint8_t {
    CLIENT = 0,
    SERVER = 1
};

/**
 * @class TlsSocket
 * @brief Owns the SSL_CTX and SSL for one connection
 *
 * The handshake and the exact-length helpers expect a blocking socket. After
 * the socket is switched to non-blocking, use writeSome()/readSome(), which
 * map WANT_READ/WANT_WRITE to IoStatus::WOULD_BLOCK.
 *
 * Protocol policy: TLS 1.3 only, TLS13_CIPHER_SUITES, TLS_GROUPS_LIST. The
 * server presents the certificate from setServerCertificate(); the client
 * accepts a self-signed server certificate.
 *
 * Does not own the socket descriptor.
 */
class TlsSocket {
public:
    TlsSocket(int socketFd, TlsRole role);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief Certificate and key presented by the server role
     */
    void setServerCertificate(const std::string& certPath, const std::string& keyPath);

    /**
     * @brief Create context and SSL object, then run SSL_accept/SSL_connect
     */
    bool handshake(std::string& errorMsg);

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg);
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg);

    IoStatus writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg);
    IoStatus readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof, std::string& errorMsg);

    void shutdown();

    bool isConnected() const { return m_connected; }

    /**
     * @brief Negotiated cipher suite name, or empty before the handshake
     */
    std::string cipherName() const;

    static std::string getLastError();
    static std::string getErrorDescription(int sslErrorCode);

private:
    bool createContext(std::string& errorMsg);
    bool createSsl(std::string& errorMsg);

    int m_socket;
    SSL_CTX* m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    bool m_connected;
    std::string m_certPath;
    std::string m_keyPath;
};

/**
 * @brief Verification callback that accepts only self-signed chain errors
 */
int tlsVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx);

}  // namespace PaceSend
