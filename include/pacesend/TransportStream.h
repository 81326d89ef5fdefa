/**
 * @file TransportStream.h
 * @brief Byte stream abstraction over plain TCP and TLS sockets
 */

#pragma once

#include "Transport.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace PaceSend {

class TlsSocket;

/**
 * @brief Byte stream used by the control channel
 *
 * sendExact()/recvExact() are for the blocking handshake phase;
 * writeSome()/readSome() are for the event loop once the socket is
 * non-blocking. readSome() reports an orderly close with eof=true and OK.
 */
class TransportStream {
public:
    virtual ~TransportStream() = default;
    virtual bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) = 0;
    virtual bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) = 0;
    virtual IoStatus writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg) = 0;
    virtual IoStatus readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                              std::string& errorMsg) = 0;
    virtual void shutdown() {}
    virtual bool isTls() const { return false; }
    virtual std::string describe() const { return "tcp"; }
};

class PlainSocketStream final : public TransportStream {
public:
    explicit PlainSocketStream(int socketFd) : m_socket(socketFd) {}

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    IoStatus writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg) override;
    IoStatus readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                      std::string& errorMsg) override;

private:
    int m_socket;
};

class TlsTransportStream final : public TransportStream {
public:
    explicit TlsTransportStream(std::unique_ptr<TlsSocket> tls);
    ~TlsTransportStream() override;

    bool sendExact(const uint8_t* data, size_t size, std::string& errorMsg) override;
    bool recvExact(uint8_t* buffer, size_t size, std::string& errorMsg) override;
    IoStatus writeSome(const uint8_t* data, size_t size, size_t& written, std::string& errorMsg) override;
    IoStatus readSome(uint8_t* buffer, size_t size, size_t& bytesRead, bool& eof,
                      std::string& errorMsg) override;
    void shutdown() override;
    bool isTls() const override { return true; }
    std::string describe() const override;

private:
    std::unique_ptr<TlsSocket> m_tls;
};

}  // namespace PaceSend
