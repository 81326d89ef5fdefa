/**
 * @file tls_stream_test.cpp
 * @brief Certificate generation and control-channel streams over a socket pair
 */

#include <gtest/gtest.h>

#include "pacesend/CertificateManager.h"
#include "pacesend/TlsSocket.h"
#include "pacesend/TransportStream.h"
#include "TestFiles.h"

#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <thread>

using namespace PaceSend;
using PaceSendTest::ScratchDir;

namespace {

struct SocketPair {
    int fds[2] = {-1, -1};

    SocketPair() {
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            fds[0] = fds[1] = -1;
        }
    }

    ~SocketPair() {
        for (int fd : fds) {
            if (fd >= 0) {
                ::close(fd);
            }
        }
    }
};

}  // namespace

//=============================================================================
// Certificates
//=============================================================================

TEST(CertificateManagerTest, EnsureGeneratesPairOnceAndReusesIt)
{
    ScratchDir dir("cert_generate");
    const std::string cert = (dir / "certs/server.crt").string();
    const std::string key = (dir / "certs/server.key").string();

    std::string err;
    ASSERT_TRUE(CertificateManager::ensureCertificateExists(cert, key, err)) << err;
    EXPECT_TRUE(CertificateManager::certificateExists(cert));
    EXPECT_TRUE(CertificateManager::certificateExists(key));
    EXPECT_FALSE(CertificateManager::isCertificateExpired(cert, err)) << err;

    const auto firstCert = PaceSendTest::readFile(cert);
    ASSERT_TRUE(CertificateManager::ensureCertificateExists(cert, key, err)) << err;
    EXPECT_EQ(PaceSendTest::readFile(cert), firstCert);

    const auto keyPerms = std::filesystem::status(key).permissions();
    EXPECT_EQ(keyPerms & std::filesystem::perms::group_read, std::filesystem::perms::none);
    EXPECT_EQ(keyPerms & std::filesystem::perms::others_read, std::filesystem::perms::none);
}

TEST(CertificateManagerTest, MissingOrGarbageCertificateCountsAsExpired)
{
    ScratchDir dir("cert_garbage");
    std::string err;
    EXPECT_TRUE(CertificateManager::isCertificateExpired((dir / "none.crt").string(), err));

    PaceSendTest::writeFile(dir / "junk.crt", {'n', 'o', 't', ' ', 'p', 'e', 'm'});
    err.clear();
    EXPECT_TRUE(CertificateManager::isCertificateExpired((dir / "junk.crt").string(), err));
    EXPECT_FALSE(err.empty());
}

TEST(CertificateManagerTest, ParentThatIsAFileFailsGeneration)
{
    ScratchDir dir("cert_bad_parent");
    PaceSendTest::writeFile(dir / "blocker", {1});

    std::string err;
    EXPECT_FALSE(CertificateManager::ensureCertificateExists((dir / "blocker/c.crt").string(),
                                                             (dir / "blocker/c.key").string(), err));
    EXPECT_NE(err.find("not a directory"), std::string::npos) << err;
}

//=============================================================================
// Streams
//=============================================================================

TEST(TransportStreamTest, PlainStreamReportsWouldBlockThenDataThenEof)
{
    SocketPair pair;
    ASSERT_GE(pair.fds[0], 0);

    PlainSocketStream a(pair.fds[0]);
    PlainSocketStream b(pair.fds[1]);

    std::array<uint8_t, 16> buf{};
    size_t n = 0;
    bool eof = false;
    std::string err;
    EXPECT_EQ(b.readSome(buf.data(), buf.size(), n, eof, err), IoStatus::WOULD_BLOCK);

    const uint8_t msg[] = {1, 2, 3, 4};
    ASSERT_TRUE(a.sendExact(msg, sizeof(msg), err)) << err;
    ASSERT_TRUE(b.recvExact(buf.data(), sizeof(msg), err)) << err;
    EXPECT_EQ(buf[3], 4);

    ::shutdown(pair.fds[0], SHUT_WR);
    EXPECT_EQ(b.readSome(buf.data(), buf.size(), n, eof, err), IoStatus::OK);
    EXPECT_TRUE(eof);
    EXPECT_EQ(n, 0u);
    EXPECT_EQ(b.describe(), "tcp");
}

TEST(TransportStreamTest, TlsHandshakeOverSocketPairCarriesData)
{
    ScratchDir dir("tls_pair");
    const std::string cert = (dir / "s.crt").string();
    const std::string key = (dir / "s.key").string();
    std::string err;
    ASSERT_TRUE(CertificateManager::ensureCertificateExists(cert, key, err)) << err;

    SocketPair pair;
    ASSERT_GE(pair.fds[0], 0);

    auto serverTls = std::make_unique<TlsSocket>(pair.fds[0], TlsRole::SERVER);
    serverTls->setServerCertificate(cert, key);
    auto clientTls = std::make_unique<TlsSocket>(pair.fds[1], TlsRole::CLIENT);

    bool serverOk = false;
    std::string serverErr;
    std::thread serverThread([&] { serverOk = serverTls->handshake(serverErr); });
    const bool clientOk = clientTls->handshake(err);
    serverThread.join();

    ASSERT_TRUE(serverOk) << serverErr;
    ASSERT_TRUE(clientOk) << err;
    EXPECT_TRUE(clientTls->isConnected());
    EXPECT_FALSE(clientTls->cipherName().empty());

    TlsTransportStream server(std::move(serverTls));
    TlsTransportStream client(std::move(clientTls));
    EXPECT_TRUE(client.isTls());

    const std::vector<uint8_t> payload = PaceSendTest::patternBytes(5000);
    ASSERT_TRUE(client.sendExact(payload.data(), payload.size(), err)) << err;

    std::vector<uint8_t> received(payload.size());
    ASSERT_TRUE(server.recvExact(received.data(), received.size(), err)) << err;
    EXPECT_EQ(received, payload);
}

TEST(TransportStreamTest, TlsServerWithoutCertificateFailsHandshake)
{
    ScratchDir dir("tls_nocert");
    SocketPair pair;
    ASSERT_GE(pair.fds[0], 0);

    TlsSocket server(pair.fds[0], TlsRole::SERVER);
    server.setServerCertificate((dir / "missing.crt").string(), (dir / "missing.key").string());

    std::string err;
    EXPECT_FALSE(server.handshake(err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(server.isConnected());
}
