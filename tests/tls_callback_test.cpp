/**
 * @file tls_callback_test.cpp
 * @brief OpenSSL callbacks wired by TlsSocket: key log and peer verification
 *
 * A handshake over a socket pair appends TLS 1.3 secrets to the key log and
 * accepts the self-signed server certificate. Chain verification through
 * tlsVerifyCallback still rejects certificates outside their validity window.
 */

#include <gtest/gtest.h>

#include "pacesend/CertificateManager.h"
#include "pacesend/KeyLog.h"
#include "pacesend/TlsSocket.h"
#include "TestFiles.h"

#include <openssl/bio.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <sys/socket.h>
#include <unistd.h>

#include <ctime>
#include <fstream>
#include <iterator>
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

X509* loadCertificate(const std::string& path) {
    BIO* bio = BIO_new_file(path.c_str(), "r");
    if (!bio) {
        return nullptr;
    }
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    return cert;
}

/**
 * @brief Verify cert against an empty store at the given time
 * @return X509_verify_cert result; the verification error is stored in error
 */
int verifyAt(X509* cert, time_t when, int& error) {
    X509_STORE* store = X509_STORE_new();
    X509_STORE_CTX* ctx = X509_STORE_CTX_new();
    X509_STORE_CTX_init(ctx, store, cert, nullptr);
    X509_STORE_CTX_set_verify_cb(ctx, tlsVerifyCallback);
    X509_STORE_CTX_set_time(ctx, 0, when);

    const int result = X509_verify_cert(ctx);
    error = X509_STORE_CTX_get_error(ctx);

    X509_STORE_CTX_free(ctx);
    X509_STORE_free(store);
    return result;
}

std::string readText(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class TlsCallbackTest : public ::testing::Test {
protected:
    ScratchDir dir{"tls_callback"};
    std::string certPath;
    std::string keyPath;

    void SetUp() override {
        certPath = (dir / "server.crt").string();
        keyPath = (dir / "server.key").string();
        std::string err;
        ASSERT_TRUE(CertificateManager::ensureCertificateExists(certPath, keyPath, err)) << err;
    }

    void TearDown() override {
        KeyLog::initialize({});
    }
};

}  // namespace

TEST_F(TlsCallbackTest, HandshakeWritesTrafficSecretsToKeyLog) {
    const auto keyLogPath = dir / "keys.log";
    KeyLog::initialize(keyLogPath);
    ASSERT_TRUE(KeyLog::isEnabled());

    SocketPair pair;
    ASSERT_GE(pair.fds[0], 0);

    TlsSocket server(pair.fds[0], TlsRole::SERVER);
    server.setServerCertificate(certPath, keyPath);
    TlsSocket client(pair.fds[1], TlsRole::CLIENT);

    bool serverOk = false;
    std::string serverErr;
    std::thread serverThread([&] { serverOk = server.handshake(serverErr); });
    std::string clientErr;
    const bool clientOk = client.handshake(clientErr);
    serverThread.join();

    // The client verifies with tlsVerifyCallback, so success means the
    // self-signed certificate was accepted
    ASSERT_TRUE(clientOk) << clientErr;
    ASSERT_TRUE(serverOk) << serverErr;

    const std::string keys = readText(keyLogPath);
    EXPECT_NE(keys.find("CLIENT_HANDSHAKE_TRAFFIC_SECRET "), std::string::npos) << keys;
    EXPECT_NE(keys.find("SERVER_HANDSHAKE_TRAFFIC_SECRET "), std::string::npos) << keys;
    EXPECT_NE(keys.find("CLIENT_TRAFFIC_SECRET_0 "), std::string::npos) << keys;
    EXPECT_NE(keys.find("SERVER_TRAFFIC_SECRET_0 "), std::string::npos) << keys;
}

TEST_F(TlsCallbackTest, NoKeyLogWrittenWhenDisabled) {
    KeyLog::initialize({});
    const auto keyLogPath = dir / "unused.log";

    SocketPair pair;
    ASSERT_GE(pair.fds[0], 0);

    TlsSocket server(pair.fds[0], TlsRole::SERVER);
    server.setServerCertificate(certPath, keyPath);
    TlsSocket client(pair.fds[1], TlsRole::CLIENT);

    bool serverOk = false;
    std::string serverErr;
    std::thread serverThread([&] { serverOk = server.handshake(serverErr); });
    std::string clientErr;
    EXPECT_TRUE(client.handshake(clientErr)) << clientErr;
    serverThread.join();
    EXPECT_TRUE(serverOk) << serverErr;

    EXPECT_FALSE(std::filesystem::exists(keyLogPath));
}

TEST_F(TlsCallbackTest, VerifyAcceptsGeneratedSelfSignedCertificate) {
    X509* cert = loadCertificate(certPath);
    ASSERT_NE(cert, nullptr);

    int error = X509_V_OK;
    EXPECT_EQ(verifyAt(cert, std::time(nullptr), error), 1)
        << X509_verify_cert_error_string(error);
    X509_free(cert);
}

TEST_F(TlsCallbackTest, VerifyRejectsCertificatePastValidity) {
    X509* cert = loadCertificate(certPath);
    ASSERT_NE(cert, nullptr);

    const time_t afterExpiry = std::time(nullptr) +
                               static_cast<time_t>(CERT_VALIDITY_DAYS + 30) * 24 * 60 * 60;
    int error = X509_V_OK;
    EXPECT_EQ(verifyAt(cert, afterExpiry, error), 0);
    EXPECT_EQ(error, X509_V_ERR_CERT_HAS_EXPIRED);
    X509_free(cert);
}

TEST_F(TlsCallbackTest, VerifyRejectsCertificateNotYetValid) {
    X509* cert = loadCertificate(certPath);
    ASSERT_NE(cert, nullptr);

    const time_t beforeIssue = std::time(nullptr) - static_cast<time_t>(30) * 24 * 60 * 60;
    int error = X509_V_OK;
    EXPECT_EQ(verifyAt(cert, beforeIssue, error), 0);
    EXPECT_EQ(error, X509_V_ERR_CERT_NOT_YET_VALID);
    X509_free(cert);
}
