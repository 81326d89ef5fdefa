/**
 * @file CertificateManager.h
 * @brief Server certificate generation and loading
 */

#pragma once

#include "config.h"
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;

namespace PaceSend {

//=============================================================================
// CertificateManager Class
//=============================================================================

/**
 * @class CertificateManager
 * @brief Generates and loads the server's self-signed certificate
 *
 * The server presents a certificate from --cert/--key (default ./cert.crt
 * and ./cert.key). When either file is missing or the certificate has
 * expired, a new self-signed pair is generated in place.
 *
 * Security model:
 * - Self-signed certificate (no CA validation)
 * - Provides confidentiality and integrity of the control channel
 * - The client does not authenticate the server beyond TLS itself
 *
 * Usage:
 * @code
 * std::string error;
 * if (!CertificateManager::ensureCertificateExists(certPath, keyPath, error)) {
 *     LOG_ERROR("Certificate setup failed: " << error);
 *     return 1;
 * }
 * @endcode
 */
class CertificateManager {
public:
    /**
     * @brief Generate a self-signed certificate
     * @param certPath Output path for certificate (PEM)
     * @param keyPath Output path for private key (PEM, unencrypted)
     * @param commonName Common name (CN) for certificate
     * @param errorMsg Output error message on failure
     * @return true if certificate generated successfully
     *
     * Creates:
     * - RSA 2048-bit key pair (EVP_PKEY)
     * - X.509 v3 certificate, valid for CERT_VALIDITY_DAYS
     * - Subject and issuer: CN=<commonName>, O=PaceSend
     * - Signature: SHA-256
     */
    static bool generateSelfSignedCert(const std::string& certPath,
                                       const std::string& keyPath,
                                       const std::string& commonName,
                                       std::string& errorMsg);

    /**
     * @brief Load certificate and private key into SSL context
     *
     * Verifies the private key matches the certificate.
     */
    static bool loadCertificate(SSL_CTX* ctx,
                                const std::string& certPath,
                                const std::string& keyPath,
                                std::string& errorMsg);

    static bool certificateExists(const std::string& certPath);

    /**
     * @brief Ensure a usable pair exists at the given paths (generate if missing)
     * @return true if the pair exists or was generated successfully
     */
    static bool ensureCertificateExists(const std::string& certPath,
                                        const std::string& keyPath,
                                        std::string& errorMsg);

    /**
     * @brief Check whether the certificate's notAfter is in the past
     * @return true if expired or unreadable
     */
    static bool isCertificateExpired(const std::string& certPath, std::string& errorMsg);

private:
    static std::string getHostname();
};

}  // namespace PaceSend
