/**
 * @file CertificateManager.cpp
 * @brief Server certificate generation and loading
 */

#include "pacesend/CertificateManager.h"
#include "pacesend/Debug.h"
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <openssl/pem.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <filesystem>
#include <memory>
#include <system_error>
#include <unistd.h>

namespace PaceSend {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

bool ensureParentDir(const std::string& filePath, std::string& errorMsg) {
    const std::filesystem::path parent = std::filesystem::path(filePath).parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code ec;
    if (std::filesystem::exists(parent, ec)) {
        if (!std::filesystem::is_directory(parent, ec)) {
            errorMsg = "Certificate path exists but is not a directory: " + parent.string();
            return false;
        }
        return true;
    }

    std::filesystem::create_directories(parent, ec);
    if (ec) {
        errorMsg = "Failed to create certificate directory " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

}  // namespace

std::string CertificateManager::getHostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        return std::string(hostname);
    }
    return "localhost";
}

//=============================================================================
// CertificateManager: Certificate Existence
//=============================================================================

bool CertificateManager::certificateExists(const std::string& certPath) {
    std::error_code ec;
    std::filesystem::path path(certPath);
    return std::filesystem::exists(path, ec) && std::filesystem::is_regular_file(path, ec);
}

bool CertificateManager::ensureCertificateExists(const std::string& certPath,
                                                 const std::string& keyPath,
                                                 std::string& errorMsg) {
    if (certificateExists(certPath) && certificateExists(keyPath)) {
        std::string expiryError;
        if (!isCertificateExpired(certPath, expiryError)) {
            return true;
        }
        LOG_WARNING("Certificate " << certPath << " is expired or unreadable"
                    << (expiryError.empty() ? std::string() : " (" + expiryError + ")")
                    << ", regenerating");
    }

    const std::string commonName = "PaceSend-" + getHostname();
    if (!generateSelfSignedCert(certPath, keyPath, commonName, errorMsg)) {
        return false;
    }
    LOG_INFO("Generated self-signed certificate " << certPath << " (CN=" << commonName << ")");
    return true;
}

//=============================================================================
// CertificateManager: Certificate Generation
//=============================================================================

bool CertificateManager::generateSelfSignedCert(const std::string& certPath,
                                                const std::string& keyPath,
                                                const std::string& commonName,
                                                std::string& errorMsg) {
    if (!ensureParentDir(certPath, errorMsg) || !ensureParentDir(keyPath, errorMsg)) {
        return false;
    }

    // Generate RSA 2048-bit key pair
    PkeyCtxPtr pkeyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
    if (!pkeyCtx) {
        errorMsg = "Failed to create key context";
        return false;
    }
    if (EVP_PKEY_keygen_init(pkeyCtx.get()) <= 0) {
        errorMsg = "Failed to initialize keygen";
        return false;
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(pkeyCtx.get(), 2048) <= 0) {
        errorMsg = "Failed to set RSA key size";
        return false;
    }

    EVP_PKEY* rawKey = nullptr;
    if (EVP_PKEY_keygen(pkeyCtx.get(), &rawKey) <= 0) {
        errorMsg = "Failed to generate RSA key";
        return false;
    }
    PkeyPtr pkey(rawKey, &EVP_PKEY_free);

    // Create X.509 certificate
    X509Ptr cert(X509_new(), &X509_free);
    if (!cert) {
        errorMsg = "Failed to create certificate";
        return false;
    }

    // Set version (X509v3)
    if (X509_set_version(cert.get(), 2) != 1) {
        errorMsg = "Failed to set certificate version";
        return false;
    }

    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);

    X509_gmtime_adj(X509_get_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_get_notAfter(cert.get()),
                    static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60);

    if (X509_set_pubkey(cert.get(), pkey.get()) != 1) {
        errorMsg = "Failed to set public key";
        return false;
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (!name) {
        errorMsg = "Failed to get subject name";
        return false;
    }

    if (X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(commonName.c_str()),
                                   static_cast<int>(commonName.length()), -1, 0) != 1) {
        errorMsg = "Failed to set common name";
        return false;
    }

    if (X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("PaceSend"),
                                   8, -1, 0) != 1) {
        errorMsg = "Failed to set organization";
        return false;
    }

    // Self-signed: issuer = subject
    if (X509_set_issuer_name(cert.get(), name) != 1) {
        errorMsg = "Failed to set issuer name";
        return false;
    }

    if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) <= 0) {
        errorMsg = "Failed to sign certificate";
        return false;
    }

    BioPtr certBio(BIO_new_file(certPath.c_str(), "w"), &BIO_free);
    if (!certBio) {
        errorMsg = "Failed to create certificate file: " + certPath;
        return false;
    }
    if (PEM_write_bio_X509(certBio.get(), cert.get()) != 1) {
        errorMsg = "Failed to write certificate";
        return false;
    }

    BioPtr keyBio(BIO_new_file(keyPath.c_str(), "w"), &BIO_free);
    if (!keyBio) {
        errorMsg = "Failed to create key file: " + keyPath;
        return false;
    }
    if (PEM_write_bio_PrivateKey(keyBio.get(), pkey.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        errorMsg = "Failed to write private key";
        return false;
    }

    // Owner-only access to the private key
    std::error_code ec;
    std::filesystem::permissions(keyPath,
                                 std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARNING("Could not restrict permissions on " << keyPath << ": " << ec.message());
    }

    return true;
}

//=============================================================================
// CertificateManager: Certificate Loading
//=============================================================================

bool CertificateManager::loadCertificate(SSL_CTX* ctx,
                                         const std::string& certPath,
                                         const std::string& keyPath,
                                         std::string& errorMsg) {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }

    if (SSL_CTX_use_certificate_file(ctx, certPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load certificate: " + certPath;
        return false;
    }

    if (SSL_CTX_use_PrivateKey_file(ctx, keyPath.c_str(), SSL_FILETYPE_PEM) != 1) {
        errorMsg = "Failed to load private key: " + keyPath;
        return false;
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        return false;
    }

    return true;
}

bool CertificateManager::isCertificateExpired(const std::string& certPath,
                                              std::string& errorMsg) {
    BioPtr bio(BIO_new_file(certPath.c_str(), "r"), &BIO_free);
    if (!bio) {
        errorMsg = "Failed to open certificate file";
        return true;  // Treat missing cert as expired
    }

    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
    if (!cert) {
        errorMsg = "Failed to read certificate";
        return true;
    }

    // If result < 0, certificate has expired
    return X509_cmp_time(X509_get0_notAfter(cert.get()), nullptr) < 0;
}

}  // namespace PaceSend
