/**
 * @file HashUtils.cpp
 * @brief SHA-256 utilities using the OpenSSL EVP API
 */

#include "pacesend/HashUtils.h"
#include "pacesend/ByteOrder.h"

#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace PaceSend {

//=============================================================================
// Static Methods
//=============================================================================

uint64_t HashUtils::computeTransferId(const std::filesystem::path& sourcePath,
                                      uint64_t totalSize)
{
    const std::string pathBytes = sourcePath.string();
    uint8_t sizeBytes[8];
    storeLe64(sizeBytes, totalSize);

    IncrementalHash hasher;
    unsigned char digest[HASH_SIZE] = {};
    hasher.update(reinterpret_cast<const uint8_t*>(pathBytes.data()), pathBytes.size());
    hasher.update(sizeBytes, sizeof(sizeBytes));
    hasher.finalize(digest);

    return loadLe64(digest);
}

bool HashUtils::computeFileHash(const std::filesystem::path& filePath,
                                unsigned char* hash,
                                std::string& errorMsg)
{
    if (!hash) {
        errorMsg = "Hash buffer is null";
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file) {
        errorMsg = "Failed to open file: " + filePath.string();
        return false;
    }

    IncrementalHash hasher;
    std::vector<uint8_t> buffer(HASH_BUFFER_SIZE);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        std::streamsize bytesRead = file.gcount();

        if (bytesRead > 0 && !hasher.update(buffer.data(), static_cast<size_t>(bytesRead))) {
            errorMsg = "Failed to update SHA256 hash";
            return false;
        }
    }

    if (file.bad()) {
        errorMsg = "Error reading file: " + filePath.string();
        return false;
    }

    if (!hasher.finalize(hash)) {
        errorMsg = "Failed to finalize SHA256 hash";
        return false;
    }
    return true;
}

std::string HashUtils::fileHashHex(const std::filesystem::path& filePath) {
    unsigned char hash[HASH_SIZE] = {};
    std::string errorMsg;
    if (!computeFileHash(filePath, hash, errorMsg)) {
        return {};
    }
    return hashToString(hash);
}

std::string HashUtils::hashToString(const unsigned char* hash)
{
    if (!hash) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(hash[i]);
    }
    return oss.str();
}

//=============================================================================
// IncrementalHash Class
//=============================================================================

HashUtils::IncrementalHash::IncrementalHash()
    : m_ctx(nullptr), m_finalized(false)
{
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        // update() and finalize() fail on a missing context
        EVP_MD_CTX_free(ctx);
        ctx = nullptr;
    }
    m_ctx = ctx;
}

HashUtils::IncrementalHash::~IncrementalHash()
{
    if (m_ctx) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        m_ctx = nullptr;
    }
}

HashUtils::IncrementalHash::IncrementalHash(IncrementalHash&& other) noexcept
    : m_ctx(other.m_ctx)
    , m_finalized(other.m_finalized)
{
    other.m_ctx = nullptr;
    other.m_finalized = false;
}

HashUtils::IncrementalHash& HashUtils::IncrementalHash::operator=(IncrementalHash&& other) noexcept {
    if (this != &other) {
        if (m_ctx) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(m_ctx));
        }

        m_ctx = other.m_ctx;
        m_finalized = other.m_finalized;

        other.m_ctx = nullptr;
        other.m_finalized = false;
    }
    return *this;
}

bool HashUtils::IncrementalHash::update(const uint8_t* data, size_t size)
{
    if (m_finalized || !m_ctx) {
        return false;
    }

    if (!data || size == 0) {
        return true;  // Nothing to update
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    return EVP_DigestUpdate(ctx, data, size) == 1;
}

bool HashUtils::IncrementalHash::finalize(unsigned char* hash)
{
    if (m_finalized || !hash || !m_ctx) {
        return false;
    }

    EVP_MD_CTX* ctx = static_cast<EVP_MD_CTX*>(m_ctx);
    unsigned int hashLen = 0;
    bool success = (EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1);
    m_finalized = true;
    return success;
}

}  // namespace PaceSend
