/**
 * @file HashUtils.h
 * @brief SHA-256 utilities and transfer identity derivation
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <filesystem>
#include <string>

namespace PaceSend {

/**
 * @class HashUtils
 * @brief SHA-256 hashing via the OpenSSL EVP API
 *
 * Used for two things:
 * - Deriving the 64-bit transfer id that tags every chunk of a transfer
 * - Digesting whole files so sender and receiver logs can be compared
 *
 * All methods are thread-safe (no shared state).
 */
class HashUtils {
public:
    /**
     * @brief Derive the transfer id for a source file
     * @param sourcePath Path as given by the operator (not canonicalized)
     * @param totalSize File size in bytes
     * @return First 8 bytes of SHA-256(path bytes || size as u64 LE), read little-endian
     *
     * Deterministic for a given (path, size). Distinct files that collide are
     * not detected; the receiver would merge them into one output file.
     */
    static uint64_t computeTransferId(const std::filesystem::path& sourcePath,
                                      uint64_t totalSize);

    /**
     * @brief Compute SHA-256 hash of a file
     * @param filePath Path to the file to hash
     * @param hash Output buffer (must be at least HASH_SIZE bytes)
     * @param errorMsg Output error message if computation fails
     * @return true if successful, false otherwise
     */
    static bool computeFileHash(const std::filesystem::path& filePath,
                                unsigned char* hash,
                                std::string& errorMsg);

    /**
     * @brief Hex digest of a file, or an empty string on failure
     */
    static std::string fileHashHex(const std::filesystem::path& filePath);

    /**
     * @brief Convert binary hash to hexadecimal string
     * @param hash Binary hash (must be HASH_SIZE bytes)
     * @return 64 lowercase hex characters
     */
    static std::string hashToString(const unsigned char* hash);

    /**
     * @brief Incremental SHA-256 context
     */
    class IncrementalHash {
    public:
        IncrementalHash();
        ~IncrementalHash();

        // Prevent copying (context cannot be copied)
        IncrementalHash(const IncrementalHash&) = delete;
        IncrementalHash& operator=(const IncrementalHash&) = delete;

        IncrementalHash(IncrementalHash&& other) noexcept;
        IncrementalHash& operator=(IncrementalHash&& other) noexcept;

        bool update(const uint8_t* data, size_t size);

        /**
         * @brief Finalize and get the hash result
         * @param hash Output buffer (must be at least HASH_SIZE bytes)
         *
         * After calling finalize(), update() and finalize() fail.
         */
        bool finalize(unsigned char* hash);

    private:
        void* m_ctx;  ///< Opaque pointer to EVP_MD_CTX
        bool m_finalized;
    };
};

}  // namespace PaceSend
