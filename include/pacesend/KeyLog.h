/**
 * @file KeyLog.h
 * @brief Process-wide NSS key log writer for TLS secrets
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

// Forward declaration - avoid including OpenSSL headers in this header
struct ssl_st;
typedef struct ssl_st SSL;

namespace PaceSend {

/**
 * @brief Appends TLS key log lines (NSS format) to a file
 *
 * Used by Wireshark and similar tools to decrypt captured traffic. OpenSSL
 * delivers each line through sslCallback(), which is registered on every
 * SSL_CTX when a path was configured.
 *
 * Note: initialize() must be called before any TLS context is created.
 * Calling log() before initialize() silently does nothing.
 */
class KeyLog {
public:
    /**
     * @brief Set the key log file path (empty disables logging)
     */
    static void initialize(const std::filesystem::path& logPath);

    static bool isEnabled();

    /**
     * @brief Append one line
     *
     * Thread-safe: locks a static mutex before writing to the file.
     */
    static void log(const std::string& line);

    /**
     * @brief Callback for SSL_CTX_set_keylog_callback
     */
    static void sslCallback(const SSL* ssl, const char* line);

private:
    static std::mutex s_mutex;
    static std::filesystem::path s_logPath;
};

}  // namespace PaceSend
