/**
 * @file TransferOptions.h
 * @brief Command-line and config-file options for the client and server
 *
 * Both option sets may be seeded from a JSON file given with --config; any
 * flag on the command line overrides the file. JSON keys are the long flag
 * names with either '-' or '_' as separator, e.g. {"chunk_bytes": 1400}.
 */

#pragma once

#include "config.h"
#include "CongestionControl.h"
#include "Debug.h"
#include "Transport.h"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace PaceSend {

/**
 * @brief host:port pair
 */
struct SocketAddress {
    std::string host;
    uint16_t port = 0;

    std::string toString() const { return host + ":" + std::to_string(port); }

    /**
     * @throws std::runtime_error on a missing or out-of-range port
     */
    static SocketAddress parseOrThrow(const std::string& text);
};

struct SenderOptions {
    bool showHelp = false;
    LogLevel logLevel = LogLevel::INFO;

    SocketAddress connectTo;
    uint64_t idleTimeoutUs = DEFAULT_IDLE_TIMEOUT_US;

    std::string keylogFile;
    std::string qlogFile;
    std::string csvSend;
    size_t flushEvery = DEFAULT_FLUSH_EVERY;

    size_t maxDatagramFrameSize = DEFAULT_MAX_DATAGRAM_FRAME_SIZE;
    uint64_t sendTimeoutUs = DEFAULT_CLIENT_DATAGRAM_SEND_TIMEOUT_US;

    ChannelKind mode = ChannelKind::DATAGRAM;
    std::string inFile;
    size_t chunkBytes = DEFAULT_CHUNK_BYTES;
    double rateMbps = DEFAULT_RATE_MBPS;
    std::optional<CongestionControl> cca;

    bool useTls = true;

    double rateBitsPerSec() const { return rateMbps * 1e6; }

    static SenderOptions parseOrThrow(int argc, const char* const* argv);
    static std::string usage(const std::string& program);
};

struct ReceiverOptions {
    bool showHelp = false;
    LogLevel logLevel = LogLevel::INFO;

    SocketAddress listen;
    uint64_t idleTimeoutUs = DEFAULT_IDLE_TIMEOUT_US;

    std::string certFile = DEFAULT_CERT_FILE;
    std::string keyFile = DEFAULT_KEY_FILE;

    std::string keylogFile;
    std::string qlogFile;

    size_t maxDatagramFrameSize = DEFAULT_MAX_DATAGRAM_FRAME_SIZE;
    uint64_t sendTimeoutUs = DEFAULT_SERVER_DATAGRAM_SEND_TIMEOUT_US;

    std::string outDir = DEFAULT_OUT_DIR;
    size_t flushEvery = DEFAULT_FLUSH_EVERY;
    std::string csvRecv;
    std::optional<CongestionControl> cca;

    bool useTls = true;

    ReceiverOptions();

    static ReceiverOptions parseOrThrow(int argc, const char* const* argv);
    static std::string usage(const std::string& program);
};

}  // namespace PaceSend
