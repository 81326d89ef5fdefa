/**
 * @file config.h
 * @brief Configuration constants for PaceSend
 *
 * Compile-time defaults used by the sender, the receiver and the socket
 * transport backend. Most of them can be overridden at run time through
 * TransferOptions (command line or JSON config file).
 *
 * @note The wire constants (CHUNK_HEADER_SIZE, frame layout) affect protocol
 *       compatibility. Both peers must agree on them.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace PaceSend
 * @brief PaceSend namespace containing all public APIs
 */
namespace PaceSend {

//=========================================================================
// Wire Format
//=========================================================================

/** @defgroup WireFormat Wire Format
 * @brief Layout of the unreliable-message chunk header
 * @{
 */

/**
 * @brief Size of the chunk header that precedes every datagram payload.
 *
 * transfer_id(8) total_size(8) offset(8) length(4) flags(1) padding(3)
 * timestamp(8), little-endian.
 */
constexpr size_t CHUNK_HEADER_SIZE = 40;

/** @brief Bit 0 of the flags byte marks the last chunk of a transfer */
constexpr uint8_t CHUNK_FLAG_LAST = 0x01;

/** @} */ // end of WireFormat

//=========================================================================
// Transfer Defaults
//=========================================================================

/** @defgroup TransferDefaults Transfer Defaults
 * @{
 */

/** @brief Default payload bytes per chunk (fits a 1280-byte path MTU with header) */
constexpr size_t DEFAULT_CHUNK_BYTES = 1200;

/** @brief Default pacing rate in megabits per second */
constexpr double DEFAULT_RATE_MBPS = 10.0;

/** @brief Default telemetry flush cadence (records) */
constexpr size_t DEFAULT_FLUSH_EVERY = 200;

/** @brief Progress is logged every time this many bytes have been sent */
constexpr uint64_t PROGRESS_LOG_STEP_BYTES = 1024 * 1024;

/** @brief Receiver read buffer for stream segments */
constexpr size_t MAX_BUF_SIZE = 64 * 1024;

/** @brief Default receiver output directory */
constexpr const char* DEFAULT_OUT_DIR = "results/recv";

/** @brief Urgency hint passed when the sender opens its stream */
constexpr uint8_t SENDER_STREAM_URGENCY = 3;

/** @} */ // end of TransferDefaults

//=========================================================================
// Transport Defaults
//=========================================================================

/** @defgroup TransportDefaults Socket Transport Defaults
 * @{
 */

/** @brief Default server listen address */
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0:4433";

/** @brief Default idle timeout (microseconds) */
constexpr uint64_t DEFAULT_IDLE_TIMEOUT_US = 5000000;

/** @brief Default max datagram frame size (bytes) */
constexpr size_t DEFAULT_MAX_DATAGRAM_FRAME_SIZE = 65535;

/** @brief Default datagram send timeout on the client (microseconds) */
constexpr uint64_t DEFAULT_CLIENT_DATAGRAM_SEND_TIMEOUT_US = 500000;

/** @brief Default datagram send timeout on the server (microseconds) */
constexpr uint64_t DEFAULT_SERVER_DATAGRAM_SEND_TIMEOUT_US = 5000000;

/** @brief Largest UDP payload over IPv4 */
constexpr size_t MAX_UDP_PAYLOAD = 65507;

/** @brief Bytes of connection token that prefix every UDP packet */
constexpr size_t DATAGRAM_TOKEN_SIZE = 8;

/** @brief Datagrams waiting in the send queue before submissions would block */
constexpr size_t DATAGRAM_SEND_QUEUE_CAPACITY = 1024;

/** @brief Received datagrams buffered before the oldest are discarded */
constexpr size_t DATAGRAM_RECV_QUEUE_CAPACITY = 4096;

/** @brief Stream bytes buffered before stream writes would block */
constexpr size_t STREAM_SEND_BUFFER_LIMIT = 1024 * 1024;

/** @brief Size of the TCP frame header: type(1) stream_id(8) length(4) */
constexpr size_t FRAME_HEADER_SIZE = 13;

/** @brief Largest frame payload accepted from a peer */
constexpr size_t MAX_FRAME_PAYLOAD = 1024 * 1024;

/** @brief Socket send/receive buffer size requested from the kernel */
constexpr int SOCKET_BUFFER_SIZE = 4 * 1024 * 1024;

/** @brief Upper bound on a single poll() wait (milliseconds) */
constexpr int MAX_POLL_WAIT_MS = 100;

/** @brief Listen backlog for the server TCP socket */
constexpr int LISTEN_BACKLOG = 16;

/** @} */ // end of TransportDefaults

//=========================================================================
// TLS
//=========================================================================

/** @defgroup TlsConfig TLS Configuration
 * @{
 */

/** @brief TLS 1.3 cipher suites in preference order */
constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256:TLS_AES_128_GCM_SHA256";

/** @brief Key exchange groups */
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

/** @brief Default server certificate path */
constexpr const char* DEFAULT_CERT_FILE = "./cert.crt";

/** @brief Default server private key path */
constexpr const char* DEFAULT_KEY_FILE = "./cert.key";

/** @brief Validity of a generated self-signed certificate */
constexpr int CERT_VALIDITY_DAYS = 365;

/** @brief Timeout for the blocking TLS and HELLO handshake */
constexpr uint32_t HANDSHAKE_TIMEOUT_MS = 10000;

/** @brief Max TLS record payload */
constexpr size_t TLS_MAX_PACKET_SIZE = 16384;

/** @} */ // end of TlsConfig

//=========================================================================
// Hashing
//=========================================================================

/** @brief SHA-256 produces 32 bytes */
constexpr size_t HASH_SIZE = 32;

/** @brief Read buffer used while hashing files */
constexpr size_t HASH_BUFFER_SIZE = 262144;  // 256 KB

}  // namespace PaceSend
