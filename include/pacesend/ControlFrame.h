/**
 * @file ControlFrame.h
 * @brief Frames carried on the TCP/TLS control channel
 *
 * Every frame starts with a 13-byte header:
 *
 * | offset | field     | width |
 * |--------|-----------|-------|
 * | 0      | type      | 1     |
 * | 1      | stream_id | 8     |
 * | 9      | length    | 4     |
 *
 * All integers are little-endian. `length` payload bytes follow.
 */

#pragma once

#include "config.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace PaceSend {

enum class FrameType : uint8_t {
    HELLO = 1,       ///< Client -> server: token u64 | udp_port u16
    HELLO_ACK = 2,   ///< Server -> client: token u64 (echo)
    STREAM = 3,      ///< Stream data
    STREAM_FIN = 4,  ///< Final stream data (payload may be empty)
    CLOSE = 5        ///< code u64 | reason bytes
};

const char* frameTypeToString(FrameType type);

struct FrameHeader {
    FrameType type = FrameType::STREAM;
    uint64_t streamId = 0;
    uint32_t length = 0;

    std::array<uint8_t, FRAME_HEADER_SIZE> encode() const;

    /**
     * @brief Decode a header
     * @return false if fewer than FRAME_HEADER_SIZE bytes, the type is unknown,
     *         or the length exceeds MAX_FRAME_PAYLOAD
     */
    static bool decode(const uint8_t* data, size_t size, FrameHeader& out, std::string& errorMsg);
};

/**
 * @brief Append a complete frame (header + payload) to out
 */
void appendFrame(std::vector<uint8_t>& out,
                 FrameType type,
                 uint64_t streamId,
                 const uint8_t* payload,
                 size_t payloadSize);

struct HelloPayload {
    uint64_t token = 0;
    uint16_t udpPort = 0;

    static constexpr size_t SIZE = 10;

    std::vector<uint8_t> encode() const;
    static bool decode(const uint8_t* data, size_t size, HelloPayload& out);
};

struct ClosePayload {
    uint64_t code = 0;
    std::string reason;

    std::vector<uint8_t> encode() const;
    static bool decode(const uint8_t* data, size_t size, ClosePayload& out);
};

}  // namespace PaceSend
