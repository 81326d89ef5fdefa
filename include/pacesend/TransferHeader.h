/**
 * @file TransferHeader.h
 * @brief Binary header carried in front of every datagram chunk
 */

#pragma once

#include "config.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace PaceSend {

/**
 * @brief Result of decoding a chunk header
 */
enum class CodecError : uint8_t {
    NONE = 0,        ///< Header decoded
    SHORT_BUFFER = 1 ///< Fewer than CHUNK_HEADER_SIZE bytes supplied
};

/**
 * @brief Human-readable name for a codec error
 */
const char* codecErrorToString(CodecError error);

/**
 * @brief Header for one chunk of a file sent as an unreliable message
 *
 * Header Layout (40 bytes, little-endian):
 * - Offset 0-7:   Transfer id
 * - Offset 8-15:  Total file size
 * - Offset 16-23: Chunk offset within the file
 * - Offset 24-27: Payload length
 * - Offset 28:    Flags (bit 0 = last chunk)
 * - Offset 29-31: Padding (zero)
 * - Offset 32-39: Sender monotonic timestamp (ns)
 *
 * The payload follows immediately after byte 39. There is no checksum;
 * integrity beyond what the transport guarantees is not verified.
 */
struct TransferHeader {
    uint64_t transferId = 0;
    uint64_t totalSize = 0;
    uint64_t offset = 0;
    uint32_t length = 0;
    uint8_t flags = 0;
    uint64_t timestampNs = 0;

    bool isLast() const { return (flags & CHUNK_FLAG_LAST) != 0; }

    void setLast(bool last) {
        if (last) {
            flags = static_cast<uint8_t>(flags | CHUNK_FLAG_LAST);
        } else {
            flags = static_cast<uint8_t>(flags & ~CHUNK_FLAG_LAST);
        }
    }

    bool operator==(const TransferHeader& other) const {
        return transferId == other.transferId && totalSize == other.totalSize &&
               offset == other.offset && length == other.length &&
               flags == other.flags && timestampNs == other.timestampNs;
    }

    bool operator!=(const TransferHeader& other) const { return !(*this == other); }

    /**
     * @brief Serialize this header into exactly CHUNK_HEADER_SIZE bytes
     */
    std::array<uint8_t, CHUNK_HEADER_SIZE> encode() const;

    /**
     * @brief Write the header into a caller-provided buffer
     * @param buffer Output buffer (must be at least CHUNK_HEADER_SIZE bytes)
     */
    void encodeTo(uint8_t* buffer) const;
};

/**
 * @brief A decoded chunk: header plus a view of the bytes that followed it
 *
 * payload points into the buffer given to decodeChunk() and is only valid
 * as long as that buffer is.
 */
struct DecodedChunk {
    TransferHeader header;
    const uint8_t* payload = nullptr;
    size_t payloadSize = 0;
};

/**
 * @brief Decode a header from the front of a received message
 * @param data Message bytes
 * @param size Number of bytes available
 * @param out Decoded header and remaining payload view
 * @return CodecError::NONE on success, SHORT_BUFFER if size < CHUNK_HEADER_SIZE
 *
 * The declared length is not checked against payloadSize; callers decide
 * how to treat a short payload.
 */
CodecError decodeChunk(const uint8_t* data, size_t size, DecodedChunk& out);

/**
 * @brief Build a complete datagram: encoded header followed by payload
 */
std::vector<uint8_t> frameChunk(const TransferHeader& header,
                                const uint8_t* payload,
                                size_t payloadSize);

}  // namespace PaceSend
