/**
 * @file TransferHeader.cpp
 * @brief Chunk header codec
 */

#include "pacesend/TransferHeader.h"
#include "pacesend/ByteOrder.h"

#include <cstring>

namespace PaceSend {

namespace {
    constexpr size_t OFF_TRANSFER_ID = 0;
    constexpr size_t OFF_TOTAL_SIZE = 8;
    constexpr size_t OFF_OFFSET = 16;
    constexpr size_t OFF_LENGTH = 24;
    constexpr size_t OFF_FLAGS = 28;
    constexpr size_t OFF_PADDING = 29;
    constexpr size_t PADDING_BYTES = 3;
    constexpr size_t OFF_TIMESTAMP = 32;
}

const char* codecErrorToString(CodecError error) {
    switch (error) {
        case CodecError::NONE:         return "none";
        case CodecError::SHORT_BUFFER: return "short buffer";
        default:                       return "unknown";
    }
}

void TransferHeader::encodeTo(uint8_t* buffer) const {
    storeLe64(buffer + OFF_TRANSFER_ID, transferId);
    storeLe64(buffer + OFF_TOTAL_SIZE, totalSize);
    storeLe64(buffer + OFF_OFFSET, offset);
    storeLe32(buffer + OFF_LENGTH, length);
    buffer[OFF_FLAGS] = flags;
    std::memset(buffer + OFF_PADDING, 0, PADDING_BYTES);
    storeLe64(buffer + OFF_TIMESTAMP, timestampNs);
}

std::array<uint8_t, CHUNK_HEADER_SIZE> TransferHeader::encode() const {
    std::array<uint8_t, CHUNK_HEADER_SIZE> out{};
    encodeTo(out.data());
    return out;
}

CodecError decodeChunk(const uint8_t* data, size_t size, DecodedChunk& out) {
    if (!data || size < CHUNK_HEADER_SIZE) {
        return CodecError::SHORT_BUFFER;
    }

    out.header.transferId = loadLe64(data + OFF_TRANSFER_ID);
    out.header.totalSize = loadLe64(data + OFF_TOTAL_SIZE);
    out.header.offset = loadLe64(data + OFF_OFFSET);
    out.header.length = loadLe32(data + OFF_LENGTH);
    out.header.flags = data[OFF_FLAGS];
    out.header.timestampNs = loadLe64(data + OFF_TIMESTAMP);

    out.payload = data + CHUNK_HEADER_SIZE;
    out.payloadSize = size - CHUNK_HEADER_SIZE;
    return CodecError::NONE;
}

std::vector<uint8_t> frameChunk(const TransferHeader& header,
                                const uint8_t* payload,
                                size_t payloadSize)
{
    std::vector<uint8_t> packet(CHUNK_HEADER_SIZE + payloadSize);
    header.encodeTo(packet.data());
    if (payload && payloadSize > 0) {
        std::memcpy(packet.data() + CHUNK_HEADER_SIZE, payload, payloadSize);
    }
    return packet;
}

}  // namespace PaceSend
