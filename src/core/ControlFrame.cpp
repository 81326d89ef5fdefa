/**
 * @file ControlFrame.cpp
 * @brief Control channel frame encoding
 */

#include "pacesend/ControlFrame.h"
#include "pacesend/ByteOrder.h"

#include <algorithm>

namespace PaceSend {

const char* frameTypeToString(FrameType type) {
    switch (type) {
        case FrameType::HELLO:      return "HELLO";
        case FrameType::HELLO_ACK:  return "HELLO_ACK";
        case FrameType::STREAM:     return "STREAM";
        case FrameType::STREAM_FIN: return "STREAM_FIN";
        case FrameType::CLOSE:      return "CLOSE";
        default:                    return "UNKNOWN";
    }
}

std::array<uint8_t, FRAME_HEADER_SIZE> FrameHeader::encode() const {
    std::array<uint8_t, FRAME_HEADER_SIZE> out{};
    out[0] = static_cast<uint8_t>(type);
    storeLe64(out.data() + 1, streamId);
    storeLe32(out.data() + 9, length);
    return out;
}

bool FrameHeader::decode(const uint8_t* data, size_t size, FrameHeader& out, std::string& errorMsg) {
    if (!data || size < FRAME_HEADER_SIZE) {
        errorMsg = "short frame header";
        return false;
    }

    const uint8_t rawType = data[0];
    if (rawType < static_cast<uint8_t>(FrameType::HELLO) ||
        rawType > static_cast<uint8_t>(FrameType::CLOSE)) {
        errorMsg = "unknown frame type " + std::to_string(rawType);
        return false;
    }

    out.type = static_cast<FrameType>(rawType);
    out.streamId = loadLe64(data + 1);
    out.length = loadLe32(data + 9);

    if (out.length > MAX_FRAME_PAYLOAD) {
        errorMsg = "frame length " + std::to_string(out.length) + " exceeds limit";
        return false;
    }
    return true;
}

void appendFrame(std::vector<uint8_t>& out,
                 FrameType type,
                 uint64_t streamId,
                 const uint8_t* payload,
                 size_t payloadSize)
{
    FrameHeader hdr;
    hdr.type = type;
    hdr.streamId = streamId;
    hdr.length = static_cast<uint32_t>(payloadSize);

    const auto encoded = hdr.encode();
    out.insert(out.end(), encoded.begin(), encoded.end());
    if (payloadSize > 0) {
        out.insert(out.end(), payload, payload + payloadSize);
    }
}

std::vector<uint8_t> HelloPayload::encode() const {
    std::vector<uint8_t> out(SIZE);
    storeLe64(out.data(), token);
    out[8] = static_cast<uint8_t>(udpPort & 0xFF);
    out[9] = static_cast<uint8_t>((udpPort >> 8) & 0xFF);
    return out;
}

bool HelloPayload::decode(const uint8_t* data, size_t size, HelloPayload& out) {
    if (!data || size != SIZE) {
        return false;
    }
    out.token = loadLe64(data);
    out.udpPort = static_cast<uint16_t>(data[8] | (static_cast<uint16_t>(data[9]) << 8));
    return true;
}

std::vector<uint8_t> ClosePayload::encode() const {
    std::vector<uint8_t> out(8 + reason.size());
    storeLe64(out.data(), code);
    std::copy(reason.begin(), reason.end(), out.begin() + 8);
    return out;
}

bool ClosePayload::decode(const uint8_t* data, size_t size, ClosePayload& out) {
    if (!data || size < 8) {
        return false;
    }
    out.code = loadLe64(data);
    out.reason.assign(reinterpret_cast<const char*>(data + 8), size - 8);
    return true;
}

}  // namespace PaceSend
