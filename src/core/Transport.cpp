/**
 * @file Transport.cpp
 * @brief Name helpers for transport enums
 */

#include "pacesend/Transport.h"

#include <cctype>

namespace PaceSend {

const char* channelKindToString(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::DATAGRAM: return "datagram";
        case ChannelKind::STREAM:   return "stream";
        default:                    return "unknown";
    }
}

bool parseChannelKind(const std::string& name, ChannelKind& out) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "datagram" || lower == "dg") {
        out = ChannelKind::DATAGRAM;
        return true;
    }
    if (lower == "stream" || lower == "str") {
        out = ChannelKind::STREAM;
        return true;
    }
    return false;
}

const char* ioStatusToString(IoStatus status) {
    switch (status) {
        case IoStatus::OK:          return "ok";
        case IoStatus::WOULD_BLOCK: return "would block";
        case IoStatus::FAILED:      return "failed";
        default:                    return "unknown";
    }
}

}  // namespace PaceSend
