/**
 * @file ByteOrder.h
 * @brief Little-endian load/store helpers for wire encoding
 */

#pragma once

#include <cstdint>

namespace PaceSend {

inline void storeLe32(uint8_t* out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline void storeLe64(uint8_t* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

inline uint32_t loadLe32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | in[i];
    }
    return value;
}

inline uint64_t loadLe64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | in[i];
    }
    return value;
}

}  // namespace PaceSend
