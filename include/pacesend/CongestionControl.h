/**
 * @file CongestionControl.h
 * @brief Congestion-control algorithm names passed through to the transport
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace PaceSend {

enum class CongestionControl : uint8_t {
    CUBIC = 0,
    BBR = 1,
    COPA = 2,
    RENO = 3
};

/**
 * @brief Canonical display name ("Cubic", "Bbr", "Copa", "Reno")
 */
const char* congestionControlToString(CongestionControl algorithm);

/**
 * @brief Name understood by the Linux TCP_CONGESTION socket option
 */
const char* congestionControlKernelName(CongestionControl algorithm);

/**
 * @brief Parse an algorithm name (case-insensitive)
 * @throws std::runtime_error carrying ErrorCodes::CONFIG_UNKNOWN_ALGORITHM
 */
CongestionControl parseCongestionControlOrThrow(const std::string& name);

}  // namespace PaceSend
