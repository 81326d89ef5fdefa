/**
 * @file CongestionControl.cpp
 * @brief Congestion-control name parsing
 */

#include "pacesend/CongestionControl.h"
#include "pacesend/ErrorCodes.h"

#include <cctype>

namespace PaceSend {

const char* congestionControlToString(CongestionControl algorithm) {
    switch (algorithm) {
        case CongestionControl::CUBIC: return "Cubic";
        case CongestionControl::BBR:   return "Bbr";
        case CongestionControl::COPA:  return "Copa";
        case CongestionControl::RENO:  return "Reno";
        default:                       return "Unknown";
    }
}

const char* congestionControlKernelName(CongestionControl algorithm) {
    switch (algorithm) {
        case CongestionControl::CUBIC: return "cubic";
        case CongestionControl::BBR:   return "bbr";
        // No Copa module ships with Linux; the kernel rejects it and the
        // socket keeps its default.
        case CongestionControl::COPA:  return "copa";
        case CongestionControl::RENO:  return "reno";
        default:                       return "";
    }
}

CongestionControl parseCongestionControlOrThrow(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "cubic") {
        return CongestionControl::CUBIC;
    }
    if (lower == "bbr") {
        return CongestionControl::BBR;
    }
    if (lower == "copa") {
        return CongestionControl::COPA;
    }
    if (lower == "reno") {
        return CongestionControl::RENO;
    }

    throw std::runtime_error(std::string(ErrorCodes::CONFIG_UNKNOWN_ALGORITHM) +
                             ": unknown congestion control algorithm: " + name);
}

}  // namespace PaceSend
