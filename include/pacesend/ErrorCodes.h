/**
 * @file ErrorCodes.h
 * @brief Stable, operator-visible error codes for troubleshooting.
 *
 * These codes are intended to be:
 * - Stable across versions (avoid renaming once shipped)
 * - Short and searchable
 * - Presented alongside a human-readable message
 */

#pragma once

namespace PaceSend {
namespace ErrorCodes {

// Configuration (command line / config file)
inline constexpr const char* CONFIG_INVALID_ARGUMENT = "PSD-CFG-1000";
inline constexpr const char* CONFIG_INVALID_VALUE = "PSD-CFG-1001";
inline constexpr const char* CONFIG_UNKNOWN_ALGORITHM = "PSD-CFG-1002";
inline constexpr const char* CONFIG_FILE_ERROR = "PSD-CFG-1003";

// Transfer (sender / receiver sessions)
inline constexpr const char* TRANSFER_SOURCE_UNREADABLE = "PSD-XFR-2000";
inline constexpr const char* TRANSFER_OUTPUT_UNWRITABLE = "PSD-XFR-2001";

// Transport (socket backend)
inline constexpr const char* TRANSPORT_CONNECT_FAILED = "PSD-NET-3000";
inline constexpr const char* TRANSPORT_HANDSHAKE_FAILED = "PSD-NET-3001";
inline constexpr const char* TRANSPORT_TLS_ERROR = "PSD-NET-3002";

}  // namespace ErrorCodes
}  // namespace PaceSend
