#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace plugctl::tuya::config {

/**
 * @brief Constants for the Tuya local protocol as spoken by 3.3 firmware.
 *
 * Retry and timeout defaults are the values the outlet controller is
 * expected to run with; `TuyaSettings` copies them and tests shrink them.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short TUYA_PORT_DEFAULT = 6668;
constexpr const char* TUYA_PROTOCOL_VERSION = "3.3";
constexpr int TUYA_SOCKET_RETRY_LIMIT = 4;
constexpr std::chrono::milliseconds TUYA_SOCKET_TIMEOUT{4000};
constexpr std::chrono::milliseconds TUYA_RETRY_BACKOFF{100};

// Framing ---------------------------------------------------------------------
constexpr std::uint32_t TUYA_FRAME_PREFIX = 0x000055AAu;
constexpr std::uint32_t TUYA_FRAME_SUFFIX = 0x0000AA55u;
constexpr std::size_t TUYA_HEADER_SIZE = 16;          // prefix, seqno, command, length
constexpr std::size_t TUYA_TRAILER_SIZE = 8;          // crc32, suffix
constexpr std::size_t TUYA_RETURN_CODE_SIZE = 4;      // device-to-client frames only
constexpr std::uint32_t TUYA_MAX_FRAME_LENGTH = 0x1000u;
constexpr std::size_t TUYA_VERSION_HEADER_SIZE = 15;  // "3.3" + 12 zero bytes

// Unrelated frames (heartbeats, async pushes) tolerated while awaiting a reply.
constexpr int TUYA_MAX_STRAY_FRAMES = 4;

// Data point of the outlet's primary switch.
constexpr int TUYA_PRIMARY_SWITCH = 1;

// Payload encryption ----------------------------------------------------------
constexpr std::size_t TUYA_LOCAL_KEY_SIZE = 16;       // AES-128
constexpr std::size_t TUYA_AES_BLOCK_SIZE = 16;

} // namespace plugctl::tuya::config
