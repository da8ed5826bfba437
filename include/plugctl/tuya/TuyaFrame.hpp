#pragma once

#include "plugctl/core/Expected.hpp"
#include "plugctl/schema/plugctl_schema.hpp"
#include "plugctl/tuya/tuya_schema.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace plugctl::tuya {

enum class Command : std::uint32_t {
    Control    = 7,
    Status     = 8,
    HeartBeat  = 9,
    DpQuery    = 10,
    ControlNew = 13,
    DpQueryNew = 16
};

/// Frames sent by a device carry a return code between header and payload.
enum class Direction {
    ToDevice,
    FromDevice
};

struct Frame {
    std::uint32_t seqno = 0;
    std::uint32_t command = 0;
    std::uint32_t returnCode = 0;
    std::vector<std::uint8_t> payload;
};

/// CRC-32 (IEEE, reflected, as zlib computes it).
std::uint32_t crc32(const std::uint8_t* data, std::size_t size);

/// Serialise a complete frame: header, optional return code, payload, crc, suffix.
expected<std::vector<std::uint8_t>, schema::DecodeError>
encodeFrame(const Frame& frame, Direction direction);

/**
 * @brief Decode the part of a frame that follows the 16-byte header.
 *
 * `body` must be exactly `header.length` bytes. The CRC covers the header
 * bytes too, so they are passed back in as `headerBytes`.
 */
expected<Frame, schema::DecodeError>
decodeFrameBody(const schema::FrameHeader& header,
                plugctl::schema::ByteView headerBytes,
                plugctl::schema::ByteView body,
                Direction direction);

/// Convenience for tests and buffers that already hold a whole frame.
expected<Frame, schema::DecodeError>
decodeFrame(plugctl::schema::ByteView bytes, Direction direction);

} // namespace plugctl::tuya
