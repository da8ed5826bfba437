#pragma once
// Tuya frame header layout for plugctl::schema.
//
//  0..3   prefix   0x000055AA
//  4..7   seqno
//  8..11  command
// 12..15  length   bytes that follow the header (return code, payload, crc, suffix)
//
// All fields big-endian.

#include <cstdint>
#include <vector>

#include "plugctl/schema/plugctl_schema.hpp"
#include "plugctl/tuya/TuyaConfig.hpp"

namespace plugctl::tuya::schema {

struct FrameHeader {
    std::uint32_t prefix = config::TUYA_FRAME_PREFIX;
    std::uint32_t seqno = 0;
    std::uint32_t command = 0;
    std::uint32_t length = 0;
};

using namespace plugctl::schema;
using plugctl::schema::expected;
using plugctl::schema::unexpected;

inline auto headerRules = objectValidator([](const FrameHeader& h)
    -> expected<void, DecodeError>
{
    if (h.length < config::TUYA_TRAILER_SIZE) {
        return unexpected<DecodeError>({"length", "shorter than trailer"});
    }
    return {};
});

inline const auto frameHeaderSchema = makeSchema<FrameHeader>(std::make_tuple(
    field<&FrameHeader::prefix >("prefix" , BeU32{}, Equals<config::TUYA_FRAME_PREFIX>{}),
    field<&FrameHeader::seqno  >("seqno"  , BeU32{}),
    field<&FrameHeader::command>("command", BeU32{}),
    field<&FrameHeader::length >("length" , BeU32{}, AtMost<config::TUYA_MAX_FRAME_LENGTH>{})
), headerRules);

static_assert(config::TUYA_HEADER_SIZE == 16, "header is four u32 fields");

inline expected<FrameHeader, DecodeError> decodeHeader(ByteView view) {
    if (view.size() < config::TUYA_HEADER_SIZE) {
        return unexpected<DecodeError>({"header", "expected 16 bytes"});
    }
    return decode(frameHeaderSchema, view);
}

inline expected<std::vector<std::uint8_t>, DecodeError> encodeHeader(const FrameHeader& h) {
    return encode(frameHeaderSchema, h);
}

} // namespace plugctl::tuya::schema
