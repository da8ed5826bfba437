#include "plugctl/tuya/TuyaFrame.hpp"

#include <array>

namespace plugctl::tuya {

using plugctl::schema::ByteView;
using plugctl::schema::DecodeError;

namespace {

std::array<std::uint32_t, 256> makeCrcTable() {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < table.size(); ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
        }
        table[i] = c;
    }
    return table;
}

void appendU32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    plugctl::schema::BeU32{}.write(v, out);
}

std::uint32_t readU32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24)
         | (static_cast<std::uint32_t>(p[1]) << 16)
         | (static_cast<std::uint32_t>(p[2]) << 8)
         |  static_cast<std::uint32_t>(p[3]);
}

} // namespace

std::uint32_t crc32(const std::uint8_t* data, std::size_t size) {
    static const auto table = makeCrcTable();
    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < size; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

expected<std::vector<std::uint8_t>, DecodeError>
encodeFrame(const Frame& frame, Direction direction) {
    const bool withReturnCode = direction == Direction::FromDevice;

    schema::FrameHeader header;
    header.seqno = frame.seqno;
    header.command = frame.command;
    header.length = static_cast<std::uint32_t>(
        frame.payload.size() + config::TUYA_TRAILER_SIZE +
        (withReturnCode ? config::TUYA_RETURN_CODE_SIZE : 0));

    auto out = schema::encodeHeader(header);
    if (!out) {
        return unexpected(out.error());
    }

    if (withReturnCode) {
        appendU32(*out, frame.returnCode);
    }
    out->insert(out->end(), frame.payload.begin(), frame.payload.end());
    appendU32(*out, crc32(out->data(), out->size()));
    appendU32(*out, config::TUYA_FRAME_SUFFIX);
    return out;
}

expected<Frame, DecodeError>
decodeFrameBody(const schema::FrameHeader& header,
                ByteView headerBytes,
                ByteView body,
                Direction direction) {
    const bool withReturnCode = direction == Direction::FromDevice;
    const std::size_t overhead = config::TUYA_TRAILER_SIZE +
        (withReturnCode ? config::TUYA_RETURN_CODE_SIZE : 0);

    if (body.size() != header.length || body.size() < overhead) {
        return unexpected(DecodeError{"length", "body does not match header"});
    }
    if (headerBytes.size() != config::TUYA_HEADER_SIZE) {
        return unexpected(DecodeError{"header", "expected 16 bytes"});
    }

    const std::size_t crcOffset = body.size() - config::TUYA_TRAILER_SIZE;
    if (readU32(body.data() + crcOffset + 4) != config::TUYA_FRAME_SUFFIX) {
        return unexpected(DecodeError{"suffix", "missing 0x0000AA55"});
    }

    std::vector<std::uint8_t> covered(headerBytes.data(), headerBytes.data() + headerBytes.size());
    covered.insert(covered.end(), body.data(), body.data() + crcOffset);
    if (crc32(covered.data(), covered.size()) != readU32(body.data() + crcOffset)) {
        return unexpected(DecodeError{"crc", "checksum mismatch"});
    }

    Frame frame;
    frame.seqno = header.seqno;
    frame.command = header.command;

    std::size_t payloadStart = 0;
    if (withReturnCode) {
        frame.returnCode = readU32(body.data());
        payloadStart = config::TUYA_RETURN_CODE_SIZE;
    }
    frame.payload.assign(body.data() + payloadStart, body.data() + crcOffset);
    return frame;
}

expected<Frame, DecodeError>
decodeFrame(ByteView bytes, Direction direction) {
    auto header = schema::decodeHeader(bytes);
    if (!header) {
        return unexpected(header.error());
    }
    const ByteView rest = bytes.subspan(config::TUYA_HEADER_SIZE);
    if (rest.size() < header->length) {
        return unexpected(DecodeError{"length", "truncated frame"});
    }
    return decodeFrameBody(*header,
                           ByteView(bytes.data(), config::TUYA_HEADER_SIZE),
                           ByteView(rest.data(), header->length),
                           direction);
}

} // namespace plugctl::tuya
