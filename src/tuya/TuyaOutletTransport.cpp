/**
 * @brief Request/response exchange with a Tuya 3.3 outlet: connect, frame, retry, decode.
 */
#include "plugctl/tuya/TuyaOutletTransport.hpp"

#include "plugctl/log/Log.hpp"
#include "plugctl/net/Resolve.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

namespace plugctl::tuya {

using device::TransportRecord;
using plugctl::schema::ByteView;
namespace asio = plugctl::net::asio;

namespace {

protocol::ErrorCode classify(const std::error_code& ec, protocol::ErrorCode otherwise) {
    return ec == asio::error::timed_out ? protocol::ErrorCode::Timeout : otherwise;
}

} // namespace

TuyaOutletTransport::TuyaOutletTransport(TuyaSettings settings)
: settings_(std::move(settings))
, cipher(settings_.localKey)
{}

TuyaOutletTransport::~TuyaOutletTransport() {
    tcpClient.close();
}

TransportRecord TuyaOutletTransport::status() {
    if (device22) {
        return exchange(Command::ControlNew,
                        protocol::controlBody(settings_.deviceId,
                                              {{std::to_string(config::TUYA_PRIMARY_SWITCH), nullptr}}));
    }

    auto record = exchange(Command::DpQuery, protocol::dpQueryBody(settings_.deviceId));
    const auto deviceTypeCode = std::to_string(static_cast<int>(ErrorCode::DeviceType));
    if (record.value(device::keys::ERROR_CODE, std::string{}) != deviceTypeCode) {
        return record;
    }

    logInfo("[TuyaOutletTransport] ", settings_.address,
            " needs device22 queries, retrying\n");
    device22 = true;
    return status();
}

TransportRecord TuyaOutletTransport::setStatus(bool on, int switchIndex) {
    return exchange(Command::Control,
                    protocol::controlBody(settings_.deviceId,
                                          {{std::to_string(switchIndex), on}}));
}

TransportRecord TuyaOutletTransport::exchange(Command command, const nlohmann::json& body) {
    auto payload = protocol::sealPayload(command, body, cipher, settings_.version);
    if (!payload) {
        logError("[TuyaOutletTransport] cannot encrypt request: ",
                 payload.error().where, " ", payload.error().what, "\n");
        return protocol::errorRecord(ErrorCode::KeyOrVersion, payload.error().what);
    }

    Frame request;
    request.seqno = nextSeqno++;
    request.command = static_cast<std::uint32_t>(command);
    request.payload = std::move(*payload);

    auto wire = encodeFrame(request, Direction::ToDevice);
    if (!wire) {
        return protocol::errorRecord(ErrorCode::Payload, wire.error().what);
    }

    const int attempts = std::max(1, settings_.socketRetryLimit);
    ErrorCode failure = ErrorCode::Connect;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            std::this_thread::sleep_for(settings_.retryBackoff);
        }

        if (auto connected = ensureConnected(); !connected) {
            failure = connected.error();
            continue;
        }

        logInfo("[TuyaOutletTransport] TX cmd=", request.command, " seq=", request.seqno,
                " bytes=", wire->size(), " attempt ", attempt, "/", attempts, "\n");

        if (auto ec = tcpClient.write_all(wire->data(), wire->size(), settings_.socketTimeout); ec) {
            logError("[TuyaOutletTransport] write failed: ", ec.message(), "\n");
            failure = classify(ec, ErrorCode::Offline);
            tcpClient.close();
            continue;
        }

        auto reply = awaitReply(command);
        if (!reply) {
            failure = reply.error();
            tcpClient.close();
            continue;
        }

        return interpret(*reply);
    }

    logError("[TuyaOutletTransport] giving up on ", settings_.address, " after ",
             attempts, " attempt(s): ", protocol::describe(failure), "\n");
    return protocol::errorRecord(failure);
}

expected<void, protocol::ErrorCode> TuyaOutletTransport::ensureConnected() {
    if (tcpClient.is_open()) {
        return {};
    }

    net::tcp::resolver::results_type endpoints;
    if (auto ec = net::resolve(*net::shared_io_context(), settings_.address,
                               std::to_string(settings_.port), endpoints); ec) {
        logError("[TuyaOutletTransport] cannot resolve ", settings_.address, ": ",
                 ec.message(), "\n");
        return unexpected(ErrorCode::Connect);
    }

    if (auto ec = tcpClient.connect(endpoints, settings_.socketTimeout); ec) {
        logError("[TuyaOutletTransport] connect to ", settings_.address, ":", settings_.port,
                 " failed: ", ec.message(), " timeout=", settings_.socketTimeout.count(), "ms\n");
        tcpClient.close();
        return unexpected(ec == asio::error::timed_out ? ErrorCode::Offline : ErrorCode::Connect);
    }

    tcpClient.setNoDelay();
    logInfo("[TuyaOutletTransport] connected to ", settings_.address, ":", settings_.port, "\n");
    return {};
}

expected<Frame, protocol::ErrorCode> TuyaOutletTransport::receiveFrame() {
    std::array<std::uint8_t, config::TUYA_HEADER_SIZE> headerBytes{};
    if (auto ec = tcpClient.read_exact(headerBytes.data(), headerBytes.size(), settings_.socketTimeout); ec) {
        logError("[TuyaOutletTransport] RX header: ", ec.message(), "\n");
        return unexpected(classify(ec, ErrorCode::Offline));
    }

    auto header = schema::decodeHeader(ByteView(headerBytes));
    if (!header) {
        logError("[TuyaOutletTransport] bad header: ", header.error().where, " ",
                 header.error().what, "\n");
        return unexpected(ErrorCode::Payload);
    }

    std::vector<std::uint8_t> body(header->length);
    if (auto ec = tcpClient.read_exact(body.data(), body.size(), settings_.socketTimeout); ec) {
        logError("[TuyaOutletTransport] RX body: ", ec.message(), "\n");
        return unexpected(classify(ec, ErrorCode::Offline));
    }

    auto frame = decodeFrameBody(*header, ByteView(headerBytes), ByteView(body), Direction::FromDevice);
    if (!frame) {
        logError("[TuyaOutletTransport] bad frame: ", frame.error().where, " ",
                 frame.error().what, "\n");
        return unexpected(ErrorCode::Payload);
    }

    logInfo("[TuyaOutletTransport] RX cmd=", frame->command, " seq=", frame->seqno,
            " rc=", frame->returnCode, " payload=", frame->payload.size(), " bytes\n");
    return frame;
}

expected<Frame, protocol::ErrorCode> TuyaOutletTransport::awaitReply(Command command) {
    // A switch command is acknowledged with an empty frame; queries need data.
    const bool needsData = command != Command::Control;

    for (int seen = 0; seen <= config::TUYA_MAX_STRAY_FRAMES; ++seen) {
        auto frame = receiveFrame();
        if (!frame) {
            return frame;
        }
        if (!answers(command, frame->command)) {
            logInfo("[TuyaOutletTransport] skipping unsolicited cmd=", frame->command, "\n");
            continue;
        }
        if (needsData && frame->payload.empty() && frame->returnCode == 0) {
            continue;
        }
        return frame;
    }
    return unexpected(ErrorCode::Payload);
}

TransportRecord TuyaOutletTransport::interpret(const Frame& reply) {
    if (reply.payload.empty()) {
        if (reply.returnCode != 0) {
            return protocol::errorRecord(ErrorCode::Payload,
                                         "return code " + std::to_string(reply.returnCode));
        }
        return nlohmann::json::object();
    }

    auto text = protocol::openPayload(ByteView(reply.payload), cipher, settings_.version);
    if (!text) {
        logError("[TuyaOutletTransport] cannot decrypt reply: ", text.error().what, "\n");
        return protocol::errorRecord(ErrorCode::KeyOrVersion, text.error().what);
    }
    if (text->empty()) {
        return nlohmann::json::object();
    }
    if (text->find(protocol::DEVICE22_MARKER) != std::string::npos) {
        return protocol::errorRecord(ErrorCode::DeviceType, *text);
    }

    auto parsed = nlohmann::json::parse(*text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return protocol::errorRecord(ErrorCode::InvalidJson, *text);
    }
    return parsed;
}

bool TuyaOutletTransport::answers(Command request, std::uint32_t replyCommand) {
    const auto status = static_cast<std::uint32_t>(Command::Status);
    switch (request) {
        case Command::Control:
        case Command::ControlNew:
            return replyCommand == static_cast<std::uint32_t>(request) || replyCommand == status;
        default:
            return replyCommand == static_cast<std::uint32_t>(request);
    }
}

std::unique_ptr<device::OutletTransport> makeTuyaTransport(const core::DeviceIdentity& identity) {
    TuyaSettings settings;
    settings.deviceId = identity.deviceId();
    settings.address = identity.host();
    settings.localKey = identity.deviceKey();
    return std::make_unique<TuyaOutletTransport>(std::move(settings));
}

} // namespace plugctl::tuya
