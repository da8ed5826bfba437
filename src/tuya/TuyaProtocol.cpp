#include "plugctl/tuya/TuyaProtocol.hpp"

#include <chrono>

namespace plugctl::tuya::protocol {

using plugctl::schema::ByteView;
using plugctl::schema::DecodeError;

const char* describe(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidJson:  return "Invalid JSON Response from Device";
        case ErrorCode::Connect:      return "Network Error: Unable to Connect";
        case ErrorCode::Timeout:      return "Timeout Waiting for Device";
        case ErrorCode::Range:        return "Specified Value Out of Range";
        case ErrorCode::Payload:      return "Unexpected Payload from Device";
        case ErrorCode::Offline:      return "Network Error: Device Unreachable";
        case ErrorCode::State:        return "Device in Unknown State";
        case ErrorCode::Function:     return "Function Not Supported by Device";
        case ErrorCode::DeviceType:   return "Device22 Detected: Retry Command";
        case ErrorCode::KeyOrVersion: return "Check device key or version";
    }
    return "Unknown Error";
}

device::TransportRecord errorRecord(ErrorCode code, std::string_view payload) {
    device::TransportRecord record = nlohmann::json::object();
    record[device::keys::ERROR_MESSAGE] = describe(code);
    record[device::keys::ERROR_CODE] = std::to_string(static_cast<int>(code));
    if (payload.empty()) {
        record[device::keys::ERROR_PAYLOAD] = nullptr;
    } else {
        record[device::keys::ERROR_PAYLOAD] = std::string(payload);
    }
    return record;
}

std::string timestamp() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

nlohmann::json dpQueryBody(const std::string& deviceId) {
    return {
        {"gwId", deviceId},
        {"devId", deviceId},
        {"uid", deviceId},
        {"t", timestamp()}
    };
}

nlohmann::json controlBody(const std::string& deviceId, const nlohmann::json& dps) {
    return {
        {"devId", deviceId},
        {"uid", deviceId},
        {"t", timestamp()},
        {"dps", dps}
    };
}

bool needsVersionHeader(Command command) {
    switch (command) {
        case Command::DpQuery:
        case Command::DpQueryNew:
        case Command::HeartBeat:
            return false;
        default:
            return true;
    }
}

expected<std::vector<std::uint8_t>, DecodeError>
sealPayload(Command command, const nlohmann::json& body,
            const TuyaCipher& cipher, std::string_view version) {
    auto sealed = cipher.encrypt(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    if (!sealed) {
        return unexpected(sealed.error());
    }
    if (!needsVersionHeader(command)) {
        return sealed;
    }

    std::vector<std::uint8_t> out(version.begin(), version.end());
    out.resize(config::TUYA_VERSION_HEADER_SIZE, 0);
    out.insert(out.end(), sealed->begin(), sealed->end());
    return out;
}

expected<std::string, DecodeError>
openPayload(ByteView payload, const TuyaCipher& cipher, std::string_view version) {
    if (payload.size() >= version.size() &&
        std::string_view(reinterpret_cast<const char*>(payload.data()), version.size()) == version) {
        payload = payload.subspan(config::TUYA_VERSION_HEADER_SIZE);
    }
    if (payload.size() == 0) {
        return std::string{};
    }
    if (payload[0] == '{') {
        return std::string(payload.data(), payload.data() + payload.size());
    }
    return cipher.decrypt(payload);
}

} // namespace plugctl::tuya::protocol
