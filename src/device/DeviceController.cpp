#include "plugctl/device/DeviceController.hpp"

#include "plugctl/log/Log.hpp"

#include <string>
#include <utility>

namespace plugctl::device {

namespace {

// Key of the primary outlet channel inside "dps".
const std::string kSwitchDataPoint = "1";

std::string codeText(const TransportRecord& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

} // namespace

std::optional<DeviceError> errorFromRecord(const TransportRecord& record) {
    if (!record.is_object()) {
        return DeviceError{"904", "Unexpected Payload from Device"};
    }
    const auto message = record.find(keys::ERROR_MESSAGE);
    if (message == record.end()) {
        return std::nullopt;
    }

    DeviceError error;
    error.message = codeText(*message);
    if (const auto code = record.find(keys::ERROR_CODE); code != record.end()) {
        error.code = codeText(*code);
    }
    return error;
}

expected<DeviceController, DeviceError>
DeviceController::create(core::DeviceIdentity identity, std::unique_ptr<OutletTransport> transport) {
    if (!identity.isComplete()) {
        return unexpected(DeviceError{{}, "incomplete device identity for '" + identity.host() +
                                          "': host, device id and key are all required"});
    }
    if (!transport) {
        return unexpected(DeviceError{{}, "no transport for " + identity.host()});
    }
    return DeviceController(std::move(identity), std::move(transport));
}

DeviceController::DeviceController(core::DeviceIdentity identity,
                                   std::unique_ptr<OutletTransport> transport)
: identity_(std::move(identity))
, transport(std::move(transport))
{}

expected<DeviceState, DeviceError> DeviceController::getState() {
    const auto record = transport->status();
    if (auto error = errorFromRecord(record)) {
        logError("[DeviceController] status of ", identity_.host(), " failed: ",
                 error->describe(), "\n");
        return unexpected(std::move(*error));
    }

    const auto dps = record.find(keys::DATA_POINTS);
    if (dps == record.end() || !dps->is_object()) {
        return unexpected(DeviceError{"904", "Unexpected Payload from Device"});
    }
    // Some firmwares report the switch as 0/1 rather than false/true.
    const auto primary = dps->find(kSwitchDataPoint);
    if (primary == dps->end() || !(primary->is_boolean() || primary->is_number())) {
        return unexpected(DeviceError{"904", "Unexpected Payload from Device"});
    }

    const bool on = primary->is_boolean() ? primary->get<bool>() : primary->get<double>() != 0.0;
    const auto state = on ? DeviceState::On : DeviceState::Off;
    logInfo("[DeviceController] ", identity_.host(), " is ", toString(state), "\n");
    return state;
}

expected<void, DeviceError> DeviceController::setState(DeviceState target) {
    const auto record = transport->setStatus(target == DeviceState::On);
    if (auto error = errorFromRecord(record)) {
        logError("[DeviceController] switching ", identity_.host(), " ", toString(target),
                 " failed: ", error->describe(), "\n");
        return unexpected(std::move(*error));
    }
    logInfo("[DeviceController] ", identity_.host(), " switched ", toString(target), "\n");
    return {};
}

expected<DeviceState, DeviceError> DeviceController::toggle() {
    auto current = getState();
    if (!current) {
        return unexpected(current.error());
    }

    const auto next = complement(*current);
    if (auto written = setState(next); !written) {
        return unexpected(written.error());
    }
    return next;
}

} // namespace plugctl::device
