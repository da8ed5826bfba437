#pragma once

#include "plugctl/core/DeviceIdentity.hpp"
#include "plugctl/core/Expected.hpp"
#include "plugctl/device/DeviceError.hpp"
#include "plugctl/device/DeviceState.hpp"
#include "plugctl/device/OutletTransport.hpp"

#include <memory>
#include <optional>

namespace plugctl::device {

/**
 * @brief On/off/toggle/state control of one outlet over an `OutletTransport`.
 *
 * Every call is a blocking round trip to the device and may fail; failures
 * carry the transport's error code and message unchanged. Nothing is cached:
 * a failed call leaves no believed state behind.
 *
 * `toggle()` is a read followed by a separate write. If something else
 * switches the outlet in between, toggle writes the complement of the stale
 * reading. There is no locking against this.
 *
 * Built through `create`, which refuses an incomplete identity or a missing
 * transport, so every controller has both.
 */
class DeviceController {
public:
    static expected<DeviceController, DeviceError>
    create(core::DeviceIdentity identity, std::unique_ptr<OutletTransport> transport);

    DeviceController(const DeviceController&) = delete;
    DeviceController& operator=(const DeviceController&) = delete;
    DeviceController(DeviceController&&) = default;
    DeviceController& operator=(DeviceController&&) = default;

    expected<DeviceState, DeviceError> getState();
    expected<void, DeviceError> setState(DeviceState target);

    expected<void, DeviceError> turnOn() { return setState(DeviceState::On); }
    expected<void, DeviceError> turnOff() { return setState(DeviceState::Off); }

    /// Returns the state that was written.
    expected<DeviceState, DeviceError> toggle();

    const core::DeviceIdentity& identity() const { return identity_; }

private:
    DeviceController(core::DeviceIdentity identity, std::unique_ptr<OutletTransport> transport);

    core::DeviceIdentity identity_;
    std::unique_ptr<OutletTransport> transport;
};

/// The error carried by `record`, if it has one.
std::optional<DeviceError> errorFromRecord(const TransportRecord& record);

} // namespace plugctl::device
