#pragma once

namespace plugctl::device {

enum class DeviceState : int {
    Off = 0,
    On = 1
};

inline DeviceState complement(DeviceState state) {
    return state == DeviceState::On ? DeviceState::Off : DeviceState::On;
}

inline int toInt(DeviceState state) {
    return static_cast<int>(state);
}

inline const char* toString(DeviceState state) {
    return state == DeviceState::On ? "on" : "off";
}

} // namespace plugctl::device
