#pragma once

namespace plugctl::app::defaults {

constexpr const char* PLUGCTL_VERSION = "0.9";
constexpr const char* PLUGCTL_PROGRAM_NAME = "plugctl";

// JSON device table: { "<fqdn or ip>": ["<device id>", "<local key>"], ... }
constexpr const char* PLUGCTL_DEVICE_TABLE_PATH = "/etc/plugctl/devices.json";

constexpr const char* PLUGCTL_ERROR_PREFIX = "ERROR: ";

} // namespace plugctl::app::defaults
