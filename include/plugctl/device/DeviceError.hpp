#pragma once

#include <string>

namespace plugctl::device {

/**
 * @brief The single failure kind of the device layer.
 *
 * `code` and `message` are copied verbatim from the transport's error
 * indicator, so "unreachable" and "rejected" are told apart only by code.
 */
struct DeviceError {
    std::string code;
    std::string message;

    std::string describe() const {
        return code.empty() ? message : code + ": " + message;
    }
};

} // namespace plugctl::device
