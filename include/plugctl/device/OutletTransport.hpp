#pragma once

#include <nlohmann/json.hpp>

namespace plugctl::device {

/**
 * @brief Result of one transport call: a JSON object.
 *
 * Failures are signalled in-band with the keys below; a record without
 * `Error` is a success. Status records carry the data points under `dps`.
 */
using TransportRecord = nlohmann::json;

namespace keys {
constexpr const char* ERROR_MESSAGE = "Error";
constexpr const char* ERROR_CODE = "Err";
constexpr const char* ERROR_PAYLOAD = "Payload";
constexpr const char* DATA_POINTS = "dps";
} // namespace keys

/**
 * @brief Blocking request/response access to one outlet.
 *
 * Implementations own their connection and bounded retry policy. Neither call
 * throws; every failure comes back as an error record.
 */
class OutletTransport {
public:
    virtual ~OutletTransport() = default;

    /// Query all data points.
    virtual TransportRecord status() = 0;

    /// Switch the outlet channel `switchIndex` (data point id) on or off.
    virtual TransportRecord setStatus(bool on, int switchIndex = 1) = 0;
};

} // namespace plugctl::device
