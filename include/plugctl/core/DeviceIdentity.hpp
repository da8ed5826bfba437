#pragma once

#include <string>
#include <utility>

namespace plugctl::core {

/**
 * @brief Everything needed to address one outlet: where it is and how to talk to it.
 *
 * Immutable once built. `ConfigResolver` only produces identities whose id
 * and key are non-empty.
 */
class DeviceIdentity {
public:
    DeviceIdentity(std::string host, std::string deviceId, std::string deviceKey)
    : host_(std::move(host))
    , deviceId_(std::move(deviceId))
    , deviceKey_(std::move(deviceKey))
    {}

    /// Host name or address exactly as the user gave it.
    const std::string& host() const { return host_; }
    const std::string& deviceId() const { return deviceId_; }
    const std::string& deviceKey() const { return deviceKey_; }

    bool isComplete() const {
        return !host_.empty() && !deviceId_.empty() && !deviceKey_.empty();
    }

private:
    std::string host_;
    std::string deviceId_;
    std::string deviceKey_;
};

} // namespace plugctl::core
