#include "plugctl/config/ConfigResolver.hpp"

#include "plugctl/log/Log.hpp"

#include <utility>

namespace plugctl::config {

namespace {

bool present(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

} // namespace

DeviceTableLoader fileTableLoader(std::string path) {
    return [path = std::move(path)]() { return DeviceTable::load(path); };
}

expected<core::DeviceIdentity, ConfigError>
ConfigResolver::resolve(const std::string& host,
                        const CredentialOverrides& overrides,
                        const DeviceTableLoader& loadTable) const {
    if (present(overrides.deviceId) && present(overrides.deviceKey)) {
        return core::DeviceIdentity(host, *overrides.deviceId, *overrides.deviceKey);
    }

    if (!loadTable) {
        return unexpected(ConfigError{ConfigErrorKind::NotFound, {},
                                      "no device table configured"});
    }
    auto table = loadTable();
    if (!table) {
        return unexpected(table.error());
    }

    const std::string canonical = canonicalizer.canonicalize(host);
    const auto found = table->find(canonical);
    if (!found) {
        return unexpected(found.error());
    }
    const auto& entry = *found;
    if (!entry) {
        logInfo("[ConfigResolver] ", host, " (", canonical, ") not in device table\n");
        return unexpected(ConfigError{
            ConfigErrorKind::UnknownHost, host,
            "no entry in device table for host/ip: " + host +
            "\nPlease specify --key and --id for this host."});
    }

    logInfo("[ConfigResolver] ", host, " matched table entry ", canonical, "\n");
    return core::DeviceIdentity(
        host,
        present(overrides.deviceId) ? *overrides.deviceId : entry->deviceId,
        present(overrides.deviceKey) ? *overrides.deviceKey : entry->deviceKey);
}

} // namespace plugctl::config
