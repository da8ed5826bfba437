#include "plugctl/config/DeviceTable.hpp"

#include "plugctl/log/Log.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace plugctl::config {

namespace {

ConfigError parseError(const std::string& source, std::string message) {
    return ConfigError{ConfigErrorKind::ParseError, source, std::move(message)};
}

bool isUsableString(const nlohmann::json& value) {
    return value.is_string() && !value.get_ref<const std::string&>().empty();
}

} // namespace

expected<DeviceTable, ConfigError> DeviceTable::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        const int err = errno;
        const std::string reason = err == ENOENT || err == 0
            ? "No such file or directory"
            : std::strerror(err);
        return unexpected(ConfigError{ConfigErrorKind::NotFound, path,
                                      "cannot open config file " + path + ": " + reason});
    }

    std::ostringstream text;
    text << in.rdbuf();
    logInfo("[DeviceTable] read ", path, "\n");
    return parse(text.str(), path);
}

expected<DeviceTable, ConfigError> DeviceTable::parse(const std::string& text,
                                                      const std::string& source) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return unexpected(parseError(source, "In config file " + source + ": " + e.what()));
    }

    if (!document.is_object()) {
        return unexpected(parseError(source, "In config file " + source +
                                     ": top level must be an object of host -> [id, key]"));
    }

    DeviceTable table;
    table.source = source;
    for (const auto& [host, value] : document.items()) {
        table.entries[host] = value;
    }

    logInfo("[DeviceTable] ", table.size(), " device(s) from ", source, "\n");
    return table;
}

expected<std::optional<DeviceCredentials>, ConfigError>
DeviceTable::find(const std::string& host) const {
    const auto it = entries.find(host);
    if (it == entries.end()) {
        return std::optional<DeviceCredentials>{};
    }

    const auto& value = it->second;
    if (!value.is_array() || value.size() < 2 ||
        !isUsableString(value[0]) || !isUsableString(value[1])) {
        return unexpected(parseError(source, "In config file " + source + ": entry for " +
                                     host + " must be [\"<device id>\", \"<device key>\"]"));
    }
    return std::optional<DeviceCredentials>(DeviceCredentials{value[0].get<std::string>(),
                                                              value[1].get<std::string>()});
}

void DeviceTable::insert(std::string host, DeviceCredentials credentials) {
    entries[std::move(host)] = nlohmann::json::array({std::move(credentials.deviceId),
                                                      std::move(credentials.deviceKey)});
}

} // namespace plugctl::config
