#pragma once

#include "plugctl/config/ConfigError.hpp"
#include "plugctl/core/Expected.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace plugctl::config {

struct DeviceCredentials {
    std::string deviceId;
    std::string deviceKey;
};

/**
 * @brief Host name to credentials mapping read from a JSON file.
 *
 * File format, keys being fully qualified names or literal addresses:
 *
 *     {
 *       "plug0.home.lan": ["7553155390339f8fa571", "f201b3618e4f3f10"],
 *       "192.168.1.40":   ["744315537003af8f9571", "f94j23118e2f5810"]
 *     }
 *
 * Each value lists the device id then the local key; further elements are
 * ignored. Loading only checks that the document is a JSON object. An entry
 * is checked when it is looked up, so a bad entry for one host does not stop
 * lookups of the others.
 */
class DeviceTable {
public:
    DeviceTable() = default;

    static expected<DeviceTable, ConfigError> load(const std::string& path);

    /// `source` names the document in error messages.
    static expected<DeviceTable, ConfigError> parse(const std::string& text,
                                                    const std::string& source);

    /// Empty when `host` has no entry; `ParseError` when its entry is malformed.
    expected<std::optional<DeviceCredentials>, ConfigError> find(const std::string& host) const;
    void insert(std::string host, DeviceCredentials credentials);

    std::size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

private:
    std::string source;
    std::map<std::string, nlohmann::json> entries;
};

} // namespace plugctl::config
