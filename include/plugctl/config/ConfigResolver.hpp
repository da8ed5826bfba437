#pragma once

#include "plugctl/config/ConfigError.hpp"
#include "plugctl/config/DeviceTable.hpp"
#include "plugctl/config/HostCanonicalizer.hpp"
#include "plugctl/core/DeviceIdentity.hpp"
#include "plugctl/core/Expected.hpp"

#include <functional>
#include <optional>
#include <string>

namespace plugctl::config {

/// Credentials given on the command line; an empty string counts as absent.
struct CredentialOverrides {
    std::optional<std::string> deviceId;
    std::optional<std::string> deviceKey;
};

/// Deferred table load, invoked only when an override is missing.
using DeviceTableLoader = std::function<expected<DeviceTable, ConfigError>()>;

/// Loader reading the JSON table at `path`.
DeviceTableLoader fileTableLoader(std::string path);

/**
 * @brief Turns a host plus optional overrides into a complete `DeviceIdentity`.
 *
 * 1. Both overrides present: returned as is, the table is never loaded.
 * 2. Otherwise the table is loaded (load errors are returned unchanged),
 *    the host is canonicalized and looked up; a miss is `UnknownHost` and a
 *    malformed entry for that host is `ParseError`.
 * 3. Each missing value comes from the entry, id first then key.
 *
 * The identity keeps the host as given, not its canonical form.
 */
class ConfigResolver {
public:
    explicit ConfigResolver(HostCanonicalizer& canonicalizer)
    : canonicalizer(canonicalizer) {}

    expected<core::DeviceIdentity, ConfigError>
    resolve(const std::string& host,
            const CredentialOverrides& overrides,
            const DeviceTableLoader& loadTable) const;

private:
    HostCanonicalizer& canonicalizer;
};

} // namespace plugctl::config
