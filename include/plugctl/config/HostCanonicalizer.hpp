#pragma once

#include <string>

namespace plugctl::config {

/**
 * @brief Maps a user-supplied host to the name used as the device table key.
 *
 * Implementations never fail: when no better name is known they return the
 * input unchanged.
 */
class HostCanonicalizer {
public:
    virtual ~HostCanonicalizer() = default;
    virtual std::string canonicalize(const std::string& host) = 0;
};

/// Leaves every host as given.
class PassthroughHostCanonicalizer : public HostCanonicalizer {
public:
    std::string canonicalize(const std::string& host) override { return host; }
};

/// Fully qualified name via forward then reverse DNS (see `net::canonicalHostName`).
class DnsHostCanonicalizer : public HostCanonicalizer {
public:
    std::string canonicalize(const std::string& host) override;
};

} // namespace plugctl::config
