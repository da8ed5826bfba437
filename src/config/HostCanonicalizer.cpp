#include "plugctl/config/HostCanonicalizer.hpp"

#include "plugctl/net/NetService.hpp"
#include "plugctl/net/Resolve.hpp"

namespace plugctl::config {

std::string DnsHostCanonicalizer::canonicalize(const std::string& host) {
    return net::canonicalHostName(*net::shared_io_context(), host);
}

} // namespace plugctl::config
