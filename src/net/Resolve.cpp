#include "plugctl/net/Resolve.hpp"
#include "plugctl/log/Log.hpp"

namespace plugctl::net {

error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

std::string canonicalHostName(asio::io_context& io, const std::string& host) {
    std::string name = host;
    if (name.empty() || name == "0.0.0.0") {
        error_code ec;
        name = asio::ip::host_name(ec);
        if (ec) {
            return host;
        }
    }

    tcp::resolver::results_type forward;
    if (auto ec = resolve(io, name, "0", forward); ec || forward.empty()) {
        logInfo("[Resolve] no address for ", name, "\n");
        return name;
    }

    error_code ec;
    tcp::resolver r(io);
    auto reverse = r.resolve(forward.begin()->endpoint(), ec);
    if (ec || reverse.empty()) {
        return name;
    }

    // Without a PTR record the reverse lookup echoes the numeric address.
    std::string fqdn = reverse.begin()->host_name();
    error_code numeric;
    asio::ip::make_address(fqdn, numeric);
    if (!numeric || fqdn.find('.') == std::string::npos) {
        return name;
    }
    logInfo("[Resolve] ", host, " -> ", fqdn, "\n");
    return fqdn;
}

} // namespace plugctl::net
