#pragma once
#include "plugctl/net/NetConfig.hpp"
#include <string>

namespace plugctl::net {

/**
 * resolve
 *
 * Synchronous forward lookup. Given `host` and `service` (e.g.
 * "plug.home.lan", "6668") fills `out` with the candidate endpoints for
 * `TcpClient::connect`. Literal addresses resolve without touching DNS.
 */
error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out);

/**
 * canonicalHostName
 *
 * Fully qualified name for `host`, with the same fallbacks as Python's
 * `socket.getfqdn`: an empty host or "0.0.0.0" means this machine; the
 * first resolved address is reverse-resolved and the result is used only
 * when it contains a dot. Any lookup failure returns `host` unchanged.
 */
std::string canonicalHostName(asio::io_context& io, const std::string& host);

} // namespace plugctl::net
