#pragma once

#include <asio.hpp>
#include <system_error>

namespace plugctl::net {

/**
 * @brief Networking aliases so the device and config layers never name Asio directly.
 *
 * Exposes:
 * - `plugctl::net::asio` as the standalone Asio namespace.
 * - `plugctl::net::tcp` for the TCP protocol types.
 * - `plugctl::net::error_code` for results reported by the helpers.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using error_code = std::error_code;
} // namespace plugctl::net
