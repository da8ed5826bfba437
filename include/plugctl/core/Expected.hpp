// Expected.hpp
// -----------------------------------------------------------------------------
// Result aliases over tl::expected / tl::unexpected. The net layer reports
// std::error_code (the default error type); the config and device layers
// carry their own error structs so callers can map them to exit codes.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace plugctl {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace plugctl
