#pragma once

#include <string>

#include <asio/error.hpp>
#include <asio/error_code.hpp>
#include <fmt/core.h>

#include "errors.hpp"

namespace metafetch::client {

/**
 * @brief Classify a transport failure, `fallback` covers everything that
 *        is neither a timeout, an oversized frame nor a closed peer
 */
inline auto connection_errc(const asio::error_code& ec, Errc fallback) -> Errc
{
    if (ec == asio::error::timed_out) {
        return Errc::TIMEOUT;
    }
    if (ec == asio::error::message_size) {
        return Errc::FRAME_TOO_LARGE;
    }
    if (ec == asio::error::eof or ec == asio::error::connection_reset or
        ec == asio::error::connection_aborted or
        ec == asio::error::broken_pipe or ec == asio::error::not_connected) {
        return Errc::CONNECTION_CLOSED;
    }
    return fallback;
}

[[noreturn]] inline void raise_connection_error(
  const asio::error_code& ec, Errc fallback, const std::string& context
)
{
    raise(connection_errc(ec, fallback), fmt::format("{}: {}", context, ec.message()));
}

}  // namespace metafetch::client
