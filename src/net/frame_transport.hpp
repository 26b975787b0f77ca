#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <asio/error_code.hpp>
#include <tl/expected.hpp>

#include "net/tcp_connection.hpp"

namespace net {

/**
 * @brief Length-prefixed peer wire messages over a tcp::Connection
 *
 * Frames are a 4-byte big-endian length followed by that many payload
 * bytes. A zero length is a keep-alive and reads as an empty payload.
 */
class FrameTransport
{
 public:
    constexpr static std::size_t LENGTH_PREFIX_SIZE = 4;
    constexpr static std::size_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;

    explicit FrameTransport(
      tcp::Connection& connection,
      std::size_t max_frame_size = DEFAULT_MAX_FRAME_SIZE
    );

    auto write_frame(std::span<const uint8_t> payload)
      -> tl::expected<void, asio::error_code>;

    /**
     * @brief Read one whole frame, failing with `asio::error::message_size`
     *        if the peer declares more than the configured ceiling
     */
    auto read_frame() -> tl::expected<std::vector<uint8_t>, asio::error_code>;

    auto connection() -> tcp::Connection& { return _connection; }
    auto max_frame_size() const -> std::size_t { return _max_frame_size; }

 private:
    tcp::Connection& _connection;
    std::size_t _max_frame_size;
};

}  // namespace net
