#include "net/frame_transport.hpp"

#include <asio/error.hpp>

#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace net {

FrameTransport::FrameTransport(
  tcp::Connection& connection, std::size_t max_frame_size
) :
  _connection(connection),
  _max_frame_size(max_frame_size)
{
}

auto FrameTransport::write_frame(std::span<const uint8_t> payload)
  -> tl::expected<void, asio::error_code>
{
    if (payload.size() > _max_frame_size) {
        return tl::make_unexpected(asio::error::message_size);
    }

    const auto frame = metafetch::proto::pack_frame(payload);
    return _connection.write(frame);
}

auto FrameTransport::read_frame()
  -> tl::expected<std::vector<uint8_t>, asio::error_code>
{
    using metafetch::proto::utils::unpack_u32;

    return _connection.read(LENGTH_PREFIX_SIZE)
      .and_then([this](std::vector<uint8_t> prefix)
                  -> tl::expected<std::vector<uint8_t>, asio::error_code> {
          const auto length =
            unpack_u32(std::span<const uint8_t, LENGTH_PREFIX_SIZE>(
              prefix.data(), LENGTH_PREFIX_SIZE
            ));

          if (length > _max_frame_size) {
              tcp::internal_logger()->debug(
                "Frame of {} bytes exceeds limit {}", length, _max_frame_size
              );
              return tl::make_unexpected(asio::error::message_size);
          }

          return _connection.read(length);
      });
}

}  // namespace net
