#include "client/handshake.hpp"

#include <vector>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "client/connection_errors.hpp"
#include "errors.hpp"
#include "misc/digest.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"

namespace metafetch::client {

HandshakeNegotiator::HandshakeNegotiator(
  net::FrameTransport& transport,
  const proto::InfoHash& info_hash,
  const proto::PeerId& peer_id
) :
  _transport(transport),
  _info_hash(info_hash),
  _peer_id(peer_id)
{
}

auto HandshakeNegotiator::base_handshake() -> proto::PeerHandshakeMsg
{
    spdlog::debug("HANDSHAKE");

    auto& connection = _transport.connection();

    const auto request = proto::pack_handshake(
      proto::PeerHandshakeMsg{.info_hash = _info_hash, .peer_id = _peer_id}
    );

    connection.write(request).map_error([](auto&& e) {
        raise_connection_error(e, Errc::WRITE_FAILED, "Handshake write");
    });

    auto reply = connection.read(proto::PeerHandshakeMsg::SIZE)
                   .map_error([](auto&& e) {
                       raise_connection_error(e, Errc::READ_FAILED, "Handshake read");
                   });

    auto answer = proto::unpack_handshake(*reply).map_error([](auto&& e) {
        raise(e, "Remote peer does not speak the BitTorrent protocol");
    });

    if (not answer->supports_extensions()) {
        raise(
          Errc::EXTENSION_UNSUPPORTED,
          fmt::format(
            "Remote peer does not support the extension protocol, reserved "
            "bytes {}",
            to_hex(answer->reserved)
          )
        );
    }

    if (answer->info_hash != _info_hash) {
        raise(
          Errc::INFO_HASH_MISMATCH,
          fmt::format(
            "Invalid info hash. Expected {}, got {}", to_hex(_info_hash),
            to_hex(answer->info_hash)
          )
        );
    }

    spdlog::debug("Remote peer id: {}", to_hex(answer->peer_id));

    return *answer;
}

auto HandshakeNegotiator::extension_handshake() -> ExtensionParameters
{
    spdlog::debug("EXTENSION HANDSHAKE");

    const auto request = proto::pack_ext_handshake_msg(proto::LOCAL_UT_METADATA_ID);

    _transport.write_frame(request).map_error([](auto&& e) {
        raise_connection_error(e, Errc::WRITE_FAILED, "Extension handshake write");
    });

    // Peers may send bitfield, have or keep-alives before their handshake
    while (true) {
        auto frame = _transport.read_frame().map_error([](auto&& e) {
            raise_connection_error(e, Errc::READ_FAILED, "Extension handshake read");
        });

        auto extended = proto::unpack_extended_msg(*frame);
        if (not extended) {
            auto msg_id = proto::unpack_msg_id(*frame);
            spdlog::debug(
              "Skip {} while waiting for extension handshake",
              frame->empty() ? "keep-alive"
              : msg_id       ? magic_enum::enum_name(*msg_id)
                             : "unknown message"
            );
            continue;
        }

        if (extended->sub_id != uint8_t(proto::ExtendedMsgId::Handshake)) {
            raise(
              Errc::UNEXPECTED_MESSAGE,
              fmt::format(
                "Extended message {} received before extension handshake",
                extended->sub_id
              )
            );
        }

        auto handshake =
          proto::unpack_ext_handshake_msg(extended->body).map_error([](auto&& e) {
              raise(e, "Bad extension handshake from peer");
          });

        _remote_client = handshake->client;

        spdlog::debug(
          "Peer client: {}, metadata_size: {}, ut_metadata: {}",
          _remote_client.value_or("unknown"), handshake->metadata_size,
          handshake->ut_metadata
        );

        return ExtensionParameters{
          .metadata_size = handshake->metadata_size,
          .peer_ut_metadata = handshake->ut_metadata,
        };
    }
}

}  // namespace metafetch::client
