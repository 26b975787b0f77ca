#include "client/metadata_session.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>

#include "client/connection_errors.hpp"
#include "errors.hpp"
#include "misc/digest.hpp"

namespace metafetch::client {

MetadataSession::MetadataSession(
  PeerEndpoint peer,
  proto::InfoHash info_hash,
  SessionConfig config,
  ProgressCb progress_cb
) :
  _peer(std::move(peer)),
  _info_hash(info_hash),
  _config(config),
  _progress_callback(std::move(progress_cb)),
  _transport(_connection, config.max_frame_size)
{
}

auto MetadataSession::fetch() -> std::vector<uint8_t>
{
    if (_state != SessionState::Idle) {
        throw std::logic_error(fmt::format(
          "Metadata session with {} already ran, state {}", _peer.to_string(),
          magic_enum::enum_name(_state)
        ));
    }

    try {
        _connect();
        _negotiate();

        auto metadata = _collect_pieces();

        _connection.close();
        _transition(SessionState::Done);

        return metadata;
    } catch (const MetadataError& e) {
        spdlog::debug("{} failed in state {}: {}", _peer.to_string(),
                      magic_enum::enum_name(_state), e.what());
        _connection.close();
        _transition(SessionState::Failed);
        throw;
    } catch (...) {
        _connection.close();
        _transition(SessionState::Failed);
        throw;
    }
}

auto MetadataSession::_transition(SessionState next) -> void
{
    spdlog::debug(
      "{} {} -> {}", _peer.to_string(), magic_enum::enum_name(_state),
      magic_enum::enum_name(next)
    );
    _state = next;
}

auto MetadataSession::_connect() -> void
{
    _transition(SessionState::Connecting);

    _connection.connect(_peer.host, _peer.port, _config.dial_timeout)
      .map_error([this](auto&& e) {
          raise_connection_error(
            e, Errc::CONNECT_FAILED, fmt::format("Connect to {}", _peer.to_string())
          );
      });
}

auto MetadataSession::_negotiate() -> void
{
    HandshakeNegotiator negotiator(_transport, _info_hash, _peer.peer_id);

    _transition(SessionState::Handshaking);
    _connection.set_timeout(_config.handshake_timeout);

    const auto handshake = negotiator.base_handshake();
    _remote_peer_id = handshake.peer_id;

    _transition(SessionState::ExtensionHandshaking);
    _connection.set_timeout(_config.handshake_timeout);

    _extension_parameters = negotiator.extension_handshake();
    _remote_client = negotiator.remote_client();
}

auto MetadataSession::_collect_pieces() -> std::vector<uint8_t>
{
    PieceAssembler assembler(_info_hash, *_extension_parameters, _progress_callback);

    // Empty metadata has nothing to request, verify it right away
    if (not assembler.complete()) {
        _transition(SessionState::RequestingPieces);

        // One deadline for the whole transfer
        _connection.set_deadline(net::tcp::Clock::now() + _config.transfer_timeout);

        for (const auto& request : assembler.request_msgs()) {
            _transport.write_frame(request).map_error([](auto&& e) {
                raise_connection_error(e, Errc::WRITE_FAILED, "Piece request write");
            });
        }

        _transition(SessionState::Assembling);

        while (not assembler.complete()) {
            auto frame = _transport.read_frame().map_error([](auto&& e) {
                raise_connection_error(e, Errc::READ_FAILED, "Piece read");
            });

            assembler.handle_message(*frame);
        }
    }

    auto metadata = assembler.verified_metadata();

    spdlog::debug(
      "{} metadata of {} bytes verified against {}", _peer.to_string(),
      metadata.size(), to_hex(_info_hash)
    );

    return metadata;
}

}  // namespace metafetch::client
