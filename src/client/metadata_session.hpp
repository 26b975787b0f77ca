#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "client/handshake.hpp"
#include "client/piece_assembler.hpp"
#include "net/frame_transport.hpp"
#include "net/tcp_connection.hpp"
#include "peer.hpp"
#include "proto/types.hpp"

namespace metafetch::client {

enum class SessionState
{
    Idle,
    Connecting,
    Handshaking,
    ExtensionHandshaking,
    RequestingPieces,
    Assembling,
    Done,
    Failed,
};

struct SessionConfig
{
    std::chrono::milliseconds dial_timeout = std::chrono::seconds(3);
    std::chrono::milliseconds handshake_timeout = std::chrono::seconds(5);
    std::chrono::milliseconds transfer_timeout = std::chrono::seconds(30);
    std::size_t max_frame_size = net::FrameTransport::DEFAULT_MAX_FRAME_SIZE;
};

/**
 * @brief Fetch the info dictionary of one torrent from one peer over one
 *        connection
 *
 * A session runs once. `fetch()` either returns the raw metadata whose
 * SHA-1 is the info hash, or throws a MetadataError after closing the
 * connection. Nothing is kept between sessions.
 */
class MetadataSession
{
 public:
    using ProgressCb = PieceAssembler::ProgressCb;

    MetadataSession(
      PeerEndpoint peer,
      proto::InfoHash info_hash,
      SessionConfig config = {},
      ProgressCb progress_cb = [](std::size_t, std::size_t) {}
    );

    MetadataSession(const MetadataSession&) = delete;
    MetadataSession& operator=(const MetadataSession&) = delete;

    auto fetch() -> std::vector<uint8_t>;

    auto state() const noexcept -> SessionState { return _state; }

    auto extension_parameters() const
      -> const std::optional<ExtensionParameters>&
    {
        return _extension_parameters;
    }

    auto remote_peer_id() const -> const std::optional<proto::PeerId>&
    {
        return _remote_peer_id;
    }

    auto remote_client() const -> const std::optional<std::string>&
    {
        return _remote_client;
    }

 private:
    auto _transition(SessionState next) -> void;

    auto _connect() -> void;
    auto _negotiate() -> void;
    auto _collect_pieces() -> std::vector<uint8_t>;

    const PeerEndpoint _peer;
    const proto::InfoHash _info_hash;
    const SessionConfig _config;
    ProgressCb _progress_callback;

    net::tcp::Connection _connection;
    net::FrameTransport _transport;

    SessionState _state = SessionState::Idle;

    std::optional<ExtensionParameters> _extension_parameters;
    std::optional<proto::PeerId> _remote_peer_id;
    std::optional<std::string> _remote_client;
};

}  // namespace metafetch::client
