#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "bencode/types.hpp"
#include "net/frame_transport.hpp"
#include "proto/types.hpp"

namespace metafetch::client {

/**
 * @brief What the peer told us in its extension handshake
 */
struct ExtensionParameters
{
    bencode::Integer metadata_size;
    uint8_t peer_ut_metadata;  // sub-id for requests we send to the peer

    auto piece_count() const -> std::size_t
    {
        return proto::metadata_piece_count(std::size_t(metadata_size));
    }
};

/**
 * @brief Runs the base handshake and the BEP 10 extension handshake
 *
 * Every failure is thrown as the matching MetadataError. Deadlines are the
 * caller's business and must be set on the connection beforehand.
 */
class HandshakeNegotiator
{
 public:
    HandshakeNegotiator(
      net::FrameTransport& transport,
      const proto::InfoHash& info_hash,
      const proto::PeerId& peer_id
    );

    auto base_handshake() -> proto::PeerHandshakeMsg;
    auto extension_handshake() -> ExtensionParameters;

    auto remote_client() const -> const std::optional<std::string>&
    {
        return _remote_client;
    }

 private:
    net::FrameTransport& _transport;
    const proto::InfoHash& _info_hash;
    const proto::PeerId& _peer_id;

    std::optional<std::string> _remote_client;
};

}  // namespace metafetch::client
