#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "proto/types.hpp"

namespace metafetch {

/**
 * @brief Remote address plus the identity we present to it
 */
struct PeerEndpoint
{
    const std::string host;
    const uint16_t port;
    const proto::PeerId peer_id;

    static auto from_string(const std::string& host_port, proto::PeerId peer_id)
      -> PeerEndpoint;

    auto to_string() const -> std::string;
};

/**
 * @brief Endpoints for every well formed "<host>:<port>", in the given order.
 *        Malformed addresses are logged and left out.
 */
auto parse_peer_endpoints(const std::vector<std::string>& addresses, const proto::PeerId& peer_id)
  -> std::vector<PeerEndpoint>;

/**
 * @brief Azureus-style id: "-MF0100-" followed by 12 random digits
 */
auto generate_peer_id() -> proto::PeerId;

auto peer_id_from_string(std::string_view) -> std::optional<proto::PeerId>;

auto info_hash_from_string(std::string_view) -> std::optional<proto::InfoHash>;

}  // namespace metafetch
