#include "peer.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "misc/digest.hpp"
#include "misc/parse_ip_port.hpp"

namespace metafetch {

constexpr const std::string_view PEER_ID_PREFIX = "-MF0100-";

auto PeerEndpoint::from_string(const std::string& host_port, proto::PeerId peer_id)
  -> PeerEndpoint
{
    auto [host, port] = utils::parse_host_port(host_port);
    return PeerEndpoint{.host = host, .port = port, .peer_id = peer_id};
}

auto PeerEndpoint::to_string() const -> std::string
{
    if (host.find(':') != std::string::npos) {
        return fmt::format("[{}]:{}", host, port);
    }
    return fmt::format("{}:{}", host, port);
}

auto parse_peer_endpoints(const std::vector<std::string>& addresses, const proto::PeerId& peer_id)
  -> std::vector<PeerEndpoint>
{
    std::vector<PeerEndpoint> endpoints;
    endpoints.reserve(addresses.size());

    for (const auto& address : addresses) {
        try {
            endpoints.push_back(PeerEndpoint::from_string(address, peer_id));
        } catch (const std::runtime_error& e) {
            spdlog::error("Skip peer: {}", e.what());
        }
    }

    return endpoints;
}

auto generate_peer_id() -> proto::PeerId
{
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> digit('0', '9');

    proto::PeerId peer_id{};
    auto iter = std::copy(PEER_ID_PREFIX.begin(), PEER_ID_PREFIX.end(), peer_id.begin());
    std::generate(iter, peer_id.end(), [&] { return uint8_t(digit(generator)); });

    return peer_id;
}

auto peer_id_from_string(std::string_view str) -> std::optional<proto::PeerId>
{
    proto::PeerId peer_id{};
    if (str.size() != peer_id.size()) {
        return std::nullopt;
    }

    std::copy(str.begin(), str.end(), peer_id.begin());
    return peer_id;
}

auto info_hash_from_string(std::string_view str) -> std::optional<proto::InfoHash>
{
    return sha1_hash_from_hex(str);
}

}  // namespace metafetch
