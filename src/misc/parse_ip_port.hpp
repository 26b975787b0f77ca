#pragma once

#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>
#include <tuple>

#include <fmt/core.h>

namespace utils {

/**
 * @brief Split "<host>:<port>" where host is a name, a dotted IPv4 address
 *        or a bracketed IPv6 address
 */
inline auto parse_host_port(const std::string& host_port_str)
  -> std::tuple<std::string, uint16_t>
{
    std::regex host_port_regex(  //
      R"((?:\[([0-9A-Fa-f:.]+)\]|([A-Za-z0-9.\-]+)):(\d{1,5}))"
    );
    std::smatch match;

    if (not std::regex_match(host_port_str, match, host_port_regex)) {
        throw std::runtime_error(fmt::format(
          "Peer address must be in format \"<host>:<port>\" or "
          "\"[<ipv6>]:<port>\". Found: {0}",
          host_port_str
        ));
    }

    auto host = match[1].matched ? match[1].str() : match[2].str();
    auto port = std::stoul(match[3].str());

    if (port == 0 or port > UINT16_MAX) {
        throw std::runtime_error(
          fmt::format("Peer port out of range: {0}", host_port_str)
        );
    }

    return {host, static_cast<uint16_t>(port)};
}

}  // namespace utils
