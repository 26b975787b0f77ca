#include "fetch_options.hpp"

#include <chrono>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace metafetch {

auto parse_fetch_options(int argc, const char* const argv[]) -> FetchOptions
{
    FetchOptions options;

    auto value_of = [&](int& idx) -> std::string {
        if (idx + 1 >= argc) {
            throw std::runtime_error(
              fmt::format("Option {} requires a value", argv[idx])
            );
        }
        return argv[++idx];
    };

    auto number_of = [&](int& idx, auto convert) {
        const auto option = std::string(argv[idx]);
        const auto value = value_of(idx);
        try {
            return convert(value);
        } catch (const std::logic_error&) {
            throw std::runtime_error(
              fmt::format("Option {} expects a number, got \"{}\"", option, value)
            );
        }
    };

    auto seconds_of = [&](int& idx) -> std::chrono::milliseconds {
        const auto option = std::string(argv[idx]);
        const auto value =
          number_of(idx, [](const std::string& str) { return std::stod(str); });
        if (value <= 0) {
            throw std::runtime_error(
              fmt::format("Option {} must be positive", option)
            );
        }
        return std::chrono::milliseconds(static_cast<long long>(value * 1000));
    };

    std::vector<std::string> positional;

    for (int idx = 2; idx < argc; ++idx) {
        const std::string arg = argv[idx];

        if (arg == "-o") {
            options.output_file_path = value_of(idx);
        }
        else if (arg == "--peer-id") {
            options.peer_id = value_of(idx);
        }
        else if (arg == "--dial-timeout") {
            options.config.dial_timeout = seconds_of(idx);
        }
        else if (arg == "--handshake-timeout") {
            options.config.handshake_timeout = seconds_of(idx);
        }
        else if (arg == "--transfer-timeout") {
            options.config.transfer_timeout = seconds_of(idx);
        }
        else if (arg == "--max-frame") {
            options.config.max_frame_size =
              number_of(idx, [](const std::string& str) { return std::stoull(str); });
        }
        else if (arg == "-v") {
            options.verbose = true;
        }
        else if (arg.starts_with("-")) {
            throw std::runtime_error(fmt::format("Unknown option: {}", arg));
        }
        else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        throw std::runtime_error(fmt::format(
          "Usage: {} fetch [options] <info_hash> <host>:<port> "
          "[<host>:<port> ...]",
          argv[0]
        ));
    }

    options.info_hash = positional.front();
    options.peers.assign(std::next(positional.begin()), positional.end());

    return options;
}

}  // namespace metafetch
