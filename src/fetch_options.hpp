#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "client/metadata_session.hpp"

namespace metafetch {

struct FetchOptions
{
    std::string info_hash;
    std::vector<std::string> peers;
    std::optional<std::filesystem::path> output_file_path;
    std::optional<std::string> peer_id;
    client::SessionConfig config;
    bool verbose = false;
};

/**
 * @brief Options of the `fetch` command, argv[2] onwards. Throws
 *        std::runtime_error naming the offending option.
 */
auto parse_fetch_options(int argc, const char* const argv[]) -> FetchOptions;

}  // namespace metafetch
