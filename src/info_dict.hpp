#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bencode/types.hpp"

namespace metafetch {

/**
 * @brief Decoded "info" dictionary as fetched from a peer
 */
struct InfoDict
{
    struct File
    {
        std::string path;
        bencode::Integer length;
    };

    const nlohmann::json raw;
    const std::string name;
    const bencode::Integer piece_length;
    const std::vector<File> files;  // single entry for single-file torrents

    static auto from_bytes(std::span<const uint8_t> metadata, bool strict = true)
      -> std::optional<InfoDict>;

    auto total_length() const -> bencode::Integer;
    auto piece_hashes() const -> std::vector<std::vector<uint8_t>>;
    auto is_multi_file() const -> bool;
};

}  // namespace metafetch
