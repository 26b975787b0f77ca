#include "info_dict.hpp"

#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/transform.hpp>

#include "bencode/decoders.hpp"
#include "bencode/types.hpp"
#include "misc/digest.hpp"

namespace metafetch {

namespace {

auto text_or_empty(const bencode::Json& value) -> std::string
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        return std::string(bin.begin(), bin.end());
    }
    return {};
}

auto bytes_or_empty(const bencode::Json& value) -> std::vector<uint8_t>
{
    if (value.is_binary()) {
        return value.get_binary();
    }
    const auto text = text_or_empty(value);
    return {text.begin(), text.end()};
}

/**
 * @brief Integer under `key`, 0 when absent, nullopt when it has another type
 */
auto integer_or_zero(const bencode::Json& dict, const char* key)
  -> std::optional<bencode::Integer>
{
    auto it = dict.find(key);
    if (it == dict.end()) {
        return 0;
    }
    if (not it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<bencode::Integer>();
}

auto parse_files(const bencode::Json& info) -> std::optional<std::vector<InfoDict::File>>
{
    if (not info.contains("files")) {
        auto length = integer_or_zero(info, "length");
        if (not length) {
            return std::nullopt;
        }

        InfoDict::File single{
          .path = text_or_empty(info.value("name", bencode::Json())),
          .length = *length,
        };
        return std::vector<InfoDict::File>{single};
    }

    const auto& files_json = info["files"];
    if (not files_json.is_array()) {
        return std::nullopt;
    }

    std::vector<InfoDict::File> files;

    for (const auto& file : files_json) {
        if (not file.is_object() or not file.contains("path") or
            not file["path"].is_array()) {
            return std::nullopt;
        }

        std::vector<std::string> parts;
        for (const auto& part : file["path"]) {
            parts.push_back(text_or_empty(part));
        }

        auto length = integer_or_zero(file, "length");
        if (not length) {
            return std::nullopt;
        }

        files.push_back({
          .path = fmt::format("{}", fmt::join(parts, "/")),
          .length = *length,
        });
    }

    return files;
}

}  // namespace

auto InfoDict::from_bytes(std::span<const uint8_t> metadata, bool strict)
  -> std::optional<InfoDict>
{
    auto decoded = bencode::decode_bencoded_value(metadata);
    if (not decoded) {
        return std::nullopt;
    }

    auto [encoded, info] = *decoded;
    if (not info.is_object()) {
        return std::nullopt;
    }

    if (strict) {
        bool is_full_info = info.contains("name") and
                            info.contains("piece length") and
                            info.contains("pieces") and
                            (info.contains("length") or info.contains("files"));

        if (not is_full_info or encoded.value.size() != metadata.size()) {
            return std::nullopt;
        }
    }

    auto files = parse_files(info);
    if (not files) {
        return std::nullopt;
    }

    auto piece_length = integer_or_zero(info, "piece length");
    if (not piece_length) {
        return std::nullopt;
    }

    auto name = text_or_empty(info.value("name", bencode::Json()));

    return InfoDict{
      .raw = info,
      .name = name,
      .piece_length = *piece_length,
      .files = *files,
    };
}

auto InfoDict::total_length() const -> bencode::Integer
{
    return ::ranges::accumulate(
      files, bencode::Integer(0),
      [](bencode::Integer sum, const File& file) { return sum + file.length; }
    );
}

auto InfoDict::piece_hashes() const -> std::vector<std::vector<uint8_t>>
{
    using namespace ::ranges;

    const auto pieces_bytes = bytes_or_empty(raw.value("pieces", bencode::Json()));

    // clang-format off
    return pieces_bytes
      | views::chunk(SHA1_DIGEST_SIZE)
      | views::transform([](auto chunk) {
          return std::vector<uint8_t>(chunk.begin(), chunk.end());
      })
      | to<std::vector<std::vector<uint8_t>>>();
    // clang-format on
}

auto InfoDict::is_multi_file() const -> bool
{
    return raw.contains("files");
}

}  // namespace metafetch
