#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "bencode/types.hpp"

namespace bencode {

inline auto to_integer(std::string_view s) -> std::optional<Integer>
{
    if (s.empty()) {
        return std::nullopt;
    }

    Integer value{};
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{} or result.ptr != s.data() + s.size()) {
        return std::nullopt;
    }

    return value;
}

/**
 * @brief View raw wire bytes as characters for the decoder
 */
inline auto as_chars(std::span<const std::uint8_t> bytes) -> std::string_view
{
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline auto to_bytes(std::string_view chars) -> Bytes
{
    return {chars.begin(), chars.end()};
}

}  // namespace bencode
