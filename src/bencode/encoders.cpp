#include "bencode/encoders.hpp"

#include <optional>
#include <sstream>

#include <fmt/core.h>

#include "bencode/consts.hpp"


namespace bencode {

auto encode(const Json& value) -> std::optional<std::string>
{
    using namespace internal;

    if (value.is_number_integer()) {
        return encode_integer(value);
    }
    if (value.is_string()) {
        return encode_string(value);
    }
    if (value.is_binary()) {
        return encode_binary(value);
    }
    if (value.is_object()) {
        return encode_dict(value);
    }
    if (value.is_array()) {
        return encode_list(value);
    }

    return std::nullopt;
}

namespace internal {

auto encode_integer(const Json& value) -> std::string
{
    return fmt::format(
      "{}{}{}", INTEGER_START_SYMBOL, value.dump(), END_SYMBOL
    );
}

auto encode_string(const Json& value) -> std::string
{
    const auto& str = value.get_ref<const Json::string_t&>();
    return fmt::format("{}{}{}", str.length(), STRING_DELIMITER_SYMBOL, str);
}

auto encode_binary(const Json& value) -> std::string
{
    const auto& bin = value.get_binary();
    return fmt::format(
      "{}{}{}", bin.size(), STRING_DELIMITER_SYMBOL,
      std::string(bin.begin(), bin.end())
    );
}

/**
 * @brief Json objects keep keys sorted, which is the order bencode requires
 */
auto encode_dict(const Json& dict) -> std::optional<std::string>
{
    std::stringstream stream;

    stream << DICT_START_SYMBOL;

    for (const auto& [key, value] : dict.items()) {
        stream << encode_string(Json(key));

        auto encoded_value = encode(value);
        if (not encoded_value) {
            return std::nullopt;
        }

        stream << *encoded_value;
    }

    stream << END_SYMBOL;

    return stream.str();
}

auto encode_list(const Json& list) -> std::optional<std::string>
{
    std::stringstream stream;

    stream << LIST_START_SYMBOL;

    for (const auto& value : list) {
        auto encoded_value = encode(value);
        if (not encoded_value) {
            return std::nullopt;
        }

        stream << *encoded_value;
    }

    stream << END_SYMBOL;

    return stream.str();
}

}  // namespace internal

}  // namespace bencode
