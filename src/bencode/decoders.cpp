#include <cctype>  // is_digit
#include <optional>
#include <string>
#include <string_view>

#include "bencode/consts.hpp"
#include "bencode/decoders.hpp"
#include "bencode/tools.hpp"
#include "bencode/types.hpp"


namespace bencode {

/**
 * @brief Try to decode the value at the beginning of the source and return
 *        nullopt if failed
 *
 * Returns pair of encoded value and result of decoding. Bytes after the
 * first complete value are not inspected, the encoded value tells how many
 * bytes were consumed.
 */
auto decode_bencoded_value(std::string_view encoded_value)
  -> std::optional<DecodedValue>
{
    return internal::decode_value(encoded_value, 0);
}

auto decode_bencoded_value(std::span<const std::uint8_t> encoded_value)
  -> std::optional<DecodedValue>
{
    return internal::decode_value(as_chars(encoded_value), 0);
}

namespace internal {

auto decode_value(std::string_view encoded_value, std::size_t depth)
  -> std::optional<DecodedValue>
{
    if (depth > MAX_NESTING_DEPTH) {
        return std::nullopt;
    }

    switch (detect_bencoded_value_type(encoded_value)) {
        case EncodedValueType::String:
            return decode_string(encoded_value);

        case EncodedValueType::Integer:
            return decode_integer(encoded_value);

        case EncodedValueType::List:
            return decode_bencoded_list(encoded_value, depth + 1);

        case EncodedValueType::Dictionary:
            return decode_bencoded_dict(encoded_value, depth + 1);

        default:
            return std::nullopt;
    }
}

auto detect_bencoded_value_type(std::string_view bencoded_value)
  -> EncodedValueType
{
    if (is_encoded_integer_ahead(bencoded_value)) {
        return EncodedValueType::Integer;
    }
    if (is_encoded_string_ahead(bencoded_value)) {
        return EncodedValueType::String;
    }
    if (is_encoded_list_ahead(bencoded_value)) {
        return EncodedValueType::List;
    }
    if (is_encoded_dict_ahead(bencoded_value)) {
        return EncodedValueType::Dictionary;
    }
    return EncodedValueType::Unknown;
}

auto is_encoded_string_ahead(std::string_view encoded_value) -> bool
{
    return not encoded_value.empty() and
           std::isdigit(static_cast<unsigned char>(encoded_value.front()));
}

/**
 * @brief Bencoded strings are byte strings. Only those that survive an
 *        ASCII-escaped JSON dump are kept as JSON strings.
 */
static auto is_text(std::string_view str) -> bool
{
    try {
        Json(str).dump(-1, ' ', /*ensure_ascii=*/true);
        return true;
    } catch (const Json::type_error&) {
        return false;
    }
}

/**
 * @brief Decode bencoded string to a pair of encoded value and decoded json
 *  object
 *
 * If string cannot be fully decoded as UTF-8 sequence it will be decoded as
 * Json::binary.
 *
 * "5:hello" -> "hello"
 * "3:\1\2\3" -> b"\1\2\3"
 */
auto decode_string(std::string_view encoded_string)
  -> std::optional<DecodedValue>
{
    size_t delimiter_index = encoded_string.find(STRING_DELIMITER_SYMBOL);

    if (delimiter_index == std::string::npos) {
        return std::nullopt;
    }

    auto len = to_integer(encoded_string.substr(0, delimiter_index));
    if (not len or *len < 0) {
        return std::nullopt;
    }

    const auto available = encoded_string.length() - delimiter_index - 1;
    if (static_cast<unsigned long long>(*len) > available) {
        return std::nullopt;
    }

    const auto last_symbol_pos =
      delimiter_index + 1 + static_cast<std::size_t>(*len);
    const auto decoded_str = encoded_string.substr(
      delimiter_index + 1, static_cast<std::size_t>(*len)
    );

    EncodedValue encoded{
      .type = EncodedValueType::String,
      .value = encoded_string.substr(0, last_symbol_pos),
    };

    if (is_text(decoded_str)) {
        return {{encoded, Json(decoded_str)}};
    }

    return {{encoded, Json::binary(to_bytes(decoded_str))}};
}


auto is_encoded_integer_ahead(std::string_view encoded_value) -> bool
{
    return encoded_value.starts_with(INTEGER_START_SYMBOL);
}

/**
 * @brief Decode bencoded integer to json object
 *
 * "i-123e" -> -123
 */
auto decode_integer(std::string_view encoded_value)
  -> std::optional<DecodedValue>
{
    auto end_index = encoded_value.find_first_of(END_SYMBOL);
    if (end_index == std::string::npos) {
        return std::nullopt;
    }

    auto encoded_integer = encoded_value.substr(0, end_index + 1);

    auto integer_str = encoded_integer;
    integer_str.remove_prefix(1);
    integer_str.remove_suffix(1);

    auto decoded_int = to_integer(integer_str);
    if (not decoded_int) {
        return std::nullopt;
    }

    return {
      {EncodedValue{
         .type = EncodedValueType::Integer,
         .value = encoded_integer,
       },
       Json(*decoded_int)}
    };
}


auto is_encoded_list_ahead(std::string_view encoded_value) -> bool
{
    return encoded_value.starts_with(LIST_START_SYMBOL);
}


/**
 * @brief Decode bencoded list of bencoded values to pair of source string and
 *        decoded json
 *
 * "l5:helloi52ee" -> ["hello", 52]
 */
auto decode_bencoded_list(std::string_view encoded_list, std::size_t depth)
  -> std::optional<DecodedValue>
{
    std::string_view remaining_encoded_list{encoded_list};
    remaining_encoded_list.remove_prefix(1);  // rm "l" prefix

    std::vector<Json> list;

    while (not remaining_encoded_list.starts_with(END_SYMBOL)) {
        auto decoded = decode_value(remaining_encoded_list, depth);
        if (not decoded) {
            return std::nullopt;  // malformed or truncated list
        }

        auto [encoded, result] = *decoded;
        list.push_back(std::move(result));

        remaining_encoded_list.remove_prefix(encoded.value.length());
    }

    remaining_encoded_list.remove_prefix(1);  // rm list end symbol

    const auto encoded_list_len =
      encoded_list.length() - remaining_encoded_list.length();

    return {
      {EncodedValue{
         .type = EncodedValueType::List,
         .value = encoded_list.substr(0, encoded_list_len),
       },
       Json(list)}
    };
}


auto is_encoded_dict_ahead(std::string_view encoded_value) -> bool
{
    return encoded_value.starts_with(DICT_START_SYMBOL);
}


/**
 * @brief Decode bencoded dict of bencoded values to pair of source string and
 *        decoded json
 *
 * Keys must be text strings. Everything after the closing "e" is left
 * untouched, so a dictionary followed by raw bytes decodes fine.
 *
 * "d3:foo3:bar5:helloi52ee" -> {"hello": 52, "foo":"bar"}
 */
auto decode_bencoded_dict(std::string_view encoded_dict, std::size_t depth)
  -> std::optional<DecodedValue>
{
    std::string_view remaining_encoded_dict{encoded_dict};
    remaining_encoded_dict.remove_prefix(1);  // rm "d" prefix

    Dict dict;

    while (not remaining_encoded_dict.starts_with(END_SYMBOL)) {
        // Decode key (always string)
        auto decoded_key = decode_string(remaining_encoded_dict);
        if (not decoded_key) {
            return std::nullopt;
        }
        auto [encoded_key, key] = *decoded_key;
        if (not key.is_string()) {
            return std::nullopt;
        }
        remaining_encoded_dict.remove_prefix(encoded_key.value.length());

        // Decode value
        auto decoded_value = decode_value(remaining_encoded_dict, depth);
        if (not decoded_value) {
            return std::nullopt;
        }

        auto [encoded_value, value] = *decoded_value;
        remaining_encoded_dict.remove_prefix(encoded_value.value.length());

        dict.insert_or_assign(key.get<std::string>(), std::move(value));
    }

    remaining_encoded_dict.remove_prefix(1);  // remove dict end symbol

    const auto encoded_dict_len =
      encoded_dict.length() - remaining_encoded_dict.length();

    return {
      {EncodedValue{
         .type = EncodedValueType::Dictionary,
         .value = encoded_dict.substr(0, encoded_dict_len),
       },
       Json(dict)}
    };
}


}  // namespace internal

}  // namespace bencode
