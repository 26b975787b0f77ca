#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <nlohmann/json.hpp>

namespace bencode {

using Json = nlohmann::json;

enum class EncodedValueType
{
    Integer,
    String,
    List,
    Dictionary,
    Unknown,
};

/**
 * @brief Slice of the source buffer a value was decoded from
 *
 * `value.size()` is the exact count of bytes consumed by the decoder.
 */
struct EncodedValue
{
    EncodedValueType type;
    std::string_view value;
};

using Dict = std::map<std::string, Json>;
using DecodedValue = std::tuple<EncodedValue, Json>;

using Integer = long long;
using Bytes = std::vector<std::uint8_t>;

}  // namespace bencode
