#pragma once

#include <optional>
#include <string>

#include "bencode/types.hpp"

namespace bencode {

/**
 * @brief Encode json value to bencode. Floats, booleans and nulls have no
 *        bencode representation and give nullopt.
 */
auto encode(const Json&) -> std::optional<std::string>;

namespace internal {

auto encode_integer(const Json&) -> std::string;
auto encode_string(const Json&) -> std::string;
auto encode_binary(const Json&) -> std::string;
auto encode_dict(const Json&) -> std::optional<std::string>;
auto encode_list(const Json&) -> std::optional<std::string>;

}  // namespace internal

}  // namespace bencode
