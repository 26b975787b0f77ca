#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bencode/types.hpp"
#include "proto/types.hpp"

namespace metafetch::proto {

/**
 * @brief Base handshake, 68 bytes with the extension protocol bit set
 */
auto pack_handshake(const PeerHandshakeMsg& msg) -> std::vector<uint8_t>;

/**
 * @brief BEP 10 handshake payload announcing our ut_metadata sub-id
 */
auto pack_ext_handshake_msg(
  uint8_t ut_metadata_id,
  std::optional<bencode::Integer> metadata_size = std::nullopt
) -> std::vector<uint8_t>;

auto pack_metadata_request_msg(uint8_t peer_ut_metadata_id, std::size_t piece)
  -> std::vector<uint8_t>;

auto pack_metadata_data_msg(
  uint8_t ut_metadata_id,
  std::size_t piece,
  std::size_t total_size,
  std::span<const uint8_t> block
) -> std::vector<uint8_t>;

auto pack_metadata_reject_msg(uint8_t ut_metadata_id, std::size_t piece)
  -> std::vector<uint8_t>;

/**
 * @brief Length prefixed frame around a message payload
 */
auto pack_frame(std::span<const uint8_t> payload) -> std::vector<uint8_t>;

namespace internal {

auto pack_extended_msg(uint8_t sub_id, const bencode::Json& dict)
  -> std::vector<uint8_t>;

}

}  // namespace metafetch::proto
