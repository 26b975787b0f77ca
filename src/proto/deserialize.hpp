#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <tl/expected.hpp>

#include "errors.hpp"
#include "proto/types.hpp"

namespace metafetch::proto {

/**
 * @brief Message id of a frame payload, nullopt for keep-alives and ids we
 *        do not know
 */
auto unpack_msg_id(std::span<const uint8_t> payload) -> std::optional<MsgId>;

/**
 * @brief Split an extended message into sub-id and body, nullopt if the
 *        payload is not an extended message
 */
auto unpack_extended_msg(std::span<const uint8_t> payload)
  -> std::optional<ExtendedMsg>;

auto unpack_handshake(std::span<const uint8_t> msg)
  -> tl::expected<PeerHandshakeMsg, Errc>;

auto unpack_ext_handshake_msg(std::span<const uint8_t> body)
  -> tl::expected<ExtensionHandshakeMsg, Errc>;

auto unpack_metadata_msg(std::span<const uint8_t> body)
  -> tl::expected<MetadataMsg, Errc>;

}  // namespace metafetch::proto
