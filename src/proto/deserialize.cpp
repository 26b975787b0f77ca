#include "proto/deserialize.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <vector>

#include <magic_enum.hpp>
#include <tl/expected.hpp>

#include "bencode/decoders.hpp"
#include "bencode/types.hpp"
#include "proto/types.hpp"


namespace metafetch::proto {

namespace {

auto decode_dict(std::span<const uint8_t> body)
  -> std::optional<bencode::DecodedValue>
{
    auto decoded = bencode::decode_bencoded_value(body);
    if (not decoded) {
        return std::nullopt;
    }

    const auto& [encoded, _] = *decoded;
    if (encoded.type != bencode::EncodedValueType::Dictionary) {
        return std::nullopt;
    }

    return decoded;
}

auto integer_field(const bencode::Json& dict, const char* key)
  -> std::optional<bencode::Integer>
{
    auto it = dict.find(key);
    if (it == dict.end() or not it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<bencode::Integer>();
}

}  // namespace

auto unpack_msg_id(std::span<const uint8_t> payload) -> std::optional<MsgId>
{
    if (payload.empty()) {
        return std::nullopt;
    }
    return magic_enum::enum_cast<MsgId>(payload[0]);
}

auto unpack_extended_msg(std::span<const uint8_t> payload)
  -> std::optional<ExtendedMsg>
{
    if (payload.size() < 2 or payload[0] != uint8_t(MsgId::Extended)) {
        return std::nullopt;
    }

    return ExtendedMsg{.sub_id = payload[1], .body = payload.subspan(2)};
}

auto unpack_handshake(std::span<const uint8_t> msg)
  -> tl::expected<PeerHandshakeMsg, Errc>
{
    if (msg.size() < PeerHandshakeMsg::SIZE) {
        return tl::make_unexpected(Errc::PROTOCOL_MISMATCH);
    }

    const auto protocol = PeerHandshakeMsg::PROTOCOL;
    auto iter = msg.begin();

    if (*iter != protocol.size() or
        not std::equal(protocol.begin(), protocol.end(), std::next(iter))) {
        return tl::make_unexpected(Errc::PROTOCOL_MISMATCH);
    }
    std::advance(iter, PeerHandshakeMsg::HEADER_SIZE);

    PeerHandshakeMsg handshake;

    std::copy_n(iter, PeerHandshakeMsg::RESERVED_SIZE, handshake.reserved.begin());
    std::advance(iter, PeerHandshakeMsg::RESERVED_SIZE);

    std::copy_n(iter, PeerHandshakeMsg::HASH_SIZE, handshake.info_hash.begin());
    std::advance(iter, PeerHandshakeMsg::HASH_SIZE);

    std::copy_n(iter, PeerHandshakeMsg::PEER_ID_SIZE, handshake.peer_id.begin());

    return handshake;
}

/**
 * @brief Extract metadata exchange parameters from a BEP 10 handshake
 *
 * Fields are checked in a fixed order: metadata_size, then the "m" map, then
 * its ut_metadata entry.
 */
auto unpack_ext_handshake_msg(std::span<const uint8_t> body)
  -> tl::expected<ExtensionHandshakeMsg, Errc>
{
    auto decoded = decode_dict(body);
    if (not decoded) {
        return tl::make_unexpected(Errc::MALFORMED_HANDSHAKE);
    }

    const auto& [_, dict] = *decoded;

    ExtensionHandshakeMsg msg;

    auto metadata_size = integer_field(dict, "metadata_size");
    if (not metadata_size) {
        return tl::make_unexpected(Errc::METADATA_SIZE_MISSING);
    }
    if (*metadata_size < 0) {
        return tl::make_unexpected(Errc::METADATA_SIZE_NEGATIVE);
    }
    if (*metadata_size > MAX_METADATA_SIZE) {
        return tl::make_unexpected(Errc::METADATA_SIZE_TOO_LARGE);
    }
    msg.metadata_size = *metadata_size;

    auto m = dict.find("m");
    if (m == dict.end() or not m->is_object()) {
        return tl::make_unexpected(Errc::HANDSHAKE_MAP_MISSING);
    }

    auto ut_metadata = integer_field(*m, UT_METADATA_KEY.data());
    if (not ut_metadata) {
        return tl::make_unexpected(Errc::UT_METADATA_MISSING);
    }
    // 0 disables the extension, ids are carried in one byte
    if (*ut_metadata < 1 or *ut_metadata > 255) {
        return tl::make_unexpected(Errc::UT_METADATA_INVALID);
    }
    msg.ut_metadata = static_cast<uint8_t>(*ut_metadata);

    if (auto v = dict.find("v"); v != dict.end() and v->is_string()) {
        msg.client = v->get<std::string>();
    }

    return msg;
}

/**
 * @brief Parse a ut_metadata message: a bencoded dictionary, then for data
 *        messages the raw piece bytes
 *
 * The piece bytes start right where the decoder stopped, so their content
 * never affects where the dictionary ends.
 */
auto unpack_metadata_msg(std::span<const uint8_t> body)
  -> tl::expected<MetadataMsg, Errc>
{
    auto decoded = decode_dict(body);
    if (not decoded) {
        return tl::make_unexpected(Errc::MALFORMED_PIECE);
    }

    const auto& [encoded, dict] = *decoded;

    const auto msg_type = integer_field(dict, "msg_type");
    const auto piece = integer_field(dict, "piece");
    if (not msg_type or not piece) {
        return tl::make_unexpected(Errc::MALFORMED_PIECE);
    }

    const auto type = magic_enum::enum_cast<MetadataMsgType>(*msg_type);
    if (not type) {
        return tl::make_unexpected(Errc::UNEXPECTED_MSG_TYPE);
    }

    const auto block = body.subspan(encoded.value.size());

    return MetadataMsg{
      .msg_type = *type,
      .piece = *piece,
      .total_size = integer_field(dict, "total_size"),
      .block = std::vector<uint8_t>(block.begin(), block.end()),
    };
}

}  // namespace metafetch::proto
