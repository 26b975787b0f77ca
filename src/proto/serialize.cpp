#include "proto/serialize.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <magic_enum.hpp>

#include "bencode/encoders.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace metafetch::proto {

using namespace internal;

auto pack_handshake(const PeerHandshakeMsg& msg) -> std::vector<uint8_t>
{
    std::vector<uint8_t> packed;
    packed.reserve(PeerHandshakeMsg::SIZE);

    packed.push_back(PeerHandshakeMsg::PROTOCOL.size());
    packed.insert(
      packed.end(), PeerHandshakeMsg::PROTOCOL.begin(),
      PeerHandshakeMsg::PROTOCOL.end()
    );

    auto reserved = msg.reserved;
    reserved[PeerHandshakeMsg::EXTENSION_BYTE] |= PeerHandshakeMsg::EXTENSION_BIT;
    packed.insert(packed.end(), reserved.begin(), reserved.end());

    packed.insert(packed.end(), msg.info_hash.begin(), msg.info_hash.end());
    packed.insert(packed.end(), msg.peer_id.begin(), msg.peer_id.end());

    return packed;
}

auto pack_ext_handshake_msg(
  uint8_t ut_metadata_id, std::optional<bencode::Integer> metadata_size
) -> std::vector<uint8_t>
{
    bencode::Json dict = {
      {"m", {{std::string(UT_METADATA_KEY), ut_metadata_id}}},
    };

    if (metadata_size) {
        dict["metadata_size"] = *metadata_size;
    }

    return pack_extended_msg(uint8_t(ExtendedMsgId::Handshake), dict);
}

auto pack_metadata_request_msg(uint8_t peer_ut_metadata_id, std::size_t piece)
  -> std::vector<uint8_t>
{
    return pack_extended_msg(
      peer_ut_metadata_id,
      {
        {"msg_type", magic_enum::enum_integer(MetadataMsgType::Request)},
        {"piece", piece},
      }
    );
}

auto pack_metadata_data_msg(
  uint8_t ut_metadata_id,
  std::size_t piece,
  std::size_t total_size,
  std::span<const uint8_t> block
) -> std::vector<uint8_t>
{
    auto msg = pack_extended_msg(
      ut_metadata_id,
      {
        {"msg_type", magic_enum::enum_integer(MetadataMsgType::Data)},
        {"piece", piece},
        {"total_size", total_size},
      }
    );

    msg.insert(msg.end(), block.begin(), block.end());
    return msg;
}

auto pack_metadata_reject_msg(uint8_t ut_metadata_id, std::size_t piece)
  -> std::vector<uint8_t>
{
    return pack_extended_msg(
      ut_metadata_id,
      {
        {"msg_type", magic_enum::enum_integer(MetadataMsgType::Reject)},
        {"piece", piece},
      }
    );
}

auto pack_frame(std::span<const uint8_t> payload) -> std::vector<uint8_t>
{
    const auto length = utils::pack_u32(uint32_t(payload.size()));

    std::vector<uint8_t> frame;
    frame.reserve(length.size() + payload.size());
    frame.insert(frame.end(), length.begin(), length.end());
    frame.insert(frame.end(), payload.begin(), payload.end());

    return frame;
}

}  // namespace metafetch::proto


namespace metafetch::proto::internal {

auto pack_extended_msg(uint8_t sub_id, const bencode::Json& dict)
  -> std::vector<uint8_t>
{
    const auto encoded = bencode::encode(dict);
    if (not encoded) {
        throw std::logic_error(
          fmt::format("Extended message is not bencodable: {}", dict.dump())
        );
    }

    std::vector<uint8_t> msg{uint8_t(MsgId::Extended), sub_id};
    msg.insert(msg.end(), encoded->begin(), encoded->end());

    return msg;
}

}  // namespace metafetch::proto::internal
