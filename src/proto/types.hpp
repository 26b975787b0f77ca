#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bencode/types.hpp"
#include "misc/digest.hpp"

namespace metafetch::proto {

using InfoHash = Sha1Digest;
using PeerId = std::array<std::uint8_t, 20>;

enum class MsgId : uint8_t
{
    Choke = 0,
    Unchoke,
    Interested,
    NotInterested,
    Have,
    Bitfield,
    Request,
    Piece,
    Cancel,
    Port,
    Extended = 20,
};

enum class ExtendedMsgId : uint8_t
{
    Handshake = 0,
};

enum class MetadataMsgType : bencode::Integer
{
    Request = 0,
    Data = 1,
    Reject = 2,
};

constexpr const std::size_t METADATA_PIECE_SIZE = 16 * 1024;
constexpr const std::size_t MAX_METADATA_PIECES = 1024;
constexpr const bencode::Integer MAX_METADATA_SIZE =
  METADATA_PIECE_SIZE * MAX_METADATA_PIECES;

// Sub-id we announce for ut_metadata; peers must use it on messages to us
constexpr const std::uint8_t LOCAL_UT_METADATA_ID = 1;
constexpr const std::string_view UT_METADATA_KEY = "ut_metadata";

struct PeerHandshakeMsg
{
    constexpr static std::size_t HEADER_SIZE = 20;  // length byte + protocol
    constexpr static std::size_t RESERVED_SIZE = 8;
    constexpr static std::size_t HASH_SIZE = 20;
    constexpr static std::size_t PEER_ID_SIZE = 20;

    constexpr static std::size_t SIZE =
      HEADER_SIZE + RESERVED_SIZE + HASH_SIZE + PEER_ID_SIZE;

    constexpr static std::string_view PROTOCOL = "BitTorrent protocol";

    // BEP 10: reserved_byte[5] & 0x10
    constexpr static std::size_t EXTENSION_BYTE = 5;
    constexpr static std::uint8_t EXTENSION_BIT = 0x10;

    std::array<std::uint8_t, RESERVED_SIZE> reserved{};
    InfoHash info_hash{};
    PeerId peer_id{};

    auto supports_extensions() const -> bool
    {
        return (reserved[EXTENSION_BYTE] & EXTENSION_BIT) != 0;
    }
};

/**
 * @brief Fields of a BEP 10 handshake that matter for metadata exchange
 */
struct ExtensionHandshakeMsg
{
    bencode::Integer metadata_size = 0;
    std::uint8_t ut_metadata = 0;  // sub-id the peer wants on our requests
    std::optional<std::string> client;
};

struct ExtendedMsg
{
    std::uint8_t sub_id;
    std::span<const std::uint8_t> body;
};

struct MetadataMsg
{
    MetadataMsgType msg_type;
    bencode::Integer piece;
    std::optional<bencode::Integer> total_size;
    std::vector<std::uint8_t> block;  // Data messages only
};

/**
 * @brief ceil(metadata_size / METADATA_PIECE_SIZE)
 */
constexpr auto metadata_piece_count(std::size_t metadata_size) -> std::size_t
{
    return (metadata_size + METADATA_PIECE_SIZE - 1) / METADATA_PIECE_SIZE;
}

constexpr auto metadata_piece_length(
  std::size_t metadata_size, std::size_t piece_idx
) -> std::size_t
{
    const auto begin = piece_idx * METADATA_PIECE_SIZE;
    if (begin >= metadata_size) {
        return 0;
    }
    const auto remaining = metadata_size - begin;
    return remaining < METADATA_PIECE_SIZE ? remaining : METADATA_PIECE_SIZE;
}

}  // namespace metafetch::proto
