#include "client/piece_assembler.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/join.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "misc/digest.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"

namespace metafetch::client {

MetadataAssembly::MetadataAssembly(std::size_t metadata_size) :
  _metadata_size(metadata_size),
  _pieces(proto::metadata_piece_count(metadata_size))
{
}

auto MetadataAssembly::expected_length(std::size_t piece_idx) const
  -> std::size_t
{
    return proto::metadata_piece_length(_metadata_size, piece_idx);
}

auto MetadataAssembly::store(std::size_t piece_idx, std::vector<uint8_t> block)
  -> void
{
    _pieces.at(piece_idx) = std::move(block);
}

auto MetadataAssembly::has_piece(std::size_t piece_idx) const -> bool
{
    return _pieces.at(piece_idx).has_value();
}

auto MetadataAssembly::received_count() const -> std::size_t
{
    return ::ranges::count_if(_pieces, [](const auto& piece) {
        return piece.has_value();
    });
}

auto MetadataAssembly::complete() const -> bool
{
    return ::ranges::all_of(_pieces, [](const auto& piece) {
        return piece.has_value();
    });
}

auto MetadataAssembly::take() -> std::vector<uint8_t>
{
    using namespace ::ranges;

    if (_taken) {
        throw std::logic_error("Metadata assembly was already consumed");
    }
    if (not complete()) {
        throw std::logic_error(fmt::format(
          "Metadata assembly is incomplete: {} of {} pieces", received_count(),
          piece_count()
        ));
    }

    // clang-format off
    auto metadata =
      _pieces
      | views::transform([](const auto& piece) -> const std::vector<uint8_t>& {
          return *piece;
      })
      | views::join
      | to<std::vector<uint8_t>>();
    // clang-format on

    _pieces.clear();
    _taken = true;

    return metadata;
}


PieceAssembler::PieceAssembler(
  const proto::InfoHash& info_hash,
  ExtensionParameters params,
  ProgressCb progress_cb
) :
  _info_hash(info_hash),
  _params(params),
  _assembly(std::size_t(params.metadata_size)),
  _progress_callback(progress_cb)
{
}

auto PieceAssembler::request_msgs() const -> std::vector<std::vector<uint8_t>>
{
    std::vector<std::vector<uint8_t>> requests;
    requests.reserve(_assembly.piece_count());

    for (std::size_t piece = 0; piece < _assembly.piece_count(); ++piece) {
        requests.push_back(
          proto::pack_metadata_request_msg(_params.peer_ut_metadata, piece)
        );
    }

    return requests;
}

auto PieceAssembler::handle_message(std::span<const uint8_t> payload) -> bool
{
    auto extended = proto::unpack_extended_msg(payload);

    if (not extended or extended->sub_id != proto::LOCAL_UT_METADATA_ID) {
        auto msg_id = proto::unpack_msg_id(payload);
        spdlog::debug(
          "Skip {} ({} bytes)",
          msg_id ? magic_enum::enum_name(*msg_id) : "message", payload.size()
        );
        return complete();
    }

    auto msg = proto::unpack_metadata_msg(extended->body).map_error([](auto&& e) {
        raise(e, "Bad ut_metadata message from peer");
    });

    if (msg->msg_type == proto::MetadataMsgType::Reject) {
        raise(Errc::PIECE_REJECTED, fmt::format("Peer rejected piece {}", msg->piece));
    }

    if (msg->msg_type != proto::MetadataMsgType::Data) {
        raise(
          Errc::UNEXPECTED_MSG_TYPE,
          fmt::format(
            "Expected data message, got {} for piece {}",
            magic_enum::enum_name(msg->msg_type), msg->piece
          )
        );
    }

    if (msg->piece < 0 or std::size_t(msg->piece) >= _assembly.piece_count()) {
        raise(
          Errc::PIECE_OUT_OF_RANGE,
          fmt::format(
            "Piece {} is out of range [0, {})", msg->piece, _assembly.piece_count()
          )
        );
    }

    if (msg->total_size and *msg->total_size != _params.metadata_size) {
        raise(
          Errc::TOTAL_SIZE_MISMATCH,
          fmt::format(
            "Piece {} announces total size {}, handshake said {}", msg->piece,
            *msg->total_size, _params.metadata_size
          )
        );
    }

    const auto piece_idx = std::size_t(msg->piece);
    const auto expected_length = _assembly.expected_length(piece_idx);

    if (msg->block.size() != expected_length) {
        raise(
          Errc::PIECE_SIZE_MISMATCH,
          fmt::format(
            "Piece {} has {} bytes, expected {}", piece_idx, msg->block.size(),
            expected_length
          )
        );
    }

    if (_assembly.has_piece(piece_idx)) {
        spdlog::debug("Piece {} received again, replacing it", piece_idx);
    }

    _assembly.store(piece_idx, std::move(msg->block));

    spdlog::debug(
      "Piece {} stored, {} of {} received", piece_idx,
      _assembly.received_count(), _assembly.piece_count()
    );
    _progress_callback(_assembly.received_count(), _assembly.piece_count());

    return complete();
}

auto PieceAssembler::verified_metadata() -> std::vector<uint8_t>
{
    auto metadata = _assembly.take();

    const auto digest = sha1(metadata);
    if (digest != _info_hash) {
        raise(
          Errc::CHECKSUM_MISMATCH,
          fmt::format(
            "Metadata checksum mismatch: expected {}, got {}", to_hex(_info_hash),
            to_hex(digest)
          )
        );
    }

    return metadata;
}

}  // namespace metafetch::client
