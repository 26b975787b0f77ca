#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "client/handshake.hpp"
#include "proto/types.hpp"

namespace metafetch::client {

/**
 * @brief Metadata piece slots, each absent or holding the received bytes
 */
class MetadataAssembly
{
 public:
    explicit MetadataAssembly(std::size_t metadata_size);

    auto metadata_size() const -> std::size_t { return _metadata_size; }
    auto piece_count() const -> std::size_t { return _pieces.size(); }
    auto expected_length(std::size_t piece_idx) const -> std::size_t;

    /**
     * @brief Store a piece, replacing whatever was there
     */
    auto store(std::size_t piece_idx, std::vector<uint8_t> block) -> void;

    auto has_piece(std::size_t piece_idx) const -> bool;
    auto received_count() const -> std::size_t;
    auto complete() const -> bool;

    /**
     * @brief Concatenate the pieces in index order, emptying the assembly
     */
    auto take() -> std::vector<uint8_t>;

 private:
    std::size_t _metadata_size;
    std::vector<std::optional<std::vector<uint8_t>>> _pieces;
    bool _taken = false;
};

/**
 * @brief ut_metadata side of a session: builds requests, consumes replies,
 *        verifies the result against the info hash
 */
class PieceAssembler
{
 public:
    using ProgressCb = std::function<void(
      std::size_t /* received_pieces */, std::size_t /* piece_count */
    )>;

    PieceAssembler(
      const proto::InfoHash& info_hash,
      ExtensionParameters params,
      ProgressCb progress_cb = [](std::size_t, std::size_t) {}
    );

    /**
     * @brief One request payload per piece, in index order
     */
    auto request_msgs() const -> std::vector<std::vector<uint8_t>>;

    /**
     * @brief Consume one frame payload. Anything but a ut_metadata message
     *        addressed to us is ignored. Throws PieceError on bad replies.
     *
     * Returns true once every piece is present.
     */
    auto handle_message(std::span<const uint8_t> payload) -> bool;

    auto complete() const -> bool { return _assembly.complete(); }
    auto assembly() const -> const MetadataAssembly& { return _assembly; }

    /**
     * @brief Concatenated metadata, only if its SHA-1 equals the info hash.
     *        Throws ChecksumError otherwise.
     */
    auto verified_metadata() -> std::vector<uint8_t>;

 private:
    const proto::InfoHash _info_hash;
    ExtensionParameters _params;
    MetadataAssembly _assembly;
    ProgressCb _progress_callback;
};

}  // namespace metafetch::client
