#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <magic_enum.hpp>

namespace metafetch {

enum class ErrorKind
{
    Connection,
    Protocol,
    Extension,
    Piece,
    Checksum,
};

enum class Errc
{
    // Connection
    CONNECT_FAILED,
    READ_FAILED,
    WRITE_FAILED,
    TIMEOUT,
    CONNECTION_CLOSED,
    FRAME_TOO_LARGE,

    // Protocol
    PROTOCOL_MISMATCH,
    EXTENSION_UNSUPPORTED,
    INFO_HASH_MISMATCH,

    // Extension
    MALFORMED_HANDSHAKE,
    UNEXPECTED_MESSAGE,
    METADATA_SIZE_MISSING,
    METADATA_SIZE_NEGATIVE,
    METADATA_SIZE_TOO_LARGE,
    HANDSHAKE_MAP_MISSING,
    UT_METADATA_MISSING,
    UT_METADATA_INVALID,

    // Piece
    MALFORMED_PIECE,
    PIECE_REJECTED,
    UNEXPECTED_MSG_TYPE,
    PIECE_OUT_OF_RANGE,
    TOTAL_SIZE_MISMATCH,
    PIECE_SIZE_MISMATCH,

    // Checksum
    CHECKSUM_MISMATCH,
};

constexpr auto kind_of(Errc code) noexcept -> ErrorKind
{
    if (code <= Errc::FRAME_TOO_LARGE) {
        return ErrorKind::Connection;
    }
    if (code <= Errc::INFO_HASH_MISMATCH) {
        return ErrorKind::Protocol;
    }
    if (code <= Errc::UT_METADATA_INVALID) {
        return ErrorKind::Extension;
    }
    if (code <= Errc::PIECE_SIZE_MISMATCH) {
        return ErrorKind::Piece;
    }
    return ErrorKind::Checksum;
}

/**
 * @brief Base of every error a metadata session reports to its caller
 */
class MetadataError : public std::runtime_error
{
 public:
    MetadataError(Errc code, const std::string& details) :
      std::runtime_error(fmt::format(
        "{} error ({}): {}", magic_enum::enum_name(kind_of(code)),
        magic_enum::enum_name(code), details
      )),
      _code(code)
    {
    }

    auto code() const noexcept -> Errc { return _code; }
    auto kind() const noexcept -> ErrorKind { return kind_of(_code); }

 private:
    Errc _code;
};

template<ErrorKind KIND>
class KindError : public MetadataError
{
 public:
    using MetadataError::MetadataError;
};

using ConnectionError = KindError<ErrorKind::Connection>;
using ProtocolError = KindError<ErrorKind::Protocol>;
using ExtensionError = KindError<ErrorKind::Extension>;
using PieceError = KindError<ErrorKind::Piece>;
using ChecksumError = KindError<ErrorKind::Checksum>;

/**
 * @brief Throw the exception type matching the kind of `code`
 */
[[noreturn]] inline void raise(Errc code, const std::string& details)
{
    switch (kind_of(code)) {
        case ErrorKind::Connection:
            throw ConnectionError(code, details);
        case ErrorKind::Protocol:
            throw ProtocolError(code, details);
        case ErrorKind::Extension:
            throw ExtensionError(code, details);
        case ErrorKind::Piece:
            throw PieceError(code, details);
        case ErrorKind::Checksum:
            throw ChecksumError(code, details);
    }

    throw MetadataError(code, details);
}

}  // namespace metafetch
