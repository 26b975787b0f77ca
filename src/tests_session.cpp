#include <algorithm>
#include <array>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "bencode/encoders.hpp"
#include "bencode/types.hpp"
#include "client/metadata_session.hpp"
#include "errors.hpp"
#include "misc/digest.hpp"
#include "peer.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

using namespace metafetch;
using namespace std::chrono_literals;
using namespace std::string_view_literals;
using asio::ip::tcp;

void test_session_out_of_order_pieces();
void test_session_duplicate_pieces();
void test_session_empty_metadata();
void test_session_runs_once();
void test_session_handshake_errors();
void test_session_unexpected_extended_message();
void test_session_negative_metadata_size();
void test_session_rejected_piece();
void test_session_checksum_mismatch();
void test_session_truncated_frame();
void test_session_frame_too_large();
void test_session_timeout();
void test_session_connect_refused();

void session_tests()
{
    test_session_out_of_order_pieces();
    test_session_duplicate_pieces();
    test_session_empty_metadata();
    test_session_runs_once();
    test_session_handshake_errors();
    test_session_unexpected_extended_message();
    test_session_negative_metadata_size();
    test_session_rejected_piece();
    test_session_checksum_mismatch();
    test_session_truncated_frame();
    test_session_frame_too_large();
    test_session_timeout();
    test_session_connect_refused();

    spdlog::info("Session tests passed");
}

namespace {

using Bytes = std::vector<uint8_t>;

const auto LOCAL_PEER_ID = *peer_id_from_string("-MF0100-111111111111");
const auto FAKE_PEER_ID = *peer_id_from_string("-FK0001-000000000042");

constexpr const uint8_t FAKE_UT_METADATA_ID = 3;

/**
 * @brief One-shot peer on 127.0.0.1 that accepts a single connection and
 *        runs a blocking script against it on its own thread
 *
 * The destructor joins the thread, so anything the script records can be
 * checked once the peer goes out of scope.
 */
class FakePeer
{
 public:
    using Script = std::function<void(tcp::socket&)>;

    explicit FakePeer(Script script) :
      _acceptor(_io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      _port(_acceptor.local_endpoint().port()),
      _thread([this, script = std::move(script)] { _serve(script); })
    {
    }

    auto endpoint() const -> PeerEndpoint
    {
        return PeerEndpoint{.host = "127.0.0.1", .port = _port, .peer_id = LOCAL_PEER_ID};
    }

 private:
    auto _serve(const Script& script) -> void
    {
        tcp::socket socket(_io);

        asio::error_code ec;
        _acceptor.accept(socket, ec);
        if (ec) {
            return;
        }

        script(socket);
    }

    asio::io_context _io;
    tcp::acceptor _acceptor;
    uint16_t _port;
    std::jthread _thread;
};

/**
 * @brief Routes the default logger into a string while alive
 */
class CapturedLog
{
 public:
    CapturedLog() :
      _previous(spdlog::default_logger()),
      _sink(std::make_shared<spdlog::sinks::ostream_sink_mt>(_stream))
    {
        auto logger = std::make_shared<spdlog::logger>("captured", _sink);
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%v");
        spdlog::set_default_logger(logger);
    }

    ~CapturedLog() { spdlog::set_default_logger(_previous); }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    auto text() const -> std::string { return _stream.str(); }

 private:
    std::ostringstream _stream;
    std::shared_ptr<spdlog::logger> _previous;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> _sink;
};

auto read_exact(tcp::socket& socket, std::size_t length) -> std::optional<Bytes>
{
    Bytes buffer(length);

    asio::error_code ec;
    asio::read(socket, asio::buffer(buffer), ec);
    if (ec) {
        return std::nullopt;
    }
    return buffer;
}

auto read_frame(tcp::socket& socket) -> std::optional<Bytes>
{
    auto prefix = read_exact(socket, 4);
    if (not prefix) {
        return std::nullopt;
    }

    auto length = proto::utils::unpack_u32(std::span<const uint8_t, 4>(prefix->data(), 4));
    return read_exact(socket, length);
}

auto send(tcp::socket& socket, std::span<const uint8_t> data) -> bool
{
    asio::error_code ec;
    asio::write(socket, asio::buffer(data.data(), data.size()), ec);
    return not ec;
}

auto send_frame(tcp::socket& socket, std::span<const uint8_t> payload) -> bool
{
    return send(socket, proto::pack_frame(payload));
}

// Block until the client hangs up
auto wait_closed(tcp::socket& socket) -> void
{
    std::array<uint8_t, 512> sink;
    asio::error_code ec;
    while (not ec) {
        socket.read_some(asio::buffer(sink), ec);
    }
}

// Frames the client sends until it hangs up
auto drain_frames(tcp::socket& socket) -> std::size_t
{
    std::size_t count = 0;
    while (read_frame(socket)) {
        ++count;
    }
    return count;
}

auto handshake_reply(const proto::InfoHash& info_hash) -> Bytes
{
    return proto::pack_handshake(
      proto::PeerHandshakeMsg{.info_hash = info_hash, .peer_id = FAKE_PEER_ID}
    );
}

auto ext_handshake_reply(const bencode::Json& dict) -> Bytes
{
    auto encoded = bencode::encode(dict);
    assert(encoded);

    Bytes payload{uint8_t(proto::MsgId::Extended), uint8_t(proto::ExtendedMsgId::Handshake)};
    payload.insert(payload.end(), encoded->begin(), encoded->end());
    return payload;
}

auto ext_handshake_dict(bencode::Integer metadata_size) -> bencode::Json
{
    return bencode::Json{
      {"m", bencode::Json{{"ut_metadata", FAKE_UT_METADATA_ID}}},
      {"metadata_size", metadata_size},
      {"v", "FakePeer 0.1"},
    };
}

/**
 * @brief Both handshakes of a well behaved peer
 *
 * Returns the client's extension handshake payload.
 */
auto greet(tcp::socket& socket, const proto::InfoHash& info_hash, const bencode::Json& ext_dict)
  -> std::optional<Bytes>
{
    if (not read_exact(socket, proto::PeerHandshakeMsg::SIZE)) {
        return std::nullopt;
    }
    if (not send(socket, handshake_reply(info_hash))) {
        return std::nullopt;
    }

    auto client_ext_handshake = read_frame(socket);
    if (not client_ext_handshake) {
        return std::nullopt;
    }
    if (not send_frame(socket, ext_handshake_reply(ext_dict))) {
        return std::nullopt;
    }

    return client_ext_handshake;
}

auto make_metadata(std::size_t size) -> Bytes
{
    Bytes metadata(size);
    for (std::size_t i = 0; i < size; ++i) {
        metadata[i] = uint8_t((i * 37 + 11) % 253);
    }
    // Pieces that open with bytes looking like a dictionary end
    for (std::size_t begin = 0; begin < size; begin += proto::METADATA_PIECE_SIZE) {
        metadata[begin] = 'e';
        if (begin + 1 < size) {
            metadata[begin + 1] = 'e';
        }
    }
    return metadata;
}

auto piece_msg(const Bytes& metadata, std::size_t piece_idx) -> Bytes
{
    const auto begin = piece_idx * proto::METADATA_PIECE_SIZE;
    const auto length = proto::metadata_piece_length(metadata.size(), piece_idx);

    return proto::pack_metadata_data_msg(
      proto::LOCAL_UT_METADATA_ID, piece_idx, metadata.size(),
      std::span(metadata).subspan(begin, length)
    );
}

auto fast_config() -> client::SessionConfig
{
    return client::SessionConfig{
      .dial_timeout = 2s,
      .handshake_timeout = 2s,
      .transfer_timeout = 5s,
    };
}

template<typename Error>
auto fetch_error(client::MetadataSession& session) -> std::optional<Error>
{
    try {
        session.fetch();
    } catch (const Error& e) {
        return e;
    }
    return std::nullopt;
}

}  // namespace

void test_session_out_of_order_pieces()
{
    const auto metadata = make_metadata(proto::METADATA_PIECE_SIZE * 2 + 100);
    const auto info_hash = sha1(metadata);

    Bytes client_handshake;
    Bytes client_ext_handshake;
    std::vector<Bytes> requests;

    Bytes result;
    std::size_t progress_calls = 0;

    {
        FakePeer peer([&](tcp::socket& socket) {
            auto handshake = read_exact(socket, proto::PeerHandshakeMsg::SIZE);
            if (not handshake) {
                return;
            }
            client_handshake = *handshake;

            send(socket, handshake_reply(info_hash));

            const Bytes bitfield{uint8_t(proto::MsgId::Bitfield), 0xff};
            send_frame(socket, bitfield);

            client_ext_handshake = read_frame(socket).value_or(Bytes{});
            send_frame(socket, ext_handshake_reply(ext_handshake_dict(bencode::Integer(metadata.size()))));

            for (int i = 0; i < 3; ++i) {
                requests.push_back(read_frame(socket).value_or(Bytes{}));
            }

            send_frame(socket, piece_msg(metadata, 2));
            send_frame(socket, Bytes{});  // keep-alive
            send_frame(socket, piece_msg(metadata, 0));
            send_frame(socket, Bytes{uint8_t(proto::MsgId::Have), 0, 0, 0, 1});
            send_frame(socket, piece_msg(metadata, 1));

            wait_closed(socket);
        });

        client::MetadataSession session(
          peer.endpoint(), info_hash, fast_config(),
          [&](std::size_t received, std::size_t total) {
              ++progress_calls;
              assert(received == progress_calls);
              assert(total == 3);
          }
        );

        assert(session.state() == client::SessionState::Idle);

        result = session.fetch();

        assert(session.state() == client::SessionState::Done);
        assert(session.extension_parameters().has_value());
        assert(session.extension_parameters()->metadata_size == 32868);
        assert(session.extension_parameters()->peer_ut_metadata == FAKE_UT_METADATA_ID);
        assert(session.remote_peer_id() == FAKE_PEER_ID);
        assert(session.remote_client() == "FakePeer 0.1");
    }

    assert(result.size() == 32868);
    assert(result == metadata);
    assert(sha1(result) == info_hash);
    assert(progress_calls == 3);

    // Our side of the conversation
    assert(client_handshake.size() == proto::PeerHandshakeMsg::SIZE);
    assert(client_handshake[25] & proto::PeerHandshakeMsg::EXTENSION_BIT);
    assert(std::equal(info_hash.begin(), info_hash.end(), client_handshake.begin() + 28));
    assert(std::equal(LOCAL_PEER_ID.begin(), LOCAL_PEER_ID.end(), client_handshake.begin() + 48));

    assert(client_ext_handshake == proto::pack_ext_handshake_msg(proto::LOCAL_UT_METADATA_ID));

    assert(requests.size() == 3);
    for (std::size_t i = 0; i < requests.size(); ++i) {
        assert(requests[i] == proto::pack_metadata_request_msg(FAKE_UT_METADATA_ID, i));
    }
}

void test_session_duplicate_pieces()
{
    const auto metadata = make_metadata(proto::METADATA_PIECE_SIZE + 1);
    const auto info_hash = sha1(metadata);

    auto corrupted = metadata;
    corrupted[10] ^= 0xff;

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, info_hash, ext_handshake_dict(bencode::Integer(metadata.size())))) {
            return;
        }
        read_frame(socket);
        read_frame(socket);

        // A repeated piece replaces the earlier copy
        send_frame(socket, piece_msg(corrupted, 0));
        send_frame(socket, piece_msg(metadata, 0));
        send_frame(socket, piece_msg(metadata, 1));

        wait_closed(socket);
    });

    client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
    assert(session.fetch() == metadata);
}

void test_session_empty_metadata()
{
    const auto info_hash = sha1(""sv);
    std::size_t frames_after_handshake = 1;

    {
        FakePeer peer([&](tcp::socket& socket) {
            if (not greet(socket, info_hash, ext_handshake_dict(0))) {
                return;
            }
            frames_after_handshake = drain_frames(socket);
        });

        CapturedLog log;

        client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
        auto result = session.fetch();

        assert(result.empty());
        assert(session.state() == client::SessionState::Done);

        // Verified straight after the extension handshake
        const auto transitions = log.text();
        assert(transitions.find("ExtensionHandshaking -> Done") != std::string::npos);
        assert(transitions.find("RequestingPieces") == std::string::npos);
        assert(transitions.find("Assembling") == std::string::npos);
    }

    assert(frames_after_handshake == 0);
}

void test_session_runs_once()
{
    const auto metadata = make_metadata(200);
    const auto info_hash = sha1(metadata);

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, info_hash, ext_handshake_dict(200))) {
            return;
        }
        read_frame(socket);
        send_frame(socket, piece_msg(metadata, 0));
        wait_closed(socket);
    });

    client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
    assert(session.fetch() == metadata);

    bool thrown = false;
    try {
        session.fetch();
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(session.state() == client::SessionState::Done);
}

void test_session_handshake_errors()
{
    const auto info_hash = sha1("handshake"sv);

    auto run = [&](Bytes reply) {
        FakePeer peer([&](tcp::socket& socket) {
            if (not read_exact(socket, proto::PeerHandshakeMsg::SIZE)) {
                return;
            }
            send(socket, reply);
            wait_closed(socket);
        });

        client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
        auto error = fetch_error<ProtocolError>(session);

        assert(error.has_value());
        assert(error->kind() == ErrorKind::Protocol);
        assert(session.state() == client::SessionState::Failed);
        assert(not session.extension_parameters());

        return error->code();
    };

    {
        auto reply = handshake_reply(info_hash);
        reply[1] = 'b';  // "bitTorrent protocol"
        assert(run(reply) == Errc::PROTOCOL_MISMATCH);
    }

    {
        auto reply = handshake_reply(info_hash);
        reply[20 + proto::PeerHandshakeMsg::EXTENSION_BYTE] = 0;
        assert(run(reply) == Errc::EXTENSION_UNSUPPORTED);
    }

    {
        auto reply = handshake_reply(sha1("another torrent"sv));
        assert(run(reply) == Errc::INFO_HASH_MISMATCH);
    }
}

void test_session_unexpected_extended_message()
{
    const auto info_hash = sha1("unexpected"sv);

    FakePeer peer([&](tcp::socket& socket) {
        if (not read_exact(socket, proto::PeerHandshakeMsg::SIZE)) {
            return;
        }
        send(socket, handshake_reply(info_hash));
        read_frame(socket);

        send_frame(socket, proto::pack_metadata_reject_msg(proto::LOCAL_UT_METADATA_ID, 0));
        wait_closed(socket);
    });

    client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
    auto error = fetch_error<ExtensionError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::UNEXPECTED_MESSAGE);
    assert(session.state() == client::SessionState::Failed);
}

void test_session_negative_metadata_size()
{
    const auto info_hash = sha1("negative"sv);
    std::size_t frames_after_handshake = 1;

    {
        FakePeer peer([&](tcp::socket& socket) {
            if (not greet(socket, info_hash, ext_handshake_dict(-1))) {
                return;
            }
            frames_after_handshake = drain_frames(socket);
        });

        client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
        auto error = fetch_error<ExtensionError>(session);

        assert(error.has_value());
        assert(error->code() == Errc::METADATA_SIZE_NEGATIVE);
        assert(session.state() == client::SessionState::Failed);
    }

    // Not a single piece was requested
    assert(frames_after_handshake == 0);
}

void test_session_rejected_piece()
{
    const auto info_hash = sha1("rejected"sv);

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, info_hash, ext_handshake_dict(100))) {
            return;
        }
        read_frame(socket);
        send_frame(socket, proto::pack_metadata_reject_msg(proto::LOCAL_UT_METADATA_ID, 0));
        wait_closed(socket);
    });

    client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
    auto error = fetch_error<PieceError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::PIECE_REJECTED);
    assert(session.state() == client::SessionState::Failed);
}

void test_session_checksum_mismatch()
{
    const auto metadata = make_metadata(300);

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, sha1("expected"sv), ext_handshake_dict(300))) {
            return;
        }
        read_frame(socket);
        send_frame(socket, piece_msg(metadata, 0));
        wait_closed(socket);
    });

    client::MetadataSession session(peer.endpoint(), sha1("expected"sv), fast_config());
    auto error = fetch_error<ChecksumError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::CHECKSUM_MISMATCH);
    assert(session.state() == client::SessionState::Failed);
}

void test_session_truncated_frame()
{
    const auto info_hash = sha1("truncated"sv);

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, info_hash, ext_handshake_dict(100))) {
            return;
        }
        read_frame(socket);

        // Announce 200 bytes, deliver 50, hang up
        auto prefix = proto::utils::pack_u32(200);
        send(socket, prefix);
        send(socket, Bytes(50, 'x'));
    });

    client::MetadataSession session(peer.endpoint(), info_hash, fast_config());
    auto error = fetch_error<ConnectionError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::CONNECTION_CLOSED);
    assert(session.state() == client::SessionState::Failed);
}

void test_session_frame_too_large()
{
    const auto info_hash = sha1("too large"sv);

    FakePeer peer([&](tcp::socket& socket) {
        if (not greet(socket, info_hash, ext_handshake_dict(100))) {
            return;
        }
        read_frame(socket);

        auto prefix = proto::utils::pack_u32(2 * 1024 * 1024);
        send(socket, prefix);
        wait_closed(socket);
    });

    auto config = fast_config();
    config.max_frame_size = 1024;

    client::MetadataSession session(peer.endpoint(), info_hash, config);
    auto error = fetch_error<ConnectionError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::FRAME_TOO_LARGE);
}

void test_session_timeout()
{
    const auto info_hash = sha1("silent"sv);

    // Accepts, reads the handshake, then says nothing
    FakePeer peer([&](tcp::socket& socket) {
        if (not read_exact(socket, proto::PeerHandshakeMsg::SIZE)) {
            return;
        }
        wait_closed(socket);
    });

    auto config = fast_config();
    config.handshake_timeout = 300ms;

    client::MetadataSession session(peer.endpoint(), info_hash, config);

    const auto started = std::chrono::steady_clock::now();
    auto error = fetch_error<ConnectionError>(session);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(error.has_value());
    assert(error->code() == Errc::TIMEOUT);
    assert(session.state() == client::SessionState::Failed);
    assert(elapsed >= 250ms);
    assert(elapsed < 2s);
}

void test_session_connect_refused()
{
    uint16_t port = 0;
    {
        asio::io_context io;
        tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    client::MetadataSession session(
      PeerEndpoint{.host = "127.0.0.1", .port = port, .peer_id = LOCAL_PEER_ID},
      sha1("nobody home"sv), fast_config()
    );
    auto error = fetch_error<ConnectionError>(session);

    assert(error.has_value());
    assert(error->code() == Errc::CONNECT_FAILED);
    assert(session.state() == client::SessionState::Failed);
}
