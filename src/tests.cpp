#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "bencode/decoders.hpp"
#include "bencode/encoders.hpp"
#include "bencode/tools.hpp"
#include "bencode/types.hpp"
#include "client/piece_assembler.hpp"
#include "errors.hpp"
#include "fetch_options.hpp"
#include "info_dict.hpp"
#include "misc/digest.hpp"
#include "misc/parse_ip_port.hpp"
#include "peer.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

using namespace bencode;
using namespace bencode::internal;
using namespace std::string_view_literals;

void test_decoding();
void test_encoding();
void test_pack_u32();
void test_digest();
void test_parse_host_port();
void test_fetch_options();
void test_handshake_codec();
void test_ext_handshake_codec();
void test_metadata_msg_codec();
void test_piece_count();
void test_assembly_order_independent();
void test_assembly_duplicates();
void test_assembler_errors();
void test_assembler_checksum();
void test_info_dict();

void session_tests();

void tests()
{
    test_decoding();
    test_encoding();
    test_pack_u32();
    test_digest();
    test_parse_host_port();
    test_fetch_options();
    test_handshake_codec();
    test_ext_handshake_codec();
    test_metadata_msg_codec();
    test_piece_count();
    test_assembly_order_independent();
    test_assembly_duplicates();
    test_assembler_errors();
    test_assembler_checksum();
    test_info_dict();

    session_tests();

    spdlog::info("All tests passed");
}

namespace {

auto make_metadata(std::size_t size) -> std::vector<uint8_t>
{
    std::vector<uint8_t> metadata(size);
    for (std::size_t i = 0; i < size; ++i) {
        metadata[i] = uint8_t((i * 131 + 7) % 251);
    }
    return metadata;
}

auto slice(const std::vector<uint8_t>& data, std::size_t piece_idx)
  -> std::vector<uint8_t>
{
    using metafetch::proto::METADATA_PIECE_SIZE;

    const auto begin = piece_idx * METADATA_PIECE_SIZE;
    const auto end = std::min(begin + METADATA_PIECE_SIZE, data.size());
    return {data.begin() + begin, data.begin() + end};
}

auto data_msg(std::size_t piece_idx, const std::vector<uint8_t>& block, std::size_t total)
  -> std::vector<uint8_t>
{
    return metafetch::proto::pack_metadata_data_msg(
      metafetch::proto::LOCAL_UT_METADATA_ID, piece_idx, total, block
    );
}

template<typename Error>
auto piece_error_of(metafetch::client::PieceAssembler& assembler, std::span<const uint8_t> msg)
  -> std::optional<Error>
{
    try {
        assembler.handle_message(msg);
    } catch (const Error& e) {
        return e;
    }
    return std::nullopt;
}

}  // namespace

void test_decoding()
{
    // decode_string
    {
        auto res = decode_string("3:abc");
        assert(res != std::nullopt);

        auto [encoded, decoded] = *res;
        assert(encoded.value == "3:abc"sv);
        assert(decoded == Json("abc"));
    }

    {
        auto res = decode_string("3:foo3:bar");
        assert(res != std::nullopt);

        auto [encoded, decoded] = *res;
        assert(encoded.value == "3:foo"sv);
        assert(decoded == Json("foo"));
    }

    {
        assert(decode_string("3+abc") == std::nullopt);
        assert(decode_string("5:abc") == std::nullopt);   // truncated
        assert(decode_string("-1:abc") == std::nullopt);  // negative length
    }

    {  // non UTF-8 strings become binary
        auto res = decode_string("2:\xff\xfe"sv);
        assert(res != std::nullopt);

        auto [encoded, decoded] = *res;
        assert(decoded.is_binary());
        assert(decoded.get_binary().size() == 2);
    }

    // decode_integer
    {
        auto res = decode_integer("i-123e");
        assert(res != std::nullopt);

        auto [encoded, decoded] = *res;
        assert(encoded.value == "i-123e"sv);
        assert(decoded == Json(-123));
    }

    {
        auto res = decode_integer("i100ei-123e");
        assert(res != std::nullopt);

        auto [encoded, decoded] = *res;
        assert(encoded.value == "i100e"sv);
        assert(decoded == Json(100));
    }

    {
        assert(decode_integer("iasde") == std::nullopt);
        assert(decode_integer("ie") == std::nullopt);
    }

    // decode_bencoded_list
    {
        auto res = decode_bencoded_list("li123el2:abee");
        assert(res != std::nullopt);

        auto [src, result] = *res;
        assert(src.value == "li123el2:abee"sv);

        auto expected_result =
          Json(std::vector{Json(123), Json(std::vector{Json("ab")})});

        assert(result.dump() == expected_result.dump());
    }

    {
        assert(decode_bencoded_list("l2:aasdasdbe") == std::nullopt);
        assert(decode_bencoded_list("li1e") == std::nullopt);  // no end
    }

    // decode_bencoded_dict
    {
        auto res = decode_bencoded_dict("d3:foo3:bar5:helloi52ee");
        assert(res != std::nullopt);

        auto [src, result] = *res;
        assert(src.value == "d3:foo3:bar5:helloi52ee"sv);

        auto expected_result = R"({"hello": 52, "foo":"bar"})"_json;
        assert(result.dump() == expected_result.dump());
    }

    {  // consumed length stops at the dict end, trailing bytes are untouched
        auto res = decode_bencoded_value("d5:piecei0eeee\x01\x02"sv);
        assert(res != std::nullopt);

        auto [src, result] = *res;
        assert(src.type == EncodedValueType::Dictionary);
        assert(src.value == "d5:piecei0ee"sv);
        assert(result["piece"] == Json(0));
    }

    {
        assert(decode_bencoded_dict("d3:fooee") == std::nullopt);
        assert(decode_bencoded_dict("d3:foo2bare") == std::nullopt);
        assert(decode_bencoded_value(""sv) == std::nullopt);
    }

    {  // nesting is bounded
        std::string deep(200, 'l');
        deep += std::string(200, 'e');
        assert(decode_bencoded_value(deep) == std::nullopt);
    }
}


void test_encoding()
{
    {
        assert(encode_integer(Json(123)) == "i123e");
        assert(encode_integer(Json(-123)) == "i-123e");
    }

    {
        assert(encode_string(Json("123")) == "3:123");
        assert(encode_binary(Json::binary({1, 2, 3})) == "3:\1\2\3");
    }

    {
        auto encoded_dict = encode_dict(R"({"foo":"bar","buz":2})"_json);

        assert(encoded_dict != std::nullopt);
        assert(*encoded_dict == "d3:buzi2e3:foo3:bare");
    }

    {
        auto encoded_list = encode_list(R"([1, 2, 3])"_json);

        assert(encoded_list != std::nullopt);
        assert(*encoded_list == "li1ei2ei3ee");
    }

    {  // nothing to map a float onto
        assert(encode(R"({"a": 1.5})"_json) == std::nullopt);
    }
}

void test_pack_u32()
{
    using namespace metafetch::proto::utils;

    const uint32_t a = 32868;
    const auto packed = pack_u32(a);
    assert(packed[0] == 0x00 and packed[1] == 0x00);
    assert(packed[2] == 0x80 and packed[3] == 0x64);
    assert(unpack_u32(packed) == a);

    const auto frame = metafetch::proto::pack_frame(std::vector<uint8_t>{20, 0});
    assert((frame == std::vector<uint8_t>{0, 0, 0, 2, 20, 0}));
}

void test_digest()
{
    using namespace metafetch;

    // SHA-1("abc")
    assert(
      to_hex(sha1("abc"sv)) == "a9993e364706816aba3e25717850c26c9cd0d89d"
    );

    auto parsed = sha1_hash_from_hex("A9993E364706816ABA3E25717850C26C9CD0D89D");
    assert(parsed.has_value());
    assert(*parsed == sha1("abc"sv));

    assert(not sha1_hash_from_hex("a9993e"));
    assert(not sha1_hash_from_hex("z9993e364706816aba3e25717850c26c9cd0d89d"));
}

void test_parse_host_port()
{
    {
        auto [host, port] = utils::parse_host_port("127.0.0.1:6881");
        assert(host == "127.0.0.1" and port == 6881);
    }

    {
        auto [host, port] = utils::parse_host_port("[::1]:51413");
        assert(host == "::1" and port == 51413);
    }

    {
        auto [host, port] = utils::parse_host_port("router.example.org:80");
        assert(host == "router.example.org" and port == 80);
    }

    for (auto bad : {"127.0.0.1", "127.0.0.1:0", "host:99999", ":80"}) {
        bool thrown = false;
        try {
            utils::parse_host_port(bad);
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
    }

    auto peer_id = metafetch::generate_peer_id();
    assert(std::string(peer_id.begin(), peer_id.begin() + 8) == "-MF0100-");
    assert(std::all_of(peer_id.begin() + 8, peer_id.end(), [](auto c) {
        return c >= '0' and c <= '9';
    }));

    assert(not metafetch::peer_id_from_string("short"));

    {  // a bad address does not hide the good ones after it
        auto endpoints = metafetch::parse_peer_endpoints(
          {"10.0.0.1:0", "not an address", "127.0.0.1:6881", "[::1]:51413"}, peer_id
        );
        assert(endpoints.size() == 2);
        assert(endpoints[0].to_string() == "127.0.0.1:6881");
        assert(endpoints[1].to_string() == "[::1]:51413");
        assert(endpoints[1].peer_id == peer_id);

        assert(metafetch::parse_peer_endpoints({"host:99999"}, peer_id).empty());
    }
}

void test_fetch_options()
{
    using namespace std::chrono_literals;

    {
        const char* argv[] = {
          "metafetch", "fetch", "--dial-timeout", "1.5", "--max-frame", "4096",
          "-v", "0123456789abcdef0123456789abcdef01234567", "10.0.0.1:0",
          "127.0.0.1:6881",
        };
        auto options = metafetch::parse_fetch_options(std::size(argv), argv);

        assert(options.config.dial_timeout == 1500ms);
        assert(options.config.max_frame_size == 4096);
        assert(options.verbose);
        assert(options.peers.size() == 2);  // validated later, one by one
    }

    auto error_of = [](std::vector<const char*> argv) -> std::string {
        try {
            metafetch::parse_fetch_options(int(argv.size()), argv.data());
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return {};
    };

    {
        auto error = error_of({"metafetch", "fetch", "--dial-timeout", "soon", "h", "a:1"});
        assert(error.find("--dial-timeout") != std::string::npos);
        assert(error.find("soon") != std::string::npos);
    }

    {
        auto error = error_of({"metafetch", "fetch", "--max-frame", "big", "h", "a:1"});
        assert(error.find("--max-frame") != std::string::npos);
    }

    assert(not error_of({"metafetch", "fetch", "--handshake-timeout", "-1", "h", "a:1"}).empty());
    assert(not error_of({"metafetch", "fetch", "--transfer-timeout"}).empty());
    assert(not error_of({"metafetch", "fetch", "only_hash"}).empty());
}

void test_handshake_codec()
{
    using namespace metafetch;
    using namespace metafetch::proto;

    PeerHandshakeMsg msg;
    msg.info_hash = sha1("info"sv);
    msg.peer_id = *peer_id_from_string("-MF0100-123456789012");

    auto packed = pack_handshake(msg);
    assert(packed.size() == PeerHandshakeMsg::SIZE);
    assert(packed[0] == 19);
    assert(std::string(packed.begin() + 1, packed.begin() + 20) == "BitTorrent protocol");
    assert(packed[25] == 0x10);  // extension protocol bit
    assert(std::equal(msg.info_hash.begin(), msg.info_hash.end(), packed.begin() + 28));

    auto unpacked = unpack_handshake(packed);
    assert(unpacked.has_value());
    assert(unpacked->supports_extensions());
    assert(unpacked->info_hash == msg.info_hash);
    assert(unpacked->peer_id == msg.peer_id);

    {
        auto no_extensions = packed;
        no_extensions[25] = 0;
        auto result = unpack_handshake(no_extensions);
        assert(result.has_value());
        assert(not result->supports_extensions());
    }

    {
        auto other_protocol = packed;
        other_protocol[1] = 'b';
        auto result = unpack_handshake(other_protocol);
        assert(not result.has_value());
        assert(result.error() == Errc::PROTOCOL_MISMATCH);
    }

    {
        auto result = unpack_handshake(std::span(packed).first(40));
        assert(not result.has_value());
    }
}

void test_ext_handshake_codec()
{
    using namespace metafetch;
    using namespace metafetch::proto;

    {
        auto packed = pack_ext_handshake_msg(LOCAL_UT_METADATA_ID);
        auto expected = "d1:md11:ut_metadatai1eee"sv;

        assert(packed.size() == 2 + expected.size());
        assert(packed[0] == 20 and packed[1] == 0);
        assert(bencode::as_chars(std::span(packed).subspan(2)) == expected);
    }

    auto ext_body = [](std::string_view dict) {
        return std::vector<uint8_t>(dict.begin(), dict.end());
    };

    {
        auto msg = unpack_ext_handshake_msg(
          ext_body("d1:md11:ut_metadatai3ee13:metadata_sizei32868e1:v10:Fake 1.0.0e")
        );
        assert(msg.has_value());
        assert(msg->metadata_size == 32868);
        assert(msg->ut_metadata == 3);
        assert(msg->client == "Fake 1.0.0");
    }

    auto error_of = [&](std::string_view dict) {
        auto msg = unpack_ext_handshake_msg(ext_body(dict));
        assert(not msg.has_value());
        assert(kind_of(msg.error()) == ErrorKind::Extension);
        return msg.error();
    };

    assert(error_of("d1:md11:ut_metadatai3eee") == Errc::METADATA_SIZE_MISSING);
    assert(error_of("d13:metadata_sizei-1e1:md11:ut_metadatai3eee") == Errc::METADATA_SIZE_NEGATIVE);
    assert(error_of("d13:metadata_sizei16777217e1:md11:ut_metadatai3eee") == Errc::METADATA_SIZE_TOO_LARGE);
    assert(error_of("d13:metadata_sizei100ee") == Errc::HANDSHAKE_MAP_MISSING);
    assert(error_of("d1:mi1e13:metadata_sizei100ee") == Errc::HANDSHAKE_MAP_MISSING);
    assert(error_of("d1:md6:ut_pexi1ee13:metadata_sizei100ee") == Errc::UT_METADATA_MISSING);
    assert(error_of("d1:md11:ut_metadatai0ee13:metadata_sizei100ee") == Errc::UT_METADATA_INVALID);
    assert(error_of("d1:md11:ut_metadatai256ee13:metadata_sizei100ee") == Errc::UT_METADATA_INVALID);
    assert(error_of("not a dict") == Errc::MALFORMED_HANDSHAKE);

    {  // the biggest allowed size is accepted
        auto msg = unpack_ext_handshake_msg(
          ext_body("d1:md11:ut_metadatai2ee13:metadata_sizei16777216ee")
        );
        assert(msg.has_value());
        assert(msg->metadata_size == MAX_METADATA_SIZE);
    }
}

void test_metadata_msg_codec()
{
    using namespace metafetch;
    using namespace metafetch::proto;

    {
        auto request = pack_metadata_request_msg(3, 7);
        assert(request[0] == 20 and request[1] == 3);
        assert(bencode::as_chars(std::span(request).subspan(2)) == "d8:msg_typei0e5:piecei7ee"sv);
    }

    {  // payload that starts with what looks like a dictionary end
        std::vector<uint8_t> block{'e', 'e', 'd', 'e', 0, 255};
        auto packed = pack_metadata_data_msg(LOCAL_UT_METADATA_ID, 2, 32774, block);

        auto extended = unpack_extended_msg(packed);
        assert(extended.has_value());
        assert(extended->sub_id == LOCAL_UT_METADATA_ID);

        auto msg = unpack_metadata_msg(extended->body);
        assert(msg.has_value());
        assert(msg->msg_type == MetadataMsgType::Data);
        assert(msg->piece == 2);
        assert(msg->total_size == 32774);
        assert(msg->block == block);
    }

    {
        auto packed = pack_metadata_reject_msg(LOCAL_UT_METADATA_ID, 1);
        auto msg = unpack_metadata_msg(unpack_extended_msg(packed)->body);
        assert(msg.has_value());
        assert(msg->msg_type == MetadataMsgType::Reject);
        assert(msg->block.empty());
    }

    auto body = [](std::string_view dict) {
        return std::vector<uint8_t>(dict.begin(), dict.end());
    };

    assert(unpack_metadata_msg(body("d5:piecei0ee")).error() == Errc::MALFORMED_PIECE);
    assert(unpack_metadata_msg(body("d8:msg_type1:15:piecei0ee")).error() == Errc::MALFORMED_PIECE);
    assert(unpack_metadata_msg(body("li1ee")).error() == Errc::MALFORMED_PIECE);
    assert(unpack_metadata_msg(body("d8:msg_typei7e5:piecei0ee")).error() == Errc::UNEXPECTED_MSG_TYPE);

    assert(not unpack_extended_msg(std::vector<uint8_t>{5, 0xff}));
    assert(not unpack_extended_msg(std::vector<uint8_t>{}));
    assert(unpack_msg_id(std::vector<uint8_t>{5, 0xff}) == MsgId::Bitfield);
    assert(not unpack_msg_id(std::vector<uint8_t>{}));
}

void test_piece_count()
{
    using namespace metafetch::proto;

    assert(metadata_piece_count(0) == 0);
    assert(metadata_piece_count(1) == 1);
    assert(metadata_piece_count(METADATA_PIECE_SIZE) == 1);
    assert(metadata_piece_count(METADATA_PIECE_SIZE + 1) == 2);
    assert(metadata_piece_count(METADATA_PIECE_SIZE * 2 + 100) == 3);
    assert(metadata_piece_count(MAX_METADATA_SIZE) == MAX_METADATA_PIECES);

    for (std::size_t size = 0; size <= std::size_t(MAX_METADATA_SIZE); size += 4099) {
        const auto count = metadata_piece_count(size);
        assert(count * METADATA_PIECE_SIZE >= size);
        assert(count == 0 or (count - 1) * METADATA_PIECE_SIZE < size);
    }

    assert(metadata_piece_length(METADATA_PIECE_SIZE * 2 + 100, 0) == METADATA_PIECE_SIZE);
    assert(metadata_piece_length(METADATA_PIECE_SIZE * 2 + 100, 2) == 100);
    assert(metadata_piece_length(METADATA_PIECE_SIZE * 2, 1) == METADATA_PIECE_SIZE);

    metafetch::client::MetadataAssembly empty(0);
    assert(empty.piece_count() == 0);
    assert(empty.complete());
    assert(empty.take().empty());
}

void test_assembly_order_independent()
{
    using namespace metafetch;
    using namespace metafetch::client;

    const std::size_t size = proto::METADATA_PIECE_SIZE * 2 + 100;
    const auto metadata = make_metadata(size);
    const auto info_hash = sha1(metadata);

    const std::vector<std::vector<std::size_t>> orders{
      {0, 1, 2},
      {2, 0, 1},
      {2, 1, 0},
      {1, 1, 2, 0, 2},
    };

    for (const auto& order : orders) {
        std::size_t progress_calls = 0;
        PieceAssembler assembler(
          info_hash, ExtensionParameters{.metadata_size = bencode::Integer(size), .peer_ut_metadata = 2},
          [&](std::size_t received, std::size_t total) {
              ++progress_calls;
              assert(total == 3);
              assert(received >= 1 and received <= 3);
          }
        );

        assert(assembler.assembly().piece_count() == 3);
        assert(assembler.request_msgs().size() == 3);

        bool done = false;
        for (auto idx : order) {
            assert(not done);
            done = assembler.handle_message(data_msg(idx, slice(metadata, idx), size));
        }

        assert(done);
        assert(progress_calls == order.size());

        auto result = assembler.verified_metadata();
        assert(result.size() == 32868);
        assert(result == metadata);
    }
}

void test_assembly_duplicates()
{
    using namespace metafetch::client;

    MetadataAssembly assembly(100);
    assert(assembly.piece_count() == 1);
    assert(not assembly.complete());

    assembly.store(0, std::vector<uint8_t>(100, 'a'));
    assembly.store(0, std::vector<uint8_t>(100, 'a'));
    assert(assembly.received_count() == 1);

    assembly.store(0, std::vector<uint8_t>(100, 'b'));  // last write wins
    assert(assembly.complete());

    auto result = assembly.take();
    assert(result == std::vector<uint8_t>(100, 'b'));

    bool thrown = false;
    try {
        assembly.take();
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_assembler_errors()
{
    using namespace metafetch;
    using namespace metafetch::client;

    const std::size_t size = proto::METADATA_PIECE_SIZE + 10;
    const auto metadata = make_metadata(size);

    PieceAssembler assembler(
      sha1(metadata),
      ExtensionParameters{.metadata_size = bencode::Integer(size), .peer_ut_metadata = 4}
    );

    {  // requests use the peer's sub-id
        auto requests = assembler.request_msgs();
        assert(requests.size() == 2);
        assert(requests[1] == proto::pack_metadata_request_msg(4, 1));
    }

    {  // other messages and other sub-ids are skipped
        assert(not assembler.handle_message(std::vector<uint8_t>{}));
        assert(not assembler.handle_message(std::vector<uint8_t>{5, 0xff}));

        auto other_sub_id = proto::pack_metadata_data_msg(2, 1, size, slice(metadata, 1));
        assert(not assembler.handle_message(other_sub_id));
        assert(assembler.assembly().received_count() == 0);
    }

    {
        auto reject = proto::pack_metadata_reject_msg(proto::LOCAL_UT_METADATA_ID, 0);
        auto error = piece_error_of<PieceError>(assembler, reject);
        assert(error and error->code() == Errc::PIECE_REJECTED);
        assert(error->kind() == ErrorKind::Piece);
    }

    {
        auto out_of_range = data_msg(2, slice(metadata, 1), size);
        auto error = piece_error_of<PieceError>(assembler, out_of_range);
        assert(error and error->code() == Errc::PIECE_OUT_OF_RANGE);
    }

    {
        auto wrong_total = data_msg(0, slice(metadata, 0), size + 1);
        auto error = piece_error_of<PieceError>(assembler, wrong_total);
        assert(error and error->code() == Errc::TOTAL_SIZE_MISMATCH);
    }

    {
        auto short_piece = data_msg(0, slice(metadata, 1), size);
        auto error = piece_error_of<PieceError>(assembler, short_piece);
        assert(error and error->code() == Errc::PIECE_SIZE_MISMATCH);
    }

    {
        auto request = proto::pack_metadata_request_msg(proto::LOCAL_UT_METADATA_ID, 0);
        auto error = piece_error_of<PieceError>(assembler, request);
        assert(error and error->code() == Errc::UNEXPECTED_MSG_TYPE);
    }

    {
        std::vector<uint8_t> garbage{20, proto::LOCAL_UT_METADATA_ID, 'x', 'y'};
        auto error = piece_error_of<PieceError>(assembler, garbage);
        assert(error and error->code() == Errc::MALFORMED_PIECE);
    }

    assert(assembler.assembly().received_count() == 0);
}

void test_assembler_checksum()
{
    using namespace metafetch;
    using namespace metafetch::client;

    const auto metadata = make_metadata(500);

    PieceAssembler assembler(
      sha1("something else"sv),
      ExtensionParameters{.metadata_size = 500, .peer_ut_metadata = 1}
    );

    assert(assembler.handle_message(data_msg(0, metadata, 500)));

    bool thrown = false;
    try {
        assembler.verified_metadata();
        assert(false && "mismatched metadata must never be returned");
    } catch (const ChecksumError& e) {
        thrown = true;
        assert(e.code() == Errc::CHECKSUM_MISMATCH);
    }
    assert(thrown);
}

void test_info_dict()
{
    using namespace metafetch;

    {
        auto json = R"({
            "name": "file.bin",
            "length": 1000,
            "piece length": 16384
        })"_json;
        json["pieces"] = Json::binary(std::vector<uint8_t>(40, 0xab));  // 2 hashes
        auto bytes = to_bytes(*encode(json));

        auto info = InfoDict::from_bytes(bytes);
        assert(info.has_value());
        assert(info->name == "file.bin");
        assert(info->total_length() == 1000);
        assert(info->piece_length == 16384);
        assert(info->piece_hashes().size() == 2);
        assert(not info->is_multi_file());
    }

    {
        auto json = R"({
            "name": "dir",
            "piece length": 32768,
            "files": [
                {"length": 10, "path": ["a", "b.txt"]},
                {"length": 20, "path": ["c.txt"]}
            ]
        })"_json;
        json["pieces"] = Json::binary(std::vector<uint8_t>(20, 0xcd));
        auto bytes = to_bytes(*encode(json));

        auto info = InfoDict::from_bytes(bytes);
        assert(info.has_value());
        assert(info->is_multi_file());
        assert(info->files.size() == 2);
        assert(info->files[0].path == "a/b.txt");
        assert(info->total_length() == 30);
    }

    {  // not an info dictionary
        auto bytes = to_bytes("d3:fooi1ee");
        assert(not InfoDict::from_bytes(bytes));
        assert(InfoDict::from_bytes(bytes, /*strict=*/false).has_value());
    }

    {  // wrongly typed numbers are rejected, not thrown
        for (auto bad : {
               R"({"name": "x", "length": "10", "piece length": 16384})",
               R"({"name": "x", "length": 10, "piece length": [1]})",
               R"({"name": "d", "piece length": 1, "files": [{"length": "1", "path": ["a"]}]})",
             }) {
            auto json = Json::parse(bad);
            json["pieces"] = Json::binary(std::vector<uint8_t>(20, 0));
            auto bytes = to_bytes(*encode(json));

            assert(not InfoDict::from_bytes(bytes));
            assert(not InfoDict::from_bytes(bytes, /*strict=*/false));
        }
    }
}
