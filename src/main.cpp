#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <indicators/progress_bar.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "client/metadata_session.hpp"
#include "errors.hpp"
#include "fetch_options.hpp"
#include "info_dict.hpp"
#include "misc/digest.hpp"
#include "peer.hpp"

namespace fs = std::filesystem;

#ifdef ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

auto fetch_command(const metafetch::FetchOptions& options) -> ExitCode;
auto print_info(const metafetch::InfoDict& info, const metafetch::proto::InfoHash&)
  -> void;


int main(int argc, char* argv[])
{
    auto internal_logger = spdlog::stdout_color_mt("internal_logger");

    spdlog::set_level(spdlog::level::err);
    internal_logger->set_level(spdlog::level::off);

    if (argc < 2) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} fetch [options] <info_hash> <host>:<port> [<host>:<port> ...]", argv[0]);
        spdlog::error("    -o <output_file_path>      write raw metadata to file");
        spdlog::error("    --peer-id <20 chars>       local peer id");
        spdlog::error("    --dial-timeout <s>         default 3");
        spdlog::error("    --handshake-timeout <s>    default 5");
        spdlog::error("    --transfer-timeout <s>     default 30");
        spdlog::error("    --max-frame <bytes>        default {}", net::FrameTransport::DEFAULT_MAX_FRAME_SIZE);
        spdlog::error("    -v                         debug output");
        spdlog::error("  {} test", argv[0]);
        // clang-format on
        return 1;
    }

    std::string command = argv[1];

    try {
        if (command == "test") {
#ifdef ENABLE_TESTS
            spdlog::set_level(spdlog::level::info);
            tests();
#endif
            return ExitCode::Success;
        }

        if (command == "fetch") {
            auto options = metafetch::parse_fetch_options(argc, argv);

            if (options.verbose) {
                spdlog::set_level(spdlog::level::debug);
                internal_logger->set_level(spdlog::level::debug);
            }

            return fetch_command(options);
        }
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto progress_bar() -> std::unique_ptr<indicators::ProgressBar>
{
    using namespace indicators;

    return std::make_unique<ProgressBar>(
      option::BarWidth{50}, option::Start{"["}, option::Fill{"■"},
      option::Lead{"■"}, option::Remainder{"-"}, option::End{" ]"},
      option::PostfixText{"..."}, option::ForegroundColor{Color::grey},
      option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
      option::ShowElapsedTime{true}, option::Stream{std::cerr}
    );
}


auto fetch_command(const metafetch::FetchOptions& options) -> ExitCode
{
    using namespace metafetch;

    const auto info_hash = info_hash_from_string(options.info_hash);
    EXPECTED(
      info_hash.has_value(), "Info hash must be 40 hex characters, got \"{}\"",
      options.info_hash
    );

    auto peer_id = options.peer_id ? peer_id_from_string(*options.peer_id)
                                   : std::optional(generate_peer_id());
    EXPECTED(
      peer_id.has_value(), "Peer id must be exactly 20 characters, got \"{}\"",
      options.peer_id.value_or("")
    );

    if (options.output_file_path and options.output_file_path->has_parent_path()) {
        EXPECTED(
          fs::exists(options.output_file_path->parent_path()),
          "Path not found: \"{}\"",
          options.output_file_path->parent_path().c_str()
        );
    }

    const auto peers = parse_peer_endpoints(options.peers, *peer_id);
    EXPECTED(not peers.empty(), "No usable peer address among {}", options.peers.size());

    // One session per attempt, first peer that delivers wins
    for (const auto& peer : peers) {
        std::shared_ptr<indicators::ProgressBar> bar = progress_bar();
        auto on_progress = [bar](std::size_t received, std::size_t total) {
            bar->set_option(indicators::option::PostfixText{
              fmt::format("{}/{} pieces", received, total)
            });
            bar->set_progress(received * 100 / total);
        };

        client::MetadataSession session(peer, *info_hash, options.config, on_progress);

        spdlog::info("Fetching metadata {} from {}", to_hex(*info_hash), peer.to_string());

        std::vector<uint8_t> metadata;
        try {
            metadata = session.fetch();
        } catch (const MetadataError& e) {
            spdlog::error("{}: {}", peer.to_string(), e.what());
            continue;
        }

        if (not bar->is_completed()) {
            bar->mark_as_completed();
        }

        if (options.output_file_path) {
            std::ofstream ofs;
            ofs.open(*options.output_file_path, std::ios::out | std::ios::binary);
            EXPECTED(ofs, "Can't write to file {}", options.output_file_path->c_str());

            ofs.write(reinterpret_cast<const char*>(metadata.data()), metadata.size());
            EXPECTED(ofs, "Can't write to file {}", options.output_file_path->c_str());
        }

        auto info = InfoDict::from_bytes(metadata, /*strict=*/false);
        EXPECTED(
          info.has_value(), "Metadata from {} verified but does not decode",
          peer.to_string()
        );

        print_info(*info, *info_hash);

        if (session.remote_client()) {
            spdlog::info("Served by {}", *session.remote_client());
        }

        return ExitCode::Success;
    }

    spdlog::error("No peer delivered metadata for {}", to_hex(*info_hash));
    return ExitCode::Fail;
}


auto print_info(const metafetch::InfoDict& info, const metafetch::proto::InfoHash& info_hash)
  -> void
{
    fmt::print(
      "Name: {0}\nInfo Hash: {1}\nLength: {2}\nPiece Length: {3}\nPieces: {4}\n",
      info.name, metafetch::to_hex(info_hash), info.total_length(),
      info.piece_length, info.piece_hashes().size()
    );

    if (info.is_multi_file()) {
        fmt::print("Files:\n");
        for (const auto& file : info.files) {
            fmt::print("  {} ({})\n", file.path, file.length);
        }
    }
}
