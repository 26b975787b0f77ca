#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace net::tcp {

using Clock = std::chrono::steady_clock;

/**
 * @brief Logger for transport chatter, the default one if the application
 *        did not register "internal_logger"
 */
inline auto internal_logger() -> std::shared_ptr<spdlog::logger>
{
    if (auto logger = spdlog::get("internal_logger")) {
        return logger;
    }
    return spdlog::default_logger();
}

/**
 * @brief Blocking TCP connection where every operation is bounded by an
 *        absolute deadline
 *
 * Each call starts one async operation plus a deadline timer on a private
 * io_context and runs it to completion. When the timer wins, the socket is
 * cancelled and the call fails with `asio::error::timed_out`.
 */
class Connection
{
 public:
    inline Connection() :
      _socket(_io),
      _resolver(_io),
      _deadline_timer(_io),
      _logger(internal_logger())
    {
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    inline ~Connection() { close(); }

    inline auto connect(
      const std::string& host, uint16_t port, std::chrono::milliseconds timeout
    ) -> tl::expected<void, asio::error_code>
    {
        using asio::ip::tcp;

        set_timeout(timeout);

        tcp::resolver::results_type endpoints;
        auto error = _run_until_deadline([&](auto done) {
            _resolver.async_resolve(
              host, std::to_string(port),
              [&endpoints, done](auto ec, tcp::resolver::results_type results) {
                  endpoints = std::move(results);
                  done(ec);
              }
            );
        });

        if (error) {
            _logger->debug("Resolve {}:{} failed: {}", host, port, error.message());
            return tl::make_unexpected(error);
        }

        error = _run_until_deadline([&](auto done) {
            asio::async_connect(
              _socket, endpoints,
              [done](auto ec, const tcp::endpoint&) { done(ec); }
            );
        });

        if (error) {
            _logger->debug("Connect {}:{} failed: {}", host, port, error.message());
            close();
            return tl::make_unexpected(error);
        }

        _logger->debug("Connected to {}:{}", host, port);
        return {};
    }

    inline auto set_deadline(Clock::time_point deadline) -> void
    {
        _deadline = deadline;
    }

    inline auto set_timeout(std::chrono::milliseconds timeout) -> void
    {
        set_deadline(Clock::now() + timeout);
    }

    inline auto write(std::span<const uint8_t> data)
      -> tl::expected<void, asio::error_code>
    {
        if (not _socket.is_open()) {
            return tl::make_unexpected(asio::error::not_connected);
        }

        auto error = _run_until_deadline([&](auto done) {
            asio::async_write(
              _socket, asio::buffer(data.data(), data.size()),
              [done](auto ec, std::size_t) { done(ec); }
            );
        });

        _logger->debug("Write {} bytes: {}", data.size(), error.message());

        if (error) {
            return tl::make_unexpected(error);
        }
        return {};
    }

    /**
     * @brief Read exactly `length` bytes
     */
    inline auto read(std::size_t length)
      -> tl::expected<std::vector<uint8_t>, asio::error_code>
    {
        if (not _socket.is_open()) {
            return tl::make_unexpected(asio::error::not_connected);
        }

        std::vector<uint8_t> buffer(length);
        if (length == 0) {
            return buffer;
        }

        auto error = _run_until_deadline([&](auto done) {
            asio::async_read(
              _socket, asio::buffer(buffer),
              [done](auto ec, std::size_t) { done(ec); }
            );
        });

        _logger->debug("Read {} bytes: {}", length, error.message());

        if (error) {
            return tl::make_unexpected(error);
        }
        return buffer;
    }

    inline auto is_open() const -> bool { return _socket.is_open(); }

    inline auto close() -> void
    {
        if (not _socket.is_open()) {
            return;
        }

        asio::error_code ignored;
        _socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        _socket.close(ignored);

        _logger->debug("Connection closed");
    }

 private:
    template<typename Operation>
    inline auto _run_until_deadline(Operation&& start_operation)
      -> asio::error_code
    {
        asio::error_code operation_error = asio::error::operation_aborted;
        bool deadline_expired = false;

        _io.restart();

        start_operation([this, &operation_error](asio::error_code ec) {
            operation_error = ec;
            _deadline_timer.cancel();
        });

        _deadline_timer.expires_at(_deadline);
        _deadline_timer.async_wait([this, &deadline_expired](asio::error_code ec) {
            if (ec == asio::error::operation_aborted) {  // timer canceled
                return;
            }

            _logger->debug("Deadline expired");
            deadline_expired = true;

            asio::error_code ignored;
            _resolver.cancel();
            _socket.cancel(ignored);
        });

        _io.run();

        if (operation_error and deadline_expired) {
            return asio::error::timed_out;
        }
        return operation_error;
    }

    asio::io_context _io;
    asio::ip::tcp::socket _socket;
    asio::ip::tcp::resolver _resolver;
    asio::steady_timer _deadline_timer;

    Clock::time_point _deadline = Clock::time_point::max();

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace net::tcp
