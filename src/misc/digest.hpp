#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/evp.h>

namespace metafetch {

constexpr const std::size_t SHA1_DIGEST_SIZE = 20;

using Sha1Digest = std::array<std::uint8_t, SHA1_DIGEST_SIZE>;

/**
 * @brief Incremental SHA-1 over OpenSSL's EVP interface
 */
class Sha1
{
 public:
    Sha1() : _ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
    {
        if (not _ctx or EVP_DigestInit_ex(_ctx.get(), EVP_sha1(), nullptr) != 1) {
            throw std::runtime_error("Can't initialize SHA-1 context");
        }
    }

    auto update(std::span<const std::uint8_t> data) -> Sha1&
    {
        if (EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("SHA-1 update failed");
        }
        return *this;
    }

    auto update(std::string_view data) -> Sha1&
    {
        return update(std::span<const std::uint8_t>(
          reinterpret_cast<const std::uint8_t*>(data.data()), data.size()
        ));
    }

    auto final() -> Sha1Digest
    {
        Sha1Digest digest{};
        unsigned int length = 0;

        if (EVP_DigestFinal_ex(_ctx.get(), digest.data(), &length) != 1 or
            length != digest.size()) {
            throw std::runtime_error("SHA-1 finalization failed");
        }

        return digest;
    }

 private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> _ctx;
};

inline auto sha1(std::span<const std::uint8_t> data) -> Sha1Digest
{
    return Sha1().update(data).final();
}

inline auto sha1(std::string_view data) -> Sha1Digest
{
    return Sha1().update(data).final();
}

inline auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
    return fmt::format("{:02x}", fmt::join(bytes, ""));
}

/**
 * @brief Parse 40 hex characters into a digest
 */
inline auto sha1_hash_from_hex(std::string_view hex) -> std::optional<Sha1Digest>
{
    if (hex.size() != SHA1_DIGEST_SIZE * 2) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' and c <= '9') {
            return c - '0';
        }
        if (c >= 'a' and c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' and c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };

    Sha1Digest digest{};
    for (std::size_t i = 0; i < digest.size(); ++i) {
        const auto hi = nibble(hex[2 * i]);
        const auto lo = nibble(hex[2 * i + 1]);
        if (hi < 0 or lo < 0) {
            return std::nullopt;
        }
        digest[i] = static_cast<std::uint8_t>(hi << 4 | lo);
    }

    return digest;
}

}  // namespace metafetch
