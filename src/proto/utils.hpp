#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace metafetch::proto::utils {

/**
 * @brief Network byte order, independent of the host's
 */
inline auto pack_u32(uint32_t value) -> std::array<uint8_t, 4>
{
    return {
      static_cast<uint8_t>((value >> 24) & 0xFF),  // Most significant byte
      static_cast<uint8_t>((value >> 16) & 0xFF),
      static_cast<uint8_t>((value >> 8) & 0xFF),
      static_cast<uint8_t>(value & 0xFF),          // Least significant byte
    };
}

inline auto unpack_u32(std::span<const uint8_t, 4> msg) -> uint32_t
{
    return (uint32_t)msg[0] << 24 | ((uint32_t)msg[1] << 16) |
           ((uint32_t)msg[2] << 8) | ((uint32_t)msg[3]);
}

}  // namespace metafetch::proto::utils
