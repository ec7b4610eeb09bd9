//
// Little-endian field access for chunk headers
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

#include <riff/riff_config.h>

namespace riff {
    // Platform endianness detection using CMake-generated config
#if LIBRIFF_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    inline std::uint32_t swap32le(std::uint32_t x) {
        return is_little_endian ? x : swap32(x);
    }

    // Unaligned read of a little-endian uint32
    inline std::uint32_t load_le32(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32le(value);
    }

    inline void store_le32(std::byte* dst, std::uint32_t value) {
        value = swap32le(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
