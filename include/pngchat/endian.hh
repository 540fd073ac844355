//
// Big-endian integer helpers for the PNG wire format
//

#pragma once

#include <cstdint>
#include <cstring>
#include <cstddef>

#include <pngchat/pngchat_config.h>

namespace pngchat {
    // Platform endianness detection using CMake-generated config
#if PNGCHAT_BIG_ENDIAN
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

    // Network (PNG) order <-> host order
    inline std::uint32_t swap32be(std::uint32_t x) {
        return is_big_endian ? x : swap32(x);
    }

    // Read a big-endian u32 from 4 bytes
    inline std::uint32_t load_be32(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32be(value);
    }

    // Write a u32 as 4 big-endian bytes
    inline void store_be32(std::byte* dst, std::uint32_t value) {
        value = swap32be(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
