#pragma once

#include <cstdint>
#include <cstring>

namespace strata {
namespace utils {

/// Byte-level helpers for the packed row format.
/// All multi-byte integers in a row are little-endian except values written
/// for the fixed-size key tree, which are stored big-endian so that raw byte
/// comparison matches numeric order.
namespace bits {

inline uint64_t swapBytes(uint64_t value) {
    return ((value & 0x00000000000000FFull) << 56) |
           ((value & 0x000000000000FF00ull) << 40) |
           ((value & 0x0000000000FF0000ull) << 24) |
           ((value & 0x00000000FF000000ull) << 8)  |
           ((value & 0x000000FF00000000ull) >> 8)  |
           ((value & 0x0000FF0000000000ull) >> 24) |
           ((value & 0x00FF000000000000ull) >> 40) |
           ((value & 0xFF00000000000000ull) >> 56);
}

inline void storeUInt32LE(uint8_t* dest, uint32_t value) {
    dest[0] = static_cast<uint8_t>(value >> 0);
    dest[1] = static_cast<uint8_t>(value >> 8);
    dest[2] = static_cast<uint8_t>(value >> 16);
    dest[3] = static_cast<uint8_t>(value >> 24);
}

inline uint32_t loadUInt32LE(const uint8_t* src) {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) |
           (static_cast<uint32_t>(src[3]) << 24);
}

inline void storeUInt64LE(uint8_t* dest, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        dest[i] = static_cast<uint8_t>(value >> (i * 8));
    }
}

inline uint64_t loadUInt64LE(const uint8_t* src) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(src[i]) << (i * 8);
    }
    return value;
}

inline void storeUInt64BE(uint8_t* dest, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        dest[i] = static_cast<uint8_t>(value >> ((7 - i) * 8));
    }
}

inline uint64_t loadUInt64BE(const uint8_t* src) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint64_t>(src[i]);
    }
    return value;
}

} // namespace bits
} // namespace utils
} // namespace strata
