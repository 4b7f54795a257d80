#pragma once

/// @file endian.hpp
/// @brief Big-endian stores for CBOR argument and float payloads.
///
/// CBOR is big-endian on the wire (RFC 8949 §3). These helpers write into
/// a caller-provided byte array with explicit shifts, so the result does
/// not depend on host byte order.

#include <cstdint>
#include <cstring>

namespace yacbor::detail {

inline void store_be16(uint8_t* p, uint16_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

inline void store_be32(uint8_t* p, uint32_t v) noexcept {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void store_be64(uint8_t* p, uint64_t v) noexcept {
    store_be32(p, static_cast<uint32_t>(v >> 32));
    store_be32(p + 4, static_cast<uint32_t>(v));
}

/// @brief Raw IEEE-754 bits of a double.
inline uint64_t double_bits(double d) noexcept {
    static_assert(sizeof(double) == sizeof(uint64_t), "IEEE-754 binary64 required");
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return bits;
}

inline double bits_to_double(uint64_t bits) noexcept {
    double d;
    std::memcpy(&d, &bits, sizeof(d));
    return d;
}

} // namespace yacbor::detail
