#pragma once

/// @file hash.hpp
/// @brief Key hashing for the Container lookup index.
///
/// Map keys are short byte strings ("id", "created_at", ...). The hasher
/// folds the key 8 bytes at a time with one multiply per word and finishes
/// with a xor-shift avalanche. Keys are opaque bytes; no UTF-8 handling.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace yacbor::detail {

inline uint64_t load_u64(const char* p) noexcept {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

inline uint64_t mix(uint64_t h, uint64_t word) noexcept {
    constexpr uint64_t kMul = 0x9fb21c651e98df25ULL;
    h ^= word;
    h *= kMul;
    return h ^ (h >> 47);
}

/// @brief Hash @p len bytes at @p data.
inline size_t hash_bytes(const char* data, size_t len) noexcept {
    uint64_t h = 0x243f6a8885a308d3ULL ^ (static_cast<uint64_t>(len) << 1);

    size_t i = 0;
    for (; i + 8 <= len; i += 8) h = mix(h, load_u64(data + i));

    // Tail: 0..7 bytes packed little-end first.
    uint64_t tail = 0;
    for (size_t shift = 0; i < len; ++i, shift += 8)
        tail |= static_cast<uint64_t>(static_cast<unsigned char>(data[i])) << shift;
    h = mix(h, tail);

    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    return static_cast<size_t>(h);
}

/// @brief Transparent hasher over string_view keys.
struct KeyHash {
    using is_transparent = void;

    size_t operator()(std::string_view key) const noexcept {
        return hash_bytes(key.data(), key.size());
    }
};

/// @brief Transparent comparator matching KeyHash.
struct KeyEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace yacbor::detail
