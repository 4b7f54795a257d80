#pragma once

/// @file half.hpp
/// @brief IEEE-754 binary64 <-> binary16 conversion for the canonical float policy.
///
/// Conversion rules (double -> half):
///   - NaN           -> 0x7E00 (canonical quiet NaN, sign and payload dropped)
///   - +/-Inf        -> 0x7C00 / 0xFC00
///   - exponent > 15 -> signed infinity
///   - exponent in [-14, 15]   -> normal half, mantissa rounded to nearest even
///   - exponent in [-24, -15]  -> subnormal half, rounded to nearest even
///   - exponent < -24          -> signed zero

#include "endian.hpp"

#include <cmath>
#include <cstdint>

namespace yacbor::detail {

inline constexpr uint16_t kHalfPositiveInfinity = 0x7C00;
inline constexpr uint16_t kHalfQuietNaN = 0x7E00;
inline constexpr double kHalfMax = 65504.0;

/// @brief Round @p sig right by @p shift bits, ties to even.
inline uint64_t shift_round_even(uint64_t sig, unsigned shift) noexcept {
    const uint64_t kept = sig >> shift;
    const uint64_t rem = sig & ((uint64_t(1) << shift) - 1);
    const uint64_t halfway = uint64_t(1) << (shift - 1);
    if (rem > halfway || (rem == halfway && (kept & 1))) return kept + 1;
    return kept;
}

/// @brief Convert a double to the nearest binary16 bit pattern.
inline uint16_t double_to_half(double d) noexcept {
    const uint64_t bits = double_bits(d);
    const auto sign = static_cast<uint16_t>((bits >> 48) & 0x8000);
    const auto exp = static_cast<int>((bits >> 52) & 0x7FF);
    const uint64_t mant = bits & 0xFFFFFFFFFFFFFULL;

    if (exp == 0x7FF) {
        if (mant != 0) return kHalfQuietNaN;
        return static_cast<uint16_t>(sign | kHalfPositiveInfinity);
    }
    if (exp == 0) return sign;  // zero or binary64 subnormal

    const int e = exp - 1023;
    if (e > 15) return static_cast<uint16_t>(sign | kHalfPositiveInfinity);

    if (e >= -14) {
        // A mantissa carry out of 10 bits bumps the exponent, up to Inf.
        const uint64_t m = shift_round_even(mant, 42);
        return static_cast<uint16_t>(sign | ((static_cast<uint64_t>(e + 15) << 10) + m));
    }
    if (e >= -24) {
        // Rounding up to 0x400 yields the smallest normal, which is correct.
        const uint64_t sig = mant | (uint64_t(1) << 52);
        const auto shift = static_cast<unsigned>(28 - e);
        return static_cast<uint16_t>(sign | shift_round_even(sig, shift));
    }
    return sign;
}

/// @brief Expand a binary16 bit pattern to a double (exact).
inline double half_to_double(uint16_t h) noexcept {
    const int exp = (h >> 10) & 0x1F;
    const int mant = h & 0x3FF;
    double v;
    if (exp == 0) {
        v = std::ldexp(static_cast<double>(mant), -24);
    } else if (exp == 31) {
        v = mant == 0 ? HUGE_VAL : std::nan("");
    } else {
        v = std::ldexp(static_cast<double>(mant | 0x400), exp - 25);
    }
    return (h & 0x8000) ? -v : v;
}

/// @brief Decide whether @p d takes the 2-byte path under the canonical policy.
///
/// Qualifies: zeros, infinities, NaN, and integral values within +/-65504
/// whose half encoding converts back to exactly @p d. On success the half
/// bit pattern is stored in @p out.
inline bool half_if_exact(double d, uint16_t& out) noexcept {
    if (std::isnan(d) || std::isinf(d) || d == 0.0) {
        out = double_to_half(d);
        return true;
    }
    if (std::fabs(d) > kHalfMax || std::trunc(d) != d) return false;

    const uint16_t h = double_to_half(d);
    if (half_to_double(h) != d) return false;
    out = h;
    return true;
}

} // namespace yacbor::detail
