#pragma once

/// @file config.hpp
/// @brief Configuration macros for the yacbor library.
///
/// Controls:
///   - Float encoding policy (system-wide, fixed at compile time)
///   - Linear vs hashed key lookup threshold for Container
///   - Platform detection
///   - Branch prediction hints

// =====================================================================
// Float encoding policy
// =====================================================================
// 0 (default): every float is written as an 8-byte double (0xFB).
// 1: zero, -0, infinities, NaN and small exactly-integral values are
//    written as 2-byte half floats (0xF9); everything else as a double.
// Decoders only need to agree on the wire format, which both policies
// keep inside RFC 8949. Pick one per build; do not mix.

#if !defined(YACBOR_CANONICAL_FLOATS)
    #define YACBOR_CANONICAL_FLOATS 0
#endif

// =====================================================================
// Small map threshold for linear vs hash lookup
// =====================================================================

#if !defined(YACBOR_OBJECT_LINEAR_THRESHOLD)
    #define YACBOR_OBJECT_LINEAR_THRESHOLD 16
#endif

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define CBOR_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define CBOR_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define CBOR_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define CBOR_LIKELY(x)   (x)
    #define CBOR_UNLIKELY(x) (x)
    #define CBOR_NOINLINE    __declspec(noinline)
#else
    #define CBOR_LIKELY(x)   (x)
    #define CBOR_UNLIKELY(x) (x)
    #define CBOR_NOINLINE
#endif
