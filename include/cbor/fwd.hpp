#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and the value type enumeration for yacbor.

#include <cstddef>
#include <cstdint>

namespace yacbor {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class ArrayRef;
class Container;
class MonotonicArena;
class CountingResource;

/// Value variants. The set is closed: every switch over Type is exhaustive.
enum class Type : uint8_t {
    Null    = 0,
    Bool    = 1,
    Integer = 2,
    Float   = 3,
    String  = 4,
    Array   = 5,
    Object  = 6
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:    return "null";
        case Type::Bool:    return "bool";
        case Type::Integer: return "integer";
        case Type::Float:   return "float";
        case Type::String:  return "string";
        case Type::Array:   return "array";
        case Type::Object:  return "object";
    }
    return "unknown";
}

/// CBOR major types (RFC 8949 §3.1), the top 3 bits of an initial byte.
enum class MajorType : uint8_t {
    UnsignedInteger = 0,
    NegativeInteger = 1,
    ByteString      = 2,
    TextString      = 3,
    Array           = 4,
    Map             = 5,
    Tag             = 6,
    Simple          = 7
};

} // namespace yacbor
