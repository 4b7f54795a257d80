#pragma once

/// @file encoder.hpp
/// @brief Canonical CBOR encoder: one writer per major type, single pass.
///
/// Wire format (RFC 8949 subset):
///   null            -> 0xF6
///   false / true    -> 0xF4 / 0xF5
///   integer         -> major 0 / 1, shortest of 1, 2, 3, 5 or 9 bytes
///   float           -> 0xFB + 8 bytes, or 0xF9 + 2 bytes under
///                      FloatPolicy::CanonicalHalf (see config.hpp)
///   string          -> major 3, length < 24 inline, else 1 or 2 length bytes
///   array           -> major 4, same length rule, then each element
///   map             -> major 5, same length rule, then key/value pairs in
///                      insertion order; keys are always strings
///
/// Lengths above 65535 throw LengthError. Everything multi-byte is
/// big-endian. Bytes go straight to the output with no intermediate tree;
/// a failure part-way leaves whatever was already written in place.
///
/// Output adapters are plain classes with:
///   void write(uint8_t byte);
///   void write(const uint8_t* data, size_t n);

#include "config.hpp"
#include "detail/endian.hpp"
#include "detail/half.hpp"
#include "error.hpp"
#include "value.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <ostream>
#include <string_view>
#include <system_error>
#include <vector>

namespace yacbor {

/// @brief How floats are written. Chosen once per build via
/// YACBOR_CANONICAL_FLOATS; every encoder in the program must agree.
enum class FloatPolicy : uint8_t {
    Double,         ///< Always the 9-byte double form
    CanonicalHalf   ///< 3-byte half form for values it represents exactly
};

inline constexpr FloatPolicy kFloatPolicy =
    YACBOR_CANONICAL_FLOATS ? FloatPolicy::CanonicalHalf : FloatPolicy::Double;

/// Largest string, array or map length the encoder accepts.
inline constexpr size_t kMaxLength = 0xFFFF;

namespace detail {

/// Additional-information values selecting a following argument field.
inline constexpr uint8_t kInfoUint8  = 24;
inline constexpr uint8_t kInfoUint16 = 25;
inline constexpr uint8_t kInfoUint32 = 26;
inline constexpr uint8_t kInfoUint64 = 27;

inline constexpr uint8_t kFalse  = 0xF4;
inline constexpr uint8_t kTrue   = 0xF5;
inline constexpr uint8_t kNull   = 0xF6;
inline constexpr uint8_t kHalf   = 0xF9;
inline constexpr uint8_t kDouble = 0xFB;

constexpr uint8_t initial_byte(MajorType major, uint8_t info) noexcept {
    return static_cast<uint8_t>((static_cast<uint8_t>(major) << 5) | info);
}

/// @brief Output adapter: append to a std::vector<uint8_t>.
class VectorOutput {
public:
    explicit VectorOutput(std::vector<uint8_t>& target) noexcept : target_(target) {}

    VectorOutput(const VectorOutput&) = delete;
    VectorOutput& operator=(const VectorOutput&) = delete;

    void write(uint8_t byte) { target_.push_back(byte); }

    void write(const uint8_t* data, size_t n) {
        target_.insert(target_.end(), data, data + n);
    }

private:
    std::vector<uint8_t>& target_;
};

/// @brief Output adapter: buffered writing to std::ostream.
///
/// Accumulates small writes in an internal 8 KiB buffer so that a header
/// byte does not cost a virtual call through streambuf. Call flush() when
/// done; bytes still staged when the adapter is destroyed are dropped.
class StreamOutput {
public:
    explicit StreamOutput(std::ostream& os) noexcept : os_(os) {}

    StreamOutput(const StreamOutput&) = delete;
    StreamOutput& operator=(const StreamOutput&) = delete;

    void write(uint8_t byte) {
        if (CBOR_UNLIKELY(pos_ >= kBufSize)) flush();
        buf_[pos_++] = byte;
    }

    void write(const uint8_t* data, size_t n) {
        if (CBOR_LIKELY(pos_ + n <= kBufSize)) {
            if (n != 0) std::memcpy(buf_ + pos_, data, n);
            pos_ += n;
        } else {
            write_slow(data, n);
        }
    }

    void flush() {
        if (pos_ > 0) {
            os_.write(reinterpret_cast<const char*>(buf_), static_cast<std::streamsize>(pos_));
            pos_ = 0;
        }
    }

private:
    static constexpr size_t kBufSize = 8192;

    std::ostream& os_;
    uint8_t buf_[kBufSize];
    size_t pos_ = 0;

    CBOR_NOINLINE void write_slow(const uint8_t* data, size_t n) {
        flush();
        if (n >= kBufSize) {
            // Large payload goes straight to the stream.
            os_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(n));
        } else {
            std::memcpy(buf_, data, n);
            pos_ = n;
        }
    }
};

} // namespace detail

// ─── Primitive writers ──────────────────────────────────────────────────

/// @brief Initial byte plus the shortest argument field for @p arg.
template <typename Output>
inline void write_head(Output& out, MajorType major, uint64_t arg) {
    uint8_t buf[9];
    if (arg < 24) {
        out.write(detail::initial_byte(major, static_cast<uint8_t>(arg)));
    } else if (arg <= std::numeric_limits<uint8_t>::max()) {
        buf[0] = detail::initial_byte(major, detail::kInfoUint8);
        buf[1] = static_cast<uint8_t>(arg);
        out.write(buf, 2);
    } else if (arg <= std::numeric_limits<uint16_t>::max()) {
        buf[0] = detail::initial_byte(major, detail::kInfoUint16);
        detail::store_be16(buf + 1, static_cast<uint16_t>(arg));
        out.write(buf, 3);
    } else if (arg <= std::numeric_limits<uint32_t>::max()) {
        buf[0] = detail::initial_byte(major, detail::kInfoUint32);
        detail::store_be32(buf + 1, static_cast<uint32_t>(arg));
        out.write(buf, 5);
    } else {
        buf[0] = detail::initial_byte(major, detail::kInfoUint64);
        detail::store_be64(buf + 1, arg);
        out.write(buf, 9);
    }
}

/// @brief Length header for a string, array or map.
/// @param what  Noun used in the LengthError message.
/// @throws LengthError if @p length > kMaxLength; nothing is written then.
template <typename Output>
inline void write_length(Output& out, MajorType major, size_t length, const char* what) {
    if (CBOR_UNLIKELY(length > kMaxLength)) throw LengthError(what, length);
    write_head(out, major, static_cast<uint64_t>(length));
}

/// @brief Major type 0 for n >= 0, major type 1 with argument -1 - n otherwise.
template <typename Output>
inline void write_integer(Output& out, int64_t v) {
    if (v >= 0) {
        write_head(out, MajorType::UnsignedInteger, static_cast<uint64_t>(v));
        return;
    }
    // -v - 1 overflows for the minimum; its magnitude is 2^63.
    const uint64_t magnitude = v == std::numeric_limits<int64_t>::min()
        ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
        : static_cast<uint64_t>(-v - 1);
    write_head(out, MajorType::NegativeInteger, magnitude);
}

template <FloatPolicy Policy = kFloatPolicy, typename Output>
inline void write_float(Output& out, double v) {
    uint8_t buf[9];
    if constexpr (Policy == FloatPolicy::CanonicalHalf) {
        uint16_t half;
        if (detail::half_if_exact(v, half)) {
            buf[0] = detail::kHalf;
            detail::store_be16(buf + 1, half);
            out.write(buf, 3);
            return;
        }
    }
    buf[0] = detail::kDouble;
    detail::store_be64(buf + 1, detail::double_bits(v));
    out.write(buf, 9);
}

/// @brief Major type 3. Bytes are copied verbatim; no UTF-8 validation.
template <typename Output>
inline void write_string(Output& out, std::string_view s) {
    write_length(out, MajorType::TextString, s.size(), "string");
    if (!s.empty()) out.write(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

template <typename Output>
inline void write_value(Output& out, const Value& v);

template <typename Output>
inline void write_array(Output& out, ArrayRef items) {
    write_length(out, MajorType::Array, items.size(), "array");
    for (const Value& item : items) write_value(out, item);
}

template <typename Output>
inline void write_map(Output& out, const Container& map) {
    write_length(out, MajorType::Map, map.size(), "map");
    for (const auto& [key, value] : map) {
        write_string(out, std::string_view(key));
        write_value(out, value);
    }
}

/// @brief Dispatch on the variant.
template <typename Output>
inline void write_value(Output& out, const Value& v) {
    switch (v.type()) {
        case Type::Null:
            out.write(detail::kNull);
            break;
        case Type::Bool:
            out.write(v.as_bool() ? detail::kTrue : detail::kFalse);
            break;
        case Type::Integer:
            write_integer(out, v.as_integer());
            break;
        case Type::Float:
            write_float(out, v.as_float());
            break;
        case Type::String:
            write_string(out, v.as_string());
            break;
        case Type::Array:
            write_array(out, v.as_array());
            break;
        case Type::Object:
            write_map(out, v.as_object());
            break;
    }
}

// ─── Value::encode() implementation ──────────────────────────────────────

template <typename Output>
void Value::encode_to(Output& out) const {
    write_value(out, *this);
}

inline std::vector<uint8_t> Value::encode() const {
    std::vector<uint8_t> bytes;
    detail::VectorOutput out(bytes);
    write_value(out, *this);
    return bytes;
}

/// @brief Free function: encode to a fresh byte vector.
/// @throws LengthError, std::bad_alloc
[[nodiscard]] inline std::vector<uint8_t> encode(const Value& value) {
    return value.encode();
}

/// @brief Encode to an ostream (binary; open the stream in binary mode).
///
/// On LengthError the stream holds every byte written before the failing
/// item, the same prefix the vector path would have produced.
inline void encode(std::ostream& os, const Value& value) {
    detail::StreamOutput out(os);
    try {
        write_value(out, value);
    } catch (const LengthError&) {
        out.flush();
        throw;
    }
    out.flush();
}

/// @brief Encode without exceptions.
[[nodiscard]] inline result<std::vector<uint8_t>> try_encode(const Value& value) noexcept {
    try {
        return {value.encode(), {}};
    } catch (const LengthError& e) {
        return {{}, e.code()};
    } catch (const std::bad_alloc&) {
        return {{}, make_error_code(errc::out_of_memory)};
    }
}

/// @brief Append the encoding of @p value to @p out, all or nothing.
///
/// The value is encoded into a temporary first; @p out only changes when
/// the whole encoding succeeded.
inline std::error_code try_encode(const Value& value, std::vector<uint8_t>& out) noexcept {
    auto res = try_encode(value);
    if (!res) return res.ec;
    try {
        out.insert(out.end(), res.value.begin(), res.value.end());
    } catch (const std::bad_alloc&) {
        return make_error_code(errc::out_of_memory);
    }
    return {};
}

} // namespace yacbor
