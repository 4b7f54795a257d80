#pragma once

/// @file error.hpp
/// @brief Error types for yacbor: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: LengthError, TypeError, OutOfRangeError, std::bad_alloc
///   - Via error_code: yacbor::errc enum + cbor_category() (exception-free)
///
/// Use try_encode(value) / Container::try_put() for exception-free code paths.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace yacbor {

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief CBOR error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Encoding errors (1-49)
    length_exceeded = 1,   ///< String, array or map longer than 65535
    out_of_memory   = 2,   ///< The memory resource could not satisfy a request

    // Value access errors (50-79)
    type_mismatch   = 50,
    key_not_found   = 51,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class cbor_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "cbor";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:              return "success";
            case errc::length_exceeded: return "length exceeds supported range";
            case errc::out_of_memory:   return "allocation failure";
            case errc::type_mismatch:   return "type mismatch";
            case errc::key_not_found:   return "key not found";
            default:                    return "unknown cbor error";
        }
    }
};

} // namespace detail

/// @brief Get the cbor error category singleton.
inline const std::error_category& cbor_category() noexcept {
    static const detail::cbor_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from yacbor::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), cbor_category()};
}

/// @brief Create an error_condition from yacbor::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), cbor_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief A string, array or map does not fit the supported length tiers.
class LengthError : public std::system_error {
public:
    LengthError(const char* what_kind, size_t length)
        : std::system_error(make_error_code(errc::length_exceeded),
                            format_message(what_kind, length))
        , length_(length) {}

    /// @brief The offending element or byte count.
    [[nodiscard]] size_t length() const noexcept { return length_; }

private:
    static std::string format_message(const char* what_kind, size_t length) {
        return std::string(what_kind) + " of length " + std::to_string(length) +
               " exceeds the 65535 limit";
    }

    size_t length_;
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Missing key in a Container.
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::key_not_found), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [bytes, ec] = yacbor::try_encode(value);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace yacbor

// Register yacbor::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<yacbor::errc> : true_type {};
} // namespace std
