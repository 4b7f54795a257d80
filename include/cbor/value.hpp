#pragma once

/// @file value.hpp
/// @brief Library core: Value — a 24-byte closed tagged union over the CBOR
/// data model, plus the inline definitions of ArrayRef and Container.
///
/// Ownership:
///   - Null, Bool, Integer, Float: stored inline.
///   - String: borrowed (pointer, length) view of caller bytes. Never copied,
///     never freed. A std::string temporary is rejected at compile time.
///   - Array: borrowed ArrayRef over caller-owned Values. Never freed.
///   - Object: owned Container, placed on the Container's own memory
///     resource. Copying a Value deep-copies it, destroying a Value tears it
///     down recursively.

#include "allocator.hpp"
#include "config.hpp"
#include "container.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory_resource>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace yacbor {

namespace detail {

/// Integral types a Value accepts: every signed type, and unsigned types
/// whose whole range fits int64_t.
template <typename T>
inline constexpr bool is_value_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> &&
    (std::is_signed_v<T> || sizeof(T) < sizeof(int64_t));

} // namespace detail

class Value {
public:
    Value() noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    Value(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }

    template <typename T, std::enable_if_t<detail::is_value_integer_v<T>, int> = 0>
    Value(T v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }

    Value(double v) noexcept : kind_(Type::Float) { u_.d = v; }

    /// Borrowed byte string. The bytes must outlive every encode of this value.
    Value(std::string_view v) noexcept : kind_(Type::String) {
        u_.str.data = v.data();
        u_.str.size = v.size();
    }
    Value(const char* v) noexcept : Value(v ? std::string_view(v) : std::string_view()) {}
    /// Rejected: the view would dangle as soon as the temporary dies.
    Value(std::string&&) = delete;

    /// Borrowed sequence (defined after ArrayRef).
    Value(ArrayRef v) noexcept;
    /// Borrowed C array. Without this overload the array decays to a
    /// pointer and picks the bool constructor.
    template <size_t N>
    Value(const Value (&items)[N]) noexcept : kind_(Type::Array) {
        u_.arr.data = items;
        u_.arr.size = N;
    }

    /// Owned map: takes the container's entries.
    Value(Container&& v) : kind_(Type::Object) { u_.obj = make_owned(std::move(v)); }
    /// Owned map: deep copy.
    Value(const Container& v) : kind_(Type::Object) { u_.obj = make_owned(Container(v)); }

    Value(const Value& o) : kind_(o.kind_) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_) {
        std::memcpy(&u_, &o.u_, sizeof(u_));
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            std::memcpy(&u_, &o.u_, sizeof(u_));
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        Payload tmp;
        std::memcpy(&tmp, &u_, sizeof(u_));
        std::memcpy(&u_, &o.u_, sizeof(u_));
        std::memcpy(&o.u_, &tmp, sizeof(u_));
    }

    // ─── Named constructors ─────────────────────────────────────────────

    [[nodiscard]] static Value null() noexcept { return Value(); }
    [[nodiscard]] static Value boolean(bool v) noexcept { return Value(v); }
    [[nodiscard]] static Value integer(int64_t v) noexcept { return Value(v); }
    [[nodiscard]] static Value floating(double v) noexcept { return Value(v); }
    [[nodiscard]] static Value string(std::string_view v) noexcept { return Value(v); }
    [[nodiscard]] static Value array(ArrayRef v) noexcept;
    [[nodiscard]] static Value object(Container&& v) { return Value(std::move(v)); }
    /// Empty map on @p mr.
    [[nodiscard]] static Value object(memory_resource* mr = get_default_resource()) {
        return Value(Container(mr));
    }

    // ─── Type queries ───────────────────────────────────────────────────

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()    const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()    const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer() const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_float()   const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_string()  const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()   const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()  const noexcept { return kind_ == Type::Object; }

    // ─── Access ─────────────────────────────────────────────────────────

    bool as_bool() const {
        if (CBOR_UNLIKELY(!is_bool())) throw_type_error("bool");
        return u_.b;
    }
    int64_t as_integer() const {
        if (CBOR_UNLIKELY(!is_integer())) throw_type_error("integer");
        return u_.i;
    }
    double as_float() const {
        if (CBOR_UNLIKELY(!is_float())) throw_type_error("float");
        return u_.d;
    }
    [[nodiscard]] std::string_view as_string() const {
        if (CBOR_UNLIKELY(!is_string())) throw_type_error("string");
        return {u_.str.data, u_.str.size};
    }
    [[nodiscard]] ArrayRef as_array() const;
    [[nodiscard]] const Container& as_object() const {
        if (CBOR_UNLIKELY(!is_object())) throw_type_error("object");
        return *u_.obj;
    }
    Container& as_object() {
        if (CBOR_UNLIKELY(!is_object())) throw_type_error("object");
        return *u_.obj;
    }

    /// Elements of an array or map, bytes of a string, 0 otherwise.
    [[nodiscard]] size_t size() const noexcept;

    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    // ─── Encoding (defined in encoder.hpp) ──────────────────────────────

    /// @brief Canonical CBOR bytes of this value.
    /// @throws LengthError, std::bad_alloc
    [[nodiscard]] std::vector<uint8_t> encode() const;

    /// @brief Append the encoding to any output adapter.
    template <typename Output>
    void encode_to(Output& out) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; double d;
        struct { const char* data; size_t size; } str;
        struct { const Value* data; size_t size; } arr;
        Container* obj;
    } u_;

    [[noreturn]] void throw_type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    /// Place @p c on its own memory resource.
    static Container* make_owned(Container&& c) {
        memory_resource* mr = c.get_resource();
        void* mem = mr->allocate(sizeof(Container), alignof(Container));
        return ::new (mem) Container(std::move(c));
    }

    static void release_owned(Container* c) noexcept {
        memory_resource* mr = c->get_resource();
        c->~Container();
        mr->deallocate(c, sizeof(Container), alignof(Container));
    }

    void copy_payload(const Value& o) {
        if (o.kind_ == Type::Object) {
            u_.obj = make_owned(Container(*o.u_.obj));
        } else {
            std::memcpy(&u_, &o.u_, sizeof(u_));
        }
    }

    void destroy() noexcept {
        if (kind_ == Type::Object) release_owned(u_.obj);
    }
};

static_assert(sizeof(Value) <= 24, "Value must stay within 24 bytes");
static_assert(std::is_nothrow_move_constructible_v<Value>,
              "Container storage relies on noexcept Value moves");

// ─── ArrayRef ────────────────────────────────────────────────────────────

/// @brief Borrowed, read-only view of a contiguous sequence of Values.
///
/// The viewed Values are owned by the caller and must outlive the view and
/// every encode that reads it.
class ArrayRef {
public:
    using value_type = Value;
    using const_iterator = const Value*;
    using iterator = const Value*;

    constexpr ArrayRef() noexcept = default;
    constexpr ArrayRef(const Value* data, size_t size) noexcept : data_(data), size_(size) {}
    ArrayRef(const std::vector<Value>& v) noexcept : data_(v.data()), size_(v.size()) {}
    template <size_t N>
    constexpr ArrayRef(const std::array<Value, N>& a) noexcept : data_(a.data()), size_(N) {}
    template <size_t N>
    constexpr ArrayRef(const Value (&a)[N]) noexcept : data_(a), size_(N) {}
    /// Rejected: the view would dangle.
    ArrayRef(std::vector<Value>&&) = delete;

    [[nodiscard]] constexpr const Value* data() const noexcept { return data_; }
    [[nodiscard]] constexpr size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

    const Value* begin() const noexcept { return data_; }
    const Value* end() const noexcept { return data_ + size_; }

    const Value& operator[](size_t i) const noexcept { return data_[i]; }

private:
    const Value* data_ = nullptr;
    size_t size_ = 0;
};

inline Value::Value(ArrayRef v) noexcept : kind_(Type::Array) {
    u_.arr.data = v.data();
    u_.arr.size = v.size();
}

inline Value Value::array(ArrayRef v) noexcept { return Value(v); }

inline ArrayRef Value::as_array() const {
    if (CBOR_UNLIKELY(!is_array())) throw_type_error("array");
    return {u_.arr.data, u_.arr.size};
}

inline size_t Value::size() const noexcept {
    switch (kind_) {
        case Type::String: return u_.str.size;
        case Type::Array:  return u_.arr.size;
        case Type::Object: return u_.obj->size();
        default:           return 0;
    }
}

inline bool Value::operator==(const Value& other) const {
    if (kind_ != other.kind_) return false;
    switch (kind_) {
        case Type::Null:    return true;
        case Type::Bool:    return u_.b == other.u_.b;
        case Type::Integer: return u_.i == other.u_.i;
        case Type::Float:   return u_.d == other.u_.d;
        case Type::String:  return as_string() == other.as_string();
        case Type::Array: {
            const ArrayRef a = as_array();
            const ArrayRef b = other.as_array();
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i)
                if (a[i] != b[i]) return false;
            return true;
        }
        case Type::Object:  return *u_.obj == *other.u_.obj;
    }
    return false;
}

// ─── Container member functions ──────────────────────────────────────────

inline Container::Container(memory_resource* mr)
    : entries_(mr), index_(mr) {}

inline Container::Container(const Container& other)
    : entries_(other.entries_, other.get_resource())
    , index_(other.get_resource()) {}

inline Container::Container(Container&& other) noexcept
    : entries_(std::move(other.entries_))
    , index_(std::move(other.index_))
    , indexed_(other.indexed_) {
    // The moved buffer keeps its addresses, so the index views stay valid.
    other.invalidate_index();
}

inline Container& Container::operator=(const Container& other) {
    if (this != &other) {
        // Nested maps are rebuilt on this container's resource too.
        Container copy = other.clone(get_resource());
        entries_.swap(copy.entries_);
        invalidate_index();
    }
    return *this;
}

inline Container& Container::operator=(Container&& other) {
    if (this == &other) return *this;
    if (*get_resource() == *other.get_resource()) {
        entries_ = std::move(other.entries_);
        other.entries_.clear();
        other.invalidate_index();
    } else {
        // Moving the nested Container pointers would leave them on the
        // other resource.
        Container copy = other.clone(get_resource());
        entries_.swap(copy.entries_);
        other.clear();
    }
    invalidate_index();
    return *this;
}

inline Container::~Container() = default;

inline bool Container::empty() const noexcept { return entries_.empty(); }
inline Container::size_type Container::size() const noexcept { return entries_.size(); }
inline Container::iterator Container::begin() noexcept { return entries_.begin(); }
inline Container::iterator Container::end() noexcept { return entries_.end(); }
inline Container::const_iterator Container::begin() const noexcept { return entries_.begin(); }
inline Container::const_iterator Container::end() const noexcept { return entries_.end(); }

inline void Container::reserve(size_type n) {
    const auto* old_data = entries_.data();
    entries_.reserve(n);
    if (entries_.data() != old_data) invalidate_index();
}

inline void Container::invalidate_index() const noexcept {
    index_.clear();
    indexed_ = false;
}

inline bool Container::ensure_index() const noexcept {
    if (indexed_) return true;
    try {
        index_.clear();
        index_.reserve(entries_.size());
        for (size_type i = 0; i < entries_.size(); ++i)
            index_.emplace(std::string_view(entries_[i].first), i);
        indexed_ = true;
    } catch (const std::bad_alloc&) {
        // Lookups stay correct through the linear scan.
        index_.clear();
    }
    return indexed_;
}

inline Container::size_type Container::position_of(std::string_view key) const noexcept {
    if (use_index() && ensure_index()) {
        auto it = index_.find(key);
        return it != index_.end() ? it->second : entries_.size();
    }
    for (size_type i = 0; i < entries_.size(); ++i)
        if (entries_[i].first == key) return i;
    return entries_.size();
}

inline void Container::append(std::string_view key, Value&& value) {
    const auto* old_data = entries_.data();
    entries_.emplace_back(key, std::move(value));
    if (!indexed_) return;
    if (entries_.data() != old_data) {
        // Reallocation moved the keys; rebuild lazily on the next lookup.
        invalidate_index();
        return;
    }
    try {
        index_.emplace(std::string_view(entries_.back().first), entries_.size() - 1);
    } catch (const std::bad_alloc&) {
        invalidate_index();
    }
}

inline void Container::put(std::string_view key, Value value) {
    const size_type pos = position_of(key);
    if (pos != entries_.size()) {
        entries_[pos].second = std::move(value);
        return;
    }
    append(key, std::move(value));
}

inline std::error_code Container::try_put(std::string_view key, Value value) noexcept {
    try {
        put(key, std::move(value));
        return {};
    } catch (const std::bad_alloc&) {
        return make_error_code(errc::out_of_memory);
    }
}

inline bool Container::erase(std::string_view key) {
    const size_type pos = position_of(key);
    if (pos == entries_.size()) return false;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    invalidate_index();
    return true;
}

inline void Container::clear() noexcept {
    invalidate_index();
    // Swap with empty containers on the same resource so capacity is
    // returned too, not just the elements.
    memory_resource* mr = get_resource();
    storage_type(mr).swap(entries_);
    index_type(mr).swap(index_);
}

inline Container Container::clone() const {
    return Container(*this);
}

inline Container Container::clone(memory_resource* mr) const {
    Container copy(mr);
    copy.entries_.reserve(entries_.size());
    for (const auto& [key, value] : entries_) {
        if (value.is_object())
            copy.entries_.emplace_back(key, Value(value.as_object().clone(mr)));
        else
            copy.entries_.emplace_back(key, value);
    }
    return copy;
}

inline Value* Container::find(std::string_view key) noexcept {
    const size_type pos = position_of(key);
    return pos != entries_.size() ? &entries_[pos].second : nullptr;
}

inline const Value* Container::find(std::string_view key) const noexcept {
    const size_type pos = position_of(key);
    return pos != entries_.size() ? &entries_[pos].second : nullptr;
}

inline bool Container::contains(std::string_view key) const noexcept {
    return find(key) != nullptr;
}

inline Value& Container::at(std::string_view key) {
    Value* p = find(key);
    if (CBOR_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}

inline const Value& Container::at(std::string_view key) const {
    const Value* p = find(key);
    if (CBOR_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}

inline bool Container::operator==(const Container& other) const {
    if (size() != other.size()) return false;
    // Order is part of the wire image, so compare positionally.
    for (size_type i = 0; i < entries_.size(); ++i) {
        if (entries_[i].first != other.entries_[i].first) return false;
        if (entries_[i].second != other.entries_[i].second) return false;
    }
    return true;
}

} // namespace yacbor
