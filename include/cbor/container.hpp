#pragma once

/// @file container.hpp
/// @brief Container: the ordered string-keyed map behind Value's Object variant.
///
/// Properties:
///   - Keys are unique and owned: put() copies the key bytes into a
///     std::pmr::string on the container's memory resource. No key is
///     ever borrowed from the caller.
///   - Iteration order is first-insertion order and is exactly the order
///     in which entries are encoded. Re-putting a key replaces its value
///     in place; the entry keeps its position.
///   - Nested Containers (Object values) are owned and torn down
///     recursively. String and Array values are borrowed views and are
///     never released here.
///   - Teardown is the destructor. clear() does the same work early and
///     leaves the container empty and reusable.
///   - Lookup is linear below YACBOR_OBJECT_LINEAR_THRESHOLD entries and
///     goes through a lazily built hash index above it.
///
/// Not thread-safe. Encoding never touches the index, so concurrent
/// encodes of a container that nobody mutates only read it.
///
/// Member functions are defined in value.hpp, where Value is complete.

#include "allocator.hpp"
#include "config.hpp"
#include "detail/hash.hpp"
#include "fwd.hpp"

#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace yacbor {

class Container {
public:
    using key_type = std::pmr::string;
    using entry_type = std::pair<std::pmr::string, Value>;
    using storage_type = std::pmr::vector<entry_type>;
    using size_type = size_t;
    using iterator = storage_type::iterator;
    using const_iterator = storage_type::const_iterator;

    /// Index from key view (into entries_[i].first) to position.
    using index_type = std::pmr::unordered_map<std::string_view, size_type,
                                               detail::KeyHash,
                                               detail::KeyEqual>;

    /// @brief Create an empty container allocating from @p mr.
    explicit Container(memory_resource* mr = get_default_resource());

    /// Deep copy on the source's memory resource.
    Container(const Container& other);
    /// Steals storage; @p other is left empty and valid.
    Container(Container&& other) noexcept;
    /// Deep copy into this container's memory resource.
    Container& operator=(const Container& other);
    /// Steals storage when both use the same resource, deep-copies into this
    /// container's resource otherwise and clears @p other.
    Container& operator=(Container&& other);
    ~Container();

    // ─── Mutation ────────────────────────────────────────────────────────

    /// @brief Insert or replace.
    ///
    /// A new key is copied and appended. An existing key keeps its position
    /// and the old value is destroyed (an old nested Container is released).
    /// @throws std::bad_alloc if the resource is exhausted; the container is
    ///         unchanged in that case.
    void put(std::string_view key, Value value);

    /// @brief put() without exceptions.
    /// @return errc::out_of_memory on allocation failure, empty code otherwise.
    std::error_code try_put(std::string_view key, Value value) noexcept;

    /// @brief Remove @p key. Later entries shift one position earlier.
    bool erase(std::string_view key);

    /// @brief Release every entry, key and nested Container, and the storage.
    void clear() noexcept;

    void reserve(size_type n);

    // ─── Copy ────────────────────────────────────────────────────────────

    /// @brief Deep copy on this container's resource.
    [[nodiscard]] Container clone() const;

    /// @brief Deep copy whose keys, storage and nested Containers all live
    /// on @p mr.
    [[nodiscard]] Container clone(memory_resource* mr) const;

    // ─── Lookup ──────────────────────────────────────────────────────────

    [[nodiscard]] Value* find(std::string_view key) noexcept;
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /// @throws OutOfRangeError if @p key is absent.
    [[nodiscard]] Value& at(std::string_view key);
    [[nodiscard]] const Value& at(std::string_view key) const;

    // ─── Capacity / iteration ────────────────────────────────────────────

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] size_type size() const noexcept;

    iterator begin() noexcept;
    iterator end() noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    /// Get the memory_resource used for keys, storage and nested maps.
    [[nodiscard]] memory_resource* get_resource() const noexcept {
        return entries_.get_allocator().resource();
    }

    bool operator==(const Container& other) const;
    bool operator!=(const Container& other) const { return !(*this == other); }

private:
    static constexpr size_type kIndexThreshold = YACBOR_OBJECT_LINEAR_THRESHOLD;

    storage_type entries_;
    mutable index_type index_;
    mutable bool indexed_ = false;

    bool use_index() const noexcept { return entries_.size() >= kIndexThreshold; }

    /// Build the index if it is missing. Returns false when the index could
    /// not be allocated; callers then fall back to a linear scan.
    bool ensure_index() const noexcept;
    void invalidate_index() const noexcept;

    /// Position of @p key, or size() when absent.
    size_type position_of(std::string_view key) const noexcept;

    void append(std::string_view key, Value&& value);
};

} // namespace yacbor
