#pragma once

/// @file allocator.hpp
/// @brief PMR (Polymorphic Memory Resource) support for yacbor.
///
/// Every Container allocates its entries, its owned key copies and its
/// nested Containers from one std::pmr::memory_resource chosen at
/// construction. The codec does not care which resource that is.
///
/// @example
/// @code
///   yacbor::CountingResource counting;
///   {
///       yacbor::Container map(&counting);
///       map.put("answer", 42);
///   }
///   assert(counting.outstanding_blocks() == 0);
/// @endcode

#include "config.hpp"

#include <cstddef>
#include <memory_resource>
#include <new>

namespace yacbor {

/// @brief Alias for std::pmr::memory_resource.
using memory_resource = std::pmr::memory_resource;

/// @brief Get default memory resource for yacbor.
/// Falls back to std::pmr::get_default_resource().
inline memory_resource* get_default_resource() noexcept {
    return std::pmr::get_default_resource();
}

/// @brief RAII helper to use a custom memory resource in a scope.
///
/// Containers constructed without an explicit resource inside the scope
/// pick up @p mr. The previous default is restored on destruction.
class ScopedResource {
public:
    explicit ScopedResource(memory_resource* mr) noexcept
        : prev_(std::pmr::get_default_resource()) {
        std::pmr::set_default_resource(mr);
    }

    ~ScopedResource() {
        std::pmr::set_default_resource(prev_);
    }

    ScopedResource(const ScopedResource&) = delete;
    ScopedResource& operator=(const ScopedResource&) = delete;

private:
    memory_resource* prev_;
};

/// @brief Memory resource adapter that accounts for every allocation.
///
/// Forwards to an upstream resource and tracks outstanding blocks and bytes.
/// With a non-zero byte limit, a request that would push the outstanding
/// total past the limit throws std::bad_alloc without touching upstream.
class CountingResource : public std::pmr::memory_resource {
public:
    explicit CountingResource(memory_resource* upstream = std::pmr::new_delete_resource(),
                              size_t byte_limit = 0) noexcept
        : upstream_(upstream), byte_limit_(byte_limit) {}

    CountingResource(const CountingResource&) = delete;
    CountingResource& operator=(const CountingResource&) = delete;

    /// @brief Blocks allocated and not yet returned.
    [[nodiscard]] size_t outstanding_blocks() const noexcept { return outstanding_blocks_; }
    /// @brief Bytes allocated and not yet returned.
    [[nodiscard]] size_t outstanding_bytes() const noexcept { return outstanding_bytes_; }
    /// @brief Highest value outstanding_bytes() ever reached.
    [[nodiscard]] size_t peak_bytes() const noexcept { return peak_bytes_; }
    /// @brief Number of successful allocate() calls.
    [[nodiscard]] size_t total_allocations() const noexcept { return total_allocations_; }
    /// @brief Number of requests refused because of the byte limit.
    [[nodiscard]] size_t failed_allocations() const noexcept { return failed_allocations_; }

    /// @brief Change the byte limit (0 = unlimited).
    void set_byte_limit(size_t limit) noexcept { byte_limit_ = limit; }
    [[nodiscard]] size_t byte_limit() const noexcept { return byte_limit_; }

    [[nodiscard]] memory_resource* upstream() const noexcept { return upstream_; }

protected:
    void* do_allocate(size_t bytes, size_t alignment) override {
        if (byte_limit_ != 0 && outstanding_bytes_ + bytes > byte_limit_) {
            ++failed_allocations_;
            throw std::bad_alloc();
        }
        void* p = upstream_->allocate(bytes, alignment);
        ++outstanding_blocks_;
        ++total_allocations_;
        outstanding_bytes_ += bytes;
        if (outstanding_bytes_ > peak_bytes_) peak_bytes_ = outstanding_bytes_;
        return p;
    }

    void do_deallocate(void* p, size_t bytes, size_t alignment) override {
        upstream_->deallocate(p, bytes, alignment);
        --outstanding_blocks_;
        outstanding_bytes_ -= bytes;
    }

    bool do_is_equal(const memory_resource& other) const noexcept override {
        return this == &other;
    }

private:
    memory_resource* upstream_;
    size_t byte_limit_;
    size_t outstanding_blocks_ = 0;
    size_t outstanding_bytes_ = 0;
    size_t peak_bytes_ = 0;
    size_t total_allocations_ = 0;
    size_t failed_allocations_ = 0;
};

} // namespace yacbor
