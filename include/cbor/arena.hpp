#pragma once

/// @file arena.hpp
/// @brief Monotonic arena allocator for building short-lived value trees.
///
/// MonotonicArena is a std::pmr::memory_resource, so a Container created on
/// it places its entry storage, key copies and nested Containers in the
/// arena. Teardown of such a Container still runs destructors, but every
/// deallocation is a no-op; the memory comes back at reset() or when the
/// arena is destroyed.
///
/// Typical usage:
/// @code
///   alignas(16) char buf[8192];
///   yacbor::MonotonicArena arena(buf, sizeof(buf));
///   {
///       yacbor::Container msg(&arena);
///       msg.put("type", "client_connect");
///       auto bytes = yacbor::Value(std::move(msg)).encode();
///   }
///   arena.reset();  // reuse for the next message
/// @endcode
///
/// Thread safety:
///   Each thread should use its own MonotonicArena instance.

#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <new>
#include <utility>

namespace yacbor {

/// @brief Monotonic (bump) arena allocator.
///
/// Memory layout: optional initial buffer supplied by the caller, followed
/// by a linked list of overflow blocks obtained from an upstream resource,
/// each twice the size of the previous one.
class MonotonicArena : public std::pmr::memory_resource {
public:
    /// @brief Construct with an external (e.g. stack-allocated) buffer.
    /// @param buf       Pointer to external buffer (must outlive the arena).
    /// @param buf_size  Size of the external buffer in bytes.
    /// @param upstream  Source of overflow blocks.
    MonotonicArena(void* buf, size_t buf_size,
                   std::pmr::memory_resource* upstream = std::pmr::new_delete_resource()) noexcept
        : ptr_(static_cast<char*>(buf))
        , end_(static_cast<char*>(buf) + buf_size)
        , initial_buf_(static_cast<char*>(buf))
        , initial_size_(buf_size)
        , upstream_(upstream)
        , first_block_size_(buf_size < kMinBlock ? kMinBlock : buf_size * 2)
        , next_block_size_(first_block_size_) {}

    /// @brief Construct without an initial buffer; the first block is
    /// taken from @p upstream on the first allocation.
    explicit MonotonicArena(size_t initial_size = 4096,
                            std::pmr::memory_resource* upstream = std::pmr::new_delete_resource()) noexcept
        : upstream_(upstream)
        , first_block_size_(initial_size < kMinBlock ? kMinBlock : initial_size)
        , next_block_size_(first_block_size_) {}

    ~MonotonicArena() override { release_blocks(); }

    MonotonicArena(const MonotonicArena&) = delete;
    MonotonicArena& operator=(const MonotonicArena&) = delete;
    MonotonicArena(MonotonicArena&&) = delete;
    MonotonicArena& operator=(MonotonicArena&&) = delete;

    /// @brief Release every overflow block and rewind to the initial buffer.
    /// @warning All pointers obtained from this arena become invalid.
    void reset() noexcept {
        release_blocks();
        ptr_ = initial_buf_;
        end_ = initial_buf_ ? initial_buf_ + initial_size_ : nullptr;
        next_block_size_ = first_block_size_;
    }

    /// @brief Bytes handed out since construction or the last reset(),
    /// including alignment padding.
    [[nodiscard]] size_t bytes_used() const noexcept { return used_; }

    /// @brief Bytes left in the current block before the next overflow.
    [[nodiscard]] size_t bytes_remaining() const noexcept {
        return ptr_ && end_ > ptr_ ? static_cast<size_t>(end_ - ptr_) : 0;
    }

    /// @brief Data capacity across the initial buffer and all blocks.
    [[nodiscard]] size_t capacity() const noexcept {
        size_t cap = initial_size_;
        for (Block* b = blocks_; b; b = b->next) cap += b->capacity;
        return cap;
    }

    /// @brief Number of overflow blocks currently held.
    [[nodiscard]] size_t block_count() const noexcept {
        size_t n = 0;
        for (Block* b = blocks_; b; b = b->next) ++n;
        return n;
    }

    [[nodiscard]] std::pmr::memory_resource* upstream() const noexcept { return upstream_; }

protected:
    void* do_allocate(size_t bytes, size_t alignment) override {
        if (char* p = bump(bytes, alignment)) return p;
        return allocate_slow(bytes, alignment);
    }

    /// Deallocation is a no-op for monotonic arenas.
    void do_deallocate(void* /*p*/, size_t /*bytes*/, size_t /*alignment*/) override {}

    bool do_is_equal(const memory_resource& other) const noexcept override {
        return this == &other;
    }

private:
    static constexpr size_t kMinBlock = 256;

    /// Overflow block header. Data follows immediately after this struct.
    struct Block {
        Block* next;
        size_t capacity;
        char* data() noexcept { return reinterpret_cast<char*>(this + 1); }
    };

    char* ptr_ = nullptr;
    char* end_ = nullptr;
    char* initial_buf_ = nullptr;
    size_t initial_size_ = 0;
    Block* blocks_ = nullptr;
    std::pmr::memory_resource* upstream_;
    size_t first_block_size_;
    size_t next_block_size_;
    size_t used_ = 0;

    char* bump(size_t bytes, size_t alignment) noexcept {
        if (!ptr_) return nullptr;
        const uintptr_t cur = reinterpret_cast<uintptr_t>(ptr_);
        const uintptr_t aligned = (cur + alignment - 1) & ~(uintptr_t(alignment) - 1);
        if (aligned > reinterpret_cast<uintptr_t>(end_) ||
            bytes > static_cast<size_t>(reinterpret_cast<uintptr_t>(end_) - aligned))
            return nullptr;
        char* result = reinterpret_cast<char*>(aligned);
        used_ += static_cast<size_t>(aligned - cur) + bytes;
        ptr_ = result + bytes;
        return result;
    }

    /// Current block exhausted: take a new one from upstream and retry.
    /// Upstream failure propagates as std::bad_alloc.
    CBOR_NOINLINE void* allocate_slow(size_t bytes, size_t alignment) {
        size_t needed = bytes + alignment;
        size_t block_size = next_block_size_ < needed ? needed : next_block_size_;

        void* raw = upstream_->allocate(sizeof(Block) + block_size, alignof(Block));
        auto* block = ::new (raw) Block{blocks_, block_size};
        blocks_ = block;
        ptr_ = block->data();
        end_ = ptr_ + block_size;
        next_block_size_ = block_size * 2;

        char* p = bump(bytes, alignment);
        if (CBOR_UNLIKELY(!p)) throw std::bad_alloc();
        return p;
    }

    void release_blocks() noexcept {
        Block* b = blocks_;
        while (b) {
            Block* next = b->next;
            upstream_->deallocate(b, sizeof(Block) + b->capacity, alignof(Block));
            b = next;
        }
        blocks_ = nullptr;
        used_ = 0;
    }
};

} // namespace yacbor
