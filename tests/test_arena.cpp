/// @file test_arena.cpp
/// @brief Unit tests for MonotonicArena and arena-backed Containers.

#include <cbor/cbor.hpp>

#include <gtest/gtest.h>

#include "test_helpers.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace yacbor;

// =============================================================================
// MonotonicArena basic tests
// =============================================================================

TEST(MonotonicArena, DefaultConstructionIsLazy) {
    CountingResource upstream;
    MonotonicArena arena(4096, &upstream);
    EXPECT_EQ(arena.bytes_used(), 0u);
    EXPECT_EQ(arena.block_count(), 0u);
    EXPECT_EQ(upstream.total_allocations(), 0u);

    (void)arena.allocate(8, 1);
    EXPECT_EQ(arena.block_count(), 1u);
    EXPECT_GE(arena.capacity(), 4096u);
}

TEST(MonotonicArena, StackBufferConstruction) {
    alignas(16) char buf[1024];
    MonotonicArena arena(buf, sizeof(buf));
    EXPECT_EQ(arena.capacity(), sizeof(buf));
    EXPECT_EQ(arena.bytes_used(), 0u);
    EXPECT_EQ(arena.bytes_remaining(), sizeof(buf));

    void* p = arena.allocate(100, 1);
    EXPECT_EQ(p, static_cast<void*>(buf));
    EXPECT_EQ(arena.block_count(), 0u);
}

TEST(MonotonicArena, BasicAllocation) {
    MonotonicArena arena(4096);
    void* p1 = arena.allocate(100);
    ASSERT_NE(p1, nullptr);
    EXPECT_GE(arena.bytes_used(), 100u);

    void* p2 = arena.allocate(200);
    ASSERT_NE(p2, nullptr);
    EXPECT_NE(p1, p2);
    EXPECT_GE(arena.bytes_used(), 300u);
}

TEST(MonotonicArena, AlignedAllocation) {
    MonotonicArena arena(4096);

    // Allocate 1 byte to potentially misalign
    (void)arena.allocate(1, 1);

    void* p = arena.allocate(16, 8);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(p) % 8, 0u);

    (void)arena.allocate(1, 1);
    void* p2 = arena.allocate(32, 16);
    ASSERT_NE(p2, nullptr);
    EXPECT_EQ(reinterpret_cast<uintptr_t>(p2) % 16, 0u);
}

TEST(MonotonicArena, OverflowToUpstreamBlock) {
    alignas(16) char buf[64];
    MonotonicArena arena(buf, sizeof(buf));

    void* p1 = arena.allocate(32, 1);
    ASSERT_NE(p1, nullptr);
    EXPECT_EQ(arena.block_count(), 0u);

    // Exceeds the stack buffer
    void* p2 = arena.allocate(128, 1);
    ASSERT_NE(p2, nullptr);
    EXPECT_EQ(arena.block_count(), 1u);
    EXPECT_GT(arena.capacity(), sizeof(buf));
}

TEST(MonotonicArena, OversizedRequestGetsOwnBlock) {
    MonotonicArena arena(256);
    void* p = arena.allocate(10000, 8);
    ASSERT_NE(p, nullptr);
    EXPECT_GE(arena.capacity(), 10000u);
}

TEST(MonotonicArena, BlocksGrowGeometrically) {
    CountingResource upstream;
    MonotonicArena arena(256, &upstream);
    for (int i = 0; i < 64; ++i) (void)arena.allocate(100, 1);
    // 6400 bytes from blocks of 256, 512, 1024, 2048, 4096
    EXPECT_LE(arena.block_count(), 5u);
    EXPECT_EQ(upstream.outstanding_blocks(), arena.block_count());
}

TEST(MonotonicArena, Reset) {
    alignas(16) char buf[1024];
    MonotonicArena arena(buf, sizeof(buf));

    (void)arena.allocate(512, 1);
    EXPECT_GE(arena.bytes_used(), 512u);

    arena.reset();
    EXPECT_EQ(arena.bytes_used(), 0u);
    EXPECT_EQ(arena.bytes_remaining(), sizeof(buf));

    // Can allocate again after reset
    void* p = arena.allocate(256, 1);
    EXPECT_EQ(p, static_cast<void*>(buf));
}

TEST(MonotonicArena, ResetReturnsOverflowBlocks) {
    CountingResource upstream;
    alignas(16) char buf[64];
    MonotonicArena arena(buf, sizeof(buf), &upstream);

    (void)arena.allocate(256, 1);
    (void)arena.allocate(1024, 1);
    EXPECT_GE(arena.block_count(), 1u);
    EXPECT_GT(upstream.outstanding_blocks(), 0u);

    arena.reset();
    EXPECT_EQ(arena.block_count(), 0u);
    EXPECT_EQ(upstream.outstanding_blocks(), 0u);
    EXPECT_EQ(arena.bytes_remaining(), sizeof(buf));
}

TEST(MonotonicArena, DestructorReturnsBlocks) {
    CountingResource upstream;
    {
        MonotonicArena arena(512, &upstream);
        for (int i = 0; i < 20; ++i) (void)arena.allocate(300, 8);
        EXPECT_GT(upstream.outstanding_bytes(), 0u);
    }
    EXPECT_EQ(upstream.outstanding_blocks(), 0u);
}

TEST(MonotonicArena, DeallocateIsNoOp) {
    MonotonicArena arena(1024);
    void* p = arena.allocate(64, 8);
    const size_t used = arena.bytes_used();
    arena.deallocate(p, 64, 8);
    EXPECT_EQ(arena.bytes_used(), used);
}

TEST(MonotonicArena, UpstreamFailurePropagates) {
    CountingResource upstream(std::pmr::new_delete_resource(), 300);
    MonotonicArena arena(256, &upstream);
    (void)arena.allocate(100, 1);
    EXPECT_THROW((void)arena.allocate(4096, 1), std::bad_alloc);
}

TEST(MonotonicArena, IsEqualOnlyToItself) {
    MonotonicArena a(256);
    MonotonicArena b(256);
    EXPECT_TRUE(a.is_equal(a));
    EXPECT_FALSE(a.is_equal(b));
}

// =============================================================================
// Arena-backed Containers
// =============================================================================

TEST(ArenaContainer, EverythingLandsInArena) {
    CountingResource upstream;
    MonotonicArena arena(4096, &upstream);
    CountingResource heap;
    ScopedResource scope(&heap);

    {
        Container root(&arena);
        for (int i = 0; i < 40; ++i) {
            Container child(&arena);
            child.put("a_long_enough_key_to_need_storage", i);
            root.put("child_with_a_long_key_" + std::to_string(i), std::move(child));
        }
        EXPECT_EQ(root.at("child_with_a_long_key_17").as_object()
                      .at("a_long_enough_key_to_need_storage").as_integer(), 17);
    }
    // Nothing went to the default resource.
    EXPECT_EQ(heap.total_allocations(), 0u);
    EXPECT_GT(arena.bytes_used(), 0u);
}

TEST(ArenaContainer, ResetBetweenMessages) {
    alignas(16) char buf[2048];
    MonotonicArena arena(buf, sizeof(buf));

    for (int round = 0; round < 3; ++round) {
        {
            Container msg(&arena);
            msg.put("type", "client_connect");
            msg.put("round", round);
            const auto bytes = Value(std::move(msg)).encode();
            EXPECT_EQ(bytes[0], 0xA2);
        }
        EXPECT_EQ(arena.block_count(), 0u);
        arena.reset();
        EXPECT_EQ(arena.bytes_used(), 0u);
    }
}

TEST(ArenaContainer, CloneFromArenaToHeap) {
    MonotonicArena arena(1024);
    CountingResource heap;

    Container on_arena(&arena);
    on_arena.put("key", "value");
    Container nested(&arena);
    nested.put("n", 1);
    on_arena.put("nested", std::move(nested));

    Container on_heap = on_arena.clone(&heap);
    EXPECT_EQ(on_heap.get_resource(), &heap);
    EXPECT_EQ(test::encode_hex(Value(on_heap)), test::encode_hex(Value(on_arena)));
}
