/// @file test_leak_asan.cpp
/// @brief Reduced-iteration stress test for ASan/UBSan leak detection.
/// Designed to complete in < 60 seconds under sanitizers.

#include "cbor/cbor.hpp"
#include <cassert>
#include <cstdio>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace yacbor;

// Build a medium document. Long keys and strings force heap-backed keys.
static Value make_medium_doc(int id, const std::vector<Value>& values,
                             memory_resource* mr = get_default_resource()) {
    Container nested(mr);
    nested.put("a", true);
    nested.put("b", nullptr);
    nested.put("c", 3.14159265358979);

    Container doc(mr);
    doc.put("id", id);
    doc.put("name", "test_item");
    doc.put("values", Value(ArrayRef(values)));
    doc.put("nested", std::move(nested));
    doc.put("description_that_is_longer_than_the_small_string_buffer",
            "This is a longer string to test heap allocation for keys of various lengths");
    return Value(std::move(doc));
}

// Test 1: Build/encode/destroy cycle
static void test_build_encode_cycle() {
    printf("  [1] Build/encode cycle (1K iterations)...\n");
    const std::vector<Value> values = {Value(1), Value(2), Value(3), Value(4), Value(5)};
    for (int i = 0; i < 1000; ++i) {
        Value doc = make_medium_doc(42, values);
        const auto bytes = doc.encode();
        assert(!bytes.empty());
        assert(bytes[0] == 0xA5);
        (void)bytes;
    }
    printf("      PASSED\n");
}

// Test 2: Arena build/reset cycle
static void test_arena_cycle() {
    printf("  [2] Arena build/reset cycle (1K iterations)...\n");
    const std::vector<Value> values = {Value(7), Value(8)};
    MonotonicArena arena(4096);
    for (int i = 0; i < 1000; ++i) {
        {
            Value doc = make_medium_doc(99, values, &arena);
            const Value* id = doc.as_object().find("id");
            assert(id && id->as_integer() == 99);
            (void)id;
        }
        arena.reset();
    }
    printf("      PASSED\n");
}

// Test 3: Large document, deep copy, clone and modify
static void test_large_document() {
    printf("  [3] Large document (100 items, 200 cycles)...\n");
    const std::vector<Value> values = {Value(1), Value("two"), Value(3.0)};
    for (int cycle = 0; cycle < 200; ++cycle) {
        Container root;
        for (int i = 0; i < 100; ++i)
            root.put("item_number_" + std::to_string(i), make_medium_doc(i, values));
        Value doc(std::move(root));
        assert(doc.size() == 100);

        Value copy = doc;
        copy.as_object().put("item_number_0", 42);
        Container cloned = copy.as_object().clone();
        cloned.put("extra", "x");
        assert(cloned.size() == 101);
        assert(!copy.encode().empty());
    }
    printf("      PASSED\n");
}

// Test 4: Container mutations
static void test_container_mutations() {
    printf("  [4] Container mutations (2K cycles, 100 keys each)...\n");
    for (int cycle = 0; cycle < 2000; ++cycle) {
        Container map;
        for (int k = 0; k < 100; ++k) map.put("key_" + std::to_string(k), k);
        assert(map.size() == 100);
        for (int k = 0; k < 100; ++k) {
            const Value* p = map.find("key_" + std::to_string(k));
            assert(p && p->as_integer() == k);
            (void)p;
        }
        for (int k = 0; k < 50; ++k) {
            const bool erased = map.erase("key_" + std::to_string(k));
            assert(erased);
            (void)erased;
        }
        assert(map.size() == 50);
        Container copy = map;
        assert(copy.size() == 50);
        map.clear();
        assert(map.empty());
    }
    printf("      PASSED\n");
}

// Test 5: Replacing nested objects releases the old ones
static void test_overwrite_nested() {
    printf("  [5] Overwrite nested objects (2K cycles)...\n");
    CountingResource counting;
    {
        Container root(&counting);
        for (int cycle = 0; cycle < 2000; ++cycle) {
            Container child(&counting);
            child.put("payload_key_long_enough_to_allocate", cycle);
            root.put("slot", std::move(child));
        }
        assert(root.size() == 1);
    }
    assert(counting.outstanding_blocks() == 0);
    printf("      PASSED\n");
}

// Test 6: Concurrent encodes of one shared document
static void test_multithreaded() {
    printf("  [6] Multi-threaded encode (4 threads, 500 each)...\n");
    const std::vector<Value> values = {Value(1), Value(2)};
    const Value doc = make_medium_doc(7, values);
    const auto reference = doc.encode();

    std::vector<std::thread> threads;
    std::vector<int> mismatches(4, 0);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 500; ++i) {
                if (doc.encode() != reference) ++mismatches[t];
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int m : mismatches) assert(m == 0);
    printf("      PASSED\n");
}

// Test 7: Length failures leave nothing behind
static void test_length_failures() {
    printf("  [7] Length failures (1K cycles)...\n");
    const std::string huge(kMaxLength + 1, 'x');
    for (int i = 0; i < 1000; ++i) {
        Container map;
        map.put("big", std::string_view(huge));
        map.put("nested_object_key_that_allocates", Container());
        auto res = try_encode(Value(std::move(map)));
        assert(!res);
        assert(res.ec == errc::length_exceeded);
        (void)res;
    }
    printf("      PASSED\n");
}

// Test 8: Stream output
static void test_stream_output() {
    printf("  [8] Stream output (500 cycles)...\n");
    const std::vector<Value> values = {Value(1)};
    const Value doc = make_medium_doc(3, values);
    const auto reference = doc.encode();
    for (int i = 0; i < 500; ++i) {
        std::ostringstream os(std::ios::binary);
        encode(os, doc);
        assert(os.str().size() == reference.size());
    }
    printf("      PASSED\n");
}

// Test 9: Allocation failures under a byte limit
static void test_allocation_failures() {
    printf("  [9] Allocation failures (1K cycles)...\n");
    CountingResource counting;
    for (int i = 0; i < 1000; ++i) {
        {
            Container map(&counting);
            counting.set_byte_limit(static_cast<size_t>(512 + (i % 7) * 64));
            int accepted = 0;
            for (int k = 0; k < 64; ++k) {
                if (!map.try_put("key_that_needs_heap_storage_" + std::to_string(k), k)) ++accepted;
            }
            assert(static_cast<size_t>(accepted) == map.size());
            (void)accepted;
            counting.set_byte_limit(0);
        }
        assert(counting.outstanding_blocks() == 0);
    }
    printf("      PASSED\n");
}

// Test 10: Move semantics
static void test_move_semantics() {
    printf("  [10] Move semantics stress (2K cycles)...\n");
    for (int cycle = 0; cycle < 2000; ++cycle) {
        Container map;
        for (int k = 0; k < 50; ++k) map.put("key_" + std::to_string(k), k);
        Value moved(std::move(map));
        Value other = std::move(moved);
        moved = std::move(other);
        assert(moved.size() == 50);
        Value copied = moved;
        assert(copied.size() == 50);
    }
    printf("      PASSED\n");
}

int main() {
    printf("=== yacbor Memory Leak Stress Test (ASan-friendly) ===\n\n");

    test_build_encode_cycle();
    test_arena_cycle();
    test_large_document();
    test_container_mutations();
    test_overwrite_nested();
    test_multithreaded();
    test_length_failures();
    test_stream_output();
    test_allocation_failures();
    test_move_semantics();

    printf("\n=== ALL STRESS TESTS PASSED ===\n");
    return 0;
}
