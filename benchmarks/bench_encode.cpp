/// @file bench_encode.cpp
/// @brief Benchmarks for building and encoding documents.
///
/// Measures:
///   - Encode small/medium/large documents into a vector
///   - Build + encode on the heap vs on a MonotonicArena
///   - Stream output vs vector output
///   - Multi-threaded encodes of one shared document

#include <cbor/cbor.hpp>

#include <benchmark/benchmark.h>

#include <sstream>
#include <string>
#include <vector>

using namespace yacbor;

// =============================================================================
// Test data generators
// =============================================================================

namespace {

/// Strings that Values borrow from; they live for the whole run.
struct Corpus {
    std::vector<std::string> names;
    std::vector<std::string> emails;
    std::vector<std::string> titles;
    std::vector<std::vector<Value>> tags;

    Corpus() {
        for (int i = 0; i < 1000; ++i) {
            names.push_back("user_" + std::to_string(i));
            emails.push_back("user" + std::to_string(i) + "@test.com");
            titles.push_back("Item " + std::to_string(i) + " with some longer title text for realism");
        }
        for (int i = 0; i < 10; ++i)
            tags.push_back({Value("tag"), Value(i), Value("common")});
    }
};

const Corpus& corpus() {
    static const Corpus c;
    return c;
}

/// Network-like message (~150 bytes encoded): AP event notification.
Value gen_small(memory_resource* mr) {
    Container msg(mr);
    msg.put("type", "client_connect");
    msg.put("ap_id", "AP-001-FLOOR3");
    msg.put("mac", "AA:BB:CC:DD:EE:FF");
    msg.put("rssi", -42);
    msg.put("channel", 36);
    msg.put("timestamp", int64_t(1707350400));
    msg.put("ssid", "Corporate-5G");
    return Value(std::move(msg));
}

/// Medium document (~1.5KB): list of connected clients.
Value gen_medium(memory_resource* mr, std::vector<Value>& users) {
    const Corpus& c = corpus();
    users.clear();
    for (int i = 0; i < 20; ++i) {
        Container user(mr);
        user.put("id", i);
        user.put("name", std::string_view(c.names[i]));
        user.put("email", std::string_view(c.emails[i]));
        user.put("active", i % 2 == 0);
        user.put("score", 50.0 + i * 2.5);
        users.emplace_back(std::move(user));
    }
    Container root(mr);
    root.put("users", Value(ArrayRef(users)));
    root.put("total", 20);
    root.put("page", 1);
    root.put("version", "2.0");
    return Value(std::move(root));
}

/// Large document (~80KB): bulk data export.
Value gen_large(memory_resource* mr, std::vector<Value>& items) {
    const Corpus& c = corpus();
    items.clear();
    for (int i = 0; i < 1000; ++i) {
        Container item(mr);
        item.put("id", i);
        item.put("title", std::string_view(c.titles[i]));
        item.put("price", 9.99 + i * 0.1);
        item.put("quantity", i % 100);
        item.put("tags", Value(ArrayRef(c.tags[i % 10])));
        item.put("active", i % 3 != 0);
        items.emplace_back(std::move(item));
    }
    Container root(mr);
    root.put("data", Value(ArrayRef(items)));
    root.put("total", 1000);
    return Value(std::move(root));
}

} // namespace

// =============================================================================
// Encode only (document built once)
// =============================================================================

static void BM_EncodeSmall(benchmark::State& state) {
    const Value doc = gen_small(get_default_resource());
    size_t bytes = 0;
    for (auto _ : state) {
        auto out = doc.encode();
        bytes = out.size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EncodeSmall);

static void BM_EncodeMedium(benchmark::State& state) {
    std::vector<Value> users;
    const Value doc = gen_medium(get_default_resource(), users);
    size_t bytes = 0;
    for (auto _ : state) {
        auto out = doc.encode();
        bytes = out.size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EncodeMedium);

static void BM_EncodeLarge(benchmark::State& state) {
    std::vector<Value> items;
    const Value doc = gen_large(get_default_resource(), items);
    size_t bytes = 0;
    for (auto _ : state) {
        auto out = doc.encode();
        bytes = out.size();
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_EncodeLarge);

static void BM_EncodeLarge_ReusedBuffer(benchmark::State& state) {
    std::vector<Value> items;
    const Value doc = gen_large(get_default_resource(), items);
    std::vector<uint8_t> out;
    for (auto _ : state) {
        out.clear();
        detail::VectorOutput sink(out);
        doc.encode_to(sink);
        benchmark::DoNotOptimize(out.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(out.size()));
}
BENCHMARK(BM_EncodeLarge_ReusedBuffer);

static void BM_EncodeLarge_Stream(benchmark::State& state) {
    std::vector<Value> items;
    const Value doc = gen_large(get_default_resource(), items);
    size_t bytes = 0;
    for (auto _ : state) {
        std::ostringstream os(std::ios::binary);
        encode(os, doc);
        bytes = static_cast<size_t>(os.tellp());
        benchmark::DoNotOptimize(bytes);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(bytes));
}
BENCHMARK(BM_EncodeLarge_Stream);

// =============================================================================
// Build + encode: heap vs arena
// =============================================================================

static void BM_BuildSmall_Heap(benchmark::State& state) {
    for (auto _ : state) {
        Value doc = gen_small(get_default_resource());
        auto out = doc.encode();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildSmall_Heap);

static void BM_BuildSmall_Arena(benchmark::State& state) {
    alignas(16) char buf[4096];
    MonotonicArena arena(buf, sizeof(buf));
    for (auto _ : state) {
        {
            Value doc = gen_small(&arena);
            auto out = doc.encode();
            benchmark::DoNotOptimize(out);
        }
        arena.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildSmall_Arena);

static void BM_BuildMedium_Heap(benchmark::State& state) {
    std::vector<Value> users;
    for (auto _ : state) {
        Value doc = gen_medium(get_default_resource(), users);
        auto out = doc.encode();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildMedium_Heap);

static void BM_BuildMedium_Arena(benchmark::State& state) {
    MonotonicArena arena(16384);
    std::vector<Value> users;
    for (auto _ : state) {
        {
            Value doc = gen_medium(&arena, users);
            auto out = doc.encode();
            benchmark::DoNotOptimize(out);
            users.clear();
        }
        arena.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildMedium_Arena);

static void BM_BuildLarge_Heap(benchmark::State& state) {
    std::vector<Value> items;
    for (auto _ : state) {
        Value doc = gen_large(get_default_resource(), items);
        auto out = doc.encode();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildLarge_Heap);

static void BM_BuildLarge_Arena(benchmark::State& state) {
    MonotonicArena arena(1 << 20);
    std::vector<Value> items;
    for (auto _ : state) {
        {
            Value doc = gen_large(&arena, items);
            auto out = doc.encode();
            benchmark::DoNotOptimize(out);
            items.clear();
        }
        arena.reset();

        state.counters["arena_capacity"] = static_cast<double>(arena.capacity());
        state.counters["overflow_blocks"] = static_cast<double>(arena.block_count());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BuildLarge_Arena);

// =============================================================================
// Multi-threaded
// =============================================================================

static void BM_MT_EncodeMedium_Shared(benchmark::State& state) {
    static std::vector<Value> users;
    static const Value doc = gen_medium(get_default_resource(), users);
    for (auto _ : state) {
        auto out = doc.encode();
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MT_EncodeMedium_Shared)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

static void BM_MT_BuildSmall_Arena(benchmark::State& state) {
    MonotonicArena arena(4096);
    for (auto _ : state) {
        {
            Value doc = gen_small(&arena);
            auto out = doc.encode();
            benchmark::DoNotOptimize(out);
        }
        arena.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_MT_BuildSmall_Arena)->Threads(1)->Threads(2)->Threads(4)->Threads(8);
