// jd-cpp benchmarks: measures throughput of diffing, patching and rendering.

#include <jd-cpp/jd.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

using namespace jd_cpp;

// A list of n numbers with every `stride`-th element changed.
static auto make_list(std::int64_t n, std::int64_t stride, double offset) -> Node {
    auto items = Array{};
    items.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        items.emplace_back(i % stride == 0 ? static_cast<double>(i) + offset : static_cast<double>(i));
    }
    return Node{std::move(items)};
}

// An object with n keys, each holding a small nested record.
static auto make_object(std::int64_t n, std::int64_t version) -> Node {
    auto fields = Object{};
    for (std::int64_t i = 0; i < n; ++i) {
        fields.emplace("key" + std::to_string(i), Object{
            {"id", i},
            {"version", i % 10 == 0 ? version : std::int64_t{0}},
            {"tags", Array{"a", "b"}},
        });
    }
    return Node{std::move(fields)};
}

// =============================================================================
// Hashing
// =============================================================================

static void bm_hash_code(benchmark::State& state) {
    const auto doc = make_object(state.range(0), 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(hash_code(doc));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_hash_code)->Range(8, 4096);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_list(benchmark::State& state) {
    const auto a = make_list(state.range(0), 7, 0.0);
    const auto b = make_list(state.range(0), 7, 0.5);
    for (auto _ : state) {
        auto d = diff(a, b);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_list)->Range(8, 1024);

static void bm_diff_object(benchmark::State& state) {
    const auto a = make_object(state.range(0), 1);
    const auto b = make_object(state.range(0), 2);
    for (auto _ : state) {
        auto d = diff(a, b);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_object)->Range(8, 4096);

static void bm_diff_equal(benchmark::State& state) {
    const auto a = make_object(state.range(0), 1);
    const auto b = make_object(state.range(0), 1);
    for (auto _ : state) {
        auto d = diff(a, b);
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_diff_equal)->Range(8, 4096);

// =============================================================================
// Patch
// =============================================================================

static void bm_apply_patch_list(benchmark::State& state) {
    const auto a = make_list(state.range(0), 7, 0.0);
    const auto d = diff(a, make_list(state.range(0), 7, 0.5));
    for (auto _ : state) {
        auto patched = apply_patch(a, d);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(d.size()));
}
BENCHMARK(bm_apply_patch_list)->Range(8, 1024);

static void bm_apply_patch_merge(benchmark::State& state) {
    const auto a = make_object(state.range(0), 1);
    const auto d = diff(a, make_object(state.range(0), 2), DiffOptions{}.with_merge());
    for (auto _ : state) {
        auto patched = apply_patch(a, d);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(d.size()));
}
BENCHMARK(bm_apply_patch_merge)->Range(8, 1024);

// =============================================================================
// Render and read
// =============================================================================

static void bm_render_native(benchmark::State& state) {
    const auto d = diff(make_object(state.range(0), 1), make_object(state.range(0), 2));
    for (auto _ : state) {
        auto text = render_native(d);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_render_native)->Range(8, 1024);

static void bm_read_diff(benchmark::State& state) {
    const auto text = render_native(diff(make_object(state.range(0), 1), make_object(state.range(0), 2)));
    for (auto _ : state) {
        auto d = read_diff(text);
        benchmark::DoNotOptimize(d);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_read_diff)->Range(8, 1024);
