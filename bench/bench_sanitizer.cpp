#include <benchmark/benchmark.h>
#include <map>
#include <string>
#include <vector>
#include "nslog.hpp"

// ---------------------------------------------------------------------------
// BM_Sanitize_Scalar
// Short string, no truncation.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Scalar(benchmark::State& state) {
    nslog::SanitizationContext ctx;
    nslog::Value value("hello world");
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::sanitize(value, ctx));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Scalar);

// ---------------------------------------------------------------------------
// BM_Sanitize_Truncate
// Long string cut to 64 characters.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Truncate(benchmark::State& state) {
    nslog::SanitizationContext ctx;
    ctx.maxStringLength = 64;
    nslog::Value value(std::string(4096, 'x'));
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::sanitize(value, ctx));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Truncate);

// ---------------------------------------------------------------------------
// BM_Sanitize_Record
// Plain record with a nested sequence.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Record(benchmark::State& state) {
    nslog::SanitizationContext ctx;
    ctx.maxStringLength = 128;
    nslog::Value value(nslog::Fields{
        {"userId", 42},
        {"name", "alice"},
        {"roles", std::vector<std::string>{"admin", "billing", "support"}},
        {"address", nslog::Fields{{"city", "Lisbon"}, {"zip", "1000-001"}}}});
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::sanitize(value, ctx));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Record);

// ---------------------------------------------------------------------------
// BM_Sanitize_NestedMaps/depth
// Keyed containers nested `depth` levels deep against the default budget.
// ---------------------------------------------------------------------------
static void BM_Sanitize_NestedMaps(benchmark::State& state) {
    nslog::SanitizationContext ctx;
    nslog::Value value(std::map<std::string, int>{{"leaf", 1}});
    for (int64_t i = 0; i < state.range(0); ++i) {
        value = nslog::Value::map(nslog::Value::MapEntries{std::make_pair(nslog::Value("k"), value)});
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::sanitize(value, ctx));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_NestedMaps)->Arg(2)->Arg(8)->Arg(16);
