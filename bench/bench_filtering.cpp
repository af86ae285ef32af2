#include <benchmark/benchmark.h>
#include <memory>
#include "nslog.hpp"
#include "null_sink.hpp"

namespace {

nslog::Logger makeLogger(const std::string& ns, const std::string& debug) {
    auto base = std::make_shared<nslog::SinkLogger>(std::make_shared<nslog::NullSink>(),
                                                    nslog::LogLevel::TRACE);
    auto config = std::make_shared<nslog::RuntimeConfig>(nslog::Environment{{"DEBUG", debug}});
    nlohmann::ordered_json bindings = nlohmann::ordered_json::object();
    bindings["namespace"] = ns;
    return nslog::Logger(base->child(bindings), ns, config);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_Filter_Universal
// DEBUG=*: every namespace passes.
// ---------------------------------------------------------------------------
static void BM_Filter_Universal(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::NamespaceFilter::isEnabled("api:users", "*"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Filter_Universal);

// ---------------------------------------------------------------------------
// BM_Filter_Mixed
// Prefix, exact and negative patterns; cached compilation.
// ---------------------------------------------------------------------------
static void BM_Filter_Mixed(benchmark::State& state) {
    const std::string expr = "api:*,db:query,-api:internal:*,worker";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nslog::NamespaceFilter::isEnabled("api:internal:jobs", expr));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Filter_Mixed);

// ---------------------------------------------------------------------------
// BM_Filter_Compile
// Cost of compiling an expression without the cache.
// ---------------------------------------------------------------------------
static void BM_Filter_Compile(benchmark::State& state) {
    for (auto _ : state) {
        nslog::FilterExpression expr =
            nslog::FilterExpression::compile("api:*,db:query,-api:internal:*,worker");
        benchmark::DoNotOptimize(expr.isEnabled("db:query"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Filter_Compile);

// ---------------------------------------------------------------------------
// BM_Logger_Disabled
// Namespace disabled: the call returns before building any Value.
// ---------------------------------------------------------------------------
static void BM_Logger_Disabled(benchmark::State& state) {
    nslog::Logger log = makeLogger("api:users", "db:*");
    for (auto _ : state) {
        log.info("user %s logged in", "alice");
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Logger_Disabled);

// ---------------------------------------------------------------------------
// BM_Logger_Enabled
// Full dispatch into a null sink.
// ---------------------------------------------------------------------------
static void BM_Logger_Enabled(benchmark::State& state) {
    nslog::Logger log = makeLogger("api:users", "api:*");
    for (auto _ : state) {
        log.info(nslog::Fields{{"userId", 42}}, "user %s logged in", "alice");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Logger_Enabled);
