#include "sanctions/engine/screening_engine.hpp"
#include "sanctions/matching/ngram_similarity_provider.hpp"
#include "sanctions/watchlist/in_memory_watchlist_store.hpp"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <string>
#include <vector>

using namespace sn;

// Latency tracking helper
struct LatencyStats {
    std::vector<double> latencies;

    void record(double latency_ns) {
        latencies.push_back(latency_ns);
    }

    void report(benchmark::State& state, const std::string& name) {
        if (latencies.empty()) return;

        std::sort(latencies.begin(), latencies.end());

        auto p50 = latencies[latencies.size() * 0.50];
        auto p95 = latencies[latencies.size() * 0.95];
        auto p99 = latencies[latencies.size() * 0.99];
        auto max = latencies.back();
        auto min = latencies.front();

        double sum = 0.0;
        for (auto l : latencies) sum += l;
        double mean = sum / latencies.size();

        double variance = 0.0;
        for (auto l : latencies) {
            variance += (l - mean) * (l - mean);
        }
        double stddev = std::sqrt(variance / latencies.size());

        state.counters[name + "_P50_ns"] = p50;
        state.counters[name + "_P95_ns"] = p95;
        state.counters[name + "_P99_ns"] = p99;
        state.counters[name + "_Mean_ns"] = mean;
        state.counters[name + "_StdDev_ns"] = stddev;
        state.counters[name + "_Min_ns"] = min;
        state.counters[name + "_Max_ns"] = max;
    }
};

// Random two-part name from a fixed syllable set (static to avoid multiple definition)
static std::string generateName(std::mt19937& gen) {
    static const std::vector<std::string> syllables{
        "al", "ba", "ka", "de", "mo", "ri", "su", "ten", "vor", "xi", "lan", "gor"
    };
    std::uniform_int_distribution<std::size_t> pick(0, syllables.size() - 1);
    std::uniform_int_distribution<int> length(2, 3);

    auto word = [&] {
        std::string w;
        for (int i = length(gen); i > 0; --i) w += syllables[pick(gen)];
        w[0] = static_cast<char>(w[0] - 'a' + 'A');
        return w;
    };
    return word() + " " + word();
}

static std::shared_ptr<watchlist::InMemoryWatchlistStore> syntheticWatchlist(std::size_t size) {
    auto store = std::make_shared<watchlist::InMemoryWatchlistStore>();
    std::mt19937 gen(42);  // Fixed seed for reproducibility
    for (std::size_t i = 0; i < size; ++i) {
        core::WatchlistRecord r;
        r.listName = i % 2 ? "OFAC SDN List" : "EU Sanctions";
        r.source = i % 2 ? "OFAC" : "EU";
        r.name = generateName(gen);
        r.aliases = {generateName(gen)};
        store->upsert(std::move(r));
    }
    return store;
}

// Benchmark a full screening against watchlists of growing size
static void BM_Screening_Candidate(benchmark::State& state) {
    auto store = syntheticWatchlist(static_cast<std::size_t>(state.range(0)));
    engine::ScreeningEngine engine(store, std::make_shared<matching::NgramSimilarityProvider>());
    std::mt19937 gen(7);
    LatencyStats stats;

    for (auto _ : state) {
        core::Candidate candidate;
        candidate.name = generateName(gen);

        auto start = std::chrono::steady_clock::now();
        auto result = engine.screen(candidate);
        auto end = std::chrono::steady_clock::now();

        stats.record(static_cast<double>(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count()));
        benchmark::DoNotOptimize(result);
    }

    stats.report(state, "Screen");
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

// Benchmark the exact-hit short circuit
static void BM_Screening_ExactHit(benchmark::State& state) {
    auto store = syntheticWatchlist(1000);
    const auto snapshot = store->activeRecords();
    engine::ScreeningEngine engine(store, std::make_shared<matching::NgramSimilarityProvider>());

    core::Candidate candidate;
    candidate.name = snapshot->front().name;

    for (auto _ : state) {
        auto result = engine.screen(candidate);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}

// Register benchmarks
BENCHMARK(BM_Screening_Candidate)
    ->Name("Screening_Candidate")
    ->Arg(100)
    ->Arg(1000)
    ->UseRealTime()
    ->Unit(benchmark::kMicrosecond);

BENCHMARK(BM_Screening_ExactHit)
    ->Name("Screening_ExactHit")
    ->UseRealTime()
    ->Unit(benchmark::kMicrosecond);

// BENCHMARK_MAIN(); // Defined in benchmark_lexical.cpp
