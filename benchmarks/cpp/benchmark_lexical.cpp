#include "sanctions/matching/lexical_matcher.hpp"
#include "sanctions/matching/ngram_similarity_provider.hpp"
#include <benchmark/benchmark.h>
#include <string>
#include <vector>

using namespace sn::matching;

static const std::vector<std::pair<std::string, std::string>>& namePairs() {
    static const std::vector<std::pair<std::string, std::string>> pairs{
        {"John Smith", "Johnny Smith"},
        {"Osama bin Laden", "Usama bin Ladin"},
        {"Kim Jong Un", "Kim Jong-un"},
        {"Vladimir Vladimirovich Putin", "Vladimir Putin"},
        {"Islamic Resistance Movement", "Islamic Emirate of Afghanistan"},
        {"Maria G. Rodriguez", "Robert Johnson"},
    };
    return pairs;
}

// Benchmark the weighted fuzzy ratio on short names
static void BM_Lexical_Similarity(benchmark::State& state) {
    const auto& pairs = namePairs();
    std::size_t i = 0;
    for (auto _ : state) {
        const auto& p = pairs[i++ % pairs.size()];
        double score = LexicalMatcher::similarity(p.first, p.second);
        benchmark::DoNotOptimize(score);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_Lexical_PartialRatio(benchmark::State& state) {
    const auto& pairs = namePairs();
    std::size_t i = 0;
    for (auto _ : state) {
        const auto& p = pairs[i++ % pairs.size()];
        double score = LexicalMatcher::partialRatio(p.first, p.second);
        benchmark::DoNotOptimize(score);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_Lexical_VariationScore(benchmark::State& state) {
    const auto& pairs = namePairs();
    std::size_t i = 0;
    for (auto _ : state) {
        const auto& p = pairs[i++ % pairs.size()];
        double score = LexicalMatcher::variationScore(p.first, p.second);
        benchmark::DoNotOptimize(score);
    }
    state.SetItemsProcessed(state.iterations());
}

// Benchmark one query against a batch of names with the n-gram provider
static void BM_Ngram_BatchSimilarity(benchmark::State& state) {
    NgramSimilarityProvider provider;
    std::vector<std::string> candidates;
    for (const auto& p : namePairs()) {
        candidates.push_back(p.first);
        candidates.push_back(p.second);
    }
    for (auto _ : state) {
        auto scores = provider.batchSimilarity("Dr. Ayman al-Zawahiri", candidates);
        benchmark::DoNotOptimize(scores);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(candidates.size()));
}

// Register benchmarks
BENCHMARK(BM_Lexical_Similarity)
    ->Name("Lexical_Similarity")
    ->UseRealTime()
    ->Iterations(100000);

BENCHMARK(BM_Lexical_PartialRatio)
    ->Name("Lexical_PartialRatio")
    ->UseRealTime()
    ->Iterations(100000);

BENCHMARK(BM_Lexical_VariationScore)
    ->Name("Lexical_VariationScore")
    ->UseRealTime()
    ->Iterations(10000);

BENCHMARK(BM_Ngram_BatchSimilarity)
    ->Name("Ngram_BatchSimilarity")
    ->UseRealTime()
    ->Iterations(10000);

BENCHMARK_MAIN();
