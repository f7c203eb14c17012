#include "sanctions/pipeline/screening_pipeline.hpp"
#include "sanctions/matching/ngram_similarity_provider.hpp"
#include "sanctions/queue/blocking_queue.hpp"
#include "sanctions/watchlist/in_memory_watchlist_store.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include <thread>

using namespace sn;

static std::shared_ptr<watchlist::InMemoryWatchlistStore> sampleWatchlist() {
    auto store = std::make_shared<watchlist::InMemoryWatchlistStore>();
    const char* names[] = {"John Smith", "Maria Garcia", "Robert Johnson", "Vladimir Putin", "Kim Jong-un"};
    for (const char* name : names) {
        core::WatchlistRecord r;
        r.listName = "OFAC SDN List";
        r.source = "OFAC";
        r.name = name;
        store->upsert(std::move(r));
    }
    return store;
}

static events::PaymentEvent generatePayment(std::uint64_t id) {
    events::PaymentEvent e;
    e.paymentId = "PAY-" + std::to_string(id);
    e.transactionId = "TXN-" + std::to_string(id);
    e.senderName = id % 10 == 0 ? "John Smith" : "Alice Walker";
    e.recipientName = "Bob Miller";
    e.amount = 1000.0;
    e.currency = "USD";
    e.ts = std::chrono::system_clock::now();
    return e;
}

// Benchmark end-to-end payment throughput through the pipeline
static void BM_Pipeline_PaymentThroughput(benchmark::State& state) {
    core::PipelineConfig config;
    config.prefetch = static_cast<std::size_t>(state.range(0));
    config.queueSize = 4096;
    pipeline::ScreeningPipeline service(sampleWatchlist(), std::make_shared<matching::NgramSimilarityProvider>(),
                                         core::ScreeningThresholds{}, config);
    service.start();

    std::uint64_t paymentId = 1;
    constexpr std::size_t BATCH = 64;
    for (auto _ : state) {
        std::size_t submitted = 0;
        while (submitted < BATCH) {
            if (service.submitPayment(generatePayment(paymentId))) {
                ++paymentId;
                ++submitted;
            } else {
                std::this_thread::yield();
            }
        }
        std::size_t done = 0;
        while (done < BATCH) {
            done += service.processResults();
            if (done < BATCH) std::this_thread::yield();
        }
    }

    service.stop();
    state.SetItemsProcessed(state.iterations() * BATCH);
}

// Benchmark the bounded queue under a single producer and consumer
static void BM_Queue_PushPop(benchmark::State& state) {
    queue::BlockingQueue<std::uint64_t> q(1024);
    std::uint64_t value = 0;

    for (auto _ : state) {
        bool pushed = q.tryPush(value++);
        benchmark::DoNotOptimize(pushed);
        std::uint64_t out = 0;
        bool popped = q.tryPop(out);
        benchmark::DoNotOptimize(popped);
    }
    state.SetItemsProcessed(state.iterations());
}

// Register benchmarks
BENCHMARK(BM_Pipeline_PaymentThroughput)
    ->Name("Pipeline_PaymentThroughput")
    ->Arg(1)
    ->Arg(4)
    ->UseRealTime()
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Queue_PushPop)
    ->Name("Queue_PushPop")
    ->UseRealTime()
    ->Iterations(1000000);

// BENCHMARK_MAIN(); // Defined in benchmark_lexical.cpp
