#include "pfbook/fenwick_auction.h"
#include "pfbook/frontier_auction.h"
#include "pfbook/word_codec.h"
#include <benchmark/benchmark.h>
#include <algorithm>
#include <random>
#include <vector>

using namespace pfbook;

struct BidEvent {
    Tick tick;
    Volume amount;
};

// Shared setup: bids clustered just above a moving base price
static std::vector<BidEvent> make_bids(size_t n, Tick max_ticks, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<Tick> near(0, 49);
    std::uniform_int_distribution<Tick> far(50, 1049);
    std::uniform_int_distribution<int> aggressive(0, 99);
    std::uniform_int_distribution<Volume> amount(1, 50);

    std::vector<BidEvent> bids;
    bids.reserve(n);
    Tick base = 100;
    for (size_t i = 0; i < n; ++i) {
        Tick offset = aggressive(rng) < 15 ? far(rng) : near(rng);
        Tick tick = std::min(base + offset, max_ticks - 1);
        bids.push_back({tick, amount(rng)});
        if (i % 256 == 255) base = std::min(base + 25, max_ticks - 1);
    }
    return bids;
}

// --- Word codec ---

static void BM_PackUnpack(benchmark::State& state) {
    std::mt19937_64 rng(99);
    Lanes lanes{rng(), rng(), rng(), rng()};
    for (auto _ : state) {
        Word w = pack_word(lanes);
        lanes = unpack_word(w);
        benchmark::DoNotOptimize(lanes);
    }
}
BENCHMARK(BM_PackUnpack);

// --- Bidding ---

static void BM_FenwickBid(benchmark::State& state) {
    const Tick max_ticks = state.range(0);
    auto bids = make_bids(4096, max_ticks);

    FenwickAuction auction(max_ticks);
    Gas gas = 0;
    size_t idx = 0;
    for (auto _ : state) {
        const auto& b = bids[idx];
        auto result = auction.bid(b.tick, b.amount);
        gas += result.gas.total;
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) & (bids.size() - 1);
    }
    state.counters["gas_per_bid"] =
        benchmark::Counter(static_cast<double>(gas), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_FenwickBid)->Arg(10'000)->Arg(100'000);

static void BM_FrontierBid(benchmark::State& state) {
    const Tick max_ticks = state.range(0);
    auto bids = make_bids(4096, max_ticks);

    FrontierAuction auction(max_ticks, kDefaultSaleSupply);
    Gas gas = 0;
    size_t idx = 0;
    for (auto _ : state) {
        const auto& b = bids[idx];
        auto result = auction.bid(b.tick, b.amount);
        gas += result.gas.total;
        benchmark::DoNotOptimize(result);
        idx = (idx + 1) & (bids.size() - 1);
    }
    state.counters["gas_per_bid"] =
        benchmark::Counter(static_cast<double>(gas), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_FrontierBid)->Arg(10'000)->Arg(100'000);

// --- Clearing ---

static void BM_FenwickClearingSearch(benchmark::State& state) {
    const Tick max_ticks = state.range(0);
    auto bids = make_bids(4096, max_ticks);

    FenwickAuction auction(max_ticks);
    Volume total = 0;
    for (const auto& b : bids) {
        auction.bid(b.tick, b.amount);
        total += b.amount;
    }

    Gas gas = 0;
    for (auto _ : state) {
        auto search = auction.find_clearing_price(total / 2);
        gas += cost_of_query(search.operations).total;
        benchmark::DoNotOptimize(search);
    }
    state.counters["search_gas"] =
        benchmark::Counter(static_cast<double>(gas), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_FenwickClearingSearch)->Arg(10'000)->Arg(100'000);

// The write phase scans ticks linearly; each iteration rebuilds the book.
static void BM_FenwickClear(benchmark::State& state) {
    const Tick max_ticks = state.range(0);
    auto bids = make_bids(1024, max_ticks);
    Volume total = 0;
    for (const auto& b : bids) total += b.amount;

    for (auto _ : state) {
        state.PauseTiming();
        FenwickAuction auction(max_ticks);
        for (const auto& b : bids) auction.bid(b.tick, b.amount);
        state.ResumeTiming();

        auto result = auction.clear(total / 2);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_FenwickClear)->Arg(10'000);
