/**
 * @file  bench/bench_decay.cpp
 * @brief Google Benchmark suite for the decay engine.
 *
 * Benchmarks
 * ----------
 *   BM_Rpow                       one rpow call vs exponent size
 *   BM_IteratedDecay              naive per-period loop, for comparison
 *   BM_ComputeDecayed_Regimes     regime walk vs number of rate changes
 *   BM_Token_Transfer             settle + validate + commit round trip
 *
 * Build (CMake):
 *   cmake -DDEMURRAGE_BENCH=ON ..
 *   cmake --build build --target bench_decay
 *   ./build/bench_decay --benchmark_format=json
 *
 * Throughput units: items/second (periods folded or transfers applied).
 */

#include "benchmark/benchmark.h"

#include "demurrage/decay.hpp"
#include "demurrage/fixed_point.hpp"
#include "demurrage/token.hpp"

#include <cstdint>
#include <memory>

using demurrage::Amount;
using demurrage::Rate;
using demurrage::fixed_point::FixedPoint;

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const Amount SCALE{"10000000000000000000000000"};  // 10^25
static const Rate   RATE{"9985000000000000000000000"};    // 0.9985
static const Amount BALANCE{"10000000000000000000000"};   // 10000 · 10^18

// ── rpow vs iteration ──────────────────────────────────────────────────────────

static void BM_Rpow(benchmark::State& state) {
    const auto periods = static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        auto factor = FixedPoint::rpow(RATE, periods, SCALE);
        auto value  = FixedPoint::mul_div(BALANCE, *factor, SCALE);
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Rpow)->RangeMultiplier(8)->Range(1, 1 << 18)->Unit(benchmark::kNanosecond);

static void BM_IteratedDecay(benchmark::State& state) {
    const auto periods = static_cast<std::uint64_t>(state.range(0));
    for (auto _ : state) {
        Amount value = BALANCE;
        for (std::uint64_t i = 0; i < periods; ++i) {
            value = value * RATE / SCALE;
        }
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_IteratedDecay)->RangeMultiplier(8)->Range(1, 1 << 12)->Unit(benchmark::kMicrosecond);

// ── Regime walk ────────────────────────────────────────────────────────────────

static void BM_ComputeDecayed_Regimes(benchmark::State& state) {
    const auto changes = static_cast<demurrage::Period>(state.range(0));
    demurrage::RateSchedule schedule(demurrage::PeriodClock(0, 86'400), RATE);
    for (demurrage::Period p = 1; p <= changes; ++p) {
        schedule.schedule_change(p * 12, p % 2 == 0 ? RATE : SCALE, 0);
    }
    const demurrage::DecayAccountant accountant(schedule, 25);
    const demurrage::Period now = (changes + 1) * 12;

    for (auto _ : state) {
        auto result = accountant.compute_decayed(BALANCE, demurrage::DecayState{}, now);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(now));
    state.counters["regimes"] = static_cast<double>(changes + 1);
}
BENCHMARK(BM_ComputeDecayed_Regimes)->RangeMultiplier(4)->Range(1, 256)->Unit(benchmark::kMicrosecond);

// ── Token round trip ───────────────────────────────────────────────────────────

static void BM_Token_Transfer(benchmark::State& state) {
    auto now = std::make_shared<demurrage::Timestamp>(0);
    demurrage::TokenConfig config;
    config.owner = "owner";  // unit rate, so balances stay positive for any iteration count
    demurrage::DemurrageToken token(config, [now] { return *now; });
    token.mint("owner", "alice", BALANCE);
    token.mint("owner", "bob", BALANCE);

    const Amount amount{1};
    bool forward = true;
    for (auto _ : state) {
        // One period per iteration so every transfer walks a fresh span.
        *now += config.period_duration_seconds;
        if (forward) {
            token.transfer("alice", "bob", amount);
        } else {
            token.transfer("bob", "alice", amount);
        }
        forward = !forward;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Token_Transfer)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
