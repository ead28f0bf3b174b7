/**
 * @file  bench/bench_monte_carlo.cpp
 * @brief Google Benchmark suite for the forecasting hot path.
 *
 * Benchmarks
 * ----------
 *   BM_StandardNormal          — one Box–Muller draw
 *   BM_MonteCarlo_Run          — full simulate + sort + summarise
 *   BM_TrendAnalyzer_Analyze   — share series + OLS for many parties
 *   BM_ForecastGenerator       — per-party simulation at default iterations
 *
 * Build (CMake):
 *   cmake -DVOTECAST_BENCH=ON ..
 *   cmake --build build --target bench_monte_carlo
 *   ./build/bench_monte_carlo --benchmark_format=json
 *
 * Throughput units: items/second (samples or rows processed).
 */

#include "benchmark/benchmark.h"

#include "votecast/forecast.hpp"
#include "votecast/monte_carlo.hpp"
#include "votecast/trend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// `parties` parties over 2002..2022, votes drifting by party index.
static std::vector<votecast::HistoricalDataPoint> make_history(std::size_t parties) {
    std::vector<votecast::HistoricalDataPoint> rows;
    rows.reserve(parties * 6);
    for (std::size_t p = 0; p < parties; ++p) {
        for (int year = 2002; year <= 2022; year += 4) {
            rows.push_back(votecast::HistoricalDataPoint{
                .year        = year,
                .party       = "P" + std::to_string(p),
                .total_votes = static_cast<std::int64_t>(1000 + p * 37 + (year - 2002) * (p % 5)),
            });
        }
    }
    return rows;
}

// ── Simulation ─────────────────────────────────────────────────────────────────

static void BM_StandardNormal(benchmark::State& state) {
    votecast::simulation::MonteCarloSimulator sim(1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sim.standard_normal());
    }
}
BENCHMARK(BM_StandardNormal);

static void BM_MonteCarlo_Run(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    votecast::simulation::MonteCarloSimulator sim(2024);
    const votecast::simulation::SimulationInput in{
        .base_value = 35.0,
        .volatility = 4.0,
        .iterations = n,
    };
    for (auto _ : state) {
        auto r = sim.run(in);
        benchmark::DoNotOptimize(r.mean);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_MonteCarlo_Run)->RangeMultiplier(4)->Range(1024, 65536)->Unit(benchmark::kMicrosecond);

// ── Pipeline stages ────────────────────────────────────────────────────────────

static void BM_TrendAnalyzer_Analyze(benchmark::State& state) {
    const auto rows = make_history(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto trends = votecast::trend::TrendAnalyzer::analyze(rows);
        benchmark::DoNotOptimize(trends.size());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(rows.size()));
}
BENCHMARK(BM_TrendAnalyzer_Analyze)->RangeMultiplier(4)->Range(4, 256);

static void BM_ForecastGenerator(benchmark::State& state) {
    const auto rows   = make_history(static_cast<std::size_t>(state.range(0)));
    const auto trends = votecast::trend::TrendAnalyzer::analyze(rows);
    const votecast::forecast::ForecastGenerator generator(votecast::ModelParameters{}, 7);
    for (auto _ : state) {
        auto results = generator.generate(trends, 2026);
        benchmark::DoNotOptimize(results.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) *
                            static_cast<int64_t>(trends.size()));
}
BENCHMARK(BM_ForecastGenerator)->Arg(4)->Arg(16)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
