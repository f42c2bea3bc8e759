/**
 * @file  bench/bench_pair_filters.cpp
 * @brief Google Benchmark suite for the statistical pair filters.
 *
 * Benchmarks
 * ----------
 *   BM_Hurst_Estimate          — lagged-difference Hurst exponent
 *   BM_EngleGranger_Test       — OLS + ADF lag search + MacKinnon p-value
 *   BM_OU_Fit                  — AR(1) regression
 *   BM_Optics_Fit              — OPTICS over N points in 10 dimensions
 *   BM_PairsSelector_Run       — full selection on a synthetic universe
 *
 * Build (CMake):
 *   cmake -DPAIRSEL_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_pair_filters
 *   ./build/bench_pair_filters --benchmark_format=json
 *
 * Throughput units: items/second (observations processed).
 */

#include "benchmark/benchmark.h"

#include "pairsel/clustering.hpp"
#include "pairsel/pipeline.hpp"
#include "pairsel/stat_arb.hpp"
#include "pairsel/stats.hpp"
#include "support/synthetic_prices.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

using pairsel::testing::NormalSource;
using pairsel::testing::ar1;
using pairsel::testing::random_walk;

// ── Hurst ─────────────────────────────────────────────────────────────────────

static void BM_Hurst_Estimate(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    NormalSource normal(1);
    const auto series = ar1(normal, n, 0.7);
    const pairsel::stats::HurstEstimator estimator;

    for (auto _ : state) {
        auto h = estimator.estimate(series);
        benchmark::DoNotOptimize(h);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Hurst_Estimate)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

// ── Engle-Granger ─────────────────────────────────────────────────────────────

static void BM_EngleGranger_Test(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    NormalSource normal(2);
    const auto x = random_walk(normal, n, 50.0);
    const auto noise = ar1(normal, n, 0.5);
    std::vector<double> y(n);
    for (std::size_t t = 0; t < n; ++t) y[t] = 1.5 * x[t] + noise[t];

    const pairsel::stat_arb::EngleGrangerTester tester;
    for (auto _ : state) {
        auto r = tester.test(y, x);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_EngleGranger_Test)->RangeMultiplier(4)->Range(256, 4096)->Unit(benchmark::kMicrosecond);

// ── Ornstein-Uhlenbeck ────────────────────────────────────────────────────────

static void BM_OU_Fit(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    NormalSource normal(3);
    const auto series = ar1(normal, n, 0.9);

    for (auto _ : state) {
        auto p = pairsel::stat_arb::OrnsteinUhlenbeckEstimator::fit(series);
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_OU_Fit)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── OPTICS ────────────────────────────────────────────────────────────────────

static void BM_Optics_Fit(benchmark::State& state) {
    const auto n = static_cast<Eigen::Index>(state.range(0));
    NormalSource normal(4);
    pairsel::Matrix points(n, 10);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < 10; ++j) points(i, j) = normal();
    }
    const pairsel::cluster::Optics optics;

    for (auto _ : state) {
        auto r = optics.fit(points);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Optics_Fit)->RangeMultiplier(2)->Range(32, 512)->Unit(benchmark::kMillisecond);

// ── Full selection ────────────────────────────────────────────────────────────

static void BM_PairsSelector_Run(benchmark::State& state) {
    const auto prices = pairsel::testing::cointegrated_universe(7, 500);
    pairsel::pipeline::SelectorConfig cfg;
    cfg.num_features = 2;
    const pairsel::pipeline::PairsSelector selector(cfg);

    for (auto _ : state) {
        auto result = selector.run(prices);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_PairsSelector_Run)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
