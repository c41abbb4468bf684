/**
 * @file  bench/bench_asymmetry.cpp
 * @brief Google Benchmark suite for the charm CP-asymmetry evaluation chain.
 *
 * Benchmarks
 * ----------
 *   BM_WeakAmplitudes_ShortDistance   CKM products → D⁰ and D̄⁰ amplitudes
 *   BM_RescatteringMatrix_Build       Ω from the tabulated Omnès entries
 *   BM_TriangleModel_Build            closed-form loop matrix K
 *   BM_Engine_ModelA                  full PSV evaluation
 *   BM_Engine_ModelB_Single / _Resummed
 *   BM_Engine_Delta1Scan              n-point scan of arg Ω₁
 *
 * Build (CMake):
 *   cmake -DCHARMCP_BUILD_BENCHMARKS=ON ..
 *   cmake --build build --target bench_asymmetry
 *   ./build/bench_asymmetry --benchmark_format=json
 *
 * Throughput units: items/second (complete evaluations).
 */

#include "benchmark/benchmark.h"

#include "charmcp/constants.hpp"
#include "charmcp/engine.hpp"
#include "charmcp/reference_points.hpp"

#include <cstdint>

using namespace charmcp;

// ── Building blocks ────────────────────────────────────────────────────────────

static void BM_WeakAmplitudes_ShortDistance(benchmark::State& state) {
    const CkmProducts ckm = reference::psv_ckm_products();
    const WeakInputs in   = reference::psv_short_distance();
    for (auto _ : state) {
        auto weak = WeakAmplitudeBuilder::build(ckm, in);
        benchmark::DoNotOptimize(weak);
    }
}
BENCHMARK(BM_WeakAmplitudes_ShortDistance);

static void BM_RescatteringMatrix_Build(benchmark::State& state) {
    const auto table = reference::psv_omnes_table();
    for (auto _ : state) {
        auto omega = RescatteringMatrix::from_omnes_table(table);
        benchmark::DoNotOptimize(omega);
    }
}
BENCHMARK(BM_RescatteringMatrix_Build);

static void BM_TriangleModel_Build(benchmark::State& state) {
    const auto params = reference::illustrative_triangle();
    for (auto _ : state) {
        TriangleRescatteringModel model(params);
        benchmark::DoNotOptimize(model.loop_matrix());
    }
}
BENCHMARK(BM_TriangleModel_Build);

// ── Full evaluation ────────────────────────────────────────────────────────────

static void run_engine(benchmark::State& state, const RunConfig& cfg) {
    const Engine engine;
    for (auto _ : state) {
        auto result = engine.evaluate(cfg);
        benchmark::DoNotOptimize(result.delta_acp);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

static void BM_Engine_ModelA(benchmark::State& state) {
    run_engine(state, reference::psv_run_config());
}
BENCHMARK(BM_Engine_ModelA);

static void BM_Engine_ModelB_Single(benchmark::State& state) {
    run_engine(state, reference::illustrative_triangle_run_config(RescatteringOrder::Single));
}
BENCHMARK(BM_Engine_ModelB_Single);

static void BM_Engine_ModelB_Resummed(benchmark::State& state) {
    run_engine(state, reference::illustrative_triangle_run_config(RescatteringOrder::Resummed));
}
BENCHMARK(BM_Engine_ModelB_Resummed);

static void BM_Engine_Delta1Scan(benchmark::State& state) {
    const int n = static_cast<int>(state.range(0));
    const Engine engine;
    RunConfig cfg = reference::psv_run_config();
    for (auto _ : state) {
        double sum = 0.0;
        for (int i = 0; i < n; ++i) {
            cfg.rescattering.kk_isovector.phase = 2.0 * constants::PI * i / n;
            sum += *engine.evaluate(cfg).delta_acp;
        }
        benchmark::DoNotOptimize(sum);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * n);
}
BENCHMARK(BM_Engine_Delta1Scan)->RangeMultiplier(4)->Range(16, 1024)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
