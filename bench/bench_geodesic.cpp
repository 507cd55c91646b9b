/**
 * @file  bench/bench_geodesic.cpp
 * @brief Google Benchmark suite for geodesic stepping and batch solves.
 *
 * Benchmarks
 * ----------
 *   BM_Metric_Evaluate         — one tangent basis + metric
 *   BM_Christoffel_Compute     — second-kind symbols (five basis evaluations)
 *   BM_Step_Euler / BM_Step_RK4
 *   BM_Solve_Sphere            — batch solve, step budget as argument
 *   BM_Animator_Tick           — one frame at 10 sub-steps
 *
 * Build (CMake):
 *   cmake -DGEOSURF_BENCH=ON ..
 *   cmake --build build --target bench_geodesic
 *   ./build/bench_geodesic --benchmark_format=json
 *
 * Custom counter "steps_per_sec" = integration steps per second.
 */

#include "benchmark/benchmark.h"

#include "geosurf/animator.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/surface.hpp"
#include "geosurf/tensor.hpp"

#include <cstdint>
#include <numbers>

using namespace geosurf;
using namespace geosurf::geodesic;

namespace {

const GeodesicState SPHERE_START{ParameterPoint(std::numbers::pi / 4.0, 0.0),
                                 Velocity2D(1.0, 1.0)};

} // namespace

// ── Differential geometry ─────────────────────────────────────────────────────

static void BM_Metric_Evaluate(benchmark::State& state) {
    auto torus = Surface::make_torus(5.0, 1.0);
    tensor::MetricTensor metric(torus);
    double u = 0.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(metric.evaluate(u, 0.3));
        u += 1e-3;
    }
}
BENCHMARK(BM_Metric_Evaluate);

static void BM_Christoffel_Compute(benchmark::State& state) {
    auto torus = Surface::make_torus(5.0, 1.0);
    tensor::ChristoffelSymbols cs(torus);
    double u = 0.0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(cs.compute(u, 0.3));
        u += 1e-3;
    }
}
BENCHMARK(BM_Christoffel_Compute);

// ── Single steps ──────────────────────────────────────────────────────────────

static void BM_Step_Euler(benchmark::State& state) {
    auto sphere = Surface::make_sphere(5.0);
    GeodesicStepper stepper(sphere);
    GeodesicState s = SPHERE_START;
    for (auto _ : state) {
        s = stepper.euler_step(s, 1e-4);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Step_Euler);

static void BM_Step_RK4(benchmark::State& state) {
    auto sphere = Surface::make_sphere(5.0);
    GeodesicStepper stepper(sphere);
    GeodesicState s = SPHERE_START;
    for (auto _ : state) {
        s = stepper.rk4_step(s, 1e-4);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Step_RK4);

// ── Batch solve ───────────────────────────────────────────────────────────────

static void BM_Solve_Sphere(benchmark::State& state) {
    auto sphere = Surface::make_sphere(5.0);
    GeodesicSolver solver(sphere);
    const int steps = static_cast<int>(state.range(0));
    const SolveConfig config{.dt = 0.01, .max_steps = steps,
                             .integrator = Integrator::RungeKutta4};
    for (auto _ : state) {
        auto result = solver.solve(SPHERE_START, config);
        benchmark::DoNotOptimize(result.path.data());
        benchmark::ClobberMemory();
    }
    state.counters["steps_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(steps),
        benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Solve_Sphere)->RangeMultiplier(4)->Range(64, 4096)->Unit(benchmark::kMicrosecond);

// ── Animation ─────────────────────────────────────────────────────────────────

static void BM_Animator_Tick(benchmark::State& state) {
    auto torus = Surface::make_torus(5.0, 1.0);
    animation::Animator anim(torus);
    anim.reset(ParameterPoint(0.0, 0.0), Velocity2D(1.0, 0.3));
    for (auto _ : state) {
        anim.tick(1.0 / 60.0);
        if (anim.path().size() > 100'000) {
            state.PauseTiming();
            anim.reset(anim.state().position, anim.state().velocity);
            state.ResumeTiming();
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 10);
}
BENCHMARK(BM_Animator_Tick)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
