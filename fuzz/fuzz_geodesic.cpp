/**
 * @file  fuzz_geodesic.cpp
 * @brief libFuzzer target for GeodesicSolver::solve and Animator::tick
 *
 * Build:
 *   cmake -DGEOSURF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_geodesic
 *
 * Run for 60 seconds:
 *   ./fuzz_geodesic -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. Always terminates (step count bounded by the fuzzed budget).
 *   2. path.size() == steps_taken + 1 and path.front() is the start point.
 *   3. No crash, no UB, no exception for any (preset, state, dt, cap) combo,
 *      including NaN and infinite inputs.
 *
 * Fuzzer strategy:
 *   Bytes interpreted as:
 *     [1 byte:    preset index]
 *     [1 byte:    flags (bit 0: integrator, bit 1: unit speed)]
 *     [2 bytes:   step budget, 0..1023]
 *     [4 doubles: start u, start v, velocity du, velocity dv]
 *     [2 doubles: dt, max_length]
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include "geosurf/animator.hpp"
#include "geosurf/geodesic.hpp"
#include "geosurf/surface.hpp"

using namespace geosurf;
using namespace geosurf::geodesic;

static constexpr size_t HEADER_BYTES = 4;
static constexpr size_t DOUBLE_BYTES = 6 * sizeof(double);
static constexpr size_t MIN_INPUT    = HEADER_BYTES + DOUBLE_BYTES;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < MIN_INPUT) return 0;

    static const auto names = preset_names();
    const auto preset = find_preset(names[data[0] % names.size()]);
    if (!preset) return 0;

    const Integrator integrator = (data[1] & 1) ? Integrator::Euler
                                                : Integrator::RungeKutta4;
    const VelocityNormalization normalization = (data[1] & 2)
        ? VelocityNormalization::UnitSpeed
        : VelocityNormalization::AsGiven;

    uint16_t raw_steps{};
    std::memcpy(&raw_steps, data + 2, sizeof(raw_steps));
    const int steps = raw_steps % 1024;

    double values[6];
    std::memcpy(values, data + HEADER_BYTES, DOUBLE_BYTES);

    const GeodesicState initial{ParameterPoint(values[0], values[1]),
                                Velocity2D(values[2], values[3])};

    // ── Test 1: batch solve ──────────────────────────────────────────────────
    GeodesicSolver solver(preset->surface);
    const SolveResult result = solver.solve(initial, SolveConfig{
        .dt            = values[4],
        .max_steps     = steps,
        .max_length    = values[5],
        .integrator    = integrator,
        .normalization = normalization,
    });

    assert(result.steps_taken <= steps);
    assert(result.path.size() == static_cast<size_t>(result.steps_taken) + 1);
    assert(result.path.front().cwiseEqual(initial.position).all()
           || !initial.position.allFinite());

    // ── Test 2: animation ticks with a bounded point budget ──────────────────
    animation::Animator anim(preset->surface, animation::AnimatorConfig{
        .integrator         = integrator,
        .substeps_per_frame = 1 + steps % 16,
        .speed              = 1.0,
        .max_points         = 64,
        .normalization      = normalization,
    });
    anim.reset(initial.position, initial.velocity);
    for (int frame = 0; frame < 8 && anim.running(); ++frame) {
        anim.tick(values[4]);
    }
    assert(anim.path().size() <= 64);

    return 0;
}
