/**
 * @file  fuzz_cli.cpp
 * @brief libFuzzer target for cli::parse_cli
 *
 * Build:
 *   cmake -DGEOSURF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_cli
 *
 * Safety invariants verified on every input:
 *   1. Never throws and never crashes on arbitrary argument vectors.
 *   2. Any accepted batch / animate configuration names a known preset
 *      (or carries formulas whose parameters it resolves), has dt > 0 and
 *      a step budget within [0, MAX_STEP_COUNT].
 *   3. An accepted animation runs at most MAX_STEP_COUNT integration steps.
 *
 * Fuzzer strategy:
 *   Input is split on NUL bytes into argv entries.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "geosurf/cli.hpp"

using namespace geosurf;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::vector<std::string> args;
    std::string current;
    for (size_t i = 0; i < size; ++i) {
        if (data[i] == '\0') {
            args.push_back(current);
            current.clear();
        } else {
            current.push_back(static_cast<char>(data[i]));
        }
    }
    if (!current.empty()) args.push_back(current);

    const auto opts = cli::parse_cli(args);
    if (!opts) return 0;

    if (opts->mode == cli::RunMode::Batch || opts->mode == cli::RunMode::Animate) {
        if (opts->formulas) {
            assert(resolve_parameters(*opts->formulas, opts->parameters).has_value());
        } else {
            assert(find_preset(opts->preset, opts->parameters).has_value());
        }
        assert(opts->solve.dt > 0.0);
        assert(opts->solve.max_steps >= 0);
        assert(opts->solve.max_steps <= constants::MAX_STEP_COUNT);
        assert(opts->substeps >= 1);
    }
    if (opts->mode == cli::RunMode::Animate) {
        assert(static_cast<long long>(opts->frames) * opts->substeps
               <= constants::MAX_STEP_COUNT);
    }

    return 0;
}
