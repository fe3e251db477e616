/**
 * @file  bench/bench_tracking.cpp
 * @brief Google Benchmark suite for ringtrack tracking and optics.
 *
 * Benchmarks
 * ----------
 *   BM_LatticePass_Linear        QuadLinearPass FODO ring, N particles
 *   BM_LatticePass_Symplectic    same ring with StrMPoleSymplectic4Pass quads
 *   BM_Atpass_Refpts             observation at every element, reuse on
 *   BM_Prepare                   pass-method lookup and kernel construction
 *   BM_FindOrbit4                closed orbit of a steered ring
 *   BM_GetTwiss                  linear optics at all elements, with chromaticity
 *
 * Build (CMake):
 *   cmake -DRINGTRACK_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_tracking
 *   ./build/bench_tracking --benchmark_format=json
 *
 * Throughput units: items/second (particle-element passes).
 */

#include "benchmark/benchmark.h"

#include "ringtrack/element.hpp"
#include "ringtrack/lattice.hpp"
#include "ringtrack/physics.hpp"
#include "ringtrack/tracking.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace ringtrack;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// FODO ring of `cells` cells; `method` overrides the quadrupole pass method.
static Lattice make_ring(int cells, const std::string& method = {}) {
    Attributes quad_extra;
    if (!method.empty()) {
        quad_extra.emplace("PassMethod", method);
        quad_extra.emplace("NumIntSteps", 10L);
    }
    std::vector<Element> elems;
    for (int i = 0; i < cells; ++i) {
        elems.push_back(elements::quadrupole("qf", 0.5, 1.2, quad_extra));
        elems.push_back(elements::drift("d", 2.0));
        elems.push_back(elements::quadrupole("qd", 0.5, -1.2, quad_extra));
        elems.push_back(elements::drift("d", 2.0));
        elems.push_back(elements::monitor("bpm"));
    }
    return Lattice(std::move(elems), LatticeParams{"bench", 3e9, 1, 100, {}});
}

/// N particles spread over a small transverse box.
static ParticleMatrix make_bunch(std::size_t n) {
    ParticleMatrix r = ParticleMatrix::Zero(NUM_COORDS, static_cast<Eigen::Index>(n));
    for (std::size_t i = 0; i < n; ++i) {
        const double f = static_cast<double>(i) / static_cast<double>(n > 1 ? n - 1 : 1);
        r(X, static_cast<Eigen::Index>(i)) = 1e-4 * (2.0 * f - 1.0);
        r(Y, static_cast<Eigen::Index>(i)) = 5e-5 * (1.0 - 2.0 * f);
        r(DELTA, static_cast<Eigen::Index>(i)) = 1e-4 * f;
    }
    return r;
}

// ── Tracking ───────────────────────────────────────────────────────────────────

static void BM_LatticePass_Linear(benchmark::State& state) {
    const Lattice ring = make_ring(16);
    const auto n = static_cast<std::size_t>(state.range(0));
    Tracker tracker(ring);
    tracker.prepare();
    ParticleMatrix r = make_bunch(n);
    for (auto _ : state) {
        tracker.lattice_pass(r, 1, std::nullopt, true);
        benchmark::DoNotOptimize(r.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(n * ring.size()));
}
BENCHMARK(BM_LatticePass_Linear)->RangeMultiplier(8)->Range(1, 4096)->Unit(benchmark::kMicrosecond);

static void BM_LatticePass_Symplectic(benchmark::State& state) {
    const Lattice ring = make_ring(16, "StrMPoleSymplectic4Pass");
    const auto n = static_cast<std::size_t>(state.range(0));
    Tracker tracker(ring);
    tracker.prepare();
    ParticleMatrix r = make_bunch(n);
    for (auto _ : state) {
        tracker.lattice_pass(r, 1, std::nullopt, true);
        benchmark::DoNotOptimize(r.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(n * ring.size()));
}
BENCHMARK(BM_LatticePass_Symplectic)->RangeMultiplier(8)->Range(1, 4096)->Unit(benchmark::kMicrosecond);

static void BM_Atpass_Refpts(benchmark::State& state) {
    const Lattice ring = make_ring(16);
    const Refpts refpts = all_refpts(ring.size());
    Tracker tracker(ring);
    tracker.prepare();
    ParticleMatrix r = make_bunch(64);
    for (auto _ : state) {
        auto obs = tracker.atpass(r, 4, refpts, true);
        benchmark::DoNotOptimize(obs.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * 4 * 64
                            * static_cast<int64_t>(ring.size()));
}
BENCHMARK(BM_Atpass_Refpts)->Unit(benchmark::kMicrosecond);

static void BM_Prepare(benchmark::State& state) {
    const Lattice ring = make_ring(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        Tracker tracker(ring);
        tracker.prepare();
        benchmark::DoNotOptimize(tracker.prepared());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations())
                            * static_cast<int64_t>(ring.size()));
}
BENCHMARK(BM_Prepare)->RangeMultiplier(4)->Range(4, 256)->Unit(benchmark::kMicrosecond);

// ── Optics ─────────────────────────────────────────────────────────────────────

static void BM_FindOrbit4(benchmark::State& state) {
    std::vector<Element> elems = make_ring(16).elements();
    elems.insert(elems.begin() + 1,
                 elements::corrector("hcm", 0.0, Eigen::Vector2d(1e-4, -5e-5)));
    const Lattice ring(std::move(elems));
    for (auto _ : state) {
        auto orbit = find_orbit4(ring);
        benchmark::DoNotOptimize(orbit);
    }
}
BENCHMARK(BM_FindOrbit4)->Unit(benchmark::kMicrosecond);

static void BM_GetTwiss(benchmark::State& state) {
    const Lattice ring = make_ring(16);
    const Refpts refpts = all_refpts(ring.size());
    for (auto _ : state) {
        auto twiss = get_twiss(ring, 0.0, refpts, true);
        benchmark::DoNotOptimize(twiss);
    }
}
BENCHMARK(BM_GetTwiss)->Unit(benchmark::kMicrosecond);
