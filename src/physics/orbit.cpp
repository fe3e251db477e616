/// @file src/physics/orbit.cpp
/// @brief Closed-orbit search, 4×4 transfer matrices and the 6×6 one-turn map.

#include "optics.hpp"

#include <fmt/format.h>

namespace ringtrack {

namespace detail {

// ─── find_orbit4 ──────────────────────────────────────────────────────────────
//
// Fixed point of the one-turn map f at constant δ, by Newton iteration on
// g(r) = f(r) - r:
//   r_{n+1} = r_n - (J - I)⁺ (f(r_n) - r_n)
// with the Jacobian J from forward differences and (J - I)⁺ applied as a
// least-squares solve.

std::optional<OrbitResult>
find_orbit4(Tracker& tracker, double dp, const Refpts& refpts, const OpticsConfig& config) {
    const Refpts points = normalize_refpts(refpts, tracker.lattice().size());

    PhaseVector r_in = PhaseVector::Zero();
    r_in[DELTA] = dp;

    double change = 1.0;
    int iterations = 0;
    while (change > config.orbit_convergence && iterations < config.orbit_max_iterations) {
        ParticleMatrix offsets = r_in.replicate(1, 5);
        for (int i = 0; i < 4; ++i) offsets(i, i) += config.orbit_step;

        tracker.track_turn(offsets);
        if (!offsets.allFinite()) return std::nullopt;

        const Vector4 ref_out = offsets.block<4, 1>(0, 4);
        const Matrix44 jacobian =
            (offsets.topLeftCorner<4, 4>().colwise() - ref_out) / config.orbit_step;
        const Matrix44 a = jacobian - Matrix44::Identity();
        const Vector4 b = ref_out - r_in.head<4>();
        const Vector4 correction = a.completeOrthogonalDecomposition().solve(b);
        if (!correction.allFinite()) return std::nullopt;

        r_in.head<4>() -= correction;
        change = correction.norm();
        ++iterations;
    }
    if (config.verbose) {
        fmt::print(stderr, "[ringtrack] closed orbit after {} iterations, last step {:.3e}\n",
                   iterations, change);
    }

    OrbitResult result;
    result.orbit = r_in.head<4>();
    result.iterations = iterations;

    ParticleMatrix trial = r_in;
    const Observations obs = tracker.atpass(trial, 1, points, true);
    result.at_refpts.reserve(points.size());
    for (const auto& m : obs.front()) {
        if (!m.allFinite()) return std::nullopt;
        result.at_refpts.emplace_back(m.block<4, 1>(0, 0));
    }
    return result;
}

// ─── find_m44 ─────────────────────────────────────────────────────────────────
//
// Central differences: eight offsets at orbit ± step/2 along each transverse
// coordinate. The lattice exit is always tracked to get the one-turn matrix
// and dropped from the stack unless it was requested.

std::optional<M44Result>
find_m44(Tracker& tracker, double dp, const Refpts& refpts,
         const Vector4& orbit4, const OpticsConfig& config) {
    const std::size_t n = tracker.lattice().size();
    Refpts points = normalize_refpts(refpts, n);
    const bool last_requested = !points.empty() && points.back() == n;
    if (!last_requested) points.push_back(n);

    PhaseVector orbit6;
    orbit6 << orbit4, dp, 0.0;
    ParticleMatrix offsets = orbit6.replicate(1, 8);
    for (int i = 0; i < 4; ++i) {
        offsets(i, i)     += 0.5 * config.xy_step;
        offsets(i, i + 4) -= 0.5 * config.xy_step;
    }

    const Observations obs = tracker.atpass(offsets, 1, points, true);

    M44Result result;
    result.stack.reserve(points.size());
    for (const auto& m : obs.front()) {
        const Matrix44 mk = (m.block<4, 4>(0, 0) - m.block<4, 4>(0, 4)) / config.xy_step;
        if (!mk.allFinite()) return std::nullopt;
        result.stack.push_back(mk);
    }
    result.m44 = result.stack.back();
    if (!last_requested) result.stack.pop_back();
    return result;
}

} // namespace detail

// ─── Public entry points ──────────────────────────────────────────────────────

std::optional<OrbitResult>
find_orbit4(const Lattice& ring, double dp, const Refpts& refpts, const OpticsConfig& config) {
    Tracker tracker(ring, TrackingConfig{config.verbose});
    tracker.prepare();
    return detail::find_orbit4(tracker, dp, refpts, config);
}

std::optional<M44Result>
find_m44(const Lattice& ring, double dp, const Refpts& refpts,
         const std::optional<Vector4>& orbit4, const OpticsConfig& config) {
    Tracker tracker(ring, TrackingConfig{config.verbose});
    tracker.prepare();
    Vector4 orbit;
    if (orbit4) {
        orbit = *orbit4;
    } else {
        const auto found = detail::find_orbit4(tracker, dp, {}, config);
        if (!found) return std::nullopt;
        orbit = found->orbit;
    }
    return detail::find_m44(tracker, dp, refpts, orbit, config);
}

std::optional<Matrix66> m66(const Lattice& ring) {
    ParticleMatrix offsets = constants::M66_EPSILON * Matrix66::Identity();
    Tracker tracker(ring);
    tracker.track_turn(offsets);
    if (!offsets.allFinite()) return std::nullopt;
    return Matrix66(offsets / constants::M66_EPSILON);
}

} // namespace ringtrack
