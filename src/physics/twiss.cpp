/// @file src/physics/twiss.cpp
/// @brief Twiss parameters, tunes and chromaticity.

#include "optics.hpp"

#include <cmath>
#include <limits>

namespace ringtrack {

namespace {

/// α, β, μ of one plane at every position.
struct PlaneTwiss {
    std::vector<double> alpha;
    std::vector<double> beta;
    std::vector<double> mu;
};

/// Propagate the periodic solution of the one-turn 2×2 matrix `mat` through
/// the cumulative matrices `ms`.
///
/// # Returns
/// `std::nullopt` if the plane is unstable (|cos μ| ≥ 1).
std::optional<PlaneTwiss> twiss22(const Eigen::Matrix2d& mat,
                                  const std::vector<Eigen::Matrix2d>& ms) {
    const double half_diff = (mat(0, 0) - mat(1, 1)) / 2.0;
    const double sin2_mu = -mat(0, 1) * mat(1, 0) - half_diff * half_diff;
    if (!(sin2_mu > 0.0)) return std::nullopt;

    const double sin_mu = std::copysign(std::sqrt(sin2_mu), mat(0, 1));
    const double alpha0 = half_diff / sin_mu;
    const double beta0 = mat(0, 1) / sin_mu;

    PlaneTwiss out;
    out.alpha.reserve(ms.size());
    out.beta.reserve(ms.size());
    out.mu.reserve(ms.size());
    for (const auto& m : ms) {
        const double a = m(0, 0) * beta0 - m(0, 1) * alpha0;
        const double c = m(1, 0) * beta0 - m(1, 1) * alpha0;
        out.beta.push_back((a * a + m(0, 1) * m(0, 1)) / beta0);
        out.alpha.push_back(-(a * c + m(0, 1) * m(1, 1)) / beta0);
        out.mu.push_back(std::atan(m(0, 1) / a));
    }
    out.mu = betatron_phase_unwrap(out.mu);
    return out;
}

std::optional<TwissResult> twiss_impl(Tracker& tracker, double dp, const Refpts& requested,
                                      bool get_chrom, const OpticsConfig& config) {
    const Lattice& ring = tracker.lattice();
    // Phases are unwrapped over every position so that no half-turn jump
    // between two requested refpts goes unnoticed.
    const Refpts all = all_refpts(ring.size());

    const auto orbit = detail::find_orbit4(tracker, dp, all, config);
    if (!orbit) return std::nullopt;
    const auto matrices = detail::find_m44(tracker, dp, all, orbit->orbit, config);
    if (!matrices) return std::nullopt;

    std::vector<Eigen::Matrix2d> msx;
    std::vector<Eigen::Matrix2d> msy;
    msx.reserve(all.size());
    msy.reserve(all.size());
    for (const auto& m : matrices->stack) {
        msx.emplace_back(m.topLeftCorner<2, 2>());
        msy.emplace_back(m.bottomRightCorner<2, 2>());
    }
    const auto px = twiss22(matrices->m44.topLeftCorner<2, 2>(), msx);
    const auto py = twiss22(matrices->m44.bottomRightCorner<2, 2>(), msy);
    if (!px || !py) return std::nullopt;

    const std::vector<double> s_pos = ring.get_s_pos(all);

    TwissResult result;
    result.tune = Eigen::Vector2d(px->mu.back(), py->mu.back()) / constants::TWO_PI;
    result.twiss.reserve(requested.size());
    for (std::size_t idx : requested) {
        TwissData d;
        d.idx = idx;
        d.s_pos = s_pos[idx];
        d.closed_orbit = orbit->at_refpts[idx];
        d.dispersion = Vector4::Constant(std::numeric_limits<double>::quiet_NaN());
        d.alpha = Eigen::Vector2d(px->alpha[idx], py->alpha[idx]);
        d.beta = Eigen::Vector2d(px->beta[idx], py->beta[idx]);
        d.mu = Eigen::Vector2d(px->mu[idx], py->mu[idx]);
        d.m44 = matrices->stack[idx];
        result.twiss.push_back(d);
    }

    if (get_chrom) {
        const auto shifted = twiss_impl(tracker, dp + config.ddp, requested, false, config);
        if (!shifted) return std::nullopt;
        result.chromaticity = Eigen::Vector2d((shifted->tune - result.tune) / config.ddp);
        for (std::size_t i = 0; i < result.twiss.size(); ++i) {
            result.twiss[i].dispersion =
                (shifted->twiss[i].closed_orbit - result.twiss[i].closed_orbit) / config.ddp;
        }
    }
    return result;
}

} // namespace

std::vector<double> betatron_phase_unwrap(const std::vector<double>& mu) {
    std::vector<double> out(mu);
    double offset = 0.0;
    for (std::size_t i = 1; i < mu.size(); ++i) {
        if (mu[i] - mu[i - 1] < 0.0) offset += constants::PI;
        out[i] += offset;
    }
    return out;
}

std::optional<TwissResult>
get_twiss(const Lattice& ring, double dp, const std::optional<Refpts>& refpts,
          bool get_chrom, const OpticsConfig& config) {
    const Refpts requested = normalize_refpts(refpts.value_or(all_refpts(ring.size())),
                                              ring.size());
    Tracker tracker(ring, TrackingConfig{config.verbose});
    tracker.prepare();
    return twiss_impl(tracker, dp, requested, get_chrom, config);
}

} // namespace ringtrack
