#pragma once

/// @file include/ringtrack/physics.hpp
/// @brief Linear optics from tracking: closed orbit, transfer matrices, Twiss.
///
/// # Module: Physics
///
/// ## Responsibility
/// Derive the linear optics of a ring numerically, by tracking small
/// offsets around the 4-D closed orbit:
///
///   - `find_orbit4`: Newton iteration on the one-turn map at fixed δ
///   - `find_m44`:    central-difference 4×4 transfer matrices
///   - `get_twiss`:   α, β, μ per plane, tunes, chromaticity, dispersion
///   - `m66`:         6×6 one-turn matrix around the origin
///
/// ## Guarantees
/// - Numerical failure (lost particles, non-finite solves, unstable
///   planes) is reported as `std::nullopt`, never by an exception
/// - Results at refpts come back in refpt order
///
/// ## NOT Responsible For
/// - Radiation, 6-D closed orbit, coupled optics

#include "ringtrack/constants.hpp"
#include "ringtrack/lattice.hpp"
#include "ringtrack/tracking.hpp"
#include "ringtrack/types.hpp"

#include <Eigen/Dense>

#include <optional>
#include <vector>

namespace ringtrack {

// ─── Configuration ────────────────────────────────────────────────────────────

/// Numerical parameters of the optics routines.
struct OpticsConfig {
    double orbit_step           = constants::ORBIT_STEP;
    int    orbit_max_iterations = constants::ORBIT_MAX_ITERATIONS;
    double orbit_convergence    = constants::ORBIT_CONVERGENCE;
    double xy_step              = constants::XY_DEFAULT_STEP;   ///< find_m44 differentiation step
    double ddp                  = constants::DEFAULT_DDP;       ///< chromaticity momentum step
    bool   verbose              = false;
};

// ─── Results ──────────────────────────────────────────────────────────────────

struct OrbitResult {
    Vector4              orbit;        ///< Closed orbit at the lattice entrance
    std::vector<Vector4> at_refpts;    ///< Closed orbit at each refpt
    int                  iterations = 0;
};

struct M44Result {
    Matrix44              m44;         ///< One-turn matrix
    std::vector<Matrix44> stack;       ///< Cumulative matrix at each refpt
};

/// Twiss parameters at one refpt.
struct TwissData {
    std::size_t     idx = 0;
    double          s_pos = 0.0;
    Vector4         closed_orbit;
    Vector4         dispersion;        ///< NaN unless chromaticity was requested
    Eigen::Vector2d alpha;
    Eigen::Vector2d beta;
    Eigen::Vector2d mu;                ///< Unwrapped betatron phase [rad]
    Matrix44        m44;               ///< Transfer matrix from the entrance
};

struct TwissResult {
    std::vector<TwissData>         twiss;
    Eigen::Vector2d                tune;
    std::optional<Eigen::Vector2d> chromaticity;
};

// ─── Operations ───────────────────────────────────────────────────────────────

/// 4-D closed orbit at constant momentum deviation `dp`.
///
/// # Returns
/// `std::nullopt` if a tracked particle is lost or the correction is not
/// finite.
///
/// # Throws
/// Structural errors from preparing the lattice (`TrackingError`,
/// `RefptsError`).
[[nodiscard]] std::optional<OrbitResult>
find_orbit4(const Lattice& ring, double dp = 0.0, const Refpts& refpts = {},
            const OpticsConfig& config = {});

/// One-turn 4×4 matrix and cumulative matrices at `refpts`.
///
/// The closed orbit is searched first unless `orbit4` is given.
[[nodiscard]] std::optional<M44Result>
find_m44(const Lattice& ring, double dp = 0.0, const Refpts& refpts = {},
         const std::optional<Vector4>& orbit4 = std::nullopt,
         const OpticsConfig& config = {});

/// Add π after every negative jump of a phase advance computed with atan.
[[nodiscard]] std::vector<double> betatron_phase_unwrap(const std::vector<double>& mu);

/// Twiss parameters at `refpts` (all positions by default).
///
/// # Returns
/// `std::nullopt` if the closed orbit is not found or either plane is
/// unstable.
[[nodiscard]] std::optional<TwissResult>
get_twiss(const Lattice& ring, double dp = 0.0,
          const std::optional<Refpts>& refpts = std::nullopt,
          bool get_chrom = false, const OpticsConfig& config = {});

/// 6×6 one-turn matrix: column j is the image of the unit offset along j.
///
/// # Returns
/// `std::nullopt` if a tracked particle is lost.
[[nodiscard]] std::optional<Matrix66> m66(const Lattice& ring);

} // namespace ringtrack
