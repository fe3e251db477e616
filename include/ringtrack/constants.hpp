#pragma once

#include <cstddef>

/// @file include/ringtrack/constants.hpp
/// @brief Physical constants and numerical defaults for ringtrack.

namespace ringtrack::constants {

// ─── Physics ──────────────────────────────────────────────────────────────────

/// Speed of light in vacuum [m/s].
static constexpr double C_LIGHT = 299792458.0;

static constexpr double PI     = 3.14159265358979323846;
static constexpr double TWO_PI = 2.0 * PI;

// ─── Element Defaults ─────────────────────────────────────────────────────────

/// Default number of integration steps for thick multipoles.
static constexpr int DEFAULT_NUM_INT_STEPS = 10;

/// Harmonic number assumed when a lattice file does not provide one.
static constexpr int DEFAULT_HARMONIC_NUMBER = 31;

/// Upper bound on the number of elements one expanded lattice line may hold.
static constexpr std::size_t MAX_LINE_ELEMENTS = 1'000'000;

// ─── Closed-Orbit Search ──────────────────────────────────────────────────────

/// Finite-difference step for the Jacobian of the one-turn map.
static constexpr double ORBIT_STEP = 1e-6;

/// Upper bound on Newton iterations in find_orbit4.
static constexpr int ORBIT_MAX_ITERATIONS = 20;

/// Newton iteration stops once the correction norm falls to this value.
static constexpr double ORBIT_CONVERGENCE = 1e-12;

// ─── Linear Optics ────────────────────────────────────────────────────────────

/// Default differentiation step for find_m44.
static constexpr double XY_DEFAULT_STEP = 6.055454452393343e-6;

/// Momentum step for chromaticity and dispersion.
static constexpr double DEFAULT_DDP = 1e-8;

/// Amplitude of the identity bunch tracked by m66.
static constexpr double M66_EPSILON = 1e-10;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

/// Below this magnitude a focusing strength is treated as zero.
static constexpr double STRENGTH_EPSILON = 1e-12;

} // namespace ringtrack::constants
