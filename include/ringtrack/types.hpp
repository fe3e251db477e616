#pragma once

/// @file include/ringtrack/types.hpp
/// @brief Shared primitive types for the ringtrack tracking library.
///
/// Every module includes this file. It defines the phase-space layout and
/// the Eigen-based linear-algebra aliases used throughout the library.

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace ringtrack {

/// Number of phase-space coordinates per particle.
static constexpr int NUM_COORDS = 6;

// ─── Coordinate Layout ────────────────────────────────────────────────────────

/// Row index of each phase-space coordinate in a PhaseVector.
///
/// Layout: [x, px, y, py, δ, ct]
///   - px, py are transverse momenta normalised to the reference momentum
///   - δ is the relative momentum deviation
///   - ct is the path lengthening (positive for a longer path)
enum Coord : int {
    X     = 0,
    PX    = 1,
    Y     = 2,
    PY    = 3,
    DELTA = 4,
    CT    = 5,
};

// ─── Linear Algebra Aliases ───────────────────────────────────────────────────

/// Coordinates of a single particle.
using PhaseVector = Eigen::Vector<double, NUM_COORDS>;

/// A bunch of particles: one column per particle.
using ParticleMatrix = Eigen::Matrix<double, NUM_COORDS, Eigen::Dynamic>;

/// Full 6×6 transfer matrix.
using Matrix66 = Eigen::Matrix<double, NUM_COORDS, NUM_COORDS>;

/// Transverse (x, px, y, py) transfer matrix.
using Matrix44 = Eigen::Matrix4d;

/// Transverse (x, px, y, py) vector.
using Vector4 = Eigen::Vector4d;

/// Indices of lattice positions at which results are reported.
/// Index `i` means "at the entrance of element i"; index `size()` means
/// "at the exit of the lattice".
using Refpts = std::vector<std::size_t>;

} // namespace ringtrack
