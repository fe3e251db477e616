#pragma once

/// @file src/physics/optics.hpp
/// @brief Tracker-based optics routines shared by orbit.cpp and twiss.cpp.
///
/// The public functions in include/ringtrack/physics.hpp build one Tracker
/// and hand it to these, so that a Twiss computation prepares the lattice
/// once for the orbit search, the matrices and the chromaticity pass.

#include "ringtrack/physics.hpp"

namespace ringtrack::detail {

/// Closed orbit using an already prepared tracker.
[[nodiscard]] std::optional<OrbitResult>
find_orbit4(Tracker& tracker, double dp, const Refpts& refpts, const OpticsConfig& config);

/// Transfer matrices around `orbit4` using an already prepared tracker.
[[nodiscard]] std::optional<M44Result>
find_m44(Tracker& tracker, double dp, const Refpts& refpts,
         const Vector4& orbit4, const OpticsConfig& config);

} // namespace ringtrack::detail
