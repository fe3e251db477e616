#pragma once

/// @file include/ringtrack/tracking.hpp
/// @brief Multi-particle, multi-turn tracking through a lattice.
///
/// # Module: Tracking
///
/// ## Responsibility
/// Carry a bunch of particles (one column of a ParticleMatrix each) around
/// the ring for a number of turns, recording coordinates at observation
/// points.
///
/// ## Guarantees
/// - Particles are tracked in place
/// - Observations are taken *before* the element at each refpt; refpt
///   `lattice.size()` is the exit of the lattice
/// - With `reuse`/`keep_lattice` set, the kernels prepared by an earlier
///   call are used as they are, even if element attributes changed since
///
/// ## NOT Responsible For
/// - Closed orbits and optics (see include/ringtrack/physics.hpp)

#include "ringtrack/lattice.hpp"
#include "ringtrack/pass_method.hpp"
#include "ringtrack/types.hpp"

#include <optional>
#include <vector>

namespace ringtrack {

/// Tracking options.
struct TrackingConfig {
    bool verbose = false;   ///< Report preparation and turn counts on stderr
};

/// Recorded coordinates, indexed `[turn][refpt]`; each entry is 6×N.
using Observations = std::vector<std::vector<ParticleMatrix>>;

// ─── Tracker ──────────────────────────────────────────────────────────────────

/// Holds the prepared kernels of one lattice between tracking calls.
///
/// The lattice is referenced, not copied: it must outlive the tracker.
class Tracker {
public:
    explicit Tracker(const Lattice& lattice,
                     TrackingConfig config = {},
                     const PassMethodRegistry& registry = PassMethodRegistry::instance());

    /// (Re)prepare every element from its current attributes.
    ///
    /// # Throws
    /// `TrackingError` naming the offending element if any kernel cannot
    /// be prepared.
    void prepare();

    /// True once `prepare` has succeeded.
    [[nodiscard]] bool prepared() const noexcept { return ready_; }

    /// Track `particles` for `nturns` turns, recording at `refpts`.
    ///
    /// # Arguments
    /// * `particles` - 6×N matrix, updated in place
    /// * `nturns`    - number of turns, ≥ 0
    /// * `refpts`    - observation points (may be empty)
    /// * `reuse`     - keep the kernels of an earlier call
    ///
    /// # Throws
    /// `TrackingError` if `nturns` is negative or preparation fails;
    /// `RefptsError` for invalid refpts.
    Observations atpass(ParticleMatrix& particles, int nturns,
                        const Refpts& refpts, bool reuse = false);

    /// As `atpass`, with refpts defaulting to the lattice exit.
    Observations lattice_pass(ParticleMatrix& particles,
                              int nturns = 1,
                              const std::optional<Refpts>& refpts = std::nullopt,
                              bool keep_lattice = false);

    /// Track one full turn without observations (prepares on first use).
    void track_turn(ParticleMatrix& particles);

    [[nodiscard]] const Lattice& lattice() const noexcept { return *lattice_; }

private:
    const Lattice*               lattice_;
    TrackingConfig               config_;
    const PassMethodRegistry*    registry_;
    std::vector<PreparedElement> prepared_;
    bool                         ready_ = false;
};

// ─── Free functions ───────────────────────────────────────────────────────────

/// One-shot tracking with freshly prepared kernels.
Observations atpass(const Lattice& lattice, ParticleMatrix& particles,
                    int nturns, const Refpts& refpts = {});

/// One-shot tracking with refpts defaulting to the lattice exit.
Observations lattice_pass(const Lattice& lattice, ParticleMatrix& particles,
                          int nturns = 1,
                          const std::optional<Refpts>& refpts = std::nullopt);

} // namespace ringtrack
