/// @file src/tracking/tracker.cpp
/// @brief Turn loop, observation points and kernel reuse.

#include "ringtrack/tracking.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

namespace ringtrack {

namespace {

/// Cavities without their own Energy take the lattice energy.
std::optional<Element> with_ring_energy(const Element& e, double energy) {
    if (energy <= 0.0 || e.has("Energy") || !e.has_pass_method()) return std::nullopt;
    if (e.pass_method() != "CavityPass") return std::nullopt;
    Element copy = e;
    copy.set("Energy", energy);
    return copy;
}

} // namespace

Tracker::Tracker(const Lattice& lattice, TrackingConfig config, const PassMethodRegistry& registry)
    : lattice_(&lattice), config_(config), registry_(&registry) {}

void Tracker::prepare() {
    ready_ = false;
    std::vector<PreparedElement> prepared;
    prepared.reserve(lattice_->size());
    for (std::size_t i = 0; i < lattice_->size(); ++i) {
        const Element& elem = (*lattice_)[i];
        try {
            if (auto filled = with_ring_energy(elem, lattice_->energy())) {
                prepared.emplace_back(*filled, *registry_);
            } else {
                prepared.emplace_back(elem, *registry_);
            }
        } catch (const ElementError& e) {
            throw TrackingError(fmt::format("Element {} ({}): {}", i, elem.fam_name(), e.what()));
        }
    }
    prepared_ = std::move(prepared);
    ready_ = true;
    if (config_.verbose) {
        fmt::print(stderr, "[ringtrack] prepared {} elements of lattice '{}'\n",
                   prepared_.size(), lattice_->name());
    }
}

Observations Tracker::atpass(ParticleMatrix& particles, int nturns,
                             const Refpts& refpts, bool reuse) {
    if (nturns < 0) {
        throw TrackingError(fmt::format("Number of turns must be non-negative, got {}", nturns));
    }
    const Refpts points = normalize_refpts(refpts, lattice_->size());
    if (!reuse || !ready_ || prepared_.size() != lattice_->size()) prepare();

    Observations obs;
    obs.reserve(static_cast<std::size_t>(nturns));
    for (int turn = 0; turn < nturns; ++turn) {
        std::vector<ParticleMatrix> at_refpts;
        at_refpts.reserve(points.size());
        auto next = points.begin();
        for (std::size_t i = 0; i < prepared_.size(); ++i) {
            if (next != points.end() && *next == i) {
                at_refpts.push_back(particles);
                ++next;
            }
            prepared_[i].pass(particles);
        }
        if (next != points.end()) at_refpts.push_back(particles);
        obs.push_back(std::move(at_refpts));
    }
    if (config_.verbose) {
        fmt::print(stderr, "[ringtrack] tracked {} particles for {} turns\n",
                   particles.cols(), nturns);
    }
    return obs;
}

Observations Tracker::lattice_pass(ParticleMatrix& particles, int nturns,
                                   const std::optional<Refpts>& refpts, bool keep_lattice) {
    return atpass(particles, nturns, refpts.value_or(Refpts{lattice_->size()}), keep_lattice);
}

void Tracker::track_turn(ParticleMatrix& particles) {
    if (!ready_) prepare();
    for (const auto& elem : prepared_) elem.pass(particles);
}

Observations atpass(const Lattice& lattice, ParticleMatrix& particles,
                    int nturns, const Refpts& refpts) {
    Tracker tracker(lattice);
    return tracker.atpass(particles, nturns, refpts);
}

Observations lattice_pass(const Lattice& lattice, ParticleMatrix& particles,
                          int nturns, const std::optional<Refpts>& refpts) {
    Tracker tracker(lattice);
    return tracker.lattice_pass(particles, nturns, refpts);
}

} // namespace ringtrack
