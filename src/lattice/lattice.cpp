/// @file src/lattice/lattice.cpp
/// @brief Lattice container and refpts helpers.

#include "ringtrack/lattice.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace ringtrack {

namespace {

const Element* first_ring_param(const std::vector<Element>& elements) noexcept {
    auto it = std::find_if(elements.begin(), elements.end(), [](const Element& e) {
        return e.kind() == ElementKind::RingParam;
    });
    return it == elements.end() ? nullptr : &*it;
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

Lattice::Lattice(std::vector<Element> elements, LatticeParams params)
    : elements_(std::move(elements))
    , name_(std::move(params.name))
    , source_(std::move(params.source))
{
    const Element* rp = first_ring_param(elements_);

    if (params.energy) {
        energy_ = *params.energy;
    } else if (rp && rp->has("Energy")) {
        energy_ = rp->real("Energy");
    } else {
        // Any element carrying an energy (typically a cavity) will do.
        for (const auto& e : elements_) {
            if (e.has("Energy")) {
                energy_ = e.real("Energy");
                break;
            }
        }
    }

    if (params.periodicity) {
        periodicity_ = *params.periodicity;
    } else if (rp && rp->has("Periodicity")) {
        periodicity_ = rp->integer("Periodicity");
    }

    if (params.harmonic_number) {
        harmonic_number_ = *params.harmonic_number;
    } else {
        for (const auto& e : elements_) {
            if (e.kind() == ElementKind::RFCavity && e.has("HarmNumber")) {
                harmonic_number_ = e.integer("HarmNumber");
                break;
            }
        }
    }
}

// ─── Geometry ─────────────────────────────────────────────────────────────────

double Lattice::circumference() const noexcept {
    double s = 0.0;
    for (const auto& e : elements_) {
        if (e.has_length()) s += e.length();
    }
    return s;
}

std::vector<double> Lattice::get_s_pos(const Refpts& refpts) const {
    const Refpts checked = normalize_refpts(refpts, elements_.size());

    std::vector<double> s_pos;
    s_pos.reserve(checked.size());

    double s = 0.0;
    std::size_t next = 0;
    for (std::size_t i = 0; i <= elements_.size() && next < checked.size(); ++i) {
        if (checked[next] == i) {
            s_pos.push_back(s);
            ++next;
        }
        if (i < elements_.size() && elements_[i].has_length()) {
            s += elements_[i].length();
        }
    }
    return s_pos;
}

Refpts Lattice::find_family(std::string_view fam_name) const {
    Refpts out;
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (elements_[i].fam_name() == fam_name) out.push_back(i);
    }
    return out;
}

std::string Lattice::to_string() const {
    std::string out = fmt::format(
        "Lattice '{}': {} elements, {:.6f} m, energy={} eV, periodicity={}, harmonic_number={}",
        name_, elements_.size(), circumference(), energy_, periodicity_, harmonic_number_);
    for (const auto& e : elements_) {
        out += '\n';
        out += e.repr();
    }
    return out;
}

// ─── Refpts helpers ───────────────────────────────────────────────────────────

Refpts normalize_refpts(const Refpts& refpts, std::size_t n) {
    for (std::size_t i = 0; i < refpts.size(); ++i) {
        if (refpts[i] > n) {
            throw RefptsError(fmt::format(
                "refpts {} out of range for a lattice of {} elements", refpts[i], n));
        }
        if (i > 0 && refpts[i] <= refpts[i - 1]) {
            throw RefptsError("refpts must be strictly increasing");
        }
    }
    return refpts;
}

Refpts refpts_from_mask(const std::vector<bool>& mask, std::size_t n) {
    if (mask.size() != n && mask.size() != n + 1) {
        throw RefptsError(fmt::format(
            "boolean refpts must have length {} or {}, got {}", n, n + 1, mask.size()));
    }
    Refpts out;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) out.push_back(i);
    }
    return out;
}

Refpts all_refpts(std::size_t n) {
    Refpts out(n + 1);
    for (std::size_t i = 0; i <= n; ++i) out[i] = i;
    return out;
}

} // namespace ringtrack
