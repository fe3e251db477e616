#pragma once

/// @file include/ringtrack/lattice.hpp
/// @brief Ordered element sequence with ring parameters.
///
/// # Module: Lattice
///
/// ## Responsibility
/// Holds the elements of a ring in beam order together with the parameters
/// shared by all of them: beam energy, periodicity, harmonic number. Also
/// provides the observation-point ("refpts") helpers used by tracking and
/// optics.
///
/// ## Guarantees
/// - Elements are owned by value; references obtained through `operator[]`
///   stay valid until the lattice is resized
/// - Refpts returned by `normalize_refpts` are sorted, unique and in
///   `[0, size()]`

#include "ringtrack/element.hpp"
#include "ringtrack/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack {

// ─── LatticeParams ────────────────────────────────────────────────────────────

/// Ring parameters supplied alongside the element list.
///
/// Missing values are looked up in the first RingParam element, then fall
/// back to the defaults below.
struct LatticeParams {
    std::string           name;                 ///< Lattice name (e.g. line key)
    std::optional<double> energy;               ///< Beam energy [eV]
    std::optional<long>   periodicity;          ///< Number of superperiods
    std::optional<long>   harmonic_number;      ///< RF harmonic number
    std::string           source;               ///< File the lattice came from
};

// ─── Lattice ──────────────────────────────────────────────────────────────────

class Lattice {
public:
    Lattice() = default;

    /// Build from elements and parameters.
    explicit Lattice(std::vector<Element> elements, LatticeParams params = {});

    // ── Element access ───────────────────────────────────────────────────────

    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] Element&       operator[](std::size_t i) { return elements_[i]; }
    [[nodiscard]] const Element& operator[](std::size_t i) const { return elements_[i]; }

    [[nodiscard]] auto begin() noexcept { return elements_.begin(); }
    [[nodiscard]] auto end() noexcept { return elements_.end(); }
    [[nodiscard]] auto begin() const noexcept { return elements_.begin(); }
    [[nodiscard]] auto end() const noexcept { return elements_.end(); }

    [[nodiscard]] const std::vector<Element>& elements() const noexcept { return elements_; }

    void push_back(Element e) { elements_.push_back(std::move(e)); }

    // ── Ring parameters ──────────────────────────────────────────────────────

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

    /// Beam energy [eV]; 0 when unknown.
    [[nodiscard]] double energy() const noexcept { return energy_; }
    void set_energy(double energy) noexcept { energy_ = energy; }

    [[nodiscard]] long periodicity() const noexcept { return periodicity_; }
    [[nodiscard]] long harmonic_number() const noexcept { return harmonic_number_; }

    /// Sum of element lengths [m]. Elements with an erased length count as 0.
    [[nodiscard]] double circumference() const noexcept;

    // ── Positions ────────────────────────────────────────────────────────────

    /// Longitudinal position of each refpt: sum of the lengths of the
    /// elements before it.
    ///
    /// # Throws
    /// `RefptsError` if a refpt is out of range or the refpts are not sorted.
    [[nodiscard]] std::vector<double> get_s_pos(const Refpts& refpts) const;

    /// Indices of elements whose family name equals `fam_name`.
    [[nodiscard]] Refpts find_family(std::string_view fam_name) const;

    /// Multi-line summary: parameters then one `repr` per element.
    [[nodiscard]] std::string to_string() const;

private:
    std::vector<Element> elements_;
    std::string          name_;
    std::string          source_;
    double               energy_          = 0.0;
    long                 periodicity_     = 1;
    long                 harmonic_number_ = 0;
};

// ─── Refpts helpers ───────────────────────────────────────────────────────────

/// Validate refpts against a lattice of `n` elements.
///
/// # Throws
/// `RefptsError` if any index exceeds `n` or the list is not strictly
/// increasing.
[[nodiscard]] Refpts normalize_refpts(const Refpts& refpts, std::size_t n);

/// Convert a boolean mask (length `n` or `n + 1`) to refpts.
///
/// # Throws
/// `RefptsError` if the mask has any other length.
[[nodiscard]] Refpts refpts_from_mask(const std::vector<bool>& mask, std::size_t n);

/// Every position from 0 to `n` inclusive.
[[nodiscard]] Refpts all_refpts(std::size_t n);

} // namespace ringtrack
