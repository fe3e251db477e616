#pragma once

/// @file include/ringtrack/pass_method.hpp
/// @brief Pass-method kernels, their registry, and prepared elements.
///
/// # Module: Pass Methods
///
/// ## Responsibility
/// A *pass method* is the numerical map that carries a particle through one
/// element. Each element names its pass method; the registry turns that
/// name into a `PassKernel` that has already read every attribute it needs
/// ("preparation"). Preparation is the only place attributes are looked up,
/// so tracking many turns never touches the attribute map.
///
/// Built-in pass methods:
///
/// | name                    | map                                            |
/// |-------------------------|------------------------------------------------|
/// | IdentityPass            | none                                           |
/// | DriftPass               | exact field-free drift                         |
/// | AperturePass            | rectangular aperture (`Limits`)                |
/// | QuadLinearPass          | linear quadrupole                              |
/// | BendLinearPass          | linear sector dipole with edge focusing        |
/// | StrMPoleSymplectic4Pass | 4th-order symplectic straight multipole        |
/// | BndMPoleSymplectic4Pass | 4th-order symplectic curved multipole          |
/// | ThinMPolePass           | thin multipole kick                            |
/// | CorrectorPass           | thin or thick steering kick                    |
/// | CavityPass              | RF cavity energy kick                          |
/// | Matrix66Pass            | arbitrary 6×6 linear map                       |
///
/// ## Lost particles
/// A particle outside an aperture has its `x` set to +∞. Particles whose `x`
/// is not finite are left untouched by every later element.
///
/// ## NOT Responsible For
/// - Turn loops and observation points (see include/ringtrack/tracking.hpp)

#include "ringtrack/element.hpp"
#include "ringtrack/types.hpp"

#include <Eigen/Dense>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack {

// ─── PassKernel ───────────────────────────────────────────────────────────────

/// A prepared pass method for one element.
class PassKernel {
public:
    virtual ~PassKernel() = default;

    /// Transform one particle in the element's local frame.
    virtual void track(Eigen::Ref<PhaseVector> r) const = 0;
};

/// Builds a kernel from an element's attributes.
///
/// # Throws
/// `ElementError` if a required attribute is missing or malformed;
/// `TrackingError` for attribute values the pass method cannot use.
using PassFactory = std::function<std::unique_ptr<PassKernel>(const Element&)>;

// ─── PassMethodRegistry ───────────────────────────────────────────────────────

/// Maps pass-method names to kernel factories.
///
/// The process-wide instance is populated with the built-in pass methods on
/// first use. Registration is not synchronised: add custom pass methods
/// before tracking starts.
class PassMethodRegistry {
public:
    /// Registry holding the built-in pass methods.
    [[nodiscard]] static PassMethodRegistry& instance();

    /// An empty registry (for tests and sandboxed extensions).
    [[nodiscard]] static PassMethodRegistry empty();

    /// Register or replace a pass method.
    void add(std::string name, PassFactory factory);

    [[nodiscard]] bool contains(std::string_view name) const noexcept;

    /// Registered names in alphabetical order.
    [[nodiscard]] std::vector<std::string> names() const;

    /// Prepare a kernel for `element`.
    ///
    /// # Throws
    /// `TrackingError` if the element has no pass method or the pass method
    /// is unknown; whatever the factory throws otherwise.
    [[nodiscard]] std::unique_ptr<PassKernel> create(const Element& element) const;

private:
    PassMethodRegistry() = default;

    std::map<std::string, PassFactory, std::less<>> factories_;
};

// ─── PreparedElement ──────────────────────────────────────────────────────────

/// An element ready for tracking: misalignment, apertures and kernel.
///
/// Each particle goes through, in order: T1 translation, R1 rotation,
/// RApertures / EApertures check, kernel, R2 rotation, T2 translation.
class PreparedElement {
public:
    /// # Throws
    /// See `PassMethodRegistry::create`.
    explicit PreparedElement(const Element& element,
                             const PassMethodRegistry& registry = PassMethodRegistry::instance());

    /// Advance every surviving particle (column) of `particles`.
    void pass(ParticleMatrix& particles) const;

    /// Advance a single particle; no-op if it is already lost.
    void pass_particle(Eigen::Ref<PhaseVector> r) const;

    [[nodiscard]] const std::string& fam_name() const noexcept { return fam_name_; }

private:
    /// True if the particle falls outside the element apertures.
    [[nodiscard]] bool outside_apertures(const Eigen::Ref<PhaseVector>& r) const noexcept;

    std::string                    fam_name_;
    std::optional<PhaseVector>     t1_;
    std::optional<PhaseVector>     t2_;
    std::optional<Matrix66>        r1_;
    std::optional<Matrix66>        r2_;
    std::optional<Eigen::Vector4d> rapertures_;
    std::optional<Eigen::Vector2d> eapertures_;
    std::unique_ptr<PassKernel>    kernel_;
};

/// Mark a particle as lost.
void mark_lost(Eigen::Ref<PhaseVector> r) noexcept;

/// True if the particle has been marked lost.
[[nodiscard]] bool is_lost(const Eigen::Ref<const PhaseVector>& r) noexcept;

} // namespace ringtrack
