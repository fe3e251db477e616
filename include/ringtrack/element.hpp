#pragma once

/// @file include/ringtrack/element.hpp
/// @brief Lattice elements: kinds, attributes, factories and slicing.
///
/// # Module: Element
///
/// ## Responsibility
/// An `Element` describes one component of an accelerator lattice. It carries
/// three core fields (family name, length, pass method) plus an open set of
/// named attributes. The pass method named by an element reads whatever
/// attributes it needs when the lattice is prepared for tracking; it is the
/// caller's responsibility to keep the attributes consistent with the pass
/// method when overriding the default one.
///
/// Attributes with a known meaning (`R1`, `T1`, `PolynomB`, `MaxOrder`, ...)
/// are converted and shape-checked on every write, so a malformed value is
/// reported where it is set rather than deep inside tracking.
///
/// ## Guarantees
/// - Elements are regular values: copy, compare, store in containers
/// - A failed attribute write throws `ElementError` and leaves the element
///   unchanged
///
/// ## NOT Responsible For
/// - Numerical tracking (see include/ringtrack/pass_method.hpp)
/// - Element ordering and ring parameters (see include/ringtrack/lattice.hpp)

#include "ringtrack/types.hpp"
#include "ringtrack/constants.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ringtrack {

// ─── ElementKind ──────────────────────────────────────────────────────────────

/// The class of a lattice element. Selects the default pass method, the
/// required constructor arguments and whether the element can be sliced.
enum class ElementKind {
    Marker,
    Monitor,
    Aperture,
    Drift,
    ThinMultipole,
    Multipole,
    Dipole,
    Quadrupole,
    Sextupole,
    Octupole,
    RFCavity,
    RingParam,
    M66,
    Corrector,
};

/// Class name of an element kind ("Drift", "Quadrupole", ...).
[[nodiscard]] std::string_view to_string(ElementKind kind) noexcept;

/// True for kinds that have a physical extent and support `divide`.
[[nodiscard]] bool is_long_kind(ElementKind kind) noexcept;

// ─── ParamValue ───────────────────────────────────────────────────────────────

/// Value of a named element attribute.
using ParamValue = std::variant<double,
                                long,
                                std::string,
                                Eigen::VectorXd,
                                Eigen::MatrixXd>;

/// Named attributes, used both for storage and as constructor keywords.
using Attributes = std::map<std::string, ParamValue>;

/// Exact comparison of two attribute values (type, shape and content).
[[nodiscard]] bool same_value(const ParamValue& a, const ParamValue& b) noexcept;

/// Render a value the way `Element::to_string` prints it.
[[nodiscard]] std::string format_value(const ParamValue& v);

/// Convenience: build a real-vector value from a list of numbers.
[[nodiscard]] ParamValue vector_value(std::initializer_list<double> values);

// ─── Element ──────────────────────────────────────────────────────────────────

/// Attributes that belong to the entrance face of an element.
inline constexpr std::string_view ENTRANCE_FIELDS[] = {
    "T1", "R1", "EntranceAngle", "FringeInt1",
    "FringeBendEntrance", "FringeQuadEntrance"};

/// Attributes that belong to the exit face of an element.
inline constexpr std::string_view EXIT_FIELDS[] = {
    "T2", "R2", "ExitAngle", "FringeInt2",
    "FringeBendExit", "FringeQuadExit"};

/// A single lattice element.
///
/// # Example
/// ```cpp
/// auto q = ringtrack::elements::quadrupole("QF", 0.4, 1.2);
/// q.set("NumIntSteps", 20L);
/// double k = q.k();                          // 1.2, stored in PolynomB[1]
/// auto halves = q.divide(std::vector{0.5, 0.5});
/// ```
class Element {
public:
    /// Construct an element with no attributes beyond the core fields.
    Element(ElementKind kind,
            std::string fam_name,
            double length = 0.0,
            std::string pass_method = "IdentityPass");

    // ── Core fields ──────────────────────────────────────────────────────────

    [[nodiscard]] ElementKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& fam_name() const noexcept { return fam_name_; }
    void set_fam_name(std::string name) { fam_name_ = std::move(name); }

    /// Element length in metres.
    ///
    /// # Throws
    /// `ElementError` if the length has been erased.
    [[nodiscard]] double length() const;
    void set_length(double length) noexcept { length_ = length; }
    [[nodiscard]] bool has_length() const noexcept { return length_.has_value(); }

    /// Name of the pass method used for tracking.
    ///
    /// # Throws
    /// `ElementError` if the pass method has been erased.
    [[nodiscard]] const std::string& pass_method() const;
    void set_pass_method(std::string name) { pass_method_ = std::move(name); }
    [[nodiscard]] bool has_pass_method() const noexcept { return pass_method_.has_value(); }

    // ── Attributes ───────────────────────────────────────────────────────────

    /// Set an attribute, converting it to its canonical type and shape.
    ///
    /// The keys `FamName`, `Length` and `PassMethod` address the core fields.
    ///
    /// # Throws
    /// `ElementError` ("In element <name>, parameter <key>: <reason>") if the
    /// value cannot be converted.
    void set(const std::string& key, ParamValue value);

    /// Apply every entry of `attrs` with `set`. If any entry fails, none
    /// is applied.
    void update(const Attributes& attrs);

    /// True if the attribute (or core field) is present.
    [[nodiscard]] bool has(std::string_view key) const noexcept;

    /// Remove an attribute or core field. Returns true if it was present.
    bool erase(std::string_view key);

    /// Raw access to an attribute. `nullptr` if absent.
    [[nodiscard]] const ParamValue* find(std::string_view key) const noexcept;

    /// Typed read of a real attribute (integers are widened).
    ///
    /// # Throws
    /// `ElementError` if missing or not numeric.
    [[nodiscard]] double real(std::string_view key) const;

    /// Typed read of a real attribute, or `fallback` when absent.
    [[nodiscard]] double real_or(std::string_view key, double fallback) const;

    /// Typed read of an integer attribute (integral reals are narrowed).
    [[nodiscard]] long integer(std::string_view key) const;
    [[nodiscard]] long integer_or(std::string_view key, long fallback) const;

    /// Typed read of a real-vector attribute.
    [[nodiscard]] const Eigen::VectorXd& vector(std::string_view key) const;

    /// Typed read of a real-matrix attribute.
    [[nodiscard]] const Eigen::MatrixXd& matrix(std::string_view key) const;

    /// Typed read of a string attribute.
    [[nodiscard]] const std::string& text(std::string_view key) const;

    /// All non-core attributes, ordered by name.
    [[nodiscard]] const Attributes& attributes() const noexcept { return attrs_; }

    // ── Kind-specific accessors ──────────────────────────────────────────────

    /// Quadrupole strength, stored as PolynomB[1] on Quadrupole and Dipole.
    [[nodiscard]] double k() const;
    void set_k(double strength);

    /// True if this element supports `divide`.
    [[nodiscard]] bool is_long() const noexcept { return is_long_kind(kind_); }

    // ── Slicing ──────────────────────────────────────────────────────────────

    /// Split a long element into `frac.size()` slices of length
    /// `frac[i] * length()`.
    ///
    /// `sum(frac)` may differ from 1. `BendingAngle`, when present, is split
    /// in proportion `frac[i] / sum(frac)`. Entrance attributes are kept on
    /// the first slice and exit attributes on the last one; with `keep_axis`
    /// the misalignment attributes (T1, R1, T2, R2) are kept on every slice.
    ///
    /// # Throws
    /// `ElementError` if the element is not long or `frac` is empty.
    [[nodiscard]] std::vector<Element>
    divide(std::span<const double> frac, bool keep_axis = false) const;

    /// One entry of a `Drift::insert` request: the location of the centre
    /// of the inserted element as a fraction of the drift length, and the
    /// element (or nothing, to only split the drift).
    using Insertion = std::pair<double, std::optional<Element>>;

    /// Insert elements inside a drift.
    ///
    /// Each element is centred at its fractional location; the drift is
    /// shortened around it. Zero-length drift pieces are dropped. Drifts
    /// with negative lengths may be generated if insertions overlap.
    ///
    /// # Throws
    /// `ElementError` if this element is not a Drift or has zero length.
    [[nodiscard]] std::vector<Element>
    insert(std::span<const Insertion> insertions) const;

    // ── Formatting ───────────────────────────────────────────────────────────

    /// Multi-line listing: kind, then FamName, Length, PassMethod, then the
    /// remaining attributes.
    [[nodiscard]] std::string to_string() const;

    /// Constructor-like one-liner listing only attributes that differ from a
    /// default element of the same kind.
    [[nodiscard]] std::string repr() const;

    friend bool operator==(const Element& a, const Element& b) noexcept;

private:
    [[noreturn]] void fail(std::string_view key, std::string_view reason) const;

    ElementKind                kind_;
    std::string                fam_name_;
    std::optional<double>      length_;
    std::optional<std::string> pass_method_;
    Attributes                 attrs_;
};

bool operator==(const Element& a, const Element& b) noexcept;

// ─── Factories ────────────────────────────────────────────────────────────────

/// Constructors for each element kind, with the defaults of the Accelerator
/// Toolbox. Every factory accepts `extra` attributes that are applied last
/// and may override the defaults, including `PassMethod` and `Length`.
namespace elements {

[[nodiscard]] Element marker(std::string name, const Attributes& extra = {});

[[nodiscard]] Element monitor(std::string name, const Attributes& extra = {});

/// Rectangular aperture; `limits` = [xmin, xmax, ymin, ymax].
[[nodiscard]] Element aperture(std::string name,
                               const Eigen::Vector4d& limits,
                               const Attributes& extra = {});

[[nodiscard]] Element drift(std::string name, double length,
                            const Attributes& extra = {});

/// Thin multipole. Polynomials are zero-padded to
/// max(MaxOrder + 1, len(poly_a), len(poly_b)).
[[nodiscard]] Element thin_multipole(std::string name,
                                     const Eigen::VectorXd& poly_a,
                                     const Eigen::VectorXd& poly_b,
                                     const Attributes& extra = {});

/// Thick multipole integrated with StrMPoleSymplectic4Pass.
[[nodiscard]] Element multipole(std::string name, double length,
                                const Eigen::VectorXd& poly_a,
                                const Eigen::VectorXd& poly_b,
                                const Attributes& extra = {});

/// Sector dipole. `extra` may carry EntranceAngle, ExitAngle, FullGap,
/// FringeInt1/2, PolynomB (overrides k), ...
[[nodiscard]] Element dipole(std::string name, double length,
                             double bending_angle, double k = 0.0,
                             const Attributes& extra = {});

/// Synonym of `dipole`.
[[nodiscard]] Element bend(std::string name, double length,
                           double bending_angle, double k = 0.0,
                           const Attributes& extra = {});

[[nodiscard]] Element quadrupole(std::string name, double length,
                                 double k = 0.0,
                                 const Attributes& extra = {});

[[nodiscard]] Element sextupole(std::string name, double length,
                                double h = 0.0,
                                const Attributes& extra = {});

[[nodiscard]] Element octupole(std::string name, double length,
                               const Eigen::VectorXd& poly_a,
                               const Eigen::VectorXd& poly_b,
                               const Attributes& extra = {});

/// RF cavity. `energy` in eV, `voltage` in V, `frequency` in Hz.
[[nodiscard]] Element rf_cavity(std::string name, double length,
                                double voltage, double frequency,
                                long harmonic_number, double energy,
                                const Attributes& extra = {});

/// Ring parameters carried inside the element list.
[[nodiscard]] Element ring_param(std::string name, double energy,
                                 const Attributes& extra = {});

/// Arbitrary linear 6×6 map.
[[nodiscard]] Element m66(std::string name,
                          const Matrix66& matrix = Matrix66::Identity(),
                          const Attributes& extra = {});

/// Orbit corrector; `kick_angle` = [hkick, vkick] in radians.
[[nodiscard]] Element corrector(std::string name, double length,
                                const Eigen::Vector2d& kick_angle,
                                const Attributes& extra = {});

/// Build a default element of `kind` reusing the required arguments of
/// `source` (used by `Element::repr`).
[[nodiscard]] Element default_like(const Element& source);

} // namespace elements

} // namespace ringtrack
