/// @file src/element/element_factories.cpp
/// @brief Element constructors with Accelerator Toolbox defaults.

#include "ringtrack/element.hpp"

#include <algorithm>

namespace ringtrack::elements {

namespace {

Eigen::VectorXd as_vector(std::initializer_list<double> values) {
    return std::get<Eigen::VectorXd>(vector_value(values));
}

/// Zero-pad PolynomA/PolynomB to max(MaxOrder + 1, len(A), len(B)).
void pad_polynomials(Element& e) {
    Eigen::VectorXd a = e.vector("PolynomA");
    Eigen::VectorXd b = e.vector("PolynomB");
    const Eigen::Index size = std::max({static_cast<Eigen::Index>(e.integer("MaxOrder") + 1),
                                        a.size(), b.size()});
    a.conservativeResizeLike(Eigen::VectorXd::Zero(size));
    b.conservativeResizeLike(Eigen::VectorXd::Zero(size));
    e.set("PolynomA", std::move(a));
    e.set("PolynomB", std::move(b));
}

/// Common body of every multipole-family constructor.
Element make_multipole(ElementKind kind,
                       std::string name,
                       double length,
                       const Eigen::VectorXd& poly_a,
                       const Eigen::VectorXd& poly_b,
                       std::string pass_method,
                       long max_order,
                       const Attributes& extra) {
    Element e(kind, std::move(name), length, std::move(pass_method));
    e.set("PolynomA", poly_a);
    e.set("PolynomB", poly_b);
    e.set("MaxOrder", max_order);
    if (kind != ElementKind::ThinMultipole) {
        e.set("NumIntSteps", static_cast<long>(constants::DEFAULT_NUM_INT_STEPS));
    }
    e.update(extra);
    pad_polynomials(e);
    return e;
}

/// PolynomB from `extra` if given, otherwise the default built from `k`.
Eigen::VectorXd polynom_b_or(const Attributes& extra, Eigen::VectorXd fallback) {
    auto it = extra.find("PolynomB");
    if (it == extra.end()) return fallback;
    Element scratch(ElementKind::Multipole, "scratch");
    scratch.set("PolynomB", it->second);
    return scratch.vector("PolynomB");
}

/// Extra attributes without the ones already consumed by the factory.
Attributes without(const Attributes& extra, std::initializer_list<std::string_view> keys) {
    Attributes out = extra;
    for (auto key : keys) out.erase(std::string(key));
    return out;
}

double k_from(const Attributes& extra, double k) {
    auto it = extra.find("K");
    if (it == extra.end()) return k;
    Element scratch(ElementKind::Multipole, "scratch");
    scratch.set("K", it->second);
    return scratch.real("K");
}

} // namespace

// ─── Zero-length elements ─────────────────────────────────────────────────────

Element marker(std::string name, const Attributes& extra) {
    Element e(ElementKind::Marker, std::move(name), 0.0, "IdentityPass");
    e.update(extra);
    return e;
}

Element monitor(std::string name, const Attributes& extra) {
    Element e(ElementKind::Monitor, std::move(name), 0.0, "IdentityPass");
    e.update(extra);
    return e;
}

Element aperture(std::string name,
                 const Eigen::Vector4d& limits,
                 const Attributes& extra) {
    Element e(ElementKind::Aperture, std::move(name), 0.0, "AperturePass");
    e.set("Limits", Eigen::VectorXd(limits));
    e.update(extra);
    return e;
}

Element ring_param(std::string name, double energy, const Attributes& extra) {
    Element e(ElementKind::RingParam, std::move(name), 0.0, "IdentityPass");
    e.set("Energy", energy);
    e.set("Periodicity", 1L);
    e.update(extra);
    return e;
}

Element m66(std::string name, const Matrix66& matrix, const Attributes& extra) {
    Element e(ElementKind::M66, std::move(name), 0.0, "Matrix66Pass");
    e.set("M66", Eigen::MatrixXd(matrix));
    e.update(extra);
    return e;
}

// ─── Long elements ────────────────────────────────────────────────────────────

Element drift(std::string name, double length, const Attributes& extra) {
    Element e(ElementKind::Drift, std::move(name), length, "DriftPass");
    e.update(extra);
    return e;
}

Element corrector(std::string name, double length,
                  const Eigen::Vector2d& kick_angle,
                  const Attributes& extra) {
    Element e(ElementKind::Corrector, std::move(name), length, "CorrectorPass");
    e.set("KickAngle", Eigen::VectorXd(kick_angle));
    e.update(extra);
    return e;
}

Element rf_cavity(std::string name, double length,
                  double voltage, double frequency,
                  long harmonic_number, double energy,
                  const Attributes& extra) {
    Element e(ElementKind::RFCavity, std::move(name), length, "CavityPass");
    e.set("Voltage", voltage);
    e.set("Frequency", frequency);
    e.set("HarmNumber", harmonic_number);
    e.set("Energy", energy);
    e.set("TimeLag", 0.0);
    e.update(extra);
    return e;
}

// ─── Multipole family ─────────────────────────────────────────────────────────

Element thin_multipole(std::string name,
                       const Eigen::VectorXd& poly_a,
                       const Eigen::VectorXd& poly_b,
                       const Attributes& extra) {
    return make_multipole(ElementKind::ThinMultipole, std::move(name), 0.0,
                          poly_a, poly_b, "ThinMPolePass", 0, extra);
}

Element multipole(std::string name, double length,
                  const Eigen::VectorXd& poly_a,
                  const Eigen::VectorXd& poly_b,
                  const Attributes& extra) {
    return make_multipole(ElementKind::Multipole, std::move(name), length,
                          poly_a, poly_b, "StrMPoleSymplectic4Pass", 0, extra);
}

Element octupole(std::string name, double length,
                 const Eigen::VectorXd& poly_a,
                 const Eigen::VectorXd& poly_b,
                 const Attributes& extra) {
    return make_multipole(ElementKind::Octupole, std::move(name), length,
                          poly_a, poly_b, "StrMPoleSymplectic4Pass", 0, extra);
}

Element dipole(std::string name, double length,
               double bending_angle, double k,
               const Attributes& extra) {
    const auto poly_b = polynom_b_or(extra, as_vector({0.0, k_from(extra, k)}));
    Element e = make_multipole(ElementKind::Dipole, std::move(name), length,
                               Eigen::VectorXd(), poly_b, "BendLinearPass", 1,
                               without(extra, {"K", "PolynomB"}));
    if (!extra.contains("BendingAngle")) e.set("BendingAngle", bending_angle);
    if (!extra.contains("EntranceAngle")) e.set("EntranceAngle", 0.0);
    if (!extra.contains("ExitAngle")) e.set("ExitAngle", 0.0);
    return e;
}

Element bend(std::string name, double length,
             double bending_angle, double k,
             const Attributes& extra) {
    return dipole(std::move(name), length, bending_angle, k, extra);
}

Element quadrupole(std::string name, double length, double k,
                   const Attributes& extra) {
    const auto poly_b = polynom_b_or(extra, as_vector({0.0, k_from(extra, k)}));
    return make_multipole(ElementKind::Quadrupole, std::move(name), length,
                          Eigen::VectorXd(), poly_b, "QuadLinearPass", 1,
                          without(extra, {"K", "PolynomB"}));
}

Element sextupole(std::string name, double length, double h,
                  const Attributes& extra) {
    const auto poly_b = polynom_b_or(extra, as_vector({0.0, 0.0, h}));
    return make_multipole(ElementKind::Sextupole, std::move(name), length,
                          Eigen::VectorXd(), poly_b, "StrMPoleSymplectic4Pass", 2,
                          without(extra, {"PolynomB"}));
}

// ─── default_like ─────────────────────────────────────────────────────────────

Element default_like(const Element& source) {
    const std::string& name = source.fam_name();
    const double length = source.has_length() ? source.length() : 0.0;
    auto vec_or_empty = [&](std::string_view key) {
        const auto* v = source.find(key);
        const auto* vec = v ? std::get_if<Eigen::VectorXd>(v) : nullptr;
        return vec ? *vec : Eigen::VectorXd();
    };

    switch (source.kind()) {
        case ElementKind::Marker:
            return marker(name);
        case ElementKind::Monitor:
            return monitor(name);
        case ElementKind::Aperture: {
            const auto limits = vec_or_empty("Limits");
            return aperture(name, limits.size() == 4 ? Eigen::Vector4d(limits)
                                                     : Eigen::Vector4d::Zero());
        }
        case ElementKind::Drift:
            return drift(name, length);
        case ElementKind::ThinMultipole:
            return thin_multipole(name, vec_or_empty("PolynomA"), vec_or_empty("PolynomB"));
        case ElementKind::Multipole:
            return multipole(name, length, vec_or_empty("PolynomA"), vec_or_empty("PolynomB"));
        case ElementKind::Octupole:
            return octupole(name, length, vec_or_empty("PolynomA"), vec_or_empty("PolynomB"));
        case ElementKind::Dipole:
            return dipole(name, length, source.real_or("BendingAngle", 0.0),
                          source.has("K") ? source.k() : 0.0);
        case ElementKind::Quadrupole:
            return quadrupole(name, length, source.has("K") ? source.k() : 0.0);
        case ElementKind::Sextupole:
            return sextupole(name, length);
        case ElementKind::RFCavity:
            return rf_cavity(name, length,
                             source.real_or("Voltage", 0.0),
                             source.real_or("Frequency", 0.0),
                             source.integer_or("HarmNumber", 0),
                             source.real_or("Energy", 0.0));
        case ElementKind::RingParam:
            return ring_param(name, source.real_or("Energy", 0.0));
        case ElementKind::M66:
            return m66(name);
        case ElementKind::Corrector: {
            const auto kick = vec_or_empty("KickAngle");
            return corrector(name, length, kick.size() == 2 ? Eigen::Vector2d(kick)
                                                            : Eigen::Vector2d::Zero());
        }
    }
    return marker(name);
}

} // namespace ringtrack::elements
