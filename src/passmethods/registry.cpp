/// @file src/passmethods/registry.cpp
/// @brief PassMethodRegistry and the attribute readers shared by kernels.

#include "kernels.hpp"

#include "ringtrack/constants.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

namespace ringtrack {

// ─── PassMethodRegistry ───────────────────────────────────────────────────────

PassMethodRegistry& PassMethodRegistry::instance() {
    static PassMethodRegistry registry = [] {
        PassMethodRegistry r;
        passmethods::register_builtin_pass_methods(r);
        return r;
    }();
    return registry;
}

PassMethodRegistry PassMethodRegistry::empty() {
    return PassMethodRegistry{};
}

void PassMethodRegistry::add(std::string name, PassFactory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

bool PassMethodRegistry::contains(std::string_view name) const noexcept {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> PassMethodRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) out.push_back(name);
    return out;
}

std::unique_ptr<PassKernel> PassMethodRegistry::create(const Element& element) const {
    if (!element.has_pass_method()) {
        throw TrackingError(fmt::format("Element {} has no PassMethod", element.fam_name()));
    }
    const std::string& method = element.pass_method();
    auto it = factories_.find(method);
    if (it == factories_.end()) {
        throw TrackingError(fmt::format("Unknown pass method '{}' in element {}",
                                        method, element.fam_name()));
    }
    return it->second(element);
}

namespace passmethods {

// ─── Attribute readers ────────────────────────────────────────────────────────

Polynomials read_polynomials(const Element& e) {
    Polynomials p;
    p.a = e.vector("PolynomA");
    p.b = e.vector("PolynomB");
    const long max_order = e.integer("MaxOrder");
    if (max_order < 0) {
        throw TrackingError(fmt::format("In element {}: MaxOrder must be >= 0, got {}",
                                        e.fam_name(), max_order));
    }
    if (p.a.size() <= max_order || p.b.size() <= max_order) {
        throw TrackingError(fmt::format(
            "In element {}: PolynomA/PolynomB have {}/{} terms, MaxOrder {} needs {}",
            e.fam_name(), p.a.size(), p.b.size(), max_order, max_order + 1));
    }
    p.max_order = static_cast<int>(max_order);
    return p;
}

std::optional<Matrix66> optional_matrix66(const Element& e, std::string_view key) {
    if (!e.has(key)) return std::nullopt;
    const Eigen::MatrixXd& m = e.matrix(key);
    if (m.rows() != NUM_COORDS || m.cols() != NUM_COORDS) {
        throw TrackingError(fmt::format("In element {}, parameter {}: expected a 6x6 matrix, got {}x{}",
                                        e.fam_name(), key, m.rows(), m.cols()));
    }
    return Matrix66(m);
}

int read_num_steps(const Element& e) {
    const long steps = e.integer_or("NumIntSteps", constants::DEFAULT_NUM_INT_STEPS);
    if (steps <= 0) {
        throw TrackingError(fmt::format("In element {}: NumIntSteps must be positive, got {}",
                                        e.fam_name(), steps));
    }
    return static_cast<int>(steps);
}

// ─── Built-ins ────────────────────────────────────────────────────────────────

void register_builtin_pass_methods(PassMethodRegistry& registry) {
    registry.add("IdentityPass", make_identity_pass);
    registry.add("DriftPass", make_drift_pass);
    registry.add("AperturePass", make_aperture_pass);
    registry.add("QuadLinearPass", make_quad_linear_pass);
    registry.add("BendLinearPass", make_bend_linear_pass);
    registry.add("StrMPoleSymplectic4Pass", make_str_mpole_symplectic4_pass);
    registry.add("BndMPoleSymplectic4Pass", make_bnd_mpole_symplectic4_pass);
    registry.add("ThinMPolePass", make_thin_mpole_pass);
    registry.add("CorrectorPass", make_corrector_pass);
    registry.add("CavityPass", make_cavity_pass);
    registry.add("Matrix66Pass", make_matrix66_pass);
}

} // namespace passmethods

} // namespace ringtrack
