#pragma once

/// @file src/passmethods/kernels.hpp
/// @brief Shared integrator steps and built-in kernel factories.
///
/// # Module: Pass Methods (internal)
///
/// ## Responsibility
/// Inline building blocks used by several pass methods (drift, thin kicks,
/// dipole edge focusing) and the factory declarations that
/// `register_builtin_pass_methods` wires into the registry.
///
/// ## Guarantees
/// - Every helper is a pure function of its arguments
/// - Coordinates follow the (x, px, y, py, δ, ct) convention with ct the
///   path lengthening relative to the reference particle

#include "ringtrack/element.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/pass_method.hpp"
#include "ringtrack/types.hpp"

#include <Eigen/Dense>
#include <fmt/format.h>

#include <cmath>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace ringtrack::passmethods {

// ─── Forest-Ruth 4th-order coefficients ───────────────────────────────────────

inline constexpr double DRIFT1 =  0.6756035959798286638;
inline constexpr double DRIFT2 = -0.1756035959798286639;
inline constexpr double KICK1  =  1.351207191959657328;
inline constexpr double KICK2  = -1.702414383919314656;

// ─── Integrator steps ─────────────────────────────────────────────────────────

/// Exact drift of length `le` in the paraxial-momentum approximation.
inline void drift(Eigen::Ref<PhaseVector> r, double le) noexcept {
    const double p_norm = 1.0 / (1.0 + r[DELTA]);
    const double norm_l = le * p_norm;
    r[X]  += norm_l * r[PX];
    r[Y]  += norm_l * r[PY];
    r[CT] += norm_l * p_norm * (r[PX] * r[PX] + r[PY] * r[PY]) / 2.0;
}

/// Real and imaginary parts of Σ (B_n + i A_n)(x + i y)^n, n = 0..max_order.
struct FieldSum {
    double re;
    double im;
};

inline FieldSum field_sum(const Eigen::Ref<const PhaseVector>& r,
                          const Eigen::VectorXd& a,
                          const Eigen::VectorXd& b,
                          int max_order) noexcept {
    double re = b[max_order];
    double im = a[max_order];
    for (int i = max_order - 1; i >= 0; --i) {
        const double tmp = re * r[X] - im * r[Y] + b[i];
        im = im * r[X] + re * r[Y] + a[i];
        re = tmp;
    }
    return {re, im};
}

/// Thin multipole kick of integrated strength `le` in a straight frame.
inline void straight_kick(Eigen::Ref<PhaseVector> r,
                          const Eigen::VectorXd& a,
                          const Eigen::VectorXd& b,
                          double le,
                          int max_order) noexcept {
    const auto [re, im] = field_sum(r, a, b, max_order);
    r[PX] -= le * re;
    r[PY] += le * im;
}

/// Thin multipole kick in a frame of curvature `irho` [1/m].
inline void bend_kick(Eigen::Ref<PhaseVector> r,
                      const Eigen::VectorXd& a,
                      const Eigen::VectorXd& b,
                      double le,
                      double irho,
                      int max_order) noexcept {
    const auto [re, im] = field_sum(r, a, b, max_order);
    r[PX] -= le * (re - (r[DELTA] - r[X] * irho) * irho);
    r[PY] += le * im;
    r[CT] += le * irho * r[X];
}

/// Dipole edge focusing with the fringe-field correction of the
/// vertical edge angle.
///
/// # Arguments
/// * `irho`       - curvature of the dipole [1/m]
/// * `edge_angle` - pole-face rotation [rad]
/// * `fint`       - fringe-field integral
/// * `gap`        - full magnet gap [m]
inline void edge_fringe(Eigen::Ref<PhaseVector> r,
                        double irho,
                        double edge_angle,
                        double fint,
                        double gap) noexcept {
    if (irho == 0.0) return;
    const double sin_e = std::sin(edge_angle);
    const double psi = irho * gap * fint * (1.0 + sin_e * sin_e) / std::cos(edge_angle)
                     / (1.0 + r[DELTA]);
    r[PX] += r[X] * irho * std::tan(edge_angle);
    r[PY] -= r[Y] * irho * std::tan(edge_angle - psi);
}

// ─── Attribute helpers ────────────────────────────────────────────────────────

/// PolynomA / PolynomB checked against MaxOrder.
///
/// # Throws
/// `TrackingError` if either polynomial is shorter than MaxOrder + 1 or
/// MaxOrder is negative.
struct Polynomials {
    Eigen::VectorXd a;
    Eigen::VectorXd b;
    int             max_order = 0;
};

[[nodiscard]] Polynomials read_polynomials(const Element& e);

/// Fixed-size vector attribute, or `std::nullopt` when absent.
///
/// # Throws
/// `TrackingError` if present with another length.
template <int N>
[[nodiscard]] std::optional<Eigen::Matrix<double, N, 1>>
optional_vector(const Element& e, std::string_view key) {
    if (!e.has(key)) return std::nullopt;
    const Eigen::VectorXd& v = e.vector(key);
    if (v.size() != N) {
        throw TrackingError(fmt::format("In element {}, parameter {}: expected {} values, got {}",
                                        e.fam_name(), key, N, v.size()));
    }
    return Eigen::Matrix<double, N, 1>(v);
}

[[nodiscard]] std::optional<Matrix66> optional_matrix66(const Element& e, std::string_view key);

/// Positive integer NumIntSteps (default 10).
[[nodiscard]] int read_num_steps(const Element& e);

// ─── Factories ────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<PassKernel> make_identity_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_drift_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_aperture_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_quad_linear_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_bend_linear_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_str_mpole_symplectic4_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_bnd_mpole_symplectic4_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_thin_mpole_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_corrector_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_cavity_pass(const Element& e);
[[nodiscard]] std::unique_ptr<PassKernel> make_matrix66_pass(const Element& e);

void register_builtin_pass_methods(PassMethodRegistry& registry);

} // namespace ringtrack::passmethods
