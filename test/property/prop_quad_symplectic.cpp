/**
 * @file  prop_quad_symplectic.cpp
 * @brief Property: ∀ k, L, δ: quadrupole maps are symplectic
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_quad_symplectic
 *
 * Mathematical basis:
 *   QuadLinearPass applies, at fixed δ, the 2×2 plane maps of
 *   x'' + g·x = 0 and y'' − g·y = 0 with g = k/(1+δ). Each has unit
 *   determinant, so the transverse 4×4 Jacobian satisfies Mᵀ·S₄·M = S₄.
 *
 *   StrMPoleSymplectic4Pass is a composition of drifts and kicks that
 *   depend on position only; the full 6×6 Jacobian satisfies Mᵀ·S·M = S.
 *
 *   The linear map and the integrator must also agree near the axis.
 */

#include <rapidcheck.h>
#include <cmath>

#include "ringtrack/pass_method.hpp"

using namespace ringtrack;

namespace {

Matrix66 symplectic_form() {
    Matrix66 s = Matrix66::Zero();
    for (int i = 0; i < NUM_COORDS; i += 2) {
        s(i, i + 1) = 1.0;
        s(i + 1, i) = -1.0;
    }
    return s;
}

Matrix66 jacobian(const PreparedElement& elem, const PhaseVector& r0, double step) {
    ParticleMatrix offsets(NUM_COORDS, 2 * NUM_COORDS);
    for (int j = 0; j < NUM_COORDS; ++j) {
        offsets.col(j) = r0;
        offsets.col(j + NUM_COORDS) = r0;
        offsets(j, j) += step;
        offsets(j, j + NUM_COORDS) -= step;
    }
    elem.pass(offsets);
    return (offsets.leftCols<NUM_COORDS>() - offsets.rightCols<NUM_COORDS>()) / (2.0 * step);
}

} // namespace

int main() {
    // ── Property 1: QuadLinearPass, transverse block ─────────────────────────
    rc::check(
        "quad_symplectic: QuadLinearPass transverse M^T S M == S to 1e-8",
        [](double raw_k, double raw_l, double raw_delta) {
            const double k = 5.0 * std::tanh(raw_k);
            const double length = 0.05 + 0.95 * (1.0 + std::tanh(raw_l));   // (0.05, 1.95)
            PhaseVector r0 = PhaseVector::Zero();
            r0[DELTA] = 0.05 * std::tanh(raw_delta);

            const PreparedElement quad(elements::quadrupole("q", length, k));
            const Matrix66 m = jacobian(quad, r0, 1e-7);
            RC_ASSERT(m.allFinite());

            const Matrix44 m4 = m.topLeftCorner<4, 4>();
            const Matrix44 s4 = symplectic_form().topLeftCorner<4, 4>();
            const double err = (m4.transpose() * s4 * m4 - s4).cwiseAbs().maxCoeff();
            RC_ASSERT(err < 1e-8);
            RC_ASSERT(std::abs(m4.determinant() - 1.0) < 1e-8);
        }
    );

    // ── Property 2: StrMPoleSymplectic4Pass, full 6×6 map ────────────────────
    rc::check(
        "quad_symplectic: StrMPoleSymplectic4Pass M^T S M == S to 1e-8",
        [](double raw_k, double raw_h, double raw_x, double raw_py) {
            const double k = 3.0 * std::tanh(raw_k);
            const double h = 50.0 * std::tanh(raw_h);
            const int steps = *rc::gen::inRange(1, 30);

            Attributes extra{{"NumIntSteps", static_cast<long>(steps)},
                             {"MaxOrder", 2L}};
            const Eigen::Vector3d poly_b(0.0, k, h);
            const PreparedElement mpole(
                elements::multipole("m", 0.5, Eigen::VectorXd::Zero(3), poly_b, extra));

            PhaseVector r0 = PhaseVector::Zero();
            r0[X] = 1e-3 * std::tanh(raw_x);
            r0[PY] = 1e-4 * std::tanh(raw_py);
            r0[DELTA] = 1e-3;
            const Matrix66 m = jacobian(mpole, r0, 1e-7);
            RC_ASSERT(m.allFinite());

            const Matrix66 s = symplectic_form();
            const double err = (m.transpose() * s * m - s).cwiseAbs().maxCoeff();
            RC_ASSERT(err < 1e-8);
        }
    );

    // ── Property 3: integrator agrees with the linear map near the axis ──────
    rc::check(
        "quad_symplectic: StrMPole quad == QuadLinear quad to 1e-11 near axis",
        [](double raw_k, double raw_x, double raw_y) {
            const double k = 2.0 * std::tanh(raw_k);
            ParticleMatrix a = ParticleMatrix::Zero(NUM_COORDS, 1);
            a(X, 0) = 1e-6 * std::tanh(raw_x);
            a(Y, 0) = 1e-6 * std::tanh(raw_y);
            ParticleMatrix b = a;

            Attributes symplectic{{"PassMethod", std::string("StrMPoleSymplectic4Pass")},
                                  {"NumIntSteps", 40L}};
            PreparedElement(elements::quadrupole("q", 0.4, k, symplectic)).pass(a);
            PreparedElement(elements::quadrupole("q", 0.4, k)).pass(b);

            for (int i = 0; i < 4; ++i) RC_ASSERT(std::abs(a(i, 0) - b(i, 0)) < 1e-11);
        }
    );

    return 0;
}
