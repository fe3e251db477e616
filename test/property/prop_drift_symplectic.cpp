/**
 * @file  prop_drift_symplectic.cpp
 * @brief Property: ∀ L, ∀ phase-space point: the DriftPass map is symplectic
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_drift_symplectic
 *
 * Mathematical basis:
 *   With the canonical pairs (x, px), (y, py), (δ, ct) the drift
 *
 *     x  += L·px/(1+δ)
 *     y  += L·py/(1+δ)
 *     ct += L·(px² + py²)/(2(1+δ)²)
 *
 *   has a Jacobian M with Mᵀ·S·M = S, S the block-diagonal symplectic form.
 *   M is estimated by central differences, which are exact to rounding for
 *   the quadratic terms.
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

/// Central-difference Jacobian of one element around `r0`.
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
    // ── Property 1: Mᵀ·S·M = S ──────────────────────────────────────────────
    rc::check(
        "drift_symplectic: M^T S M == S to 1e-8",
        [](double raw_l, double raw_px, double raw_py, double raw_delta) {
            const double length = 5.0 * (1.0 + std::tanh(raw_l));      // [0, 10)
            PhaseVector r0 = PhaseVector::Zero();
            r0[PX] = 1e-2 * std::tanh(raw_px);
            r0[PY] = 1e-2 * std::tanh(raw_py);
            r0[DELTA] = 0.05 * std::tanh(raw_delta);

            const PreparedElement drift(elements::drift("d", length));
            const Matrix66 m = jacobian(drift, r0, 1e-7);
            RC_ASSERT(m.allFinite());

            const Matrix66 s = symplectic_form();
            const double err = (m.transpose() * s * m - s).cwiseAbs().maxCoeff();
            RC_ASSERT(err < 1e-8);
        }
    );

    // ── Property 2: drifts compose additively ────────────────────────────────
    rc::check(
        "drift_symplectic: drift(L1) then drift(L2) == drift(L1 + L2)",
        [](double raw_l1, double raw_l2, double raw_px) {
            const double l1 = 2.0 * (1.0 + std::tanh(raw_l1));
            const double l2 = 2.0 * (1.0 + std::tanh(raw_l2));
            ParticleMatrix a = ParticleMatrix::Zero(NUM_COORDS, 1);
            a(PX, 0) = 1e-3 * std::tanh(raw_px);
            a(PY, 0) = -5e-4;
            ParticleMatrix b = a;

            PreparedElement(elements::drift("d1", l1)).pass(a);
            PreparedElement(elements::drift("d2", l2)).pass(a);
            PreparedElement(elements::drift("d", l1 + l2)).pass(b);

            RC_ASSERT((a - b).cwiseAbs().maxCoeff() < 1e-15);
        }
    );

    return 0;
}
