/// @file src/passmethods/linear_passes.cpp
/// @brief QuadLinearPass, BendLinearPass and Matrix66Pass.
///
/// The transverse motion in each plane obeys x'' + g·x = f with constant
/// g and f, solved in closed form. Path lengthening adds ∫x'²/2 ds per
/// plane and, in a dipole, h·∫x ds.

#include "kernels.hpp"

#include "ringtrack/constants.hpp"

#include <cmath>

namespace ringtrack::passmethods {

namespace {

// ─── Closed-form plane map ────────────────────────────────────────────────────

/// Homogeneous solution over length `le`; m22 equals m11.
struct PlaneMap {
    double m11;
    double m12;
    double m21;
    double d1;   ///< ∫ m12 ds  = (1 - m11) / g
    double d2;   ///< ∫ d1 ds   = (le - m12) / g
};

PlaneMap plane_map(double g, double le) noexcept {
    if (g > constants::STRENGTH_EPSILON) {
        const double k = std::sqrt(g);
        const double c = std::cos(k * le);
        const double s = std::sin(k * le);
        return {c, s / k, -k * s, (1.0 - c) / g, (le - s / k) / g};
    }
    if (g < -constants::STRENGTH_EPSILON) {
        const double k = std::sqrt(-g);
        const double c = std::cosh(k * le);
        const double s = std::sinh(k * le);
        return {c, s / k, k * s, (1.0 - c) / g, (le - s / k) / g};
    }
    return {1.0, le, 0.0, le * le / 2.0, le * le * le / 6.0};
}

/// ∫ x'²/2 ds along the homogeneous trajectory starting at (x0, xp0).
double path_lengthening(const PlaneMap& m, double g, double le, double x0, double xp0) noexcept {
    const double cs = m.m11 * m.m12;
    return g * x0 * x0 * (le - cs) / 4.0
         + x0 * xp0 * m.m21 * m.m12 / 2.0
         + xp0 * xp0 * (le + cs) / 4.0;
}

// ─── QuadLinearPass ───────────────────────────────────────────────────────────

class QuadLinearKernel final : public PassKernel {
public:
    QuadLinearKernel(double length, double k) noexcept : length_(length), k_(k) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        const double p_norm = 1.0 / (1.0 + r[DELTA]);
        const double g = k_ * p_norm;
        const double x0 = r[X];
        const double xp0 = r[PX] * p_norm;
        const double y0 = r[Y];
        const double yp0 = r[PY] * p_norm;

        const PlaneMap mx = plane_map(g, length_);
        const PlaneMap my = plane_map(-g, length_);

        r[X]  = mx.m11 * x0 + mx.m12 * xp0;
        r[PX] = (mx.m21 * x0 + mx.m11 * xp0) / p_norm;
        r[Y]  = my.m11 * y0 + my.m12 * yp0;
        r[PY] = (my.m21 * y0 + my.m11 * yp0) / p_norm;
        r[CT] += path_lengthening(mx, g, length_, x0, xp0)
               + path_lengthening(my, -g, length_, y0, yp0);
    }

private:
    double length_;
    double k_;
};

// ─── BendLinearPass ───────────────────────────────────────────────────────────

struct EdgeParams {
    double angle = 0.0;
    double fint  = 0.0;
};

class BendLinearKernel final : public PassKernel {
public:
    BendLinearKernel(double length, double angle, double k,
                     EdgeParams entrance, EdgeParams exit, double gap) noexcept
        : length_(length)
        , h_(angle / length)
        , k_(k)
        , entrance_(entrance)
        , exit_(exit)
        , gap_(gap) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        edge_fringe(r, h_, entrance_.angle, entrance_.fint, gap_);

        const double p_norm = 1.0 / (1.0 + r[DELTA]);
        const double gx = k_ * p_norm + h_ * h_;
        const double gy = -k_ * p_norm;
        const double f = h_ * r[DELTA] * p_norm;
        const double x0 = r[X];
        const double xp0 = r[PX] * p_norm;
        const double y0 = r[Y];
        const double yp0 = r[PY] * p_norm;

        const PlaneMap mx = plane_map(gx, length_);
        const PlaneMap my = plane_map(gy, length_);

        r[X]  = mx.m11 * x0 + mx.m12 * xp0 + f * mx.d1;
        r[PX] = (mx.m21 * x0 + mx.m11 * xp0 + f * mx.m12) / p_norm;
        r[Y]  = my.m11 * y0 + my.m12 * yp0;
        r[PY] = (my.m21 * y0 + my.m11 * yp0) / p_norm;
        r[CT] += h_ * (x0 * mx.m12 + xp0 * mx.d1 + f * mx.d2)
               + path_lengthening(mx, gx, length_, x0, xp0)
               + path_lengthening(my, gy, length_, y0, yp0);

        edge_fringe(r, h_, exit_.angle, exit_.fint, gap_);
    }

private:
    double     length_;
    double     h_;
    double     k_;
    EdgeParams entrance_;
    EdgeParams exit_;
    double     gap_;
};

// ─── Matrix66Pass ─────────────────────────────────────────────────────────────

class Matrix66Kernel final : public PassKernel {
public:
    explicit Matrix66Kernel(const Matrix66& m) noexcept : m_(m) {}

    void track(Eigen::Ref<PhaseVector> r) const override { r = (m_ * r).eval(); }

private:
    Matrix66 m_;
};

} // namespace

std::unique_ptr<PassKernel> make_quad_linear_pass(const Element& e) {
    return std::make_unique<QuadLinearKernel>(e.length(), e.k());
}

std::unique_ptr<PassKernel> make_bend_linear_pass(const Element& e) {
    const double length = e.length();
    if (length <= 0.0) {
        throw TrackingError(fmt::format("In element {}: BendLinearPass needs a positive Length",
                                        e.fam_name()));
    }
    const EdgeParams entrance{e.real_or("EntranceAngle", 0.0), e.real_or("FringeInt1", 0.0)};
    const EdgeParams exit{e.real_or("ExitAngle", 0.0), e.real_or("FringeInt2", 0.0)};
    const double k = e.has("PolynomB") && e.vector("PolynomB").size() > 1 ? e.k() : 0.0;
    return std::make_unique<BendLinearKernel>(length, e.real("BendingAngle"), k,
                                              entrance, exit, e.real_or("FullGap", 0.0));
}

std::unique_ptr<PassKernel> make_matrix66_pass(const Element& e) {
    auto m = optional_matrix66(e, "M66");
    if (!m) {
        throw ElementError(fmt::format("In element {}, parameter M66: attribute is missing",
                                       e.fam_name()));
    }
    return std::make_unique<Matrix66Kernel>(*m);
}

} // namespace ringtrack::passmethods
