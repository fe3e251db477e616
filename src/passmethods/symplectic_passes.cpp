/// @file src/passmethods/symplectic_passes.cpp
/// @brief StrMPoleSymplectic4Pass, BndMPoleSymplectic4Pass and ThinMPolePass.
///
/// Long multipoles are integrated with the 4th-order Forest-Ruth scheme:
/// each of the NumIntSteps slices is
///   drift(d1) kick(k1) drift(d2) kick(k2) drift(d2) kick(k1) drift(d1)
/// with d1 + d2 + d2 + d1 = k1 + k2 + k1 = 1 slice length.

#include "kernels.hpp"

#include <cmath>

namespace ringtrack::passmethods {

namespace {

/// Fold a steering KickAngle into the dipole terms of the polynomials.
void apply_kick_angle(const Element& e, Polynomials& p, double length) {
    const auto kick = optional_vector<2>(e, "KickAngle");
    if (!kick) return;
    const double scale = length > 0.0 ? 1.0 / length : 1.0;
    p.b[0] -= std::sin((*kick)[0]) * scale;
    p.a[0] += std::sin((*kick)[1]) * scale;
}

// ─── StrMPoleSymplectic4Pass ──────────────────────────────────────────────────

class StrMPoleKernel final : public PassKernel {
public:
    StrMPoleKernel(double length, int steps, Polynomials poly)
        : length_(length), steps_(steps), poly_(std::move(poly)) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        // Zero length: PolynomA/B are integrated strengths, as in ThinMPolePass.
        if (length_ == 0.0) {
            straight_kick(r, poly_.a, poly_.b, 1.0, poly_.max_order);
            return;
        }
        const double sl = length_ / steps_;
        const double l1 = sl * DRIFT1;
        const double l2 = sl * DRIFT2;
        const double k1 = sl * KICK1;
        const double k2 = sl * KICK2;
        for (int m = 0; m < steps_; ++m) {
            drift(r, l1);
            straight_kick(r, poly_.a, poly_.b, k1, poly_.max_order);
            drift(r, l2);
            straight_kick(r, poly_.a, poly_.b, k2, poly_.max_order);
            drift(r, l2);
            straight_kick(r, poly_.a, poly_.b, k1, poly_.max_order);
            drift(r, l1);
        }
    }

private:
    double      length_;
    int         steps_;
    Polynomials poly_;
};

// ─── BndMPoleSymplectic4Pass ──────────────────────────────────────────────────

struct Edge {
    double angle = 0.0;
    double fint  = 0.0;
};

class BndMPoleKernel final : public PassKernel {
public:
    BndMPoleKernel(double length, double angle, int steps, Polynomials poly,
                   Edge entrance, Edge exit, double gap)
        : length_(length)
        , irho_(angle / length)
        , steps_(steps)
        , poly_(std::move(poly))
        , entrance_(entrance)
        , exit_(exit)
        , gap_(gap) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        edge_fringe(r, irho_, entrance_.angle, entrance_.fint, gap_);

        const double sl = length_ / steps_;
        const double l1 = sl * DRIFT1;
        const double l2 = sl * DRIFT2;
        const double k1 = sl * KICK1;
        const double k2 = sl * KICK2;
        for (int m = 0; m < steps_; ++m) {
            drift(r, l1);
            bend_kick(r, poly_.a, poly_.b, k1, irho_, poly_.max_order);
            drift(r, l2);
            bend_kick(r, poly_.a, poly_.b, k2, irho_, poly_.max_order);
            drift(r, l2);
            bend_kick(r, poly_.a, poly_.b, k1, irho_, poly_.max_order);
            drift(r, l1);
        }

        edge_fringe(r, irho_, exit_.angle, exit_.fint, gap_);
    }

private:
    double      length_;
    double      irho_;
    int         steps_;
    Polynomials poly_;
    Edge        entrance_;
    Edge        exit_;
    double      gap_;
};

// ─── ThinMPolePass ────────────────────────────────────────────────────────────

/// Integrated multipole kick; a non-zero BendingAngle adds the dispersive
/// and path-length terms of a thin dipole.
class ThinMPoleKernel final : public PassKernel {
public:
    ThinMPoleKernel(Polynomials poly, double bending_angle)
        : poly_(std::move(poly)), bending_angle_(bending_angle) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        straight_kick(r, poly_.a, poly_.b, 1.0, poly_.max_order);
        // Same sign convention as bend_kick: ct grows on the outside of the bend.
        if (bending_angle_ != 0.0) {
            r[PX] += bending_angle_ * r[DELTA];
            r[CT] += bending_angle_ * r[X];
        }
    }

private:
    Polynomials poly_;
    double      bending_angle_;
};

} // namespace

std::unique_ptr<PassKernel> make_str_mpole_symplectic4_pass(const Element& e) {
    const double length = e.length();
    Polynomials poly = read_polynomials(e);
    apply_kick_angle(e, poly, length);
    return std::make_unique<StrMPoleKernel>(length, read_num_steps(e), std::move(poly));
}

std::unique_ptr<PassKernel> make_bnd_mpole_symplectic4_pass(const Element& e) {
    const double length = e.length();
    if (length <= 0.0) {
        throw TrackingError(fmt::format(
            "In element {}: BndMPoleSymplectic4Pass needs a positive Length", e.fam_name()));
    }
    Polynomials poly = read_polynomials(e);
    apply_kick_angle(e, poly, length);
    const Edge entrance{e.real_or("EntranceAngle", 0.0), e.real_or("FringeInt1", 0.0)};
    const Edge exit{e.real_or("ExitAngle", 0.0), e.real_or("FringeInt2", 0.0)};
    return std::make_unique<BndMPoleKernel>(length, e.real("BendingAngle"), read_num_steps(e),
                                            std::move(poly), entrance, exit,
                                            e.real_or("FullGap", 0.0));
}

std::unique_ptr<PassKernel> make_thin_mpole_pass(const Element& e) {
    Polynomials poly = read_polynomials(e);
    apply_kick_angle(e, poly, 0.0);
    return std::make_unique<ThinMPoleKernel>(std::move(poly), e.real_or("BendingAngle", 0.0));
}

} // namespace ringtrack::passmethods
