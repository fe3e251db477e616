/// @file src/passmethods/prepared_element.cpp
/// @brief Misalignment and aperture wrapper around a pass kernel.

#include "kernels.hpp"

#include <cmath>
#include <limits>

namespace ringtrack {

void mark_lost(Eigen::Ref<PhaseVector> r) noexcept {
    r[X] = std::numeric_limits<double>::infinity();
}

bool is_lost(const Eigen::Ref<const PhaseVector>& r) noexcept {
    return !std::isfinite(r[X]);
}

PreparedElement::PreparedElement(const Element& element, const PassMethodRegistry& registry)
    : fam_name_(element.fam_name())
    , t1_(passmethods::optional_vector<NUM_COORDS>(element, "T1"))
    , t2_(passmethods::optional_vector<NUM_COORDS>(element, "T2"))
    , r1_(passmethods::optional_matrix66(element, "R1"))
    , r2_(passmethods::optional_matrix66(element, "R2"))
    , rapertures_(passmethods::optional_vector<4>(element, "RApertures"))
    , eapertures_(passmethods::optional_vector<2>(element, "EApertures"))
    , kernel_(registry.create(element)) {}

bool PreparedElement::outside_apertures(const Eigen::Ref<PhaseVector>& r) const noexcept {
    if (rapertures_) {
        const auto& lim = *rapertures_;
        if (r[X] < lim[0] || r[X] > lim[1] || r[Y] < lim[2] || r[Y] > lim[3]) return true;
    }
    if (eapertures_) {
        const double xn = r[X] / (*eapertures_)[0];
        const double yn = r[Y] / (*eapertures_)[1];
        if (xn * xn + yn * yn > 1.0) return true;
    }
    return false;
}

void PreparedElement::pass_particle(Eigen::Ref<PhaseVector> r) const {
    if (is_lost(r)) return;

    if (t1_) r += *t1_;
    if (r1_) r = (*r1_ * r).eval();
    if (outside_apertures(r)) {
        mark_lost(r);
        return;
    }
    kernel_->track(r);
    if (is_lost(r)) return;
    if (r2_) r = (*r2_ * r).eval();
    if (t2_) r += *t2_;
}

void PreparedElement::pass(ParticleMatrix& particles) const {
    for (Eigen::Index i = 0; i < particles.cols(); ++i) {
        pass_particle(particles.col(i));
    }
}

} // namespace ringtrack
