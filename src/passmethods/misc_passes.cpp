/// @file src/passmethods/misc_passes.cpp
/// @brief CorrectorPass and CavityPass.

#include "kernels.hpp"

#include "ringtrack/constants.hpp"

#include <cmath>

namespace ringtrack::passmethods {

namespace {

// ─── CorrectorPass ────────────────────────────────────────────────────────────

/// Uniform steering field over `length`, or a thin kick when the length is 0.
class CorrectorKernel final : public PassKernel {
public:
    CorrectorKernel(double length, const Eigen::Vector2d& kick) noexcept
        : length_(length), kick_(kick) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        const double xk = kick_[0];
        const double yk = kick_[1];
        if (length_ == 0.0) {
            r[PX] += xk;
            r[PY] += yk;
            return;
        }
        const double p_norm = 1.0 / (1.0 + r[DELTA]);
        const double norm_l = length_ * p_norm;
        r[CT] += norm_l * p_norm
               * (xk * xk / 3.0 + yk * yk / 3.0
                  + r[PX] * r[PX] + r[PY] * r[PY]
                  + r[PX] * xk + r[PY] * yk) / 2.0;
        r[X]  += norm_l * (r[PX] + xk / 2.0);
        r[PX] += xk;
        r[Y]  += norm_l * (r[PY] + yk / 2.0);
        r[PY] += yk;
    }

private:
    double          length_;
    Eigen::Vector2d kick_;
};

// ─── CavityPass ───────────────────────────────────────────────────────────────

/// Energy kick δ -= (V/E)·sin(2π f (ct - lag) / c), centred in the cavity.
class CavityKernel final : public PassKernel {
public:
    CavityKernel(double length, double voltage, double energy,
                 double frequency, double time_lag) noexcept
        : length_(length)
        , normalised_voltage_(voltage / energy)
        , frequency_(frequency)
        , time_lag_(time_lag) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        if (length_ == 0.0) {
            kick(r);
            return;
        }
        drift(r, length_ / 2.0);
        kick(r);
        drift(r, length_ / 2.0);
    }

private:
    void kick(Eigen::Ref<PhaseVector> r) const noexcept {
        r[DELTA] -= normalised_voltage_
                  * std::sin(constants::TWO_PI * frequency_ * (r[CT] - time_lag_)
                             / constants::C_LIGHT);
    }

    double length_;
    double normalised_voltage_;
    double frequency_;
    double time_lag_;
};

} // namespace

std::unique_ptr<PassKernel> make_corrector_pass(const Element& e) {
    auto kick = optional_vector<2>(e, "KickAngle");
    if (!kick) {
        throw ElementError(fmt::format("In element {}, parameter KickAngle: attribute is missing",
                                       e.fam_name()));
    }
    return std::make_unique<CorrectorKernel>(e.length(), *kick);
}

std::unique_ptr<PassKernel> make_cavity_pass(const Element& e) {
    const double energy = e.real("Energy");
    if (energy <= 0.0) {
        throw TrackingError(fmt::format("In element {}: CavityPass needs a positive Energy, got {}",
                                        e.fam_name(), energy));
    }
    return std::make_unique<CavityKernel>(e.length(), e.real("Voltage"), energy,
                                          e.real("Frequency"), e.real_or("TimeLag", 0.0));
}

} // namespace ringtrack::passmethods
