/// @file src/passmethods/drift_pass.cpp
/// @brief IdentityPass, DriftPass and AperturePass.

#include "kernels.hpp"

namespace ringtrack::passmethods {

namespace {

class IdentityKernel final : public PassKernel {
public:
    void track(Eigen::Ref<PhaseVector>) const override {}
};

class DriftKernel final : public PassKernel {
public:
    explicit DriftKernel(double length) noexcept : length_(length) {}

    void track(Eigen::Ref<PhaseVector> r) const override { drift(r, length_); }

private:
    double length_;
};

/// Rectangular aperture [xmin, xmax, ymin, ymax].
class ApertureKernel final : public PassKernel {
public:
    explicit ApertureKernel(const Eigen::Vector4d& limits) noexcept : limits_(limits) {}

    void track(Eigen::Ref<PhaseVector> r) const override {
        if (r[X] < limits_[0] || r[X] > limits_[1] || r[Y] < limits_[2] || r[Y] > limits_[3]) {
            mark_lost(r);
        }
    }

private:
    Eigen::Vector4d limits_;
};

} // namespace

std::unique_ptr<PassKernel> make_identity_pass(const Element&) {
    return std::make_unique<IdentityKernel>();
}

std::unique_ptr<PassKernel> make_drift_pass(const Element& e) {
    return std::make_unique<DriftKernel>(e.length());
}

std::unique_ptr<PassKernel> make_aperture_pass(const Element& e) {
    auto limits = optional_vector<4>(e, "Limits");
    if (!limits) {
        throw ElementError(fmt::format("In element {}, parameter Limits: attribute is missing",
                                       e.fam_name()));
    }
    return std::make_unique<ApertureKernel>(*limits);
}

} // namespace ringtrack::passmethods
