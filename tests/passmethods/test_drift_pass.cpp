#include <gtest/gtest.h>
#include "ringtrack/errors.hpp"
#include "ringtrack/pass_method.hpp"
#include <cmath>

using namespace ringtrack;
using namespace ringtrack::elements;

namespace {

PhaseVector particle(double x, double px, double y, double py, double delta, double ct) {
    PhaseVector r;
    r << x, px, y, py, delta, ct;
    return r;
}

ParticleMatrix bunch(const PhaseVector& r) {
    ParticleMatrix m = r;
    return m;
}

} // namespace

// ─── IdentityPass ─────────────────────────────────────────────────────────────

TEST(Pass_Identity, Marker_LeavesRandomParticlesUnchanged) {
    ParticleMatrix rin = ParticleMatrix::Random(NUM_COORDS, 5) * 1e-3;
    const ParticleMatrix original = rin;
    PreparedElement(marker("m")).pass(rin);
    EXPECT_EQ(rin, original);
}

TEST(Pass_Identity, Monitor_LeavesParticleUnchanged) {
    ParticleMatrix rin = bunch(particle(1e-3, -2e-4, 3e-4, 1e-5, 1e-3, 0.1));
    const ParticleMatrix original = rin;
    PreparedElement(monitor("bpm")).pass(rin);
    EXPECT_EQ(rin, original);
}

// ─── DriftPass ────────────────────────────────────────────────────────────────

TEST(Pass_Drift, TransverseMomentum_MovesAndLengthensPath) {
    ParticleMatrix rin = bunch(particle(0.0, 1e-6, 0.0, -2e-6, 0.0, 0.0));
    PreparedElement(drift("d1", 1.0)).pass(rin);
    EXPECT_DOUBLE_EQ(rin(X, 0), 1e-6);
    EXPECT_DOUBLE_EQ(rin(PX, 0), 1e-6);
    EXPECT_DOUBLE_EQ(rin(Y, 0), -2e-6);
    EXPECT_DOUBLE_EQ(rin(PY, 0), -2e-6);
    EXPECT_DOUBLE_EQ(rin(DELTA, 0), 0.0);
    EXPECT_DOUBLE_EQ(rin(CT, 0), 2.5e-12);
}

TEST(Pass_Drift, OffsetOnly_Unchanged) {
    ParticleMatrix rin = bunch(particle(1e-6, 0.0, 2e-6, 0.0, 0.0, 0.0));
    const ParticleMatrix original = rin;
    PreparedElement(drift("d1", 1.0)).pass(rin);
    EXPECT_EQ(rin, original);
}

TEST(Pass_Drift, TwoParticles_TrackedIndependently) {
    ParticleMatrix rin = ParticleMatrix::Zero(NUM_COORDS, 2);
    rin(PX, 0) = 1e-6;
    rin(PY, 1) = 2e-6;
    PreparedElement(drift("d1", 1.0)).pass(rin);
    EXPECT_DOUBLE_EQ(rin(X, 0), 1e-6);
    EXPECT_DOUBLE_EQ(rin(Y, 0), 0.0);
    EXPECT_DOUBLE_EQ(rin(X, 1), 0.0);
    EXPECT_DOUBLE_EQ(rin(Y, 1), 2e-6);
    EXPECT_DOUBLE_EQ(rin(CT, 0), 5e-13);
    EXPECT_DOUBLE_EQ(rin(CT, 1), 2e-12);
}

TEST(Pass_Drift, MomentumDeviation_ScalesAngle) {
    ParticleMatrix rin = bunch(particle(0.0, 1e-3, 0.0, 0.0, 0.01, 0.0));
    PreparedElement(drift("d1", 2.0)).pass(rin);
    EXPECT_NEAR(rin(X, 0), 2.0 * 1e-3 / 1.01, 1e-15);
}

TEST(Pass_Drift, MissingLength_Throws) {
    auto d = drift("d1", 1.0);
    d.erase("Length");
    EXPECT_THROW(PreparedElement{d}, ElementError);
}

// ─── AperturePass ─────────────────────────────────────────────────────────────

TEST(Pass_Aperture, Inside_Unchanged) {
    auto ap = aperture("ap", Eigen::Vector4d(-1e-3, 1e-3, -1e-4, 1e-4));
    ParticleMatrix rin = bunch(particle(1e-5, 0.0, -1e-5, 0.0, 0.0, 0.0));
    const ParticleMatrix original = rin;
    PreparedElement(ap).pass(rin);
    EXPECT_EQ(rin, original);
}

TEST(Pass_Aperture, Outside_MarkedLost) {
    auto ap = aperture("ap", Eigen::Vector4d(-1e-3, 1e-3, -1e-4, 1e-4));
    ParticleMatrix rin = bunch(particle(1e-2, 0.0, -1e-2, 0.0, 0.0, 0.0));
    PreparedElement(ap).pass(rin);
    EXPECT_TRUE(std::isinf(rin(X, 0)));
    EXPECT_DOUBLE_EQ(rin(Y, 0), -1e-2);
    EXPECT_TRUE(is_lost(rin.col(0)));
}

TEST(Pass_Aperture, VerticalLimitOnly_MarkedLost) {
    auto ap = aperture("ap", Eigen::Vector4d(-1e-3, 1e-3, -1e-4, 1e-4));
    ParticleMatrix rin = bunch(particle(0.0, 0.0, 2e-4, 0.0, 0.0, 0.0));
    PreparedElement(ap).pass(rin);
    EXPECT_TRUE(is_lost(rin.col(0)));
}

TEST(Pass_Aperture, MissingLimits_Throws) {
    Element ap(ElementKind::Aperture, "ap", 0.0, "AperturePass");
    EXPECT_THROW(PreparedElement{ap}, ElementError);
}
