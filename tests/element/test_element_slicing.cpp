#include <gtest/gtest.h>
#include "ringtrack/element.hpp"
#include "ringtrack/errors.hpp"
#include <optional>
#include <vector>

using namespace ringtrack;
using namespace ringtrack::elements;

namespace {

constexpr double TOL = 1e-12;

Element bent_dipole() {
    return dipole("b1", 1.0, 0.1, 0.0,
                  {{"EntranceAngle", 0.05},
                   {"ExitAngle", 0.04},
                   {"FringeInt1", 0.5},
                   {"FringeInt2", 0.6},
                   {"T1", vector_value({1e-3, 0, 0, 0, 0, 0})},
                   {"T2", vector_value({-1e-3, 0, 0, 0, 0, 0})}});
}

} // namespace

// ─── divide ───────────────────────────────────────────────────────────────────

TEST(Element_Divide, Drift_LengthsFollowFractions) {
    const std::vector<double> frac{0.3, 0.7};
    auto parts = drift("d", 2.0).divide(frac);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_NEAR(parts[0].length(), 0.6, TOL);
    EXPECT_NEAR(parts[1].length(), 1.4, TOL);
    EXPECT_EQ(parts[0].fam_name(), "d");
    EXPECT_EQ(parts[1].pass_method(), "DriftPass");
}

TEST(Element_Divide, SingleFraction_CopiesElement) {
    const std::vector<double> frac{1.0};
    const auto q = quadrupole("q", 0.4, 1.0);
    auto parts = q.divide(frac);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], q);
}

TEST(Element_Divide, Dipole_BendingAngleSplitProportionally) {
    const std::vector<double> frac{0.25, 0.75};
    auto parts = bent_dipole().divide(frac);
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_NEAR(parts[0].real("BendingAngle"), 0.025, TOL);
    EXPECT_NEAR(parts[1].real("BendingAngle"), 0.075, TOL);
}

TEST(Element_Divide, FractionsNotSummingToOne_AngleStillProportional) {
    // Two slices of 20 % each: half the angle each, 40 % of the length total.
    const std::vector<double> frac{0.2, 0.2};
    auto parts = bent_dipole().divide(frac);
    EXPECT_NEAR(parts[0].length(), 0.2, TOL);
    EXPECT_NEAR(parts[0].real("BendingAngle"), 0.05, TOL);
    EXPECT_NEAR(parts[1].real("BendingAngle"), 0.05, TOL);
}

TEST(Element_Divide, EntranceAndExitAttributesOnEndSlicesOnly) {
    const std::vector<double> frac{0.2, 0.3, 0.5};
    auto parts = bent_dipole().divide(frac);
    ASSERT_EQ(parts.size(), 3u);

    EXPECT_TRUE(parts[0].has("EntranceAngle"));
    EXPECT_TRUE(parts[0].has("FringeInt1"));
    EXPECT_TRUE(parts[0].has("T1"));
    EXPECT_FALSE(parts[0].has("ExitAngle"));
    EXPECT_FALSE(parts[0].has("T2"));

    for (const char* key : {"EntranceAngle", "ExitAngle", "FringeInt1", "FringeInt2", "T1", "T2"}) {
        EXPECT_FALSE(parts[1].has(key)) << key;
    }

    EXPECT_TRUE(parts[2].has("ExitAngle"));
    EXPECT_TRUE(parts[2].has("FringeInt2"));
    EXPECT_TRUE(parts[2].has("T2"));
    EXPECT_FALSE(parts[2].has("EntranceAngle"));
    EXPECT_DOUBLE_EQ(parts[2].real("ExitAngle"), 0.04);
}

TEST(Element_Divide, KeepAxis_MisalignmentOnEverySlice) {
    const std::vector<double> frac{0.5, 0.5};
    auto parts = bent_dipole().divide(frac, true);
    for (const auto& p : parts) {
        EXPECT_TRUE(p.has("T1"));
        EXPECT_TRUE(p.has("T2"));
    }
    EXPECT_TRUE(parts[0].has("EntranceAngle"));
    EXPECT_FALSE(parts[1].has("EntranceAngle"));
    EXPECT_FALSE(parts[0].has("ExitAngle"));
}

TEST(Element_Divide, ThinElement_Throws) {
    const std::vector<double> frac{0.5, 0.5};
    EXPECT_THROW((void)marker("m").divide(frac), ElementError);
    EXPECT_THROW((void)rf_cavity("rf", 0.0, 1e6, 5e8, 31, 3e9).divide(frac), ElementError);
}

TEST(Element_Divide, EmptyFractions_Throws) {
    const std::vector<double> frac;
    EXPECT_THROW((void)drift("d", 1.0).divide(frac), ElementError);
}

// ─── insert ───────────────────────────────────────────────────────────────────

TEST(Element_Insert, MarkerInMiddle_SplitsDriftInHalves) {
    const std::vector<Element::Insertion> ins{{0.5, marker("m")}};
    auto line = drift("d", 2.0).insert(ins);
    ASSERT_EQ(line.size(), 3u);
    EXPECT_NEAR(line[0].length(), 1.0, TOL);
    EXPECT_EQ(line[1].kind(), ElementKind::Marker);
    EXPECT_NEAR(line[2].length(), 1.0, TOL);
}

TEST(Element_Insert, LongElement_DriftShortenedAroundIt) {
    const std::vector<Element::Insertion> ins{{0.5, quadrupole("q", 0.2, 1.0)}};
    auto line = drift("d", 1.0).insert(ins);
    ASSERT_EQ(line.size(), 3u);
    EXPECT_NEAR(line[0].length(), 0.4, TOL);
    EXPECT_EQ(line[1].fam_name(), "q");
    EXPECT_NEAR(line[2].length(), 0.4, TOL);

    double total = 0.0;
    for (const auto& e : line) total += e.length();
    EXPECT_NEAR(total, 1.0, TOL);
}

TEST(Element_Insert, AtEntrance_ZeroLengthPieceDropped) {
    const std::vector<Element::Insertion> ins{{0.0, marker("m")}};
    auto line = drift("d", 1.0).insert(ins);
    ASSERT_EQ(line.size(), 2u);
    EXPECT_EQ(line[0].kind(), ElementKind::Marker);
    EXPECT_NEAR(line[1].length(), 1.0, TOL);
}

TEST(Element_Insert, NoElement_OnlySplits) {
    const std::vector<Element::Insertion> ins{{0.25, std::nullopt}, {0.75, std::nullopt}};
    auto line = drift("d", 1.0).insert(ins);
    ASSERT_EQ(line.size(), 3u);
    EXPECT_NEAR(line[0].length(), 0.25, TOL);
    EXPECT_NEAR(line[1].length(), 0.5, TOL);
    EXPECT_NEAR(line[2].length(), 0.25, TOL);
}

TEST(Element_Insert, Overlapping_NegativeDriftAllowed) {
    const std::vector<Element::Insertion> ins{{0.5, quadrupole("q1", 0.4, 1.0)},
                                              {0.6, quadrupole("q2", 0.4, 1.0)}};
    auto line = drift("d", 1.0).insert(ins);
    ASSERT_EQ(line.size(), 5u);
    EXPECT_LT(line[2].length(), 0.0);
}

TEST(Element_Insert, NotADrift_Throws) {
    const std::vector<Element::Insertion> ins{{0.5, marker("m")}};
    EXPECT_THROW((void)quadrupole("q", 1.0, 1.0).insert(ins), ElementError);
    EXPECT_THROW((void)drift("d", 0.0).insert(ins), ElementError);
}
