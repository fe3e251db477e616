#include <gtest/gtest.h>
#include "ringtrack/constants.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/tracy.hpp"
#include <string>
#include <vector>

using namespace ringtrack;
using namespace ringtrack::tracy;

namespace {

constexpr double DEG = constants::PI / 180.0;

Element parse(std::string_view definition, const Variables& variables = {}) {
    return element_from_string("e1", definition, variables);
}

std::vector<std::string> names(const std::vector<Element>& line) {
    std::vector<std::string> out;
    for (const auto& e : line) out.push_back(e.fam_name());
    return out;
}

constexpr std::string_view SMALL_RING = R"(
define lattice;
{ a small ring }
energy = 3.0;
nq = 10;
d1 : drift, l = 1.0;
qf : quadrupole, l = 0.5, k = 1.2, n = nq;
b1 : bending, l = 1.0, t = 10.0, t1 = 2.0, t2 = 3.0, k = 0.0, n = nq;
sup : qf, d1, b1;
cell : sup, inv(sup), 2*d1;
end;
)";

} // namespace

// ─── Text handling ────────────────────────────────────────────────────────────

TEST(Tracy_Text, StripComments) {
    EXPECT_EQ(strip_comments("a{}b"), "ab");
    EXPECT_EQ(strip_comments("A { comment ; } B\n C"), "abc");
    EXPECT_EQ(strip_comments("{ unterminated"), "");
}

TEST(Tracy_Text, ParseLinesSplitsOnSemicolons) {
    EXPECT_EQ(parse_lines("define lattice;\nd : drift, l=1;"),
              (std::vector<std::string>{"definelattice", "d:drift,l=1", ""}));
}

// ─── Elements ─────────────────────────────────────────────────────────────────

TEST(Tracy_Elements, Drift) {
    const auto d = parse("drift,l=1.5");
    EXPECT_EQ(d.kind(), ElementKind::Drift);
    EXPECT_DOUBLE_EQ(d.length(), 1.5);
    EXPECT_DOUBLE_EQ(parse("drift").length(), 0.0);
}

TEST(Tracy_Elements, QuadrupoleWithSteps) {
    const auto q = parse("quadrupole,l=0.5,k=1.2,n=nquad,method=4", {{"nquad", "10"}});
    EXPECT_EQ(q.kind(), ElementKind::Quadrupole);
    EXPECT_DOUBLE_EQ(q.k(), 1.2);
    EXPECT_EQ(q.pass_method(), "StrMPoleSymplectic4Pass");
    EXPECT_EQ(q.integer("NumIntSteps"), 10);
    EXPECT_DOUBLE_EQ(q.real("method"), 4.0);
    EXPECT_THROW((void)parse("quadrupole,k=1.2"), ParseError);
}

TEST(Tracy_Elements, BendingAnglesInDegrees) {
    const auto b = parse("bending,l=1,t=10,t1=5,t2=4,k=-0.1");
    EXPECT_EQ(b.kind(), ElementKind::Dipole);
    EXPECT_EQ(b.pass_method(), "BndMPoleSymplectic4Pass");
    EXPECT_DOUBLE_EQ(b.real("BendingAngle"), 10.0 * DEG);
    EXPECT_DOUBLE_EQ(b.real("EntranceAngle"), 5.0 * DEG);
    EXPECT_DOUBLE_EQ(b.real("ExitAngle"), 4.0 * DEG);
    EXPECT_DOUBLE_EQ(b.k(), -0.1);
    EXPECT_THROW((void)parse("bending,l=1,t=10,t2=4"), ParseError);
}

TEST(Tracy_Elements, Sextupole) {
    const auto s = parse("sextupole,l=0.2,k=12");
    EXPECT_EQ(s.kind(), ElementKind::Sextupole);
    EXPECT_DOUBLE_EQ(s.vector("PolynomB")[2], 12.0);
    EXPECT_DOUBLE_EQ(parse("sextupole").length(), 0.0);
}

TEST(Tracy_Elements, Cavity) {
    const auto c = parse("cavity,l=0,voltage=2e6,frequency=5e8", {{"energy", "3"}});
    EXPECT_EQ(c.kind(), ElementKind::RFCavity);
    EXPECT_DOUBLE_EQ(c.real("Voltage"), 2e6);
    EXPECT_DOUBLE_EQ(c.real("Frequency"), 5e8);
    EXPECT_DOUBLE_EQ(c.real("Energy"), 3e9);
    EXPECT_EQ(c.integer("HarmNumber"), 31);

    EXPECT_FALSE(parse("cavity,l=0,voltage=2e6,frequency=5e8").has("Energy"));
}

TEST(Tracy_Elements, MultipoleCorrectorMarker) {
    const auto m = parse("multipole,l=0");
    EXPECT_EQ(m.kind(), ElementKind::Multipole);
    EXPECT_EQ(m.vector("PolynomB").size(), 4);

    // Corrector parameters are not read.
    const auto c = parse("corrector,horizontal,l=0.1");
    EXPECT_EQ(c.kind(), ElementKind::Corrector);
    EXPECT_DOUBLE_EQ(c.length(), 0.0);
    EXPECT_TRUE(c.vector("KickAngle").isZero());

    EXPECT_EQ(parse("marker").kind(), ElementKind::Marker);
    EXPECT_EQ(parse("beampositionmonitor").kind(), ElementKind::Marker);
}

TEST(Tracy_Elements, Malformed_Throws) {
    EXPECT_THROW((void)parse("wiggler,l=1"), ParseError);
    EXPECT_THROW((void)parse("drift,l"), ParseError);
    EXPECT_THROW((void)parse("quadrupole,l=0.5,n=1.5"), ParseError);
}

// ─── Expansion ────────────────────────────────────────────────────────────────

TEST(Tracy_Expand, MinimalLattice) {
    for (const char* contents : {"define lattice;dmult:drift,l=1;cell:dmult;end",
                                 "define lattice;dmult:drift,l=1;cell:dmult;end;"}) {
        const auto expansion = expand_tracy(contents);
        ASSERT_EQ(expansion.elements.size(), 1u) << contents;
        EXPECT_EQ(expansion.elements[0].kind(), ElementKind::Drift);
        EXPECT_FALSE(expansion.energy.has_value());
    }
}

TEST(Tracy_Expand, SmallRing) {
    const auto expansion = expand_tracy(SMALL_RING);
    EXPECT_EQ(names(expansion.elements),
              (std::vector<std::string>{"qf", "d1", "b1", "b1", "d1", "qf", "d1", "d1"}));
    ASSERT_TRUE(expansion.energy.has_value());
    EXPECT_DOUBLE_EQ(*expansion.energy, 3e9);

    const auto& qf = expansion.elements[0];
    EXPECT_EQ(qf.integer("NumIntSteps"), 10);

    // inv() swaps the faces of the reversed bend.
    EXPECT_DOUBLE_EQ(expansion.elements[2].real("EntranceAngle"), 2.0 * DEG);
    EXPECT_DOUBLE_EQ(expansion.elements[3].real("EntranceAngle"), 3.0 * DEG);
    EXPECT_DOUBLE_EQ(expansion.elements[3].real("ExitAngle"), 2.0 * DEG);
}

TEST(Tracy_Expand, FramingErrors) {
    EXPECT_THROW((void)expand_tracy(""), ParseError);
    EXPECT_THROW((void)expand_tracy("d:drift,l=1;cell:d;end;"), ParseError);
    EXPECT_THROW((void)expand_tracy("define lattice;d:drift,l=1;cell:d;"), ParseError);
}

TEST(Tracy_Expand, ContentErrors) {
    EXPECT_THROW((void)expand_tracy("define lattice;d:drift,l=1;ring:d;end;"), ParseError);
    EXPECT_THROW((void)expand_tracy("define lattice;d:drift,l=1;cell:d,sx;end;"), ParseError);
    EXPECT_THROW((void)expand_tracy("define lattice;nonsense;end;"), ParseError);
}
