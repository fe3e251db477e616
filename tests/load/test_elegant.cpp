#include <gtest/gtest.h>
#include "ringtrack/elegant.hpp"
#include "ringtrack/errors.hpp"
#include <string>
#include <vector>

using namespace ringtrack;
using namespace ringtrack::elegant;

namespace {

Element parse(std::string_view definition, const Variables& variables = {}) {
    return element_from_string("e1", definition, variables);
}

std::vector<std::string> names(const std::vector<Element>& line) {
    std::vector<std::string> out;
    for (const auto& e : line) out.push_back(e.fam_name());
    return out;
}

constexpr std::string_view FODO = R"(! FODO ring
d1: drift, l=1.0
qf: quadrupole, l=0.5, k1=1.2
qd: quadrupole, l=0.5, k1=-1.2
cell: line=(qf, d1, qd, d1)
ring: line=(2*cell)
)";

} // namespace

// ─── Text handling ────────────────────────────────────────────────────────────

TEST(Elegant_Lines, CommentsAndBlankLinesDropped) {
    EXPECT_EQ(parse_lines("a\n!b\nc"), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(parse_lines("\n  \nQF: KQUAD  \n"), (std::vector<std::string>{"qf: kquad"}));
}

TEST(Elegant_Lines, ContinuationJoined) {
    EXPECT_EQ(parse_lines("a&\nb"), (std::vector<std::string>{"ab"}));
    EXPECT_EQ(parse_lines("a&\nb\nc"), (std::vector<std::string>{"ab", "c"}));
    EXPECT_EQ(parse_lines("a&\nb&\nc"), (std::vector<std::string>{"abc"}));
}

TEST(Elegant_Split, IgnoresDelimitersInParentheses) {
    EXPECT_EQ(split_ignoring_parentheses("a,b", ','), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(split_ignoring_parentheses("a,b(c,d)", ','),
              (std::vector<std::string>{"a", "b(c,d)"}));
    EXPECT_EQ(split_ignoring_parentheses("l=0,hom(4,0.0,0)", ','),
              (std::vector<std::string>{"l=0", "hom(4,0.0,0)"}));
    EXPECT_EQ(split_ignoring_parentheses("line=(a,b)", '='),
              (std::vector<std::string>{"line", "(a,b)"}));
}

TEST(Elegant_Values, PlainAndQuoted) {
    EXPECT_EQ(handle_value(" 1.5 "), "1.5");
    EXPECT_EQ(handle_value("\"0.5\""), "0.5");
    EXPECT_EQ(handle_value("\"\""), "");
    EXPECT_DOUBLE_EQ(std::stod(handle_value("\"2 3 *\"")), 6.0);
    EXPECT_DOUBLE_EQ(std::stod(handle_value("\"1 4 /\"")), 0.25);
    EXPECT_DOUBLE_EQ(std::stod(handle_value("\"1 4 -\"")), -3.0);
}

TEST(Elegant_Values, MalformedExpressions_Throw) {
    EXPECT_THROW((void)handle_value("\"2 3 *"), ParseError);
    EXPECT_THROW((void)handle_value("\"1 2 ^\""), ParseError);
    EXPECT_THROW((void)handle_value("\"1 2\""), ParseError);
    EXPECT_THROW((void)handle_value("\"a 2 +\""), ParseError);
}

// ─── Elements ─────────────────────────────────────────────────────────────────

TEST(Elegant_Elements, Drift) {
    const auto e = parse("drift, l=1.5");
    EXPECT_EQ(e.kind(), ElementKind::Drift);
    EXPECT_EQ(e.fam_name(), "e1");
    EXPECT_DOUBLE_EQ(e.length(), 1.5);
    EXPECT_EQ(e.pass_method(), "DriftPass");
    EXPECT_EQ(parse("drif").length(), 0.0);
}

TEST(Elegant_Elements, Quadrupole) {
    const auto q = parse("quadrupole, l=0.5, k1=1.2");
    EXPECT_EQ(q.kind(), ElementKind::Quadrupole);
    EXPECT_DOUBLE_EQ(q.k(), 1.2);
    EXPECT_EQ(q.pass_method(), "StrMPoleSymplectic4Pass");
    EXPECT_EQ(q.integer("NumIntSteps"), 10);

    const auto kq = parse("kquad, l=0.5, k1=-1.2, n_kicks=30");
    EXPECT_DOUBLE_EQ(kq.k(), -1.2);
    EXPECT_EQ(kq.integer("NumIntSteps"), 30);

    EXPECT_THROW((void)parse("quadrupole, l=0.5"), ParseError);
}

TEST(Elegant_Elements, SextupoleHalvesK2) {
    const auto s = parse("ksext, l=0.2, k2=39.55");
    EXPECT_EQ(s.kind(), ElementKind::Sextupole);
    EXPECT_DOUBLE_EQ(s.vector("PolynomB")[2], 19.775);
}

TEST(Elegant_Elements, CsbendCarriesEdgesAndMultipoles) {
    const auto b = parse("csben, l=1, angle=0.1, e1=0.05, e2=0.04, hgap=0.0233, fint=0.5, "
                         "k1=0.1, k2=3.0, n_kicks=50");
    EXPECT_EQ(b.kind(), ElementKind::Dipole);
    EXPECT_EQ(b.pass_method(), "BndMPoleSymplectic4Pass");
    EXPECT_DOUBLE_EQ(b.real("BendingAngle"), 0.1);
    EXPECT_DOUBLE_EQ(b.real("EntranceAngle"), 0.05);
    EXPECT_DOUBLE_EQ(b.real("ExitAngle"), 0.04);
    EXPECT_DOUBLE_EQ(b.real("FullGap"), 0.0466);
    EXPECT_DOUBLE_EQ(b.real("FringeInt1"), 0.5);
    EXPECT_DOUBLE_EQ(b.real("FringeInt2"), 0.5);
    EXPECT_EQ(b.integer("NumIntSteps"), 50);

    const auto& poly_b = b.vector("PolynomB");
    ASSERT_EQ(poly_b.size(), 5);
    EXPECT_DOUBLE_EQ(poly_b[1], 0.1);
    EXPECT_DOUBLE_EQ(poly_b[2], 1.5);

    EXPECT_THROW((void)parse("csbend, l=1"), ParseError);
}

TEST(Elegant_Elements, KickerBecomesCorrector) {
    const auto c = parse("kicker, hkick=1e-4, vkick=-2e-4");
    EXPECT_EQ(c.kind(), ElementKind::Corrector);
    EXPECT_DOUBLE_EQ(c.length(), 0.0);
    EXPECT_DOUBLE_EQ(c.vector("KickAngle")[0], 1e-4);
    EXPECT_DOUBLE_EQ(c.vector("KickAngle")[1], -2e-4);
}

TEST(Elegant_Elements, RfCavity) {
    const Variables vars{{"energy", "3.5"}, {"harmonic_number", "992"}};
    const auto c = parse("rfca, l=0, volt=2.5e6, freq=499654000, phase=156.7", vars);
    EXPECT_EQ(c.kind(), ElementKind::RFCavity);
    EXPECT_DOUBLE_EQ(c.real("Voltage"), 2.5e6);
    EXPECT_DOUBLE_EQ(c.real("Frequency"), 499654000.0);
    EXPECT_DOUBLE_EQ(c.real("Energy"), 3.5e9);
    EXPECT_EQ(c.integer("HarmNumber"), 992);
    EXPECT_DOUBLE_EQ(c.real("Phi"), 156.7);
}

TEST(Elegant_Elements, RfCavityWithoutEnergy_LeavesItUnset) {
    const auto c = parse("rfca, volt=1e6, freq=5e8");
    EXPECT_FALSE(c.has("Energy"));
    EXPECT_EQ(c.integer("HarmNumber"), 31);
    EXPECT_THROW((void)parse("rfca, volt=1e6"), ParseError);
}

TEST(Elegant_Elements, MultipoleHom) {
    const auto m = parse("multipole, l=0, hom=(4, 0.0, 0.3)");
    EXPECT_EQ(m.kind(), ElementKind::Multipole);
    const auto& poly_a = m.vector("PolynomA");
    const auto& poly_b = m.vector("PolynomB");
    ASSERT_EQ(poly_b.size(), 4);
    ASSERT_EQ(poly_a.size(), 4);
    EXPECT_DOUBLE_EQ(poly_b[3], 0.3);
    EXPECT_DOUBLE_EQ(poly_a[3], 0.0);
    EXPECT_DOUBLE_EQ(poly_b[0], 0.0);

    EXPECT_THROW((void)parse("multipole, hom=(4, 0.0)"), ParseError);
    EXPECT_THROW((void)parse("multipole, hom=(0, 0.0, 1.0)"), ParseError);
    EXPECT_THROW((void)parse("multipole, hom=4"), ParseError);
}

TEST(Elegant_Elements, MarkerFamilyKeepsExtraParameters) {
    for (const char* type : {"mark", "malign", "recirc", "sreffects", "rcol", "watch",
                             "charge", "monitor"}) {
        EXPECT_EQ(parse(type).kind(), ElementKind::Marker) << type;
    }
    const auto w = parse("watch, filename=out");
    EXPECT_EQ(w.text("filename"), "out");
}

TEST(Elegant_Elements, VariablesAndExpressions) {
    EXPECT_DOUBLE_EQ(parse("drift, l=a", {{"a", "1"}}).length(), 1.0);
    EXPECT_DOUBLE_EQ(parse("drift, l=\"0.5 2 *\"").length(), 1.0);
    EXPECT_DOUBLE_EQ(parse("DRIFT, L=2").length(), 2.0);
}

TEST(Elegant_Elements, Malformed_Throws) {
    try {
        (void)parse("wiggler, l=1");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_NE(std::string(e.what()).find("unknown element type 'wiggler'"),
                  std::string::npos) << e.what();
    }
    EXPECT_THROW((void)parse("drift, l"), ParseError);
    EXPECT_THROW((void)parse("drift, l=x"), ParseError);
}

// ─── Expansion ────────────────────────────────────────────────────────────────

TEST(Elegant_Expand, LastLineByDefault) {
    const auto ring = expand_elegant(FODO);
    EXPECT_EQ(names(ring), (std::vector<std::string>{"qf", "d1", "qd", "d1",
                                                     "qf", "d1", "qd", "d1"}));
    EXPECT_DOUBLE_EQ(ring[0].k(), 1.2);
}

TEST(Elegant_Expand, NamedLine) {
    EXPECT_EQ(expand_elegant(FODO, "cell").size(), 4u);
}

TEST(Elegant_Expand, SingleElementLine) {
    const auto line = expand_elegant("dmult:drift,l=1\ndiad6d:line=(dmult)");
    ASSERT_EQ(line.size(), 1u);
    EXPECT_EQ(line[0].kind(), ElementKind::Drift);
}

TEST(Elegant_Expand, ReversedAndContinuedLines) {
    const auto line = expand_elegant("a: drift, l=1\n"
                                     "b: mark\n"
                                     "c: quadrupole, l=0.2, &\n"
                                     "   k1=0.5\n"
                                     "arc: line=(a, b, c)\n"
                                     "ring: line=(arc, -arc)\n");
    EXPECT_EQ(names(line), (std::vector<std::string>{"a", "b", "c", "c", "b", "a"}));
}

TEST(Elegant_Expand, VariableDefinitions) {
    const auto line = expand_elegant("len = 2.5\n"
                                     "d: drift, l=len\n"
                                     "ring: line=(d)\n");
    ASSERT_EQ(line.size(), 1u);
    EXPECT_DOUBLE_EQ(line[0].length(), 2.5);
}

TEST(Elegant_Expand, EnergyAndHarmonicNumberReachCavities) {
    const auto line = expand_elegant("rf: rfca, volt=1e6, freq=5e8\nring: line=(rf)\n",
                                     {}, 3.0, 400);
    ASSERT_EQ(line.size(), 1u);
    EXPECT_DOUBLE_EQ(line[0].real("Energy"), 3e9);
    EXPECT_EQ(line[0].integer("HarmNumber"), 400);
}

TEST(Elegant_Expand, Errors) {
    EXPECT_THROW((void)expand_elegant(FODO, "arc"), ParseError);
    EXPECT_THROW((void)expand_elegant("d: drift, l=1\n"), ParseError);
    EXPECT_THROW((void)expand_elegant("d: drift, l=1\nring: line=(d, sx)\n"), ParseError);
    EXPECT_THROW((void)expand_elegant("nonsense\n"), ParseError);
}

TEST(Elegant_Expand, HugeRepeatCount_Throws) {
    EXPECT_THROW((void)expand_elegant("d: drift, l=1\nl: line=(999999999*d)\n"), ParseError);
    EXPECT_THROW((void)expand_elegant("d: drift, l=1\n"
                                      "a: line=(1000*d)\n"
                                      "b: line=(1001*a)\n"),
                 ParseError);
}
