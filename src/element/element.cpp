/// @file src/element/element.cpp
/// @brief Element core fields, attribute conversion and typed access.

#include "ringtrack/element.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>

namespace ringtrack {

namespace {

// ─── Attribute conversion table ───────────────────────────────────────────────

/// Canonical type of a known attribute.
enum class Shape {
    Real,
    Integer,
    Vector,   ///< real vector of any length
    Vector2,
    Vector4,
    Vector6,
    Matrix6,
};

/// Known attributes and their canonical shapes. Attributes not listed here
/// are stored as given.
std::optional<Shape> shape_of(std::string_view key) noexcept {
    struct Entry {
        std::string_view key;
        Shape            shape;
    };
    static constexpr Entry TABLE[] = {
        {"R1", Shape::Matrix6},          {"R2", Shape::Matrix6},
        {"M66", Shape::Matrix6},         {"T1", Shape::Vector6},
        {"T2", Shape::Vector6},          {"RApertures", Shape::Vector4},
        {"Limits", Shape::Vector4},      {"EApertures", Shape::Vector2},
        {"PolynomA", Shape::Vector},     {"PolynomB", Shape::Vector},
        {"KickAngle", Shape::Vector},    {"Energy", Shape::Real},
        {"BendingAngle", Shape::Real},   {"EntranceAngle", Shape::Real},
        {"ExitAngle", Shape::Real},      {"Voltage", Shape::Real},
        {"Frequency", Shape::Real},      {"TimeLag", Shape::Real},
        {"K", Shape::Real},              {"FullGap", Shape::Real},
        {"FringeInt1", Shape::Real},     {"FringeInt2", Shape::Real},
        {"MaxOrder", Shape::Integer},    {"NumIntSteps", Shape::Integer},
        {"HarmNumber", Shape::Integer},  {"Periodicity", Shape::Integer},
        {"FringeQuadEntrance", Shape::Integer},
        {"FringeQuadExit", Shape::Integer},
        {"FringeBendEntrance", Shape::Integer},
        {"FringeBendExit", Shape::Integer},
    };
    for (const auto& e : TABLE) {
        if (e.key == key) return e.shape;
    }
    return std::nullopt;
}

/// Parse a whole string as a double. nullopt on any trailing garbage.
std::optional<double> parse_real(std::string_view s) noexcept {
    double v = 0.0;
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return v;
}

/// Outcome of a conversion: the converted value, or a reason for failure.
struct Converted {
    std::optional<ParamValue> value;
    std::string               reason;
};

Converted to_real(const ParamValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return {*d, {}};
    if (const auto* l = std::get_if<long>(&v)) return {static_cast<double>(*l), {}};
    if (const auto* s = std::get_if<std::string>(&v)) {
        if (auto r = parse_real(*s)) return {*r, {}};
        return {std::nullopt, fmt::format("could not convert string to float: '{}'", *s)};
    }
    if (const auto* vec = std::get_if<Eigen::VectorXd>(&v); vec && vec->size() == 1) {
        return {(*vec)(0), {}};
    }
    return {std::nullopt, "expected a real number"};
}

Converted to_integer(const ParamValue& v) {
    if (const auto* l = std::get_if<long>(&v)) return {*l, {}};
    auto real = to_real(v);
    if (!real.value) {
        return {std::nullopt, real.reason.empty() ? "expected an integer" : real.reason};
    }
    const double d = std::get<double>(*real.value);
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return {std::nullopt, fmt::format("expected an integer, got {}", d)};
    }
    return {static_cast<long>(d), {}};
}

Converted to_vector(const ParamValue& v, Eigen::Index required) {
    Eigen::VectorXd out;
    if (const auto* vec = std::get_if<Eigen::VectorXd>(&v)) {
        out = *vec;
    } else if (const auto* mat = std::get_if<Eigen::MatrixXd>(&v)) {
        out = Eigen::Map<const Eigen::VectorXd>(mat->data(), mat->size());
    } else {
        auto real = to_real(v);
        if (!real.value) return {std::nullopt, real.reason};
        out = Eigen::VectorXd::Constant(1, std::get<double>(*real.value));
    }
    if (required > 0 && out.size() != required) {
        return {std::nullopt,
                fmt::format("cannot reshape array of size {} into shape ({},)",
                            out.size(), required)};
    }
    return {ParamValue{std::move(out)}, {}};
}

Converted to_matrix6(const ParamValue& v) {
    Eigen::MatrixXd out;
    if (const auto* mat = std::get_if<Eigen::MatrixXd>(&v)) {
        if (mat->size() != NUM_COORDS * NUM_COORDS) {
            return {std::nullopt,
                    fmt::format("cannot reshape array of size {} into shape (6,6)",
                                mat->size())};
        }
        out = mat->reshaped(NUM_COORDS, NUM_COORDS);
    } else if (const auto* vec = std::get_if<Eigen::VectorXd>(&v)) {
        if (vec->size() != NUM_COORDS * NUM_COORDS) {
            return {std::nullopt,
                    fmt::format("cannot reshape array of size {} into shape (6,6)",
                                vec->size())};
        }
        out = vec->reshaped(NUM_COORDS, NUM_COORDS);
    } else {
        return {std::nullopt, "expected a 6x6 matrix"};
    }
    return {ParamValue{std::move(out)}, {}};
}

Converted convert(Shape shape, const ParamValue& v) {
    switch (shape) {
        case Shape::Real:    return to_real(v);
        case Shape::Integer: return to_integer(v);
        case Shape::Vector:  return to_vector(v, 0);
        case Shape::Vector2: return to_vector(v, 2);
        case Shape::Vector4: return to_vector(v, 4);
        case Shape::Vector6: return to_vector(v, 6);
        case Shape::Matrix6: return to_matrix6(v);
    }
    return {std::nullopt, "unknown attribute shape"};
}

bool has_quadrupole_k(ElementKind kind) noexcept {
    return kind == ElementKind::Quadrupole || kind == ElementKind::Dipole;
}

} // namespace

// ─── ElementKind ──────────────────────────────────────────────────────────────

std::string_view to_string(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::Marker:        return "Marker";
        case ElementKind::Monitor:       return "Monitor";
        case ElementKind::Aperture:      return "Aperture";
        case ElementKind::Drift:         return "Drift";
        case ElementKind::ThinMultipole: return "ThinMultipole";
        case ElementKind::Multipole:     return "Multipole";
        case ElementKind::Dipole:        return "Dipole";
        case ElementKind::Quadrupole:    return "Quadrupole";
        case ElementKind::Sextupole:     return "Sextupole";
        case ElementKind::Octupole:      return "Octupole";
        case ElementKind::RFCavity:      return "RFCavity";
        case ElementKind::RingParam:     return "RingParam";
        case ElementKind::M66:           return "M66";
        case ElementKind::Corrector:     return "Corrector";
    }
    return "Element";
}

bool is_long_kind(ElementKind kind) noexcept {
    switch (kind) {
        case ElementKind::Drift:
        case ElementKind::Multipole:
        case ElementKind::Dipole:
        case ElementKind::Quadrupole:
        case ElementKind::Sextupole:
        case ElementKind::Octupole:
        case ElementKind::Corrector:
            return true;
        default:
            return false;
    }
}

// ─── ParamValue helpers ───────────────────────────────────────────────────────

bool same_value(const ParamValue& a, const ParamValue& b) noexcept {
    if (a.index() != b.index()) return false;

    if (const auto* va = std::get_if<Eigen::VectorXd>(&a)) {
        const auto& vb = std::get<Eigen::VectorXd>(b);
        return va->size() == vb.size() && (va->array() == vb.array()).all();
    }
    if (const auto* ma = std::get_if<Eigen::MatrixXd>(&a)) {
        const auto& mb = std::get<Eigen::MatrixXd>(b);
        return ma->rows() == mb.rows() && ma->cols() == mb.cols() &&
               (ma->array() == mb.array()).all();
    }
    if (const auto* da = std::get_if<double>(&a)) return *da == std::get<double>(b);
    if (const auto* la = std::get_if<long>(&a)) return *la == std::get<long>(b);
    return std::get<std::string>(a) == std::get<std::string>(b);
}

ParamValue vector_value(std::initializer_list<double> values) {
    Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
    Eigen::Index i = 0;
    for (double x : values) v(i++) = x;
    return v;
}

// ─── Element: construction and core fields ────────────────────────────────────

Element::Element(ElementKind kind,
                 std::string fam_name,
                 double length,
                 std::string pass_method)
    : kind_(kind)
    , fam_name_(std::move(fam_name))
    , length_(length)
    , pass_method_(std::move(pass_method)) {}

double Element::length() const {
    if (!length_) fail("Length", "attribute is missing");
    return *length_;
}

const std::string& Element::pass_method() const {
    if (!pass_method_) fail("PassMethod", "attribute is missing");
    return *pass_method_;
}

void Element::fail(std::string_view key, std::string_view reason) const {
    throw ElementError(fmt::format("In element {}, parameter {}: {}",
                                   fam_name_, key, reason));
}

// ─── Element: attribute writes ────────────────────────────────────────────────

void Element::set(const std::string& key, ParamValue value) {
    if (key == "FamName") {
        const auto* s = std::get_if<std::string>(&value);
        if (!s) fail(key, "expected a string");
        fam_name_ = *s;
        return;
    }
    if (key == "PassMethod") {
        const auto* s = std::get_if<std::string>(&value);
        if (!s) fail(key, "expected a string");
        pass_method_ = *s;
        return;
    }
    if (key == "Length") {
        auto real = to_real(value);
        if (!real.value) fail(key, real.reason);
        length_ = std::get<double>(*real.value);
        return;
    }

    const auto shape = shape_of(key);
    if (!shape) {
        attrs_.insert_or_assign(key, std::move(value));
        return;
    }

    auto converted = convert(*shape, value);
    if (!converted.value) fail(key, converted.reason);

    if (key == "K" && has_quadrupole_k(kind_)) {
        set_k(std::get<double>(*converted.value));
        return;
    }
    attrs_.insert_or_assign(key, std::move(*converted.value));
}

void Element::update(const Attributes& attrs) {
    Element staged = *this;
    for (const auto& [key, value] : attrs) {
        staged.set(key, value);
    }
    *this = std::move(staged);
}

bool Element::has(std::string_view key) const noexcept {
    if (key == "FamName") return true;
    if (key == "Length") return length_.has_value();
    if (key == "PassMethod") return pass_method_.has_value();
    if (key == "K" && has_quadrupole_k(kind_)) {
        const auto* b = find("PolynomB");
        const auto* v = b ? std::get_if<Eigen::VectorXd>(b) : nullptr;
        return v && v->size() > 1;
    }
    return attrs_.find(std::string(key)) != attrs_.end();
}

bool Element::erase(std::string_view key) {
    if (key == "Length") {
        const bool had = length_.has_value();
        length_.reset();
        return had;
    }
    if (key == "PassMethod") {
        const bool had = pass_method_.has_value();
        pass_method_.reset();
        return had;
    }
    return attrs_.erase(std::string(key)) > 0;
}

// ─── Element: typed reads ─────────────────────────────────────────────────────

const ParamValue* Element::find(std::string_view key) const noexcept {
    auto it = attrs_.find(std::string(key));
    return it == attrs_.end() ? nullptr : &it->second;
}

double Element::real(std::string_view key) const {
    if (key == "Length") return length();
    if (key == "K" && has_quadrupole_k(kind_)) return k();

    const auto* v = find(key);
    if (!v) fail(key, "attribute is missing");
    auto real = to_real(*v);
    if (!real.value) fail(key, real.reason);
    return std::get<double>(*real.value);
}

double Element::real_or(std::string_view key, double fallback) const {
    return has(key) ? real(key) : fallback;
}

long Element::integer(std::string_view key) const {
    const auto* v = find(key);
    if (!v) fail(key, "attribute is missing");
    auto integer = to_integer(*v);
    if (!integer.value) fail(key, integer.reason);
    return std::get<long>(*integer.value);
}

long Element::integer_or(std::string_view key, long fallback) const {
    return has(key) ? integer(key) : fallback;
}

const Eigen::VectorXd& Element::vector(std::string_view key) const {
    const auto* v = find(key);
    if (!v) fail(key, "attribute is missing");
    const auto* vec = std::get_if<Eigen::VectorXd>(v);
    if (!vec) fail(key, "expected a real vector");
    return *vec;
}

const Eigen::MatrixXd& Element::matrix(std::string_view key) const {
    const auto* v = find(key);
    if (!v) fail(key, "attribute is missing");
    const auto* mat = std::get_if<Eigen::MatrixXd>(v);
    if (!mat) fail(key, "expected a real matrix");
    return *mat;
}

const std::string& Element::text(std::string_view key) const {
    if (key == "FamName") return fam_name_;
    if (key == "PassMethod") return pass_method();
    const auto* v = find(key);
    if (!v) fail(key, "attribute is missing");
    const auto* s = std::get_if<std::string>(v);
    if (!s) fail(key, "expected a string");
    return *s;
}

// ─── Element: quadrupole strength ─────────────────────────────────────────────

double Element::k() const {
    const auto& b = vector("PolynomB");
    if (b.size() < 2) fail("PolynomB", "no quadrupole component");
    return b(1);
}

void Element::set_k(double strength) {
    auto it = attrs_.find("PolynomB");
    if (it == attrs_.end()) {
        attrs_.emplace("PolynomB", vector_value({0.0, strength}));
        return;
    }
    auto* b = std::get_if<Eigen::VectorXd>(&it->second);
    if (!b) fail("PolynomB", "expected a real vector");
    if (b->size() < 2) b->conservativeResizeLike(Eigen::VectorXd::Zero(2));
    (*b)(1) = strength;
}

// ─── Equality ─────────────────────────────────────────────────────────────────

bool operator==(const Element& a, const Element& b) noexcept {
    if (a.kind_ != b.kind_ || a.fam_name_ != b.fam_name_ ||
        a.length_ != b.length_ || a.pass_method_ != b.pass_method_ ||
        a.attrs_.size() != b.attrs_.size()) {
        return false;
    }
    auto ib = b.attrs_.begin();
    for (const auto& [key, value] : a.attrs_) {
        if (key != ib->first || !same_value(value, ib->second)) return false;
        ++ib;
    }
    return true;
}

} // namespace ringtrack
