/// @file src/element/element_format.cpp
/// @brief Human-readable element listings.

#include "ringtrack/element.hpp"

#include <fmt/format.h>

#include <string>
#include <vector>

namespace ringtrack {

namespace {

std::string format_vector(const Eigen::VectorXd& v) {
    std::vector<double> values(v.data(), v.data() + v.size());
    return fmt::format("[{}]", fmt::join(values, ", "));
}

/// Arguments printed positionally by `repr`, per kind.
std::vector<std::string_view> required_keys(ElementKind kind) {
    switch (kind) {
        case ElementKind::Aperture:      return {"Limits"};
        case ElementKind::Drift:         return {"Length"};
        case ElementKind::ThinMultipole: return {"PolynomA", "PolynomB"};
        case ElementKind::Multipole:
        case ElementKind::Octupole:      return {"Length", "PolynomA", "PolynomB"};
        case ElementKind::Dipole:        return {"Length", "BendingAngle", "K"};
        case ElementKind::Quadrupole:    return {"Length", "K"};
        case ElementKind::Sextupole:     return {"Length"};
        case ElementKind::RFCavity:
            return {"Length", "Voltage", "Frequency", "HarmNumber", "Energy"};
        case ElementKind::RingParam:     return {"Energy"};
        case ElementKind::Corrector:     return {"Length", "KickAngle"};
        default:                         return {};
    }
}

std::string repr_value(const ParamValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return fmt::format("'{}'", *s);
    return format_value(v);
}

} // namespace

std::string format_value(const ParamValue& v) {
    if (const auto* d = std::get_if<double>(&v)) return fmt::format("{}", *d);
    if (const auto* l = std::get_if<long>(&v)) return fmt::format("{}", *l);
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* vec = std::get_if<Eigen::VectorXd>(&v)) return format_vector(*vec);

    const auto& m = std::get<Eigen::MatrixXd>(v);
    std::vector<std::string> rows;
    rows.reserve(static_cast<std::size_t>(m.rows()));
    for (Eigen::Index r = 0; r < m.rows(); ++r) {
        rows.push_back(format_vector(m.row(r).transpose()));
    }
    return fmt::format("[{}]", fmt::join(rows, ", "));
}

std::string Element::to_string() const {
    std::string out = fmt::format("{}:\nFamName : {}", ringtrack::to_string(kind_), fam_name_);
    if (length_) out += fmt::format("\nLength : {}", *length_);
    if (pass_method_) out += fmt::format("\nPassMethod : {}", *pass_method_);
    for (const auto& [key, value] : attrs_) {
        out += fmt::format("\n{} : {}", key, format_value(value));
    }
    return out;
}

std::string Element::repr() const {
    const Element reference = elements::default_like(*this);
    const auto required = required_keys(kind_);

    std::vector<std::string> args;
    args.push_back(fmt::format("'{}'", fam_name_));
    for (auto key : required) {
        if (key == "Length") {
            if (length_) args.push_back(fmt::format("{}", *length_));
        } else if (key == "K") {
            if (has("K")) args.push_back(fmt::format("{}", k()));
        } else if (const auto* v = find(key)) {
            args.push_back(repr_value(*v));
        }
    }

    auto is_required = [&](std::string_view key) {
        for (auto r : required) {
            if (r == key) return true;
        }
        return false;
    };

    if (length_ && !is_required("Length") && reference.length_ != length_) {
        args.push_back(fmt::format("Length={}", *length_));
    }
    if (pass_method_ && reference.pass_method_ != pass_method_) {
        args.push_back(fmt::format("PassMethod='{}'", *pass_method_));
    }
    for (const auto& [key, value] : attrs_) {
        if (is_required(key)) continue;
        const auto* def = reference.find(key);
        if (def && same_value(*def, value)) continue;
        args.push_back(fmt::format("{}={}", key, repr_value(value)));
    }
    return fmt::format("{}({})", ringtrack::to_string(kind_), fmt::join(args, ", "));
}

} // namespace ringtrack
