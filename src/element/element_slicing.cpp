/// @file src/element/element_slicing.cpp
/// @brief Element::divide and Element::insert.

#include "ringtrack/element.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

#include <iterator>
#include <numeric>

namespace ringtrack {

// ─── divide ───────────────────────────────────────────────────────────────────

std::vector<Element>
Element::divide(std::span<const double> frac, bool keep_axis) const {
    if (!is_long()) {
        throw ElementError(fmt::format("{} element {} cannot be divided",
                                       ringtrack::to_string(kind_), fam_name_));
    }
    if (frac.empty()) {
        throw ElementError(fmt::format("In element {}: divide needs at least one fraction",
                                       fam_name_));
    }

    const double total = std::accumulate(frac.begin(), frac.end(), 0.0);
    const double full_length = length();

    // Strip face attributes from the template slice; they are restored on the
    // first and last slices only. With keep_axis the misalignment (T, R)
    // stays on every slice.
    Element tmpl = *this;
    const std::size_t first = keep_axis ? 2 : 0;
    Attributes entrance;
    Attributes exit;
    for (std::size_t i = first; i < std::size(ENTRANCE_FIELDS); ++i) {
        const std::string key(ENTRANCE_FIELDS[i]);
        if (auto it = tmpl.attrs_.find(key); it != tmpl.attrs_.end()) {
            entrance.insert(tmpl.attrs_.extract(it));
        }
    }
    for (std::size_t i = first; i < std::size(EXIT_FIELDS); ++i) {
        const std::string key(EXIT_FIELDS[i]);
        if (auto it = tmpl.attrs_.find(key); it != tmpl.attrs_.end()) {
            exit.insert(tmpl.attrs_.extract(it));
        }
    }

    const double* bending_angle = nullptr;
    if (const auto* v = find("BendingAngle")) bending_angle = std::get_if<double>(v);

    std::vector<Element> slices;
    slices.reserve(frac.size());
    for (double f : frac) {
        Element part = tmpl;
        part.length_ = f * full_length;
        if (bending_angle) {
            part.attrs_.insert_or_assign("BendingAngle", f / total * *bending_angle);
        }
        slices.push_back(std::move(part));
    }

    for (auto& [key, value] : entrance) slices.front().attrs_.insert_or_assign(key, value);
    for (auto& [key, value] : exit) slices.back().attrs_.insert_or_assign(key, value);
    return slices;
}

// ─── insert ───────────────────────────────────────────────────────────────────

std::vector<Element>
Element::insert(std::span<const Insertion> insertions) const {
    if (kind_ != ElementKind::Drift) {
        throw ElementError(fmt::format("Only drifts accept insertions, {} is a {}",
                                       fam_name_, ringtrack::to_string(kind_)));
    }
    const double full_length = length();
    if (full_length == 0.0) {
        throw ElementError(fmt::format("In element {}: cannot insert into a zero-length drift",
                                       fam_name_));
    }

    // Drift pieces between consecutive insertions, as fractions of the drift:
    //   drfrac[i] = (fr[i] - lg[i]) - (fr[i-1] + lg[i-1]),  fr[-1]+lg[-1] = 0,
    //   fr[n]-lg[n] = 1, where lg is half the inserted length / drift length.
    const std::size_t n = insertions.size();
    std::vector<double> drfrac(n + 1);
    double previous_end = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& [fr, elem] = insertions[i];
        const double lg = elem ? 0.5 * elem->length() / full_length : 0.0;
        drfrac[i] = (fr - lg) - previous_end;
        previous_end = fr + lg;
    }
    drfrac[n] = 1.0 - previous_end;

    std::vector<double> nonzero;
    for (double f : drfrac) {
        if (f != 0.0) nonzero.push_back(f);
    }
    std::vector<Element> pieces;
    if (!nonzero.empty()) pieces = divide(nonzero);

    std::vector<Element> line;
    line.reserve(pieces.size() + n);
    auto next_piece = pieces.begin();
    for (std::size_t i = 0; i <= n; ++i) {
        if (drfrac[i] != 0.0) line.push_back(std::move(*next_piece++));
        if (i < n && insertions[i].second) line.push_back(*insertions[i].second);
    }
    return line;
}

} // namespace ringtrack
