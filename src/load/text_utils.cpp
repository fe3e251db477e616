/// @file src/load/text_utils.cpp
/// @brief String handling and line expansion shared by the lattice readers.

#include "text_utils.hpp"

#include "ringtrack/constants.hpp"
#include "ringtrack/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ringtrack::text {

// ─── Strings ──────────────────────────────────────────────────────────────────

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::vector<std::string> split(std::string_view s, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = s.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            return parts;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::optional<std::pair<std::string, std::string>>
split_once(std::string_view s, char delimiter) {
    const std::size_t pos = s.find(delimiter);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::pair{std::string(s.substr(0, pos)), std::string(s.substr(pos + 1))};
}

std::optional<std::string_view> call_argument(std::string_view s,
                                              std::string_view prefix) noexcept {
    s = trim(s);
    if (s.size() < prefix.size() + 2 || s.substr(0, prefix.size()) != prefix) return std::nullopt;
    s.remove_prefix(prefix.size());
    s = trim(s);
    if (s.empty() || s.front() != '(' || s.back() != ')') return std::nullopt;
    return trim(s.substr(1, s.size() - 2));
}

double parse_number(std::string_view s, std::string_view context) {
    s = trim(s);
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (s.empty() || ec != std::errc{} || ptr != last) {
        throw ParseError(fmt::format("{}: '{}' is not a number", context, s));
    }
    return v;
}

long parse_count(std::string_view s, std::string_view context) {
    s = trim(s);
    long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
        throw ParseError(fmt::format("{}: '{}' is not an integer", context, s));
    }
    return v;
}

ParamValue param_value(std::string_view s) {
    s = trim(s);
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (first != last && *first == '+') ++first;
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (!s.empty() && ec == std::errc{} && ptr == last) return v;
    return std::string(s);
}

// ─── Element parameters ───────────────────────────────────────────────────────

std::optional<std::string> take(Params& params, std::string_view key) {
    auto it = params.find(key);
    if (it == params.end()) return std::nullopt;
    std::string value = std::move(it->second);
    params.erase(it);
    return value;
}

double take_real(Params& params, std::string_view key, std::string_view element,
                 std::optional<double> fallback) {
    const auto value = take(params, key);
    if (!value) {
        if (fallback) return *fallback;
        throw ParseError(fmt::format("Element {}: missing parameter '{}'", element, key));
    }
    return parse_number(*value, fmt::format("Element {}, parameter {}", element, key));
}

Attributes to_attributes(const Params& params) {
    Attributes attrs;
    for (const auto& [key, value] : params) attrs.emplace(key, param_value(value));
    return attrs;
}

// ─── Line expansion ───────────────────────────────────────────────────────────

std::vector<Element> inverted(const std::vector<Element>& line) {
    std::vector<Element> out;
    out.reserve(line.size());
    for (auto it = line.rbegin(); it != line.rend(); ++it) {
        Element e = *it;
        if (e.kind() == ElementKind::Dipole) {
            const double entrance = it->real_or("EntranceAngle", 0.0);
            const double exit = it->real_or("ExitAngle", 0.0);
            e.set("EntranceAngle", exit);
            e.set("ExitAngle", entrance);
        }
        out.push_back(std::move(e));
    }
    return out;
}

namespace {

const std::vector<Element>& find_line(std::string_view name, const LineTable& lines) {
    auto it = lines.find(name);
    if (it == lines.end()) {
        throw ParseError(fmt::format("Could not understand lattice section {}", name));
    }
    return it->second;
}

/// Append `count` copies of `body`, refusing to grow past MAX_LINE_ELEMENTS.
void append_repeated(const std::vector<Element>& body,
                     std::size_t count,
                     std::string_view part,
                     std::vector<Element>& out) {
    const std::size_t room =
        constants::MAX_LINE_ELEMENTS - std::min(out.size(), constants::MAX_LINE_ELEMENTS);
    if (!body.empty() && count > room / body.size()) {
        throw ParseError(fmt::format("Lattice section {} expands to more than {} elements",
                                     part, constants::MAX_LINE_ELEMENTS));
    }
    for (std::size_t i = 0; i < count; ++i) out.insert(out.end(), body.begin(), body.end());
}

} // namespace

void append_part(std::string_view part,
                 const ElementTable& elements,
                 const LineTable& lines,
                 std::vector<Element>& out) {
    part = trim(part);
    if (part.find("symmetry") != std::string_view::npos) return;

    if (auto arg = call_argument(part, "inv")) {
        append_repeated(inverted(find_line(*arg, lines)), 1, part, out);
        return;
    }
    if (part.starts_with('-')) {
        const std::string_view name = trim(part.substr(1));
        if (auto e = elements.find(name); e != elements.end()) {
            out.push_back(e->second);
            return;
        }
        const auto& line = find_line(name, lines);
        append_repeated(std::vector<Element>(line.rbegin(), line.rend()), 1, part, out);
        return;
    }
    if (const std::size_t star = part.find('*'); star != std::string_view::npos) {
        const long count = parse_count(part.substr(0, star),
                                       fmt::format("Repeat count in '{}'", part));
        if (count < 0) {
            throw ParseError(fmt::format("Repeat count in '{}' must not be negative", part));
        }
        std::vector<Element> body;
        append_part(part.substr(star + 1), elements, lines, body);
        append_repeated(body, static_cast<std::size_t>(count), part, out);
        return;
    }
    if (auto e = elements.find(part); e != elements.end()) {
        out.push_back(e->second);
        return;
    }
    if (auto l = lines.find(part); l != lines.end()) {
        append_repeated(l->second, 1, part, out);
        return;
    }
    throw ParseError(fmt::format("Could not understand lattice section {}", part));
}

} // namespace ringtrack::text
