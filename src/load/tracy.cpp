/// @file src/load/tracy.cpp
/// @brief Tracy (.lat) lattice reader.

#include "ringtrack/tracy.hpp"
#include "ringtrack/errors.hpp"

#include "text_utils.hpp"

#include <fmt/format.h>

#include <cctype>

namespace ringtrack::tracy {

namespace {

constexpr double DEGREE = constants::PI / 180.0;

enum class TracyType {
    Drift,
    Bending,
    Quadrupole,
    Sextupole,
    Multipole,
    Corrector,
    Marker,
    Cavity,
};

std::optional<TracyType> type_of(std::string_view name) {
    static const std::map<std::string, TracyType, std::less<>> types = {
        {"drift", TracyType::Drift},
        {"bending", TracyType::Bending},
        {"quadrupole", TracyType::Quadrupole},
        {"sextupole", TracyType::Sextupole},
        {"multipole", TracyType::Multipole},
        {"corrector", TracyType::Corrector},
        {"marker", TracyType::Marker},
        {"beampositionmonitor", TracyType::Marker},
        {"cavity", TracyType::Cavity},
    };
    auto it = types.find(name);
    if (it == types.end()) return std::nullopt;
    return it->second;
}

Element create_element(TracyType type, const std::string& name, text::Params& p,
                       std::optional<double> energy) {
    Attributes extra;
    if (auto n = text::take(p, "n")) {
        extra["NumIntSteps"] = text::parse_count(*n, fmt::format("Element {}, parameter n", name));
    }

    switch (type) {
        case TracyType::Marker:
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            return elements::marker(name, extra);

        case TracyType::Bending: {
            const double length = text::take_real(p, "l", name);
            const double angle = text::take_real(p, "t", name) * DEGREE;
            extra["PassMethod"] = std::string("BndMPoleSymplectic4Pass");
            extra["BendingAngle"] = angle;
            extra["EntranceAngle"] = text::take_real(p, "t1", name) * DEGREE;
            extra["ExitAngle"] = text::take_real(p, "t2", name) * DEGREE;
            const double k = text::take_real(p, "k", name, 0.0);
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            return elements::dipole(name, length, angle, k, extra);
        }

        case TracyType::Quadrupole: {
            const double length = text::take_real(p, "l", name);
            const double k = text::take_real(p, "k", name, 0.0);
            extra["PassMethod"] = std::string("StrMPoleSymplectic4Pass");
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            return elements::quadrupole(name, length, k, extra);
        }

        case TracyType::Sextupole: {
            const double h = text::take_real(p, "k", name, 0.0);
            const double length = text::take_real(p, "l", name, 0.0);
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            return elements::sextupole(name, length, h, extra);
        }

        case TracyType::Cavity: {
            const double length = text::take_real(p, "l", name);
            const double voltage = text::take_real(p, "voltage", name);
            const double frequency = text::take_real(p, "frequency", name);
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            // Tracy files carry no harmonic number.
            Element e = elements::rf_cavity(name, length, voltage, frequency,
                                            constants::DEFAULT_HARMONIC_NUMBER,
                                            energy.value_or(0.0) * 1e9, extra);
            if (!energy) e.erase("Energy");
            return e;
        }

        case TracyType::Multipole: {
            const double length = text::take_real(p, "l", name);
            for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
            return elements::multipole(name, length, Eigen::VectorXd::Zero(4),
                                       Eigen::VectorXd::Zero(4), extra);
        }

        case TracyType::Corrector:
            return elements::corrector(name, 0.0, Eigen::Vector2d::Zero(), extra);

        case TracyType::Drift:
            break;
    }
    const double length = text::take_real(p, "l", name, 0.0);
    for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);
    return elements::drift(name, length, extra);
}

} // namespace

// ─── Text handling ────────────────────────────────────────────────────────────

std::string strip_comments(std::string_view contents) {
    std::string stripped;
    stripped.reserve(contents.size());
    bool in_comment = false;
    for (char c : contents) {
        if (c == '{') {
            in_comment = true;
        } else if (c == '}') {
            in_comment = false;
        } else if (!in_comment && !std::isspace(static_cast<unsigned char>(c))) {
            stripped += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return stripped;
}

std::vector<std::string> parse_lines(std::string_view contents) {
    return text::split(strip_comments(contents), ';');
}

// ─── Elements and lines ───────────────────────────────────────────────────────

Element element_from_string(std::string_view name,
                            std::string_view definition,
                            const Variables& variables) {
    const auto parts = text::split(definition, ',');
    const auto type = type_of(text::trim(parts.front()));
    if (!type) {
        throw ParseError(fmt::format("Element {}: unknown element type '{}'", name,
                                     text::trim(parts.front())));
    }

    text::Params params;
    // Corrector strengths are not read from the file.
    if (*type != TracyType::Corrector) {
        for (std::size_t i = 1; i < parts.size(); ++i) {
            if (text::trim(parts[i]).empty()) continue;
            const auto kv = text::split_once(parts[i], '=');
            if (!kv) {
                throw ParseError(fmt::format("Element {}: cannot parse '{}'", name, parts[i]));
            }
            std::string value(text::trim(kv->second));
            if (auto var = variables.find(value); var != variables.end()) value = var->second;
            params.insert_or_assign(std::string(text::trim(kv->first)), std::move(value));
        }
    }

    std::optional<double> energy;
    if (auto e = variables.find("energy"); e != variables.end()) {
        energy = text::parse_number(e->second, "Variable energy");
    }
    return create_element(*type, std::string(name), params, energy);
}

Expansion expand_tracy(std::string_view contents) {
    std::vector<std::string> lines = parse_lines(contents);
    if (!lines.empty() && lines.back().empty()) lines.pop_back();
    if (lines.empty() || lines.front() != "definelattice") {
        throw ParseError("Tracy lattice must start with 'define lattice;'");
    }
    if (lines.size() < 2 || lines.back() != "end") {
        throw ParseError("Tracy lattice must finish with 'end;'");
    }

    Variables variables;
    text::ElementTable elements;
    text::LineTable chunks;
    for (std::size_t i = 1; i + 1 < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (line.empty()) continue;
        if (line.find(':') == std::string::npos) {
            const auto kv = text::split_once(line, '=');
            if (!kv) throw ParseError(fmt::format("Could not understand line '{}'", line));
            variables.insert_or_assign(kv->first, kv->second);
            continue;
        }
        const auto kv = text::split_once(line, ':');
        const std::string& key = kv->first;
        const std::string& value = kv->second;
        if (type_of(text::split(value, ',').front())) {
            elements.insert_or_assign(key, element_from_string(key, value, variables));
        } else {
            std::vector<Element> chunk;
            for (const auto& part : text::split(value, ',')) {
                text::append_part(part, elements, chunks, chunk);
            }
            chunks.insert_or_assign(key, std::move(chunk));
        }
    }

    auto cell = chunks.find("cell");
    if (cell == chunks.end()) throw ParseError("Tracy lattice defines no 'cell' line");

    Expansion out;
    out.elements = cell->second;
    if (auto e = variables.find("energy"); e != variables.end()) {
        out.energy = text::parse_number(e->second, "Variable energy") * 1e9;
    }
    return out;
}

Lattice load_tracy(const std::filesystem::path& path, const LoadOptions& options) {
    Expansion expansion = expand_tracy(read_file(path));
    if (options.verbose) {
        fmt::print(stderr, "[ringtrack] {}: {} elements\n", path.string(),
                   expansion.elements.size());
    }

    LatticeParams params;
    params.name = path.stem().string();
    params.energy = options.energy ? std::optional<double>(*options.energy * 1e9)
                                   : expansion.energy;
    params.source = std::filesystem::absolute(path).string();
    return Lattice(std::move(expansion.elements), std::move(params));
}

} // namespace ringtrack::tracy
