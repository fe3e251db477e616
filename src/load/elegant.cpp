/// @file src/load/elegant.cpp
/// @brief Elegant (.lte) lattice reader.

#include "ringtrack/elegant.hpp"
#include "ringtrack/errors.hpp"

#include "text_utils.hpp"

#include <fmt/format.h>

#include <sstream>

namespace ringtrack::elegant {

namespace {

/// Values every element creator may need besides its own parameters.
struct Context {
    std::optional<double> energy;            ///< [GeV]
    long                  harmonic_number = constants::DEFAULT_HARMONIC_NUMBER;
};

using Creator = Element (*)(const std::string& name, text::Params& p, const Context& ctx);

long take_steps(text::Params& p, const std::string& name) {
    const auto steps = text::take(p, "n_kicks");
    if (!steps) return constants::DEFAULT_NUM_INT_STEPS;
    return text::parse_count(*steps, fmt::format("Element {}, parameter n_kicks", name));
}

// ─── Creators ─────────────────────────────────────────────────────────────────

Element create_drift(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    return elements::drift(name, length, text::to_attributes(p));
}

Element create_marker(const std::string& name, text::Params& p, const Context&) {
    return elements::marker(name, text::to_attributes(p));
}

Element create_quad(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    const long steps = take_steps(p, name);
    const double k1 = text::take_real(p, "k1", name);
    Attributes extra = text::to_attributes(p);
    extra["NumIntSteps"] = steps;
    extra["PassMethod"] = std::string("StrMPoleSymplectic4Pass");
    return elements::quadrupole(name, length, k1, extra);
}

Element create_sext(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    const long steps = take_steps(p, name);
    const double k2 = text::take_real(p, "k2", name, 0.0);
    Attributes extra = text::to_attributes(p);
    extra["NumIntSteps"] = steps;
    return elements::sextupole(name, length, k2 / 2.0, extra);
}

Element create_dipole(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    const long steps = take_steps(p, name);
    const double angle = text::take_real(p, "angle", name);
    const double e1 = text::take_real(p, "e1", name, 0.0);
    const double e2 = text::take_real(p, "e2", name, 0.0);
    const double hgap = text::take_real(p, "hgap", name, 0.0);
    const double fint = text::take_real(p, "fint", name, 0.0);
    const double k1 = text::take_real(p, "k1", name, 0.0);
    const double k2 = text::take_real(p, "k2", name, 0.0);
    const double k3 = text::take_real(p, "k3", name, 0.0);
    const double k4 = text::take_real(p, "k4", name, 0.0);

    Attributes extra = text::to_attributes(p);
    extra["NumIntSteps"] = steps;
    extra["PassMethod"] = std::string("BndMPoleSymplectic4Pass");
    extra["BendingAngle"] = angle;
    extra["EntranceAngle"] = e1;
    extra["ExitAngle"] = e2;
    extra["FullGap"] = 2.0 * hgap;
    extra["FringeInt1"] = fint;
    extra["FringeInt2"] = fint;
    extra["PolynomB"] = vector_value({0.0, k1, k2 / 2.0, k3 / 6.0, k4 / 24.0});
    return elements::dipole(name, length, angle, k1, extra);
}

Element create_corrector(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    const double hkick = text::take_real(p, "hkick", name, 0.0);
    const double vkick = text::take_real(p, "vkick", name, 0.0);
    return elements::corrector(name, length, Eigen::Vector2d(hkick, vkick),
                               text::to_attributes(p));
}

Element create_cavity(const std::string& name, text::Params& p, const Context& ctx) {
    const double length = text::take_real(p, "l", name, 0.0);
    const double voltage = text::take_real(p, "volt", name);
    const double frequency = text::take_real(p, "freq", name);
    Attributes extra;
    if (auto phase = text::take(p, "phase")) extra["Phi"] = text::param_value(*phase);
    for (auto& [key, value] : text::to_attributes(p)) extra.emplace(key, value);

    Element e = elements::rf_cavity(name, length, voltage, frequency, ctx.harmonic_number,
                                    ctx.energy.value_or(0.0) * 1e9, extra);
    if (!ctx.energy) e.erase("Energy");
    return e;
}

/// `hom=(order, a, b)` sets PolynomA/PolynomB[order - 1].
Element create_multipole(const std::string& name, text::Params& p, const Context&) {
    const double length = text::take_real(p, "l", name, 0.0);
    Eigen::VectorXd poly_a;
    Eigen::VectorXd poly_b;
    if (auto hom = text::take(p, "hom")) {
        std::string_view body = text::trim(*hom);
        if (body.size() < 2 || body.front() != '(' || body.back() != ')') {
            throw ParseError(fmt::format("Element {}: hom must be (order, a, b), got '{}'",
                                         name, *hom));
        }
        const auto fields = text::split(body.substr(1, body.size() - 2), ',');
        if (fields.size() != 3) {
            throw ParseError(fmt::format("Element {}: hom must be (order, a, b), got '{}'",
                                         name, *hom));
        }
        const long order = text::parse_count(fields[0], fmt::format("Element {}, hom order", name));
        if (order < 1) {
            throw ParseError(fmt::format("Element {}: hom order must be >= 1, got {}", name, order));
        }
        poly_a = Eigen::VectorXd::Zero(order);
        poly_b = Eigen::VectorXd::Zero(order);
        poly_a[order - 1] = text::parse_number(fields[1], fmt::format("Element {}, hom", name));
        poly_b[order - 1] = text::parse_number(fields[2], fmt::format("Element {}, hom", name));
    }
    return elements::multipole(name, length, poly_a, poly_b, text::to_attributes(p));
}

const std::map<std::string, Creator, std::less<>>& element_map() {
    static const std::map<std::string, Creator, std::less<>> map = {
        {"drift", create_drift},         {"drif", create_drift},
        {"csben", create_dipole},        {"csbend", create_dipole},
        {"csrcsben", create_dipole},     {"quadrupole", create_quad},
        {"kquad", create_quad},          {"ksext", create_sext},
        {"kicker", create_corrector},    {"rfca", create_cavity},
        {"multipole", create_multipole}, {"mark", create_marker},
        {"malign", create_marker},       {"recirc", create_marker},
        {"sreffects", create_marker},    {"rcol", create_marker},
        {"watch", create_marker},        {"charge", create_marker},
        {"monitor", create_marker},
    };
    return map;
}

/// Elements of a `line=(...)` definition or a bare list of parts.
std::vector<Element> parse_chunk(std::string_view value,
                                 const text::ElementTable& elements,
                                 const text::LineTable& lines) {
    std::vector<Element> chunk;
    for (const auto& raw : split_ignoring_parentheses(value, ',')) {
        const std::string_view part = text::trim(raw);
        if (part.find("symmetry") != std::string_view::npos) continue;
        if (part.starts_with("line")) {
            const auto eq = text::split_once(part, '=');
            const auto body = eq ? text::call_argument(eq->second, "") : std::nullopt;
            if (!body) {
                throw ParseError(fmt::format("Could not understand lattice section {}", part));
            }
            for (const auto& item : text::split(*body, ',')) {
                text::append_part(item, elements, lines, chunk);
            }
        } else {
            text::append_part(part, elements, lines, chunk);
        }
    }
    return chunk;
}

} // namespace

// ─── Text handling ────────────────────────────────────────────────────────────

std::vector<std::string> parse_lines(std::string_view contents) {
    std::vector<std::string> parsed;
    std::string current;
    for (const auto& raw : text::split(contents, '\n')) {
        const std::string lowered = text::to_lower(text::trim(raw));
        if (lowered.empty() || lowered.front() == '!') continue;
        if (lowered.back() == '&') {
            current += lowered.substr(0, lowered.size() - 1);
        } else {
            parsed.push_back(current + lowered);
            current.clear();
        }
    }
    return parsed;
}

std::vector<std::string> split_ignoring_parentheses(std::string_view s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (char c : s) {
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (c == delimiter && depth == 0) {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(std::move(current));
    return parts;
}

std::string handle_value(std::string_view value) {
    value = text::trim(value);
    if (!value.starts_with('"')) return std::string(value);
    if (value.size() < 2 || !value.ends_with('"')) {
        throw ParseError(fmt::format("Unterminated quoted value {}", value));
    }

    std::istringstream stream{std::string(value.substr(1, value.size() - 2))};
    std::vector<std::string> tokens;
    for (std::string token; stream >> token;) tokens.push_back(token);
    if (tokens.empty()) return {};
    if (tokens.size() == 1) return tokens.front();
    if (tokens.size() != 3 || tokens[2].size() != 1) {
        throw ParseError(fmt::format("Cannot evaluate expression {}", value));
    }

    // Reverse Polish: "a b op".
    const double a = text::parse_number(tokens[0], fmt::format("Expression {}", value));
    const double b = text::parse_number(tokens[1], fmt::format("Expression {}", value));
    double result = 0.0;
    switch (tokens[2][0]) {
        case '+': result = a + b; break;
        case '-': result = a - b; break;
        case '*': result = a * b; break;
        case '/': result = a / b; break;
        default:
            throw ParseError(fmt::format("Unknown operator '{}' in {}", tokens[2], value));
    }
    return fmt::format("{}", result);
}

// ─── Elements and lines ───────────────────────────────────────────────────────

Element element_from_string(std::string_view name,
                            std::string_view definition,
                            const Variables& variables) {
    const auto parts = split_ignoring_parentheses(definition, ',');
    const std::string type = text::to_lower(text::trim(parts.front()));
    const auto& map = element_map();
    auto creator = map.find(type);
    if (creator == map.end()) {
        throw ParseError(fmt::format("Element {}: unknown element type '{}'", name, type));
    }

    text::Params params;
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (text::trim(parts[i]).empty()) continue;
        const auto kv = split_ignoring_parentheses(parts[i], '=');
        if (kv.size() != 2) {
            throw ParseError(fmt::format("Element {}: cannot parse '{}'", name,
                                         text::trim(parts[i])));
        }
        std::string value = handle_value(kv[1]);
        if (auto var = variables.find(value); var != variables.end()) value = var->second;
        params.insert_or_assign(text::to_lower(text::trim(kv[0])), std::move(value));
    }

    Context ctx;
    if (auto e = variables.find("energy"); e != variables.end()) {
        ctx.energy = text::parse_number(e->second, "Variable energy");
    }
    if (auto h = variables.find("harmonic_number"); h != variables.end()) {
        ctx.harmonic_number = text::parse_count(h->second, "Variable harmonic_number");
    }
    return creator->second(std::string(name), params, ctx);
}

std::vector<Element> expand_elegant(std::string_view contents,
                                    std::string_view lattice_key,
                                    std::optional<double> energy,
                                    long harmonic_number) {
    Variables variables;
    if (energy) variables["energy"] = fmt::format("{}", *energy);
    variables["harmonic_number"] = fmt::format("{}", harmonic_number);

    text::ElementTable elements;
    text::LineTable lines;
    std::string last_line;
    const auto& map = element_map();

    for (const auto& line : parse_lines(contents)) {
        if (line.find(':') == std::string::npos) {
            const auto kv = text::split_once(line, '=');
            if (!kv) throw ParseError(fmt::format("Could not understand line '{}'", line));
            variables.insert_or_assign(std::string(text::trim(kv->first)),
                                       handle_value(kv->second));
            continue;
        }
        const auto kv = text::split_once(line, ':');
        const std::string key(text::trim(kv->first));
        const std::string_view value = text::trim(kv->second);
        const std::string type(text::trim(split_ignoring_parentheses(value, ',').front()));
        if (map.contains(type)) {
            elements.insert_or_assign(key, element_from_string(key, value, variables));
        } else {
            lines.insert_or_assign(key, parse_chunk(value, elements, lines));
            last_line = key;
        }
    }

    const std::string key = lattice_key.empty() ? last_line : std::string(lattice_key);
    auto it = lines.find(key);
    if (it == lines.end()) {
        throw ParseError(key.empty() ? std::string("No line defined")
                                     : fmt::format("Line '{}' is not defined", key));
    }
    return it->second;
}

Lattice load_elegant(const std::filesystem::path& path, const LoadOptions& options) {
    const std::string contents = read_file(path);
    auto elements = expand_elegant(contents, text::to_lower(options.lattice_key),
                                   options.energy, options.harmonic_number);
    if (options.verbose) {
        fmt::print(stderr, "[ringtrack] {}: {} elements\n", path.string(), elements.size());
    }

    LatticeParams params;
    params.name = options.lattice_key.empty() ? path.stem().string() : options.lattice_key;
    if (options.energy) params.energy = *options.energy * 1e9;
    params.harmonic_number = options.harmonic_number;
    params.source = std::filesystem::absolute(path).string();
    return Lattice(std::move(elements), std::move(params));
}

} // namespace ringtrack::elegant
