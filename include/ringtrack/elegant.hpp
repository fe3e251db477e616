#pragma once

/// @file include/ringtrack/elegant.hpp
/// @brief Reader for Elegant (.lte) lattice files.
///
/// Supported element types:
///
/// | Elegant type                   | element     | notes                              |
/// |--------------------------------|-------------|------------------------------------|
/// | drift, drif                    | Drift       |                                    |
/// | csben, csbend, csrcsben        | Dipole      | BndMPoleSymplectic4Pass            |
/// | quadrupole, kquad              | Quadrupole  | StrMPoleSymplectic4Pass            |
/// | ksext                          | Sextupole   | h = k2 / 2                         |
/// | kicker                         | Corrector   |                                    |
/// | rfca                           | RFCavity    | phase stored as Phi                |
/// | multipole                      | Multipole   | hom=(order, a, b)                  |
/// | mark, malign, recirc, sreffects, rcol, watch, charge, monitor | Marker |         |
///
/// Elegant scales multipole coefficients by n! relative to PolynomB, so
/// k2, k3, k4 are divided by 2, 6, 24.

#include "ringtrack/element.hpp"
#include "ringtrack/lattice.hpp"
#include "ringtrack/load.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack::elegant {

/// Variable name to (unevaluated) value. The reserved names `energy`
/// [GeV] and `harmonic_number` feed RF cavities.
using Variables = std::map<std::string, std::string, std::less<>>;

/// Lower-case, trim, drop blank and `!` comment lines, and join lines
/// ending in `&` with the next one.
[[nodiscard]] std::vector<std::string> parse_lines(std::string_view contents);

/// Split on `delimiter` except inside parentheses.
[[nodiscard]] std::vector<std::string> split_ignoring_parentheses(std::string_view s,
                                                                  char delimiter);

/// Strip quotes and evaluate a quoted RPN expression `"a b op"`.
///
/// # Throws
/// `ParseError` for an unterminated quote or a malformed expression.
[[nodiscard]] std::string handle_value(std::string_view value);

/// Build one element from `type, key=value, ...`.
///
/// # Throws
/// `ParseError` for an unknown type or an unusable value.
[[nodiscard]] Element element_from_string(std::string_view name,
                                          std::string_view definition,
                                          const Variables& variables);

/// Expand the line `lattice_key` (the last line defined if empty).
///
/// # Arguments
/// * `energy`          - beam energy [GeV] used by RF cavities
/// * `harmonic_number` - harmonic number given to RF cavities
///
/// # Throws
/// `ParseError` if a line refers to an unknown part or `lattice_key`
/// is not defined.
[[nodiscard]] std::vector<Element>
expand_elegant(std::string_view contents,
               std::string_view lattice_key = {},
               std::optional<double> energy = std::nullopt,
               long harmonic_number = constants::DEFAULT_HARMONIC_NUMBER);

/// Load an Elegant file.
[[nodiscard]] Lattice load_elegant(const std::filesystem::path& path,
                                   const LoadOptions& options = {});

} // namespace ringtrack::elegant
