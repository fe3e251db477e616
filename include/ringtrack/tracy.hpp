#pragma once

/// @file include/ringtrack/tracy.hpp
/// @brief Reader for Tracy (.lat) lattice files.
///
/// A Tracy file is a `;`-separated list of statements between
/// `define lattice;` and `end;`. Comments are enclosed in `{ }` and do
/// not nest. Angles are given in degrees, the energy in GeV. The ring is
/// the line called `cell`.

#include "ringtrack/element.hpp"
#include "ringtrack/lattice.hpp"
#include "ringtrack/load.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack::tracy {

using Variables = std::map<std::string, std::string, std::less<>>;

/// Lower-case and drop `{...}` comments and all whitespace.
[[nodiscard]] std::string strip_comments(std::string_view contents);

/// `strip_comments`, then split on `;`.
[[nodiscard]] std::vector<std::string> parse_lines(std::string_view contents);

/// Build one element from `type,key=value,...`.
///
/// # Throws
/// `ParseError` for an unknown type or an unusable value.
[[nodiscard]] Element element_from_string(std::string_view name,
                                          std::string_view definition,
                                          const Variables& variables);

/// Elements of the `cell` line and the energy [eV] if the file defines one.
struct Expansion {
    std::vector<Element>  elements;
    std::optional<double> energy;
};

/// # Throws
/// `ParseError` if the file is not framed by `define lattice;` … `end;`,
/// a line refers to an unknown part, or no `cell` line is defined.
[[nodiscard]] Expansion expand_tracy(std::string_view contents);

/// Load a Tracy file.
[[nodiscard]] Lattice load_tracy(const std::filesystem::path& path,
                                 const LoadOptions& options = {});

} // namespace ringtrack::tracy
