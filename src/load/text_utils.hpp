#pragma once

/// @file src/load/text_utils.hpp
/// @brief String handling and line expansion shared by the lattice readers.

#include "ringtrack/element.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack::text {

// ─── Strings ──────────────────────────────────────────────────────────────────

[[nodiscard]] std::string to_lower(std::string_view s);
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/// Plain split; empty fields are kept.
[[nodiscard]] std::vector<std::string> split(std::string_view s, char delimiter);

/// Split at the first occurrence of `delimiter`.
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_once(std::string_view s, char delimiter);

/// Content of `prefix(...)`, or nullopt if `s` has another shape.
[[nodiscard]] std::optional<std::string_view> call_argument(std::string_view s,
                                                            std::string_view prefix) noexcept;

/// Whole string as a double.
///
/// # Throws
/// `ParseError` mentioning `context` if `s` is not a number.
[[nodiscard]] double parse_number(std::string_view s, std::string_view context);

/// Whole string as an integer.
[[nodiscard]] long parse_count(std::string_view s, std::string_view context);

/// Number if `s` parses as one, otherwise the string itself.
[[nodiscard]] ParamValue param_value(std::string_view s);

// ─── Element parameters ───────────────────────────────────────────────────────

/// Raw `key=value` pairs of one element definition.
using Params = std::map<std::string, std::string, std::less<>>;

/// Remove `key` and return its value.
[[nodiscard]] std::optional<std::string> take(Params& params, std::string_view key);

/// Remove `key` and return it as a number, or `fallback` when absent.
///
/// # Throws
/// `ParseError` if the key is absent without a fallback, or not a number.
[[nodiscard]] double take_real(Params& params, std::string_view key,
                               std::string_view element,
                               std::optional<double> fallback = std::nullopt);

/// Leftover parameters as element attributes.
[[nodiscard]] Attributes to_attributes(const Params& params);

// ─── Line expansion ───────────────────────────────────────────────────────────

using ElementTable = std::map<std::string, Element, std::less<>>;
using LineTable    = std::map<std::string, std::vector<Element>, std::less<>>;

/// Reverse a line, swapping the entrance and exit angles of dipoles.
[[nodiscard]] std::vector<Element> inverted(const std::vector<Element>& line);

/// Append the elements one line part stands for:
///
/// | part       | expansion                                  |
/// |------------|--------------------------------------------|
/// | `name`     | element or line `name`                     |
/// | `-name`    | line `name` reversed                       |
/// | `N*name`   | `name` repeated N times                    |
/// | `inv(name)`| `inverted(name)`                           |
/// | `*symmetry*` | nothing                                  |
///
/// # Throws
/// `ParseError` for parts that name nothing known, negative repeat counts,
/// or an expansion longer than `constants::MAX_LINE_ELEMENTS`.
void append_part(std::string_view part,
                 const ElementTable& elements,
                 const LineTable& lines,
                 std::vector<Element>& out);

} // namespace ringtrack::text
