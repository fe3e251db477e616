#pragma once

/// @file src/cli/cli_options.hpp
/// @brief Command-line options of the ringtrack executable.

#include "ringtrack/load.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace ringtrack::cli {

/// Options collected from the command line after the lattice path.
struct CliOptions {
    LoadOptions load;
    double dp         = 0.0;
    bool   chrom      = false;
    bool   verbose    = false;
    int    turns      = 1;
    double x          = 0.0;
    double px         = 0.0;
    double y          = 0.0;
    double py         = 0.0;
};

/// Parse `--flag value` pairs.
///
/// Returns std::nullopt, after printing the reason on stderr, for an
/// unknown flag, a missing or malformed value, or `--turns` outside
/// [0, INT_MAX].
[[nodiscard]] std::optional<CliOptions> parse_options(std::span<const std::string_view> args);

} // namespace ringtrack::cli
