/// @file src/cli/cli_options.cpp
/// @brief Flag parsing for the ringtrack executable.

#include "cli_options.hpp"

#include <fmt/core.h>

#include <charconv>
#include <limits>
#include <string>

namespace ringtrack::cli {

namespace {

std::optional<double> parse_double(std::string_view s) {
    double v = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

std::optional<long> parse_long(std::string_view s) {
    long v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

std::optional<CliOptions> parse_options(std::span<const std::string_view> args) {
    CliOptions opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string_view flag = args[i];
        if (flag == "--chrom") {
            opts.chrom = true;
            continue;
        }
        if (flag == "--verbose") {
            opts.verbose = true;
            opts.load.verbose = true;
            continue;
        }
        if (i + 1 >= args.size()) {
            fmt::print(stderr, "Error: {} requires a value\n", flag);
            return std::nullopt;
        }
        const std::string_view value = args[++i];

        if (flag == "--key") {
            opts.load.lattice_key = std::string(value);
            continue;
        }
        if (flag == "--harmonic" || flag == "--turns") {
            const auto n = parse_long(value);
            if (!n) {
                fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", flag, value);
                return std::nullopt;
            }
            if (flag == "--harmonic") {
                opts.load.harmonic_number = *n;
            } else {
                if (*n < 0 || *n > std::numeric_limits<int>::max()) {
                    fmt::print(stderr, "Error: --turns must be in [0, {}], got {}\n",
                               std::numeric_limits<int>::max(), *n);
                    return std::nullopt;
                }
                opts.turns = static_cast<int>(*n);
            }
            continue;
        }

        const auto number = parse_double(value);
        if (!number) {
            fmt::print(stderr, "Error: {} expects a number, got '{}'\n", flag, value);
            return std::nullopt;
        }
        if (flag == "--energy") {
            opts.load.energy = *number;
        } else if (flag == "--dp") {
            opts.dp = *number;
        } else if (flag == "--x") {
            opts.x = *number;
        } else if (flag == "--px") {
            opts.px = *number;
        } else if (flag == "--y") {
            opts.y = *number;
        } else if (flag == "--py") {
            opts.py = *number;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", flag);
            return std::nullopt;
        }
    }
    return opts;
}

} // namespace ringtrack::cli
