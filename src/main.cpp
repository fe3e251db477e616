/// @file src/main.cpp
/// @brief ringtrack CLI entry point.
///
/// Usage:
///   ringtrack --twiss <lattice> [options]   Print closed orbit, Twiss and tunes
///   ringtrack --track <lattice> [options]   Track one particle turn by turn
///   ringtrack --m66 <lattice>               Print the 6x6 one-turn matrix
///   ringtrack --formats                     List registered lattice formats
///   ringtrack --help                        Print usage

#include "cli/cli_options.hpp"

#include "ringtrack/errors.hpp"
#include "ringtrack/load.hpp"
#include "ringtrack/physics.hpp"
#include "ringtrack/tracking.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using ringtrack::cli::CliOptions;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  ringtrack --twiss <lattice> [--energy GeV] [--key LINE] [--harmonic H]\n"
        "                              [--dp D] [--chrom]\n"
        "  ringtrack --track <lattice> [--turns N] [--x X] [--px PX] [--y Y] [--py PY]\n"
        "                              [--dp D] [--energy GeV] [--key LINE]\n"
        "  ringtrack --m66 <lattice>   [--energy GeV] [--key LINE]\n"
        "  ringtrack --formats         List lattice file formats\n"
        "  ringtrack --help            Show this help\n"
        "\n"
        "Relative lattice paths are looked up in the current directory, then\n"
        "in each directory of RINGTRACK_LATTICE_PATH (colon-separated).\n"
    );
}

/// Directories listed in RINGTRACK_LATTICE_PATH, empty if unset.
std::string_view lattice_search_path() {
    const char* search = std::getenv("RINGTRACK_LATTICE_PATH");
    return search ? std::string_view(search) : std::string_view{};
}

ringtrack::Lattice load(const std::string& name, const CliOptions& opts) {
    auto lattice = ringtrack::load_lattice(
        ringtrack::resolve_lattice(name, lattice_search_path()), opts.load);
    fmt::print("Loaded {} elements from '{}' (circumference {:.6f} m)\n",
               lattice.size(), lattice.source(), lattice.circumference());
    return lattice;
}

/// Print the optics of the lattice. Returns 0 on success, 1 if unstable.
int run_twiss(const std::string& name, const CliOptions& opts) {
    const auto ring = load(name, opts);
    ringtrack::OpticsConfig config;
    config.verbose = opts.verbose;

    const auto result = ringtrack::get_twiss(ring, opts.dp, std::nullopt, opts.chrom, config);
    if (!result) {
        fmt::print(stderr, "Error: no stable closed orbit / optics found at dp={}\n", opts.dp);
        return 1;
    }

    fmt::print("{:>6} {:>12} {:>12} {:>12} {:>12} {:>12} {:>12} {:>12}\n",
               "idx", "s [m]", "beta_x", "beta_y", "alpha_x", "alpha_y", "mu_x", "mu_y");
    for (const auto& t : result->twiss) {
        fmt::print("{:>6} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f} {:>12.6f}\n",
                   t.idx, t.s_pos, t.beta[0], t.beta[1], t.alpha[0], t.alpha[1],
                   t.mu[0], t.mu[1]);
    }
    fmt::print("Tunes: Qx = {:.6f}  Qy = {:.6f}\n", result->tune[0], result->tune[1]);
    if (result->chromaticity) {
        fmt::print("Chromaticity: ξx = {:.6f}  ξy = {:.6f}\n",
                   (*result->chromaticity)[0], (*result->chromaticity)[1]);
    }
    return 0;
}

/// Track one particle and print its coordinates after every turn.
int run_track(const std::string& name, const CliOptions& opts) {
    const auto ring = load(name, opts);

    ringtrack::ParticleMatrix particle(ringtrack::NUM_COORDS, 1);
    particle << opts.x, opts.px, opts.y, opts.py, opts.dp, 0.0;

    ringtrack::Tracker tracker(ring, ringtrack::TrackingConfig{opts.verbose});
    fmt::print("{:>6} {:>14} {:>14} {:>14} {:>14} {:>14} {:>14}\n",
               "turn", "x", "px", "y", "py", "delta", "ct");
    for (int turn = 1; turn <= opts.turns; ++turn) {
        tracker.lattice_pass(particle, 1, std::nullopt, turn > 1);
        if (ringtrack::is_lost(particle.col(0))) {
            fmt::print("Particle lost at turn {}\n", turn);
            return 0;
        }
        fmt::print("{:>6} {:>14.6e} {:>14.6e} {:>14.6e} {:>14.6e} {:>14.6e} {:>14.6e}\n",
                   turn, particle(0, 0), particle(1, 0), particle(2, 0),
                   particle(3, 0), particle(4, 0), particle(5, 0));
    }
    return 0;
}

int run_m66(const std::string& name, const CliOptions& opts) {
    const auto ring = load(name, opts);
    const auto m = ringtrack::m66(ring);
    if (!m) {
        fmt::print(stderr, "Error: particle lost while computing the one-turn matrix\n");
        return 1;
    }
    for (Eigen::Index r = 0; r < m->rows(); ++r) {
        for (Eigen::Index c = 0; c < m->cols(); ++c) fmt::print("{:>14.6e}", (*m)(r, c));
        fmt::print("\n");
    }
    return 0;
}

int run_formats() {
    for (const auto& f : ringtrack::registered_formats()) {
        fmt::print("{:<6} {}\n", f.extension, f.description);
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode == "--formats") {
        return run_formats();
    }

    if (mode != "--twiss" && mode != "--track" && mode != "--m66") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage();
        return 1;
    }
    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a lattice file path\n", mode);
        print_usage();
        return 1;
    }

    const std::vector<std::string_view> args(argv + 3, argv + argc);
    const auto opts = ringtrack::cli::parse_options(args);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        const std::string lattice(argv[2]);
        if (mode == "--twiss") return run_twiss(lattice, *opts);
        if (mode == "--track") return run_track(lattice, *opts);
        return run_m66(lattice, *opts);
    } catch (const ringtrack::Error& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
