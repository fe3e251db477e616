#pragma once

/// @file include/ringtrack/load.hpp
/// @brief Lattice-file loaders selected by file extension.
///
/// # Module: Loaders
///
/// ## Responsibility
/// Map a file extension to a loader and turn lattice files into `Lattice`
/// objects. Two formats are registered on first use:
///
/// | extension | format  | loader                          |
/// |-----------|---------|---------------------------------|
/// | `.lte`    | Elegant | `elegant::load_elegant`         |
/// | `.lat`    | Tracy   | `tracy::load_tracy`             |
///
/// ## Guarantees
/// - Unreadable files and unknown extensions throw `LoadError`
/// - Malformed contents throw `ParseError` naming the offending part
///
/// ## NOT Responsible For
/// - Writing lattice files

#include "ringtrack/constants.hpp"
#include "ringtrack/lattice.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ringtrack {

/// Options shared by every loader.
struct LoadOptions {
    std::optional<double> energy;      ///< Beam energy [GeV]; overrides the file
    std::string           lattice_key; ///< Line to expand (Elegant); empty = last line defined
    long harmonic_number = constants::DEFAULT_HARMONIC_NUMBER;
    bool verbose         = false;
};

using Loader = std::function<Lattice(const std::filesystem::path&, const LoadOptions&)>;

/// A registered file format.
struct FormatInfo {
    std::string extension;     ///< Including the dot, lower case
    std::string description;
};

/// Register or replace the loader for `extension` (e.g. ".lte").
void register_format(std::string extension, Loader loader, std::string description);

/// Registered formats in extension order.
[[nodiscard]] std::vector<FormatInfo> registered_formats();

/// Load `path` with the loader registered for its extension.
///
/// # Throws
/// `LoadError` for an unknown extension or unreadable file; `ParseError`
/// for malformed contents.
[[nodiscard]] Lattice load_lattice(const std::filesystem::path& path,
                                   const LoadOptions& options = {});

/// Resolve a lattice file name.
///
/// An absolute `name`, or one that exists relative to the working
/// directory, is returned unchanged. Otherwise each directory of the
/// colon-separated `search_path` is tried in order and the first existing
/// candidate is returned; empty entries are skipped. If nothing matches,
/// `name` is returned so that loading reports the original path.
[[nodiscard]] std::filesystem::path resolve_lattice(const std::filesystem::path& name,
                                                    std::string_view search_path);

/// Whole file as a string.
///
/// # Throws
/// `LoadError` if the file cannot be opened.
[[nodiscard]] std::string read_file(const std::filesystem::path& path);

} // namespace ringtrack
