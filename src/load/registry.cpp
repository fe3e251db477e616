/// @file src/load/registry.cpp
/// @brief Extension-to-loader registry and file reading.

#include "ringtrack/load.hpp"
#include "ringtrack/elegant.hpp"
#include "ringtrack/errors.hpp"
#include "ringtrack/tracy.hpp"

#include "text_utils.hpp"

#include <fmt/format.h>

#include <fstream>
#include <map>
#include <sstream>

namespace ringtrack {

namespace {

struct Format {
    Loader      loader;
    std::string description;
};

std::map<std::string, Format>& formats() {
    static std::map<std::string, Format> registry = {
        {".lte", {elegant::load_elegant, "Elegant format"}},
        {".lat", {tracy::load_tracy, "Tracy format"}},
    };
    return registry;
}

} // namespace

void register_format(std::string extension, Loader loader, std::string description) {
    formats().insert_or_assign(text::to_lower(extension),
                               Format{std::move(loader), std::move(description)});
}

std::vector<FormatInfo> registered_formats() {
    std::vector<FormatInfo> out;
    for (const auto& [ext, format] : formats()) out.push_back({ext, format.description});
    return out;
}

Lattice load_lattice(const std::filesystem::path& path, const LoadOptions& options) {
    const std::string ext = text::to_lower(path.extension().string());
    auto it = formats().find(ext);
    if (it == formats().end()) {
        throw LoadError(fmt::format("No loader registered for extension '{}' ({})",
                                    ext, path.string()));
    }
    return it->second.loader(path, options);
}

std::filesystem::path resolve_lattice(const std::filesystem::path& name,
                                      std::string_view search_path) {
    if (name.is_absolute() || std::filesystem::exists(name)) return name;
    while (!search_path.empty()) {
        const std::size_t colon = search_path.find(':');
        const std::string_view dir = search_path.substr(0, colon);
        if (!dir.empty()) {
            const std::filesystem::path candidate = std::filesystem::path(dir) / name;
            if (std::filesystem::exists(candidate)) return candidate;
        }
        if (colon == std::string_view::npos) break;
        search_path.remove_prefix(colon + 1);
    }
    return name;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LoadError(fmt::format("Cannot open lattice file: {}", path.string()));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace ringtrack
