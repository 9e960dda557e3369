#pragma once

#include <strata/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// A python distribution installed in a site-packages directory, found by its
// <name>-<version>.dist-info directory
struct InstalledDist {
    std::string name;
    std::string version;
    std::filesystem::path dist_info;

    // nullopt unless `dir` is a *.dist-info directory with a parsable name
    static std::optional<InstalledDist> try_from_path(const std::filesystem::path& dir);

    // Contents of dist-info/INSTALLER, trimmed. nullopt when the file is
    // missing; an error when it exists but cannot be read.
    Result<std::optional<std::string>> installer() const;
};

// All distributions of a site-packages directory, ordered by name
Result<std::vector<InstalledDist>> list_installed_dists(const std::filesystem::path& site_packages);

// Distributions whose INSTALLER is `installer`. Distributions without an
// installer or from another installer are skipped; ones whose installer
// cannot be read are skipped with a warning.
Result<std::vector<InstalledDist>> find_dists_installed_by(
    const std::filesystem::path& site_packages, const std::string& installer);

} // namespace strata
