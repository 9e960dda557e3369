#pragma once

#include <strata/manifest.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <string>

namespace strata {

inline constexpr const char* LOCK_FILE_NAME = "strata.lock";

// A loaded project. Environments handed out by `manifest` point into this
// object, so it must stay in place while they are in use.
struct Project {
    Manifest manifest;
    std::filesystem::path root_dir;       // dir containing strata.toml
    std::filesystem::path manifest_path;  // full path to strata.toml
    std::string checksum;                 // SHA-256 of strata.toml contents

    // Walk up from start_dir to find strata.toml, then load
    static Result<Project> discover(const std::filesystem::path& start_dir);

    // Load from a specific directory (must contain strata.toml)
    static Result<Project> load(const std::filesystem::path& project_dir);

    // <root>/.strata
    std::filesystem::path state_dir() const;

    // <root>/.strata/envs
    std::filesystem::path environments_dir() const;

    // Where an environment is installed: <root>/.strata/envs/<name>
    std::filesystem::path environment_dir(const EnvironmentName& name) const;

    std::filesystem::path lock_file_path() const;
};

// Walk up from start_dir to find the nearest strata.toml, return its path
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir);

} // namespace strata
