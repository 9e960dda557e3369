#pragma once

#include <strata/drift_hash.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace strata {

// Provenance record written into conda-meta/ after a successful install.
// Comparing its hash against the lock file tells whether the prefix is
// already up to date.
struct EnvironmentFile {
    std::string manifest_path;
    std::string environment_name;
    std::string tool_version;
    DriftHash environment_lock_file_hash;

    std::string to_json() const;
    static Result<EnvironmentFile> from_json(const std::string& text);
};

std::filesystem::path environment_file_path(const std::filesystem::path& environment_dir);

// Creating conda-meta/ must succeed; failing to write the record itself is
// only logged. Returns the record path.
Result<std::filesystem::path> write_environment_file(
    const std::filesystem::path& environment_dir, const EnvironmentFile& file);

// nullopt when there is no usable record. An unreadable or malformed record
// is deleted so the next install rewrites it.
std::optional<EnvironmentFile> read_environment_file(
    const std::filesystem::path& environment_dir);

} // namespace strata
