#pragma once

#include <strata/log.hpp>
#include <strata/result.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// [pypi-config]: index settings used when neither the lock file nor the
// manifest configures any
struct PypiConfig {
    std::optional<std::string> index_url;
    std::vector<std::string> extra_index_urls;
};

// Layered configuration: global < project.
// Later layers override earlier ones, field by field.
struct Config {
    size_t io_concurrency_limit = 50;
    bool interactive = true;
    std::optional<log::Level> log_level;
    PypiConfig pypi_config;

    // Track which fields were explicitly set (for merge)
    bool io_concurrency_limit_set = false;
    bool interactive_set = false;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project);

    // Global config, then <state_dir>/config.toml; missing files are skipped
    static Result<Config> load_layers(const std::filesystem::path& state_dir);

    // Apply log-level, if set
    void apply_log_level() const;
};

// ~/.strata/config.toml, empty when there is no home directory
std::string global_config_path();

} // namespace strata
