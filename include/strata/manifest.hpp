#pragma once

#include <strata/environment.hpp>
#include <strata/feature.hpp>
#include <strata/index_map.hpp>
#include <strata/name.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

inline constexpr const char* MANIFEST_FILE_NAME = "strata.toml";

// [project] table, minus platforms and channels which live on the default
// feature
struct ProjectMetadata {
    std::string name;
    std::optional<std::string> version;
    std::optional<std::string> description;
};

// Parsed strata.toml
struct Manifest {
    ProjectMetadata project;

    // Always contains the default feature, in declaration order otherwise
    IndexMap<FeatureName, Feature> features;

    // Always contains the default environment
    IndexMap<EnvironmentName, EnvironmentSpec> environments;

    Manifest();

    static Result<Manifest> parse(const std::string& toml_str,
                                  const std::string& source_path = "");
    static Result<Manifest> load(const std::filesystem::path& path);

    const Feature& default_feature() const;
    Feature& default_feature_mut();

    const Feature* feature(const FeatureName& name) const;
    Feature* feature_mut(const FeatureName& name);

    Result<Environment> environment(const EnvironmentName& name) const;
    Environment default_environment() const;
    std::vector<Environment> all_environments() const;

    // Channel mutation used by the `project channel add/remove` commands
    Status add_channels(const std::vector<PrioritizedChannel>& channels,
                        const FeatureName& feature);
    Status remove_channels(const std::vector<PrioritizedChannel>& channels,
                           const FeatureName& feature);
};

} // namespace strata
