#pragma once

#include <strata/feature.hpp>
#include <strata/name.hpp>
#include <strata/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct Manifest;

// [environments] entry: which features an environment is made of
struct EnvironmentSpec {
    std::vector<FeatureName> features;
    bool no_default_feature = false;
    std::optional<std::string> solve_group;
};

// A read-only view of one environment of a manifest. Features are layered
// on top of each other: the first listed feature is the most specific and
// the default feature (unless excluded) the least specific.
class Environment {
public:
    Environment(const Manifest& manifest, EnvironmentName name,
                const EnvironmentSpec& spec);

    const EnvironmentName& name() const { return name_; }
    const Manifest& manifest() const { return *manifest_; }

    // Highest priority first
    const std::vector<const Feature*>& features() const { return features_; }

    // Project platforms restricted by every feature that declares platforms
    std::vector<Platform> platforms() const;
    bool supports(Platform p) const;

    // The current platform, or an emulated fallback (osx-64 on osx-arm64,
    // win-64 on win-arm64) when only that is supported
    Platform best_platform() const;

    // Union of feature channels, higher priority first, then feature order
    std::vector<PrioritizedChannel> channels() const;

    // First explicitly set priority; two different explicit values conflict
    Result<std::optional<ChannelPriority>> channel_priority() const;

    Result<SystemRequirements> system_requirements() const;
    Result<std::optional<PypiOptions>> pypi_options() const;

    std::optional<MaybeOwned<DependencyMap>> dependencies(
        std::optional<SpecType> kind, std::optional<Platform> platform) const;
    std::optional<MaybeOwned<PypiDependencyMap>> pypi_dependencies(
        std::optional<Platform> platform) const;

    // Each feature contributes its own most specific script list
    std::vector<std::string> activation_scripts(std::optional<Platform> platform) const;
    EnvVarMap activation_env(std::optional<Platform> platform) const;

    bool has_pypi_dependencies() const;

    // Packages exempted from build isolation, nullopt when none are listed
    Result<std::optional<std::vector<std::string>>> no_build_isolation() const;

private:
    std::vector<const Target*> layers(std::optional<Platform> platform) const;

    const Manifest* manifest_;
    EnvironmentName name_;
    std::vector<const Feature*> features_;
};

} // namespace strata
