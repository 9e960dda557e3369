#pragma once

#include <strata/name.hpp>
#include <strata/platform.hpp>
#include <strata/spec.hpp>
#include <strata/target.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// A named bundle of dependencies, activation and tasks. Features are not
// installed on their own; environments compose them.
struct Feature {
    FeatureName name;

    // nullopt: use the project platforms
    std::optional<std::vector<Platform>> platforms;

    // nullopt: use the project channels
    std::optional<std::vector<PrioritizedChannel>> channels;

    // nullopt counts as unset and never overrides a value set by another
    // feature of the same environment
    std::optional<ChannelPriority> channel_priority;

    SystemRequirements system_requirements;
    std::optional<PypiOptions> pypi_options;
    Targets targets;

    Feature() = default;
    explicit Feature(FeatureName n) : name(std::move(n)) {}

    bool is_default() const { return name.is_default(); }

    std::vector<Platform>& platforms_mut();
    std::vector<PrioritizedChannel>& channels_mut();

    // Dependencies of `kind` (all kinds combined when nullopt) for `platform`,
    // merged over the applicable target layers. The result borrows from this
    // feature when a single layer contributes and must not outlive it.
    std::optional<MaybeOwned<DependencyMap>> dependencies(
        std::optional<SpecType> kind,
        std::optional<Platform> platform) const;

    std::optional<MaybeOwned<PypiDependencyMap>> pypi_dependencies(
        std::optional<Platform> platform) const;

    // Scripts of the most specific layer defining any, or nullptr
    const std::vector<std::string>* activation_scripts(
        std::optional<Platform> platform) const;

    EnvVarMap activation_env(std::optional<Platform> platform) const;

    // True if any layer, for any platform, has a non-empty PyPI table
    bool has_pypi_dependencies() const;

    // Add channels that are not present yet, keeping order
    void add_channels(const std::vector<PrioritizedChannel>& to_add);

    // Remove channels by name. Returns how many entries were removed.
    size_t remove_channels(const std::vector<PrioritizedChannel>& to_remove);
};

} // namespace strata
