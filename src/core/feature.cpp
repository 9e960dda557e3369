#include <strata/feature.hpp>
#include <strata/layers.hpp>
#include <algorithm>

namespace strata {

std::vector<Platform>& Feature::platforms_mut() {
    if (!platforms) platforms.emplace();
    return *platforms;
}

std::vector<PrioritizedChannel>& Feature::channels_mut() {
    if (!channels) channels.emplace();
    return *channels;
}

std::optional<MaybeOwned<DependencyMap>> Feature::dependencies(
    std::optional<SpecType> kind,
    std::optional<Platform> platform) const
{
    return layers::merge_dependencies(targets.resolve(platform), kind);
}

std::optional<MaybeOwned<PypiDependencyMap>> Feature::pypi_dependencies(
    std::optional<Platform> platform) const
{
    return layers::merge_pypi_dependencies(targets.resolve(platform));
}

const std::vector<std::string>* Feature::activation_scripts(
    std::optional<Platform> platform) const
{
    return layers::first_activation_scripts(targets.resolve(platform));
}

EnvVarMap Feature::activation_env(std::optional<Platform> platform) const {
    return layers::merge_activation_env(targets.resolve(platform));
}

bool Feature::has_pypi_dependencies() const {
    for (const Target* t : targets.targets()) {
        if (t->pypi_dependencies && !t->pypi_dependencies->empty()) {
            return true;
        }
    }
    return false;
}

void Feature::add_channels(const std::vector<PrioritizedChannel>& to_add) {
    auto& current = channels_mut();
    for (const auto& ch : to_add) {
        auto it = std::find_if(current.begin(), current.end(),
            [&](const PrioritizedChannel& c) { return c.channel == ch.channel; });
        if (it == current.end()) {
            current.push_back(ch);
        } else {
            it->priority = ch.priority;
        }
    }
}

size_t Feature::remove_channels(const std::vector<PrioritizedChannel>& to_remove) {
    if (!channels) return 0;

    size_t before = channels->size();
    channels->erase(
        std::remove_if(channels->begin(), channels->end(),
            [&](const PrioritizedChannel& c) {
                return std::any_of(to_remove.begin(), to_remove.end(),
                    [&](const PrioritizedChannel& r) { return r.channel == c.channel; });
            }),
        channels->end());
    return before - channels->size();
}

} // namespace strata
