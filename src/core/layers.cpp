#include <strata/layers.hpp>

namespace strata::layers {

namespace {

template<typename Map, typename Get>
std::optional<MaybeOwned<Map>> fold_least_specific_first(
    const std::vector<const Target*>& layers, Get get)
{
    std::optional<MaybeOwned<Map>> acc;
    for (auto it = layers.rbegin(); it != layers.rend(); ++it) {
        std::optional<MaybeOwned<Map>> layer = get(**it);
        if (!layer) continue;

        // An empty map only counts when nothing else declared one
        if (!acc || (acc->get().empty() && !layer->get().empty())) {
            acc = std::move(layer);
            continue;
        }
        if (layer->get().empty()) continue;
        acc->to_mut().extend(layer->get());
    }
    return acc;
}

} // namespace

std::optional<MaybeOwned<DependencyMap>> merge_dependencies(
    const std::vector<const Target*>& layers,
    std::optional<SpecType> kind)
{
    return fold_least_specific_first<DependencyMap>(layers,
        [&](const Target& t) { return t.dependencies_for(kind); });
}

std::optional<MaybeOwned<PypiDependencyMap>> merge_pypi_dependencies(
    const std::vector<const Target*>& layers)
{
    return fold_least_specific_first<PypiDependencyMap>(layers,
        [](const Target& t) -> std::optional<MaybeOwned<PypiDependencyMap>> {
            if (!t.pypi_dependencies) return std::nullopt;
            return MaybeOwned<PypiDependencyMap>::borrowed(*t.pypi_dependencies);
        });
}

const std::vector<std::string>* first_activation_scripts(
    const std::vector<const Target*>& layers)
{
    for (const Target* t : layers) {
        if (t->activation && t->activation->scripts) {
            return &*t->activation->scripts;
        }
    }
    return nullptr;
}

EnvVarMap merge_activation_env(const std::vector<const Target*>& layers) {
    EnvVarMap merged;
    for (const Target* t : layers) {
        if (!t->activation || !t->activation->env) continue;
        for (const auto& [key, value] : *t->activation->env) {
            if (!merged.contains(key)) {
                merged.insert(key, value);
            }
        }
    }
    return merged;
}

} // namespace strata::layers
