#pragma once

#include <strata/target.hpp>
#include <optional>
#include <string>
#include <vector>

// Merge algebra over a stack of target layers ordered most specific first.
// Features and environments both reduce to such a stack.
namespace strata::layers {

// Folds least specific first, extending an accumulator, so the most specific
// value of a key wins. One contributing layer is returned borrowed; several
// produce an owned merge. An explicitly empty map resets what less specific
// layers contributed. nullopt if no layer declares the kind.
std::optional<MaybeOwned<DependencyMap>> merge_dependencies(
    const std::vector<const Target*>& layers,
    std::optional<SpecType> kind);

// Same algebra as merge_dependencies for the PyPI table
std::optional<MaybeOwned<PypiDependencyMap>> merge_pypi_dependencies(
    const std::vector<const Target*>& layers);

// Scripts of the most specific layer that declares any. Never merged.
const std::vector<std::string>* first_activation_scripts(
    const std::vector<const Target*>& layers);

// Walks most specific first; the first layer to set a key keeps it.
EnvVarMap merge_activation_env(const std::vector<const Target*>& layers);

} // namespace strata::layers
