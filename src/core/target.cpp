#include <strata/target.hpp>

namespace strata {

const char* spec_type_name(SpecType t) {
    switch (t) {
        case SpecType::Run:   return "run";
        case SpecType::Host:  return "host";
        case SpecType::Build: return "build";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Target
// ---------------------------------------------------------------------------

const DependencyMap* Target::dependencies_of(SpecType kind) const {
    auto it = dependencies.find(kind);
    return it == dependencies.end() ? nullptr : &it->second;
}

DependencyMap& Target::dependencies_mut(SpecType kind) {
    return dependencies[kind];
}

std::optional<MaybeOwned<DependencyMap>> Target::combined_dependencies() const {
    std::optional<MaybeOwned<DependencyMap>> all;
    for (SpecType kind : {SpecType::Run, SpecType::Host, SpecType::Build}) {
        const DependencyMap* deps = dependencies_of(kind);
        if (!deps || deps->empty()) continue;

        if (!all) {
            all = MaybeOwned<DependencyMap>::borrowed(*deps);
        } else {
            all->to_mut().extend(*deps);
        }
    }
    return all;
}

std::optional<MaybeOwned<DependencyMap>> Target::dependencies_for(
    std::optional<SpecType> kind) const
{
    if (!kind) return combined_dependencies();

    const DependencyMap* deps = dependencies_of(*kind);
    if (!deps) return std::nullopt;
    return MaybeOwned<DependencyMap>::borrowed(*deps);
}

// ---------------------------------------------------------------------------
// TargetSelector
// ---------------------------------------------------------------------------

Result<TargetSelector> TargetSelector::parse(const std::string& s) {
    auto platform = parse_platform(s);
    if (platform.is_err()) {
        return std::move(platform).error().context("invalid target selector");
    }
    return Result<TargetSelector>::ok(TargetSelector(platform.value()));
}

// ---------------------------------------------------------------------------
// Targets
// ---------------------------------------------------------------------------

Targets::Targets(Target default_target)
    : default_target_(std::move(default_target)) {}

Status Targets::add_target(TargetSelector selector, Target target) {
    if (for_target(selector)) {
        return StrataError{StrataError::Duplicate,
            "target '" + selector.to_string() + "' is declared more than once"};
    }
    user_defined_.emplace_back(selector, std::move(target));
    return ok_status();
}

std::vector<const Target*> Targets::resolve(std::optional<Platform> platform) const {
    std::vector<const Target*> layers;
    if (platform) {
        for (const auto& [selector, target] : user_defined_) {
            if (selector.matches(*platform)) {
                layers.push_back(&target);
            }
        }
    }
    layers.push_back(&default_target_);
    return layers;
}

const Target* Targets::for_target(const TargetSelector& selector) const {
    for (const auto& entry : user_defined_) {
        if (entry.first == selector) return &entry.second;
    }
    return nullptr;
}

const Target* Targets::for_opt_target(const std::optional<TargetSelector>& selector) const {
    if (!selector) return &default_target_;
    return for_target(*selector);
}

Target& Targets::for_target_mut(const TargetSelector& selector) {
    for (auto& entry : user_defined_) {
        if (entry.first == selector) return entry.second;
    }
    user_defined_.emplace_back(selector, Target{});
    return user_defined_.back().second;
}

std::vector<const Target*> Targets::targets() const {
    std::vector<const Target*> all;
    all.reserve(user_defined_.size() + 1);
    all.push_back(&default_target_);
    for (const auto& entry : user_defined_) all.push_back(&entry.second);
    return all;
}

} // namespace strata
