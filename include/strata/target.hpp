#pragma once

#include <strata/maybe_owned.hpp>
#include <strata/platform.hpp>
#include <strata/result.hpp>
#include <strata/spec.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace strata {

enum class SpecType {
    Run,
    Host,
    Build,
};

const char* spec_type_name(SpecType t);

// [activation] table
struct Activation {
    std::optional<std::vector<std::string>> scripts;
    std::optional<EnvVarMap> env;
};

struct Task {
    std::string cmd;
    std::vector<std::string> depends_on;
    std::optional<std::string> cwd;
    std::optional<std::string> description;
    EnvVarMap env;
};

using TaskMap = IndexMap<std::string, Task>;

// One configuration layer. An absent map means "not declared"; a present
// but empty map is an explicit declaration of "nothing".
struct Target {
    std::map<SpecType, DependencyMap> dependencies;
    std::optional<PypiDependencyMap> pypi_dependencies;
    std::optional<Activation> activation;
    TaskMap tasks;

    const DependencyMap* dependencies_of(SpecType kind) const;
    DependencyMap& dependencies_mut(SpecType kind);

    // Run, host and build merged in that order (later kinds overwrite
    // earlier ones). Empty maps are skipped; a single non-empty map is
    // returned borrowed.
    std::optional<MaybeOwned<DependencyMap>> combined_dependencies() const;

    // One kind, or the combined view when kind is nullopt
    std::optional<MaybeOwned<DependencyMap>> dependencies_for(
        std::optional<SpecType> kind) const;
};

// Selects the platform a target layer applies to. Matching is exact.
class TargetSelector {
public:
    explicit TargetSelector(Platform p) : platform_(p) {}

    static Result<TargetSelector> parse(const std::string& s);

    bool matches(Platform p) const { return platform_ == p; }
    Platform platform() const { return platform_; }
    std::string to_string() const { return platform_name(platform_); }

    bool operator==(const TargetSelector& o) const { return platform_ == o.platform_; }
    bool operator!=(const TargetSelector& o) const { return !(*this == o); }

private:
    Platform platform_;
};

// All layers of a feature: the default layer plus platform-selected layers.
class Targets {
public:
    Targets() = default;
    explicit Targets(Target default_target);

    const Target& default_target() const { return default_target_; }
    Target& default_target_mut() { return default_target_; }

    // Register a platform layer; a selector may only be declared once
    Status add_target(TargetSelector selector, Target target);

    // Layers applicable to `platform`, most specific first. The default layer
    // is always last. Without a platform only the default layer applies.
    std::vector<const Target*> resolve(std::optional<Platform> platform) const;

    const Target* for_target(const TargetSelector& selector) const;
    const Target* for_opt_target(const std::optional<TargetSelector>& selector) const;
    Target& for_target_mut(const TargetSelector& selector);

    // Every layer regardless of platform, default first
    std::vector<const Target*> targets() const;

    const std::vector<std::pair<TargetSelector, Target>>& user_defined() const {
        return user_defined_;
    }

private:
    Target default_target_;
    std::vector<std::pair<TargetSelector, Target>> user_defined_;
};

} // namespace strata
