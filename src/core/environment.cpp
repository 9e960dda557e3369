#include <strata/environment.hpp>
#include <strata/layers.hpp>
#include <strata/manifest.hpp>
#include <algorithm>

namespace strata {

Environment::Environment(const Manifest& manifest, EnvironmentName name,
                         const EnvironmentSpec& spec)
    : manifest_(&manifest), name_(std::move(name))
{
    for (const auto& fname : spec.features) {
        // Unknown names are rejected when the manifest is read
        if (const Feature* f = manifest.feature(fname)) {
            features_.push_back(f);
        }
    }
    if (!spec.no_default_feature) {
        features_.push_back(&manifest.default_feature());
    }
}

std::vector<const Target*> Environment::layers(std::optional<Platform> platform) const {
    std::vector<const Target*> out;
    for (const Feature* f : features_) {
        auto resolved = f->targets.resolve(platform);
        out.insert(out.end(), resolved.begin(), resolved.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// Feature-wide settings
// ---------------------------------------------------------------------------

std::vector<Platform> Environment::platforms() const {
    const Feature& def = manifest_->default_feature();
    std::vector<Platform> out = def.platforms.value_or(std::vector<Platform>{});

    for (const Feature* f : features_) {
        if (f->is_default() || !f->platforms) continue;
        const auto& allowed = *f->platforms;
        out.erase(std::remove_if(out.begin(), out.end(), [&](Platform p) {
            return std::find(allowed.begin(), allowed.end(), p) == allowed.end();
        }), out.end());
    }
    return out;
}

bool Environment::supports(Platform p) const {
    auto all = platforms();
    return std::find(all.begin(), all.end(), p) != all.end();
}

Platform Environment::best_platform() const {
    Platform current = current_platform();
    if (supports(current)) return current;

    switch (current) {
        case Platform::OsxArm64:
            if (supports(Platform::Osx64)) return Platform::Osx64;
            break;
        case Platform::WinArm64:
            if (supports(Platform::Win64)) return Platform::Win64;
            break;
        default:
            break;
    }
    return current;
}

std::vector<PrioritizedChannel> Environment::channels() const {
    std::vector<PrioritizedChannel> out;
    auto collect = [&](const std::vector<PrioritizedChannel>& from) {
        for (const auto& ch : from) {
            bool seen = std::any_of(out.begin(), out.end(),
                [&](const PrioritizedChannel& c) { return c.channel == ch.channel; });
            if (!seen) out.push_back(ch);
        }
    };

    for (const Feature* f : features_) {
        if (f->channels) collect(*f->channels);
    }

    // An environment without the default feature still uses the project channels
    if (out.empty() && manifest_->default_feature().channels) {
        collect(*manifest_->default_feature().channels);
    }

    std::stable_sort(out.begin(), out.end(),
        [](const PrioritizedChannel& a, const PrioritizedChannel& b) {
            return a.priority.value_or(0) > b.priority.value_or(0);
        });
    return out;
}

Result<std::optional<ChannelPriority>> Environment::channel_priority() const {
    std::optional<ChannelPriority> found;
    const Feature* from = nullptr;

    for (const Feature* f : features_) {
        if (!f->channel_priority) continue;
        if (!found) {
            found = f->channel_priority;
            from = f;
        } else if (*found != *f->channel_priority) {
            return StrataError{StrataError::Manifest,
                "environment '" + name_.as_str() + "' has conflicting channel priorities: '" +
                channel_priority_name(*found) + "' from feature '" + from->name.as_str() +
                "' and '" + channel_priority_name(*f->channel_priority) + "' from feature '" +
                f->name.as_str() + "'",
                "set channel-priority in at most one feature of the environment"};
        }
    }
    return Result<std::optional<ChannelPriority>>::ok(found);
}

Result<SystemRequirements> Environment::system_requirements() const {
    SystemRequirements out;
    for (const Feature* f : features_) {
        auto merged = out.union_with(f->system_requirements);
        if (merged.is_err()) return std::move(merged).with_context("environment '" + name_.as_str() + "'");
        out = std::move(merged).value();
    }
    return Result<SystemRequirements>::ok(std::move(out));
}

Result<std::optional<PypiOptions>> Environment::pypi_options() const {
    std::optional<PypiOptions> out;
    for (const Feature* f : features_) {
        if (!f->pypi_options) continue;
        if (!out) {
            out = *f->pypi_options;
            continue;
        }
        auto merged = out->union_with(*f->pypi_options);
        if (merged.is_err()) {
            return std::move(merged).error().context("environment '" + name_.as_str() + "'");
        }
        out = std::move(merged).value();
    }
    return Result<std::optional<PypiOptions>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Layered resolution
// ---------------------------------------------------------------------------

std::optional<MaybeOwned<DependencyMap>> Environment::dependencies(
    std::optional<SpecType> kind, std::optional<Platform> platform) const
{
    return layers::merge_dependencies(layers(platform), kind);
}

std::optional<MaybeOwned<PypiDependencyMap>> Environment::pypi_dependencies(
    std::optional<Platform> platform) const
{
    return layers::merge_pypi_dependencies(layers(platform));
}

std::vector<std::string> Environment::activation_scripts(std::optional<Platform> platform) const {
    std::vector<std::string> out;
    for (const Feature* f : features_) {
        if (const auto* scripts = f->activation_scripts(platform)) {
            out.insert(out.end(), scripts->begin(), scripts->end());
        }
    }
    return out;
}

EnvVarMap Environment::activation_env(std::optional<Platform> platform) const {
    return layers::merge_activation_env(layers(platform));
}

bool Environment::has_pypi_dependencies() const {
    return std::any_of(features_.begin(), features_.end(),
        [](const Feature* f) { return f->has_pypi_dependencies(); });
}

Result<std::optional<std::vector<std::string>>> Environment::no_build_isolation() const {
    auto opts = pypi_options();
    if (opts.is_err()) return std::move(opts).error();

    std::optional<std::vector<std::string>> out;
    if (opts.value() && opts.value()->no_build_isolation) {
        out = *opts.value()->no_build_isolation;
    }
    return Result<std::optional<std::vector<std::string>>>::ok(std::move(out));
}

} // namespace strata
