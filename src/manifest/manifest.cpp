#include <strata/manifest.hpp>
#include <strata/log.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace strata {

namespace {

// Keys a table describing one target layer may carry
const char* const TARGET_KEYS[] = {
    "dependencies", "host-dependencies", "build-dependencies",
    "pypi-dependencies", "activation", "tasks",
};

// Keys a [feature.<name>] table may carry on top of the target keys
const char* const FEATURE_KEYS[] = {
    "platforms", "channels", "channel-priority", "system-requirements",
    "pypi-options", "target",
};

// Keys of the document root on top of the target keys
const char* const ROOT_KEYS[] = {
    "project", "system-requirements", "pypi-options", "target", "feature",
    "environments",
};

template<size_t N>
bool is_one_of(const std::string& key, const char* const (&keys)[N]) {
    return std::any_of(std::begin(keys), std::end(keys),
        [&](const char* k) { return key == k; });
}

bool is_valid_environment_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-';
    });
}

// Walks a parsed document into the feature model. Every error carries the
// manifest path and the line of the offending node.
class ManifestReader {
public:
    explicit ManifestReader(const std::string& path) : path_(path) {}

    Result<Manifest> read(const toml::table& doc);

private:
    StrataError error_at(const toml::node& node, std::string msg,
                         std::string hint = "") const {
        return StrataError{StrataError::Manifest, std::move(msg), std::move(hint),
            path_, static_cast<int>(node.source().begin.line)};
    }

    Result<std::vector<std::string>> string_array(const toml::node& node,
                                                  const std::string& what) const;

    Result<DependencySpec> dependency_spec(const std::string& name,
                                           const toml::node& node) const;
    Result<DependencyMap> dependency_map(const toml::node& node,
                                         const std::string& what) const;

    Result<PypiRequirement> pypi_requirement(const std::string& name,
                                             const toml::node& node) const;
    Result<PypiDependencyMap> pypi_dependency_map(const toml::node& node) const;

    Result<Activation> activation(const toml::node& node) const;
    Result<TaskMap> tasks(const toml::node& node) const;
    Result<SystemRequirements> system_requirements(const toml::node& node) const;
    Result<PypiOptions> pypi_options(const toml::node& node) const;
    Result<std::vector<Platform>> platforms(const toml::node& node) const;
    Result<std::vector<PrioritizedChannel>> channels(const toml::node& node) const;
    Result<ChannelPriority> channel_priority(const toml::node& node) const;

    // Fill `target` from the target keys present in `tbl`
    Status target_body(const toml::table& tbl, Target& target) const;

    // [target.<platform>] tables
    Status target_tables(const toml::node& node, Targets& targets) const;

    // Everything a feature table or the document root may declare
    Status feature_body(const toml::table& tbl, Feature& feature) const;

    Status environments(const toml::node& node, Manifest& m) const;

    std::string path_;
};

Result<std::vector<std::string>> ManifestReader::string_array(
    const toml::node& node, const std::string& what) const
{
    const auto* arr = node.as_array();
    if (!arr) {
        return error_at(node, what + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) return error_at(elem, what + " must only contain strings");
        out.push_back(std::string(*s));
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Dependencies
// ---------------------------------------------------------------------------

Result<DependencySpec> ManifestReader::dependency_spec(
    const std::string& name, const toml::node& node) const
{
    if (auto v = node.value<std::string>()) {
        return Result<DependencySpec>::ok(DependencySpec::from_version(std::string(*v)));
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        return error_at(node, "dependency '" + name + "' must be a version string or a table");
    }

    DependencySpec spec;
    for (const auto& [key, val] : *tbl) {
        std::string k(key);
        auto s = val.value<std::string>();
        if (!s) {
            return error_at(val, "field '" + k + "' of dependency '" + name + "' must be a string");
        }
        if (k == "version") spec.version = std::string(*s);
        else if (k == "build") spec.build = std::string(*s);
        else if (k == "channel") spec.channel = std::string(*s);
        else if (k == "subdir") spec.subdir = std::string(*s);
        else if (k == "url") spec.url = std::string(*s);
        else if (k == "path") spec.path = std::string(*s);
        else if (k == "git") spec.git = std::string(*s);
        else {
            return error_at(val, "unknown field '" + k + "' in dependency '" + name + "'",
                "expected one of: version, build, channel, subdir, url, path, git");
        }
    }

    int sources = (spec.url ? 1 : 0) + (spec.path ? 1 : 0) + (spec.git ? 1 : 0);
    if (sources > 1) {
        return error_at(node, "dependency '" + name + "' has more than one source",
            "use only one of url, path or git");
    }
    return Result<DependencySpec>::ok(std::move(spec));
}

Result<DependencyMap> ManifestReader::dependency_map(
    const toml::node& node, const std::string& what) const
{
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[" + what + "] must be a table");

    DependencyMap deps;
    for (const auto& [key, val] : *tbl) {
        auto name = PackageName::parse(std::string(key));
        if (name.is_err()) {
            auto e = std::move(name).error();
            return error_at(val, e.message, e.hint);
        }
        auto spec = dependency_spec(std::string(key), val);
        if (spec.is_err()) return std::move(spec).error();
        if (!deps.insert(name.value(), std::move(spec).value())) {
            return error_at(val, "package '" + std::string(key) + "' is listed twice in [" + what + "]",
                "names are compared case-insensitively");
        }
    }
    return Result<DependencyMap>::ok(std::move(deps));
}

Result<PypiRequirement> ManifestReader::pypi_requirement(
    const std::string& name, const toml::node& node) const
{
    PypiRequirement req;
    if (auto v = node.value<std::string>()) {
        if (*v != "*") req.version = std::string(*v);
        return Result<PypiRequirement>::ok(std::move(req));
    }

    const auto* tbl = node.as_table();
    if (!tbl) {
        return error_at(node, "pypi dependency '" + name + "' must be a version string or a table");
    }

    for (const auto& [key, val] : *tbl) {
        std::string k(key);
        if (k == "extras") {
            auto extras = string_array(val, "extras of '" + name + "'");
            if (extras.is_err()) return std::move(extras).error();
            req.extras = std::move(extras).value();
            continue;
        }
        if (k == "editable") {
            auto b = val.value<bool>();
            if (!b) return error_at(val, "'editable' of '" + name + "' must be a boolean");
            req.editable = *b;
            continue;
        }

        auto s = val.value<std::string>();
        if (!s) {
            return error_at(val, "field '" + k + "' of pypi dependency '" + name + "' must be a string");
        }
        if (k == "version") {
            if (*s != "*") req.version = std::string(*s);
        }
        else if (k == "path") req.path = std::string(*s);
        else if (k == "git") req.git = std::string(*s);
        else if (k == "rev" || k == "tag" || k == "branch") req.rev = std::string(*s);
        else if (k == "url") req.url = std::string(*s);
        else if (k == "index") req.index = std::string(*s);
        else {
            return error_at(val, "unknown field '" + k + "' in pypi dependency '" + name + "'");
        }
    }

    if (req.editable && !req.path) {
        return error_at(node, "pypi dependency '" + name + "' is editable but has no path",
            "only local path dependencies can be installed in editable mode");
    }
    if (req.rev && !req.git) {
        return error_at(node, "pypi dependency '" + name + "' sets a git revision without 'git'");
    }
    return Result<PypiRequirement>::ok(std::move(req));
}

Result<PypiDependencyMap> ManifestReader::pypi_dependency_map(const toml::node& node) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[pypi-dependencies] must be a table");

    PypiDependencyMap deps;
    for (const auto& [key, val] : *tbl) {
        auto name = PypiPackageName::parse(std::string(key));
        if (name.is_err()) {
            auto e = std::move(name).error();
            return error_at(val, e.message, e.hint);
        }
        auto req = pypi_requirement(std::string(key), val);
        if (req.is_err()) return std::move(req).error();
        if (!deps.insert(name.value(), std::move(req).value())) {
            return error_at(val, "pypi package '" + std::string(key) + "' is listed twice",
                "names are compared after PEP 503 normalization");
        }
    }
    return Result<PypiDependencyMap>::ok(std::move(deps));
}

// ---------------------------------------------------------------------------
// Activation and tasks
// ---------------------------------------------------------------------------

Result<Activation> ManifestReader::activation(const toml::node& node) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[activation] must be a table");

    Activation act;
    for (const auto& [key, val] : *tbl) {
        std::string k(key);
        if (k == "scripts") {
            auto scripts = string_array(val, "activation scripts");
            if (scripts.is_err()) return std::move(scripts).error();
            act.scripts = std::move(scripts).value();
        } else if (k == "env") {
            const auto* env = val.as_table();
            if (!env) return error_at(val, "activation env must be a table of strings");
            EnvVarMap vars;
            for (const auto& [ek, ev] : *env) {
                auto s = ev.value<std::string>();
                if (!s) return error_at(ev, "activation variable '" + std::string(ek) + "' must be a string");
                vars.insert_or_assign(std::string(ek), std::string(*s));
            }
            act.env = std::move(vars);
        } else {
            return error_at(val, "unknown field '" + k + "' in [activation]",
                "expected 'scripts' or 'env'");
        }
    }
    return Result<Activation>::ok(std::move(act));
}

Result<TaskMap> ManifestReader::tasks(const toml::node& node) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[tasks] must be a table");

    TaskMap out;
    for (const auto& [key, val] : *tbl) {
        std::string name(key);
        Task task;

        if (auto cmd = val.value<std::string>()) {
            task.cmd = std::string(*cmd);
            out.insert_or_assign(name, std::move(task));
            continue;
        }

        const auto* t = val.as_table();
        if (!t) return error_at(val, "task '" + name + "' must be a command string or a table");

        if (auto cmd = (*t)["cmd"].value<std::string>()) task.cmd = std::string(*cmd);
        if (auto cwd = (*t)["cwd"].value<std::string>()) task.cwd = std::string(*cwd);
        if (auto d = (*t)["description"].value<std::string>()) task.description = std::string(*d);

        if (const auto* dep = (*t).get("depends-on")) {
            if (auto single = dep->value<std::string>()) {
                task.depends_on.push_back(std::string(*single));
            } else {
                auto list = string_array(*dep, "depends-on of task '" + name + "'");
                if (list.is_err()) return std::move(list).error();
                task.depends_on = std::move(list).value();
            }
        }

        if (auto env = (*t)["env"].as_table()) {
            for (const auto& [ek, ev] : *env) {
                if (auto s = ev.value<std::string>()) {
                    task.env.insert_or_assign(std::string(ek), std::string(*s));
                }
            }
        }

        if (task.cmd.empty() && task.depends_on.empty()) {
            return error_at(val, "task '" + name + "' has neither a command nor dependencies");
        }
        out.insert_or_assign(name, std::move(task));
    }
    return Result<TaskMap>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Feature-wide settings
// ---------------------------------------------------------------------------

Result<SystemRequirements> ManifestReader::system_requirements(const toml::node& node) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[system-requirements] must be a table");

    SystemRequirements req;
    for (const auto& [key, val] : *tbl) {
        std::string k(key);

        // Versions are commonly written as bare numbers (cuda = 12)
        std::optional<std::string> version;
        if (auto s = val.value<std::string>()) version = std::string(*s);
        else if (auto i = val.value<int64_t>()) version = std::to_string(*i);

        if (k == "libc") {
            LibCSystemRequirement libc;
            if (version) {
                libc.version = *version;
            } else if (const auto* lt = val.as_table()) {
                if (auto f = (*lt)["family"].value<std::string>()) libc.family = std::string(*f);
                auto v = (*lt)["version"].value<std::string>();
                if (!v) return error_at(val, "libc requirement needs a 'version'");
                libc.version = std::string(*v);
            } else {
                return error_at(val, "libc must be a version or a {family, version} table");
            }
            req.libc = std::move(libc);
            continue;
        }

        if (!version) {
            return error_at(val, "system requirement '" + k + "' must be a version string");
        }
        if (k == "linux") req.linux_kernel = *version;
        else if (k == "cuda") req.cuda = *version;
        else if (k == "macos") req.macos = *version;
        else if (k == "archspec") req.archspec = *version;
        else {
            return error_at(val, "unknown system requirement '" + k + "'",
                "expected one of: linux, cuda, macos, libc, archspec");
        }
    }
    return Result<SystemRequirements>::ok(std::move(req));
}

Result<PypiOptions> ManifestReader::pypi_options(const toml::node& node) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[pypi-options] must be a table");

    PypiOptions opts;
    for (const auto& [key, val] : *tbl) {
        std::string k(key);
        if (k == "index-url") {
            auto s = val.value<std::string>();
            if (!s) return error_at(val, "index-url must be a string");
            opts.index_url = std::string(*s);
        } else if (k == "extra-index-urls") {
            auto list = string_array(val, "extra-index-urls");
            if (list.is_err()) return std::move(list).error();
            opts.extra_index_urls = std::move(list).value();
        } else if (k == "find-links") {
            // Either plain strings or {path = ...} / {url = ...} tables
            const auto* arr = val.as_array();
            if (!arr) return error_at(val, "find-links must be an array");
            for (const auto& elem : *arr) {
                if (auto s = elem.value<std::string>()) {
                    opts.find_links.push_back(std::string(*s));
                } else if (const auto* ft = elem.as_table()) {
                    if (auto p = (*ft)["path"].value<std::string>()) opts.find_links.push_back(std::string(*p));
                    else if (auto u = (*ft)["url"].value<std::string>()) opts.find_links.push_back(std::string(*u));
                    else return error_at(elem, "find-links entry needs 'path' or 'url'");
                } else {
                    return error_at(elem, "invalid find-links entry");
                }
            }
        } else if (k == "no-build-isolation") {
            auto list = string_array(val, "no-build-isolation");
            if (list.is_err()) return std::move(list).error();
            opts.no_build_isolation = std::move(list).value();
        } else {
            return error_at(val, "unknown field '" + k + "' in [pypi-options]");
        }
    }
    return Result<PypiOptions>::ok(std::move(opts));
}

Result<std::vector<Platform>> ManifestReader::platforms(const toml::node& node) const {
    auto names = string_array(node, "platforms");
    if (names.is_err()) return std::move(names).error();

    std::vector<Platform> out;
    for (const auto& n : names.value()) {
        auto p = parse_platform(n);
        if (p.is_err()) {
            auto e = std::move(p).error();
            return error_at(node, e.message, e.hint);
        }
        if (std::find(out.begin(), out.end(), p.value()) == out.end()) {
            out.push_back(p.value());
        }
    }
    return Result<std::vector<Platform>>::ok(std::move(out));
}

Result<std::vector<PrioritizedChannel>> ManifestReader::channels(const toml::node& node) const {
    const auto* arr = node.as_array();
    if (!arr) return error_at(node, "channels must be an array");

    std::vector<PrioritizedChannel> out;
    for (const auto& elem : *arr) {
        PrioritizedChannel ch;
        if (auto s = elem.value<std::string>()) {
            ch.channel = std::string(*s);
        } else if (const auto* t = elem.as_table()) {
            auto name = (*t)["channel"].value<std::string>();
            if (!name) return error_at(elem, "channel entry needs a 'channel' field");
            ch.channel = std::string(*name);
            if (auto prio = (*t)["priority"].value<int64_t>()) {
                ch.priority = static_cast<int>(*prio);
            }
        } else {
            return error_at(elem, "channel must be a string or a {channel, priority} table");
        }

        bool dup = std::any_of(out.begin(), out.end(),
            [&](const PrioritizedChannel& c) { return c.channel == ch.channel; });
        if (dup) {
            return error_at(elem, "channel '" + ch.channel + "' is listed twice");
        }
        out.push_back(std::move(ch));
    }
    return Result<std::vector<PrioritizedChannel>>::ok(std::move(out));
}

Result<ChannelPriority> ManifestReader::channel_priority(const toml::node& node) const {
    auto s = node.value<std::string>();
    if (!s) return error_at(node, "channel-priority must be a string");
    auto prio = parse_channel_priority(std::string(*s));
    if (prio.is_err()) {
        auto e = std::move(prio).error();
        return error_at(node, e.message, e.hint);
    }
    return prio;
}

// ---------------------------------------------------------------------------
// Targets and features
// ---------------------------------------------------------------------------

Status ManifestReader::target_body(const toml::table& tbl, Target& target) const {
    struct KindKey { const char* key; SpecType kind; };
    static const KindKey kinds[] = {
        {"dependencies", SpecType::Run},
        {"host-dependencies", SpecType::Host},
        {"build-dependencies", SpecType::Build},
    };

    // Only declared tables create a map, so an empty table stays
    // distinguishable from a missing one
    for (const auto& kk : kinds) {
        if (const auto* node = tbl.get(kk.key)) {
            auto deps = dependency_map(*node, kk.key);
            if (deps.is_err()) return std::move(deps).error();
            target.dependencies[kk.kind] = std::move(deps).value();
        }
    }

    if (const auto* node = tbl.get("pypi-dependencies")) {
        auto deps = pypi_dependency_map(*node);
        if (deps.is_err()) return std::move(deps).error();
        target.pypi_dependencies = std::move(deps).value();
    }

    if (const auto* node = tbl.get("activation")) {
        auto act = activation(*node);
        if (act.is_err()) return std::move(act).error();
        target.activation = std::move(act).value();
    }

    if (const auto* node = tbl.get("tasks")) {
        auto t = tasks(*node);
        if (t.is_err()) return std::move(t).error();
        target.tasks = std::move(t).value();
    }

    return ok_status();
}

Status ManifestReader::target_tables(const toml::node& node, Targets& targets) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[target] must be a table of platforms");

    for (const auto& [key, val] : *tbl) {
        auto selector = TargetSelector::parse(std::string(key));
        if (selector.is_err()) {
            auto e = std::move(selector).error();
            return error_at(val, e.message, e.hint);
        }

        const auto* body = val.as_table();
        if (!body) return error_at(val, "[target." + std::string(key) + "] must be a table");

        for (const auto& [field, fval] : *body) {
            if (!is_one_of(std::string(field), TARGET_KEYS)) {
                return error_at(fval, "unknown field '" + std::string(field) +
                    "' in [target." + std::string(key) + "]");
            }
        }

        Target target;
        STRATA_TRY(target_body(*body, target));
        auto added = targets.add_target(selector.value(), std::move(target));
        if (added.is_err()) {
            auto e = std::move(added).error();
            return error_at(val, e.message, e.hint);
        }
    }
    return ok_status();
}

Status ManifestReader::feature_body(const toml::table& tbl, Feature& feature) const {
    if (const auto* node = tbl.get("platforms")) {
        auto p = platforms(*node);
        if (p.is_err()) return std::move(p).error();
        feature.platforms = std::move(p).value();
    }
    if (const auto* node = tbl.get("channels")) {
        auto c = channels(*node);
        if (c.is_err()) return std::move(c).error();
        feature.channels = std::move(c).value();
    }
    if (const auto* node = tbl.get("channel-priority")) {
        auto prio = channel_priority(*node);
        if (prio.is_err()) return std::move(prio).error();
        feature.channel_priority = prio.value();
    }
    if (const auto* node = tbl.get("system-requirements")) {
        auto req = system_requirements(*node);
        if (req.is_err()) return std::move(req).error();
        feature.system_requirements = std::move(req).value();
    }
    if (const auto* node = tbl.get("pypi-options")) {
        auto opts = pypi_options(*node);
        if (opts.is_err()) return std::move(opts).error();
        feature.pypi_options = std::move(opts).value();
    }

    STRATA_TRY(target_body(tbl, feature.targets.default_target_mut()));

    if (const auto* node = tbl.get("target")) {
        STRATA_TRY(target_tables(*node, feature.targets));
    }
    return ok_status();
}

Status ManifestReader::environments(const toml::node& node, Manifest& m) const {
    const auto* tbl = node.as_table();
    if (!tbl) return error_at(node, "[environments] must be a table");

    for (const auto& [key, val] : *tbl) {
        std::string name(key);
        if (!is_valid_environment_name(name)) {
            return error_at(val, "invalid environment name '" + name + "'",
                "environment names may only contain lowercase letters, digits and '-'");
        }

        EnvironmentSpec spec;
        std::vector<std::string> feature_names;

        if (val.is_array()) {
            auto list = string_array(val, "features of environment '" + name + "'");
            if (list.is_err()) return std::move(list).error();
            feature_names = std::move(list).value();
        } else if (const auto* et = val.as_table()) {
            if (const auto* f = et->get("features")) {
                auto list = string_array(*f, "features of environment '" + name + "'");
                if (list.is_err()) return std::move(list).error();
                feature_names = std::move(list).value();
            }
            if (auto sg = (*et)["solve-group"].value<std::string>()) {
                spec.solve_group = std::string(*sg);
            }
            if (auto nd = (*et)["no-default-feature"].value<bool>()) {
                spec.no_default_feature = *nd;
            }
        } else {
            return error_at(val, "environment '" + name + "' must be a list of features or a table");
        }

        for (const auto& fname : feature_names) {
            auto feature = FeatureName::named(fname);
            if (feature.is_err()) {
                auto e = std::move(feature).error();
                return error_at(val, e.message + " (in environment '" + name + "')", e.hint);
            }
            if (!m.features.contains(feature.value())) {
                return error_at(val, "environment '" + name + "' uses undefined feature '" + fname + "'",
                    "declare it as [feature." + fname + "]");
            }
            if (std::find(spec.features.begin(), spec.features.end(), feature.value()) !=
                spec.features.end()) {
                return error_at(val, "feature '" + fname + "' is listed twice in environment '" + name + "'");
            }
            spec.features.push_back(std::move(feature).value());
        }

        m.environments.insert_or_assign(EnvironmentName::from_str(name), std::move(spec));
    }
    return ok_status();
}

Result<Manifest> ManifestReader::read(const toml::table& doc) {
    Manifest m;

    for (const auto& [key, val] : doc) {
        std::string k(key);
        if (!is_one_of(k, ROOT_KEYS) && !is_one_of(k, TARGET_KEYS)) {
            return error_at(val, "unknown top-level field '" + k + "'");
        }
    }

    // [project] section
    const auto* project = doc["project"].as_table();
    if (!project) {
        return StrataError{StrataError::Manifest, "missing [project] table",
            "add a [project] table with at least a name", path_};
    }
    auto name = (*project)["name"].value<std::string>();
    if (!name) {
        return error_at(*project, "[project] has no name");
    }
    m.project.name = std::string(*name);
    if (auto v = (*project)["version"].value<std::string>()) m.project.version = std::string(*v);
    if (auto v = (*project)["description"].value<std::string>()) m.project.description = std::string(*v);

    // Platforms and channels of [project] belong to the default feature
    Feature& def = m.default_feature_mut();
    if (const auto* node = project->get("platforms")) {
        auto p = platforms(*node);
        if (p.is_err()) return std::move(p).error();
        def.platforms = std::move(p).value();
    } else {
        def.platforms.emplace();
    }
    if (const auto* node = project->get("channels")) {
        auto c = channels(*node);
        if (c.is_err()) return std::move(c).error();
        def.channels = std::move(c).value();
    } else {
        def.channels.emplace();
    }
    if (const auto* node = project->get("channel-priority")) {
        auto prio = channel_priority(*node);
        if (prio.is_err()) return std::move(prio).error();
        def.channel_priority = prio.value();
    }

    // Root-level dependency tables, system requirements and targets. Keys
    // only allowed inside [project] were rejected above.
    STRATA_TRY(feature_body(doc, def));

    // [feature.<name>] sections
    if (const auto* features = doc.get("feature")) {
        const auto* ft = features->as_table();
        if (!ft) return error_at(*features, "[feature] must be a table");

        for (const auto& [key, val] : *ft) {
            auto fname = FeatureName::named(std::string(key));
            if (fname.is_err()) {
                auto e = std::move(fname).error();
                return error_at(val, e.message, e.hint);
            }

            const auto* body = val.as_table();
            if (!body) return error_at(val, "[feature." + std::string(key) + "] must be a table");
            for (const auto& [field, fval] : *body) {
                std::string f(field);
                if (!is_one_of(f, FEATURE_KEYS) && !is_one_of(f, TARGET_KEYS)) {
                    return error_at(fval, "unknown field '" + f + "' in [feature." + std::string(key) + "]");
                }
            }

            Feature feature(fname.value());
            STRATA_TRY(feature_body(*body, feature));
            m.features.insert_or_assign(fname.value(), std::move(feature));
        }
    }

    if (const auto* node = doc.get("environments")) {
        STRATA_TRY(environments(*node, m));
    }

    for (const auto& [fname, feature] : m.features) {
        if (feature.is_default()) continue;
        bool used = std::any_of(m.environments.begin(), m.environments.end(),
            [&](const std::pair<EnvironmentName, EnvironmentSpec>& env) {
                const auto& fs = env.second.features;
                return std::find(fs.begin(), fs.end(), fname) != fs.end();
            });
        if (!used) {
            log::warn("feature '%s' is not used by any environment", fname.as_str().c_str());
        }
    }

    return Result<Manifest>::ok(std::move(m));
}

} // namespace

// ---------------------------------------------------------------------------
// Manifest
// ---------------------------------------------------------------------------

Manifest::Manifest() {
    features.insert(FeatureName::default_name(), Feature(FeatureName::default_name()));
    environments.insert(EnvironmentName::default_name(), EnvironmentSpec{});
}

Result<Manifest> Manifest::parse(const std::string& toml_str,
                                 const std::string& source_path) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, std::string_view(source_path));
    } catch (const toml::parse_error& e) {
        return StrataError{StrataError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", source_path, static_cast<int>(e.source().begin.line)};
    }

    ManifestReader reader(source_path);
    return reader.read(doc);
}

Result<Manifest> Manifest::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return StrataError{StrataError::IO,
            "cannot open manifest file: " + path.string()};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return Manifest::parse(ss.str(), path.string());
}

const Feature& Manifest::default_feature() const {
    return *features.find(FeatureName::default_name());
}

Feature& Manifest::default_feature_mut() {
    return *features.find_mut(FeatureName::default_name());
}

const Feature* Manifest::feature(const FeatureName& name) const {
    return features.find(name);
}

Feature* Manifest::feature_mut(const FeatureName& name) {
    return features.find_mut(name);
}

Result<Environment> Manifest::environment(const EnvironmentName& name) const {
    const EnvironmentSpec* spec = environments.find(name);
    if (!spec) {
        std::string known;
        for (const auto& entry : environments) {
            if (!known.empty()) known += ", ";
            known += entry.first.as_str();
        }
        return StrataError{StrataError::NotFound,
            "unknown environment '" + name.as_str() + "'",
            "available environments: " + known};
    }
    return Result<Environment>::ok(Environment(*this, name, *spec));
}

Environment Manifest::default_environment() const {
    return Environment(*this, EnvironmentName::default_name(),
        environments.at(EnvironmentName::default_name()));
}

std::vector<Environment> Manifest::all_environments() const {
    std::vector<Environment> out;
    for (const auto& [name, spec] : environments) {
        out.emplace_back(*this, name, spec);
    }
    return out;
}

Status Manifest::add_channels(const std::vector<PrioritizedChannel>& channels,
                              const FeatureName& feature) {
    Feature* f = feature_mut(feature);
    if (!f) {
        return StrataError{StrataError::NotFound,
            "feature '" + feature.as_str() + "' does not exist"};
    }
    f->add_channels(channels);
    return ok_status();
}

Status Manifest::remove_channels(const std::vector<PrioritizedChannel>& channels,
                                 const FeatureName& feature) {
    Feature* f = feature_mut(feature);
    if (!f) {
        return StrataError{StrataError::NotFound,
            "feature '" + feature.as_str() + "' does not exist"};
    }
    size_t removed = f->remove_channels(channels);
    log::debug("removed %zu channel(s) from feature '%s'", removed, feature.as_str().c_str());
    return ok_status();
}

} // namespace strata
