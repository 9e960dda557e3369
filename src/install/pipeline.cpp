#include <strata/pipeline.hpp>
#include <strata/consts.hpp>
#include <strata/drift_hash.hpp>
#include <strata/environment_file.hpp>
#include <strata/log.hpp>
#include <strata/prefix_guard.hpp>
#include <strata/rlimit.hpp>
#include <tbb/task_group.h>
#include <algorithm>
#include <mutex>

namespace strata {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// LockFileUsage
// ---------------------------------------------------------------------------

bool LockFileUsage::allows_lock_file_updates() const {
    switch (kind_) {
        case Update: return true;
        case Locked:
        case Frozen: return false;
    }
    return false;
}

bool LockFileUsage::should_check_if_out_of_date() const {
    switch (kind_) {
        case Update:
        case Locked: return true;
        case Frozen: return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Sanity check and lock file
// ---------------------------------------------------------------------------

Status sanity_check_project(const Project& project, const Environment& environment,
                            Prompter& prompter) {
    {
        // Concurrent materializations must not ask at the same time
        static std::mutex prompt_mutex;
        std::lock_guard<std::mutex> lock(prompt_mutex);
        STRATA_TRY(verify_prefix_location_unchanged(
            project.environment_dir(environment.name()), prompter));
    }

    // Environments used to live in .strata/env before moving to .strata/envs
    fs::path old_env_dir = project.state_dir() / "env";
    std::error_code ec;
    if (fs::exists(old_env_dir, ec)) {
        log::warn("the '%s' folder is deprecated, please remove it as we now use the '%s' folder",
                  old_env_dir.string().c_str(), ENVIRONMENTS_DIR);
    }

    return ensure_state_directory_and_gitignore(project.state_dir());
}

Result<LockFileDerivedData> update_lock_file(const Project& project, LockFileUsage usage,
                                             MaterializeContext& ctx) {
    auto loaded = ctx.lock_files.load(project);
    if (loaded.is_err()) return std::move(loaded).error().context("loading the lock file");
    LockFile lock = std::move(loaded).value();

    if (!usage.should_check_if_out_of_date()) {
        log::debug("lock file is frozen, skipping the up-to-date check");
        return Result<LockFileDerivedData>::ok(LockFileDerivedData(project, std::move(lock), false, ctx));
    }

    auto outdated = ctx.lock_files.is_outdated(project, lock);
    if (outdated.is_err()) return std::move(outdated).error();
    if (!outdated.value()) {
        return Result<LockFileDerivedData>::ok(LockFileDerivedData(project, std::move(lock), false, ctx));
    }

    if (!usage.allows_lock_file_updates()) {
        return StrataError{StrataError::LockFile,
            "lock file is not up-to-date with the project",
            "run without --locked to update it, or regenerate it with `strata lock`",
            project.lock_file_path().string()};
    }

    ctx.reporter.on_step_start("updating lock file");
    auto solved = ctx.lock_files.solve(project, lock);
    if (solved.is_err()) return std::move(solved).error().context("solving the project");
    STRATA_TRY(ctx.lock_files.save(project, solved.value()));
    ctx.reporter.on_step_finish("updating lock file");

    return Result<LockFileDerivedData>::ok(
        LockFileDerivedData(project, std::move(solved).value(), true, ctx));
}

Result<LockFileAndPrefix> get_update_lock_file_and_prefix(
    const Project& project, const Environment& environment, LockFileUsage usage,
    bool no_install, UpdateMode mode, MaterializeContext& ctx)
{
    Platform platform = environment.best_platform();

    if (!no_install && !environment.supports(platform)) {
        log::warn("not installing dependencies on the current platform (%s) as it is not "
                  "part of the supported platforms of environment '%s'",
                  platform_name(platform), environment.name().as_str().c_str());
        no_install = true;
    }

    STRATA_TRY(sanity_check_project(project, environment, ctx.prompter));

    auto derived = update_lock_file(project, usage, ctx);
    if (derived.is_err()) return std::move(derived).error();

    if (no_install) {
        Prefix prefix(project.environment_dir(environment.name()));
        return Result<LockFileAndPrefix>::ok(
            LockFileAndPrefix{std::move(derived).value(), std::move(prefix)});
    }

    auto prefix = derived.value().prefix(environment, mode);
    if (prefix.is_err()) return std::move(prefix).error();
    return Result<LockFileAndPrefix>::ok(
        LockFileAndPrefix{std::move(derived).value(), std::move(prefix).value()});
}

// ---------------------------------------------------------------------------
// Installing a prefix
// ---------------------------------------------------------------------------

LockFileDerivedData::LockFileDerivedData(const Project& project, LockFile lock_file,
                                         bool updated, MaterializeContext& ctx)
    : project_(&project), lock_file_(std::move(lock_file)), updated_(updated), ctx_(&ctx) {}

Result<Prefix> LockFileDerivedData::prefix(const Environment& environment, UpdateMode mode) const {
    const std::string& env_name = environment.name().as_str();
    Platform platform = environment.best_platform();
    fs::path env_dir = project_->environment_dir(environment.name());
    Prefix prefix(env_dir);

    const LockedEnvironment* locked = lock_file_.environment(env_name);
    if (!locked) {
        return StrataError{StrataError::LockFile,
            "environment '" + env_name + "' is missing from the lock file",
            "update the lock file by running without --frozen",
            project_->lock_file_path().string()};
    }

    DriftHash hash = DriftHash::from_environment(*locked, platform);

    switch (mode) {
        case UpdateMode::QuickValidate: {
            auto marker = read_environment_file(env_dir);
            if (marker && marker->environment_lock_file_hash == hash) {
                log::info("environment '%s' is up-to-date with the lock file", env_name.c_str());
                return Result<Prefix>::ok(std::move(prefix));
            }
            break;
        }
        case UpdateMode::Revalidate:
            break;
    }

    auto installed = load_prefix_records(env_dir);
    if (installed.is_err()) return std::move(installed).error();

    std::vector<CondaPackageData> conda = locked->conda_packages(platform);
    auto status = update_prefix_conda(prefix, std::move(installed).value(), conda, platform,
                                      *ctx_, "updating environment '" + env_name + "'");
    if (status.is_err()) return std::move(status).error();

    PypiUpdate update;
    update.lock_file_dir = project_->root_dir;
    update.conda_packages = std::move(conda);
    update.pypi_packages = locked->pypi_packages(platform);
    update.platform = platform;
    update.environment_variables = environment.activation_env(platform);

    auto requirements = environment.system_requirements();
    if (requirements.is_err()) return std::move(requirements).error();
    update.system_requirements = std::move(requirements).value();

    auto no_isolation = environment.no_build_isolation();
    if (no_isolation.is_err()) return std::move(no_isolation).error();
    update.no_build_isolation = std::move(no_isolation).value();

    // Indexes: the lock file, then the manifest, then configuration
    if (locked->pypi_indexes) {
        update.pypi_indexes = locked->pypi_indexes;
    } else {
        auto options = environment.pypi_options();
        if (options.is_err()) return std::move(options).error();
        update.pypi_indexes = std::move(options).value();
    }
    if (!update.pypi_indexes && ctx_->config.pypi_config.index_url) {
        PypiOptions from_config;
        from_config.index_url = ctx_->config.pypi_config.index_url;
        from_config.extra_index_urls = ctx_->config.pypi_config.extra_index_urls;
        update.pypi_indexes = std::move(from_config);
    }

    STRATA_TRY(update_prefix_pypi(environment.name(), prefix, status.value(),
                                  std::move(update), *ctx_));

    // Only a fully installed prefix may be trusted by QuickValidate
    EnvironmentFile marker;
    marker.manifest_path = project_->manifest_path.string();
    marker.environment_name = env_name;
    marker.tool_version = TOOL_VERSION;
    marker.environment_lock_file_hash = hash;
    auto written = write_environment_file(env_dir, marker);
    if (written.is_err()) return std::move(written).error();

    return Result<Prefix>::ok(std::move(prefix));
}

Result<PythonStatus> update_prefix_conda(const Prefix& prefix,
                                         std::vector<PrefixRecord> installed,
                                         const std::vector<CondaPackageData>& desired,
                                         Platform platform, MaterializeContext& ctx,
                                         const std::string& message) {
    try_increase_rlimit_to_sensible();

    ctx.reporter.on_step_start(message);
    Installer installer(ctx.package_cache, ctx.linker, ctx.io_permits);
    auto result = installer
        .with_installed_packages(std::move(installed))
        .with_target_platform(platform)
        .with_reporter(&ctx.reporter)
        .install(prefix.root(), desired);
    if (result.is_err()) return std::move(result).error();
    ctx.reporter.on_step_finish(message);

    STRATA_TRY(create_prefix_location_file(prefix.root()));
    STRATA_TRY(create_history_file(prefix.root()));

    return Result<PythonStatus>::ok(PythonStatus::from_transaction(result.value().transaction));
}

// ---------------------------------------------------------------------------
// PyPI sync
// ---------------------------------------------------------------------------

Status uninstall_outdated_site_packages(const fs::path& site_packages, PypiInstaller& installer) {
    auto ours = find_dists_installed_by(site_packages, UV_INSTALLER);
    if (ours.is_err()) {
        auto e = std::move(ours).error();
        e.code = StrataError::Uninstall;
        return e.context("scanning outdated site-packages");
    }

    for (const auto& dist : ours.value()) {
        log::debug("uninstalling outdated %s %s", dist.name.c_str(), dist.version.c_str());
        auto removed = installer.uninstall(dist);
        if (removed.is_err()) {
            auto e = std::move(removed).error();
            e.code = StrataError::Uninstall;
            return e.context("uninstalling outdated " + dist.name + " " + dist.version);
        }
    }
    return ok_status();
}

static Status purge_site_packages(const Prefix& prefix, const PythonInfo& info,
                                  PypiInstaller& installer) {
    fs::path site_packages = prefix.root() / info.site_packages_path;
    std::error_code ec;
    if (!fs::exists(site_packages, ec)) return ok_status();
    return uninstall_outdated_site_packages(site_packages, installer);
}

Status update_prefix_pypi(const EnvironmentName& environment_name, const Prefix& prefix,
                          const PythonStatus& status, PypiUpdate update,
                          MaterializeContext& ctx) {
    const PythonInfo* python = nullptr;

    switch (status.kind()) {
        case PythonStatus::Removed:
            // Nothing can run the remaining distributions any more
            return purge_site_packages(prefix, *status.old_info(), ctx.pypi_installer);

        case PythonStatus::Changed: {
            const PythonInfo& old_info = *status.old_info();
            python = status.current_info();
            // On Windows site-packages does not depend on the version
            if (old_info.site_packages_path != python->site_packages_path) {
                STRATA_TRY(purge_site_packages(prefix, old_info, ctx.pypi_installer));
            }
            break;
        }

        case PythonStatus::Unchanged:
        case PythonStatus::Added:
            python = status.current_info();
            if (update.pypi_packages.empty()) {
                return purge_site_packages(prefix, *python, ctx.pypi_installer);
            }
            break;

        case PythonStatus::DoesNotExist:
            return ok_status();
    }

    std::string message = "updating pypi packages in '" + environment_name.as_str() + "'";
    update.prefix = prefix.root();
    update.python_path = python->path;

    ctx.reporter.on_step_start(message);
    STRATA_TRY(ctx.pypi_installer.update_python_distributions(update));
    ctx.reporter.on_step_finish(message);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Several environments
// ---------------------------------------------------------------------------

Result<std::vector<Status>> materialize_environments(
    const Project& project, const std::vector<EnvironmentName>& environments,
    LockFileUsage usage, UpdateMode mode, MaterializeContext& ctx)
{
    std::vector<Environment> resolved;
    for (const auto& name : environments) {
        auto env = project.manifest.environment(name);
        if (env.is_err()) return std::move(env).error();
        resolved.push_back(std::move(env).value());
    }

    std::vector<Status> results(resolved.size(), ok_status());
    std::vector<bool> install(resolved.size(), false);
    for (size_t i = 0; i < resolved.size(); ++i) {
        const Environment& env = resolved[i];
        Platform platform = env.best_platform();
        if (!env.supports(platform)) {
            log::warn("skipping environment '%s': %s is not one of its platforms",
                      env.name().as_str().c_str(), platform_name(platform));
            continue;
        }

        auto checked = sanity_check_project(project, env, ctx.prompter);
        if (checked.is_err()) {
            results[i] = std::move(checked).error().context("environment '" + env.name().as_str() + "'");
            continue;
        }
        install[i] = true;
    }

    // Nothing left to install: leave the lock file alone
    if (std::find(install.begin(), install.end(), true) == install.end()) {
        return Result<std::vector<Status>>::ok(std::move(results));
    }

    auto derived = update_lock_file(project, usage, ctx);
    if (derived.is_err()) return std::move(derived).error();
    const LockFileDerivedData& lock_file = derived.value();

    tbb::task_group tg;
    for (size_t i = 0; i < resolved.size(); ++i) {
        if (!install[i]) continue;
        tg.run([&, i] {
            const Environment& env = resolved[i];
            auto prefix = lock_file.prefix(env, mode);
            if (prefix.is_err()) {
                results[i] = std::move(prefix).error().context("environment '" + env.name().as_str() + "'");
            }
        });
    }
    tg.wait();

    return Result<std::vector<Status>>::ok(std::move(results));
}

} // namespace strata
