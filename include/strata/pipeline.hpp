#pragma once

#include <strata/config.hpp>
#include <strata/environment.hpp>
#include <strata/installer.hpp>
#include <strata/io_permits.hpp>
#include <strata/lock_file.hpp>
#include <strata/project.hpp>
#include <strata/prompt.hpp>
#include <strata/python_status.hpp>
#include <strata/reporter.hpp>
#include <strata/result.hpp>
#include <strata/site_packages.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// How the lock file may be refreshed before installing
class LockFileUsage {
public:
    enum Kind {
        Update,     // refresh it when it is out of date
        Locked,     // fail when it is out of date
        Frozen,     // use it as is
    };

    LockFileUsage(Kind k = Update) : kind_(k) {}

    Kind kind() const { return kind_; }

    bool allows_lock_file_updates() const;
    bool should_check_if_out_of_date() const;

    bool operator==(const LockFileUsage& o) const { return kind_ == o.kind_; }
    bool operator!=(const LockFileUsage& o) const { return kind_ != o.kind_; }

private:
    Kind kind_;
};

enum class UpdateMode {
    // Always run the installer; it skips what is already in place
    Revalidate,
    // Trust the marker record when its hash matches the lock file
    QuickValidate,
};

// Reads, checks, solves and writes lock files
class LockFileProvider {
public:
    virtual ~LockFileProvider() = default;

    // An empty lock file when the project has none yet
    virtual Result<LockFile> load(const Project& project) = 0;
    virtual Result<bool> is_outdated(const Project& project, const LockFile& lock) = 0;
    virtual Result<LockFile> solve(const Project& project, const LockFile& previous) = 0;
    virtual Status save(const Project& project, const LockFile& lock) = 0;
};

// Everything the PyPI installer needs to bring site-packages in line with
// the lock file
struct PypiUpdate {
    std::filesystem::path prefix;
    std::filesystem::path lock_file_dir;
    std::vector<CondaPackageData> conda_packages;
    std::vector<PypiPackageData> pypi_packages;
    std::filesystem::path python_path;        // relative to prefix
    SystemRequirements system_requirements;
    std::optional<PypiOptions> pypi_indexes;
    EnvVarMap environment_variables;
    Platform platform = Platform::NoArch;
    std::optional<std::vector<std::string>> no_build_isolation;
};

class PypiInstaller {
public:
    virtual ~PypiInstaller() = default;

    virtual Status update_python_distributions(const PypiUpdate& update) = 0;
    virtual Status uninstall(const InstalledDist& dist) = 0;
};

// Collaborators and shared resources of one run. The permit pool is shared
// by every materialization running concurrently.
struct MaterializeContext {
    const Config& config;
    LockFileProvider& lock_files;
    PackageCache& package_cache;
    PackageLinker& linker;
    PypiInstaller& pypi_installer;
    Prompter& prompter;
    Reporter& reporter;
    IoPermitPool& io_permits;
};

// An environment directory, installed or not
class Prefix {
public:
    explicit Prefix(std::filesystem::path root) : root_(std::move(root)) {}

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// A lock file known to be usable for the project, and the prefixes derived
// from it. prefix() may be called for several environments concurrently.
class LockFileDerivedData {
public:
    LockFileDerivedData(const Project& project, LockFile lock_file, bool updated,
                        MaterializeContext& ctx);

    const LockFile& lock_file() const { return lock_file_; }

    // True if the lock file was solved again during this run
    bool updated() const { return updated_; }

    // Install `environment` for its best platform and return its prefix.
    // With QuickValidate an environment whose marker record matches the lock
    // file is returned without running the installer.
    Result<Prefix> prefix(const Environment& environment, UpdateMode mode) const;

private:
    const Project* project_;
    LockFile lock_file_;
    bool updated_;
    MaterializeContext* ctx_;
};

// Prefix location guard for the environment, deprecated layout warning, and
// the state directory with its .gitignore
Status sanity_check_project(const Project& project, const Environment& environment,
                            Prompter& prompter);

// Apply the lock file policy: load, check, and solve again when allowed
Result<LockFileDerivedData> update_lock_file(const Project& project, LockFileUsage usage,
                                             MaterializeContext& ctx);

struct LockFileAndPrefix {
    LockFileDerivedData lock_file;
    Prefix prefix;
};

// Sanity check, lock file refresh, then the prefix. Unsupported platforms
// and no_install yield a bare prefix that is not installed.
Result<LockFileAndPrefix> get_update_lock_file_and_prefix(
    const Project& project, const Environment& environment, LockFileUsage usage,
    bool no_install, UpdateMode mode, MaterializeContext& ctx);

// Install the conda packages, mark the prefix location and report how the
// interpreter changed
Result<PythonStatus> update_prefix_conda(const Prefix& prefix,
                                         std::vector<PrefixRecord> installed,
                                         const std::vector<CondaPackageData>& desired,
                                         Platform platform, MaterializeContext& ctx,
                                         const std::string& message);

// Bring PyPI packages in line after a conda install. Removes our own stale
// distributions when the interpreter went away or moved, then hands the rest
// to the PyPI installer. update.python_path is filled in here.
Status update_prefix_pypi(const EnvironmentName& environment_name, const Prefix& prefix,
                          const PythonStatus& status, PypiUpdate update,
                          MaterializeContext& ctx);

// Uninstall every distribution in site_packages installed by us
Status uninstall_outdated_site_packages(const std::filesystem::path& site_packages,
                                        PypiInstaller& installer);

// Sanity check every environment, refresh the lock file once, then install
// the environments that passed concurrently. The lock file is not touched
// when no environment is left to install. One status per environment, in
// order; the outer error is the refresh.
Result<std::vector<Status>> materialize_environments(
    const Project& project, const std::vector<EnvironmentName>& environments,
    LockFileUsage usage, UpdateMode mode, MaterializeContext& ctx);

} // namespace strata
