#pragma once

#include <strata/platform.hpp>
#include <strata/spec.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// A solved conda package as recorded in the lock file
struct CondaPackageData {
    std::string name;
    std::string version;
    std::string build;
    std::string subdir;
    std::string location;                 // URL or local path
    std::optional<std::string> sha256;
    std::optional<std::string> md5;
    std::vector<std::string> depends;

    // Archive file name, e.g. python-3.11.4-h2755cc3_0.conda
    std::string file_name() const;
};

// A solved PyPI distribution as recorded in the lock file
struct PypiPackageData {
    std::string name;
    std::string version;
    std::string location;                 // URL or local path
    std::optional<std::string> hash;
    bool editable = false;
    std::vector<std::string> extras;      // extras selected for this environment
    std::vector<std::string> requires_dist;
};

// One entry of a platform's package list
class LockedPackage {
public:
    enum Kind { Conda, Pypi };

    static LockedPackage conda(CondaPackageData data);
    static LockedPackage pypi(PypiPackageData data);

    Kind kind() const { return kind_; }
    const std::string& name() const;
    const std::string& location() const;

    const CondaPackageData* as_conda() const { return std::get_if<CondaPackageData>(&data_); }
    const PypiPackageData* as_pypi() const { return std::get_if<PypiPackageData>(&data_); }

private:
    LockedPackage(Kind k, std::variant<CondaPackageData, PypiPackageData> d)
        : kind_(k), data_(std::move(d)) {}

    Kind kind_;
    std::variant<CondaPackageData, PypiPackageData> data_;
};

// The locked state of one environment. Package lists keep the order in which
// the lock file stores them.
struct LockedEnvironment {
    std::vector<std::string> channels;
    std::optional<PypiOptions> pypi_indexes;
    std::map<Platform, std::vector<LockedPackage>> packages;

    // nullptr when the platform was not solved
    const std::vector<LockedPackage>* packages_for(Platform p) const;

    std::vector<CondaPackageData> conda_packages(Platform p) const;
    std::vector<PypiPackageData> pypi_packages(Platform p) const;

    bool has_pypi_packages(Platform p) const;
};

// In-memory lock file. Reading and writing the on-disk format is done by the
// LockFileProvider collaborator.
struct LockFile {
    int version = 5;
    std::map<std::string, LockedEnvironment> environments;

    const LockedEnvironment* environment(const std::string& name) const;
    LockedEnvironment& environment_mut(const std::string& name);
};

} // namespace strata
