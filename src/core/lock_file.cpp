#include <strata/lock_file.hpp>

namespace strata {

std::string CondaPackageData::file_name() const {
    auto slash = location.find_last_of('/');
    if (slash != std::string::npos && slash + 1 < location.size()) {
        return location.substr(slash + 1);
    }
    return name + "-" + version + "-" + build + ".conda";
}

// ---------------------------------------------------------------------------
// LockedPackage
// ---------------------------------------------------------------------------

LockedPackage LockedPackage::conda(CondaPackageData data) {
    return LockedPackage(Conda, std::move(data));
}

LockedPackage LockedPackage::pypi(PypiPackageData data) {
    return LockedPackage(Pypi, std::move(data));
}

const std::string& LockedPackage::name() const {
    switch (kind_) {
        case Conda: return std::get<CondaPackageData>(data_).name;
        case Pypi:  return std::get<PypiPackageData>(data_).name;
    }
    return std::get<CondaPackageData>(data_).name;
}

const std::string& LockedPackage::location() const {
    switch (kind_) {
        case Conda: return std::get<CondaPackageData>(data_).location;
        case Pypi:  return std::get<PypiPackageData>(data_).location;
    }
    return std::get<CondaPackageData>(data_).location;
}

// ---------------------------------------------------------------------------
// LockedEnvironment
// ---------------------------------------------------------------------------

const std::vector<LockedPackage>* LockedEnvironment::packages_for(Platform p) const {
    auto it = packages.find(p);
    return it == packages.end() ? nullptr : &it->second;
}

std::vector<CondaPackageData> LockedEnvironment::conda_packages(Platform p) const {
    std::vector<CondaPackageData> out;
    if (const auto* pkgs = packages_for(p)) {
        for (const auto& pkg : *pkgs) {
            if (const auto* c = pkg.as_conda()) out.push_back(*c);
        }
    }
    return out;
}

std::vector<PypiPackageData> LockedEnvironment::pypi_packages(Platform p) const {
    std::vector<PypiPackageData> out;
    if (const auto* pkgs = packages_for(p)) {
        for (const auto& pkg : *pkgs) {
            if (const auto* py = pkg.as_pypi()) out.push_back(*py);
        }
    }
    return out;
}

bool LockedEnvironment::has_pypi_packages(Platform p) const {
    if (const auto* pkgs = packages_for(p)) {
        for (const auto& pkg : *pkgs) {
            if (pkg.kind() == LockedPackage::Pypi) return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// LockFile
// ---------------------------------------------------------------------------

const LockedEnvironment* LockFile::environment(const std::string& name) const {
    auto it = environments.find(name);
    return it == environments.end() ? nullptr : &it->second;
}

LockedEnvironment& LockFile::environment_mut(const std::string& name) {
    return environments[name];
}

} // namespace strata
