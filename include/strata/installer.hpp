#pragma once

#include <strata/io_permits.hpp>
#include <strata/lock_file.hpp>
#include <strata/prefix_record.hpp>
#include <strata/reporter.hpp>
#include <strata/result.hpp>
#include <strata/transaction.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Source of extracted packages (download and cache live behind it)
class PackageCache {
public:
    virtual ~PackageCache() = default;

    // Directory holding the extracted package
    virtual Result<std::filesystem::path> fetch(const CondaPackageData& package) = 0;
};

// Places one extracted package into a prefix, or takes it out again
class PackageLinker {
public:
    virtual ~PackageLinker() = default;

    // Returns the linked paths, relative to the prefix
    virtual Result<std::vector<std::string>> link(const std::filesystem::path& package_dir,
                                                  const std::filesystem::path& prefix,
                                                  const CondaPackageData& package) = 0;

    virtual Status unlink(const std::filesystem::path& prefix, const PrefixRecord& record) = 0;
};

struct InstallResult {
    Transaction transaction;
};

// Computes and applies the transaction from the installed records of a
// prefix to a desired package set. Packages are fetched in parallel, then
// old packages are unlinked, then new ones linked; every link and unlink
// holds a permit of the shared pool.
class Installer {
public:
    Installer(PackageCache& cache, PackageLinker& linker, IoPermitPool& permits);

    // Skip reading conda-meta/ when the caller already has the records
    Installer& with_installed_packages(std::vector<PrefixRecord> installed);
    Installer& with_target_platform(Platform platform);
    Installer& with_reporter(Reporter* reporter);

    Result<InstallResult> install(const std::filesystem::path& prefix,
                                  const std::vector<CondaPackageData>& desired);

private:
    PackageCache& cache_;
    PackageLinker& linker_;
    IoPermitPool& permits_;
    std::optional<std::vector<PrefixRecord>> installed_;
    std::optional<Platform> platform_;
    Reporter* reporter_ = nullptr;
};

} // namespace strata
