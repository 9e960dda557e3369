#pragma once

#include <strata/platform.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace strata {

struct Transaction;

// Where an interpreter of a given version lives inside a prefix. All paths
// are relative to the prefix root.
struct PythonInfo {
    std::string version;          // full version, e.g. "3.10.1"
    std::string short_version;    // major.minor, e.g. "3.10"
    std::filesystem::path path;
    std::filesystem::path site_packages_path;
    std::filesystem::path bin_dir;

    static Result<PythonInfo> from_version(const std::string& version, Platform platform);

    bool operator==(const PythonInfo& o) const {
        return version == o.version && short_version == o.short_version &&
               path == o.path && site_packages_path == o.site_packages_path &&
               bin_dir == o.bin_dir;
    }
    bool operator!=(const PythonInfo& o) const { return !(*this == o); }
};

// How the interpreter of a prefix changed across one install. Patch
// releases count as unchanged: only the short version is compared.
class PythonStatus {
public:
    enum Kind { Changed, Unchanged, Removed, Added, DoesNotExist };

    static PythonStatus changed(PythonInfo old_info, PythonInfo new_info);
    static PythonStatus unchanged(PythonInfo info);
    static PythonStatus removed(PythonInfo old_info);
    static PythonStatus added(PythonInfo new_info);
    static PythonStatus does_not_exist();

    static PythonStatus from_infos(const std::optional<PythonInfo>& before,
                                   const std::optional<PythonInfo>& after);
    static PythonStatus from_transaction(const Transaction& transaction);

    Kind kind() const { return kind_; }

    // Interpreter before the install: Changed and Removed
    const PythonInfo* old_info() const;

    // Interpreter after the install: Changed, Unchanged and Added
    const PythonInfo* current_info() const;

    // Interpreter path relative to the prefix, if one is installed now
    std::optional<std::filesystem::path> location() const;

private:
    explicit PythonStatus(Kind k) : kind_(k) {}

    Kind kind_;
    std::optional<PythonInfo> old_;
    std::optional<PythonInfo> new_;
};

const char* python_status_name(PythonStatus::Kind kind);

} // namespace strata
