#include <strata/python_status.hpp>
#include <strata/transaction.hpp>
#include <cctype>

namespace strata {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// PythonInfo
// ---------------------------------------------------------------------------

static bool is_number(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<PythonInfo> PythonInfo::from_version(const std::string& version, Platform platform) {
    auto first = version.find('.');
    std::string major = version.substr(0, first);
    std::string minor;
    if (first != std::string::npos) {
        auto end = first + 1;
        while (end < version.size() && std::isdigit(static_cast<unsigned char>(version[end]))) {
            ++end;
        }
        minor = version.substr(first + 1, end - first - 1);
    }

    if (!is_number(major) || !is_number(minor)) {
        return StrataError{StrataError::InvalidArg,
            "cannot determine the short version of python '" + version + "'",
            "expected a version like 3.11 or 3.11.4"};
    }

    PythonInfo info;
    info.version = version;
    info.short_version = major + "." + minor;

    if (is_windows(platform)) {
        info.path = "python.exe";
        info.site_packages_path = fs::path("Lib") / "site-packages";
        info.bin_dir = "Scripts";
    } else {
        info.path = fs::path("bin") / ("python" + info.short_version);
        info.site_packages_path = fs::path("lib") / ("python" + info.short_version) / "site-packages";
        info.bin_dir = "bin";
    }
    return Result<PythonInfo>::ok(std::move(info));
}

// ---------------------------------------------------------------------------
// PythonStatus
// ---------------------------------------------------------------------------

PythonStatus PythonStatus::changed(PythonInfo old_info, PythonInfo new_info) {
    PythonStatus s(Changed);
    s.old_ = std::move(old_info);
    s.new_ = std::move(new_info);
    return s;
}

PythonStatus PythonStatus::unchanged(PythonInfo info) {
    PythonStatus s(Unchanged);
    s.new_ = std::move(info);
    return s;
}

PythonStatus PythonStatus::removed(PythonInfo old_info) {
    PythonStatus s(Removed);
    s.old_ = std::move(old_info);
    return s;
}

PythonStatus PythonStatus::added(PythonInfo new_info) {
    PythonStatus s(Added);
    s.new_ = std::move(new_info);
    return s;
}

PythonStatus PythonStatus::does_not_exist() {
    return PythonStatus(DoesNotExist);
}

PythonStatus PythonStatus::from_infos(const std::optional<PythonInfo>& before,
                                      const std::optional<PythonInfo>& after) {
    if (before && after) {
        if (before->short_version != after->short_version) {
            return changed(*before, *after);
        }
        return unchanged(*after);
    }
    if (after) return added(*after);
    if (before) return removed(*before);
    return does_not_exist();
}

PythonStatus PythonStatus::from_transaction(const Transaction& transaction) {
    return from_infos(transaction.current_python_info, transaction.python_info);
}

const PythonInfo* PythonStatus::old_info() const {
    switch (kind_) {
        case Changed:
        case Removed:
            return &*old_;
        case Unchanged:
        case Added:
        case DoesNotExist:
            return nullptr;
    }
    return nullptr;
}

const PythonInfo* PythonStatus::current_info() const {
    switch (kind_) {
        case Changed:
        case Unchanged:
        case Added:
            return &*new_;
        case Removed:
        case DoesNotExist:
            return nullptr;
    }
    return nullptr;
}

std::optional<fs::path> PythonStatus::location() const {
    const PythonInfo* info = current_info();
    if (!info) return std::nullopt;
    return info->path;
}

const char* python_status_name(PythonStatus::Kind kind) {
    switch (kind) {
        case PythonStatus::Changed:      return "changed";
        case PythonStatus::Unchanged:    return "unchanged";
        case PythonStatus::Removed:      return "removed";
        case PythonStatus::Added:        return "added";
        case PythonStatus::DoesNotExist: return "does-not-exist";
    }
    return "unknown";
}

} // namespace strata
