#include <strata/transaction.hpp>
#include <algorithm>
#include <unordered_map>

namespace strata {

const std::string& TransactionOperation::name() const {
    switch (kind) {
        case Install: return new_package->name;
        case Remove:  return old_record->package.name;
        case Change:  return new_package->name;
    }
    return new_package->name;
}

const char* operation_kind_name(TransactionOperation::Kind kind) {
    switch (kind) {
        case TransactionOperation::Install: return "install";
        case TransactionOperation::Remove:  return "remove";
        case TransactionOperation::Change:  return "change";
    }
    return "unknown";
}

bool is_same_artifact(const CondaPackageData& installed, const CondaPackageData& desired) {
    if (installed.sha256 && desired.sha256) return *installed.sha256 == *desired.sha256;
    if (installed.md5 && desired.md5) return *installed.md5 == *desired.md5;
    if (!installed.location.empty() && !desired.location.empty()) {
        return installed.location == desired.location;
    }
    return installed.version == desired.version && installed.build == desired.build &&
           installed.subdir == desired.subdir;
}

static Result<std::optional<PythonInfo>> find_python(
    const std::vector<const CondaPackageData*>& packages, Platform platform)
{
    for (const CondaPackageData* pkg : packages) {
        if (pkg->name != "python") continue;
        auto info = PythonInfo::from_version(pkg->version, platform);
        if (info.is_err()) return std::move(info).error();
        return Result<std::optional<PythonInfo>>::ok(std::move(info).value());
    }
    return Result<std::optional<PythonInfo>>::ok(std::nullopt);
}

Result<Transaction> Transaction::from_current_and_desired(
    const std::vector<PrefixRecord>& current,
    const std::vector<CondaPackageData>& desired,
    Platform platform)
{
    Transaction tx;
    tx.platform = platform;

    std::unordered_map<std::string, const PrefixRecord*> installed;
    std::vector<const CondaPackageData*> before;
    for (const auto& rec : current) {
        installed[rec.package.name] = &rec;
        before.push_back(&rec.package);
    }

    std::unordered_map<std::string, const CondaPackageData*> wanted;
    std::vector<const CondaPackageData*> after;
    for (const auto& pkg : desired) {
        if (wanted.count(pkg.name)) {
            return StrataError{StrataError::Install,
                "package '" + pkg.name + "' is requested more than once for " + platform_name(platform)};
        }
        wanted[pkg.name] = &pkg;
        after.push_back(&pkg);
    }

    for (const auto& rec : current) {
        if (!wanted.count(rec.package.name)) {
            tx.operations.push_back({TransactionOperation::Remove, rec, std::nullopt});
        }
    }

    for (const auto& pkg : desired) {
        auto it = installed.find(pkg.name);
        if (it == installed.end()) {
            tx.operations.push_back({TransactionOperation::Install, std::nullopt, pkg});
        } else if (!is_same_artifact(it->second->package, pkg)) {
            tx.operations.push_back({TransactionOperation::Change, *it->second, pkg});
        }
    }

    auto old_python = find_python(before, platform);
    if (old_python.is_err()) return std::move(old_python).error();
    tx.current_python_info = std::move(old_python).value();

    auto new_python = find_python(after, platform);
    if (new_python.is_err()) return std::move(new_python).error();
    tx.python_info = std::move(new_python).value();

    return Result<Transaction>::ok(std::move(tx));
}

size_t Transaction::count(TransactionOperation::Kind kind) const {
    return static_cast<size_t>(std::count_if(operations.begin(), operations.end(),
        [&](const TransactionOperation& op) { return op.kind == kind; }));
}

} // namespace strata
