#include <strata/installer.hpp>
#include <strata/log.hpp>
#include <tbb/task_group.h>
#include <mutex>

namespace strata {

namespace fs = std::filesystem;

namespace {

// First error reported by any task of a phase
class FirstError {
public:
    void set(StrataError err) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) error_ = std::move(err);
    }

    bool has_error() {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_.has_value();
    }

    StrataError take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(*error_);
    }

private:
    std::mutex mutex_;
    std::optional<StrataError> error_;
};

} // namespace

Installer::Installer(PackageCache& cache, PackageLinker& linker, IoPermitPool& permits)
    : cache_(cache), linker_(linker), permits_(permits) {}

Installer& Installer::with_installed_packages(std::vector<PrefixRecord> installed) {
    installed_ = std::move(installed);
    return *this;
}

Installer& Installer::with_target_platform(Platform platform) {
    platform_ = platform;
    return *this;
}

Installer& Installer::with_reporter(Reporter* reporter) {
    reporter_ = reporter;
    return *this;
}

Result<InstallResult> Installer::install(const fs::path& prefix,
                                         const std::vector<CondaPackageData>& desired) {
    std::vector<PrefixRecord> installed;
    if (installed_) {
        installed = *installed_;
    } else {
        auto loaded = load_prefix_records(prefix);
        if (loaded.is_err()) {
            return std::move(loaded).error().context("reading installed packages");
        }
        installed = std::move(loaded).value();
    }

    Platform platform = platform_.value_or(current_platform());
    auto tx = Transaction::from_current_and_desired(installed, desired, platform);
    if (tx.is_err()) return std::move(tx).error();

    InstallResult result{std::move(tx).value()};
    const auto& ops = result.transaction.operations;
    if (ops.empty()) {
        log::debug("%s is up to date", prefix.string().c_str());
        return Result<InstallResult>::ok(std::move(result));
    }

    log::debug("transaction for %s: %zu install, %zu change, %zu remove",
               prefix.string().c_str(),
               result.transaction.count(TransactionOperation::Install),
               result.transaction.count(TransactionOperation::Change),
               result.transaction.count(TransactionOperation::Remove));

    // Fetch everything before touching the prefix
    std::vector<fs::path> package_dirs(ops.size());
    {
        FirstError failed;
        tbb::task_group tg;
        for (size_t i = 0; i < ops.size(); ++i) {
            if (!ops[i].new_package) continue;
            tg.run([&, i] {
                auto dir = cache_.fetch(*ops[i].new_package);
                if (dir.is_err()) {
                    failed.set(std::move(dir).error().context("fetching " + ops[i].name()));
                    return;
                }
                package_dirs[i] = std::move(dir).value();
            });
        }
        tg.wait();
        if (failed.has_error()) return failed.take();
    }

    // Unlink removed and replaced packages
    {
        FirstError failed;
        tbb::task_group tg;
        for (size_t i = 0; i < ops.size(); ++i) {
            if (!ops[i].old_record) continue;
            tg.run([&, i] {
                auto permit = permits_.acquire();
                const PrefixRecord& old = *ops[i].old_record;

                auto unlinked = linker_.unlink(prefix, old);
                if (unlinked.is_err()) {
                    failed.set(std::move(unlinked).error().context("unlinking " + old.package.name));
                    return;
                }
                auto removed = remove_prefix_record(prefix, old);
                if (removed.is_err()) {
                    failed.set(std::move(removed).error());
                    return;
                }
                if (reporter_ && ops[i].kind == TransactionOperation::Remove) {
                    reporter_->on_operation(operation_kind_name(ops[i].kind), old.package.name);
                }
            });
        }
        tg.wait();
        if (failed.has_error()) return failed.take();
    }

    // Link new and replacing packages
    {
        FirstError failed;
        tbb::task_group tg;
        for (size_t i = 0; i < ops.size(); ++i) {
            if (!ops[i].new_package) continue;
            tg.run([&, i] {
                auto permit = permits_.acquire();
                const CondaPackageData& pkg = *ops[i].new_package;

                auto files = linker_.link(package_dirs[i], prefix, pkg);
                if (files.is_err()) {
                    failed.set(std::move(files).error().context("linking " + pkg.name));
                    return;
                }

                PrefixRecord record;
                record.package = pkg;
                record.files = std::move(files).value();
                auto written = write_prefix_record(prefix, record);
                if (written.is_err()) {
                    failed.set(std::move(written).error());
                    return;
                }
                if (reporter_) {
                    reporter_->on_operation(operation_kind_name(ops[i].kind), pkg.name);
                }
            });
        }
        tg.wait();
        if (failed.has_error()) return failed.take();
    }

    return Result<InstallResult>::ok(std::move(result));
}

} // namespace strata
