#pragma once

#include <strata/lock_file.hpp>
#include <strata/platform.hpp>
#include <strata/prefix_record.hpp>
#include <strata/python_status.hpp>
#include <strata/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct TransactionOperation {
    enum Kind { Install, Remove, Change };

    Kind kind;
    std::optional<PrefixRecord> old_record;        // Remove, Change
    std::optional<CondaPackageData> new_package;   // Install, Change

    const std::string& name() const;
};

const char* operation_kind_name(TransactionOperation::Kind kind);

// What it takes to turn the installed records of a prefix into the desired
// package set, and which interpreter the prefix has before and after.
struct Transaction {
    Platform platform = Platform::NoArch;
    std::vector<TransactionOperation> operations;
    std::optional<PythonInfo> current_python_info;
    std::optional<PythonInfo> python_info;

    // Removals first, in installed order, then changes and installs in the
    // order of `desired`
    static Result<Transaction> from_current_and_desired(
        const std::vector<PrefixRecord>& current,
        const std::vector<CondaPackageData>& desired,
        Platform platform);

    bool empty() const { return operations.empty(); }
    size_t count(TransactionOperation::Kind kind) const;
};

// Two records describe the same artifact: same location and, when both
// carry one, the same digest
bool is_same_artifact(const CondaPackageData& installed, const CondaPackageData& desired);

} // namespace strata
