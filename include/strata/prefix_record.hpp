#pragma once

#include <strata/lock_file.hpp>
#include <strata/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// An installed conda package: conda-meta/<name>-<version>-<build>.json
struct PrefixRecord {
    CondaPackageData package;
    std::vector<std::string> files;     // paths relative to the prefix

    std::string file_name() const;

    std::string to_json() const;
    static Result<PrefixRecord> from_json(const std::string& text);
};

// Every record of the prefix, ordered by file name. A prefix without
// conda-meta/ has no records.
Result<std::vector<PrefixRecord>> load_prefix_records(const std::filesystem::path& prefix);

Status write_prefix_record(const std::filesystem::path& prefix, const PrefixRecord& record);
Status remove_prefix_record(const std::filesystem::path& prefix, const PrefixRecord& record);

} // namespace strata
