#pragma once

#include <strata/index_map.hpp>
#include <strata/name.hpp>
#include <strata/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace strata {

// Requirement on a conda package: a version constraint, optionally pinned to
// a build, channel or a direct source.
struct DependencySpec {
    std::string version = "*";
    std::optional<std::string> build;
    std::optional<std::string> channel;
    std::optional<std::string> subdir;
    std::optional<std::string> url;
    std::optional<std::string> path;
    std::optional<std::string> git;

    static DependencySpec from_version(std::string v);

    bool is_source() const { return path.has_value() || git.has_value(); }
    std::string to_string() const;

    bool operator==(const DependencySpec& o) const;
    bool operator!=(const DependencySpec& o) const { return !(*this == o); }
};

struct PypiRequirement {
    std::optional<std::string> version;   // PEP 440 specifier, e.g. ">=1.2"
    std::vector<std::string> extras;
    std::optional<std::string> path;
    std::optional<std::string> git;
    std::optional<std::string> rev;
    std::optional<std::string> url;
    std::optional<std::string> index;
    bool editable = false;

    std::string to_string() const;

    bool operator==(const PypiRequirement& o) const;
    bool operator!=(const PypiRequirement& o) const { return !(*this == o); }
};

struct PypiOptions {
    std::optional<std::string> index_url;
    std::vector<std::string> extra_index_urls;
    std::vector<std::string> find_links;
    // Packages built without build isolation
    std::optional<std::vector<std::string>> no_build_isolation;

    // Combine options of several features; a second, different index-url is an error
    Result<PypiOptions> union_with(const PypiOptions& other) const;

    bool operator==(const PypiOptions& o) const;
};

struct LibCSystemRequirement {
    std::string family = "glibc";
    std::string version;

    bool operator==(const LibCSystemRequirement& o) const {
        return family == o.family && version == o.version;
    }
};

// Virtual packages the host system must provide (__linux, __cuda, ...)
struct SystemRequirements {
    std::optional<std::string> linux_kernel;
    std::optional<std::string> cuda;
    std::optional<std::string> macos;
    std::optional<std::string> archspec;
    std::optional<LibCSystemRequirement> libc;

    bool is_empty() const;

    // Field-wise union; the same field set to two different values is an error
    Result<SystemRequirements> union_with(const SystemRequirements& other) const;

    bool operator==(const SystemRequirements& o) const;
};

enum class ChannelPriority {
    Strict,
    Disabled,
};

Result<ChannelPriority> parse_channel_priority(const std::string& s);
const char* channel_priority_name(ChannelPriority p);

struct PrioritizedChannel {
    std::string channel;            // name or URL
    std::optional<int> priority;    // higher is preferred

    bool operator==(const PrioritizedChannel& o) const {
        return channel == o.channel && priority == o.priority;
    }
};

using DependencyMap = IndexMap<PackageName, DependencySpec>;
using PypiDependencyMap = IndexMap<PypiPackageName, PypiRequirement>;
using EnvVarMap = IndexMap<std::string, std::string>;

} // namespace strata
