#include <strata/spec.hpp>
#include <algorithm>

namespace strata {

// ---------------------------------------------------------------------------
// DependencySpec
// ---------------------------------------------------------------------------

DependencySpec DependencySpec::from_version(std::string v) {
    DependencySpec spec;
    spec.version = std::move(v);
    return spec;
}

std::string DependencySpec::to_string() const {
    if (path) return "path=" + *path;
    if (git) return "git=" + *git;
    if (url) return "url=" + *url;

    std::string out = version;
    if (build) out += " " + *build;
    if (channel) out = *channel + "::" + out;
    if (subdir) out += " [subdir=" + *subdir + "]";
    return out;
}

bool DependencySpec::operator==(const DependencySpec& o) const {
    return version == o.version && build == o.build && channel == o.channel &&
           subdir == o.subdir && url == o.url && path == o.path && git == o.git;
}

// ---------------------------------------------------------------------------
// PypiRequirement
// ---------------------------------------------------------------------------

std::string PypiRequirement::to_string() const {
    std::string out;
    if (!extras.empty()) {
        out += "[";
        for (size_t i = 0; i < extras.size(); ++i) {
            if (i) out += ",";
            out += extras[i];
        }
        out += "]";
    }
    if (path) {
        out += " @ " + *path;
        if (editable) out += " (editable)";
    } else if (git) {
        out += " @ git+" + *git;
        if (rev) out += "@" + *rev;
    } else if (url) {
        out += " @ " + *url;
    } else {
        out += version.value_or("*");
    }
    return out;
}

bool PypiRequirement::operator==(const PypiRequirement& o) const {
    return version == o.version && extras == o.extras && path == o.path &&
           git == o.git && rev == o.rev && url == o.url && index == o.index &&
           editable == o.editable;
}

// ---------------------------------------------------------------------------
// PypiOptions
// ---------------------------------------------------------------------------

static void append_unique(std::vector<std::string>& into,
                          const std::vector<std::string>& from) {
    for (const auto& s : from) {
        if (std::find(into.begin(), into.end(), s) == into.end()) {
            into.push_back(s);
        }
    }
}

Result<PypiOptions> PypiOptions::union_with(const PypiOptions& other) const {
    PypiOptions out = *this;

    if (other.index_url) {
        if (out.index_url && *out.index_url != *other.index_url) {
            return StrataError{StrataError::Manifest,
                "multiple primary pypi indexes are not supported, found both '" +
                *out.index_url + "' and '" + *other.index_url + "'"};
        }
        out.index_url = other.index_url;
    }

    append_unique(out.extra_index_urls, other.extra_index_urls);
    append_unique(out.find_links, other.find_links);

    if (other.no_build_isolation) {
        if (!out.no_build_isolation) out.no_build_isolation.emplace();
        append_unique(*out.no_build_isolation, *other.no_build_isolation);
    }

    return Result<PypiOptions>::ok(std::move(out));
}

bool PypiOptions::operator==(const PypiOptions& o) const {
    return index_url == o.index_url && extra_index_urls == o.extra_index_urls &&
           find_links == o.find_links && no_build_isolation == o.no_build_isolation;
}

// ---------------------------------------------------------------------------
// SystemRequirements
// ---------------------------------------------------------------------------

bool SystemRequirements::is_empty() const {
    return !linux_kernel && !cuda && !macos && !archspec && !libc;
}

template<typename T>
static Status merge_field(const char* field, std::optional<T>& into,
                          const std::optional<T>& from) {
    if (!from) return ok_status();
    if (into && !(*into == *from)) {
        return StrataError{StrataError::Manifest,
            std::string("conflicting system requirement '") + field +
            "' between features",
            "declare the requirement once, or give both features the same value"};
    }
    into = from;
    return ok_status();
}

Result<SystemRequirements> SystemRequirements::union_with(
    const SystemRequirements& other) const
{
    SystemRequirements out = *this;
    STRATA_TRY(merge_field("linux", out.linux_kernel, other.linux_kernel));
    STRATA_TRY(merge_field("cuda", out.cuda, other.cuda));
    STRATA_TRY(merge_field("macos", out.macos, other.macos));
    STRATA_TRY(merge_field("archspec", out.archspec, other.archspec));
    STRATA_TRY(merge_field("libc", out.libc, other.libc));
    return Result<SystemRequirements>::ok(std::move(out));
}

bool SystemRequirements::operator==(const SystemRequirements& o) const {
    return linux_kernel == o.linux_kernel && cuda == o.cuda && macos == o.macos &&
           archspec == o.archspec && libc == o.libc;
}

// ---------------------------------------------------------------------------
// ChannelPriority
// ---------------------------------------------------------------------------

Result<ChannelPriority> parse_channel_priority(const std::string& s) {
    if (s == "strict") return Result<ChannelPriority>::ok(ChannelPriority::Strict);
    if (s == "disabled") return Result<ChannelPriority>::ok(ChannelPriority::Disabled);
    return StrataError{StrataError::Manifest,
        "unknown channel priority '" + s + "'",
        "expected 'strict' or 'disabled'"};
}

const char* channel_priority_name(ChannelPriority p) {
    switch (p) {
        case ChannelPriority::Strict:   return "strict";
        case ChannelPriority::Disabled: return "disabled";
    }
    return "unknown";
}

} // namespace strata
