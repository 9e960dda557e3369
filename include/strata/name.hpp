#pragma once

#include <strata/result.hpp>
#include <functional>
#include <optional>
#include <string>

namespace strata {

// The name reserved for the implicit default feature and environment
inline constexpr const char* DEFAULT_NAME = "default";

// Conda package name. Matching is case-insensitive; the source spelling is
// kept for display.
class PackageName {
public:
    static Result<PackageName> parse(const std::string& raw);

    const std::string& source() const { return source_; }
    const std::string& normalized() const { return normalized_; }

    bool operator==(const PackageName& o) const { return normalized_ == o.normalized_; }
    bool operator!=(const PackageName& o) const { return !(*this == o); }
    bool operator<(const PackageName& o) const { return normalized_ < o.normalized_; }

private:
    std::string source_;
    std::string normalized_;
};

// PyPI distribution name, normalized per PEP 503: lowercase, runs of
// '-', '_' and '.' collapsed to a single '-'.
class PypiPackageName {
public:
    static Result<PypiPackageName> parse(const std::string& raw);

    const std::string& source() const { return source_; }
    const std::string& normalized() const { return normalized_; }

    bool operator==(const PypiPackageName& o) const { return normalized_ == o.normalized_; }
    bool operator!=(const PypiPackageName& o) const { return !(*this == o); }
    bool operator<(const PypiPackageName& o) const { return normalized_ < o.normalized_; }

private:
    std::string source_;
    std::string normalized_;
};

// Name of a feature or environment: either the implicit default, or a
// user-chosen name that is never "default".
template<typename Tag>
class DefaultOrNamed {
public:
    enum Kind { Default, Named };

    DefaultOrNamed() = default;

    static DefaultOrNamed default_name() { return DefaultOrNamed(); }

    // Fails for the reserved name and for the empty string
    static Result<DefaultOrNamed> named(const std::string& name) {
        if (name == DEFAULT_NAME) {
            return StrataError{StrataError::InvalidArg,
                std::string("the name '") + DEFAULT_NAME + "' is reserved for the default " + Tag::noun,
                std::string("leave the ") + Tag::noun + " unnamed to refer to the default"};
        }
        if (name.empty()) {
            return StrataError{StrataError::InvalidArg,
                std::string("empty ") + Tag::noun + " name"};
        }
        DefaultOrNamed n;
        n.kind_ = Named;
        n.name_ = name;
        return Result<DefaultOrNamed>::ok(std::move(n));
    }

    // Maps the reserved name to Default instead of failing
    static DefaultOrNamed from_str(const std::string& name) {
        if (name == DEFAULT_NAME || name.empty()) return DefaultOrNamed();
        DefaultOrNamed n;
        n.kind_ = Named;
        n.name_ = name;
        return n;
    }

    Kind kind() const { return kind_; }
    bool is_default() const { return kind_ == Default; }

    std::optional<std::string> name() const {
        switch (kind_) {
            case Default: return std::nullopt;
            case Named:   return name_;
        }
        return std::nullopt;
    }

    const std::string& as_str() const {
        static const std::string reserved = DEFAULT_NAME;
        switch (kind_) {
            case Default: return reserved;
            case Named:   return name_;
        }
        return reserved;
    }

    bool operator==(const DefaultOrNamed& o) const { return as_str() == o.as_str(); }
    bool operator!=(const DefaultOrNamed& o) const { return !(*this == o); }
    bool operator<(const DefaultOrNamed& o) const { return as_str() < o.as_str(); }

private:
    Kind kind_ = Default;
    std::string name_;
};

struct FeatureTag { static constexpr const char* noun = "feature"; };
struct EnvironmentTag { static constexpr const char* noun = "environment"; };

using FeatureName = DefaultOrNamed<FeatureTag>;
using EnvironmentName = DefaultOrNamed<EnvironmentTag>;

} // namespace strata

namespace std {

template<>
struct hash<strata::PackageName> {
    size_t operator()(const strata::PackageName& n) const {
        return hash<string>()(n.normalized());
    }
};

template<>
struct hash<strata::PypiPackageName> {
    size_t operator()(const strata::PypiPackageName& n) const {
        return hash<string>()(n.normalized());
    }
};

template<typename Tag>
struct hash<strata::DefaultOrNamed<Tag>> {
    size_t operator()(const strata::DefaultOrNamed<Tag>& n) const {
        return hash<string>()(n.as_str());
    }
};

} // namespace std
