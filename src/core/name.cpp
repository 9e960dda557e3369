#include <strata/name.hpp>
#include <algorithm>
#include <cctype>

namespace strata {

static char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

Result<PackageName> PackageName::parse(const std::string& raw) {
    if (raw.empty()) {
        return StrataError{StrataError::InvalidArg, "empty package name"};
    }

    for (char c : raw) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            return StrataError{StrataError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in package name '" + raw + "'",
                "allowed: [a-zA-Z0-9_.-]"};
        }
    }

    PackageName name;
    name.source_ = raw;
    name.normalized_ = raw;
    std::transform(name.normalized_.begin(), name.normalized_.end(),
                   name.normalized_.begin(), lower);
    return Result<PackageName>::ok(std::move(name));
}

Result<PypiPackageName> PypiPackageName::parse(const std::string& raw) {
    if (raw.empty()) {
        return StrataError{StrataError::InvalidArg, "empty PyPI package name"};
    }

    std::string normalized;
    normalized.reserve(raw.size());
    bool in_separator = false;
    for (char c : raw) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_separator) normalized += '-';
            in_separator = true;
            continue;
        }
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return StrataError{StrataError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in PyPI package name '" + raw + "'"};
        }
        normalized += lower(c);
        in_separator = false;
    }

    // Names must start and end with a letter or digit
    if (normalized.front() == '-' || normalized.back() == '-') {
        return StrataError{StrataError::InvalidArg,
            "invalid PyPI package name '" + raw + "'",
            "names must start and end with a letter or digit"};
    }

    PypiPackageName name;
    name.source_ = raw;
    name.normalized_ = std::move(normalized);
    return Result<PypiPackageName>::ok(std::move(name));
}

} // namespace strata
