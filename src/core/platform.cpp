#include <strata/platform.hpp>

namespace strata {

const std::vector<Platform>& all_platforms() {
    static const std::vector<Platform> platforms = {
        Platform::NoArch,       Platform::Linux32,    Platform::Linux64,
        Platform::LinuxAarch64, Platform::LinuxArmV7l, Platform::LinuxPpc64le,
        Platform::LinuxS390X,   Platform::Osx64,      Platform::OsxArm64,
        Platform::Win32,        Platform::Win64,      Platform::WinArm64,
    };
    return platforms;
}

const char* platform_name(Platform p) {
    switch (p) {
        case Platform::NoArch:       return "noarch";
        case Platform::Linux32:      return "linux-32";
        case Platform::Linux64:      return "linux-64";
        case Platform::LinuxAarch64: return "linux-aarch64";
        case Platform::LinuxArmV7l:  return "linux-armv7l";
        case Platform::LinuxPpc64le: return "linux-ppc64le";
        case Platform::LinuxS390X:   return "linux-s390x";
        case Platform::Osx64:        return "osx-64";
        case Platform::OsxArm64:     return "osx-arm64";
        case Platform::Win32:        return "win-32";
        case Platform::Win64:        return "win-64";
        case Platform::WinArm64:     return "win-arm64";
    }
    return "unknown";
}

Result<Platform> parse_platform(const std::string& name) {
    for (Platform p : all_platforms()) {
        if (name == platform_name(p)) {
            return Result<Platform>::ok(p);
        }
    }
    return StrataError{StrataError::Platform,
        "unknown platform '" + name + "'",
        "expected a conda subdir such as 'linux-64', 'osx-arm64' or 'win-64'"};
}

bool is_windows(Platform p) {
    switch (p) {
        case Platform::Win32:
        case Platform::Win64:
        case Platform::WinArm64:
            return true;
        default:
            return false;
    }
}

bool is_osx(Platform p) {
    return p == Platform::Osx64 || p == Platform::OsxArm64;
}

bool is_linux(Platform p) {
    switch (p) {
        case Platform::Linux32:
        case Platform::Linux64:
        case Platform::LinuxAarch64:
        case Platform::LinuxArmV7l:
        case Platform::LinuxPpc64le:
        case Platform::LinuxS390X:
            return true;
        default:
            return false;
    }
}

bool is_unix(Platform p) {
    return is_linux(p) || is_osx(p);
}

Platform current_platform() {
#if defined(_WIN32)
#  if defined(_M_ARM64)
    return Platform::WinArm64;
#  elif defined(_WIN64)
    return Platform::Win64;
#  else
    return Platform::Win32;
#  endif
#elif defined(__APPLE__)
#  if defined(__aarch64__) || defined(__arm64__)
    return Platform::OsxArm64;
#  else
    return Platform::Osx64;
#  endif
#elif defined(__linux__)
#  if defined(__aarch64__)
    return Platform::LinuxAarch64;
#  elif defined(__arm__)
    return Platform::LinuxArmV7l;
#  elif defined(__powerpc64__)
    return Platform::LinuxPpc64le;
#  elif defined(__s390x__)
    return Platform::LinuxS390X;
#  elif defined(__x86_64__)
    return Platform::Linux64;
#  else
    return Platform::Linux32;
#  endif
#else
    return Platform::NoArch;
#endif
}

} // namespace strata
