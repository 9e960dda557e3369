#pragma once

#include <strata/result.hpp>
#include <string>
#include <vector>

namespace strata {

// Conda subdirectory names ("linux-64", "osx-arm64", ...)
enum class Platform {
    NoArch,
    Linux32,
    Linux64,
    LinuxAarch64,
    LinuxArmV7l,
    LinuxPpc64le,
    LinuxS390X,
    Osx64,
    OsxArm64,
    Win32,
    Win64,
    WinArm64,
};

Result<Platform> parse_platform(const std::string& name);
const char* platform_name(Platform p);

bool is_windows(Platform p);
bool is_osx(Platform p);
bool is_linux(Platform p);
bool is_unix(Platform p);

// Platform this binary was compiled for
Platform current_platform();

const std::vector<Platform>& all_platforms();

} // namespace strata
