#pragma once

namespace strata {

// Soft limit on open files we try to reach before large installs
inline constexpr unsigned long DESIRED_NOFILE_LIMIT = 1024 * 10;

// Raise RLIMIT_NOFILE towards DESIRED_NOFILE_LIMIT, at most once per process.
// Failures are logged and otherwise ignored; a no-op on Windows.
void try_increase_rlimit_to_sensible();

} // namespace strata
