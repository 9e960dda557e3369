#include <strata/rlimit.hpp>
#include <strata/log.hpp>
#include <mutex>

#ifndef _WIN32
#include <sys/resource.h>
#include <cerrno>
#include <cstring>
#endif

namespace strata {

void try_increase_rlimit_to_sensible() {
    static std::once_flag once;
    std::call_once(once, [] {
#ifndef _WIN32
        struct rlimit limit;
        if (getrlimit(RLIMIT_NOFILE, &limit) != 0) {
            log::debug("failed to read the open file limit: %s", std::strerror(errno));
            return;
        }
        if (limit.rlim_cur == RLIM_INFINITY || limit.rlim_cur >= DESIRED_NOFILE_LIMIT) {
            return;
        }

        rlim_t target = static_cast<rlim_t>(DESIRED_NOFILE_LIMIT);
        if (limit.rlim_max != RLIM_INFINITY && limit.rlim_max < target) {
            target = limit.rlim_max;
        }
        if (target <= limit.rlim_cur) return;

        rlim_t previous = limit.rlim_cur;
        limit.rlim_cur = target;
        if (setrlimit(RLIMIT_NOFILE, &limit) != 0) {
            log::debug("failed to raise the open file limit: %s", std::strerror(errno));
            return;
        }
        log::debug("raised the open file limit from %llu to %llu",
                   static_cast<unsigned long long>(previous),
                   static_cast<unsigned long long>(target));
#endif
    });
}

} // namespace strata
