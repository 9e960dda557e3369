#pragma once

#include <strata/lock_file.hpp>
#include <strata/platform.hpp>
#include <string>

namespace strata {

// Fingerprint of one platform's locked package set, stored in the marker
// record of an installed prefix. Packages are hashed in the order the lock
// file lists them, so the same set written in another order hashes
// differently.
class DriftHash {
public:
    DriftHash() = default;
    explicit DriftHash(std::string hex) : hex_(std::move(hex)) {}

    static DriftHash from_environment(const LockedEnvironment& env, Platform platform);

    const std::string& str() const { return hex_; }

    bool operator==(const DriftHash& o) const { return hex_ == o.hex_; }
    bool operator!=(const DriftHash& o) const { return !(*this == o); }

private:
    std::string hex_;
};

} // namespace strata
