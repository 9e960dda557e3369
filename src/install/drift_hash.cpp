#include <strata/drift_hash.hpp>
#include <strata/sha256.hpp>

namespace strata {

DriftHash DriftHash::from_environment(const LockedEnvironment& env, Platform platform) {
    Sha256 hasher;

    if (const auto* packages = env.packages_for(platform)) {
        for (const auto& pkg : *packages) {
            hasher.update_field(pkg.location());

            switch (pkg.kind()) {
                case LockedPackage::Conda: {
                    // Prefer the stronger digest; md5 only when sha256 is missing
                    const auto* conda = pkg.as_conda();
                    if (conda->sha256) {
                        hasher.update_field(*conda->sha256);
                    } else if (conda->md5) {
                        hasher.update_field(*conda->md5);
                    }
                    break;
                }
                case LockedPackage::Pypi: {
                    const auto* pypi = pkg.as_pypi();
                    hasher.update_flag(pypi->editable);
                    hasher.update_field(std::to_string(pypi->extras.size()));
                    for (const auto& extra : pypi->extras) {
                        hasher.update_field(extra);
                    }
                    break;
                }
            }
        }
    }

    return DriftHash(hasher.finalize_hex());
}

} // namespace strata
