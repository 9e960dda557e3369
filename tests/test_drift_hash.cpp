#include <catch2/catch.hpp>
#include <strata/drift_hash.hpp>

using namespace strata;

static CondaPackageData conda_pkg(const std::string& name, const std::string& sha) {
    CondaPackageData p;
    p.name = name;
    p.version = "1.0";
    p.build = "h0_0";
    p.subdir = "linux-64";
    p.location = "https://conda.anaconda.org/conda-forge/linux-64/" + name + "-1.0-h0_0.conda";
    if (!sha.empty()) p.sha256 = sha;
    return p;
}

static PypiPackageData pypi_pkg(const std::string& name) {
    PypiPackageData p;
    p.name = name;
    p.version = "2.0";
    p.location = "https://files.example.com/" + name + "-2.0-py3-none-any.whl";
    return p;
}

static LockedEnvironment two_packages() {
    LockedEnvironment env;
    env.packages[Platform::Linux64] = {
        LockedPackage::conda(conda_pkg("python", "aaaa")),
        LockedPackage::pypi(pypi_pkg("requests")),
    };
    return env;
}

TEST_CASE("drift hash is deterministic", "[drift_hash]") {
    auto env = two_packages();
    auto a = DriftHash::from_environment(env, Platform::Linux64);
    auto b = DriftHash::from_environment(two_packages(), Platform::Linux64);
    REQUIRE(a == b);
    REQUIRE(a.str().size() == 64);
}

TEST_CASE("unsolved platform hashes like an empty package list", "[drift_hash]") {
    auto env = two_packages();
    auto missing = DriftHash::from_environment(env, Platform::Win64);

    LockedEnvironment empty;
    empty.packages[Platform::Win64] = {};
    REQUIRE(missing == DriftHash::from_environment(empty, Platform::Win64));
    REQUIRE(missing != DriftHash::from_environment(env, Platform::Linux64));
}

TEST_CASE("drift hash changes with the conda digest", "[drift_hash]") {
    auto env = two_packages();
    auto before = DriftHash::from_environment(env, Platform::Linux64);

    LockedEnvironment changed;
    changed.packages[Platform::Linux64] = {
        LockedPackage::conda(conda_pkg("python", "bbbb")),
        LockedPackage::pypi(pypi_pkg("requests")),
    };
    REQUIRE(before != DriftHash::from_environment(changed, Platform::Linux64));
}

TEST_CASE("drift hash falls back to md5", "[drift_hash]") {
    auto with_md5 = [](const std::string& md5) {
        auto p = conda_pkg("zlib", "");
        p.md5 = md5;
        LockedEnvironment env;
        env.packages[Platform::Linux64] = {LockedPackage::conda(p)};
        return DriftHash::from_environment(env, Platform::Linux64);
    };
    REQUIRE(with_md5("1111") != with_md5("2222"));

    // sha256 takes precedence, so md5 is ignored when both are set
    auto both = [](const std::string& md5) {
        auto p = conda_pkg("zlib", "ffff");
        p.md5 = md5;
        LockedEnvironment env;
        env.packages[Platform::Linux64] = {LockedPackage::conda(p)};
        return DriftHash::from_environment(env, Platform::Linux64);
    };
    REQUIRE(both("1111") == both("2222"));
}

TEST_CASE("drift hash changes with the package location", "[drift_hash]") {
    auto p = conda_pkg("python", "aaaa");
    LockedEnvironment a;
    a.packages[Platform::Linux64] = {LockedPackage::conda(p)};

    p.location = "https://mirror.example.com/python-1.0-h0_0.conda";
    LockedEnvironment b;
    b.packages[Platform::Linux64] = {LockedPackage::conda(p)};

    REQUIRE(DriftHash::from_environment(a, Platform::Linux64) !=
            DriftHash::from_environment(b, Platform::Linux64));
}

TEST_CASE("drift hash depends on package order", "[drift_hash]") {
    LockedEnvironment reordered;
    reordered.packages[Platform::Linux64] = {
        LockedPackage::pypi(pypi_pkg("requests")),
        LockedPackage::conda(conda_pkg("python", "aaaa")),
    };
    REQUIRE(DriftHash::from_environment(two_packages(), Platform::Linux64) !=
            DriftHash::from_environment(reordered, Platform::Linux64));
}

TEST_CASE("drift hash covers pypi editable flag and extras", "[drift_hash]") {
    auto hash_of = [](const PypiPackageData& p) {
        LockedEnvironment env;
        env.packages[Platform::Linux64] = {LockedPackage::pypi(p)};
        return DriftHash::from_environment(env, Platform::Linux64);
    };

    auto plain = pypi_pkg("mypkg");
    auto editable = plain;
    editable.editable = true;
    REQUIRE(hash_of(plain) != hash_of(editable));

    auto with_extra = plain;
    with_extra.extras = {"socks"};
    REQUIRE(hash_of(plain) != hash_of(with_extra));

    // Extras are length-delimited, so splitting one extra into two differs
    auto split_a = plain;
    split_a.extras = {"ab", "c"};
    auto split_b = plain;
    split_b.extras = {"a", "bc"};
    REQUIRE(hash_of(split_a) != hash_of(split_b));

    // The pypi version is not part of the fingerprint
    auto bumped = plain;
    bumped.version = "9.9";
    REQUIRE(hash_of(plain) == hash_of(bumped));
}
